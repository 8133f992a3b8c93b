#pragma once

#include <bert/codec/bert_decoder.hpp>
#include <bert/codec/bert_encoder.hpp>
#include <bert/core/bert_io.hpp>
#include <bert/core/bert_policy.hpp>
#include <bert/core/bert_types.hpp>
#include <bert/terms/bert_term.hpp>
#include <cstddef>
#include <expected>
#include <span>
#include <spdlog/spdlog.h>

/**
 * @brief Internal implementation details for the public API.
 */
namespace Bert::detail {

/**
 * @brief Encodes the version marker and value into a fresh buffer.
 *
 * The caller's sink is never touched here, so a failure part way through a
 * value leaves nothing behind.
 */
template <typename T>
    requires Encodable<T>
[[nodiscard]] std::expected<Bytes, Error> EncodeToBuffer(const T& value) {
    Bytes buffer;
    Writer writer{buffer};
    writer.write_tag(Tag::Version);
    if (auto err = EncodeValue(writer, value); err.has_value()) {
        spdlog::debug("bert: encode failed: {} ({})", ToString(err->code),
                      err->message);
        return std::unexpected(*err);
    }
    return buffer;
}

/**
 * @brief Decodes one versioned term from the start of input.
 *
 * @tparam Policy The DecodePolicy to apply.
 * @param input The input bytes. Bytes after the term are not read.
 * @return The term and the number of bytes it occupied, or an Error.
 */
template <DecodePolicy Policy>
[[nodiscard]] std::expected<Decoded<Term>, Error> DecodeTerm(
    std::span<const std::byte> input) {
    Reader reader{input};
    auto term = TermDecoder<Policy>::ReadVersioned(reader);
    if (!term) {
        spdlog::debug("bert: decode failed: {} at offset {} ({})",
                      ToString(term.error().code), term.error().offset,
                      term.error().message);
        return std::unexpected(term.error());
    }
    return Decoded<Term>{std::move(*term), reader.offset()};
}

}  // namespace Bert::detail
