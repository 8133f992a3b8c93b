#pragma once

#include <bert/bert_detail.hpp>
#include <bert/burp/bert_frame.hpp>
#include <bert/codec/bert_decoder.hpp>
#include <bert/codec/bert_encoder.hpp>
#include <bert/core/bert_io.hpp>
#include <bert/core/bert_policy.hpp>
#include <bert/core/bert_types.hpp>
#include <bert/records/bert_fields.hpp>
#include <bert/records/bert_record.hpp>
#include <bert/terms/bert_bigint.hpp>
#include <bert/terms/bert_term.hpp>
#include <cstddef>
#include <expected>
#include <optional>
#include <span>

/**
 * @brief The public API for BERT.
 *
 * This section contains the interfaces for encoding and decoding terms, and
 * transitively provides the term types, record binding and BURP framing.
 *
 * @section top_level_apis Top-level APIs
 *
 * - @b Encode: Encodes a value into a new buffer, version marker first.
 * - @b EncodeTo: Appends an encoded value to a sink, all or nothing.
 * - @b Decode: Decodes one term from a buffer.
 * - @b DecodePrefix: Decodes one term and reports how many bytes it used.
 * - @b DecodeInto: Decodes one term and binds it to a record.
 */

namespace Bert {

/**
 * @brief Encodes a value.
 *
 * @tparam T Any Encodable type: a Term, a built-in number, text, a byte
 * container, a std::vector, std::tuple or std::array of Encodable types, a
 * record, or an optional/pointer to one of these.
 * @param value The value to encode. It is not modified.
 * @return The encoded bytes, or an Error if the value's runtime shape has no
 * wire form (e.g. a tuple of more than 255 elements).
 */
template <typename T>
    requires Encodable<T>
[[nodiscard]] std::expected<Bytes, Error> Encode(const T& value) {
    return detail::EncodeToBuffer(value);
}

/**
 * @brief Appends an encoded value to sink.
 *
 * Encoding happens in an intermediate buffer; the sink only grows when the
 * whole value encoded.
 *
 * @param sink The destination byte sink.
 * @param value The value to encode.
 * @return std::nullopt on success, or an Error. On error sink is unchanged.
 */
template <typename T>
    requires Encodable<T>
[[nodiscard]] std::optional<Error> EncodeTo(Bytes& sink, const T& value) {
    auto encoded = detail::EncodeToBuffer(value);
    if (!encoded) {
        return encoded.error();
    }
    sink.insert(sink.end(), encoded->begin(), encoded->end());
    return std::nullopt;
}

/**
 * @brief Decodes one term.
 *
 * The first byte must be the version marker (131). Bytes after the term are
 * ignored.
 *
 * @tparam Policy The DecodePolicy (limits, bignum support).
 * @param input The encoded bytes.
 * @return The decoded Term, or an Error.
 */
template <DecodePolicy Policy = DefaultPolicy>
[[nodiscard]] std::expected<Term, Error> Decode(
    std::span<const std::byte> input) {
    return detail::DecodeTerm<Policy>(input).transform(
        [](Decoded<Term> decoded) { return std::move(decoded.value); });
}

/**
 * @brief Decodes one term and reports how many bytes it occupied.
 */
template <DecodePolicy Policy = DefaultPolicy>
[[nodiscard]] std::expected<Decoded<Term>, Error> DecodePrefix(
    std::span<const std::byte> input) {
    return detail::DecodeTerm<Policy>(input);
}

/**
 * @brief Decodes one term and binds it positionally onto a record.
 *
 * @tparam R The record type (declared with BERT_RECORD_FIELDS).
 * @tparam Policy The DecodePolicy.
 * @param input The encoded bytes.
 * @return The populated record, or a decode or binding Error.
 */
template <Record R, DecodePolicy Policy = DefaultPolicy>
[[nodiscard]] std::expected<R, Error> DecodeInto(
    std::span<const std::byte> input) {
    auto term = Decode<Policy>(input);
    if (!term) {
        return std::unexpected(term.error());
    }
    return Bind<R>(*term);
}

}  // namespace Bert
