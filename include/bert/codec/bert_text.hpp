#pragma once

#include <algorithm>
#include <bert/core/bert_io.hpp>
#include <bert/core/bert_types.hpp>
#include <bert/terms/bert_term.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <string_view>

/**
 * @brief Atom, string, binary and bitstring codecs.
 */
namespace Bert::codec {

namespace detail {

[[nodiscard]] inline std::optional<Error> WriteShortText(Writer& writer,
                                                         Tag tag,
                                                         std::string_view text) {
    if (text.size() > std::numeric_limits<uint16_t>::max()) {
        return Error::value_too_large("text longer than 65535 bytes");
    }
    writer.write_tag(tag);
    writer.write2(static_cast<uint16_t>(text.size()));
    writer.write_bytes(std::as_bytes(std::span{text}));
    return std::nullopt;
}

[[nodiscard]] inline std::expected<std::string, Error> ReadShortText(
    Reader& reader) {
    auto size = reader.read2();
    if (!size) {
        return std::unexpected(size.error());
    }
    auto bytes = reader.read_bytes(*size);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return std::string{reinterpret_cast<const char*>(bytes->data()),
                       bytes->size()};
}

}  // namespace detail

[[nodiscard]] inline std::optional<Error> WriteAtom(Writer& writer,
                                                    std::string_view name) {
    return detail::WriteShortText(writer, Tag::Atom, name);
}

[[nodiscard]] inline std::optional<Error> WriteString(Writer& writer,
                                                      std::string_view text) {
    return detail::WriteShortText(writer, Tag::String, text);
}

[[nodiscard]] inline std::optional<Error> WriteBinary(
    Writer& writer, std::span<const std::byte> bytes) {
    if (bytes.size() > std::numeric_limits<uint32_t>::max()) {
        return Error::value_too_large("binary longer than 4 GiB");
    }
    writer.write_tag(Tag::Binary);
    writer.write4(static_cast<uint32_t>(bytes.size()));
    writer.write_bytes(bytes);
    return std::nullopt;
}

/**
 * @brief Writes a bitstring, or a binary when the bit length is a whole
 * number of bytes.
 *
 * Exactly ceil(bits / 8) bytes are written. A shorter buffer is left-padded
 * with zero bytes, a longer one is cut to the first ceil(bits / 8) bytes.
 *
 * @param bytes The data bytes.
 * @param bits Total number of significant bits.
 */
[[nodiscard]] inline std::optional<Error> WriteBitstring(
    Writer& writer, std::span<const std::byte> bytes, uint64_t bits) {
    const uint64_t byte_count = (bits + 7) / 8;
    if (byte_count > std::numeric_limits<uint32_t>::max()) {
        return Error::value_too_large("bitstring longer than 4 GiB");
    }
    const auto count = static_cast<std::size_t>(byte_count);
    const std::size_t padding = count > bytes.size() ? count - bytes.size() : 0;
    const auto data = bytes.first(count - padding);

    if (bits % 8 == 0) {
        if (padding == 0) {
            return WriteBinary(writer, data);
        }
        writer.write_tag(Tag::Binary);
        writer.write4(static_cast<uint32_t>(count));
    } else {
        writer.write_tag(Tag::Bitstring);
        writer.write4(static_cast<uint32_t>(count));
        writer.write1(static_cast<uint8_t>(bits % 8));
    }
    writer.write_zeros(padding);
    writer.write_bytes(data);
    return std::nullopt;
}

[[nodiscard]] inline std::expected<Atom, Error> ReadAtom(Reader& reader) {
    return detail::ReadShortText(reader).transform(
        [](std::string name) { return Atom{std::move(name)}; });
}

[[nodiscard]] inline std::expected<std::string, Error> ReadString(
    Reader& reader) {
    return detail::ReadShortText(reader);
}

[[nodiscard]] inline std::expected<Binary, Error> ReadBinary(Reader& reader) {
    auto size = reader.read4();
    if (!size) {
        return std::unexpected(size.error());
    }
    auto bytes = reader.read_bytes(*size);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }
    return Binary(bytes->begin(), bytes->end());
}

/**
 * @brief Reads a bitstring payload.
 *
 * The trailing bit count gives the number of bits used in the last byte; 0 is
 * read as a full byte. Counts above 8 are rejected.
 */
[[nodiscard]] inline std::expected<Bitstring, Error> ReadBitstring(
    Reader& reader) {
    auto size = reader.read4();
    if (!size) {
        return std::unexpected(size.error());
    }
    const std::size_t trailing_offset = reader.offset();
    auto trailing = reader.read1();
    if (!trailing) {
        return std::unexpected(trailing.error());
    }
    if (*trailing > 8) {
        return std::unexpected(Error::unsupported_type(
            "bitstring trailing bit count above 8", trailing_offset));
    }
    auto bytes = reader.read_bytes(*size);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    Bitstring result{Binary(bytes->begin(), bytes->end()), 0};
    if (*size != 0) {
        const uint64_t last_bits = *trailing == 0 ? 8 : *trailing;
        result.bits = (static_cast<uint64_t>(*size) - 1) * 8 + last_bits;
    }
    return result;
}

}  // namespace Bert::codec
