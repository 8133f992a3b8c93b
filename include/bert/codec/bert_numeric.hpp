#pragma once

#include <algorithm>
#include <array>
#include <bert/core/bert_io.hpp>
#include <bert/core/bert_types.hpp>
#include <bert/terms/bert_bigint.hpp>
#include <bert/terms/bert_term.hpp>
#include <charconv>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <system_error>
#include <vector>

/**
 * @brief Integer, bignum and float codecs.
 *
 * Writers emit the tag byte followed by the payload. Readers are called after
 * the dispatcher has consumed the tag byte and read only the payload.
 */
namespace Bert::codec {

inline void WriteSmallInteger(Writer& writer, uint8_t value) {
    writer.write_tag(Tag::SmallInteger);
    writer.write1(value);
}

inline void WriteInteger(Writer& writer, int32_t value) {
    writer.write_tag(Tag::Integer);
    writer.write4(static_cast<uint32_t>(value));
}

/**
 * @brief Writes a small bignum.
 *
 * Payload: byte count, sign (0 non-negative, 1 negative), then the magnitude
 * least significant byte first.
 *
 * @param negative Sign of the value.
 * @param magnitude Magnitude in little-endian order.
 * @return std::nullopt on success, or UnsupportedType if the magnitude needs
 * more than 255 bytes (the large bignum tag is not emitted).
 */
[[nodiscard]] inline std::optional<Error> WriteBignum(
    Writer& writer, bool negative, std::span<const uint8_t> magnitude) {
    if (magnitude.size() > std::numeric_limits<uint8_t>::max()) {
        return Error::unsupported_type("bignum wider than 255 bytes");
    }
    writer.write_tag(Tag::SmallBignum);
    writer.write1(static_cast<uint8_t>(magnitude.size()));
    writer.write1(negative ? 1 : 0);
    writer.write_bytes(std::as_bytes(magnitude));
    return std::nullopt;
}

/**
 * @brief Writes a signed integer using the narrowest tag.
 *
 * [0, 255] uses the small integer tag, the 32-bit signed range uses the
 * integer tag, and everything else becomes a small bignum.
 */
[[nodiscard]] inline std::optional<Error> WriteNumber(Writer& writer,
                                                      int64_t value) {
    if (value >= 0 && value <= std::numeric_limits<uint8_t>::max()) {
        WriteSmallInteger(writer, static_cast<uint8_t>(value));
        return std::nullopt;
    }
    if (value >= std::numeric_limits<int32_t>::min() &&
        value <= std::numeric_limits<int32_t>::max()) {
        WriteInteger(writer, static_cast<int32_t>(value));
        return std::nullopt;
    }
    const BigInt big{value};
    return WriteBignum(writer, big.negative(), big.magnitude());
}

[[nodiscard]] inline std::optional<Error> WriteNumber(Writer& writer,
                                                      uint64_t value) {
    if (value <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
        return WriteNumber(writer, static_cast<int64_t>(value));
    }
    const BigInt big{value};
    return WriteBignum(writer, big.negative(), big.magnitude());
}

[[nodiscard]] inline std::optional<Error> WriteNumber(Writer& writer,
                                                      const BigInt& value) {
    if (const auto narrow = value.to_int64(); narrow.has_value()) {
        return WriteNumber(writer, *narrow);
    }
    return WriteBignum(writer, value.negative(), value.magnitude());
}

/**
 * @brief Writes a float as 31 bytes of `%.20e` text, null padded.
 *
 * The value is narrowed to single precision first, so only float32
 * precision survives the wire.
 */
inline void WriteFloat(Writer& writer, float value) {
    std::array<char, FloatPayloadSize> text{};
    // "-d.<20 digits>e+dd" needs at most 27 characters, so this cannot fail.
    static_cast<void>(std::to_chars(text.data(), text.data() + text.size(),
                                    static_cast<double>(value),
                                    std::chars_format::scientific, 20));
    writer.write_tag(Tag::Float);
    writer.write_bytes(std::as_bytes(std::span{text}));
}

[[nodiscard]] inline std::expected<int64_t, Error> ReadSmallInteger(
    Reader& reader) noexcept {
    return reader.read1().transform(
        [](uint8_t v) { return static_cast<int64_t>(v); });
}

[[nodiscard]] inline std::expected<int64_t, Error> ReadInteger(
    Reader& reader) noexcept {
    return reader.read4().transform([](uint32_t v) {
        return static_cast<int64_t>(static_cast<int32_t>(v));
    });
}

/**
 * @brief Reads a small (1 byte length) or large (4 byte length) bignum.
 *
 * @return An int64_t Term when the value fits, otherwise a BigInt Term.
 */
[[nodiscard]] inline std::expected<Term, Error> ReadBignum(Reader& reader,
                                                           Tag tag) {
    std::size_t length;
    if (tag == Tag::SmallBignum) {
        auto n = reader.read1();
        if (!n) {
            return std::unexpected(n.error());
        }
        length = *n;
    } else {
        auto n = reader.read4();
        if (!n) {
            return std::unexpected(n.error());
        }
        length = *n;
    }

    auto sign = reader.read1();
    if (!sign) {
        return std::unexpected(sign.error());
    }
    auto bytes = reader.read_bytes(length);
    if (!bytes) {
        return std::unexpected(bytes.error());
    }

    std::vector<uint8_t> magnitude(bytes->size());
    std::ranges::transform(*bytes, magnitude.begin(), [](std::byte b) {
        return static_cast<uint8_t>(b);
    });
    BigInt value = BigInt::FromMagnitude(*sign != 0, std::move(magnitude));
    if (const auto narrow = value.to_int64(); narrow.has_value()) {
        return Term{*narrow};
    }
    return Term{std::move(value)};
}

/**
 * @brief Reads the 31 byte float payload.
 *
 * Text after the first null byte is ignored. Anything that does not parse
 * completely as a float, or is out of float range, is MalformedFloat.
 */
[[nodiscard]] inline std::expected<float, Error> ReadFloat(Reader& reader) {
    const std::size_t start = reader.offset();
    auto payload = reader.read_bytes(FloatPayloadSize);
    if (!payload) {
        return std::unexpected(payload.error());
    }

    std::array<char, FloatPayloadSize> text{};
    std::ranges::transform(*payload, text.begin(),
                           [](std::byte b) { return static_cast<char>(b); });
    const char* first = text.data();
    const char* last =
        text.data() + (std::ranges::find(text, '\0') - text.begin());

    float value = 0.0F;
    const auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc{} || ptr != last || first == last) {
        return std::unexpected(Error::malformed_float(start));
    }
    return value;
}

}  // namespace Bert::codec
