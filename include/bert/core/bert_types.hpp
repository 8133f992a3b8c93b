#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace Bert {

/**
 * @brief Tag byte identifying the kind of every value on the wire.
 */
enum class Tag : uint8_t {
    Version = 131,      ///< Leading byte of every top-level encoding.
    SmallInteger = 97,  ///< 1 byte unsigned.
    Integer = 98,       ///< 4 bytes signed, big-endian.
    Float = 99,         ///< 31 bytes of null-padded scientific text.
    Atom = 100,         ///< 2 byte length + text.
    SmallTuple = 104,   ///< 1 byte arity + elements.
    LargeTuple = 105,   ///< Unsupported.
    Nil = 106,          ///< Empty list, no payload.
    String = 107,       ///< 2 byte length + text.
    List = 108,         ///< 4 byte count + elements + nil tag.
    Binary = 109,       ///< 4 byte length + bytes.
    SmallBignum = 110,  ///< 1 byte length, sign, little-endian magnitude.
    LargeBignum = 111,  ///< 4 byte length, sign, little-endian magnitude.
    Bitstring = 77,     ///< 4 byte length, trailing bit count, bytes.
};

/**
 * @brief Size of the float payload in bytes.
 */
static constexpr std::size_t FloatPayloadSize = 31;

/**
 * @brief Size of the BURP length prefix in bytes.
 */
static constexpr std::size_t FrameHeaderSize = sizeof(uint32_t);

/**
 * @brief Error codes representing the failure conditions of the codec.
 */
enum class ErrorCode : uint8_t {
    UNKNOWN = 0,      ///< Unknown error.
    BadMagic,         ///< Version byte at stream start is not 131.
    UnknownTag,       ///< Tag byte has no codec mapping.
    UnsupportedType,  ///< Known tag or value shape outside the supported set.
    UnexpectedEnd,    ///< Input ended before a payload completed.
    MalformedFloat,   ///< Float payload is not parseable.
    ValueTooLarge,    ///< Length does not fit its size field.
    LimitExceeded,    ///< Nesting depth or frame size above policy limit.
    TrailingData,     ///< Bytes left inside a frame after the term.
    ArityMismatch,    ///< Sequence length differs from record field count.
    TypeMismatch,     ///< Term cannot be bound to the requested type.
};

/**
 * @brief Returns a short name for the error code, suitable for logs.
 */
[[nodiscard]] constexpr std::string_view ToString(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::BadMagic:
            return "bad magic";
        case ErrorCode::UnknownTag:
            return "unknown tag";
        case ErrorCode::UnsupportedType:
            return "unsupported type";
        case ErrorCode::UnexpectedEnd:
            return "unexpected end";
        case ErrorCode::MalformedFloat:
            return "malformed float";
        case ErrorCode::ValueTooLarge:
            return "value too large";
        case ErrorCode::LimitExceeded:
            return "limit exceeded";
        case ErrorCode::TrailingData:
            return "trailing data";
        case ErrorCode::ArityMismatch:
            return "arity mismatch";
        case ErrorCode::TypeMismatch:
            return "type mismatch";
        case ErrorCode::UNKNOWN:
            break;
    }
    return "unknown error";
}

/**
 * @brief Represents an error that occurred while encoding, decoding or
 * binding a term.
 *
 * Contains an error code, the byte offset into the input where decoding
 * stopped (0 for encode errors), the index of the record field being bound
 * (0 when not applicable), and a static description.
 */
struct Error {
    ErrorCode code;  ///< The error code.
    // cppcheck-suppress unusedStructMember
    std::size_t offset{0};  ///< Input offset of the failure.
    // cppcheck-suppress unusedStructMember
    std::size_t field_index{0};  ///< Record field being bound.
    // cppcheck-suppress unusedStructMember
    std::string_view message{};  ///< Static error message string.

    [[nodiscard]] static constexpr Error bad_magic() noexcept {
        return {ErrorCode::BadMagic, 0, 0, "bad magic"};
    }

    [[nodiscard]] static constexpr Error unknown_tag(
        std::size_t offset) noexcept {
        return {ErrorCode::UnknownTag, offset, 0, "unknown tag"};
    }

    /**
     * @brief Creates an error for a tag or value shape the codec recognises
     * but does not support.
     * @param msg Description of the unsupported shape.
     * @param offset Input offset, when decoding.
     */
    [[nodiscard]] static constexpr Error unsupported_type(
        std::string_view msg = "unsupported type",
        std::size_t offset = 0) noexcept {
        return {ErrorCode::UnsupportedType, offset, 0, msg};
    }

    [[nodiscard]] static constexpr Error unexpected_end(
        std::size_t offset) noexcept {
        return {ErrorCode::UnexpectedEnd, offset, 0, "unexpected end of input"};
    }

    [[nodiscard]] static constexpr Error malformed_float(
        std::size_t offset) noexcept {
        return {ErrorCode::MalformedFloat, offset, 0, "malformed float"};
    }

    /**
     * @brief Creates an error for a length that overflows its size field.
     * @tparam N Size of the message string literal.
     * @param msg Which length overflowed.
     */
    template <size_t N>
    [[nodiscard]] static constexpr Error value_too_large(
        const char (&msg)[N]) noexcept {
        return {ErrorCode::ValueTooLarge, 0, 0, std::string_view{msg, N - 1}};
    }

    template <size_t N>
    [[nodiscard]] static constexpr Error limit_exceeded(
        const char (&msg)[N], std::size_t offset = 0) noexcept {
        return {ErrorCode::LimitExceeded, offset, 0,
                std::string_view{msg, N - 1}};
    }

    [[nodiscard]] static constexpr Error trailing_data(
        std::size_t offset) noexcept {
        return {ErrorCode::TrailingData, offset, 0,
                "trailing bytes after term"};
    }

    [[nodiscard]] static constexpr Error arity_mismatch() noexcept {
        return {ErrorCode::ArityMismatch, 0, 0,
                "element count does not match field count"};
    }

    /**
     * @brief Creates an error for a term that cannot bind to a field type.
     * @tparam N Size of the message string literal.
     * @param index The record field index (0 for top-level values).
     * @param msg The expected kind of term.
     */
    template <size_t N>
    [[nodiscard]] static constexpr Error type_mismatch(
        std::size_t index, const char (&msg)[N]) noexcept {
        return {ErrorCode::TypeMismatch, 0, index,
                std::string_view{msg, N - 1}};
    }

    [[nodiscard]] constexpr bool operator==(const Error& other) const noexcept =
        default;

    /**
     * @brief Checks if the error matches a specific error code.
     */
    [[nodiscard]] constexpr bool operator==(ErrorCode c) const noexcept {
        return code == c;
    }
};

}  // namespace Bert
