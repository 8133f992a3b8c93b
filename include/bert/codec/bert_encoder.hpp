#pragma once

#include <array>
#include <bert/codec/bert_numeric.hpp>
#include <bert/codec/bert_sequence.hpp>
#include <bert/codec/bert_text.hpp>
#include <bert/core/bert_io.hpp>
#include <bert/core/bert_types.hpp>
#include <bert/records/bert_fields.hpp>
#include <bert/terms/bert_bigint.hpp>
#include <bert/terms/bert_term.hpp>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <tuple>
#include <type_traits>
#include <variant>
#include <vector>

namespace Bert {

/**
 * @brief Per-type encoding trait.
 *
 * Specializations provide
 * `static std::optional<Error> Encode(Writer&, const T&)` and write exactly
 * one tag-prefixed value. There is no default implementation: a type without
 * a specialization is not Encodable and is rejected at compile time.
 */
template <typename T>
struct TermEncoder;

/**
 * @brief Concept satisfied by every type the encoder knows how to write.
 */
template <typename T>
concept Encodable = requires(Writer& writer, const T& value) {
    {
        TermEncoder<std::remove_cv_t<T>>::Encode(writer, value)
    } -> std::same_as<std::optional<Error>>;
};

/**
 * @brief Writes one value through its TermEncoder.
 */
template <typename T>
    requires Encodable<T>
[[nodiscard]] std::optional<Error> EncodeValue(Writer& writer,
                                               const T& value) {
    return TermEncoder<std::remove_cv_t<T>>::Encode(writer, value);
}

namespace detail {

struct ElementWriter {
    template <typename T>
    std::optional<Error> operator()(Writer& writer, const T& value) const {
        return EncodeValue(writer, value);
    }
};

[[nodiscard]] inline std::optional<Error> WriteComplexAtom(
    Writer& writer, std::string_view kind) {
    if (auto err = codec::WriteTupleHeader(writer, 2); err) {
        return err;
    }
    if (auto err = codec::WriteAtom(writer, atoms::Bert); err) {
        return err;
    }
    return codec::WriteAtom(writer, kind);
}

template <typename Tup>
[[nodiscard]] std::optional<Error> WriteTupleLike(Writer& writer,
                                                  const Tup& values) {
    if (auto err = codec::WriteTupleHeader(
            writer, std::tuple_size_v<std::remove_cvref_t<Tup>>);
        err) {
        return err;
    }
    std::optional<Error> err;
    std::apply(
        [&](const auto&... fields) {
            ([&] {
                err = EncodeValue(writer, fields);
                return !err.has_value();
            }() &&
             ...);
        },
        values);
    return err;
}

}  // namespace detail

// Indirection: unwrap, or nil when empty.

template <typename T>
    requires Encodable<T>
struct TermEncoder<std::optional<T>> {
    static std::optional<Error> Encode(Writer& writer,
                                       const std::optional<T>& value) {
        if (!value.has_value()) {
            codec::WriteNil(writer);
            return std::nullopt;
        }
        return EncodeValue(writer, *value);
    }
};

template <typename T>
    requires Encodable<T>
struct TermEncoder<T*> {
    static std::optional<Error> Encode(Writer& writer, const T* value) {
        if (value == nullptr) {
            codec::WriteNil(writer);
            return std::nullopt;
        }
        return EncodeValue(writer, *value);
    }
};

template <typename T>
    requires Encodable<T>
struct TermEncoder<std::unique_ptr<T>> {
    static std::optional<Error> Encode(Writer& writer,
                                       const std::unique_ptr<T>& value) {
        return TermEncoder<T*>::Encode(writer, value.get());
    }
};

template <typename T>
    requires Encodable<T>
struct TermEncoder<std::shared_ptr<T>> {
    static std::optional<Error> Encode(Writer& writer,
                                       const std::shared_ptr<T>& value) {
        return TermEncoder<T*>::Encode(writer, value.get());
    }
};

template <typename T>
    requires Encodable<T>
struct TermEncoder<std::reference_wrapper<T>> {
    static std::optional<Error> Encode(Writer& writer,
                                       const std::reference_wrapper<T>& value) {
        return EncodeValue(writer, value.get());
    }
};

// Numbers.

template <std::integral T>
    requires(!std::same_as<T, bool>)
struct TermEncoder<T> {
    static std::optional<Error> Encode(Writer& writer, T value) {
        if constexpr (std::is_signed_v<T>) {
            return codec::WriteNumber(writer, static_cast<int64_t>(value));
        } else {
            return codec::WriteNumber(writer, static_cast<uint64_t>(value));
        }
    }
};

template <std::floating_point T>
struct TermEncoder<T> {
    static std::optional<Error> Encode(Writer& writer, T value) {
        codec::WriteFloat(writer, static_cast<float>(value));
        return std::nullopt;
    }
};

template <>
struct TermEncoder<BigInt> {
    static std::optional<Error> Encode(Writer& writer, const BigInt& value) {
        return codec::WriteNumber(writer, value);
    }
};

/**
 * @brief Booleans encode as the complex terms `{bert, true}` and
 * `{bert, false}`, which the decoder collapses back to bool.
 */
template <>
struct TermEncoder<bool> {
    static std::optional<Error> Encode(Writer& writer, bool value) {
        return detail::WriteComplexAtom(writer,
                                        value ? atoms::True : atoms::False);
    }
};

// Text.

template <>
struct TermEncoder<Atom> {
    static std::optional<Error> Encode(Writer& writer, const Atom& value) {
        return codec::WriteAtom(writer, value.name);
    }
};

template <>
struct TermEncoder<std::string> {
    static std::optional<Error> Encode(Writer& writer,
                                       const std::string& value) {
        return codec::WriteString(writer, value);
    }
};

template <>
struct TermEncoder<std::string_view> {
    static std::optional<Error> Encode(Writer& writer,
                                       std::string_view value) {
        return codec::WriteString(writer, value);
    }
};

template <>
struct TermEncoder<const char*> {
    static std::optional<Error> Encode(Writer& writer, const char* value) {
        return codec::WriteString(writer, value);
    }
};

template <>
struct TermEncoder<char*> {
    static std::optional<Error> Encode(Writer& writer, const char* value) {
        return codec::WriteString(writer, value);
    }
};

template <std::size_t N>
struct TermEncoder<char[N]> {
    static std::optional<Error> Encode(Writer& writer, const char (&value)[N]) {
        return codec::WriteString(writer, std::string_view{value});
    }
};

// Bytes.

template <>
struct TermEncoder<Binary> {
    static std::optional<Error> Encode(Writer& writer, const Binary& value) {
        return codec::WriteBinary(writer, value);
    }
};

template <>
struct TermEncoder<std::vector<uint8_t>> {
    static std::optional<Error> Encode(Writer& writer,
                                       const std::vector<uint8_t>& value) {
        return codec::WriteBinary(writer, std::as_bytes(std::span{value}));
    }
};

template <>
struct TermEncoder<std::span<const std::byte>> {
    static std::optional<Error> Encode(Writer& writer,
                                       std::span<const std::byte> value) {
        return codec::WriteBinary(writer, value);
    }
};

template <>
struct TermEncoder<Bitstring> {
    static std::optional<Error> Encode(Writer& writer, const Bitstring& value) {
        return codec::WriteBitstring(writer, value.bytes, value.bits);
    }
};

// Sequences.

/**
 * @brief Variable-length vectors encode as small tuples.
 */
template <typename T>
    requires(Encodable<T> && !std::same_as<T, bool>)
struct TermEncoder<std::vector<T>> {
    static std::optional<Error> Encode(Writer& writer,
                                       const std::vector<T>& value) {
        return codec::WriteTuple(writer, value, detail::ElementWriter{});
    }
};

/**
 * @brief A tuple of `{bert, true}` / `{bert, false}` elements.
 *
 * std::vector<bool> yields proxy references, so each element is read out as
 * a plain bool first.
 */
template <>
struct TermEncoder<std::vector<bool>> {
    static std::optional<Error> Encode(Writer& writer,
                                       const std::vector<bool>& value) {
        if (auto err = codec::WriteTupleHeader(writer, value.size()); err) {
            return err;
        }
        for (const bool element : value) {
            if (auto err = EncodeValue(writer, element); err) {
                return err;
            }
        }
        return std::nullopt;
    }
};

template <typename... Ts>
    requires(Encodable<Ts> && ...)
struct TermEncoder<std::tuple<Ts...>> {
    static std::optional<Error> Encode(Writer& writer,
                                       const std::tuple<Ts...>& value) {
        return detail::WriteTupleLike(writer, value);
    }
};

/**
 * @brief Fixed-length arrays encode as lists.
 */
template <typename T, std::size_t N>
    requires Encodable<T>
struct TermEncoder<std::array<T, N>> {
    static std::optional<Error> Encode(Writer& writer,
                                       const std::array<T, N>& value) {
        return codec::WriteList(writer, value, detail::ElementWriter{});
    }
};

template <>
struct TermEncoder<List> {
    static std::optional<Error> Encode(Writer& writer, const List& value) {
        return codec::WriteList(writer, value.items, detail::ElementWriter{});
    }
};

template <>
struct TermEncoder<Tuple> {
    static std::optional<Error> Encode(Writer& writer, const Tuple& value) {
        return codec::WriteTuple(writer, value.elements,
                                 detail::ElementWriter{});
    }
};

template <Record T>
struct TermEncoder<T> {
    static std::optional<Error> Encode(Writer& writer, const T& value) {
        return detail::WriteTupleLike(writer, value.get_fields());
    }
};

// Nil.

template <>
struct TermEncoder<Nil> {
    static std::optional<Error> Encode(Writer& writer, Nil) {
        codec::WriteNil(writer);
        return std::nullopt;
    }
};

template <>
struct TermEncoder<std::nullptr_t> {
    static std::optional<Error> Encode(Writer& writer, std::nullptr_t) {
        codec::WriteNil(writer);
        return std::nullopt;
    }
};

template <>
struct TermEncoder<std::nullopt_t> {
    static std::optional<Error> Encode(Writer& writer, std::nullopt_t) {
        codec::WriteNil(writer);
        return std::nullopt;
    }
};

/**
 * @brief Terms encode by visiting their alternative.
 */
template <>
struct TermEncoder<Term> {
    static std::optional<Error> Encode(Writer& writer, const Term& value) {
        return std::visit(
            [&writer](const auto& v) { return EncodeValue(writer, v); },
            value.value);
    }
};

}  // namespace Bert
