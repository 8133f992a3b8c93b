#pragma once

#include <bert/core/bert_types.hpp>
#include <bert/records/bert_fields.hpp>
#include <bert/terms/bert_bigint.hpp>
#include <bert/terms/bert_term.hpp>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <optional>
#include <span>
#include <string>
#include <tuple>
#include <type_traits>
#include <utility>
#include <vector>

namespace Bert {

/**
 * @brief Per-type conversion from a decoded Term.
 *
 * Specializations provide
 * `static std::expected<T, Error> Convert(const Term&, std::size_t index)`,
 * where `index` is the record field being bound and is reported in
 * TypeMismatch errors.
 */
template <typename T>
struct FromTerm;

template <typename T>
concept Bindable = requires(const Term& term, std::size_t index) {
    { FromTerm<T>::Convert(term, index) } -> std::same_as<std::expected<T, Error>>;
};

namespace detail {

/**
 * @brief Returns the elements of a tuple or list term, or nullptr.
 */
[[nodiscard]] inline const std::vector<Term>* SequenceElements(
    const Term& term) noexcept {
    if (const auto* tuple = term.get_if<Tuple>()) {
        return &tuple->elements;
    }
    if (const auto* list = term.get_if<List>()) {
        return &list->items;
    }
    return nullptr;
}

template <typename T>
[[nodiscard]] std::expected<T, Error> ExactAlternative(const Term& term,
                                                       std::size_t index) {
    if (const auto* v = term.get_if<T>()) {
        return *v;
    }
    return std::unexpected(Error::type_mismatch(index, "unexpected term type"));
}

}  // namespace detail

template <>
struct FromTerm<Term> {
    static std::expected<Term, Error> Convert(const Term& term, std::size_t) {
        return term;
    }
};

template <>
struct FromTerm<Atom> {
    static std::expected<Atom, Error> Convert(const Term& term,
                                              std::size_t index) {
        if (const auto* atom = term.get_if<Atom>()) {
            return *atom;
        }
        return std::unexpected(Error::type_mismatch(index, "expected atom"));
    }
};

/**
 * @brief Strings bind from string and binary terms, and from the empty list
 * (how Erlang encodes "").
 */
template <>
struct FromTerm<std::string> {
    static std::expected<std::string, Error> Convert(const Term& term,
                                                     std::size_t index) {
        if (const auto* text = term.get_if<std::string>()) {
            return *text;
        }
        if (const auto* bytes = term.get_if<Binary>()) {
            return std::string{reinterpret_cast<const char*>(bytes->data()),
                               bytes->size()};
        }
        if (const auto* list = term.get_if<List>();
            list != nullptr && list->items.empty()) {
            return std::string{};
        }
        return std::unexpected(Error::type_mismatch(index, "expected string"));
    }
};

/**
 * @brief Integers bind from integer and bignum terms that fit T.
 *
 * Character types are range checked as the signed or unsigned integer of the
 * same width.
 */
template <std::integral T>
    requires(!std::same_as<T, bool>)
struct FromTerm<T> {
    static std::expected<T, Error> Convert(const Term& term,
                                           std::size_t index) {
        std::optional<int64_t> value;
        if (const auto* i = term.get_if<int64_t>()) {
            value = *i;
        } else if (const auto* big = term.get_if<BigInt>()) {
            if constexpr (std::same_as<T, uint64_t>) {
                if (!big->negative() && big->magnitude().size() <= 8) {
                    uint64_t magnitude = 0;
                    for (auto it = big->magnitude().rbegin();
                         it != big->magnitude().rend(); ++it) {
                        magnitude = (magnitude << 8) | *it;
                    }
                    return magnitude;
                }
            }
            value = big->to_int64();
        } else {
            return std::unexpected(
                Error::type_mismatch(index, "expected integer"));
        }

        using Range = std::conditional_t<std::is_signed_v<T>,
                                         std::make_signed_t<T>,
                                         std::make_unsigned_t<T>>;
        if (!value.has_value() || !std::in_range<Range>(*value)) {
            return std::unexpected(
                Error::type_mismatch(index, "integer out of range"));
        }
        return static_cast<T>(*value);
    }
};

template <std::floating_point T>
struct FromTerm<T> {
    static std::expected<T, Error> Convert(const Term& term,
                                           std::size_t index) {
        if (const auto* f = term.get_if<float>()) {
            return static_cast<T>(*f);
        }
        return std::unexpected(Error::type_mismatch(index, "expected float"));
    }
};

template <>
struct FromTerm<bool> {
    static std::expected<bool, Error> Convert(const Term& term,
                                              std::size_t index) {
        if (const auto* b = term.get_if<bool>()) {
            return *b;
        }
        return std::unexpected(Error::type_mismatch(index, "expected boolean"));
    }
};

template <>
struct FromTerm<BigInt> {
    static std::expected<BigInt, Error> Convert(const Term& term,
                                                std::size_t index) {
        if (const auto* i = term.get_if<int64_t>()) {
            return BigInt{*i};
        }
        if (const auto* big = term.get_if<BigInt>()) {
            return *big;
        }
        return std::unexpected(Error::type_mismatch(index, "expected integer"));
    }
};

template <>
struct FromTerm<Nil> {
    static std::expected<Nil, Error> Convert(const Term& term,
                                             std::size_t index) {
        return detail::ExactAlternative<Nil>(term, index);
    }
};

template <>
struct FromTerm<Binary> {
    static std::expected<Binary, Error> Convert(const Term& term,
                                                std::size_t index) {
        return detail::ExactAlternative<Binary>(term, index);
    }
};

/**
 * @brief Bitstrings also bind from binaries, as whole-byte bitstrings.
 */
template <>
struct FromTerm<Bitstring> {
    static std::expected<Bitstring, Error> Convert(const Term& term,
                                                   std::size_t index) {
        if (const auto* bytes = term.get_if<Binary>()) {
            return Bitstring{*bytes, static_cast<uint64_t>(bytes->size()) * 8};
        }
        return detail::ExactAlternative<Bitstring>(term, index);
    }
};

template <>
struct FromTerm<Tuple> {
    static std::expected<Tuple, Error> Convert(const Term& term,
                                               std::size_t index) {
        return detail::ExactAlternative<Tuple>(term, index);
    }
};

/**
 * @brief Lists also bind from tuples, since peers send argument sequences as
 * either.
 */
template <>
struct FromTerm<List> {
    static std::expected<List, Error> Convert(const Term& term,
                                              std::size_t index) {
        if (const auto* elements = detail::SequenceElements(term)) {
            return List(*elements);
        }
        return std::unexpected(Error::type_mismatch(index, "expected list"));
    }
};

template <typename T>
    requires Bindable<T>
struct FromTerm<std::vector<T>> {
    static std::expected<std::vector<T>, Error> Convert(const Term& term,
                                                        std::size_t index) {
        const auto* elements = detail::SequenceElements(term);
        if (elements == nullptr) {
            return std::unexpected(
                Error::type_mismatch(index, "expected tuple or list"));
        }
        std::vector<T> result;
        result.reserve(elements->size());
        for (const auto& element : *elements) {
            auto value = FromTerm<T>::Convert(element, index);
            if (!value) {
                return std::unexpected(value.error());
            }
            result.push_back(std::move(*value));
        }
        return result;
    }
};

/**
 * @brief Optionals bind native nil and the empty list to std::nullopt.
 *
 * An empty optional encodes as the nil tag, which decodes as the empty list.
 */
template <typename T>
    requires Bindable<T>
struct FromTerm<std::optional<T>> {
    static std::expected<std::optional<T>, Error> Convert(const Term& term,
                                                          std::size_t index) {
        const auto* list = term.get_if<List>();
        if (term.is<Nil>() || (list != nullptr && list->items.empty())) {
            return std::optional<T>{};
        }
        return FromTerm<T>::Convert(term, index).transform(
            [](T v) { return std::optional<T>{std::move(v)}; });
    }
};

/**
 * @brief Binds a tuple or list term onto a record, element i to field i.
 *
 * Fails fast: a term that is not a tuple or list, or has a different number
 * of elements than the record has fields, or an element that does not convert
 * to its field's type, is an error. The record is only returned when every
 * field bound.
 *
 * @tparam R The record type (declared with BERT_RECORD_FIELDS).
 * @param term The decoded term.
 * @return The populated record, or an Error.
 */
template <Record R>
[[nodiscard]] std::expected<R, Error> Bind(const Term& term) {
    const auto* elements = detail::SequenceElements(term);
    if (elements == nullptr) {
        return std::unexpected(
            Error::type_mismatch(0, "expected tuple or list"));
    }
    if (elements->size() != field_count_v<R>) {
        return std::unexpected(Error::arity_mismatch());
    }

    R record{};
    std::optional<Error> err;
    std::size_t index = 0;
    std::apply(
        [&](auto&... fields) {
            ([&] {
                using Field = std::remove_cvref_t<decltype(fields)>;
                auto value = FromTerm<Field>::Convert((*elements)[index], index);
                if (!value) {
                    err = value.error();
                    return false;
                }
                fields = std::move(*value);
                ++index;
                return true;
            }() &&
             ...);
        },
        record.get_fields());

    if (err.has_value()) {
        return std::unexpected(*err);
    }
    return record;
}

/**
 * @brief Nested records bind from nested tuples.
 *
 * Errors inside the nested record keep their own field index.
 */
template <Record R>
struct FromTerm<R> {
    static std::expected<R, Error> Convert(const Term& term, std::size_t) {
        return Bind<R>(term);
    }
};

}  // namespace Bert
