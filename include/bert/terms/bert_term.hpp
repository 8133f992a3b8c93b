#pragma once

#include <bert/terms/bert_bigint.hpp>
#include <compare>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <limits>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace Bert {

/**
 * @brief Symbolic identifier, distinguished from plain strings by type.
 */
struct Atom {
    std::string name;

    Atom() = default;
    explicit Atom(std::string n) : name(std::move(n)) {}
    explicit Atom(std::string_view n) : name(n) {}
    explicit Atom(const char* n) : name(n) {}

    [[nodiscard]] bool operator==(const Atom&) const = default;
    [[nodiscard]] bool operator==(std::string_view other) const noexcept {
        return name == other;
    }
};

namespace atoms {
inline constexpr std::string_view Bert = "bert";
inline constexpr std::string_view Nil = "nil";
inline constexpr std::string_view True = "true";
inline constexpr std::string_view False = "false";
}  // namespace atoms

/**
 * @brief Native nil, the absence of a value.
 */
struct Nil {
    [[nodiscard]] bool operator==(const Nil&) const = default;
};

/**
 * @brief Raw byte sequence (binary tag).
 */
using Binary = std::vector<std::byte>;

/**
 * @brief Byte sequence with an explicit total bit length.
 *
 * Only the first `bits` bits are significant. A bit length that is a multiple
 * of 8 is a plain binary.
 */
struct Bitstring {
    std::vector<std::byte> bytes;
    uint64_t bits{0};

    [[nodiscard]] bool operator==(const Bitstring&) const = default;
};

struct Term;

/**
 * @brief Ordered fixed-arity sequence (small tuple tag).
 */
struct Tuple {
    std::vector<Term> elements;

    Tuple() = default;
    explicit Tuple(std::vector<Term> e);
    Tuple(std::initializer_list<Term> e);

    [[nodiscard]] bool operator==(const Tuple&) const;
};

/**
 * @brief Ordered sequence terminated by nil (list tag).
 */
struct List {
    std::vector<Term> items;

    List() = default;
    explicit List(std::vector<Term> i);
    List(std::initializer_list<Term> i);

    [[nodiscard]] bool operator==(const List&) const;
};

/**
 * @brief The closed set of values the codec decodes to and encodes from.
 */
using TermValue = std::variant<Nil, bool, int64_t, BigInt, float, Atom,
                               std::string, Binary, Bitstring, Tuple, List>;

/**
 * @brief A decoded or encodable value.
 *
 * Wraps TermValue so that Tuple and List can hold Terms recursively.
 * Integral arguments widen to int64_t (unsigned values above the int64_t range
 * become BigInt), floating point narrows to float, and C strings become
 * std::string.
 */
struct Term {
    TermValue value;

    Term() : value(Nil{}) {}
    Term(Nil v) : value(v) {}
    Term(bool v) : value(v) {}

    template <std::integral I>
        requires(!std::same_as<I, bool>)
    Term(I v) : value(Widen(v)) {}

    template <std::floating_point F>
    Term(F v) : value(static_cast<float>(v)) {}

    Term(BigInt v) : value(std::move(v)) {}
    Term(Atom v) : value(std::move(v)) {}
    Term(std::string v) : value(std::move(v)) {}
    Term(std::string_view v) : value(std::string{v}) {}
    Term(const char* v) : value(std::string{v}) {}
    Term(Binary v) : value(std::move(v)) {}
    Term(Bitstring v) : value(std::move(v)) {}
    Term(Tuple v) : value(std::move(v)) {}
    Term(List v) : value(std::move(v)) {}

    template <typename T>
    [[nodiscard]] bool is() const noexcept {
        return std::holds_alternative<T>(value);
    }

    template <typename T>
    [[nodiscard]] const T& as() const {
        return std::get<T>(value);
    }

    template <typename T>
    [[nodiscard]] const T* get_if() const noexcept {
        return std::get_if<T>(&value);
    }

    [[nodiscard]] bool operator==(const Term& other) const {
        return value == other.value;
    }

   private:
    template <std::integral I>
    static TermValue Widen(I v) {
        if constexpr (std::is_unsigned_v<I> && sizeof(I) >= sizeof(int64_t)) {
            if (v > static_cast<uint64_t>(
                        std::numeric_limits<int64_t>::max())) {
                return BigInt{v};
            }
        }
        return static_cast<int64_t>(v);
    }
};

inline Tuple::Tuple(std::vector<Term> e) : elements(std::move(e)) {}
inline Tuple::Tuple(std::initializer_list<Term> e) : elements(e) {}
inline bool Tuple::operator==(const Tuple& other) const {
    return elements == other.elements;
}

inline List::List(std::vector<Term> i) : items(std::move(i)) {}
inline List::List(std::initializer_list<Term> i) : items(i) {}
inline bool List::operator==(const List& other) const {
    return items == other.items;
}

namespace detail {

inline void WriteQuotedText(std::ostream& out, std::string_view text,
                            char quote) {
    out << quote;
    for (const char c : text) {
        if (c == quote || c == '\\') {
            out << '\\';
        }
        out << c;
    }
    out << quote;
}

inline void WriteBytes(std::ostream& out, const std::vector<std::byte>& bytes,
                       std::size_t count) {
    for (std::size_t i = 0; i < count && i < bytes.size(); ++i) {
        if (i != 0) {
            out << ',';
        }
        out << static_cast<unsigned>(bytes[i]);
    }
}

template <typename Seq>
void WriteElements(std::ostream& out, const Seq& elements);

inline void WriteTerm(std::ostream& out, const Term& term) {
    std::visit(
        [&out](const auto& v) {
            using V = std::decay_t<decltype(v)>;
            if constexpr (std::same_as<V, Nil>) {
                out << "nil";
            } else if constexpr (std::same_as<V, bool>) {
                out << (v ? "true" : "false");
            } else if constexpr (std::same_as<V, int64_t> ||
                                 std::same_as<V, float>) {
                out << v;
            } else if constexpr (std::same_as<V, BigInt>) {
                out << v.ToString();
            } else if constexpr (std::same_as<V, Atom>) {
                out << v.name;
            } else if constexpr (std::same_as<V, std::string>) {
                WriteQuotedText(out, v, '"');
            } else if constexpr (std::same_as<V, Binary>) {
                out << "<<";
                WriteBytes(out, v, v.size());
                out << ">>";
            } else if constexpr (std::same_as<V, Bitstring>) {
                out << "<<";
                WriteBytes(out, v.bytes, (v.bits + 7) / 8);
                if (v.bits % 8 != 0) {
                    out << ':' << (v.bits % 8);
                }
                out << ">>";
            } else if constexpr (std::same_as<V, Tuple>) {
                out << '{';
                WriteElements(out, v.elements);
                out << '}';
            } else {
                out << '[';
                WriteElements(out, v.items);
                out << ']';
            }
        },
        term.value);
}

template <typename Seq>
void WriteElements(std::ostream& out, const Seq& elements) {
    bool first = true;
    for (const auto& element : elements) {
        if (!first) {
            out << ',';
        }
        first = false;
        WriteTerm(out, element);
    }
}

}  // namespace detail

/**
 * @brief Writes a term in Erlang syntax, e.g. `{call,math,add,[1,2]}`.
 *
 * The trailing bit count of a bitstring is written after its last byte.
 */
inline std::ostream& operator<<(std::ostream& out, const Term& term) {
    detail::WriteTerm(out, term);
    return out;
}

[[nodiscard]] inline std::string ToString(const Term& term) {
    std::ostringstream out;
    out << term;
    return out.str();
}

}  // namespace Bert
