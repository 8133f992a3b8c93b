#pragma once

#include <algorithm>
#include <bert/core/bert_io.hpp>
#include <bert/core/bert_types.hpp>
#include <bert/terms/bert_term.hpp>
#include <concepts>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <iterator>
#include <limits>
#include <optional>
#include <vector>

/**
 * @brief Small tuple, list and nil codecs.
 *
 * Element encoding and decoding is supplied by the caller so that these
 * codecs stay independent of the recursive dispatcher.
 */
namespace Bert::codec {

inline void WriteNil(Writer& writer) { writer.write_tag(Tag::Nil); }

/**
 * @brief Writes the small tuple tag and arity.
 * @return UnsupportedType for arity 256 and above (no large tuple support).
 */
[[nodiscard]] inline std::optional<Error> WriteTupleHeader(Writer& writer,
                                                           std::size_t arity) {
    if (arity > std::numeric_limits<uint8_t>::max()) {
        return Error::unsupported_type("tuple arity above 255");
    }
    writer.write_tag(Tag::SmallTuple);
    writer.write1(static_cast<uint8_t>(arity));
    return std::nullopt;
}

[[nodiscard]] inline std::optional<Error> WriteListHeader(Writer& writer,
                                                          std::size_t count) {
    if (count > std::numeric_limits<uint32_t>::max()) {
        return Error::value_too_large("list longer than 2^32 elements");
    }
    writer.write_tag(Tag::List);
    writer.write4(static_cast<uint32_t>(count));
    return std::nullopt;
}

/**
 * @brief Writes a small tuple.
 *
 * @param elements Range of elements, written in order.
 * @param write_element Callable `(Writer&, const Element&) ->
 * std::optional<Error>`.
 */
template <typename Range, typename WriteElement>
[[nodiscard]] std::optional<Error> WriteTuple(Writer& writer,
                                              const Range& elements,
                                              WriteElement&& write_element) {
    if (auto err = WriteTupleHeader(writer, std::size(elements)); err) {
        return err;
    }
    for (const auto& element : elements) {
        if (auto err = write_element(writer, element); err) {
            return err;
        }
    }
    return std::nullopt;
}

/**
 * @brief Writes a list: count, elements, then the nil terminator.
 *
 * The terminator is written for empty lists too.
 */
template <typename Range, typename WriteElement>
[[nodiscard]] std::optional<Error> WriteList(Writer& writer,
                                             const Range& items,
                                             WriteElement&& write_element) {
    if (auto err = WriteListHeader(writer, std::size(items)); err) {
        return err;
    }
    for (const auto& item : items) {
        if (auto err = write_element(writer, item); err) {
            return err;
        }
    }
    WriteNil(writer);
    return std::nullopt;
}

/**
 * @brief Reads count elements with read_element.
 *
 * Every element takes at least one byte, so a count larger than the
 * remaining input fails before anything is allocated.
 */
template <typename ReadElement>
[[nodiscard]] std::expected<std::vector<Term>, Error> ReadElements(
    Reader& reader, std::size_t count, ReadElement&& read_element) {
    if (!reader.has_bytes(count)) {
        return std::unexpected(Error::unexpected_end(reader.offset()));
    }
    std::vector<Term> elements;
    elements.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        auto element = read_element(reader);
        if (!element) {
            return std::unexpected(element.error());
        }
        elements.push_back(std::move(*element));
    }
    return elements;
}

/**
 * @brief Unwraps complex terms.
 *
 * A tuple of two or more elements whose first element is the atom `bert`
 * stands for its second element. The atoms `nil`, `true` and `false` in that
 * position become the native values; anything else is returned as it is.
 * Any other tuple is returned unchanged.
 */
[[nodiscard]] inline Term CollapseComplex(Tuple tuple) {
    if (tuple.elements.size() < 2) {
        return Term{std::move(tuple)};
    }
    const auto* tag = tuple.elements[0].get_if<Atom>();
    if (tag == nullptr || *tag != atoms::Bert) {
        return Term{std::move(tuple)};
    }

    Term kind = std::move(tuple.elements[1]);
    if (const auto* atom = kind.get_if<Atom>()) {
        if (*atom == atoms::Nil) {
            return Term{Nil{}};
        }
        if (*atom == atoms::True) {
            return Term{true};
        }
        if (*atom == atoms::False) {
            return Term{false};
        }
    }
    return kind;
}

/**
 * @brief Reads a small tuple payload (arity + elements).
 *
 * Every element is read before the tuple is unwrapped, so a complex term
 * always consumes its whole payload.
 */
template <typename ReadElement>
[[nodiscard]] std::expected<Term, Error> ReadSmallTuple(
    Reader& reader, ReadElement&& read_element) {
    auto arity = reader.read1();
    if (!arity) {
        return std::unexpected(arity.error());
    }
    auto elements = ReadElements(reader, *arity, read_element);
    if (!elements) {
        return std::unexpected(elements.error());
    }
    return CollapseComplex(Tuple(std::move(*elements)));
}

/**
 * @brief Reads a list payload (count + elements + terminator).
 *
 * The terminator byte is consumed but not checked.
 */
template <typename ReadElement>
[[nodiscard]] std::expected<List, Error> ReadList(Reader& reader,
                                                  ReadElement&& read_element) {
    auto count = reader.read4();
    if (!count) {
        return std::unexpected(count.error());
    }
    auto items = ReadElements(reader, *count, read_element);
    if (!items) {
        return std::unexpected(items.error());
    }
    if (auto tail = reader.read1(); !tail) {
        return std::unexpected(tail.error());
    }
    return List(std::move(*items));
}

}  // namespace Bert::codec
