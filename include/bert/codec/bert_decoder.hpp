#pragma once

#include <bert/codec/bert_numeric.hpp>
#include <bert/codec/bert_sequence.hpp>
#include <bert/codec/bert_text.hpp>
#include <bert/core/bert_io.hpp>
#include <bert/core/bert_policy.hpp>
#include <bert/core/bert_types.hpp>
#include <bert/terms/bert_term.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>

namespace Bert {

/**
 * @brief A decoded value together with the number of input bytes it used.
 */
template <typename T>
struct Decoded {
    T value;
    std::size_t consumed{0};
};

/**
 * @brief Recursive-descent term decoder.
 *
 * Parsing is keyed only on the tag byte; the decoder knows nothing about
 * application types. On failure no partial Term is returned.
 *
 * @tparam Policy The DecodePolicy supplying limits and optional features.
 */
template <DecodePolicy Policy>
struct TermDecoder {
    /**
     * @brief Reads the version marker followed by one term.
     */
    [[nodiscard]] static std::expected<Term, Error> ReadVersioned(
        Reader& reader) {
        auto version = reader.read1();
        if (!version) {
            return std::unexpected(version.error());
        }
        if (*version != static_cast<uint8_t>(Tag::Version)) {
            return std::unexpected(Error::bad_magic());
        }
        return ReadTerm(reader, 0);
    }

    /**
     * @brief Reads one tag-prefixed term.
     *
     * @param depth Nesting level of the term; tuples and lists above
     * Policy::max_depth fail with LimitExceeded.
     */
    [[nodiscard]] static std::expected<Term, Error> ReadTerm(
        Reader& reader, std::size_t depth) {
        const std::size_t tag_offset = reader.offset();
        auto tag_byte = reader.read1();
        if (!tag_byte) {
            return std::unexpected(tag_byte.error());
        }

        const auto read_child = [depth](Reader& r) {
            return ReadTerm(r, depth + 1);
        };
        const auto to_term = [](auto v) { return Term{std::move(v)}; };

        const auto tag = static_cast<Tag>(*tag_byte);
        switch (tag) {
            case Tag::SmallInteger:
                return codec::ReadSmallInteger(reader).transform(to_term);
            case Tag::Integer:
                return codec::ReadInteger(reader).transform(to_term);
            case Tag::SmallBignum:
            case Tag::LargeBignum:
                if constexpr (Policy::decode_bignums) {
                    return codec::ReadBignum(reader, tag);
                } else {
                    return std::unexpected(Error::unsupported_type(
                        "integer wider than 32 bits", tag_offset));
                }
            case Tag::Float:
                return codec::ReadFloat(reader).transform(to_term);
            case Tag::Atom:
                return codec::ReadAtom(reader).transform(to_term);
            case Tag::String:
                return codec::ReadString(reader).transform(to_term);
            case Tag::Binary:
                return codec::ReadBinary(reader).transform(to_term);
            case Tag::Bitstring:
                return codec::ReadBitstring(reader).transform(to_term);
            case Tag::Nil:
                return Term{List{}};
            case Tag::SmallTuple:
                if (depth >= Policy::max_depth) {
                    return std::unexpected(
                        Error::limit_exceeded("nesting too deep", tag_offset));
                }
                return codec::ReadSmallTuple(reader, read_child);
            case Tag::List:
                if (depth >= Policy::max_depth) {
                    return std::unexpected(
                        Error::limit_exceeded("nesting too deep", tag_offset));
                }
                return codec::ReadList(reader, read_child).transform(to_term);
            case Tag::LargeTuple:
                return std::unexpected(Error::unsupported_type(
                    "tuple arity above 255", tag_offset));
            case Tag::Version:
                break;
        }
        return std::unexpected(Error::unknown_tag(tag_offset));
    }
};

}  // namespace Bert
