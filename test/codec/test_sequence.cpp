#include <bert/codec/bert_numeric.hpp>
#include <bert/codec/bert_sequence.hpp>
#include <bert/codec/bert_text.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <expected>
#include <optional>
#include <vector>
#include <test_helpers.hpp>

using namespace Bert;
using Bert::test::MakeBytes;

namespace {

// Elements in these tests are small integers only.
std::optional<Error> WriteByteElement(Writer& writer, int value) {
    codec::WriteSmallInteger(writer, static_cast<uint8_t>(value));
    return std::nullopt;
}

std::expected<Term, Error> ReadByteElement(Reader& reader) {
    auto tag = reader.read1();
    if (!tag) {
        return std::unexpected(tag.error());
    }
    if (*tag == static_cast<uint8_t>(Tag::Atom)) {
        return codec::ReadAtom(reader).transform(
            [](Atom a) { return Term{std::move(a)}; });
    }
    return codec::ReadSmallInteger(reader).transform(
        [](int64_t v) { return Term{v}; });
}

}  // namespace

TEST_CASE("Sequence: tuple writing", "[sequence]") {
    Bytes out;
    Writer writer{out};

    SECTION("Header and elements") {
        const std::vector<int> values{1, 2, 3};
        REQUIRE_FALSE(
            codec::WriteTuple(writer, values, WriteByteElement).has_value());
        REQUIRE(out == MakeBytes({104, 3, 97, 1, 97, 2, 97, 3}));
    }

    SECTION("Empty tuple") {
        const std::vector<int> values;
        REQUIRE_FALSE(
            codec::WriteTuple(writer, values, WriteByteElement).has_value());
        REQUIRE(out == MakeBytes({104, 0}));
    }

    SECTION("Arity 255 is the largest small tuple") {
        REQUIRE_FALSE(codec::WriteTupleHeader(writer, 255).has_value());
        REQUIRE(out == MakeBytes({104, 255}));
    }

    SECTION("Arity 256 is unsupported") {
        auto err = codec::WriteTupleHeader(writer, 256);
        REQUIRE(err.has_value());
        REQUIRE(*err == ErrorCode::UnsupportedType);
        REQUIRE(out.empty());
    }

    SECTION("Element errors stop the tuple") {
        const std::vector<int> values{1, 2, 3};
        int calls = 0;
        auto err = codec::WriteTuple(
            writer, values,
            [&calls](Writer&, int) -> std::optional<Error> {
                ++calls;
                return Error::value_too_large("element");
            });
        REQUIRE(err.has_value());
        REQUIRE(*err == ErrorCode::ValueTooLarge);
        REQUIRE(calls == 1);
    }
}

TEST_CASE("Sequence: list writing", "[sequence]") {
    Bytes out;
    Writer writer{out};

    SECTION("Elements followed by the nil terminator") {
        const std::vector<int> values{7, 8};
        REQUIRE_FALSE(
            codec::WriteList(writer, values, WriteByteElement).has_value());
        REQUIRE(out == MakeBytes({108, 0, 0, 0, 2, 97, 7, 97, 8, 106}));
    }

    SECTION("Empty list still ends in nil") {
        const std::vector<int> values;
        REQUIRE_FALSE(
            codec::WriteList(writer, values, WriteByteElement).has_value());
        REQUIRE(out == MakeBytes({108, 0, 0, 0, 0, 106}));
    }

    SECTION("Nil alone") {
        codec::WriteNil(writer);
        REQUIRE(out == MakeBytes({106}));
    }
}

TEST_CASE("Sequence: element reading", "[sequence]") {
    SECTION("Count larger than the remaining input fails up front") {
        const Bytes input = MakeBytes({97, 1});
        Reader reader{input};
        int calls = 0;
        auto res = codec::ReadElements(reader, 1000, [&calls](Reader& r) {
            ++calls;
            return ReadByteElement(r);
        });
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::UnexpectedEnd);
        REQUIRE(calls == 0);
    }

    SECTION("Small tuple payload") {
        const Bytes input = MakeBytes({2, 97, 4, 97, 5});
        Reader reader{input};
        auto res = codec::ReadSmallTuple(reader, ReadByteElement);
        REQUIRE(res.has_value());
        REQUIRE(*res == Term{Tuple{4, 5}});
    }

    SECTION("List payload consumes the terminator") {
        const Bytes input = MakeBytes({0, 0, 0, 1, 97, 9, 106, 0xEE});
        Reader reader{input};
        auto res = codec::ReadList(reader, ReadByteElement);
        REQUIRE(res.has_value());
        REQUIRE(*res == List{9});
        REQUIRE(reader.offset() == 7);
    }

    SECTION("List missing its terminator") {
        const Bytes input = MakeBytes({0, 0, 0, 1, 97, 9});
        Reader reader{input};
        auto res = codec::ReadList(reader, ReadByteElement);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::UnexpectedEnd);
        REQUIRE(res.error().offset == 6);
    }
}

TEST_CASE("Sequence: complex term collapse", "[sequence]") {
    SECTION("bert tuples collapse to native values") {
        REQUIRE(codec::CollapseComplex(Tuple{Atom{"bert"}, Atom{"nil"}}) ==
                Term{Nil{}});
        REQUIRE(codec::CollapseComplex(Tuple{Atom{"bert"}, Atom{"true"}}) ==
                Term{true});
        REQUIRE(codec::CollapseComplex(Tuple{Atom{"bert"}, Atom{"false"}}) ==
                Term{false});
    }

    SECTION("Other second elements are unwrapped as they are") {
        REQUIRE(codec::CollapseComplex(Tuple{Atom{"bert"}, Atom{"foo"}}) ==
                Term{Atom{"foo"}});
        REQUIRE(codec::CollapseComplex(Tuple{Atom{"bert"}, 7}) == Term{7});
        REQUIRE(codec::CollapseComplex(
                    Tuple{Atom{"bert"}, Atom{"dict"}, List{1}}) ==
                Term{Atom{"dict"}});
        REQUIRE(codec::CollapseComplex(
                    Tuple{Atom{"bert"}, Atom{"true"}, 1}) == Term{true});
    }

    SECTION("Tuples that are not wrappers are left intact") {
        const Tuple single{Atom{"bert"}};
        REQUIRE(codec::CollapseComplex(single) == Term{single});

        const Tuple not_atoms{std::string{"bert"}, Atom{"true"}};
        REQUIRE(codec::CollapseComplex(not_atoms) == Term{not_atoms});

        const Tuple later{Atom{"ok"}, Atom{"bert"}, Atom{"nil"}};
        REQUIRE(codec::CollapseComplex(later) == Term{later});
    }

    SECTION("Collapse applies when reading tuples") {
        const Bytes input =
            MakeBytes({2, 100, 0, 4, 'b', 'e', 'r', 't', 100, 0, 4, 't', 'r',
                       'u', 'e'});
        Reader reader{input};
        auto res = codec::ReadSmallTuple(reader, ReadByteElement);
        REQUIRE(res.has_value());
        REQUIRE(*res == Term{true});
    }

    SECTION("Reading a wrapper consumes every element") {
        const Bytes input =
            MakeBytes({3, 100, 0, 4, 'b', 'e', 'r', 't', 100, 0, 3, 'f', 'o',
                       'o', 97, 5, 97, 6});
        Reader reader{input};
        auto res = codec::ReadSmallTuple(reader, ReadByteElement);
        REQUIRE(res.has_value());
        REQUIRE(*res == Term{Atom{"foo"}});
        REQUIRE(reader.offset() == 16);
        REQUIRE(reader.remaining() == 2);
    }
}
