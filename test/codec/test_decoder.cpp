#include <bert/bert.hpp>
#include <catch2/catch_test_macros.hpp>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <limits>
#include <span>
#include <string>
#include <test_helpers.hpp>

using namespace Bert;
using Bert::test::MakeBytes;

namespace {

struct ShallowPolicy : DefaultPolicy {
    static constexpr std::size_t max_depth = 2;
};

template <DecodePolicy Policy = DefaultPolicy>
std::expected<Term, Error> Read(std::span<const std::byte> input) {
    Reader reader{input};
    return TermDecoder<Policy>::ReadVersioned(reader);
}

}  // namespace

TEST_CASE("Decoder: version marker", "[decoder]") {
    SECTION("Missing marker") {
        auto res = Read(MakeBytes({130, 97, 1}));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::BadMagic);
    }

    SECTION("Empty input") {
        auto res = Read(Bytes{});
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::UnexpectedEnd);
    }

    SECTION("Marker with no term") {
        auto res = Read(MakeBytes({131}));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::UnexpectedEnd);
        REQUIRE(res.error().offset == 1);
    }
}

TEST_CASE("Decoder: tags", "[decoder]") {
    SECTION("Unknown tag reports its offset") {
        auto res = Read(MakeBytes({131, 104, 1, 200}));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::UnknownTag);
        REQUIRE(res.error().offset == 3);
    }

    SECTION("Nested version marker is not a term") {
        auto res = Read(MakeBytes({131, 131, 97, 1}));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::UnknownTag);
    }

    SECTION("Large tuple is unsupported") {
        auto res = Read(MakeBytes({131, 105, 0, 0, 0, 0}));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::UnsupportedType);
        REQUIRE(res.error().offset == 1);
    }

    SECTION("Nil decodes to the empty list") {
        auto res = Read(MakeBytes({131, 106}));
        REQUIRE(res.has_value());
        REQUIRE(*res == Term{List{}});
    }

    SECTION("Scalars") {
        REQUIRE(Read(MakeBytes({131, 97, 255})) == Term{255});
        REQUIRE(Read(MakeBytes({131, 98, 255, 255, 255, 255})) == Term{-1});
        REQUIRE(Read(MakeBytes({131, 100, 0, 2, 'o', 'k'})) == Term{Atom{"ok"}});
        REQUIRE(Read(MakeBytes({131, 107, 0, 2, 'o', 'k'})) == Term{"ok"});
        REQUIRE(Read(MakeBytes({131, 109, 0, 0, 0, 1, 7})) ==
                Term{MakeBytes({7})});
        REQUIRE(Read(MakeBytes({131, 77, 0, 0, 0, 1, 1, 128})) ==
                Term{Bitstring{MakeBytes({128}), 1}});
    }

    SECTION("Complex terms collapse") {
        auto encoded = Encode(Tuple{Atom{"bert"}, Atom{"nil"}});
        REQUIRE(encoded.has_value());
        REQUIRE(Read(*encoded) == Term{Nil{}});
        REQUIRE(Read(Encode(true).value()) == Term{true});
    }

    SECTION("Complex terms stand for their second element") {
        const Bytes wrapped =
            MakeBytes({131, 104, 2, 100, 0, 4, 'b', 'e', 'r', 't', 100, 0, 3,
                       'f', 'o', 'o'});
        REQUIRE(Read(wrapped) == Term{Atom{"foo"}});

        auto dict = Encode(Tuple{Atom{"bert"}, Atom{"dict"}, List{Tuple{1, 2}}});
        REQUIRE(dict.has_value());
        REQUIRE(Read(*dict) == Term{Atom{"dict"}});
    }

    SECTION("Complex terms nested in a list keep the stream in step") {
        const Term list{List{Tuple{Atom{"bert"}, Atom{"foo"}, 1}, 2}};
        auto encoded = Encode(list);
        REQUIRE(encoded.has_value());
        auto res = DecodePrefix(*encoded);
        REQUIRE(res.has_value());
        REQUIRE(res->value == Term{List{Atom{"foo"}, 2}});
        REQUIRE(res->consumed == encoded->size());
    }
}

TEST_CASE("Decoder: bignums", "[decoder]") {
    const Bytes small = MakeBytes({131, 110, 4, 0, 0, 0, 0, 128});
    const Bytes large = MakeBytes({131, 111, 0, 0, 0, 4, 1, 0, 0, 0, 128});

    SECTION("Rejected by default") {
        auto res = Read(small);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::UnsupportedType);
        REQUIRE(res.error().offset == 1);

        res = Read(large);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::UnsupportedType);
    }

    SECTION("Decoded with the symmetric policy") {
        REQUIRE(Read<SymmetricBignumPolicy>(small) == Term{2147483648LL});
        REQUIRE(Read<SymmetricBignumPolicy>(large) == Term{-2147483648LL});
    }

    SECTION("Values above int64 decode to BigInt") {
        auto encoded = Encode(std::numeric_limits<uint64_t>::max());
        REQUIRE(encoded.has_value());
        auto res = Read<SymmetricBignumPolicy>(*encoded);
        REQUIRE(res.has_value());
        REQUIRE(res->is<BigInt>());
        REQUIRE(res->as<BigInt>().ToString() == "18446744073709551615");
    }
}

TEST_CASE("Decoder: nesting limit", "[decoder]") {
    const Term two_deep{Tuple{Tuple{1}}};
    const Term three_deep{Tuple{List{Tuple{1}}}};

    REQUIRE(Read<ShallowPolicy>(Encode(two_deep).value()) == two_deep);

    auto res = Read<ShallowPolicy>(Encode(three_deep).value());
    REQUIRE_FALSE(res.has_value());
    REQUIRE(res.error() == ErrorCode::LimitExceeded);
    REQUIRE(res.error().offset == 8);

    SECTION("Default policy bounds deep input") {
        Bytes input = MakeBytes({131});
        for (int i = 0; i < 1000; ++i) {
            input.push_back(std::byte{104});
            input.push_back(std::byte{1});
        }
        input.push_back(std::byte{97});
        input.push_back(std::byte{0});
        auto deep = Read(input);
        REQUIRE_FALSE(deep.has_value());
        REQUIRE(deep.error() == ErrorCode::LimitExceeded);
    }
}

TEST_CASE("Decoder: truncation", "[decoder]") {
    const Term term{Tuple{Atom{"ok"}, List{1, 300}, "text", MakeBytes({1, 2}),
                          1.5F}};
    auto encoded = Encode(term);
    REQUIRE(encoded.has_value());
    REQUIRE(Read(*encoded) == term);

    for (std::size_t n = 0; n < encoded->size(); ++n) {
        auto res = Read(std::span<const std::byte>{*encoded}.first(n));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::UnexpectedEnd);
        REQUIRE(res.error().offset <= n);
    }
}

TEST_CASE("Decoder: malformed lengths", "[decoder]") {
    SECTION("List count far beyond the input") {
        auto res = Read(MakeBytes({131, 108, 0xFF, 0xFF, 0xFF, 0xFF, 97, 1}));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::UnexpectedEnd);
    }

    SECTION("Binary length far beyond the input") {
        auto res = Read(MakeBytes({131, 109, 0x7F, 0xFF, 0xFF, 0xFF, 1}));
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::UnexpectedEnd);
    }

    SECTION("Malformed float text") {
        Bytes input = MakeBytes({131, 99});
        const Bytes text = MakeBytes("1.0e+00garbage");
        input.insert(input.end(), text.begin(), text.end());
        input.resize(2 + FloatPayloadSize, std::byte{0});
        auto res = Read(input);
        REQUIRE_FALSE(res.has_value());
        REQUIRE(res.error() == ErrorCode::MalformedFloat);
    }
}
