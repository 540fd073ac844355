#include <doctest/doctest.h>
#include <pngchat/chunk_type.hh>
#include <pngchat/exceptions.hh>

#include <sstream>
#include <unordered_set>
#include <array>

using namespace pngchat;

namespace {
    std::array<std::byte, 4> raw(char a, char b, char c, char d) {
        return {std::byte(a), std::byte(b), std::byte(c), std::byte(d)};
    }
}

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk_type construction") {
        SUBCASE("from raw bytes") {
            chunk_type t(raw('R', 'u', 'S', 't'));
            auto b = t.bytes();
            CHECK(b[0] == std::byte{82});
            CHECK(b[1] == std::byte{117});
            CHECK(b[2] == std::byte{83});
            CHECK(b[3] == std::byte{116});
        }

        SUBCASE("from string") {
            auto t = chunk_type::from_string("RuSt");
            CHECK(t.bytes() == raw('R', 'u', 'S', 't'));
            CHECK(t.to_string() == "RuSt");
            CHECK(t.to_string_view() == "RuSt");
        }

        SUBCASE("from memory") {
            const char mem[] = {'I', 'H', 'D', 'R', '!'};
            auto t = chunk_type::from_bytes(mem);
            CHECK(t.to_string() == "IHDR");
        }

        SUBCASE("case is preserved") {
            CHECK(chunk_type::from_string("rUsT").to_string() == "rUsT");
            CHECK(chunk_type::from_string("rust") != chunk_type::from_string("RUST"));
        }

        SUBCASE("individual chars") {
            chunk_type t('I', 'E', 'N', 'D');
            CHECK(t == chunk_type::from_string("IEND"));
            CHECK(t[0] == 'I');
            CHECK(t[3] == 'D');
        }
    }

    TEST_CASE("chunk_type rejects invalid codes") {
        SUBCASE("wrong length") {
            CHECK_THROWS_AS(chunk_type::from_string(""), invalid_type_code);
            CHECK_THROWS_AS(chunk_type::from_string("Ru"), invalid_type_code);
            CHECK_THROWS_AS(chunk_type::from_string("RuS"), invalid_type_code);
            CHECK_THROWS_AS(chunk_type::from_string("RuStt"), invalid_type_code);
        }

        SUBCASE("non-letter characters") {
            CHECK_THROWS_AS(chunk_type::from_string("Rust1"), invalid_type_code);
            CHECK_THROWS_AS(chunk_type::from_string("Ru1t"), invalid_type_code);
            CHECK_THROWS_AS(chunk_type::from_string("Ru t"), invalid_type_code);
            CHECK_THROWS_AS(chunk_type::from_string("R@St"), invalid_type_code);
            CHECK_THROWS_AS(chunk_type::from_string("Ru[t"), invalid_type_code);
            CHECK_THROWS_AS(chunk_type::from_string("`uSt"), invalid_type_code);
        }

        SUBCASE("multi-byte UTF-8 of four characters") {
            // 4 characters but more than 4 bytes
            CHECK_THROWS_AS(chunk_type::from_string("R\xC3\xBCSt"), invalid_type_code);
        }

        SUBCASE("raw bytes outside ASCII") {
            CHECK_THROWS_AS(chunk_type(raw('R', 'u', 'S', '\x00')), invalid_type_code);
            CHECK_THROWS_AS(chunk_type(raw('\xC0', 'u', 'S', 't')), invalid_type_code);
        }

        SUBCASE("invalid_type_code is a pngchat_error") {
            CHECK_THROWS_AS(chunk_type::from_string("12ab"), pngchat_error);
        }
    }

    TEST_CASE("chunk_type property bits") {
        SUBCASE("RuSt") {
            auto t = chunk_type::from_string("RuSt");
            CHECK(t.is_critical());
            CHECK_FALSE(t.is_public());
            CHECK(t.is_reserved_bit_valid());
            CHECK(t.is_safe_to_copy());
            CHECK(t.is_valid());
        }

        SUBCASE("Rust has the reserved bit set") {
            auto t = chunk_type::from_string("Rust");
            CHECK_FALSE(t.is_reserved_bit_valid());
            CHECK_FALSE(t.is_valid());
        }

        SUBCASE("ancillary") {
            CHECK_FALSE(chunk_type::from_string("ruSt").is_critical());
        }

        SUBCASE("public") {
            CHECK(chunk_type::from_string("RUSt").is_public());
        }

        SUBCASE("unsafe to copy") {
            CHECK_FALSE(chunk_type::from_string("RuST").is_safe_to_copy());
        }

        SUBCASE("public codes are not valid message types") {
            // Standard chunk types are public and therefore not usable for messages
            CHECK_FALSE(chunk_type::from_string("IHDR").is_valid());
            CHECK_FALSE(chunk_type::from_string("tEXt").is_valid());
            CHECK(chunk_type::from_string("ruSt").is_valid());
        }
    }

    TEST_CASE("chunk_type comparison and hashing") {
        auto a = chunk_type::from_string("RuSt");
        auto b = chunk_type::from_string("RuSt");
        auto c = chunk_type::from_string("ruSt");

        CHECK(a == b);
        CHECK(a != c);
        CHECK(a < c);  // 'R' < 'r'

        std::unordered_set<chunk_type> set{a, b, c};
        CHECK(set.size() == 2);
        CHECK(std::hash<chunk_type>{}(a) == std::hash<chunk_type>{}(b));
    }

    TEST_CASE("chunk_type stream output") {
        std::ostringstream oss;
        oss << chunk_type::from_string("RuSt");
        CHECK(oss.str() == "RuSt");
    }
}
