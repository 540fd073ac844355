//
// encode / decode / remove / print
//

#include <doctest/doctest.h>
#include <pngchat/commands.hh>
#include <pngchat/exceptions.hh>
#include <pngchat/io.hh>

#include <sstream>
#include <string>
#include "test_utils.hh"

using namespace pngchat;

TEST_CASE("commands") {
    temp_dir dir;
    auto input = dir.file("test.png");
    save_png(input, minimal_png());
    std::ostringstream out;

    SUBCASE("encode in place then decode") {
        pngchat::encode({input, "ruSt", "This is a secret message!", std::nullopt}, out);
        CHECK(load_png(input).chunk_count() == 4);

        std::ostringstream decoded;
        pngchat::decode({input, "ruSt"}, decoded);
        CHECK(decoded.str() == "msg: This is a secret message!\n");
    }

    SUBCASE("encode to a separate output file") {
        auto output = dir.file("test_out.png");
        pngchat::encode({input, "ruSt", "hi", output}, out);

        CHECK(load_png(input) == minimal_png());
        auto written = load_png(output);
        REQUIRE(written.chunk_by_type("ruSt") != nullptr);
        CHECK(written.chunk_by_type("ruSt")->data_as_string() == "hi");
    }

    SUBCASE("encode with an invalid type") {
        CHECK_THROWS_AS(pngchat::encode({input, "ru5t", "hi", std::nullopt}, out), invalid_type_code);
        CHECK(load_png(input) == minimal_png());
    }

    SUBCASE("decode without a message") {
        try {
            pngchat::decode({input, "ruSt"}, out);
            FAIL("Should have thrown exception");
        } catch (const chunk_not_found& e) {
            CHECK(std::string(e.what()) == "This file does not contain msg of chunk type ruSt");
        }
    }

    SUBCASE("remove") {
        pngchat::encode({input, "ruSt", "secret", std::nullopt}, out);
        pngchat::remove({input, "ruSt"}, out);
        CHECK(read_file(input) == minimal_png().as_bytes());
    }

    SUBCASE("remove without a message") {
        CHECK_THROWS_AS(pngchat::remove({input, "ruSt"}, out), chunk_not_found);
        CHECK(read_file(input) == minimal_png().as_bytes());
    }

    SUBCASE("print") {
        pngchat::print_chunks({input}, out);
        std::string expected =
            "File: " + input.string() + ", Size: 67\n"
            "  chunk#0{ chunk_type: IHDR, data_length: 13}\n"
            "  chunk#1{ chunk_type: IDAT, data_length: 10}\n"
            "  chunk#2{ chunk_type: IEND, data_length: 0}\n";
        CHECK(out.str() == expected);
    }

    SUBCASE("commands on a non-PNG file") {
        auto bogus = dir.file("bogus.png");
        write_file(bogus, to_bytes("this is text"));
        CHECK_THROWS_AS(pngchat::print_chunks({bogus}, out), bad_signature);
    }
}
