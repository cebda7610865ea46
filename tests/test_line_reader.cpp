/**
 * @file test_line_reader.cpp
 * @brief Unit tests for LineReader.
 */

#include <catch2/catch_test_macros.hpp>
#include <yenc/line_reader.hpp>

#include <sstream>
#include <string>

using namespace yenc;

TEST_CASE("LineReader terminators", "[line_reader]") {
    std::string line;

    SECTION("LF") {
        std::istringstream input("one\ntwo\n");
        LineReader reader(input);
        REQUIRE(reader.read_line(line) == Error::Ok);
        REQUIRE(line == "one");
        REQUIRE(reader.read_line(line) == Error::Ok);
        REQUIRE(line == "two");
        REQUIRE(reader.read_line(line) == Error::EndOfStream);
    }

    SECTION("CRLF") {
        std::istringstream input("one\r\ntwo\r\n");
        LineReader reader(input);
        REQUIRE(reader.read_line(line) == Error::Ok);
        REQUIRE(line == "one");
        REQUIRE(reader.read_line(line) == Error::Ok);
        REQUIRE(line == "two");
        REQUIRE(reader.read_line(line) == Error::EndOfStream);
    }

    SECTION("final line without terminator") {
        std::istringstream input("one\nlast");
        LineReader reader(input);
        REQUIRE(reader.read_line(line) == Error::Ok);
        REQUIRE(reader.read_line(line) == Error::Ok);
        REQUIRE(line == "last");
        REQUIRE(reader.read_line(line) == Error::EndOfStream);
    }

    SECTION("empty lines") {
        std::istringstream input("\n\r\n");
        LineReader reader(input);
        REQUIRE(reader.read_line(line) == Error::Ok);
        REQUIRE(line.empty());
        REQUIRE(reader.read_line(line) == Error::Ok);
        REQUIRE(line.empty());
        REQUIRE(reader.read_line(line) == Error::EndOfStream);
    }
}

TEST_CASE("LineReader keeps raw bytes", "[line_reader]") {
    std::string raw("a\0b\rc\xff", 6);
    std::istringstream input(raw + "\r\n");
    LineReader reader(input);

    std::string line;
    REQUIRE(reader.read_line(line) == Error::Ok);
    REQUIRE(line == raw);
}

TEST_CASE("LineReader empty stream", "[line_reader]") {
    std::istringstream input("");
    LineReader reader(input);
    std::string line;
    REQUIRE(reader.read_line(line) == Error::EndOfStream);
    REQUIRE(reader.line_number() == 0);
}

TEST_CASE("LineReader failed stream", "[line_reader]") {
    std::istringstream input("data\n");
    input.setstate(std::ios::badbit);
    LineReader reader(input);
    std::string line;
    REQUIRE(reader.read_line(line) == Error::IoError);
}

TEST_CASE("LineReader line numbers", "[line_reader]") {
    std::istringstream input("a\nb\nc\n");
    LineReader reader(input);
    std::string line;
    while (reader.read_line(line) == Error::Ok) {
    }
    REQUIRE(reader.line_number() == 3);
}

TEST_CASE("strip_line_end", "[line_reader]") {
    std::string line = "abc\r\r\n";
    strip_line_end(line);
    REQUIRE(line == "abc");

    std::string bare = "\r\n";
    strip_line_end(bare);
    REQUIRE(bare.empty());
}
