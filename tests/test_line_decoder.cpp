/**
 * @file test_line_decoder.cpp
 * @brief Unit tests for the LineDecoder state machine.
 */

#include <catch2/catch_test_macros.hpp>
#include <yenc/line_decoder.hpp>

#include <string>

using namespace yenc;

TEST_CASE("LineDecoder normal bytes", "[line_decoder]") {
    LineDecoder decoder;

    SECTION("subtract 42") {
        std::string line = "*+,k";
        decoder.decode(line);
        REQUIRE(line.size() == 4);
        REQUIRE(static_cast<std::uint8_t>(line[0]) == 0);
        REQUIRE(static_cast<std::uint8_t>(line[1]) == 1);
        REQUIRE(static_cast<std::uint8_t>(line[2]) == 2);
        REQUIRE(line[3] == 'A');
    }

    SECTION("wraps below zero") {
        std::uint8_t data[] = {41, 0};
        REQUIRE(decoder.decode(data, 2) == 2);
        REQUIRE(data[0] == 255);
        REQUIRE(data[1] == 214);
    }

    SECTION("empty line") {
        std::string line;
        decoder.decode(line);
        REQUIRE(line.empty());
        REQUIRE_FALSE(decoder.awaiting_escape());
    }
}

TEST_CASE("LineDecoder escapes", "[line_decoder]") {
    LineDecoder decoder;

    SECTION("escape marker is dropped") {
        std::uint8_t data[] = {'*', '=', '@', '*'};
        std::size_t len = decoder.decode(data, sizeof(data));
        REQUIRE(len == 3);
        REQUIRE(data[0] == 0);
        REQUIRE(data[1] == 214); // '@' - 42 - 64
        REQUIRE(data[2] == 0);
    }

    SECTION("critical values") {
        std::string line = "=@=J=M=}";
        decoder.decode(line);
        REQUIRE(line.size() == 4);
        REQUIRE(static_cast<std::uint8_t>(line[0]) == 214);
        REQUIRE(static_cast<std::uint8_t>(line[1]) == 224);
        REQUIRE(static_cast<std::uint8_t>(line[2]) == 227);
        REQUIRE(static_cast<std::uint8_t>(line[3]) == 19);
    }

    SECTION("escaped escape marker") {
        // "==" escapes a literal '=' byte
        std::uint8_t data[] = {'=', '='};
        REQUIRE(decoder.decode(data, 2) == 1);
        REQUIRE(data[0] == static_cast<std::uint8_t>('=' - 42 - 64));
    }
}

TEST_CASE("LineDecoder escape across lines", "[line_decoder]") {
    LineDecoder split;
    std::string first = "+,=";
    std::string second = "@-";
    split.decode(first);
    REQUIRE(split.awaiting_escape());
    split.decode(second);
    REQUIRE_FALSE(split.awaiting_escape());

    LineDecoder whole;
    std::string joined = "+,=@-";
    whole.decode(joined);

    REQUIRE(first + second == joined);
}

TEST_CASE("LineDecoder reset", "[line_decoder]") {
    LineDecoder decoder;
    std::string line = "*=";
    decoder.decode(line);
    REQUIRE(decoder.awaiting_escape());

    decoder.reset();
    REQUIRE_FALSE(decoder.awaiting_escape());

    std::string next = "*";
    decoder.decode(next);
    REQUIRE(static_cast<std::uint8_t>(next[0]) == 0);
}
