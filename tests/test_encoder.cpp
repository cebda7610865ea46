/**
 * @file test_encoder.cpp
 * @brief Unit tests for the yEnc encoder and encode/decode round trips.
 */

#include <catch2/catch_test_macros.hpp>
#include <yenc/yenc.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace yenc;

static Error decode_all(const std::string& text, std::vector<Part>& parts) {
    std::istringstream input(text, std::ios::in | std::ios::binary);
    Decoder decoder(input);
    Error result = decoder.run();
    if (result != Error::Ok) {
        return result;
    }
    result = decoder.validate();
    parts = decoder.take_parts();
    return result;
}

TEST_CASE("needs_escape", "[encoder]") {
    SECTION("always critical") {
        REQUIRE(needs_escape(0x00, 5, 128));
        REQUIRE(needs_escape('\n', 5, 128));
        REQUIRE(needs_escape('\r', 5, 128));
        REQUIRE(needs_escape('=', 5, 128));
    }

    SECTION("whitespace at line edges") {
        REQUIRE(needs_escape(' ', 0, 128));
        REQUIRE(needs_escape('\t', 127, 128));
        REQUIRE_FALSE(needs_escape(' ', 5, 128));
        REQUIRE_FALSE(needs_escape('\t', 5, 128));
    }

    SECTION("dot at line start") {
        REQUIRE(needs_escape('.', 0, 128));
        REQUIRE_FALSE(needs_escape('.', 1, 128));
    }

    SECTION("ordinary bytes") {
        REQUIRE_FALSE(needs_escape('*', 0, 128));
        REQUIRE_FALSE(needs_escape(0xFF, 0, 128));
    }
}

TEST_CASE("encode single part", "[encoder]") {
    const std::uint8_t data[] = {0, 1, 2};
    std::string output;
    REQUIRE(encode(data, sizeof(data), "a.bin", output) == Error::Ok);
    REQUIRE(output == "=ybegin line=128 size=3 name=a.bin\r\n"
                      "*+,\r\n"
                      "=yend size=3 crc32=0854897f\r\n");
}

TEST_CASE("encode empty payload", "[encoder]") {
    std::string output;
    REQUIRE(encode(nullptr, 0, "empty", output) == Error::Ok);
    REQUIRE(output == "=ybegin line=128 size=0 name=empty\r\n"
                      "=yend size=0 crc32=00000000\r\n");
}

TEST_CASE("encode_lines wrapping", "[encoder]") {
    std::vector<std::uint8_t> zeros(300, 0);
    std::string output;
    encode_lines(zeros.data(), zeros.size(), 128, output);

    std::string expected = std::string(128, '*') + "\r\n" + std::string(128, '*') + "\r\n" +
                           std::string(44, '*') + "\r\n";
    REQUIRE(output == expected);
}

TEST_CASE("encode_lines escaping", "[encoder]") {
    std::string output;

    SECTION("critical bytes") {
        const std::uint8_t data[] = {214, 224, 227, 19};
        encode_lines(data, sizeof(data), 128, output);
        REQUIRE(output == "=@=J=M=}\r\n");
    }

    SECTION("space escaped only at the edges") {
        // 246 + 42 wraps to ' '
        const std::uint8_t data[] = {246, 0, 0};
        encode_lines(data, sizeof(data), 4, output);
        REQUIRE(output == "=`**\r\n");

        output.clear();
        const std::uint8_t last_column[] = {0, 246, 0, 246};
        encode_lines(last_column, sizeof(last_column), 4, output);
        REQUIRE(output == "* *=`\r\n");
    }

    SECTION("dot escaped only at line start") {
        // 4 + 42 == '.'
        const std::uint8_t data[] = {4, 4};
        encode_lines(data, sizeof(data), 128, output);
        REQUIRE(output == "=n.\r\n");
    }

    SECTION("escape pair is not split") {
        const std::uint8_t data[] = {0, 0, 0, 214, 0};
        encode_lines(data, sizeof(data), 4, output);
        REQUIRE(output == "***=@\r\n*\r\n");
    }
}

TEST_CASE("encode invalid arguments", "[encoder]") {
    const std::uint8_t data[] = {1};
    std::string output;
    EncodeParams params;

    REQUIRE(encode(data, 1, "", output) == Error::InvalidArg);
    REQUIRE(encode(data, 1, "a\r\nb", output) == Error::InvalidArg);
    REQUIRE(encode(nullptr, 1, "a", output) == Error::InvalidArg);

    params.line_length = 0;
    REQUIRE(encode(data, 1, "a", output, params) == Error::InvalidArg);
    params.line_length = MAX_LINE_LENGTH + 1;
    REQUIRE(encode(data, 1, "a", output, params) == Error::InvalidArg);

    REQUIRE(output.empty());
}

TEST_CASE("encode_part framing", "[encoder]") {
    const std::uint8_t file[] = {0, 1, 2, 3};
    std::string output;

    SECTION("first part has no file crc") {
        REQUIRE(encode_part(file, 4, 0, 2, 1, 2, "pair.bin", output) == Error::Ok);
        REQUIRE(output == "=ybegin part=1 total=2 line=128 size=4 name=pair.bin\r\n"
                          "=ypart begin=1 end=2\r\n"
                          "*+\r\n"
                          "=yend size=2 part=1 pcrc32=36de2269\r\n");
    }

    SECTION("last part carries the file crc") {
        REQUIRE(encode_part(file, 4, 2, 2, 2, 2, "pair.bin", output) == Error::Ok);
        REQUIRE(output == "=ybegin part=2 total=2 line=128 size=4 name=pair.bin\r\n"
                          "=ypart begin=3 end=4\r\n"
                          ",-\r\n"
                          "=yend size=2 part=2 pcrc32=eae621c7 crc32=8bb98613\r\n");
    }

    SECTION("inconsistent arguments") {
        REQUIRE(encode_part(file, 4, 3, 2, 1, 2, "x", output) == Error::InvalidArg);
        REQUIRE(encode_part(file, 4, 0, 0, 1, 2, "x", output) == Error::InvalidArg);
        REQUIRE(encode_part(file, 4, 0, 2, 0, 2, "x", output) == Error::InvalidArg);
        REQUIRE(encode_part(file, 4, 0, 2, 3, 2, "x", output) == Error::InvalidArg);
        REQUIRE(output.empty());
    }
}

TEST_CASE("Round trip every byte value", "[encoder][roundtrip]") {
    std::vector<std::uint8_t> data;
    for (int i = 0; i < 256; ++i) {
        data.push_back(static_cast<std::uint8_t>(i));
    }
    // runs of values that encode to critical characters
    for (std::uint8_t critical : {214, 224, 227, 19, 246, 223, 4}) {
        data.insert(data.end(), 10, critical);
    }

    for (std::size_t line_length : {std::size_t{1}, std::size_t{61}, DEFAULT_LINE_LENGTH,
                                    MAX_LINE_LENGTH}) {
        EncodeParams params;
        params.line_length = line_length;

        std::string encoded;
        REQUIRE(encode(data.data(), data.size(), "all.bin", encoded, params) == Error::Ok);

        Part part;
        std::string message;
        std::istringstream input(encoded, std::ios::in | std::ios::binary);
        REQUIRE(decode(input, part, &message) == Error::Ok);
        REQUIRE(part.body == data);
        REQUIRE(part.line_length == static_cast<int>(line_length));
    }
}

TEST_CASE("Round trip multipart", "[encoder][roundtrip]") {
    std::vector<std::uint8_t> data(1000);
    for (std::size_t i = 0; i < data.size(); ++i) {
        data[i] = static_cast<std::uint8_t>((i * 37U) + 11U);
    }

    std::string encoded;
    REQUIRE(encode_multipart(data.data(), data.size(), 300, "file.bin", encoded) == Error::Ok);

    std::vector<Part> parts;
    REQUIRE(decode_all(encoded, parts) == Error::Ok);
    REQUIRE(parts.size() == 4);

    std::vector<std::uint8_t> joined;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const Part& part = parts[i];
        REQUIRE(part.number == static_cast<int>(i + 1));
        REQUIRE(part.header_size == 1000);
        REQUIRE(part.begin == static_cast<std::int64_t>(i * 300 + 1));
        REQUIRE(part.end == static_cast<std::int64_t>(joined.size() + part.body.size()));
        joined.insert(joined.end(), part.body.begin(), part.body.end());
    }
    REQUIRE(joined == data);
    REQUIRE(parts.back().size == 100);
}

TEST_CASE("encode_multipart invalid arguments", "[encoder]") {
    const std::uint8_t data[] = {1, 2};
    std::string output;
    REQUIRE(encode_multipart(data, 2, 0, "x", output) == Error::InvalidArg);
    REQUIRE(encode_multipart(data, 0, 1, "x", output) == Error::InvalidArg);
    REQUIRE(encode_multipart(nullptr, 2, 1, "x", output) == Error::InvalidArg);
}
