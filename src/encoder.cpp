/**
 * @file encoder.cpp
 * @brief yEnc encoder implementation.
 */

#include <yenc/encoder.hpp>
#include <yenc/crc32.hpp>

#include <cstdio>
#include <limits>

namespace yenc {

namespace {

bool valid_name(const std::string& name) noexcept {
    return !name.empty() && name.find_first_of("\r\n") == std::string::npos;
}

bool valid_line_length(std::size_t line_length) noexcept {
    return line_length > 0 && line_length <= MAX_LINE_LENGTH;
}

} // namespace

void encode_lines(const std::uint8_t* data, std::size_t size, std::size_t line_length,
                  std::string& output) {
    std::size_t column = 0;
    for (std::size_t i = 0; i < size; ++i) {
        auto c = static_cast<std::uint8_t>(data[i] + SHIFT);
        if (needs_escape(c, column, line_length)) {
            output += ESCAPE_CHAR;
            output += static_cast<char>(static_cast<std::uint8_t>(c + ESCAPE_SHIFT));
            column += 2;
        } else {
            output += static_cast<char>(c);
            ++column;
        }

        if (column >= line_length) {
            output += "\r\n";
            column = 0;
        }
    }

    if (column > 0) {
        output += "\r\n";
    }
}

Error encode(const std::uint8_t* data, std::size_t size, const std::string& name,
             std::string& output, const EncodeParams& params) {
    if ((data == nullptr && size > 0) || !valid_name(name) ||
        !valid_line_length(params.line_length)) {
        return Error::InvalidArg;
    }

    char buf[128];
    std::snprintf(buf, sizeof(buf), "=ybegin line=%zu size=%zu name=", params.line_length, size);
    output += buf;
    output += name;
    output += "\r\n";

    encode_lines(data, size, params.line_length, output);

    std::snprintf(buf, sizeof(buf), "=yend size=%zu crc32=%08x\r\n", size,
                  static_cast<unsigned>(crc32(data, size)));
    output += buf;
    return Error::Ok;
}

Error encode_part(const std::uint8_t* file_data, std::size_t file_size, std::size_t offset,
                  std::size_t part_size, int number, int total, const std::string& name,
                  std::string& output, const EncodeParams& params) {
    if (file_data == nullptr || part_size == 0 || offset > file_size ||
        part_size > file_size - offset || number < 1 || total < number || !valid_name(name) ||
        !valid_line_length(params.line_length)) {
        return Error::InvalidArg;
    }

    const std::uint8_t* data = file_data + offset;

    char buf[160];
    std::snprintf(buf, sizeof(buf), "=ybegin part=%d total=%d line=%zu size=%zu name=", number,
                  total, params.line_length, file_size);
    output += buf;
    output += name;
    output += "\r\n";

    // begin and end are 1-based and inclusive
    std::snprintf(buf, sizeof(buf), "=ypart begin=%zu end=%zu\r\n", offset + 1,
                  offset + part_size);
    output += buf;

    encode_lines(data, part_size, params.line_length, output);

    std::snprintf(buf, sizeof(buf), "=yend size=%zu part=%d pcrc32=%08x", part_size, number,
                  static_cast<unsigned>(crc32(data, part_size)));
    output += buf;
    if (number == total) {
        std::snprintf(buf, sizeof(buf), " crc32=%08x",
                      static_cast<unsigned>(crc32(file_data, file_size)));
        output += buf;
    }
    output += "\r\n";
    return Error::Ok;
}

Error encode_multipart(const std::uint8_t* data, std::size_t size, std::size_t part_size,
                       const std::string& name, std::string& output, const EncodeParams& params) {
    if (data == nullptr || size == 0 || part_size == 0) {
        return Error::InvalidArg;
    }

    std::size_t parts = (size + part_size - 1) / part_size;
    if (parts > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return Error::InvalidArg;
    }
    int total = static_cast<int>(parts);

    for (int number = 1; number <= total; ++number) {
        std::size_t offset = static_cast<std::size_t>(number - 1) * part_size;
        std::size_t length = (size - offset < part_size) ? size - offset : part_size;
        Error result = encode_part(data, size, offset, length, number, total, name, output, params);
        if (result != Error::Ok) {
            return result;
        }
    }
    return Error::Ok;
}

} // namespace yenc
