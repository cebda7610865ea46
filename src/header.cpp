/**
 * @file header.cpp
 * @brief Header and trailer line parsing.
 */

#include <yenc/header.hpp>

#include <charconv>
#include <limits>
#include <system_error>

namespace yenc {

namespace {

constexpr std::string_view WHITESPACE = " \t\r\n\v\f";

std::string_view trim(std::string_view text) noexcept {
    std::size_t first = text.find_first_not_of(WHITESPACE);
    if (first == std::string_view::npos) {
        return {};
    }
    std::size_t last = text.find_last_not_of(WHITESPACE);
    return text.substr(first, last - first + 1);
}

/**
 * @brief Call fn(key, value) for every key=value token in text.
 *
 * Stops at the first error fn returns.
 */
template <typename Fn>
Error for_each_field(std::string_view text, Fn&& fn) {
    std::size_t pos = 0;
    while (pos <= text.size()) {
        std::size_t space = text.find(' ', pos);
        if (space == std::string_view::npos) {
            space = text.size();
        }
        std::string_view token = trim(text.substr(pos, space - pos));
        pos = space + 1;

        std::size_t eq = token.find('=');
        if (eq == std::string_view::npos) {
            continue;
        }
        Error result = fn(token.substr(0, eq), token.substr(eq + 1));
        if (result != Error::Ok) {
            return result;
        }
    }
    return Error::Ok;
}

Error decimal_field(std::string_view value, std::int64_t& out, bool strict) noexcept {
    if (parse_decimal(value, out)) {
        return Error::Ok;
    }
    out = 0;
    return strict ? Error::InvalidField : Error::Ok;
}

Error int_field(std::string_view value, int& out, bool strict) noexcept {
    std::int64_t wide = 0;
    Error result = decimal_field(value, wide, strict);
    if (result != Error::Ok) {
        return result;
    }
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        out = 0;
        return strict ? Error::InvalidField : Error::Ok;
    }
    out = static_cast<int>(wide);
    return Error::Ok;
}

Error int_field(std::string_view value, std::optional<int>& out, bool strict) noexcept {
    int parsed = 0;
    Error result = int_field(value, parsed, strict);
    if (result == Error::Ok) {
        out = parsed;
    }
    return result;
}

// A checksum that does not parse is left unset so it is not checked.
Error hex_field(std::string_view value, std::optional<std::uint32_t>& out, bool strict) noexcept {
    std::uint32_t parsed = 0;
    if (parse_hex32(value, parsed)) {
        out = parsed;
        return Error::Ok;
    }
    return strict ? Error::InvalidField : Error::Ok;
}

} // namespace

bool parse_decimal(std::string_view text, std::int64_t& value) noexcept {
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
    }
    if (text.empty()) {
        value = 0;
        return false;
    }
    std::int64_t parsed = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed, 10);
    if (ec != std::errc() || end != text.data() + text.size()) {
        value = 0;
        return false;
    }
    value = parsed;
    return true;
}

bool parse_hex32(std::string_view text, std::uint32_t& value) noexcept {
    if (text.empty()) {
        return false;
    }
    std::uint64_t parsed = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed, 16);
    if (ec != std::errc() || end != text.data() + text.size()) {
        return false;
    }
    value = static_cast<std::uint32_t>(parsed);
    return true;
}

Error parse_begin_header(std::string_view line, BeginHeader& header, bool strict) {
    if (!starts_with(line, BEGIN_MARKER)) {
        return Error::InvalidArg;
    }
    std::string_view rest = line.substr(std::string_view(BEGIN_MARKER).size());

    // name= is last and runs to the end of the line
    std::string_view fields = rest;
    std::size_t name_pos = rest.find("name=");
    if (name_pos != std::string_view::npos) {
        header.name = std::string(trim(rest.substr(name_pos + 5)));
        fields = rest.substr(0, name_pos);
    }

    return for_each_field(fields, [&](std::string_view key, std::string_view value) {
        if (key == "size") {
            return decimal_field(value, header.size, strict);
        }
        if (key == "line") {
            return int_field(value, header.line_length, strict);
        }
        if (key == "part") {
            return int_field(value, header.part, strict);
        }
        if (key == "total") {
            return int_field(value, header.total, strict);
        }
        return Error::Ok;
    });
}

Error parse_part_header(std::string_view line, PartHeader& header, bool strict) {
    if (!starts_with(line, PART_MARKER)) {
        return Error::InvalidArg;
    }
    std::string_view fields = line.substr(std::string_view(PART_MARKER).size());

    return for_each_field(fields, [&](std::string_view key, std::string_view value) {
        if (key == "begin") {
            return decimal_field(value, header.begin, strict);
        }
        if (key == "end") {
            return decimal_field(value, header.end, strict);
        }
        return Error::Ok;
    });
}

Error parse_trailer(std::string_view line, Trailer& trailer, bool strict) {
    if (!starts_with(line, END_MARKER)) {
        return Error::InvalidArg;
    }
    std::string_view fields = line.substr(std::string_view(END_MARKER).size());

    return for_each_field(fields, [&](std::string_view key, std::string_view value) {
        if (key == "size") {
            return decimal_field(value, trailer.size, strict);
        }
        if (key == "pcrc32") {
            return hex_field(value, trailer.pcrc32, strict);
        }
        if (key == "crc32") {
            return hex_field(value, trailer.crc32, strict);
        }
        if (key == "part") {
            return int_field(value, trailer.part, strict);
        }
        return Error::Ok;
    });
}

} // namespace yenc
