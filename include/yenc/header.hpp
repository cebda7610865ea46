/**
 * @file header.hpp
 * @brief Parsing of =ybegin, =ypart and =yend lines.
 *
 * Header and trailer lines carry space separated key=value tokens:
 *
 *     =ybegin [part=P] [total=T] line=L size=S name=NAME
 *     =ypart begin=B end=E
 *     =yend size=S [part=P] [pcrc32=HEX] [crc32=HEX]
 *
 * NAME runs to the end of the line and may contain spaces. Unknown keys
 * and tokens without '=' are ignored. In lenient mode a malformed decimal
 * value reads as zero and a malformed checksum is left unset; strict mode
 * reports Error::InvalidField instead.
 */

#ifndef YENC_HEADER_HPP
#define YENC_HEADER_HPP

#include "config.hpp"
#include "error.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace yenc {

/**
 * @brief Fields of a =ybegin line.
 *
 * Absent keys keep their default value.
 */
struct BeginHeader {
    std::int64_t size = 0;    ///< size= (whole file size)
    int line_length = 0;      ///< line= (informational)
    std::optional<int> part;  ///< part= (present only in multipart streams)
    std::optional<int> total; ///< total= (declared part count)
    std::string name;         ///< name= (verbatim, trimmed)
};

/**
 * @brief Fields of a =ypart line.
 */
struct PartHeader {
    std::int64_t begin = 0; ///< begin= (1-based offset of first byte)
    std::int64_t end = 0;   ///< end= (1-based offset of last byte)
};

/**
 * @brief Fields of a =yend line.
 */
struct Trailer {
    std::int64_t size = 0;                 ///< size= (decoded part length)
    std::optional<int> part;               ///< part= when present
    std::optional<std::uint32_t> pcrc32;   ///< pcrc32= when it parsed
    std::optional<std::uint32_t> crc32;    ///< crc32= when it parsed
};

/**
 * @brief Check whether a line starts with a marker.
 */
inline bool starts_with(std::string_view line, std::string_view marker) noexcept {
    return line.size() >= marker.size() && line.compare(0, marker.size(), marker) == 0;
}

/**
 * @brief Parse a decimal integer field.
 *
 * @param text Field value
 * @param[out] value Parsed value, 0 when parsing fails
 * @return true if the whole text was a valid integer
 */
bool parse_decimal(std::string_view text, std::int64_t& value) noexcept;

/**
 * @brief Parse a hexadecimal checksum field.
 *
 * Values wider than 32 bits keep their low 32 bits.
 *
 * @param text Field value (no 0x prefix)
 * @param[out] value Parsed value, untouched when parsing fails
 * @return true if the whole text was valid hexadecimal
 */
bool parse_hex32(std::string_view text, std::uint32_t& value) noexcept;

/**
 * @brief Parse a =ybegin line.
 *
 * @param line Line starting with =ybegin, line terminator stripped
 * @param[out] header Parsed fields
 * @param strict Reject malformed numeric values
 * @return Error::Ok, Error::InvalidArg when the marker is missing, or
 *         Error::InvalidField in strict mode
 */
Error parse_begin_header(std::string_view line, BeginHeader& header, bool strict = false);

/**
 * @brief Parse a =ypart line.
 */
Error parse_part_header(std::string_view line, PartHeader& header, bool strict = false);

/**
 * @brief Parse a =yend line.
 */
Error parse_trailer(std::string_view line, Trailer& trailer, bool strict = false);

} // namespace yenc

#endif // YENC_HEADER_HPP
