/**
 * @file encoder.hpp
 * @brief yEnc encoding.
 *
 * Produces the streams the Decoder consumes. Each byte is shifted by 42;
 * the result is escaped ('=' followed by the byte plus 64) when it is
 * NUL, LF, CR or '=', when it is TAB or SPACE in the first or last
 * column, or when it is '.' in the first column. Lines end in CRLF and
 * an escape pair is never split across lines.
 */

#ifndef YENC_ENCODER_HPP
#define YENC_ENCODER_HPP

#include "config.hpp"
#include "error.hpp"

#include <string>

namespace yenc {

/**
 * @brief Encoding parameters.
 */
struct EncodeParams {
    std::size_t line_length = DEFAULT_LINE_LENGTH; ///< Encoded columns per line
};

/**
 * @brief Check whether a shifted byte must be escaped.
 *
 * @param c Byte after the +42 shift
 * @param column Column the byte would land in
 * @param line_length Target line length
 */
inline bool needs_escape(std::uint8_t c, std::size_t column, std::size_t line_length) noexcept {
    bool edge = column == 0 || column + 1 == line_length;
    return c == 0x00 || c == '\r' || c == '\n' || c == static_cast<std::uint8_t>(ESCAPE_CHAR) ||
           ((c == ' ' || c == '\t') && edge) || (c == '.' && column == 0);
}

/**
 * @brief Encode data lines (no header or trailer).
 *
 * @param data Input bytes
 * @param size Input size in bytes
 * @param line_length Encoded columns per line
 * @param[out] output Lines are appended here
 */
void encode_lines(const std::uint8_t* data, std::size_t size, std::size_t line_length,
                  std::string& output);

/**
 * @brief Encode a complete single-part stream.
 *
 * @param data Input bytes
 * @param size Input size in bytes
 * @param name File name for the header
 * @param[out] output Encoded stream is appended here
 * @param params Encoding parameters
 * @return Error::Ok, or Error::InvalidArg for a bad line length or name
 */
Error encode(const std::uint8_t* data, std::size_t size, const std::string& name,
             std::string& output, const EncodeParams& params = EncodeParams{});

/**
 * @brief Encode one part of a multipart set.
 *
 * The part covers file_data[offset, offset + part_size). The final part
 * (number == total) also carries the CRC of the whole file.
 *
 * @param file_data Whole file
 * @param file_size Whole file size
 * @param offset Zero-based offset of the part in the file
 * @param part_size Bytes in this part
 * @param number Part number (1-based)
 * @param total Number of parts in the set
 * @param name File name for the header
 * @param[out] output Encoded part is appended here
 * @param params Encoding parameters
 * @return Error::Ok, or Error::InvalidArg for inconsistent arguments
 */
Error encode_part(const std::uint8_t* file_data, std::size_t file_size, std::size_t offset,
                  std::size_t part_size, int number, int total, const std::string& name,
                  std::string& output, const EncodeParams& params = EncodeParams{});

/**
 * @brief Encode a file as consecutive parts of at most part_size bytes.
 */
Error encode_multipart(const std::uint8_t* data, std::size_t size, std::size_t part_size,
                       const std::string& name, std::string& output,
                       const EncodeParams& params = EncodeParams{});

} // namespace yenc

#endif // YENC_ENCODER_HPP
