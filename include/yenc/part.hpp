/**
 * @file part.hpp
 * @brief One decoded yEnc part.
 */

#ifndef YENC_PART_HPP
#define YENC_PART_HPP

#include "config.hpp"
#include "crc32.hpp"
#include "error.hpp"

#include <optional>
#include <string>
#include <vector>

namespace yenc {

/**
 * @brief Decoded segment of an encoded file.
 *
 * The multipart fields (number, begin, end, name, size) are what a
 * caller needs to place the body into a file reassembled from several
 * streams; this library does not do that placement itself.
 */
struct Part {
    int number = 0;                            ///< part= (0 for single part)
    std::int64_t header_size = 0;              ///< size= from =ybegin
    std::int64_t size = 0;                     ///< size= from =yend
    std::int64_t begin = 0;                    ///< begin= from =ypart
    std::int64_t end = 0;                      ///< end= from =ypart
    std::string name;                          ///< name= from =ybegin
    int line_length = 0;                       ///< line= from =ybegin
    std::optional<std::uint32_t> expected_crc; ///< pcrc32= from =yend
    Crc32 crc;                                 ///< running CRC of body
    std::vector<std::uint8_t> body;            ///< decoded bytes

    /**
     * @brief Append decoded bytes to the body and checksum.
     */
    void append(const std::uint8_t* data, std::size_t size_bytes) {
        body.insert(body.end(), data, data + size_bytes);
        crc.update(data, size_bytes);
    }

    /**
     * @brief Check the body against the trailer.
     *
     * @param[out] message Diagnostic on failure (may be nullptr)
     * @return Error::Ok, Error::SizeMismatch or Error::CrcMismatch
     */
    Error validate(std::string* message = nullptr) const;
};

} // namespace yenc

#endif // YENC_PART_HPP
