/**
 * @file yenc.hpp
 * @brief High-level yEnc decoding API.
 *
 * decode() runs a Decoder over a stream and hands back the first part
 * found. Use the Decoder class directly to get every part of a
 * multipart stream.
 */

#ifndef YENC_HPP
#define YENC_HPP

#include "config.hpp"
#include "crc32.hpp"
#include "decoder.hpp"
#include "encoder.hpp"
#include "error.hpp"
#include "header.hpp"
#include "line_decoder.hpp"
#include "line_reader.hpp"
#include "part.hpp"

#include <istream>
#include <string>

namespace yenc {

/**
 * @brief Decode a yEnc stream.
 *
 * Fails with Error::NoParts when the stream holds no =ybegin line. Any
 * error discards every part decoded so far.
 *
 * @param input Source stream
 * @param[out] part First decoded part, untouched on failure
 * @param[out] message Diagnostic on failure (may be nullptr)
 * @param options Decoding options
 * @return Error::Ok on success
 */
Error decode(std::istream& input, Part& part, std::string* message = nullptr,
             const DecodeOptions& options = DecodeOptions{});

/**
 * @brief Decode a yEnc stream held in memory.
 */
Error decode(const std::uint8_t* data, std::size_t size, Part& part,
             std::string* message = nullptr, const DecodeOptions& options = DecodeOptions{});

#if !YENC_NO_EXCEPTIONS

/**
 * @brief Decode a yEnc stream, throwing on failure.
 *
 * @throws FormatException, SizeMismatchException, CrcMismatchException,
 *         NoPartsException
 */
Part decode(std::istream& input, const DecodeOptions& options = DecodeOptions{});

#endif // !YENC_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace yenc

#endif // YENC_HPP
