/**
 * @file error.hpp
 * @brief yEnc error handling.
 *
 * Every decoding step returns an Error code. The exception classes wrap
 * the same codes for callers that prefer throwing APIs and can be
 * compiled out with YENC_NO_EXCEPTIONS=1.
 */

#ifndef YENC_ERROR_HPP
#define YENC_ERROR_HPP

#include "config.hpp"

#if !YENC_NO_EXCEPTIONS
#include <stdexcept>
#include <string>
#endif

namespace yenc {

/**
 * @brief Error codes for error-code-based error handling.
 */
enum class Error {
    Ok = 0,            ///< Success
    EndOfStream = -1,  ///< No further begin header in the stream
    IoError = -2,      ///< Input stream failed
    Truncated = -3,    ///< Stream ended inside a part
    PartMismatch = -4, ///< Trailer part number differs from header
    SizeMismatch = -5, ///< Decoded length differs from trailer size
    CrcMismatch = -6,  ///< Checksum differs from trailer value
    NoParts = -7,      ///< No yEnc part found in the stream
    InvalidField = -8, ///< Malformed numeric field (strict mode)
    InvalidArg = -9    ///< Invalid argument
};

/**
 * @brief Get error message for error code.
 * @param error Error code
 * @return Human-readable error message
 */
inline const char* error_string(Error error) noexcept {
    switch (error) {
    case Error::Ok:
        return "Success";
    case Error::EndOfStream:
        return "End of stream";
    case Error::IoError:
        return "Input stream error";
    case Error::Truncated:
        return "Unexpected end of stream inside a part";
    case Error::PartMismatch:
        return "Trailer part number mismatch";
    case Error::SizeMismatch:
        return "Decoded size mismatch";
    case Error::CrcMismatch:
        return "CRC-32 mismatch";
    case Error::NoParts:
        return "No parts found";
    case Error::InvalidField:
        return "Malformed header field";
    case Error::InvalidArg:
        return "Invalid argument";
    default:
        return "Unknown error";
    }
}

#if !YENC_NO_EXCEPTIONS

/**
 * @brief Base exception for yEnc errors.
 */
class YencException : public std::runtime_error {
public:
    explicit YencException(const std::string& message, Error code = Error::InvalidArg)
        : std::runtime_error(message), error_code_(code) {}

    Error code() const noexcept {
        return error_code_;
    }

private:
    Error error_code_;
};

/**
 * @brief Malformed or truncated input (Truncated, PartMismatch, InvalidField, IoError).
 */
class FormatException : public YencException {
public:
    FormatException(const std::string& message, Error code)
        : YencException(message, code) {}
};

/**
 * @brief Decoded body length differs from the trailer size.
 */
class SizeMismatchException : public YencException {
public:
    explicit SizeMismatchException(const std::string& message)
        : YencException(message, Error::SizeMismatch) {}
};

/**
 * @brief Checksum verification failed.
 */
class CrcMismatchException : public YencException {
public:
    CrcMismatchException(const std::string& message, std::uint32_t expected,
                         std::uint32_t actual)
        : YencException(message, Error::CrcMismatch), expected_(expected), actual_(actual) {}

    std::uint32_t expected() const noexcept {
        return expected_;
    }

    std::uint32_t actual() const noexcept {
        return actual_;
    }

private:
    std::uint32_t expected_;
    std::uint32_t actual_;
};

/**
 * @brief Stream contained no yEnc part.
 */
class NoPartsException : public YencException {
public:
    explicit NoPartsException(const std::string& message)
        : YencException(message, Error::NoParts) {}
};

#endif // !YENC_NO_EXCEPTIONS

} // namespace yenc

#endif // YENC_ERROR_HPP
