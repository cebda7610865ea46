/**
 * @file config.hpp
 * @brief yEnc compile-time configuration and format constants.
 *
 * @see http://www.yenc.org/yenc-draft.1.3.txt yEnc 1.3 draft
 */

#ifndef YENC_CONFIG_HPP
#define YENC_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace yenc {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup format Format Constants
 * @{
 */

/// Additive shift applied to every byte
inline constexpr std::uint8_t SHIFT = 42U;

/// Extra shift applied to the byte following an escape marker
inline constexpr std::uint8_t ESCAPE_SHIFT = 64U;

/// Escape marker
inline constexpr char ESCAPE_CHAR = '=';

inline constexpr const char* BEGIN_MARKER = "=ybegin";
inline constexpr const char* PART_MARKER = "=ypart";
inline constexpr const char* END_MARKER = "=yend";

/// Encoded columns per line when the caller does not choose one
#ifndef YENC_DEFAULT_LINE_LENGTH
#define YENC_DEFAULT_LINE_LENGTH 128U
#endif

inline constexpr std::size_t DEFAULT_LINE_LENGTH = YENC_DEFAULT_LINE_LENGTH;

/// Longest line the encoder accepts
inline constexpr std::size_t MAX_LINE_LENGTH = 997U;

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define YENC_NO_EXCEPTIONS=1 to build without the exception layer.
 * @{
 */
#ifndef YENC_NO_EXCEPTIONS
#define YENC_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace yenc

#endif // YENC_CONFIG_HPP
