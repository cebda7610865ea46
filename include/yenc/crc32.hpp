/**
 * @file crc32.hpp
 * @brief Running CRC-32 (IEEE 802.3) accumulator.
 *
 * Thin wrapper over zlib's crc32() so the decoder can feed bytes line by
 * line and read the digest at any point.
 */

#ifndef YENC_CRC32_HPP
#define YENC_CRC32_HPP

#include "config.hpp"

#include <climits>
#include <zlib.h>

namespace yenc {

/**
 * @brief Incremental CRC-32 over a byte sequence.
 */
class Crc32 {
public:
    Crc32() noexcept : value_(::crc32(0L, Z_NULL, 0)) {}

    /**
     * @brief Feed bytes into the checksum.
     *
     * @param data Bytes to add
     * @param size Number of bytes
     */
    void update(const std::uint8_t* data, std::size_t size) noexcept {
        // zlib takes a uInt length
        while (size > 0) {
            uInt chunk = size > UINT_MAX ? UINT_MAX : static_cast<uInt>(size);
            value_ = ::crc32(value_, reinterpret_cast<const Bytef*>(data), chunk);
            data += chunk;
            size -= chunk;
        }
    }

    /**
     * @brief Digest of all bytes fed so far.
     */
    [[nodiscard]] std::uint32_t value() const noexcept {
        return static_cast<std::uint32_t>(value_);
    }

    void reset() noexcept {
        value_ = ::crc32(0L, Z_NULL, 0);
    }

private:
    uLong value_;
};

/**
 * @brief One-shot CRC-32 of a buffer.
 */
inline std::uint32_t crc32(const std::uint8_t* data, std::size_t size) noexcept {
    Crc32 crc;
    crc.update(data, size);
    return crc.value();
}

} // namespace yenc

#endif // YENC_CRC32_HPP
