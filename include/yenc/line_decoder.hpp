/**
 * @file line_decoder.hpp
 * @brief yEnc byte-shift and escape state machine.
 *
 * Reverses the encoding of one raw line:
 * - normal byte b -> (b - 42) mod 256
 * - '=' marks the next byte as escaped and is dropped
 * - escaped byte b -> ((b - 42) mod 256 - 64) mod 256
 *
 * The escape flag survives line boundaries, so a line that ends in a
 * bare '=' escapes the first byte of the next line.
 */

#ifndef YENC_LINE_DECODER_HPP
#define YENC_LINE_DECODER_HPP

#include "config.hpp"

#include <string>

namespace yenc {

/**
 * @brief Stateful line decoder for one part body.
 */
class LineDecoder {
public:
    LineDecoder() noexcept : awaiting_escape_(false) {}

    /**
     * @brief Decode a raw line in place.
     *
     * The write cursor trails the read cursor by the number of escape
     * markers consumed so far.
     *
     * @param data Line bytes, overwritten with decoded bytes
     * @param size Number of raw bytes
     * @return Number of decoded bytes at the front of data
     */
    std::size_t decode(std::uint8_t* data, std::size_t size) noexcept {
        std::size_t out = 0;
        for (std::size_t in = 0; in < size; ++in) {
            std::uint8_t byte = data[in];
            if (awaiting_escape_) {
                data[out++] = static_cast<std::uint8_t>(
                    static_cast<std::uint8_t>(byte - SHIFT) - ESCAPE_SHIFT);
                awaiting_escape_ = false;
            } else if (byte == static_cast<std::uint8_t>(ESCAPE_CHAR)) {
                awaiting_escape_ = true;
            } else {
                data[out++] = static_cast<std::uint8_t>(byte - SHIFT);
            }
        }
        return out;
    }

    /**
     * @brief Decode a line held in a string, shrinking it to the output.
     */
    void decode(std::string& line) noexcept {
        std::size_t len = decode(reinterpret_cast<std::uint8_t*>(&line[0]), line.size());
        line.resize(len);
    }

    /// Forget a pending escape (start of a new part body).
    void reset() noexcept {
        awaiting_escape_ = false;
    }

    [[nodiscard]] bool awaiting_escape() const noexcept {
        return awaiting_escape_;
    }

private:
    bool awaiting_escape_;
};

} // namespace yenc

#endif // YENC_LINE_DECODER_HPP
