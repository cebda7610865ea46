/**
 * @file line_reader.hpp
 * @brief Sequential line access over a byte stream.
 *
 * yEnc data lines may hold any byte value except LF, so lines are
 * read as raw bytes and only LF delimits them.
 */

#ifndef YENC_LINE_READER_HPP
#define YENC_LINE_READER_HPP

#include "config.hpp"
#include "error.hpp"

#include <istream>
#include <string>

namespace yenc {

/**
 * @brief Strip trailing CR and LF bytes in place.
 *
 * Accepts both LF and CRLF terminated sources.
 */
inline void strip_line_end(std::string& line) noexcept {
    std::size_t len = line.size();
    while (len > 0 && (line[len - 1] == '\r' || line[len - 1] == '\n')) {
        --len;
    }
    line.resize(len);
}

/**
 * @brief Pull-based line reader.
 *
 * Consumes the stream strictly once and never seeks.
 */
class LineReader {
public:
    /**
     * @brief Construct a line reader.
     *
     * @param input Source stream (must outlive the reader)
     */
    explicit LineReader(std::istream& input) noexcept : input_(input), line_number_(0) {}

    /**
     * @brief Read the next line without its terminator.
     *
     * A final line that lacks a terminator is still returned.
     *
     * @param[out] line Line content with trailing CR/LF removed
     * @return Error::Ok on success, Error::EndOfStream when no bytes
     *         remain, Error::IoError when the stream failed
     */
    Error read_line(std::string& line);

    /**
     * @brief Number of lines read so far.
     */
    [[nodiscard]] std::size_t line_number() const noexcept {
        return line_number_;
    }

private:
    std::istream& input_;
    std::size_t line_number_;
};

} // namespace yenc

#endif // YENC_LINE_READER_HPP
