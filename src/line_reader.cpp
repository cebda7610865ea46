/**
 * @file line_reader.cpp
 * @brief LineReader implementation.
 */

#include <yenc/line_reader.hpp>

namespace yenc {

Error LineReader::read_line(std::string& line) {
    if (!std::getline(input_, line, '\n')) {
        // failbit alone means nothing was left to extract
        return input_.bad() ? Error::IoError : Error::EndOfStream;
    }
    ++line_number_;
    strip_line_end(line);
    return Error::Ok;
}

} // namespace yenc
