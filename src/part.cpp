/**
 * @file part.cpp
 * @brief Part validation.
 */

#include <yenc/part.hpp>

#include <cstdio>

namespace yenc {

Error Part::validate(std::string* message) const {
    if (static_cast<std::int64_t>(body.size()) != size) {
        if (message != nullptr) {
            char buf[128];
            std::snprintf(buf, sizeof(buf), "body size %zu did not match expected size %lld",
                          body.size(), static_cast<long long>(size));
            *message = buf;
        }
        return Error::SizeMismatch;
    }

    if (expected_crc) {
        std::uint32_t actual = crc.value();
        if (actual != *expected_crc) {
            if (message != nullptr) {
                char buf[128];
                std::snprintf(buf, sizeof(buf), "crc check failed for part %d: expected %08x got %08x",
                              number, static_cast<unsigned>(*expected_crc),
                              static_cast<unsigned>(actual));
                *message = buf;
            }
            return Error::CrcMismatch;
        }
    }

    return Error::Ok;
}

} // namespace yenc
