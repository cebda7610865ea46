/**
 * @file yenc.cpp
 * @brief High-level decode() entry points.
 */

#include <yenc/yenc.hpp>

#include <sstream>
#include <utility>
#include <vector>

namespace yenc {

namespace {

constexpr const char* NO_PARTS_MESSAGE = "no yenc parts found";

/**
 * @brief Run the session and the whole-stream checks.
 */
Error run_session(Decoder& decoder) {
    Error result = decoder.run();
    if (result != Error::Ok) {
        return result;
    }
    if (decoder.parts().empty()) {
        return Error::NoParts;
    }
    return decoder.validate();
}

std::string session_message(const Decoder& decoder, Error result) {
    if (result == Error::NoParts) {
        return NO_PARTS_MESSAGE;
    }
    if (decoder.message().empty()) {
        return error_string(result);
    }
    return decoder.message();
}

} // namespace

Error decode(std::istream& input, Part& part, std::string* message, const DecodeOptions& options) {
    Decoder decoder(input, options);
    Error result = run_session(decoder);
    if (result != Error::Ok) {
        if (message != nullptr) {
            *message = session_message(decoder, result);
        }
        return result;
    }

    std::vector<Part> parts = decoder.take_parts();
    part = std::move(parts.front());
    return Error::Ok;
}

Error decode(const std::uint8_t* data, std::size_t size, Part& part, std::string* message,
             const DecodeOptions& options) {
    if (data == nullptr && size > 0) {
        return Error::InvalidArg;
    }

    std::string buffer;
    if (size > 0) {
        buffer.assign(reinterpret_cast<const char*>(data), size);
    }
    std::istringstream stream(std::move(buffer), std::ios::in | std::ios::binary);
    return decode(stream, part, message, options);
}

#if !YENC_NO_EXCEPTIONS

Part decode(std::istream& input, const DecodeOptions& options) {
    Decoder decoder(input, options);
    Error result = run_session(decoder);

    switch (result) {
    case Error::Ok:
        break;
    case Error::NoParts:
        throw NoPartsException(NO_PARTS_MESSAGE);
    case Error::SizeMismatch:
        throw SizeMismatchException(session_message(decoder, result));
    case Error::CrcMismatch:
        throw CrcMismatchException(session_message(decoder, result), decoder.mismatch_expected(),
                                   decoder.mismatch_actual());
    default:
        throw FormatException(session_message(decoder, result), result);
    }

    std::vector<Part> parts = decoder.take_parts();
    return std::move(parts.front());
}

#endif // !YENC_NO_EXCEPTIONS

} // namespace yenc
