/**
 * @file decoder.cpp
 * @brief Decoding session: header search, body decoding, validation.
 */

#include <yenc/decoder.hpp>

#include <cstdio>

namespace yenc {

Decoder::Decoder(std::istream& input, const DecodeOptions& options)
    : reader_(input)
    , options_(options)
    , multipart_(false)
    , total_(0)
    , mismatch_expected_(0)
    , mismatch_actual_(0)
{}

Error Decoder::fail(Error error, const std::string& detail) {
    char buf[64];
    std::snprintf(buf, sizeof(buf), " (line %zu)", reader_.line_number());
    message_ = detail + buf;
    return error;
}

Error Decoder::read_header() {
    // Any read failure before a =ybegin line means there are no more parts
    for (;;) {
        if (reader_.read_line(line_) != Error::Ok) {
            return Error::EndOfStream;
        }
        if (starts_with(line_, BEGIN_MARKER)) {
            break;
        }
    }

    BeginHeader header;
    Error result = parse_begin_header(line_, header, options_.strict_numbers);
    if (result != Error::Ok) {
        return fail(result, "malformed =ybegin line");
    }

    part_.name = header.name;
    part_.header_size = header.size;
    part_.line_length = header.line_length;
    if (header.part) {
        part_.number = *header.part;
        multipart_ = true;
    }
    if (header.total) {
        total_ = *header.total;
    }
    return Error::Ok;
}

Error Decoder::read_part_header() {
    for (;;) {
        Error result = reader_.read_line(line_);
        if (result == Error::EndOfStream) {
            return fail(Error::Truncated, "stream ended before =ypart line of part " +
                                              std::to_string(part_.number));
        }
        if (result != Error::Ok) {
            return fail(result, "read failed while looking for =ypart line");
        }
        if (starts_with(line_, PART_MARKER)) {
            break;
        }
    }

    PartHeader header;
    Error result = parse_part_header(line_, header, options_.strict_numbers);
    if (result != Error::Ok) {
        return fail(result, "malformed =ypart line");
    }

    part_.begin = header.begin;
    part_.end = header.end;
    return Error::Ok;
}

Error Decoder::read_body() {
    part_.body.clear();
    line_decoder_.reset();

    for (;;) {
        Error result = reader_.read_line(line_);
        if (result == Error::EndOfStream) {
            return fail(Error::Truncated, "stream ended before =yend line of part " +
                                              std::to_string(part_.number));
        }
        if (result != Error::Ok) {
            return fail(result, "read failed inside part body");
        }

        if (starts_with(line_, END_MARKER)) {
            Trailer trailer;
            result = parse_trailer(line_, trailer, options_.strict_numbers);
            if (result != Error::Ok) {
                return fail(result, "malformed =yend line");
            }
            if (trailer.part && *trailer.part != part_.number) {
                return fail(Error::PartMismatch,
                            "=yend out of order: expected part " + std::to_string(part_.number) +
                                " got " + std::to_string(*trailer.part));
            }
            part_.size = trailer.size;
            if (trailer.pcrc32) {
                part_.expected_crc = trailer.pcrc32;
            }
            if (trailer.crc32) {
                expected_crc_ = trailer.crc32;
            }
            return Error::Ok;
        }

        line_decoder_.decode(line_);
        const auto* bytes = reinterpret_cast<const std::uint8_t*>(line_.data());
        part_.append(bytes, line_.size());
        crc_.update(bytes, line_.size());
    }
}

Error Decoder::run() {
    for (;;) {
        part_ = Part{};

        Error result = read_header();
        if (result == Error::EndOfStream) {
            return Error::Ok;
        }
        if (result != Error::Ok) {
            return result;
        }

        if (multipart_) {
            result = read_part_header();
            if (result != Error::Ok) {
                return result;
            }
        }

        result = read_body();
        if (result != Error::Ok) {
            return result;
        }

        parts_.push_back(std::move(part_));
        const Part& done = parts_.back();
        result = done.validate(&message_);
        if (result != Error::Ok) {
            if (result == Error::CrcMismatch) {
                mismatch_expected_ = *done.expected_crc;
                mismatch_actual_ = done.crc.value();
            }
            return result;
        }
    }
}

Error Decoder::validate() {
    if (!expected_crc_ || parts_.empty()) {
        return Error::Ok;
    }

    // TODO: compare against total= once out-of-order sets need support;
    // counting parts against the last part number misses sparse sets.
    if (multipart_ && static_cast<std::int64_t>(parts_.size()) != parts_.back().number) {
        return Error::Ok;
    }

    std::uint32_t actual = crc_.value();
    if (actual != *expected_crc_) {
        mismatch_expected_ = *expected_crc_;
        mismatch_actual_ = actual;
        char buf[64];
        std::snprintf(buf, sizeof(buf), "crc check failed: expected %08x got %08x",
                      static_cast<unsigned>(*expected_crc_), static_cast<unsigned>(actual));
        message_ = buf;
        return Error::CrcMismatch;
    }
    return Error::Ok;
}

} // namespace yenc
