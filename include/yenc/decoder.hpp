/**
 * @file decoder.hpp
 * @brief yEnc decoding session.
 *
 * A Decoder runs over one input stream and collects every part it
 * finds, in stream order:
 *
 * 1. skip to a =ybegin line and parse it
 * 2. for multipart streams, skip to the =ypart line and parse it
 * 3. decode data lines up to =yend and parse the trailer
 * 4. validate the part, then look for the next =ybegin
 *
 * Running out of input while looking for the next =ybegin ends the
 * session normally. Running out anywhere inside a part is an error.
 */

#ifndef YENC_DECODER_HPP
#define YENC_DECODER_HPP

#include "config.hpp"
#include "crc32.hpp"
#include "error.hpp"
#include "header.hpp"
#include "line_decoder.hpp"
#include "line_reader.hpp"
#include "part.hpp"

#include <istream>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace yenc {

/**
 * @brief Run-time decoding options.
 */
struct DecodeOptions {
    bool strict_numbers = false; ///< Reject malformed numeric fields
};

/**
 * @brief Single-use decoding session over one stream.
 */
class Decoder {
public:
    /**
     * @brief Construct a decoder.
     *
     * @param input Source stream (must outlive the decoder)
     * @param options Decoding options
     */
    explicit Decoder(std::istream& input, const DecodeOptions& options = DecodeOptions{});

    /**
     * @brief Decode every part in the stream.
     *
     * Stops at the first error. A part that fails validation is still
     * in parts() when run() returns.
     *
     * @return Error::Ok when the stream was consumed without error
     *         (even if it held no parts)
     */
    Error run();

    /**
     * @brief Check the whole-session CRC.
     *
     * Skipped (returns Error::Ok) when no trailer declared crc32= or when
     * the multipart set looks incomplete: the count of decoded parts
     * must equal the number of the last decoded part.
     *
     * The session CRC runs over every decoded byte in the stream, so
     * unrelated single-part files concatenated together share one CRC.
     * It is compared against the crc32= of the last trailer that carried
     * one.
     *
     * @return Error::Ok or Error::CrcMismatch
     */
    Error validate();

    /**
     * @brief Decoded parts in stream order.
     */
    [[nodiscard]] const std::vector<Part>& parts() const noexcept {
        return parts_;
    }

    /**
     * @brief Move the decoded parts out of the session.
     */
    std::vector<Part> take_parts() noexcept {
        return std::move(parts_);
    }

    /// A begin header carried part=.
    [[nodiscard]] bool multipart() const noexcept {
        return multipart_;
    }

    /// Last total= seen, 0 if none.
    [[nodiscard]] int total() const noexcept {
        return total_;
    }

    /// Whole-session crc32= from the last trailer that carried one.
    [[nodiscard]] std::optional<std::uint32_t> expected_crc() const noexcept {
        return expected_crc_;
    }

    /// Running CRC over all decoded bytes.
    [[nodiscard]] std::uint32_t crc() const noexcept {
        return crc_.value();
    }

    /// Expected checksum of the last Error::CrcMismatch.
    [[nodiscard]] std::uint32_t mismatch_expected() const noexcept {
        return mismatch_expected_;
    }

    /// Computed checksum of the last Error::CrcMismatch.
    [[nodiscard]] std::uint32_t mismatch_actual() const noexcept {
        return mismatch_actual_;
    }

    /// Diagnostic for the last failure.
    [[nodiscard]] const std::string& message() const noexcept {
        return message_;
    }

private:
    Error read_header();
    Error read_part_header();
    Error read_body();
    Error fail(Error error, const std::string& detail);

    LineReader reader_;
    LineDecoder line_decoder_;
    DecodeOptions options_;
    bool multipart_;
    int total_;
    std::vector<Part> parts_;
    Part part_;
    std::optional<std::uint32_t> expected_crc_;
    Crc32 crc_;
    std::string line_;
    std::string message_;
    std::uint32_t mismatch_expected_;
    std::uint32_t mismatch_actual_;
};

} // namespace yenc

#endif // YENC_DECODER_HPP
