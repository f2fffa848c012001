/**
 * @file decoder.hpp
 * @brief MXE decoding pipeline.
 *
 * Runs the four stages over one stream: open and decompress, read the
 * preamble, read the header, then read the payload selected by the data
 * type tag. The stream is read once, front to back, and is released on
 * every exit path.
 */

#ifndef MXE_DECODER_HPP
#define MXE_DECODER_HPP

#include "config.hpp"
#include "error.hpp"
#include "grid.hpp"
#include "preamble.hpp"

#include <string>

namespace mxe {

struct DecodeOptions {
    MagicCheck magic_check = MagicCheck::Lenient;
};

/**
 * @brief Reusable decoder holding diagnostics for the last decode.
 *
 * A decode is all-or-nothing: the output grid is assigned only when
 * Error::Ok is returned.
 */
class Decoder {
public:
    explicit Decoder(const DecodeOptions& options = DecodeOptions{}) noexcept
        : options_(options) {}

    /**
     * @brief Decode an MXE file.
     *
     * @param path File path
     * @param[out] grid Decoded grid, untouched on failure
     * @return Error::Ok on success (including an unrecognised data type,
     *         which yields a grid without data)
     */
    Error decode_file(const std::string& path, RasterGrid& grid);

    /**
     * @brief Decode an MXE stream held in memory.
     *
     * @param data gzip-compressed bytes (uncompressed bytes are accepted)
     * @param size Number of bytes
     * @param[out] grid Decoded grid, untouched on failure
     */
    Error decode_buffer(const std::uint8_t* data, std::size_t size, RasterGrid& grid);

    [[nodiscard]] const DecodeOptions& options() const noexcept {
        return options_;
    }

    /// Preamble of the last decode that got past the first five bytes
    [[nodiscard]] const Preamble& preamble() const noexcept {
        return preamble_;
    }

    /// true if the last decode accepted a stream with unexpected magic bytes
    [[nodiscard]] bool magic_mismatch() const noexcept {
        return magic_mismatch_;
    }

    [[nodiscard]] Error last_error() const noexcept {
        return last_error_;
    }

    /**
     * @brief Field or stage of the last failure.
     *
     * @return Static string such as "preamble", "ncols" or "payload"; empty
     *         after a successful decode
     */
    [[nodiscard]] const char* failed_field() const noexcept {
        return failed_field_;
    }

    /// Decompressed offset at which the failing read started
    [[nodiscard]] std::size_t failed_offset() const noexcept {
        return failed_offset_;
    }

    /// Clear diagnostics from the previous decode
    void reset() noexcept;

private:
    template <typename Source> Error decode_stream(Source& source, RasterGrid& grid);

    Error fail(Error error, const char* field, std::size_t offset) noexcept;

    DecodeOptions options_;
    Preamble preamble_{};
    bool magic_mismatch_ = false;
    Error last_error_ = Error::Ok;
    const char* failed_field_ = "";
    std::size_t failed_offset_ = 0;
};

} // namespace mxe

#endif // MXE_DECODER_HPP
