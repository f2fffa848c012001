/**
 * @file source.hpp
 * @brief Decompressing byte sources for MXE streams.
 *
 * An MXE file is the output of a gzip stream wrapped around a Java data
 * stream. The sources here undo the gzip layer and hand out decompressed
 * bytes strictly front to back, tracking the decompressed offset.
 *
 * Both sources fall back to passing bytes through unchanged when the input
 * does not start with a gzip header, in the same way zlib's gzread does.
 */

#ifndef MXE_SOURCE_HPP
#define MXE_SOURCE_HPP

#include "config.hpp"
#include "error.hpp"

#include <string>

#include <zlib.h>

namespace mxe {

/**
 * @brief gzip-compressed file opened by path.
 *
 * Owns the zlib file handle; the handle is released by close() or by the
 * destructor, whichever comes first.
 */
class GzipFileSource {
public:
    GzipFileSource() noexcept = default;
    ~GzipFileSource();

    GzipFileSource(const GzipFileSource&) = delete;
    GzipFileSource& operator=(const GzipFileSource&) = delete;

    GzipFileSource(GzipFileSource&& other) noexcept;
    GzipFileSource& operator=(GzipFileSource&& other) noexcept;

    /**
     * @brief Open a file for reading.
     *
     * @param path Path to the file
     * @return Error::Ok, or Error::NotFound if the path is empty, missing,
     *         not a regular file or cannot be opened
     */
    Error open(const std::string& path) noexcept;

    /**
     * @brief Release the file handle. Safe to call more than once.
     */
    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept {
        return file_ != nullptr;
    }

    /**
     * @brief Read up to n decompressed bytes.
     *
     * @param dst Destination buffer
     * @param n Number of bytes requested
     * @param[out] got Number of bytes actually delivered; less than n only
     *             at end of stream
     * @return Error::Ok, or Error::CorruptStream if zlib reports damaged data
     */
    Error read(std::uint8_t* dst, std::size_t n, std::size_t& got) noexcept;

    /// Decompressed bytes delivered so far
    [[nodiscard]] std::size_t offset() const noexcept {
        return offset_;
    }

private:
    gzFile file_ = nullptr;
    std::size_t offset_ = 0;
};

/**
 * @brief gzip-compressed bytes held in memory.
 *
 * The buffer is borrowed and must outlive the source. Concatenated gzip
 * members are decoded as one stream.
 */
class GzipMemorySource {
public:
    GzipMemorySource() noexcept = default;
    ~GzipMemorySource();

    GzipMemorySource(const GzipMemorySource&) = delete;
    GzipMemorySource& operator=(const GzipMemorySource&) = delete;

    /**
     * @brief Attach to a compressed buffer.
     *
     * @param data Compressed bytes
     * @param size Number of compressed bytes
     * @return Error::Ok, Error::InvalidArg for a null buffer with non-zero
     *         size, Error::CorruptStream if zlib cannot be initialised
     */
    Error open(const std::uint8_t* data, std::size_t size) noexcept;

    void close() noexcept;

    [[nodiscard]] bool is_open() const noexcept {
        return open_;
    }

    /**
     * @brief Read up to n decompressed bytes.
     *
     * @param dst Destination buffer
     * @param n Number of bytes requested
     * @param[out] got Number of bytes actually delivered
     * @return Error::Ok, or Error::CorruptStream on a gzip data error
     */
    Error read(std::uint8_t* dst, std::size_t n, std::size_t& got) noexcept;

    [[nodiscard]] std::size_t offset() const noexcept {
        return offset_;
    }

private:
    Error inflate_into(std::uint8_t* dst, std::size_t n, std::size_t& got) noexcept;

    const std::uint8_t* data_ = nullptr;
    std::size_t size_ = 0;
    std::size_t raw_pos_ = 0;
    std::size_t offset_ = 0;
    z_stream strm_{};
    bool open_ = false;
    bool raw_ = false;
    bool finished_ = false;
};

} // namespace mxe

#endif // MXE_SOURCE_HPP
