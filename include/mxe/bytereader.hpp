/**
 * @file bytereader.hpp
 * @brief Big-endian typed reads from a decompressed byte source.
 *
 * Every read names the field it is reading. When a read comes up short the
 * reader remembers that name together with the stream offset at which the
 * read began, so the caller can say exactly where a stream was cut off.
 */

#ifndef MXE_BYTEREADER_HPP
#define MXE_BYTEREADER_HPP

#include "config.hpp"
#include "error.hpp"

#include <cstring>

namespace mxe {

/**
 * @defgroup bigendian Big-Endian Loads
 *
 * Decode from a byte pointer. Floating-point values are rebuilt from their
 * integer bit pattern with memcpy.
 * @{
 */

inline std::uint32_t load_be_u32(const std::uint8_t* p) noexcept {
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

inline std::uint64_t load_be_u64(const std::uint8_t* p) noexcept {
    return (static_cast<std::uint64_t>(load_be_u32(p)) << 32) | load_be_u32(p + 4);
}

inline std::int32_t load_be_i32(const std::uint8_t* p) noexcept {
    return static_cast<std::int32_t>(load_be_u32(p));
}

inline float load_be_f32(const std::uint8_t* p) noexcept {
    static_assert(sizeof(float) == 4, "IEEE-754 binary32 required");
    std::uint32_t bits = load_be_u32(p);
    float value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

inline double load_be_f64(const std::uint8_t* p) noexcept {
    static_assert(sizeof(double) == 8, "IEEE-754 binary64 required");
    std::uint64_t bits = load_be_u64(p);
    double value;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

/** @} */

/**
 * @brief Forward-only typed reader over a byte source.
 *
 * @tparam Source Type providing read(dst, n, got) and offset(), such as
 *         GzipFileSource or GzipMemorySource
 */
template <typename Source> class ByteReader {
public:
    explicit ByteReader(Source& source) noexcept : source_(source) {}

    /**
     * @brief Read exactly n bytes.
     *
     * @param dst Destination buffer (at least n bytes)
     * @param n Number of bytes
     * @param field Name of the field being read, kept on failure
     * @return Error::Ok, Error::TruncatedStream if the stream ends first,
     *         or the source's own error
     */
    Error read_exact(std::uint8_t* dst, std::size_t n, const char* field) noexcept {
        std::size_t start = source_.offset();
        std::size_t got = 0;
        Error status = source_.read(dst, n, got);
        if (status == Error::Ok && got < n) {
            status = Error::TruncatedStream;
        }
        if (status != Error::Ok) [[unlikely]] {
            failed_field_ = field;
            failed_offset_ = start;
        }
        return status;
    }

    Error read_be_i32(std::int32_t& value, const char* field) noexcept {
        std::uint8_t buf[4];
        Error status = read_exact(buf, sizeof(buf), field);
        if (status == Error::Ok) {
            value = load_be_i32(buf);
        }
        return status;
    }

    Error read_be_f64(double& value, const char* field) noexcept {
        std::uint8_t buf[8];
        Error status = read_exact(buf, sizeof(buf), field);
        if (status == Error::Ok) {
            value = load_be_f64(buf);
        }
        return status;
    }

    /// Decompressed stream offset of the next byte
    [[nodiscard]] std::size_t position() const noexcept {
        return source_.offset();
    }

    /// Field name of the last failed read, or nullptr
    [[nodiscard]] const char* failed_field() const noexcept {
        return failed_field_;
    }

    [[nodiscard]] std::size_t failed_offset() const noexcept {
        return failed_offset_;
    }

private:
    Source& source_;
    const char* failed_field_ = nullptr;
    std::size_t failed_offset_ = 0;
};

} // namespace mxe

#endif // MXE_BYTEREADER_HPP
