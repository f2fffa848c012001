/**
 * @file source.cpp
 * @brief gzip byte sources backed by zlib.
 */

#include <mxe/source.hpp>

#include <algorithm>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

namespace mxe {

namespace {

// zlib counts in unsigned int; larger requests are split.
constexpr std::size_t MAX_ZLIB_CHUNK = 1U << 30;

constexpr std::uint8_t GZIP_ID1 = 0x1FU;
constexpr std::uint8_t GZIP_ID2 = 0x8BU;

// 15 window bits plus 16 selects the gzip wrapper.
constexpr int GZIP_WINDOW_BITS = 15 + 16;

bool starts_gzip_member(const std::uint8_t* p, std::size_t n) noexcept {
    return n >= 2 && p[0] == GZIP_ID1 && p[1] == GZIP_ID2;
}

} // namespace

// ============================================================================
// GzipFileSource
// ============================================================================

GzipFileSource::~GzipFileSource() {
    close();
}

GzipFileSource::GzipFileSource(GzipFileSource&& other) noexcept
    : file_(std::exchange(other.file_, nullptr)), offset_(std::exchange(other.offset_, 0)) {}

GzipFileSource& GzipFileSource::operator=(GzipFileSource&& other) noexcept {
    if (this != &other) {
        close();
        file_ = std::exchange(other.file_, nullptr);
        offset_ = std::exchange(other.offset_, 0);
    }
    return *this;
}

Error GzipFileSource::open(const std::string& path) noexcept {
    close();

    if (path.empty()) {
        return Error::NotFound;
    }

    // gzopen happily opens a directory on POSIX and fails on the first read
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Error::NotFound;
    }

    file_ = gzopen(path.c_str(), "rb");
    if (file_ == nullptr) {
        return Error::NotFound;
    }

    offset_ = 0;
    return Error::Ok;
}

void GzipFileSource::close() noexcept {
    if (file_ != nullptr) {
        gzclose_r(file_);
        file_ = nullptr;
    }
}

Error GzipFileSource::read(std::uint8_t* dst, std::size_t n, std::size_t& got) noexcept {
    got = 0;
    if (file_ == nullptr) {
        return Error::InvalidArg;
    }

    while (got < n) {
        std::size_t want = std::min(n - got, MAX_ZLIB_CHUNK);
        int r = gzread(file_, dst + got, static_cast<unsigned>(want));
        if (r < 0) [[unlikely]] {
            return Error::CorruptStream;
        }
        got += static_cast<std::size_t>(r);
        offset_ += static_cast<std::size_t>(r);
        if (static_cast<std::size_t>(r) < want) {
            break; // end of stream, or a gzip member cut short
        }
    }

    return Error::Ok;
}

// ============================================================================
// GzipMemorySource
// ============================================================================

GzipMemorySource::~GzipMemorySource() {
    close();
}

Error GzipMemorySource::open(const std::uint8_t* data, std::size_t size) noexcept {
    close();

    if (data == nullptr && size != 0) {
        return Error::InvalidArg;
    }

    data_ = data;
    size_ = size;
    raw_pos_ = 0;
    offset_ = 0;
    finished_ = false;
    raw_ = !starts_gzip_member(data, size);

    if (!raw_) {
        strm_ = z_stream{};
        if (inflateInit2(&strm_, GZIP_WINDOW_BITS) != Z_OK) {
            return Error::CorruptStream;
        }
    }

    open_ = true;
    return Error::Ok;
}

void GzipMemorySource::close() noexcept {
    if (open_ && !raw_) {
        inflateEnd(&strm_);
    }
    open_ = false;
}

Error GzipMemorySource::read(std::uint8_t* dst, std::size_t n, std::size_t& got) noexcept {
    got = 0;
    if (!open_) {
        return Error::InvalidArg;
    }

    if (raw_) {
        std::size_t avail = size_ - raw_pos_;
        got = std::min(n, avail);
        if (got > 0) {
            std::memcpy(dst, data_ + raw_pos_, got);
        }
        raw_pos_ += got;
        offset_ += got;
        return Error::Ok;
    }

    Error status = inflate_into(dst, n, got);
    offset_ += got;
    return status;
}

Error GzipMemorySource::inflate_into(std::uint8_t* dst, std::size_t n, std::size_t& got) noexcept {
    auto refill = [this]() {
        if (strm_.avail_in == 0 && raw_pos_ < size_) {
            std::size_t chunk = std::min(size_ - raw_pos_, MAX_ZLIB_CHUNK);
            strm_.next_in = const_cast<Bytef*>(reinterpret_cast<const Bytef*>(data_ + raw_pos_));
            strm_.avail_in = static_cast<uInt>(chunk);
            raw_pos_ += chunk;
        }
    };

    while (got < n && !finished_) {
        refill();

        std::size_t want = std::min(n - got, MAX_ZLIB_CHUNK);
        strm_.next_out = reinterpret_cast<Bytef*>(dst + got);
        strm_.avail_out = static_cast<uInt>(want);

        int ret = inflate(&strm_, Z_NO_FLUSH);
        got += want - strm_.avail_out;

        if (ret == Z_STREAM_END) {
            // A further member continues the same logical stream
            refill();
            if (starts_gzip_member(strm_.next_in, strm_.avail_in)) {
                if (inflateReset(&strm_) != Z_OK) {
                    return Error::CorruptStream;
                }
            } else {
                finished_ = true;
            }
        } else if (ret == Z_BUF_ERROR) {
            // Input exhausted inside a member
            finished_ = true;
        } else if (ret != Z_OK) [[unlikely]] {
            return Error::CorruptStream;
        }
    }

    return Error::Ok;
}

} // namespace mxe
