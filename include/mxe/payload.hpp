/**
 * @file payload.hpp
 * @brief Cell payload decoding.
 *
 * The data type tag at the end of the header selects the element encoding
 * of the nrows x ncols cells that follow:
 *
 * | Tag | Width | Encoding                     |
 * |-----|-------|------------------------------|
 * | 1   | 4     | big-endian IEEE-754 float32  |
 * | 2   | 1     | signed byte                  |
 * | 3   | 4     | big-endian int32             |
 *
 * Every element is widened to double, which holds all three exactly.
 */

#ifndef MXE_PAYLOAD_HPP
#define MXE_PAYLOAD_HPP

#include "bytereader.hpp"
#include "config.hpp"
#include "error.hpp"

#include <algorithm>
#include <vector>

namespace mxe {

enum class DataType : std::int32_t {
    Unknown = 0,
    Float32 = 1,
    Int8 = 2,
    Int32 = 3
};

inline constexpr DataType data_type_from_tag(std::int32_t tag) noexcept {
    switch (tag) {
    case 1:
        return DataType::Float32;
    case 2:
        return DataType::Int8;
    case 3:
        return DataType::Int32;
    default:
        return DataType::Unknown;
    }
}

inline const char* data_type_label(DataType type) noexcept {
    switch (type) {
    case DataType::Float32:
        return "32-bit float";
    case DataType::Int8:
        return "Signed byte";
    case DataType::Int32:
        return "4-byte integer";
    default:
        return "Unknown";
    }
}

/// Bytes per element on disk, 0 for an unknown type
inline constexpr std::size_t element_width(DataType type) noexcept {
    switch (type) {
    case DataType::Float32:
    case DataType::Int32:
        return 4U;
    case DataType::Int8:
        return 1U;
    default:
        return 0U;
    }
}

/**
 * @brief Widen a run of encoded elements and append them.
 *
 * @param type Element type (not Unknown)
 * @param src Encoded bytes, count * element_width(type) long
 * @param count Number of elements
 * @param out Destination
 */
inline void decode_elements(DataType type, const std::uint8_t* src, std::size_t count,
                            std::vector<double>& out) {
    switch (type) {
    case DataType::Float32:
        for (std::size_t i = 0; i < count; ++i) {
            out.push_back(static_cast<double>(load_be_f32(src + i * 4)));
        }
        break;
    case DataType::Int8:
        for (std::size_t i = 0; i < count; ++i) {
            out.push_back(static_cast<double>(static_cast<std::int8_t>(src[i])));
        }
        break;
    case DataType::Int32:
        for (std::size_t i = 0; i < count; ++i) {
            out.push_back(static_cast<double>(load_be_i32(src + i * 4)));
        }
        break;
    default:
        break;
    }
}

/**
 * @brief Read a full payload of cells.
 *
 * Cells are read in stream order (row-major) in blocks of READ_CHUNK_BYTES.
 * Reservation is capped at MAX_RESERVE_CELLS so that a damaged cell count
 * only costs memory once the stream has actually delivered the bytes.
 *
 * @param reader Byte reader positioned after the header
 * @param type Element type (must not be Unknown)
 * @param cells Number of cells expected
 * @param[out] values Decoded cells; cleared first
 * @return Error::Ok, Error::InvalidArg for an unknown type,
 *         Error::InvalidHeader if the cell count cannot be stored,
 *         Error::TruncatedStream if fewer than cells elements arrive
 */
template <typename Source>
Error read_payload(ByteReader<Source>& reader, DataType type, std::size_t cells,
                   std::vector<double>& values) {
    values.clear();

    const std::size_t width = element_width(type);
    if (width == 0) {
        return Error::InvalidArg;
    }
    if (cells > values.max_size()) {
        return Error::InvalidHeader;
    }

    values.reserve(std::min(cells, MAX_RESERVE_CELLS));

    const std::size_t chunk_elems = READ_CHUNK_BYTES / width;
    std::vector<std::uint8_t> buffer(chunk_elems * width);

    std::size_t remaining = cells;
    while (remaining > 0) {
        std::size_t n = std::min(remaining, chunk_elems);
        Error status = reader.read_exact(buffer.data(), n * width, "payload");
        if (status != Error::Ok) {
            values.clear();
            return status;
        }
        decode_elements(type, buffer.data(), n, values);
        remaining -= n;
    }

    return Error::Ok;
}

} // namespace mxe

#endif // MXE_PAYLOAD_HPP
