/**
 * @file header.hpp
 * @brief Raster header fields.
 *
 * After the preamble the stream carries seven big-endian scalars in a fixed
 * order:
 *
 * | Field         | Encoding | Meaning                              |
 * |---------------|----------|--------------------------------------|
 * | xll           | float64  | x of the lower-left edge             |
 * | yll           | float64  | y of the lower-left edge             |
 * | cellsize      | float64  | side length of a square cell         |
 * | nrows         | int32    | number of rows                       |
 * | ncols         | int32    | number of columns                    |
 * | nodata        | int32    | value marking a cell without data    |
 * | data type     | int32    | payload element type (1, 2 or 3)     |
 */

#ifndef MXE_HEADER_HPP
#define MXE_HEADER_HPP

#include "bytereader.hpp"
#include "config.hpp"
#include "error.hpp"

#include <cstddef>
#include <limits>

namespace mxe {

struct RasterHeader {
    double origin_x = 0.0;
    double origin_y = 0.0;
    double cell_size = 0.0;
    std::int32_t row_count = 0;
    std::int32_t col_count = 0;
    std::int32_t nodata_value = 0;
    std::int32_t data_type_tag = 0;
};

inline bool operator==(const RasterHeader& a, const RasterHeader& b) noexcept {
    return a.origin_x == b.origin_x && a.origin_y == b.origin_y && a.cell_size == b.cell_size &&
           a.row_count == b.row_count && a.col_count == b.col_count &&
           a.nodata_value == b.nodata_value && a.data_type_tag == b.data_type_tag;
}

/**
 * @brief Read the seven header fields in stream order.
 *
 * A short read names the field that was cut off.
 *
 * @param reader Byte reader positioned after the preamble
 * @param[out] header Header fields
 * @return Error::Ok or the first failing read's error
 */
template <typename Source>
Error read_header(ByteReader<Source>& reader, RasterHeader& header) noexcept {
    Error status = reader.read_be_f64(header.origin_x, "xll");
    if (status == Error::Ok) {
        status = reader.read_be_f64(header.origin_y, "yll");
    }
    if (status == Error::Ok) {
        status = reader.read_be_f64(header.cell_size, "cellsize");
    }
    if (status == Error::Ok) {
        status = reader.read_be_i32(header.row_count, "nrows");
    }
    if (status == Error::Ok) {
        status = reader.read_be_i32(header.col_count, "ncols");
    }
    if (status == Error::Ok) {
        status = reader.read_be_i32(header.nodata_value, "nodata");
    }
    if (status == Error::Ok) {
        status = reader.read_be_i32(header.data_type_tag, "data type");
    }
    return status;
}

/**
 * @brief Number of cells described by a header.
 *
 * Rejects negative dimensions, any count whose byte size at the given
 * element width would not fit in std::size_t, and any count too large to
 * hold as an array of doubles.
 *
 * @param header Raster header
 * @param element_width Bytes per cell (1 if unknown)
 * @param[out] cells rows x cols
 * @return Error::Ok or Error::InvalidHeader
 */
inline Error cell_count(const RasterHeader& header, std::size_t element_width,
                        std::size_t& cells) noexcept {
    if (header.row_count < 0 || header.col_count < 0) {
        return Error::InvalidHeader;
    }

    constexpr std::size_t SIZE_LIMIT = std::numeric_limits<std::size_t>::max();
    auto rows = static_cast<std::size_t>(header.row_count);
    auto cols = static_cast<std::size_t>(header.col_count);
    std::size_t width = element_width == 0 ? 1 : element_width;

    if (cols != 0 && rows > SIZE_LIMIT / cols) {
        return Error::InvalidHeader;
    }
    std::size_t count = rows * cols;
    if (count > SIZE_LIMIT / width) {
        return Error::InvalidHeader;
    }

    // The widened cells must also be addressable as one array of doubles
    constexpr auto CELL_LIMIT =
        static_cast<std::size_t>(std::numeric_limits<std::ptrdiff_t>::max()) / sizeof(double);
    if (count > CELL_LIMIT) {
        return Error::InvalidHeader;
    }

    cells = count;
    return Error::Ok;
}

} // namespace mxe

#endif // MXE_HEADER_HPP
