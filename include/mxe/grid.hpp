/**
 * @file grid.hpp
 * @brief Decoded raster grid.
 */

#ifndef MXE_GRID_HPP
#define MXE_GRID_HPP

#include "config.hpp"
#include "header.hpp"
#include "payload.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace mxe {

/**
 * @brief Summary over the cells that carry data.
 *
 * Cells equal to the no-data value and NaN cells are counted in
 * nodata_count and left out of min, max and mean.
 */
struct GridStats {
    std::size_t count = 0;
    std::size_t nodata_count = 0;
    double min = 0.0;
    double max = 0.0;
    double mean = 0.0;
};

/**
 * @brief Header plus row-major cell values.
 *
 * A grid whose data type tag was not recognised keeps its header but has
 * no data (has_data() is false). Grids are not modified after decoding.
 */
class RasterGrid {
public:
    RasterGrid() = default;

    /// Grid for an unrecognised data type: header only
    explicit RasterGrid(const RasterHeader& header) noexcept
        : header_(header), type_(DataType::Unknown) {}

    /// values is expected to hold rows() x cols() cells; write_ascii_grid
    /// rejects a grid where it does not
    RasterGrid(const RasterHeader& header, DataType type, std::vector<double> values)
        : header_(header), type_(type), values_(std::move(values)) {}

    [[nodiscard]] const RasterHeader& header() const noexcept {
        return header_;
    }

    [[nodiscard]] DataType data_type() const noexcept {
        return type_;
    }

    [[nodiscard]] const char* data_type_label() const noexcept {
        return mxe::data_type_label(type_);
    }

    /// false when the payload was skipped for an unrecognised data type
    [[nodiscard]] bool has_data() const noexcept {
        return values_.has_value();
    }

    /**
     * @brief Cell values in row-major order.
     *
     * Empty when has_data() is false.
     */
    [[nodiscard]] const std::vector<double>& data() const noexcept {
        return values_ ? *values_ : empty_values();
    }

    [[nodiscard]] std::size_t rows() const noexcept {
        return header_.row_count > 0 ? static_cast<std::size_t>(header_.row_count) : 0U;
    }

    [[nodiscard]] std::size_t cols() const noexcept {
        return header_.col_count > 0 ? static_cast<std::size_t>(header_.col_count) : 0U;
    }

    [[nodiscard]] std::size_t size() const noexcept {
        return data().size();
    }

    /**
     * @brief Cell value.
     *
     * Row 0 is the first row in the stream (the northernmost row).
     * Requires has_data(), row < rows() and col < cols().
     */
    [[nodiscard]] double at(std::size_t row, std::size_t col) const noexcept {
        return (*values_)[row * cols() + col];
    }

    [[nodiscard]] bool is_nodata(double value) const noexcept;

    /// x of the right edge
    [[nodiscard]] double x_max() const noexcept {
        return header_.origin_x + static_cast<double>(cols()) * header_.cell_size;
    }

    /// y of the top edge
    [[nodiscard]] double y_max() const noexcept {
        return header_.origin_y + static_cast<double>(rows()) * header_.cell_size;
    }

    [[nodiscard]] double cell_center_x(std::size_t col) const noexcept {
        return header_.origin_x + (static_cast<double>(col) + 0.5) * header_.cell_size;
    }

    [[nodiscard]] double cell_center_y(std::size_t row) const noexcept {
        return y_max() - (static_cast<double>(row) + 0.5) * header_.cell_size;
    }

    [[nodiscard]] GridStats stats() const noexcept;

private:
    static const std::vector<double>& empty_values() noexcept;

    RasterHeader header_{};
    DataType type_ = DataType::Unknown;
    std::optional<std::vector<double>> values_;
};

} // namespace mxe

#endif // MXE_GRID_HPP
