/**
 * @file ascii_grid.cpp
 * @brief ESRI ASCII grid export.
 */

#include <mxe/ascii_grid.hpp>

#include <cmath>
#include <fstream>
#include <ios>
#include <limits>

namespace mxe {

namespace {

void write_cell(std::ostream& out, const RasterGrid& grid, double value) {
    if (std::isnan(value)) {
        out << grid.header().nodata_value;
    } else if (grid.data_type() == DataType::Float32) {
        out << value;
    } else {
        out << static_cast<long long>(value);
    }
}

// Every row is written in full, so the data must cover rows x cols
bool exportable(const RasterGrid& grid) noexcept {
    return grid.has_data() && grid.size() == grid.rows() * grid.cols();
}

} // namespace

Error write_ascii_grid(const RasterGrid& grid, std::ostream& out) {
    if (!exportable(grid)) {
        return Error::InvalidArg;
    }

    const RasterHeader& h = grid.header();
    const auto saved_flags = out.flags();
    const auto saved_precision = out.precision();

    // float32 needs 9 significant digits, the double origin 17
    out.unsetf(std::ios::floatfield);
    out.precision(std::numeric_limits<double>::max_digits10);
    out << "ncols         " << h.col_count << '\n';
    out << "nrows         " << h.row_count << '\n';
    out << "xllcorner     " << h.origin_x << '\n';
    out << "yllcorner     " << h.origin_y << '\n';
    out << "cellsize      " << h.cell_size << '\n';
    out << "NODATA_value  " << h.nodata_value << '\n';

    out.precision(std::numeric_limits<float>::max_digits10);
    const std::size_t rows = grid.rows();
    const std::size_t cols = grid.cols();
    for (std::size_t r = 0; r < rows; ++r) {
        for (std::size_t c = 0; c < cols; ++c) {
            if (c > 0) {
                out << ' ';
            }
            write_cell(out, grid, grid.at(r, c));
        }
        out << '\n';
    }

    out.flags(saved_flags);
    out.precision(saved_precision);
    return out ? Error::Ok : Error::WriteFailed;
}

Error write_ascii_grid(const RasterGrid& grid, const std::string& path) {
    if (!exportable(grid)) {
        return Error::InvalidArg;
    }

    std::ofstream file(path);
    if (!file) {
        return Error::WriteFailed;
    }

    Error status = write_ascii_grid(grid, file);
    file.flush();
    if (status == Error::Ok && !file.good()) {
        status = Error::WriteFailed;
    }
    return status;
}

} // namespace mxe
