/**
 * @file grid.cpp
 * @brief RasterGrid queries.
 */

#include <mxe/grid.hpp>

#include <cmath>

namespace mxe {

const std::vector<double>& RasterGrid::empty_values() noexcept {
    static const std::vector<double> empty;
    return empty;
}

bool RasterGrid::is_nodata(double value) const noexcept {
    return std::isnan(value) || value == static_cast<double>(header_.nodata_value);
}

GridStats RasterGrid::stats() const noexcept {
    GridStats stats;
    double sum = 0.0;

    for (double v : data()) {
        if (is_nodata(v)) {
            ++stats.nodata_count;
            continue;
        }
        if (stats.count == 0) {
            stats.min = v;
            stats.max = v;
        } else {
            stats.min = v < stats.min ? v : stats.min;
            stats.max = v > stats.max ? v : stats.max;
        }
        sum += v;
        ++stats.count;
    }

    if (stats.count > 0) {
        stats.mean = sum / static_cast<double>(stats.count);
    }
    return stats;
}

} // namespace mxe
