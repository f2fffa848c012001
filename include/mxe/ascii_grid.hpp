/**
 * @file ascii_grid.hpp
 * @brief ESRI ASCII grid export.
 *
 * Writes a decoded grid in the plain text raster format MaxEnt also
 * accepts as input:
 *
 *     ncols         3
 *     nrows         2
 *     xllcorner     100
 *     yllcorner     200
 *     cellsize      0.5
 *     NODATA_value  -9999
 *     1 2 3
 *     4 5 6
 */

#ifndef MXE_ASCII_GRID_HPP
#define MXE_ASCII_GRID_HPP

#include "error.hpp"
#include "grid.hpp"

#include <ostream>
#include <string>

namespace mxe {

/**
 * @brief Write a grid as ESRI ASCII.
 *
 * Integer grids are written as integers, float grids with enough digits to
 * round-trip a float32. NaN cells are written as the no-data value.
 *
 * @param grid Grid with data
 * @param out Output stream
 * @return Error::Ok, Error::InvalidArg for a grid without data or whose
 *         data does not hold rows x cols cells, Error::WriteFailed if the
 *         stream goes bad
 */
Error write_ascii_grid(const RasterGrid& grid, std::ostream& out);

/**
 * @brief Write a grid as an ESRI ASCII file.
 *
 * @return Error::Ok, Error::InvalidArg as for the stream overload,
 *         Error::WriteFailed if the file cannot be created or written
 */
Error write_ascii_grid(const RasterGrid& grid, const std::string& path);

} // namespace mxe

#endif // MXE_ASCII_GRID_HPP
