/**
 * @file mxe.hpp
 * @brief High-level MXE reading API.
 *
 * Reads the gzip-compressed raster files written by the MaxEnt species
 * distribution modelling application. decode() reports failures through
 * Error codes; read_mxe() throws.
 */

#ifndef MXE_HPP
#define MXE_HPP

#include "ascii_grid.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "grid.hpp"
#include "header.hpp"
#include "payload.hpp"
#include "preamble.hpp"

#include <string>

namespace mxe {

/**
 * @brief Decode an MXE file.
 *
 * @param path File path
 * @param[out] grid Decoded grid, untouched on failure
 * @param options Decoding options
 * @return Error::Ok on success
 */
inline Error decode(const std::string& path, RasterGrid& grid,
                    const DecodeOptions& options = DecodeOptions{}) {
    Decoder decoder(options);
    return decoder.decode_file(path, grid);
}

/**
 * @brief Decode an MXE stream from memory.
 */
inline Error decode_buffer(const std::uint8_t* data, std::size_t size, RasterGrid& grid,
                           const DecodeOptions& options = DecodeOptions{}) {
    Decoder decoder(options);
    return decoder.decode_buffer(data, size, grid);
}

#if !MXE_NO_EXCEPTIONS

/**
 * @brief Decode an MXE file, throwing on failure.
 *
 * @param path File path
 * @param options Decoding options
 * @return Decoded grid (without data for an unrecognised data type)
 * @throws NotFoundException, FormatException, TruncatedStreamException,
 *         InvalidHeaderException, CorruptStreamException, MxeException
 */
inline RasterGrid read_mxe(const std::string& path,
                           const DecodeOptions& options = DecodeOptions{}) {
    Decoder decoder(options);
    RasterGrid grid;
    Error result = decoder.decode_file(path, grid);

    switch (result) {
    case Error::Ok:
        return grid;
    case Error::NotFound:
        throw NotFoundException("Supplied file name (" + path + ") not found");
    case Error::UnrecognizedFormat:
        throw FormatException(path + ": this is not a recognized mxe format");
    case Error::TruncatedStream:
        throw TruncatedStreamException(path + ": stream ended while reading " +
                                           decoder.failed_field() + " at offset " +
                                           std::to_string(decoder.failed_offset()),
                                       decoder.failed_field(), decoder.failed_offset());
    case Error::InvalidHeader:
        throw InvalidHeaderException(path + ": invalid raster dimensions");
    case Error::CorruptStream:
        throw CorruptStreamException(path + ": corrupt gzip data");
    default:
        throw MxeException(path + ": " + error_string(result), result);
    }
}

#endif // !MXE_NO_EXCEPTIONS

/**
 * @brief Get library version.
 * @return Version string
 */
inline const char* version() noexcept {
    return "1.0.0";
}

} // namespace mxe

#endif // MXE_HPP
