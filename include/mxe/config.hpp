/**
 * @file config.hpp
 * @brief MXE reader compile-time configuration.
 *
 * Format constants for the gzip-wrapped Java data stream written by the
 * MaxEnt modelling application, plus the tunables of the decoder.
 */

#ifndef MXE_CONFIG_HPP
#define MXE_CONFIG_HPP

#include <cstddef>
#include <cstdint>

namespace mxe {

/**
 * @defgroup version Version Information
 * @{
 */
inline constexpr int VERSION_MAJOR = 1;
inline constexpr int VERSION_MINOR = 0;
inline constexpr int VERSION_PATCH = 0;
/** @} */

/**
 * @defgroup format Stream Format Constants
 * @{
 */

/// Java serialization stream magic (bytes 0-1 of the preamble)
inline constexpr std::uint8_t STREAM_MAGIC_0 = 0xACU;
inline constexpr std::uint8_t STREAM_MAGIC_1 = 0xEDU;

/// Java serialization stream version (bytes 2-3 of the preamble)
inline constexpr std::uint8_t STREAM_VERSION_0 = 0x00U;
inline constexpr std::uint8_t STREAM_VERSION_1 = 0x05U;

/// Block-data discriminators (byte 4 of the preamble)
inline constexpr std::uint8_t TC_BLOCKDATA = 0x77U;
inline constexpr std::uint8_t TC_BLOCKDATALONG = 0x7AU;

inline constexpr std::size_t PREAMBLE_BYTES = 5U;
inline constexpr std::size_t SHORT_FILLER_BYTES = 1U;
inline constexpr std::size_t LONG_FILLER_BYTES = 4U;

/// Three doubles and four 32-bit integers
inline constexpr std::size_t HEADER_BYTES = (3U * 8U) + (4U * 4U);

/** @} */

/**
 * @defgroup config Decoder Tunables
 * @{
 */

/// Bytes pulled from the stream per payload read
#ifndef MXE_READ_CHUNK_BYTES
#define MXE_READ_CHUNK_BYTES 65536U
#endif

/// Upper bound on cells reserved before any payload byte has been read
#ifndef MXE_MAX_RESERVE_CELLS
#define MXE_MAX_RESERVE_CELLS (4U * 1024U * 1024U)
#endif

inline constexpr std::size_t READ_CHUNK_BYTES = MXE_READ_CHUNK_BYTES;
inline constexpr std::size_t MAX_RESERVE_CELLS = MXE_MAX_RESERVE_CELLS;

static_assert(READ_CHUNK_BYTES >= 4U, "MXE_READ_CHUNK_BYTES must hold one 4-byte element");

/** @} */

/**
 * @defgroup exceptions Exception Configuration
 *
 * Define MXE_NO_EXCEPTIONS=1 to build the error-code API only.
 * @{
 */
#ifndef MXE_NO_EXCEPTIONS
#define MXE_NO_EXCEPTIONS 0
#endif
/** @} */

} // namespace mxe

#endif // MXE_CONFIG_HPP
