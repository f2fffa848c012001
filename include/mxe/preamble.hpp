/**
 * @file preamble.hpp
 * @brief Stream preamble and block-shape framing.
 *
 * The decompressed stream opens with five bytes from the Java serialization
 * writer:
 *
 * | Bytes | Value       | Meaning                          |
 * |-------|-------------|----------------------------------|
 * | 0-1   | AC ED       | stream magic                     |
 * | 2-3   | 00 05       | serialization version            |
 * | 4     | 77 or 7A    | short or long block-data marker  |
 *
 * A short block is followed by a one-byte length, a long block by a
 * four-byte length. Neither length is used by the raster, but it has to be
 * consumed to land on the first header field.
 */

#ifndef MXE_PREAMBLE_HPP
#define MXE_PREAMBLE_HPP

#include "bytereader.hpp"
#include "config.hpp"
#include "error.hpp"

namespace mxe {

enum class BlockShape : std::uint8_t {
    Short, ///< TC_BLOCKDATA, 1 filler byte
    Long   ///< TC_BLOCKDATALONG, 4 filler bytes
};

/**
 * @brief How strictly the magic and version bytes are checked.
 */
enum class MagicCheck : std::uint8_t {
    Off,     ///< Bytes are not inspected
    Lenient, ///< A mismatch is recorded but decoding continues
    Strict   ///< A mismatch fails with Error::UnrecognizedFormat
};

/**
 * @brief Decoded preamble.
 */
struct Preamble {
    std::uint8_t magic[2] = {0, 0};
    std::uint8_t version[2] = {0, 0};
    std::uint8_t discriminator = 0;
    BlockShape shape = BlockShape::Short;
    std::uint32_t filler = 0; ///< Block length that followed the marker

    [[nodiscard]] bool has_stream_magic() const noexcept {
        return magic[0] == STREAM_MAGIC_0 && magic[1] == STREAM_MAGIC_1 &&
               version[0] == STREAM_VERSION_0 && version[1] == STREAM_VERSION_1;
    }
};

/**
 * @brief Map the block-data marker to a block shape.
 *
 * @param discriminator Byte 4 of the preamble
 * @param[out] shape Shape for a recognised marker
 * @return true if the marker is 0x77 or 0x7A
 */
inline bool block_shape_from_discriminator(std::uint8_t discriminator,
                                           BlockShape& shape) noexcept {
    switch (discriminator) {
    case TC_BLOCKDATA:
        shape = BlockShape::Short;
        return true;
    case TC_BLOCKDATALONG:
        shape = BlockShape::Long;
        return true;
    default:
        return false;
    }
}

/// Number of block-length bytes that follow the marker
inline constexpr std::size_t filler_width(BlockShape shape) noexcept {
    return shape == BlockShape::Long ? LONG_FILLER_BYTES : SHORT_FILLER_BYTES;
}

/**
 * @brief Read the preamble and its block-length filler.
 *
 * On success the reader is positioned on the first header field. An
 * unknown marker stops the read after the fifth byte.
 *
 * @param reader Byte reader at stream start
 * @param check Magic/version policy
 * @param[out] preamble Decoded preamble
 * @return Error::Ok, Error::UnrecognizedFormat or Error::TruncatedStream
 */
template <typename Source>
Error read_preamble(ByteReader<Source>& reader, MagicCheck check, Preamble& preamble) noexcept {
    std::uint8_t bytes[PREAMBLE_BYTES];
    Error status = reader.read_exact(bytes, sizeof(bytes), "preamble");
    if (status != Error::Ok) {
        return status;
    }

    preamble.magic[0] = bytes[0];
    preamble.magic[1] = bytes[1];
    preamble.version[0] = bytes[2];
    preamble.version[1] = bytes[3];
    preamble.discriminator = bytes[4];

    if (check == MagicCheck::Strict && !preamble.has_stream_magic()) {
        return Error::UnrecognizedFormat;
    }

    if (!block_shape_from_discriminator(preamble.discriminator, preamble.shape)) {
        return Error::UnrecognizedFormat;
    }

    std::uint8_t length[LONG_FILLER_BYTES];
    const std::size_t width = filler_width(preamble.shape);
    status = reader.read_exact(length, width, "block length");
    if (status != Error::Ok) {
        return status;
    }

    // big-endian, one or four bytes
    preamble.filler = 0;
    for (std::size_t i = 0; i < width; ++i) {
        preamble.filler = (preamble.filler << 8) | length[i];
    }
    return Error::Ok;
}

} // namespace mxe

#endif // MXE_PREAMBLE_HPP
