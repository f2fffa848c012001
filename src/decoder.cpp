/**
 * @file decoder.cpp
 * @brief MXE decoding pipeline.
 */

#include <mxe/decoder.hpp>

#include <mxe/bytereader.hpp>
#include <mxe/header.hpp>
#include <mxe/payload.hpp>
#include <mxe/source.hpp>

#include <utility>
#include <vector>

namespace mxe {

void Decoder::reset() noexcept {
    preamble_ = Preamble{};
    magic_mismatch_ = false;
    last_error_ = Error::Ok;
    failed_field_ = "";
    failed_offset_ = 0;
}

Error Decoder::fail(Error error, const char* field, std::size_t offset) noexcept {
    last_error_ = error;
    failed_field_ = field != nullptr ? field : "";
    failed_offset_ = offset;
    return error;
}

Error Decoder::decode_file(const std::string& path, RasterGrid& grid) {
    reset();

    GzipFileSource source;
    Error status = source.open(path);
    if (status != Error::Ok) {
        return fail(status, "file", 0);
    }

    // source closes on scope exit
    return decode_stream(source, grid);
}

Error Decoder::decode_buffer(const std::uint8_t* data, std::size_t size, RasterGrid& grid) {
    reset();

    GzipMemorySource source;
    Error status = source.open(data, size);
    if (status != Error::Ok) {
        return fail(status, "buffer", 0);
    }

    return decode_stream(source, grid);
}

template <typename Source> Error Decoder::decode_stream(Source& source, RasterGrid& grid) {
    ByteReader<Source> reader(source);

    // ========================================================================
    // Stage 1: preamble and block-length filler
    // ========================================================================

    Error status = read_preamble(reader, options_.magic_check, preamble_);
    if (status == Error::UnrecognizedFormat) {
        return fail(status, "preamble", 0);
    }
    if (status != Error::Ok) {
        return fail(status, reader.failed_field(), reader.failed_offset());
    }
    magic_mismatch_ =
        options_.magic_check == MagicCheck::Lenient && !preamble_.has_stream_magic();

    // ========================================================================
    // Stage 2: header fields
    // ========================================================================

    RasterHeader header;
    status = read_header(reader, header);
    if (status != Error::Ok) {
        return fail(status, reader.failed_field(), reader.failed_offset());
    }

    // ========================================================================
    // Stage 3: geometry check, then payload for a known data type
    // ========================================================================

    const DataType type = data_type_from_tag(header.data_type_tag);
    const std::size_t header_end = reader.position();

    std::size_t cells = 0;
    status = cell_count(header, element_width(type), cells);
    if (status != Error::Ok) {
        return fail(status, "dimensions", header_end);
    }

    if (type == DataType::Unknown) {
        grid = RasterGrid(header);
        return Error::Ok;
    }

    std::vector<double> values;
    status = read_payload(reader, type, cells, values);
    if (status == Error::InvalidHeader) {
        return fail(status, "dimensions", header_end);
    }
    if (status != Error::Ok) {
        return fail(status, reader.failed_field(), reader.failed_offset());
    }

    grid = RasterGrid(header, type, std::move(values));
    return Error::Ok;
}

} // namespace mxe
