/**
 * @file cli.cpp
 * @brief mxeinfo command line interface.
 *
 * Prints the header of a MaxEnt .mxe raster and optionally converts it to
 * an ESRI ASCII grid.
 */

#include <mxe/mxe.hpp>

#include <cstdio>
#include <cstring>
#include <string>

using namespace mxe;

static void print_version() {
    std::printf("mxeinfo %s\n", version());
}

static void print_help(const char* prog_name) {
    std::printf("MaxEnt MXE raster reader (v%s)\n", version());
    std::printf("=================================\n\n");
    std::printf("Usage:\n");
    std::printf("  %s [--strict] <input.mxe>\n", prog_name);
    std::printf("  %s [--strict] -a <output.asc> <input.mxe>\n\n", prog_name);
    std::printf("Options:\n");
    std::printf("  -a <file>      Also write the grid as an ESRI ASCII grid\n");
    std::printf("  --strict       Reject streams without the AC ED 00 05 preamble\n");
    std::printf("  -h, --help     Show this help message\n");
    std::printf("  -v, --version  Show version information\n\n");
    std::printf("Examples:\n");
    std::printf("  %s bio1.mxe\n", prog_name);
    std::printf("  %s -a bio1.asc bio1.mxe\n\n", prog_name);
}

static const char* shape_name(BlockShape shape) {
    return shape == BlockShape::Long ? "long" : "short";
}

static void print_grid(const char* input_path, const Decoder& decoder, const RasterGrid& grid) {
    const RasterHeader& h = grid.header();
    std::printf("File:        %s\n", input_path);
    std::printf("Block:       %s (length %u)\n", shape_name(decoder.preamble().shape),
                decoder.preamble().filler);
    std::printf("xll:         %.10g\n", h.origin_x);
    std::printf("yll:         %.10g\n", h.origin_y);
    std::printf("cellsize:    %.10g\n", h.cell_size);
    std::printf("nrows:       %d\n", h.row_count);
    std::printf("ncols:       %d\n", h.col_count);
    std::printf("nodata:      %d\n", h.nodata_value);
    std::printf("Data type:   %s (tag %d)\n", grid.data_type_label(), h.data_type_tag);

    if (!grid.has_data()) {
        return;
    }

    GridStats stats = grid.stats();
    std::printf("Extent:      %.10g %.10g %.10g %.10g\n", h.origin_x, h.origin_y, grid.x_max(),
                grid.y_max());
    std::printf("Cells:       %zu (%zu with data, %zu nodata)\n", grid.size(), stats.count,
                stats.nodata_count);
    if (stats.count > 0) {
        std::printf("Range:       %.9g .. %.9g (mean %.9g)\n", stats.min, stats.max, stats.mean);
    }
}

int main(int argc, char** argv) {
    DecodeOptions options;
    const char* asc_path = nullptr;
    const char* input_path = nullptr;

    if (argc < 2) {
        print_help(argv[0]);
        return 1;
    }

    for (int i = 1; i < argc; ++i) {
        if (std::strcmp(argv[i], "-h") == 0 || std::strcmp(argv[i], "--help") == 0) {
            print_help(argv[0]);
            return 0;
        }
        if (std::strcmp(argv[i], "-v") == 0 || std::strcmp(argv[i], "--version") == 0) {
            print_version();
            return 0;
        }
        if (std::strcmp(argv[i], "--strict") == 0) {
            options.magic_check = MagicCheck::Strict;
        } else if (std::strcmp(argv[i], "-a") == 0) {
            if (i + 1 >= argc) {
                std::fprintf(stderr, "Error: -a requires an output file\n");
                return 1;
            }
            asc_path = argv[++i];
        } else if (input_path == nullptr) {
            input_path = argv[i];
        } else {
            std::fprintf(stderr, "Error: Unexpected argument: %s\n", argv[i]);
            std::fprintf(stderr, "Usage: %s [--strict] [-a <output.asc>] <input.mxe>\n", argv[0]);
            return 1;
        }
    }

    if (input_path == nullptr) {
        std::fprintf(stderr, "Error: No input file given\n");
        return 1;
    }

    Decoder decoder(options);
    RasterGrid grid;
    Error result = decoder.decode_file(input_path, grid);

    if (result != Error::Ok) {
        if (result == Error::TruncatedStream) {
            std::fprintf(stderr, "Error: %s: %s while reading %s at offset %zu\n", input_path,
                         error_string(result), decoder.failed_field(), decoder.failed_offset());
        } else {
            std::fprintf(stderr, "Error: %s: %s\n", input_path, error_string(result));
        }
        return 1;
    }

    if (decoder.magic_mismatch()) {
        const Preamble& p = decoder.preamble();
        std::fprintf(stderr, "Warning: unexpected stream header %02x %02x %02x %02x\n",
                     p.magic[0], p.magic[1], p.version[0], p.version[1]);
    }

    print_grid(input_path, decoder, grid);

    if (!grid.has_data()) {
        std::fprintf(stderr, "Warning: data type tag %d is not supported, no cells read\n",
                     grid.header().data_type_tag);
        if (asc_path != nullptr) {
            std::fprintf(stderr, "Error: Cannot write %s without cell data\n", asc_path);
            return 1;
        }
        return 0;
    }

    if (asc_path != nullptr) {
        if (write_ascii_grid(grid, std::string(asc_path)) != Error::Ok) {
            std::fprintf(stderr, "Error: Cannot write output file: %s\n", asc_path);
            return 1;
        }
        std::printf("Output:      %s\n", asc_path);
    }

    return 0;
}
