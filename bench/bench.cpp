/**
 * @file bench.cpp
 * @brief Decoding throughput benchmarks.
 *
 * Builds synthetic MXE streams in memory (one per data type) and decodes
 * them repeatedly. Use for relative comparisons between builds.
 *
 * Usage:
 *   ./build/mxe_bench              # Run with default 20 iterations
 *   ./build/mxe_bench 100          # Run with custom iteration count
 */

#include <mxe/mxe.hpp>

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <vector>

#include <zlib.h>

using namespace mxe;

static constexpr int DEFAULT_ITERATIONS = 20;
static constexpr std::int32_t BENCH_ROWS = 1024;
static constexpr std::int32_t BENCH_COLS = 1024;

static void put_be32(std::vector<std::uint8_t>& out, std::uint32_t v) {
    out.push_back(static_cast<std::uint8_t>(v >> 24));
    out.push_back(static_cast<std::uint8_t>(v >> 16));
    out.push_back(static_cast<std::uint8_t>(v >> 8));
    out.push_back(static_cast<std::uint8_t>(v));
}

static void put_be64(std::vector<std::uint8_t>& out, double d) {
    std::uint64_t v;
    std::memcpy(&v, &d, sizeof(v));
    put_be32(out, static_cast<std::uint32_t>(v >> 32));
    put_be32(out, static_cast<std::uint32_t>(v));
}

static std::vector<std::uint8_t> make_stream(std::int32_t tag) {
    std::vector<std::uint8_t> raw = {0xAC, 0xED, 0x00, 0x05, 0x7A};
    put_be32(raw, 1024);
    put_be64(raw, 150.0);
    put_be64(raw, -40.0);
    put_be64(raw, 0.01);
    put_be32(raw, static_cast<std::uint32_t>(BENCH_ROWS));
    put_be32(raw, static_cast<std::uint32_t>(BENCH_COLS));
    put_be32(raw, static_cast<std::uint32_t>(-9999));
    put_be32(raw, static_cast<std::uint32_t>(tag));

    std::size_t cells = static_cast<std::size_t>(BENCH_ROWS) * BENCH_COLS;
    for (std::size_t i = 0; i < cells; ++i) {
        if (tag == 2) {
            raw.push_back(static_cast<std::uint8_t>(i % 251));
        } else if (tag == 1) {
            float f = static_cast<float>(i % 1000) * 0.25F;
            std::uint32_t bits;
            std::memcpy(&bits, &f, sizeof(bits));
            put_be32(raw, bits);
        } else {
            put_be32(raw, static_cast<std::uint32_t>(i));
        }
    }

    // gzip wrapper, as written by java.util.zip.GZIPOutputStream
    z_stream strm{};
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, 15 + 16, 8,
                     Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }
    std::vector<std::uint8_t> out(deflateBound(&strm, static_cast<uLong>(raw.size())));
    strm.next_in = raw.data();
    strm.avail_in = static_cast<uInt>(raw.size());
    strm.next_out = out.data();
    strm.avail_out = static_cast<uInt>(out.size());
    int ret = deflate(&strm, Z_FINISH);
    out.resize(strm.total_out);
    deflateEnd(&strm);
    return ret == Z_STREAM_END ? out : std::vector<std::uint8_t>{};
}

static void bench_decode(const char* name, std::int32_t tag, int iterations) {
    std::vector<std::uint8_t> input = make_stream(tag);
    if (input.empty()) {
        std::printf("%-20s SKIP (could not build stream)\n", name);
        return;
    }

    Decoder decoder;
    RasterGrid grid;

    // Warmup run
    if (decoder.decode_buffer(input.data(), input.size(), grid) != Error::Ok) {
        std::printf("%-20s FAIL (%s)\n", name, error_string(decoder.last_error()));
        return;
    }

    auto start = std::chrono::high_resolution_clock::now();

    for (int i = 0; i < iterations; i++) {
        decoder.decode_buffer(input.data(), input.size(), grid);
    }

    auto end = std::chrono::high_resolution_clock::now();

    double total_ms = std::chrono::duration<double, std::milli>(end - start).count();
    double per_iter_ms = total_ms / static_cast<double>(iterations);
    double cells_per_s = static_cast<double>(grid.size()) * 1000.0 / per_iter_ms;

    std::printf("%-20s %8.2f ms/iter  %8.1f Mcells/s  (%zu bytes gzip)\n", name, per_iter_ms,
                cells_per_s / 1.0e6, input.size());
}

int main(int argc, char* argv[]) {
    int iterations = DEFAULT_ITERATIONS;

    if (argc >= 2) {
        iterations = std::atoi(argv[1]);
        if (iterations <= 0) {
            iterations = DEFAULT_ITERATIONS;
        }
    }

    std::printf("MXE Decoding Benchmarks\n");
    std::printf("=======================\n");
    std::printf("Iterations: %d\n", iterations);
    std::printf("Grid: %d x %d cells\n\n", BENCH_ROWS, BENCH_COLS);

    bench_decode("32-bit float", 1, iterations);
    bench_decode("signed byte", 2, iterations);
    bench_decode("4-byte integer", 3, iterations);

    return 0;
}
