/**
 * @file test_source.cpp
 * @brief Unit tests for the gzip byte sources.
 */

#include <catch2/catch_test_macros.hpp>
#include <mxe/source.hpp>

#include "mxe_fixture.hpp"

#include <filesystem>
#include <utility>
#include <vector>

using namespace mxe;
using namespace mxe_test;

static std::vector<std::uint8_t> counting_bytes(std::size_t n) {
    std::vector<std::uint8_t> v(n);
    for (std::size_t i = 0; i < n; ++i) {
        v[i] = static_cast<std::uint8_t>((i * 7U) & 0xFFU);
    }
    return v;
}

TEST_CASE("GzipMemorySource inflates gzip data", "[source]") {
    auto raw = counting_bytes(1000);
    auto gz = gzip(raw);
    REQUIRE_FALSE(gz.empty());

    GzipMemorySource source;
    REQUIRE(source.open(gz.data(), gz.size()) == Error::Ok);
    REQUIRE(source.is_open());

    SECTION("single read") {
        std::vector<std::uint8_t> out(raw.size());
        std::size_t got = 0;
        REQUIRE(source.read(out.data(), out.size(), got) == Error::Ok);
        REQUIRE(got == raw.size());
        REQUIRE(out == raw);
        REQUIRE(source.offset() == raw.size());
    }

    SECTION("small reads track offset") {
        std::uint8_t buf[3];
        std::size_t got = 0;
        REQUIRE(source.read(buf, 3, got) == Error::Ok);
        REQUIRE(got == 3);
        REQUIRE(source.offset() == 3);
        REQUIRE(buf[1] == raw[1]);

        REQUIRE(source.read(buf, 3, got) == Error::Ok);
        REQUIRE(source.offset() == 6);
        REQUIRE(buf[2] == raw[5]);
    }

    SECTION("read past end is short, not an error") {
        std::vector<std::uint8_t> out(raw.size() + 50);
        std::size_t got = 0;
        REQUIRE(source.read(out.data(), out.size(), got) == Error::Ok);
        REQUIRE(got == raw.size());

        REQUIRE(source.read(out.data(), 1, got) == Error::Ok);
        REQUIRE(got == 0);
    }
}

TEST_CASE("GzipMemorySource passes uncompressed data through", "[source]") {
    std::vector<std::uint8_t> raw = {0xAC, 0xED, 0x00, 0x05, 0x77, 0x10};

    GzipMemorySource source;
    REQUIRE(source.open(raw.data(), raw.size()) == Error::Ok);

    std::uint8_t out[8] = {0};
    std::size_t got = 0;
    REQUIRE(source.read(out, sizeof(out), got) == Error::Ok);
    REQUIRE(got == raw.size());
    REQUIRE(out[0] == 0xAC);
    REQUIRE(out[5] == 0x10);
}

TEST_CASE("GzipMemorySource joins concatenated members", "[source]") {
    std::vector<std::uint8_t> first = {1, 2, 3, 4};
    std::vector<std::uint8_t> second = {5, 6, 7};
    auto gz = gzip(first);
    auto gz2 = gzip(second);
    gz.insert(gz.end(), gz2.begin(), gz2.end());

    GzipMemorySource source;
    REQUIRE(source.open(gz.data(), gz.size()) == Error::Ok);

    std::uint8_t out[16] = {0};
    std::size_t got = 0;
    REQUIRE(source.read(out, sizeof(out), got) == Error::Ok);
    REQUIRE(got == 7);
    REQUIRE(out[3] == 4);
    REQUIRE(out[4] == 5);
    REQUIRE(out[6] == 7);
}

TEST_CASE("GzipMemorySource truncated and corrupt input", "[source]") {
    auto raw = counting_bytes(4096);
    auto gz = gzip(raw);

    SECTION("cut-off compressed data gives a short read") {
        std::vector<std::uint8_t> cut(gz.begin(), gz.begin() + static_cast<long>(gz.size() / 2));
        GzipMemorySource source;
        REQUIRE(source.open(cut.data(), cut.size()) == Error::Ok);

        std::vector<std::uint8_t> out(raw.size());
        std::size_t got = 0;
        REQUIRE(source.read(out.data(), out.size(), got) == Error::Ok);
        REQUIRE(got < raw.size());
    }

    SECTION("bad CRC is a corrupt stream") {
        gz[gz.size() - 8] ^= 0xFFU;
        GzipMemorySource source;
        REQUIRE(source.open(gz.data(), gz.size()) == Error::Ok);

        std::vector<std::uint8_t> out(raw.size() + 16);
        std::size_t got = 0;
        REQUIRE(source.read(out.data(), out.size(), got) == Error::CorruptStream);
    }
}

TEST_CASE("GzipMemorySource argument checks", "[source]") {
    GzipMemorySource source;
    REQUIRE(source.open(nullptr, 10) == Error::InvalidArg);
    REQUIRE_FALSE(source.is_open());

    std::uint8_t buf[1];
    std::size_t got = 1;
    REQUIRE(source.read(buf, 1, got) == Error::InvalidArg);
    REQUIRE(got == 0);
}

TEST_CASE("GzipFileSource open", "[source]") {
    GzipFileSource source;

    SECTION("missing file") {
        REQUIRE(source.open("/nonexistent/dir/none.mxe") == Error::NotFound);
        REQUIRE_FALSE(source.is_open());
    }

    SECTION("directory") {
        REQUIRE(source.open(std::filesystem::temp_directory_path().string()) == Error::NotFound);
    }

    SECTION("empty path") {
        REQUIRE(source.open("") == Error::NotFound);
    }
}

TEST_CASE("GzipFileSource reads gzip file", "[source]") {
    auto raw = counting_bytes(5000);
    TempFile file;
    REQUIRE(file.write_gz(raw));

    GzipFileSource source;
    REQUIRE(source.open(file.path()) == Error::Ok);

    std::vector<std::uint8_t> out(raw.size());
    std::size_t got = 0;
    REQUIRE(source.read(out.data(), 100, got) == Error::Ok);
    REQUIRE(got == 100);
    REQUIRE(source.offset() == 100);

    REQUIRE(source.read(out.data() + 100, raw.size() - 100, got) == Error::Ok);
    REQUIRE(got == raw.size() - 100);
    REQUIRE(out == raw);
    REQUIRE(source.offset() == raw.size());

    std::uint8_t scratch[10];
    REQUIRE(source.read(scratch, sizeof(scratch), got) == Error::Ok);
    REQUIRE(got == 0);

    source.close();
    REQUIRE_FALSE(source.is_open());
    source.close();
}

TEST_CASE("GzipFileSource reads uncompressed file", "[source]") {
    std::vector<std::uint8_t> raw = {0xAC, 0xED, 0x00, 0x05};
    TempFile file;
    REQUIRE(file.write_raw(raw));

    GzipFileSource source;
    REQUIRE(source.open(file.path()) == Error::Ok);

    std::uint8_t out[4] = {0};
    std::size_t got = 0;
    REQUIRE(source.read(out, 4, got) == Error::Ok);
    REQUIRE(got == 4);
    REQUIRE(out[1] == 0xED);
}

TEST_CASE("GzipFileSource move", "[source]") {
    std::vector<std::uint8_t> raw = {9, 8, 7};
    TempFile file;
    REQUIRE(file.write_gz(raw));

    GzipFileSource a;
    REQUIRE(a.open(file.path()) == Error::Ok);

    GzipFileSource b(std::move(a));
    REQUIRE(b.is_open());
    REQUIRE_FALSE(a.is_open());

    std::uint8_t out[3] = {0};
    std::size_t got = 0;
    REQUIRE(b.read(out, 3, got) == Error::Ok);
    REQUIRE(got == 3);
    REQUIRE(out[0] == 9);
}
