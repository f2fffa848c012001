/**
 * @file test_preamble.cpp
 * @brief Unit tests for preamble and block-shape framing.
 */

#include <catch2/catch_test_macros.hpp>
#include <mxe/preamble.hpp>

#include "mxe_fixture.hpp"

#include <cstring>

using namespace mxe;
using namespace mxe_test;

TEST_CASE("Block shape dispatch", "[preamble]") {
    BlockShape shape = BlockShape::Long;

    REQUIRE(block_shape_from_discriminator(0x77, shape));
    REQUIRE(shape == BlockShape::Short);
    REQUIRE(filler_width(shape) == 1);

    REQUIRE(block_shape_from_discriminator(0x7A, shape));
    REQUIRE(shape == BlockShape::Long);
    REQUIRE(filler_width(shape) == 4);

    REQUIRE_FALSE(block_shape_from_discriminator(0x73, shape));
    REQUIRE_FALSE(block_shape_from_discriminator(0x00, shape));
}

TEST_CASE("Short block preamble", "[preamble]") {
    MxeBuilder b;
    b.short_block(0x2D).u8(0x40);

    VectorSource source(b.data());
    ByteReader<VectorSource> reader(source);
    Preamble p;

    REQUIRE(read_preamble(reader, MagicCheck::Strict, p) == Error::Ok);
    REQUIRE(p.shape == BlockShape::Short);
    REQUIRE(p.discriminator == 0x77);
    REQUIRE(p.filler == 0x2D);
    REQUIRE(p.has_stream_magic());
    REQUIRE(reader.position() == 6);
}

TEST_CASE("Long block preamble", "[preamble]") {
    SECTION("filler value is kept but not interpreted") {
        for (std::uint32_t filler : {0U, 1024U, 0xFFFFFFFFU}) {
            MxeBuilder b;
            b.long_block(filler);

            VectorSource source(b.data());
            ByteReader<VectorSource> reader(source);
            Preamble p;

            REQUIRE(read_preamble(reader, MagicCheck::Strict, p) == Error::Ok);
            REQUIRE(p.shape == BlockShape::Long);
            REQUIRE(p.filler == filler);
            REQUIRE(reader.position() == 9);
        }
    }
}

TEST_CASE("Unknown block marker", "[preamble]") {
    for (int value = 0; value < 256; ++value) {
        if (value == 0x77 || value == 0x7A) {
            continue;
        }

        MxeBuilder b;
        b.bytes({0xAC, 0xED, 0x00, 0x05, static_cast<std::uint8_t>(value), 1, 2, 3, 4});

        VectorSource source(b.data());
        ByteReader<VectorSource> reader(source);
        Preamble p;

        REQUIRE(read_preamble(reader, MagicCheck::Off, p) == Error::UnrecognizedFormat);
        REQUIRE(reader.position() == 5);
        REQUIRE(p.discriminator == static_cast<std::uint8_t>(value));
    }
}

TEST_CASE("Magic check policy", "[preamble]") {
    MxeBuilder b;
    b.bytes({0xCA, 0xFE, 0x00, 0x05, 0x77, 0x01});

    VectorSource source(b.data());
    ByteReader<VectorSource> reader(source);
    Preamble p;

    SECTION("strict rejects") {
        REQUIRE(read_preamble(reader, MagicCheck::Strict, p) == Error::UnrecognizedFormat);
        REQUIRE_FALSE(p.has_stream_magic());
    }

    SECTION("lenient accepts") {
        REQUIRE(read_preamble(reader, MagicCheck::Lenient, p) == Error::Ok);
        REQUIRE_FALSE(p.has_stream_magic());
        REQUIRE(p.magic[0] == 0xCA);
    }

    SECTION("off accepts") {
        REQUIRE(read_preamble(reader, MagicCheck::Off, p) == Error::Ok);
        REQUIRE(p.shape == BlockShape::Short);
    }
}

TEST_CASE("Truncated preamble", "[preamble]") {
    Preamble p;

    SECTION("fewer than five bytes") {
        MxeBuilder b;
        b.bytes({0xAC, 0xED, 0x00});
        VectorSource source(b.data());
        ByteReader<VectorSource> reader(source);

        REQUIRE(read_preamble(reader, MagicCheck::Lenient, p) == Error::TruncatedStream);
        REQUIRE(std::strcmp(reader.failed_field(), "preamble") == 0);
    }

    SECTION("missing short filler") {
        MxeBuilder b;
        b.bytes({0xAC, 0xED, 0x00, 0x05, 0x77});
        VectorSource source(b.data());
        ByteReader<VectorSource> reader(source);

        REQUIRE(read_preamble(reader, MagicCheck::Lenient, p) == Error::TruncatedStream);
        REQUIRE(std::strcmp(reader.failed_field(), "block length") == 0);
        REQUIRE(reader.failed_offset() == 5);
    }

    SECTION("partial long filler") {
        MxeBuilder b;
        b.bytes({0xAC, 0xED, 0x00, 0x05, 0x7A, 0x00, 0x00});
        VectorSource source(b.data());
        ByteReader<VectorSource> reader(source);

        REQUIRE(read_preamble(reader, MagicCheck::Lenient, p) == Error::TruncatedStream);
        REQUIRE(std::strcmp(reader.failed_field(), "block length") == 0);
    }
}
