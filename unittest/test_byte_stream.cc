//
// Created by bffnt_kit contributors on 13/10/2026.
//
// Unit tests for byte_reader / byte_writer
//

#include <doctest/doctest.h>
#include <bffnt/utils/byte_stream.hh>
#include <bffnt/errors.hh>
#include <vector>

using namespace bffnt;

TEST_SUITE("byte_stream") {

    TEST_CASE("reader honours byte order") {
        const std::vector<std::uint8_t> data = {0x12, 0x34, 0x56, 0x78};

        byte_reader le(data, byte_order::little);
        CHECK(le.read_u32() == 0x78563412u);

        byte_reader be(data, byte_order::big);
        CHECK(be.read_u16() == 0x1234);
        CHECK(be.read_u16() == 0x5678);
    }

    TEST_CASE("signed reads sign-extend") {
        const std::vector<std::uint8_t> data = {0xFF, 0xFE, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF};
        byte_reader r(data, byte_order::little);
        CHECK(r.read_s8() == -1);
        CHECK(r.read_s16() == -2);
        CHECK(r.read_s64() == -1);
    }

    TEST_CASE("read_u16_be ignores current order") {
        const std::vector<std::uint8_t> data = {0xFF, 0xFE};
        byte_reader r(data, byte_order::little);
        CHECK(r.read_u16_be() == 0xFFFE);
    }

    TEST_CASE("tags") {
        const std::vector<std::uint8_t> data = {'C', 'W', 'D', 'H', 0};
        byte_reader r(data);
        CHECK(r.peek_tag("CWDH"));
        CHECK_FALSE(r.peek_tag("CMAP"));
        CHECK(r.tell() == 0);
        CHECK(r.read_tag() == "CWDH");
        CHECK(r.remaining() == 1);
        CHECK_FALSE(r.peek_tag("CWDH"));
    }

    TEST_CASE("reading past the end throws truncation_error") {
        const std::vector<std::uint8_t> data = {1, 2, 3};
        byte_reader r(data);
        r.skip(2);
        CHECK_THROWS_AS((void)r.read_u16(), truncation_error);
        CHECK(r.tell() == 2);
        CHECK_THROWS_AS(r.seek(4), truncation_error);
        CHECK_NOTHROW(r.seek(3));
        CHECK_THROWS_AS((void)r.read_bytes(1), truncation_error);
    }

    TEST_CASE("writer emits both byte orders") {
        byte_writer le(byte_order::little);
        le.write_u32(0x11223344);
        le.write_u16_be(0xFEFF);
        CHECK(le.data() == std::vector<std::uint8_t>{0x44, 0x33, 0x22, 0x11, 0xFE, 0xFF});

        byte_writer be(byte_order::big);
        be.write_u16(0xABCD);
        be.write_s8(-1);
        CHECK(be.data() == std::vector<std::uint8_t>{0xAB, 0xCD, 0xFF});
    }

    TEST_CASE("align pads with zeros") {
        byte_writer w;
        w.write_u8(7);
        w.align(4);
        CHECK(w.size() == 4);
        w.align(4);
        CHECK(w.size() == 4);
        w.write_tag("KRNG");
        w.align(0x10);
        CHECK(w.size() == 0x10);
        CHECK(w.data()[1] == 0);
        CHECK(w.data()[8] == 0);
    }

    TEST_CASE("patch_u32 overwrites without moving the cursor") {
        byte_writer w(byte_order::big);
        w.write_u32(0);
        w.write_u32(0xDEADBEEF);
        w.patch_u32(0, 0x01020304);
        CHECK(w.tell() == 8);
        CHECK(w.data()[0] == 1);
        CHECK(w.data()[3] == 4);
        CHECK(w.data()[4] == 0xDE);
    }

    TEST_CASE("seek and overwrite inside written data") {
        byte_writer w;
        w.write_zeros(8);
        w.seek(2);
        w.write_u16(0xBEEF);
        CHECK(w.size() == 8);
        CHECK(w.data()[2] == 0xEF);
        CHECK(w.data()[3] == 0xBE);

        auto bytes = std::move(w).release();
        CHECK(bytes.size() == 8);
    }

    TEST_CASE("align_up") {
        CHECK(align_up(0, 4) == 0);
        CHECK(align_up(1, 4) == 4);
        CHECK(align_up(0x54, 0x1000) == 0x1000);
        CHECK(align_up(0x1000, 0x1000) == 0x1000);
    }
}
