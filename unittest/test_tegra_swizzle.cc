//
// Created by bffnt_kit contributors on 13/10/2026.
//
// Unit tests for block-linear tiling
//

#include <doctest/doctest.h>
#include <bffnt/texture/tegra_swizzle.hh>
#include <bffnt/errors.hh>
#include <algorithm>
#include <vector>

using namespace bffnt;

namespace {
    std::vector<std::uint8_t> pattern(std::size_t n) {
        std::vector<std::uint8_t> out(n);
        for (std::size_t i = 0; i < n; ++i) {
            out[i] = static_cast<std::uint8_t>((i * 31 + i / 251) & 0xFF);
        }
        return out;
    }
}

TEST_SUITE("tegra_swizzle") {

    TEST_CASE("gob block height") {
        CHECK(gob_block_height(1) == 1);
        CHECK(gob_block_height(8) == 1);
        CHECK(gob_block_height(9) == 2);
        CHECK(gob_block_height(24) == 4);
        CHECK(gob_block_height(64) == 8);
        CHECK(gob_block_height(128) == 16);
        CHECK(gob_block_height(4096) == 16);

        CHECK(gob_block_height_log2(1) == 0);
        CHECK(gob_block_height_log2(9) == 1);
        CHECK(gob_block_height_log2(64) == 3);
        CHECK(gob_block_height_log2(1000) == 4);
    }

    TEST_CASE("address of the first GOB") {
        // Inside one GOB: 64 byte rows split into 32/16 byte columns
        CHECK(block_linear_address(0, 0, 4, 16, 1) == 0);
        CHECK(block_linear_address(1, 0, 4, 16, 1) == 32);
        CHECK(block_linear_address(0, 1, 4, 16, 1) == 16);
        CHECK(block_linear_address(2, 0, 4, 16, 1) == 256);
        CHECK(block_linear_address(0, 2, 4, 16, 1) == 64);
    }

    TEST_CASE("next GOB row of a block") {
        // Block height 2: row 8 is the second GOB of the first column
        CHECK(block_linear_address(0, 8, 4, 16, 2) == 512);
        // Block height 1: row 8 starts the second GOB row
        CHECK(block_linear_address(0, 8, 4, 16, 1) == 512);
        // Two GOBs wide, block height 1
        CHECK(block_linear_address(0, 8, 8, 16, 1) == 1024);
    }

    TEST_CASE("swizzled size covers whole GOBs") {
        const surface_layout bc4_8x8{8, 8, 4, 4, 8};
        CHECK(bc4_8x8.width_in_blocks() == 2);
        CHECK(bc4_8x8.height_in_blocks() == 2);
        CHECK(bc4_8x8.linear_size() == 32);
        CHECK(swizzled_size(bc4_8x8) == 512);

        const surface_layout bc4_256{256, 256, 4, 4, 8};
        CHECK(swizzled_size(bc4_256) == 256u / 4 * 256 / 4 * 8);
    }

    TEST_CASE("zero dimensions are rejected") {
        const surface_layout empty{0, 8, 4, 4, 8};
        CHECK_THROWS_AS((void)empty.width_in_blocks(), geometry_error);
        CHECK_THROWS_AS((void)swizzled_size(empty), geometry_error);

        const std::vector<std::uint8_t> none;
        CHECK_THROWS_AS((void)swizzle_block_linear(empty, none), geometry_error);
    }

    TEST_CASE("deswizzle undoes swizzle") {
        for (const std::uint32_t bpb : {1u, 2u, 4u, 8u, 16u}) {
            for (const std::uint32_t w : {1u, 3u, 16u, 33u, 128u}) {
                for (const std::uint32_t h : {1u, 7u, 8u, 40u, 130u}) {
                    CAPTURE(bpb);
                    CAPTURE(w);
                    CAPTURE(h);
                    const surface_layout layout{w, h, 1, 1, bpb};
                    const auto linear = pattern(layout.linear_size());

                    const auto tiled = swizzle_block_linear(layout, linear);
                    CHECK(tiled.size() == swizzled_size(layout));
                    CHECK(deswizzle_block_linear(layout, tiled) == linear);
                }
            }
        }
    }

    TEST_CASE("short tiled input leaves missing blocks zero") {
        const surface_layout layout{16, 16, 4, 4, 8};
        const auto linear = pattern(layout.linear_size());
        auto tiled = swizzle_block_linear(layout, linear);
        tiled.resize(8);

        const auto back = deswizzle_block_linear(layout, tiled);
        REQUIRE(back.size() == linear.size());
        CHECK(std::equal(back.begin(), back.begin() + 8, linear.begin()));
        CHECK(std::all_of(back.begin() + 8, back.end(), [](std::uint8_t b) { return b == 0; }));
    }
}
