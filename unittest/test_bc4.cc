//
// Created by bffnt_kit contributors on 13/10/2026.
//
// Unit tests for the BC4 block codec
//

#include <doctest/doctest.h>
#include <bffnt/texture/bc4.hh>
#include <bffnt/errors.hh>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>
#include <vector>

using namespace bffnt;

TEST_SUITE("bc4") {

    TEST_CASE("eight entry palette") {
        const auto p = bc4_palette(200, 100);
        CHECK(p[0] == 200);
        CHECK(p[1] == 100);
        CHECK(p[2] == 185);   // (6*200 + 100) / 7
        CHECK(p[7] == 114);   // (200 + 6*100) / 7
    }

    TEST_CASE("six entry palette with fixed black and white") {
        const auto p = bc4_palette(10, 20);
        CHECK(p[0] == 10);
        CHECK(p[1] == 20);
        CHECK(p[2] == 12);    // (4*10 + 20) / 5
        CHECK(p[5] == 18);    // (10 + 4*20) / 5
        CHECK(p[6] == 0);
        CHECK(p[7] == 255);
    }

    TEST_CASE("decode reads 3-bit little endian indices") {
        // texel 0 -> index 1, texel 1 -> index 7, rest 0
        bc4_block block{255, 0, 0, 0, 0, 0, 0, 0};
        block[2] = 0x01 | (0x07 << 3);
        const auto texels = bc4_decode_block(block);
        CHECK(texels[0] == 0);
        CHECK(texels[1] == bc4_palette(255, 0)[7]);
        CHECK(texels[2] == 255);
        CHECK(texels[15] == 255);
    }

    TEST_CASE("flat block round-trips exactly") {
        for (const int v : {0, 1, 77, 128, 255}) {
            bc4_texels texels;
            texels.fill(static_cast<std::uint8_t>(v));
            const auto block = bc4_encode_block(texels);
            CHECK(block[0] == v);
            CHECK(block[1] == v);
            CHECK(bc4_decode_block(block) == texels);
        }
    }

    TEST_CASE("two level block round-trips exactly") {
        bc4_texels texels{};
        for (std::size_t i = 0; i < texels.size(); ++i) {
            texels[i] = (i % 3 == 0) ? 255 : 0;
        }
        CHECK(bc4_decode_block(bc4_encode_block(texels)) == texels);
    }

    TEST_CASE("gradient stays within the quantization error") {
        const std::vector<std::pair<int, int>> ranges = {{0, 255}, {30, 60}, {100, 107}, {250, 255}};
        for (const auto& [lo, hi] : ranges) {
            CAPTURE(lo);
            CAPTURE(hi);
            bc4_texels texels{};
            for (std::size_t i = 0; i < texels.size(); ++i) {
                texels[i] = static_cast<std::uint8_t>(lo + (hi - lo) * static_cast<int>(i) / 15);
            }
            const auto decoded = bc4_decode_block(bc4_encode_block(texels));
            const int bound = (hi - lo) / 14 + 1;
            for (std::size_t i = 0; i < texels.size(); ++i) {
                CHECK(std::abs(static_cast<int>(decoded[i]) - texels[i]) <= bound);
            }
        }
    }

    TEST_CASE("image encode pads partial blocks") {
        const std::uint32_t w = 6;
        const std::uint32_t h = 5;
        std::vector<std::uint8_t> values(w * h, 200);

        const auto encoded = bc4_encode_image(values, w, h);
        CHECK(encoded.size() == 2 * 2 * bc4_block_size);
        CHECK(bc4_decode_image(encoded, w, h) == std::vector<std::uint8_t>(w * h, 200));
    }

    TEST_CASE("image decode tolerates missing blocks") {
        std::vector<std::uint8_t> values(8 * 8, 90);
        auto encoded = bc4_encode_image(values, 8, 8);
        encoded.resize(bc4_block_size);

        const auto decoded = bc4_decode_image(encoded, 8, 8);
        REQUIRE(decoded.size() == 64);
        CHECK(decoded[0] == 90);
        CHECK(decoded[3 * 8 + 3] == 90);
        CHECK(decoded[4] == 0);
        CHECK(decoded[63] == 0);
    }

    TEST_CASE("errors") {
        const std::vector<std::uint8_t> values(15, 0);
        CHECK_THROWS_AS((void)bc4_encode_image(values, 4, 4), std::invalid_argument);
        CHECK_THROWS_AS((void)bc4_encode_image(values, 0, 4), geometry_error);
        CHECK_THROWS_AS((void)bc4_decode_image(values, 4, 0), geometry_error);
    }
}
