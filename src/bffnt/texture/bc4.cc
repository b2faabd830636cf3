//
// Created by bffnt_kit contributors on 08/10/2026.
//
// BC4 block codec
//

#include <bffnt/texture/bc4.hh>
#include <bffnt/errors.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <cstdlib>
#include <stdexcept>

namespace bffnt {
    namespace {
        constexpr std::uint32_t index_bits = 3;
        constexpr std::uint32_t index_mask = 0x7;

        std::uint64_t read_indices(const bc4_block& block) {
            std::uint64_t v = 0;
            for (std::size_t i = bc4_block_size; i > 2; --i) {
                v = (v << 8) | block[i - 1];
            }
            return v;
        }

        void write_indices(bc4_block& block, std::uint64_t v) {
            for (std::size_t i = 2; i < bc4_block_size; ++i) {
                block[i] = static_cast<std::uint8_t>(v & 0xFF);
                v >>= 8;
            }
        }

        void check_size(std::uint32_t width, std::uint32_t height) {
            THROW_IF(width == 0 || height == 0, geometry_error,
                     "BC4 image of", width, "x", height, "pixels has no blocks");
        }
    }

    std::array<std::uint8_t, 8> bc4_palette(std::uint8_t e0, std::uint8_t e1) noexcept {
        std::array<std::uint8_t, 8> p{};
        p[0] = e0;
        p[1] = e1;
        const unsigned a = e0;
        const unsigned b = e1;
        if (e0 > e1) {
            for (unsigned k = 0; k < 6; ++k) {
                p[2 + k] = static_cast<std::uint8_t>(((6 - k) * a + (1 + k) * b) / 7);
            }
        } else {
            for (unsigned k = 0; k < 4; ++k) {
                p[2 + k] = static_cast<std::uint8_t>(((4 - k) * a + (1 + k) * b) / 5);
            }
            p[6] = 0;
            p[7] = 255;
        }
        return p;
    }

    bc4_texels bc4_decode_block(const bc4_block& block) noexcept {
        const auto palette = bc4_palette(block[0], block[1]);
        const std::uint64_t indices = read_indices(block);

        bc4_texels out{};
        for (std::size_t i = 0; i < out.size(); ++i) {
            out[i] = palette[(indices >> (i * index_bits)) & index_mask];
        }
        return out;
    }

    bc4_block bc4_encode_block(const bc4_texels& texels) noexcept {
        const auto [lo, hi] = std::minmax_element(texels.begin(), texels.end());

        bc4_block block{};
        if (*lo == *hi) {
            block[0] = *lo;
            block[1] = *lo;
            return block;
        }

        block[0] = *hi;
        block[1] = *lo;
        const auto palette = bc4_palette(block[0], block[1]);

        std::uint64_t indices = 0;
        for (std::size_t i = 0; i < texels.size(); ++i) {
            std::uint64_t best = 0;
            int best_diff = std::abs(static_cast<int>(palette[0]) - texels[i]);
            for (std::uint64_t j = 1; j < palette.size(); ++j) {
                const int diff = std::abs(static_cast<int>(palette[j]) - texels[i]);
                if (diff < best_diff) {
                    best_diff = diff;
                    best = j;
                }
            }
            indices |= best << (i * index_bits);
        }
        write_indices(block, indices);
        return block;
    }

    std::vector<std::uint8_t> bc4_decode_image(std::span<const std::uint8_t> data,
                                               std::uint32_t width, std::uint32_t height) {
        check_size(width, height);
        const std::uint32_t bw = (width + bc4_block_dim - 1) / bc4_block_dim;
        const std::uint32_t bh = (height + bc4_block_dim - 1) / bc4_block_dim;

        std::vector<std::uint8_t> out(static_cast<std::size_t>(width) * height, 0);
        for (std::uint32_t by = 0; by < bh; ++by) {
            for (std::uint32_t bx = 0; bx < bw; ++bx) {
                const std::size_t offset = (static_cast<std::size_t>(by) * bw + bx) * bc4_block_size;
                if (offset + bc4_block_size > data.size()) {
                    continue;
                }
                bc4_block block;
                std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), bc4_block_size, block.begin());
                const auto texels = bc4_decode_block(block);

                for (std::uint32_t py = 0; py < bc4_block_dim; ++py) {
                    for (std::uint32_t px = 0; px < bc4_block_dim; ++px) {
                        const std::uint32_t x = bx * bc4_block_dim + px;
                        const std::uint32_t y = by * bc4_block_dim + py;
                        if (x < width && y < height) {
                            out[static_cast<std::size_t>(y) * width + x] = texels[py * bc4_block_dim + px];
                        }
                    }
                }
            }
        }
        return out;
    }

    std::vector<std::uint8_t> bc4_encode_image(std::span<const std::uint8_t> values,
                                               std::uint32_t width, std::uint32_t height) {
        check_size(width, height);
        THROW_IF(values.size() < static_cast<std::size_t>(width) * height, std::invalid_argument,
                 "BC4 source holds", values.size(), "values, need", static_cast<std::size_t>(width) * height);

        const std::uint32_t bw = (width + bc4_block_dim - 1) / bc4_block_dim;
        const std::uint32_t bh = (height + bc4_block_dim - 1) / bc4_block_dim;

        std::vector<std::uint8_t> out(static_cast<std::size_t>(bw) * bh * bc4_block_size);
        for (std::uint32_t by = 0; by < bh; ++by) {
            for (std::uint32_t bx = 0; bx < bw; ++bx) {
                bc4_texels texels{};
                for (std::uint32_t py = 0; py < bc4_block_dim; ++py) {
                    for (std::uint32_t px = 0; px < bc4_block_dim; ++px) {
                        const std::uint32_t x = bx * bc4_block_dim + px;
                        const std::uint32_t y = by * bc4_block_dim + py;
                        if (x < width && y < height) {
                            texels[py * bc4_block_dim + px] = values[static_cast<std::size_t>(y) * width + x];
                        }
                    }
                }
                const auto block = bc4_encode_block(texels);
                std::copy(block.begin(), block.end(),
                          out.begin() + static_cast<std::ptrdiff_t>((static_cast<std::size_t>(by) * bw + bx) * bc4_block_size));
            }
        }
        return out;
    }
}
