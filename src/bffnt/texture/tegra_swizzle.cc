//
// Created by bffnt_kit contributors on 08/10/2026.
//
// Block-linear address translation
//

#include <bffnt/texture/tegra_swizzle.hh>
#include <bffnt/errors.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>

namespace bffnt {
    namespace {
        constexpr std::uint32_t gob_width = 64;     // bytes
        constexpr std::uint32_t gob_rows = 8;

        constexpr std::uint32_t div_round_up(std::uint32_t n, std::uint32_t d) {
            return (n + d - 1) / d;
        }

        constexpr std::uint32_t pow2_round_up(std::uint32_t x) {
            std::uint32_t p = 1;
            while (p < x) {
                p <<= 1;
            }
            return p;
        }

        void check_layout(const surface_layout& layout) {
            THROW_IF(layout.width == 0 || layout.height == 0, geometry_error,
                     "Surface of", layout.width, "x", layout.height, "pixels has no blocks");
            THROW_IF(layout.block_width == 0 || layout.block_height == 0 || layout.bytes_per_block == 0,
                     geometry_error, "Invalid texel block", layout.block_width, "x", layout.block_height,
                     "of", layout.bytes_per_block, "bytes");
        }
    }

    std::uint32_t surface_layout::width_in_blocks() const {
        check_layout(*this);
        return div_round_up(width, block_width);
    }

    std::uint32_t surface_layout::height_in_blocks() const {
        check_layout(*this);
        return div_round_up(height, block_height);
    }

    std::size_t surface_layout::linear_size() const {
        return static_cast<std::size_t>(width_in_blocks()) * height_in_blocks() * bytes_per_block;
    }

    std::uint32_t gob_block_height(std::uint32_t height_in_blocks) {
        return std::min(pow2_round_up(div_round_up(height_in_blocks, gob_rows)), max_gob_block_height);
    }

    std::uint32_t gob_block_height_log2(std::uint32_t height_in_blocks) {
        const std::uint32_t bh = gob_block_height(height_in_blocks);
        std::uint32_t log2 = 0;
        while ((1u << log2) < bh) {
            ++log2;
        }
        return log2;
    }

    std::size_t block_linear_address(std::uint32_t x, std::uint32_t y, std::uint32_t width_in_blocks,
                                     std::uint32_t bytes_per_block, std::uint32_t block_height) noexcept {
        const std::size_t width_in_gobs = div_round_up(width_in_blocks * bytes_per_block, gob_width);
        const std::size_t column_rows = gob_rows * block_height;

        const std::size_t gob_address = (y / column_rows) * gob_size * block_height * width_in_gobs
                                        + (static_cast<std::size_t>(x) * bytes_per_block / gob_width) * gob_size * block_height
                                        + (y % column_rows / gob_rows) * gob_size;

        const std::size_t xb = static_cast<std::size_t>(x) * bytes_per_block;

        return gob_address
               + ((xb % 64) / 32) * 256
               + ((y % 8) / 2) * 64
               + ((xb % 32) / 16) * 32
               + (y % 2) * 16
               + (xb % 16);
    }

    std::size_t swizzled_size(const surface_layout& layout) {
        const std::uint32_t wb = layout.width_in_blocks();
        const std::uint32_t hb = layout.height_in_blocks();
        const std::uint32_t bh = gob_block_height(hb);

        const std::size_t width_in_gobs = div_round_up(wb * layout.bytes_per_block, gob_width);
        const std::size_t gob_columns = div_round_up(hb, gob_rows * bh);
        return std::max(width_in_gobs * gob_columns * gob_size * bh, layout.linear_size());
    }

    std::vector<std::uint8_t> swizzle_block_linear(const surface_layout& layout,
                                                   std::span<const std::uint8_t> linear) {
        const std::uint32_t wb = layout.width_in_blocks();
        const std::uint32_t hb = layout.height_in_blocks();
        const std::uint32_t bpb = layout.bytes_per_block;
        const std::uint32_t bh = gob_block_height(hb);

        std::vector<std::uint8_t> tiled(swizzled_size(layout), 0);

        for (std::uint32_t y = 0; y < hb; ++y) {
            for (std::uint32_t x = 0; x < wb; ++x) {
                const std::size_t src = (static_cast<std::size_t>(y) * wb + x) * bpb;
                const std::size_t dst = block_linear_address(x, y, wb, bpb, bh);
                if (src + bpb <= linear.size() && dst + bpb <= tiled.size()) {
                    std::copy_n(linear.begin() + static_cast<std::ptrdiff_t>(src), bpb,
                                tiled.begin() + static_cast<std::ptrdiff_t>(dst));
                }
            }
        }
        return tiled;
    }

    std::vector<std::uint8_t> deswizzle_block_linear(const surface_layout& layout,
                                                     std::span<const std::uint8_t> tiled) {
        const std::uint32_t wb = layout.width_in_blocks();
        const std::uint32_t hb = layout.height_in_blocks();
        const std::uint32_t bpb = layout.bytes_per_block;
        const std::uint32_t bh = gob_block_height(hb);

        std::vector<std::uint8_t> linear(layout.linear_size(), 0);

        for (std::uint32_t y = 0; y < hb; ++y) {
            for (std::uint32_t x = 0; x < wb; ++x) {
                const std::size_t src = block_linear_address(x, y, wb, bpb, bh);
                const std::size_t dst = (static_cast<std::size_t>(y) * wb + x) * bpb;
                if (src + bpb <= tiled.size() && dst + bpb <= linear.size()) {
                    std::copy_n(tiled.begin() + static_cast<std::ptrdiff_t>(src), bpb,
                                linear.begin() + static_cast<std::ptrdiff_t>(dst));
                }
            }
        }
        return linear;
    }
}
