/**
 * @file bc4.hh
 * @brief BC4 single-channel block compression.
 *
 * BC4 stores a 4x4 block of 8-bit values in 8 bytes:
 *
 * @code
 *   byte 0     byte 1     bytes 2..7
 *   +--------+--------+--------------------------------------+
 *   |   e0   |   e1   | 16 x 3-bit palette indices (LE)      |
 *   +--------+--------+--------------------------------------+
 * @endcode
 *
 * The palette has 8 entries. If e0 > e1, entries 2..7 interpolate between
 * the endpoints in sevenths; otherwise entries 2..5 interpolate in fifths
 * and entries 6 and 7 are fixed at 0 and 255. Interpolation truncates.
 *
 * Fonts use BC4 for glyph alpha. The encoder always selects the
 * eight-value mode (e0 = max, e1 = min) unless the block is flat; the
 * decoder handles both modes.
 */

#pragma once

#include <bffnt/export.h>
#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace bffnt {
    /// Encoded size of one 4x4 block
    inline constexpr std::size_t bc4_block_size = 8;

    /// Pixels per block side
    inline constexpr std::uint32_t bc4_block_dim = 4;

    using bc4_block = std::array<std::uint8_t, bc4_block_size>;

    /// 16 values of a block in row-major order
    using bc4_texels = std::array<std::uint8_t, 16>;

    /**
     * @brief Palette a block with these endpoints decodes to.
     */
    [[nodiscard]] BFFNT_EXPORT std::array<std::uint8_t, 8> bc4_palette(std::uint8_t e0, std::uint8_t e1) noexcept;

    [[nodiscard]] BFFNT_EXPORT bc4_texels bc4_decode_block(const bc4_block& block) noexcept;

    /**
     * @brief Encode 16 values.
     *
     * Flat blocks encode as e0 = e1 = value with all indices 0. Otherwise
     * e0 = max, e1 = min and every texel takes the palette entry closest to
     * it, the lowest index winning ties.
     */
    [[nodiscard]] BFFNT_EXPORT bc4_block bc4_encode_block(const bc4_texels& texels) noexcept;

    /**
     * @brief Decode a row-major array of blocks to width x height values.
     *
     * Blocks missing from the end of data decode as zero.
     *
     * @throws geometry_error if width or height is zero
     */
    [[nodiscard]] BFFNT_EXPORT std::vector<std::uint8_t> bc4_decode_image(std::span<const std::uint8_t> data,
                                                                         std::uint32_t width, std::uint32_t height);

    /**
     * @brief Encode width x height values to a row-major array of blocks.
     *
     * Texels of partial edge blocks that lie outside the image are zero.
     *
     * @throws geometry_error if width or height is zero
     * @throws std::invalid_argument if values holds fewer than width * height bytes
     */
    [[nodiscard]] BFFNT_EXPORT std::vector<std::uint8_t> bc4_encode_image(std::span<const std::uint8_t> values,
                                                                         std::uint32_t width, std::uint32_t height);
}
