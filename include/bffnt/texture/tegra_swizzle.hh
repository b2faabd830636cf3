/**
 * @file tegra_swizzle.hh
 * @brief Block-linear (GOB) tiling used by the Switch GPU.
 *
 * Textures in a BNTX container are not stored row by row. The image is cut
 * into blocks (4x4 pixels for BCn formats, single pixels otherwise) and the
 * blocks are laid out in GOBs ("groups of bytes"): 512-byte tiles holding
 * 64 bytes x 8 rows. GOBs are stacked vertically in columns of
 * `block_height` GOBs before moving right:
 *
 * @code
 *   x (bytes) ->  0      64     128
 *              +------+------+------+
 *   y  GOB     |  0   |  bh  | 2bh  |   one column of bh GOBs covers
 *   |  rows    |  1   | bh+1 |      |   8 * bh rows of blocks
 *   v          | ...  |      |      |
 *              | bh-1 |      |      |
 *              +------+------+------+
 *              |  next row of GOB columns
 * @endcode
 *
 * Inside a GOB, bytes are interleaved in 16-byte, 32-byte and 64-byte
 * sectors. block_linear_address() computes the exact position.
 *
 * The GOB block height is chosen from the image height alone, and the same
 * value must be used by the decoder, the encoder and the BNTX builder (which
 * stores its log2 in the texture layout field).
 */

#pragma once

#include <bffnt/export.h>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace bffnt {
    /// Size of one GOB in bytes
    inline constexpr std::size_t gob_size = 512;

    /// Largest GOB block height the encoder selects
    inline constexpr std::uint32_t max_gob_block_height = 16;

    /**
     * @brief Dimensions of a surface and the size of its texel blocks.
     *
     * For BC4: block 4x4, 8 bytes per block. For R8: block 1x1, 1 byte.
     */
    struct BFFNT_EXPORT surface_layout {
        std::uint32_t width = 0;            ///< Pixels
        std::uint32_t height = 0;           ///< Pixels
        std::uint32_t block_width = 1;      ///< Pixels per block, horizontally
        std::uint32_t block_height = 1;     ///< Pixels per block, vertically
        std::uint32_t bytes_per_block = 1;

        /// @throws geometry_error if any dimension is zero
        [[nodiscard]] std::uint32_t width_in_blocks() const;

        /// @throws geometry_error if any dimension is zero
        [[nodiscard]] std::uint32_t height_in_blocks() const;

        /// Bytes of the untiled, row-major block array
        [[nodiscard]] std::size_t linear_size() const;

        bool operator==(const surface_layout&) const = default;
    };

    /**
     * @brief GOB block height for an image of the given height.
     *
     * Next power of two of ceil(height_in_blocks / 8), capped at 16.
     */
    [[nodiscard]] BFFNT_EXPORT std::uint32_t gob_block_height(std::uint32_t height_in_blocks);

    /**
     * @brief log2 of gob_block_height(), as stored in a BNTX texture layout.
     */
    [[nodiscard]] BFFNT_EXPORT std::uint32_t gob_block_height_log2(std::uint32_t height_in_blocks);

    /**
     * @brief Byte offset of block (x, y) in a block-linear surface.
     *
     * @param x Block column
     * @param y Block row
     * @param width_in_blocks Surface width in blocks
     * @param bytes_per_block Size of one block
     * @param block_height GOB block height (1, 2, 4, 8 or 16)
     */
    [[nodiscard]] BFFNT_EXPORT std::size_t block_linear_address(std::uint32_t x, std::uint32_t y,
                                                                std::uint32_t width_in_blocks,
                                                                std::uint32_t bytes_per_block,
                                                                std::uint32_t block_height) noexcept;

    /**
     * @brief Size of the tiled buffer, padded to whole GOB columns.
     *
     * Never smaller than layout.linear_size().
     */
    [[nodiscard]] BFFNT_EXPORT std::size_t swizzled_size(const surface_layout& layout);

    /**
     * @brief Tile a row-major block array.
     *
     * Blocks whose source or target falls outside the buffers are skipped.
     *
     * @return Buffer of swizzled_size(layout) bytes
     */
    [[nodiscard]] BFFNT_EXPORT std::vector<std::uint8_t> swizzle_block_linear(const surface_layout& layout,
                                                                             std::span<const std::uint8_t> linear);

    /**
     * @brief Untile a block-linear surface into a row-major block array.
     *
     * Blocks whose source or target falls outside the buffers are left zero.
     *
     * @return Buffer of layout.linear_size() bytes
     */
    [[nodiscard]] BFFNT_EXPORT std::vector<std::uint8_t> deswizzle_block_linear(const surface_layout& layout,
                                                                               std::span<const std::uint8_t> tiled);
}
