/**
 * @file bntx.hh
 * @brief Minimal reader, builder and patcher for BNTX texture containers.
 *
 * Switch fonts store all texture sheets in one BNTX container, one array
 * layer per sheet. Only what font sheets use is supported: a single 2D
 * texture, one mip level, block-linear tiling.
 *
 * @section bntx_layout Layout produced by the builder
 *
 * | Offset | Content |
 * |--------|---------|
 * | 0x000 | "BNTX" header, total size at 0x18 |
 * | 0x020 | "NX  " block: texture count, pointers |
 * | 0x060 | "BRTI" texture info (0x100 bytes) |
 * | 0x200 | texture name (u16 length + bytes) |
 * | 0xFF0 | "BRTD" data block header |
 * | 0x1000 | tiled layers, back to back |
 *
 * @section bntx_patch Patching
 *
 * Containers shipped with games carry relocation tables and string pools
 * the builder cannot reproduce. bntx_container::patch() therefore only
 * replaces the bytes of the BRTD data region and keeps everything else.
 *
 * @code{.cpp}
 * const auto& payload = std::get<embedded_texture>(page.payload).bntx;
 * auto tex = bntx_container::parse(payload);
 * std::cout << tex.name << ": " << tex.width << "x" << tex.height
 *           << ", " << tex.array_count << " layers\n";
 * @endcode
 */

#pragma once

#include <bffnt/export.h>
#include <bffnt/texture/tegra_swizzle.hh>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace bffnt {
    /// BRTI format codes used by fonts
    inline constexpr std::uint32_t bntx_format_r8 = 0x0101;
    inline constexpr std::uint32_t bntx_format_rgba8 = 0x0B01;
    inline constexpr std::uint32_t bntx_format_bc4_unorm = 0x1D01;
    inline constexpr std::uint32_t bntx_format_bc4_snorm = 0x1D02;

    /**
     * @brief Texel block geometry of a BRTI format code.
     */
    struct BFFNT_EXPORT bntx_format_info {
        std::uint32_t bytes_per_block = 4;
        std::uint32_t block_width = 1;
        std::uint32_t block_height = 1;

        /**
         * @brief Look up a format code.
         *
         * Unknown codes are treated as 4 bytes per pixel.
         */
        [[nodiscard]] static bntx_format_info lookup(std::uint32_t format_code);

        /// True for the BC4 UNORM and SNORM codes
        [[nodiscard]] static bool is_bc4(std::uint32_t format_code) noexcept;
    };

    /**
     * @brief Options for building a new container.
     */
    struct BFFNT_EXPORT bntx_build_options {
        std::string name = "font_texture";              ///< Texture name stored at 0x200
        std::uint32_t format_code = bntx_format_bc4_unorm;
        std::uint32_t alignment = 512;                  ///< BRTI alignment field

        /**
         * @brief Options for BC4 UNORM font sheets, the format games use.
         */
        static bntx_build_options bc4_unorm() {
            return {"font_texture", bntx_format_bc4_unorm, 512};
        }
    };

    /**
     * @brief Texture described by a container's BRTI section, with its data.
     */
    struct BFFNT_EXPORT bntx_texture {
        std::string name = "texture";
        std::uint32_t format_code = 0;
        std::uint8_t dimension = 0;
        std::uint16_t tile_mode = 0;
        std::uint16_t mip_count = 0;
        std::uint32_t width = 0;
        std::uint32_t height = 0;
        std::uint32_t depth = 0;
        std::uint32_t array_count = 0;
        std::uint32_t block_height_log2 = 0;    ///< Low 3 bits of the texture layout field
        std::uint32_t image_size = 0;           ///< Declared bytes per layer
        std::uint32_t alignment = 0;
        std::vector<std::uint8_t> data;         ///< Tiled layers, back to back

        /**
         * @brief Surface geometry of one layer.
         */
        [[nodiscard]] surface_layout layout() const;

        /**
         * @brief Number of layers to decode (at least 1).
         */
        [[nodiscard]] std::uint32_t layer_count() const noexcept;

        /**
         * @brief Tiled bytes of one layer.
         *
         * Layers are swizzled_size(layout()) bytes apart; a layer cut short by
         * the end of data is zero padded.
         */
        [[nodiscard]] std::vector<std::uint8_t> layer(std::uint32_t index) const;
    };

    /**
     * @brief Byte range [begin, end) of the texture data inside a container.
     */
    struct BFFNT_EXPORT bntx_region {
        std::size_t begin = 0;
        std::size_t end = 0;

        [[nodiscard]] std::size_t size() const noexcept { return end - begin; }
    };

    /**
     * @brief Static entry points for BNTX containers.
     */
    struct BFFNT_EXPORT bntx_container {
        /**
         * @brief Check for the "BNTX" magic.
         */
        [[nodiscard]] static bool is_bntx(std::span<const std::uint8_t> data) noexcept;

        /**
         * @brief Read the texture of a container.
         *
         * The data of array_count layers is taken from 16 bytes past the
         * BRTD tag (or from 0x1000 without one). If the declared size runs
         * past the buffer, the rest of the buffer is used instead.
         *
         * @throws format_error if the magic or the BRTI section is missing
         * @throws truncation_error if the BRTI section is cut short
         */
        [[nodiscard]] static bntx_texture parse(std::span<const std::uint8_t> data);

        /**
         * @brief Locate the data region for in-place patching.
         *
         * Starts 16 bytes past the BRTD tag and ends at the total size
         * declared at 0x18, or at the end of the buffer when that size is
         * not between the data start and the buffer length.
         *
         * @return nullopt if data is not a container or has no BRTD block
         */
        [[nodiscard]] static std::optional<bntx_region> data_region(std::span<const std::uint8_t> data);

        /**
         * @brief Build a new single-texture container.
         *
         * @param layers Tiled layers, all of the same size
         * @param width Layer width in pixels
         * @param height Layer height in pixels
         * @param options Name, format and alignment
         * @throws std::invalid_argument if layers is empty or sizes differ
         * @throws format_error if the format is not BC4
         */
        [[nodiscard]] static std::vector<std::uint8_t> build(std::span<const std::vector<std::uint8_t>> layers,
                                                             std::uint32_t width, std::uint32_t height,
                                                             const bntx_build_options& options = {});

        /**
         * @brief Replace the data region of an existing container.
         *
         * The region is split evenly between the layers. Each layer is zero
         * padded or truncated to its share; bytes outside the region are
         * copied unchanged.
         *
         * @throws format_error if original has no data region
         * @throws std::invalid_argument if layers is empty
         */
        [[nodiscard]] static std::vector<std::uint8_t> patch(std::span<const std::uint8_t> original,
                                                             std::span<const std::vector<std::uint8_t>> layers);
    };
}
