/**
 * @file sheet_codec.hh
 * @brief Decoding and replacing the glyph sheets of a font.
 *
 * Sheets are exchanged as top-down RGBA images. Font sheets only carry
 * coverage, so decoding produces white pixels with the stored value in the
 * alpha channel, and encoding keeps only the alpha channel.
 *
 * @section sheet_pipeline Pipeline
 *
 * Decoding a Switch font runs the texture pipeline backwards:
 *
 * @code
 * BNTX layer -> deswizzle (block linear) -> BC4 decode -> flip -> rgba_image
 * @endcode
 *
 * Encoding runs it forwards and then either patches the original BNTX
 * container in place or builds a new one.
 *
 * @section sheet_usage Usage
 *
 * @code{.cpp}
 * auto font = font_codec::load("ui.bffnt");
 * auto sheets = sheet_codec::decode_sheets(font);
 *
 * // Replace the glyph in row 2, column 5 of the first sheet
 * rgba_image glyph = render_my_glyph(font.get_texture_page().cell_width,
 *                                    font.get_texture_page().cell_height);
 * sheet_codec::insert_glyph(sheets[0], font.get_texture_page(), 2, 5, glyph);
 *
 * const auto& original = std::get<embedded_texture>(font.get_texture_page().payload).bntx;
 * auto bntx = sheet_codec::encode_sheets(sheets, original);
 * sheet_codec::replace_texture_payload(font, std::move(bntx), sheets.size());
 * font_codec::save(font, "ui_patched.bffnt");
 * @endcode
 */

#pragma once

#include <bffnt/export.h>
#include <bffnt/font_file.hh>
#include <bffnt/texture/bntx.hh>
#include <bffnt/texture/rgba_image.hh>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace bffnt {
    /**
     * @brief Options for encode_sheets().
     */
    struct BFFNT_EXPORT sheet_encode_options {
        /// Splice into the original container when it has a data region
        bool patch_in_place = true;

        /// Used when a new container is built
        bntx_build_options build;
    };

    /**
     * @brief Static entry points for sheet images.
     */
    struct BFFNT_EXPORT sheet_codec {
        /**
         * @brief Decode every sheet of a font to top-down RGBA images.
         *
         * - BNTX payload: one image per array layer. BC4 becomes white with
         *   the decoded value as alpha, RGBA8 passes through, other formats
         *   are read as one alpha byte per pixel. Images are flipped.
         * - Legacy payload: one image per sheet blob, BC4 or one alpha byte
         *   per pixel, flipped on CAFE and NX.
         *
         * @throws format_error, truncation_error if the BNTX container is damaged
         * @throws geometry_error if a sheet side is zero or above 16384 pixels, or
         *         the declared sheets need more bytes than the payload holds
         */
        [[nodiscard]] static std::vector<rgba_image> decode_sheets(const font_file& font);

        /**
         * @brief Encode sheets to a BNTX container.
         *
         * Each sheet is flipped, BC4 encoded from its alpha channel and
         * swizzled. The layers then replace the data region of
         * original_payload, or a new container is built when patching is
         * disabled or impossible.
         *
         * @param sheets Top-down images, all of the same size
         * @param original_payload BNTX container the sheets were decoded from (may be empty)
         * @param options Patch or build settings
         * @throws std::invalid_argument if sheets is empty
         * @throws geometry_error if the sheets differ in size or are empty images
         */
        [[nodiscard]] static std::vector<std::uint8_t> encode_sheets(std::span<const rgba_image> sheets,
                                                                     std::span<const std::uint8_t> original_payload,
                                                                     const sheet_encode_options& options = {});

        /**
         * @brief Install a new BNTX container as the font's sheet payload.
         *
         * Sets the sheet count and the per-sheet size (payload size divided
         * by the sheet count).
         *
         * @throws std::invalid_argument if sheet_count is 0 or above 255
         */
        static void replace_texture_payload(font_file& font, std::vector<std::uint8_t> payload,
                                            std::size_t sheet_count);

        /**
         * @brief Copy one glyph cell out of a sheet.
         *
         * Cells are separated by one pixel; the cell at (row, column) starts
         * at (column * (cell_width + 1) + 1, row * (cell_height + 1) + 1).
         */
        [[nodiscard]] static rgba_image extract_glyph(const rgba_image& sheet, const texture_page& page,
                                                      std::uint32_t row, std::uint32_t column);

        /**
         * @brief Draw a glyph into its cell, clipped to the cell size.
         */
        static void insert_glyph(rgba_image& sheet, const texture_page& page,
                                 std::uint32_t row, std::uint32_t column, const rgba_image& glyph);
    };
}
