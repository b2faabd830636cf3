//
// Created by bffnt_kit contributors on 11/10/2026.
//
// Sheet images <-> texture payloads
//

#include <bffnt/sheet_codec.hh>
#include <bffnt/errors.hh>
#include <bffnt/texture/bc4.hh>
#include <bffnt/texture/tegra_swizzle.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <limits>
#include <stdexcept>

#include "utils/overloaded.hh"

namespace bffnt {
    namespace {
        constexpr std::uint8_t coverage_color = 255;

        // Largest 2D texture side the Switch GPU accepts
        constexpr std::uint32_t max_sheet_dimension = 16384;

        // Declared dimensions must describe no more texels than the payload can hold
        void check_bntx_geometry(const bntx_texture& tex, std::size_t payload_size) {
            THROW_IF(tex.width == 0 || tex.height == 0 ||
                     tex.width > max_sheet_dimension || tex.height > max_sheet_dimension,
                     geometry_error, "BNTX texture", tex.name, "declares", tex.width, "x", tex.height, "pixels");

            const std::uint64_t layer_bytes = tex.layout().linear_size();
            const std::uint64_t needed = layer_bytes * tex.layer_count();
            THROW_IF(needed > payload_size, geometry_error,
                     "BNTX texture", tex.name, "declares", tex.layer_count(), "layers of", tex.width, "x",
                     tex.height, "pixels, needing", needed, "bytes, but the container is", payload_size, "bytes");
        }

        void check_legacy_geometry(const texture_page& page, std::size_t blob_size) {
            const std::uint64_t w = page.sheet_width;
            const std::uint64_t h = page.sheet_height;
            THROW_IF(w == 0 || h == 0, geometry_error, "TGLP declares", w, "x", h, "pixel sheets");

            // BC4 needs whole blocks; the narrowest other formats use 4 bits per pixel
            const std::uint64_t needed = page.format == texture_format::BC4
                                             ? ((w + 3) / 4) * ((h + 3) / 4) * bc4_block_size
                                             : (w * h + 1) / 2;
            THROW_IF(needed > blob_size, geometry_error,
                     "TGLP sheet of", w, "x", h, "pixels needs", needed, "bytes, but holds", blob_size);
        }

        rgba_image from_alpha(std::span<const std::uint8_t> values, int width, int height) {
            rgba_image image(width, height);
            const std::size_t count = std::min(values.size(),
                                               static_cast<std::size_t>(width) * static_cast<std::size_t>(height));
            for (std::size_t i = 0; i < count; ++i) {
                const int x = static_cast<int>(i % static_cast<std::size_t>(width));
                const int y = static_cast<int>(i / static_cast<std::size_t>(width));
                image.set_pixel(x, y, {coverage_color, coverage_color, coverage_color, values[i]});
            }
            return image;
        }

        rgba_image from_rgba(std::span<const std::uint8_t> values, int width, int height) {
            rgba_image image(width, height);
            std::copy_n(values.begin(), std::min(values.size(), image.size()), image.data());
            return image;
        }

        rgba_image decode_layer(const bntx_texture& tex, std::uint32_t index) {
            const auto layout = tex.layout();
            const auto linear = deswizzle_block_linear(layout, tex.layer(index));
            const auto w = static_cast<int>(tex.width);
            const auto h = static_cast<int>(tex.height);

            rgba_image image;
            if (bntx_format_info::is_bc4(tex.format_code)) {
                image = from_alpha(bc4_decode_image(linear, tex.width, tex.height), w, h);
            } else if (tex.format_code == bntx_format_rgba8) {
                image = from_rgba(linear, w, h);
            } else {
                image = from_alpha(linear, w, h);
            }
            image.flip_vertical();
            return image;
        }

        std::vector<rgba_image> decode_embedded(const embedded_texture& payload) {
            const auto tex = bntx_container::parse(payload.bntx);
            check_bntx_geometry(tex, payload.bntx.size());
            std::vector<rgba_image> sheets;
            sheets.reserve(tex.layer_count());
            for (std::uint32_t i = 0; i < tex.layer_count(); ++i) {
                sheets.push_back(decode_layer(tex, i));
            }
            return sheets;
        }

        std::vector<rgba_image> decode_legacy(const legacy_sheets& payload, const texture_page& page,
                                              platform_type platform) {
            const bool flip = platform == platform_type::CAFE || platform == platform_type::NX;
            const int w = page.sheet_width;
            const int h = page.sheet_height;

            std::vector<rgba_image> sheets;
            sheets.reserve(payload.sheets.size());
            for (const auto& blob : payload.sheets) {
                check_legacy_geometry(page, blob.size());
                rgba_image image;
                if (page.format == texture_format::BC4) {
                    image = from_alpha(bc4_decode_image(blob, page.sheet_width, page.sheet_height), w, h);
                } else {
                    image = from_alpha(blob, w, h);
                }
                if (flip) {
                    image.flip_vertical();
                }
                sheets.push_back(std::move(image));
            }
            return sheets;
        }

        std::vector<std::uint8_t> encode_layer(const rgba_image& sheet) {
            rgba_image flipped = sheet;
            flipped.flip_vertical();

            const auto w = static_cast<std::uint32_t>(sheet.width());
            const auto h = static_cast<std::uint32_t>(sheet.height());
            const auto linear = bc4_encode_image(flipped.alpha(), w, h);
            const surface_layout layout{w, h, bc4_block_dim, bc4_block_dim, bc4_block_size};
            return swizzle_block_linear(layout, linear);
        }
    }

    std::vector<rgba_image> sheet_codec::decode_sheets(const font_file& font) {
        const auto& page = font.get_texture_page();
        auto sheets = std::visit(overloaded{
            [&](const embedded_texture& e) { return decode_embedded(e); },
            [&](const legacy_sheets& l) { return decode_legacy(l, page, font.get_header().platform); }
        }, page.payload);

        LOG_DEBUG("Decoded", sheets.size(), "sheets");
        return sheets;
    }

    std::vector<std::uint8_t> sheet_codec::encode_sheets(std::span<const rgba_image> sheets,
                                                         std::span<const std::uint8_t> original_payload,
                                                         const sheet_encode_options& options) {
        THROW_IF(sheets.empty(), std::invalid_argument, "No sheets to encode");
        const int w = sheets.front().width();
        const int h = sheets.front().height();
        THROW_IF(w <= 0 || h <= 0, geometry_error, "Cannot encode sheet of", w, "x", h, "pixels");
        for (const auto& sheet : sheets) {
            THROW_IF(sheet.width() != w || sheet.height() != h, geometry_error,
                     "Sheet of", sheet.width(), "x", sheet.height(), "pixels differs from first sheet",
                     w, "x", h);
        }

        std::vector<std::vector<std::uint8_t>> layers;
        layers.reserve(sheets.size());
        for (const auto& sheet : sheets) {
            layers.push_back(encode_layer(sheet));
        }

        if (options.patch_in_place && bntx_container::data_region(original_payload)) {
            LOG_INFO("Patching", layers.size(), "sheets into the existing texture container");
            return bntx_container::patch(original_payload, layers);
        }
        LOG_INFO("Building a new texture container for", layers.size(), "sheets of", w, "x", h);
        return bntx_container::build(layers, static_cast<std::uint32_t>(w), static_cast<std::uint32_t>(h),
                                     options.build);
    }

    void sheet_codec::replace_texture_payload(font_file& font, std::vector<std::uint8_t> payload,
                                              std::size_t sheet_count) {
        THROW_IF(sheet_count == 0 || sheet_count > std::numeric_limits<std::uint8_t>::max(),
                 std::invalid_argument, "Invalid sheet count", sheet_count);

        auto& page = font.m_page;
        page.sheet_count = static_cast<std::uint8_t>(sheet_count);
        page.sheet_size = static_cast<std::uint32_t>(payload.size() / sheet_count);
        page.payload = embedded_texture{std::move(payload)};
    }

    rgba_image sheet_codec::extract_glyph(const rgba_image& sheet, const texture_page& page,
                                          std::uint32_t row, std::uint32_t column) {
        const int x = static_cast<int>(column * (page.cell_width + 1u) + 1);
        const int y = static_cast<int>(row * (page.cell_height + 1u) + 1);
        return sheet.crop(x, y, page.cell_width, page.cell_height);
    }

    void sheet_codec::insert_glyph(rgba_image& sheet, const texture_page& page,
                                   std::uint32_t row, std::uint32_t column, const rgba_image& glyph) {
        const int x = static_cast<int>(column * (page.cell_width + 1u) + 1);
        const int y = static_cast<int>(row * (page.cell_height + 1u) + 1);
        sheet.blit(glyph.crop(0, 0, page.cell_width, page.cell_height), x, y);
    }
}
