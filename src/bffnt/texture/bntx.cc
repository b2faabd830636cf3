//
// Created by bffnt_kit contributors on 08/10/2026.
//
// BNTX texture container: parse, build and in-place patch
//

#include <bffnt/texture/bntx.hh>
#include <bffnt/errors.hh>
#include <bffnt/utils/byte_stream.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <stdexcept>
#include <string_view>

namespace bffnt {
    namespace {
        constexpr std::size_t bom_offset = 0x0C;
        constexpr std::size_t total_size_offset = 0x18;
        constexpr std::size_t brtd_header_size = 0x10;
        constexpr std::size_t default_data_start = 0x1000;

        // Builder layout
        constexpr std::size_t nx_offset = 0x20;
        constexpr std::size_t brti_offset = 0x60;
        constexpr std::uint32_t brti_size = 0x100;
        constexpr std::size_t name_offset = 0x200;
        constexpr std::size_t data_offset = 0x1000;

        // BRTI field offsets
        constexpr std::size_t brti_dimension = 0x11;
        constexpr std::size_t brti_tile_mode = 0x12;
        constexpr std::size_t brti_mip_count = 0x16;
        constexpr std::size_t brti_format = 0x1C;
        constexpr std::size_t brti_width = 0x24;
        constexpr std::size_t brti_layout_field = 0x38;
        constexpr std::size_t brti_image_size = 0x50;
        constexpr std::size_t brti_name_ptr = 0x60;
        constexpr std::size_t brti_min_size = brti_name_ptr + 8;

        std::optional<std::size_t> find_tag(std::span<const std::uint8_t> data, std::string_view tag) {
            const auto it = std::search(data.begin(), data.end(), tag.begin(), tag.end(),
                                        [](std::uint8_t a, char b) { return a == static_cast<std::uint8_t>(b); });
            if (it == data.end()) {
                return std::nullopt;
            }
            return static_cast<std::size_t>(it - data.begin());
        }

        std::string read_name(byte_reader& r, std::int64_t ptr) {
            if (ptr <= 0 || static_cast<std::uint64_t>(ptr) + 2 > r.size()) {
                return "texture";
            }
            r.seek(static_cast<std::size_t>(ptr));
            const auto len = std::min<std::size_t>(r.read_u16(), r.remaining());
            auto bytes = r.read_bytes(len);
            std::string name(bytes.begin(), bytes.end());
            std::erase(name, '\0');
            return name;
        }

        void check_layers(std::span<const std::vector<std::uint8_t>> layers) {
            THROW_IF(layers.empty(), std::invalid_argument, "No texture layers given");
        }
    }

    // =============================================================================
    // bntx_format_info
    // =============================================================================
    bntx_format_info bntx_format_info::lookup(std::uint32_t format_code) {
        switch (format_code) {
            case 0x0101: return {1, 1, 1};
            case 0x0201: return {2, 1, 1};
            case 0x0301: return {3, 1, 1};
            case 0x0B01: return {4, 1, 1};
            case 0x1A01:
            case 0x1A06: return {8, 4, 4};
            case 0x1B01: return {16, 4, 4};
            case 0x1C01:
            case 0x1C06: return {16, 4, 4};
            case 0x1D01:
            case 0x1D02: return {8, 4, 4};
            case 0x1E01:
            case 0x1E02: return {16, 4, 4};
            case 0x2001:
            case 0x2006: return {16, 4, 4};
            default: return {4, 1, 1};
        }
    }

    bool bntx_format_info::is_bc4(std::uint32_t format_code) noexcept {
        return format_code == bntx_format_bc4_unorm || format_code == bntx_format_bc4_snorm;
    }

    // =============================================================================
    // bntx_texture
    // =============================================================================
    surface_layout bntx_texture::layout() const {
        const auto info = bntx_format_info::lookup(format_code);
        return {width, height, info.block_width, info.block_height, info.bytes_per_block};
    }

    std::uint32_t bntx_texture::layer_count() const noexcept {
        return array_count > 1 ? array_count : 1;
    }

    std::vector<std::uint8_t> bntx_texture::layer(std::uint32_t index) const {
        THROW_IF(index >= layer_count(), std::out_of_range,
                 "Layer", index, "of texture with", layer_count(), "layers");
        const std::size_t stride = swizzled_size(layout());
        std::vector<std::uint8_t> out(stride, 0);

        const std::size_t begin = static_cast<std::size_t>(index) * stride;
        if (begin < data.size()) {
            const std::size_t n = std::min(stride, data.size() - begin);
            std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(begin), n, out.begin());
        }
        return out;
    }

    // =============================================================================
    // bntx_container
    // =============================================================================
    bool bntx_container::is_bntx(std::span<const std::uint8_t> data) noexcept {
        byte_reader r(data);
        return r.peek_tag("BNTX");
    }

    bntx_texture bntx_container::parse(std::span<const std::uint8_t> data) {
        THROW_IF(!is_bntx(data), format_error, "Not a BNTX container");

        byte_reader r(data);
        r.seek(bom_offset);
        r.set_order(r.read_u16_be() == 0xFEFF ? byte_order::big : byte_order::little);

        const auto brti = find_tag(data, "BRTI");
        THROW_IF(!brti, format_error, "BNTX container has no BRTI section");
        THROW_IF(data.size() - *brti < brti_min_size, truncation_error,
                 "BRTI section at offset", *brti, "is cut short");

        bntx_texture tex;
        r.seek(*brti + brti_dimension);
        tex.dimension = r.read_u8();
        r.seek(*brti + brti_tile_mode);
        tex.tile_mode = r.read_u16();
        r.seek(*brti + brti_mip_count);
        tex.mip_count = r.read_u16();
        r.seek(*brti + brti_format);
        tex.format_code = r.read_u32();
        r.seek(*brti + brti_width);
        tex.width = r.read_u32();
        tex.height = r.read_u32();
        tex.depth = r.read_u32();
        tex.array_count = r.read_u32();
        r.seek(*brti + brti_layout_field);
        tex.block_height_log2 = r.read_u32() & 0x7;
        r.seek(*brti + brti_image_size);
        tex.image_size = r.read_u32();
        tex.alignment = r.read_u32();
        r.seek(*brti + brti_name_ptr);
        const auto name_ptr = r.read_s64();
        tex.name = read_name(r, name_ptr);

        const auto brtd = find_tag(data, "BRTD");
        const std::size_t start = std::min(brtd ? *brtd + brtd_header_size : default_data_start, data.size());
        const std::size_t wanted = static_cast<std::size_t>(tex.image_size) * tex.array_count;
        const std::size_t available = data.size() - start;
        if (wanted > available) {
            LOG_WARN("BNTX texture", tex.name, "declares", wanted, "bytes of data but only",
                     available, "remain; using the rest of the container");
        }
        const auto bytes = data.subspan(start, std::min(wanted, available));
        tex.data.assign(bytes.begin(), bytes.end());

        LOG_DEBUG("BNTX texture", tex.name, tex.width, "x", tex.height, "format", tex.format_code,
                  "layers", tex.array_count, "data", tex.data.size(), "bytes at offset", start);
        return tex;
    }

    std::optional<bntx_region> bntx_container::data_region(std::span<const std::uint8_t> data) {
        if (!is_bntx(data)) {
            return std::nullopt;
        }
        const auto brtd = find_tag(data, "BRTD");
        if (!brtd || *brtd + brtd_header_size > data.size()) {
            return std::nullopt;
        }

        bntx_region region;
        region.begin = *brtd + brtd_header_size;
        region.end = data.size();
        if (data.size() >= total_size_offset + 4) {
            byte_reader r(data, byte_order::little);
            r.seek(total_size_offset);
            const std::size_t declared = r.read_u32();
            if (declared > region.begin && declared < data.size()) {
                region.end = declared;
            }
        }
        return region;
    }

    std::vector<std::uint8_t> bntx_container::build(std::span<const std::vector<std::uint8_t>> layers,
                                                    std::uint32_t width, std::uint32_t height,
                                                    const bntx_build_options& options) {
        check_layers(layers);
        THROW_IF(!bntx_format_info::is_bc4(options.format_code), format_error,
                 "Cannot build BNTX texture of format", options.format_code);
        const std::size_t layer_size = layers.front().size();
        for (const auto& layer : layers) {
            THROW_IF(layer.size() != layer_size, std::invalid_argument,
                     "Texture layers differ in size:", layer.size(), "vs", layer_size);
        }

        const auto info = bntx_format_info::lookup(options.format_code);
        const surface_layout layout{width, height, info.block_width, info.block_height, info.bytes_per_block};
        const std::size_t total = layer_size * layers.size();
        const auto file_size = static_cast<std::uint32_t>(data_offset + total);

        byte_writer w(byte_order::little);
        w.write_zeros(file_size);

        w.seek(0);
        w.write_tag("BNTX");
        w.write_u32(0x20);
        w.write_u32(file_size);
        w.write_u16_be(0xFFFE);
        w.write_u16(0x40);
        w.write_u32(static_cast<std::uint32_t>(options.name.size() + 2));
        w.write_u16(0);
        w.write_u16(0);
        w.write_u32(file_size);

        w.seek(nx_offset);
        w.write_tag("NX  ");
        w.write_u32(1);
        w.write_s64(0x38);
        w.write_s64(0x48);
        w.write_s64(0x60);
        w.write_s64(name_offset - 0x40);

        w.seek(brti_offset);
        w.write_tag("BRTI");
        w.write_u32(brti_size);
        w.write_u32(brti_size);
        w.seek(brti_offset + 0x10);
        w.write_u8(1);
        w.write_u8(2);
        w.write_u16(0);
        w.write_u16(0);
        w.write_u16(1);
        w.write_u32(1);
        w.write_u32(options.format_code);
        w.write_u32(1);
        w.write_u32(width);
        w.write_u32(height);
        w.write_u32(1);
        w.write_u32(static_cast<std::uint32_t>(layers.size()));
        w.seek(brti_offset + brti_layout_field);
        w.write_u32(gob_block_height_log2(layout.height_in_blocks()));
        w.seek(brti_offset + brti_image_size);
        w.write_u32(static_cast<std::uint32_t>(layer_size));
        w.write_u32(options.alignment);
        w.seek(brti_offset + brti_name_ptr);
        w.write_s64(name_offset);

        w.seek(name_offset);
        w.write_u16(static_cast<std::uint16_t>(options.name.size()));
        w.write_bytes({reinterpret_cast<const std::uint8_t*>(options.name.data()), options.name.size()});

        w.seek(data_offset - brtd_header_size);
        w.write_tag("BRTD");
        w.write_u32(static_cast<std::uint32_t>(total + brtd_header_size));

        w.seek(data_offset);
        for (const auto& layer : layers) {
            w.write_bytes(layer);
        }

        LOG_DEBUG("Built BNTX texture", options.name, width, "x", height, "with", layers.size(),
                  "layers of", layer_size, "bytes");
        return std::move(w).release();
    }

    std::vector<std::uint8_t> bntx_container::patch(std::span<const std::uint8_t> original,
                                                    std::span<const std::vector<std::uint8_t>> layers) {
        check_layers(layers);
        const auto region = data_region(original);
        THROW_IF(!region, format_error, "BNTX container has no texture data region to patch");

        const std::size_t share = region->size() / layers.size();
        std::vector<std::uint8_t> out(original.begin(), original.end());
        auto dst = out.begin() + static_cast<std::ptrdiff_t>(region->begin);

        std::fill_n(dst, region->size(), std::uint8_t{0});
        for (const auto& layer : layers) {
            std::copy_n(layer.begin(), std::min(share, layer.size()), dst);
            dst += static_cast<std::ptrdiff_t>(share);
        }

        LOG_DEBUG("Patched", layers.size(), "layers into BNTX data region", region->begin, "-", region->end);
        return out;
    }
}
