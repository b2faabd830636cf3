//
// Created by bffnt_kit contributors on 11/10/2026.
//
// BFFNT entry points: file I/O and naming helpers
//

#include <bffnt/font_codec.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <array>
#include <fstream>

#include "codec/sections.hh"

namespace bffnt {

    namespace {
        constexpr std::array<std::array<std::uint8_t, 4>, 4> FONT_MAGICS = {{
            {'F', 'F', 'N', 'T'},
            {'C', 'F', 'N', 'T'},
            {'R', 'F', 'N', 'T'},
            {'T', 'N', 'F', 'R'}
        }};

        std::vector<std::uint8_t> read_file(const std::filesystem::path& path) {
            std::ifstream file(path, std::ios::binary | std::ios::ate);
            THROW_IF(!file, std::runtime_error, "Cannot open file:", path.string());

            auto size = file.tellg();
            file.seekg(0, std::ios::beg);

            std::vector<std::uint8_t> data(static_cast<std::size_t>(size));
            THROW_IF(!file.read(reinterpret_cast<char*>(data.data()), size),
                     std::runtime_error, "Failed to read file:", path.string());

            return data;
        }

        void write_file(const std::filesystem::path& path, const std::vector<std::uint8_t>& data) {
            std::ofstream file(path, std::ios::binary | std::ios::trunc);
            THROW_IF(!file, std::runtime_error, "Cannot create file:", path.string());
            THROW_IF(!file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size())),
                     std::runtime_error, "Failed to write file:", path.string());
        }
    }

    bool font_codec::is_font(std::span<const std::uint8_t> data) {
        if (data.size() < 4) return false;
        return std::any_of(FONT_MAGICS.begin(), FONT_MAGICS.end(), [&](const auto& magic) {
            return std::equal(magic.begin(), magic.end(), data.begin());
        });
    }

    font_file font_codec::parse(std::span<const std::uint8_t> data) {
        return internal::font_reader::read(data);
    }

    font_file font_codec::load(const std::filesystem::path& path) {
        auto data = read_file(path);
        LOG_INFO("Loading font", path.string(), "(", data.size(), "bytes )");
        return parse(data);
    }

    std::vector<std::uint8_t> font_codec::write(const font_file& font) {
        return internal::font_writer::write(font);
    }

    void font_codec::save(font_file& font, const std::filesystem::path& path) {
        const auto sync = font.sync_char_map();
        if (sync.changed()) {
            LOG_INFO("CMAP synchronized:", sync.added, "added,", sync.updated, "updated,",
                     sync.deleted, "deleted");
        }
        write_file(path, write(font));
    }

    // =========================================================================
    // Naming helpers
    // =========================================================================

    std::string_view font_codec::platform_name(platform_type platform) {
        switch (platform) {
            case platform_type::WII: return "WII (Wii)";
            case platform_type::CTR: return "CTR (3DS)";
            case platform_type::CAFE: return "CAFE (Wii U)";
            case platform_type::NX: return "NX (Switch)";
            default: return "Unknown";
        }
    }

    std::string_view font_codec::texture_format_name(texture_format format) {
        switch (format) {
            case texture_format::RGBA8888: return "RGBA8888";
            case texture_format::RGB888: return "RGB888";
            case texture_format::RGB5A1: return "RGB5A1";
            case texture_format::RGB565: return "RGB565";
            case texture_format::RGBA4444: return "RGBA4444";
            case texture_format::LA8: return "LA8";
            case texture_format::HILO8: return "HILO8";
            case texture_format::L8: return "L8";
            case texture_format::A8: return "A8";
            case texture_format::LA4: return "LA4";
            case texture_format::L4: return "L4";
            case texture_format::A4: return "A4";
            case texture_format::BC4: return "BC4";
            case texture_format::BC1: return "BC1";
            case texture_format::BC2: return "BC2";
            case texture_format::BC3: return "BC3";
            case texture_format::BC7: return "BC7";
            case texture_format::BC5: return "BC5";
            default: return "Unknown";
        }
    }

    std::string_view font_codec::mapping_type_name(mapping_type type) {
        switch (type) {
            case mapping_type::DIRECT: return "Direct";
            case mapping_type::TABLE: return "Table";
            case mapping_type::SCAN: return "Scan";
            default: return "Unknown";
        }
    }
}
