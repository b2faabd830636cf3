//
// Created by bffnt_kit contributors on 05/10/2026.
//
// BFFNT container parser
//

#include "sections.hh"
#include <bffnt/errors.hh>
#include <bffnt/utils/byte_stream.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <array>
#include <set>
#include <string_view>

namespace bffnt::internal {
    namespace {
        constexpr std::array<std::string_view, 4> known_magics = {"FFNT", "CFNT", "RFNT", "TNFR"};

        constexpr std::uint32_t nx_min_version = 0x04010000;

        // Total-size field of an embedded BNTX header, always little endian
        constexpr std::size_t bntx_size_field = 0x18;

        constexpr std::uint16_t max_texture_format = static_cast<std::uint16_t>(texture_format::BC5);
        constexpr std::uint16_t max_mapping_type = static_cast<std::uint16_t>(mapping_type::SCAN);

        void expect_tag(byte_reader& r, std::string_view tag) {
            const auto pos = r.tell();
            const auto got = r.read_tag();
            THROW_IF(got != tag, format_error,
                     "Expected", tag, "section at offset", pos, "but found tag", got);
        }

        // Offsets point past the tag and size of the section they reference
        void seek_section(byte_reader& r, std::uint32_t offset, std::string_view tag) {
            THROW_IF(offset < section_prefix_size, format_error,
                     "Invalid", tag, "offset", offset);
            r.seek(offset - section_prefix_size);
        }

        platform_type detect_platform(const font_header& h) {
            if (h.legacy_layout()) {
                return platform_type::WII;
            }
            if (h.magic == "CFNT") {
                return platform_type::CTR;
            }
            if (h.little_endian()) {
                return h.version >= nx_min_version ? platform_type::NX : platform_type::CTR;
            }
            return platform_type::CAFE;
        }

        font_header read_header(byte_reader& r) {
            font_header h;
            h.magic = r.read_tag();
            THROW_IF(std::find(known_magics.begin(), known_magics.end(), h.magic) == known_magics.end(),
                     format_error, "Unknown font container magic", h.magic);

            h.bom = r.read_u16_be();
            THROW_IF(h.bom != 0xFFFE && h.bom != 0xFEFF, format_error,
                     "Invalid byte order mark", h.bom, "in", h.magic, "header");
            r.set_order(h.little_endian() ? byte_order::little : byte_order::big);

            if (h.legacy_layout()) {
                h.version = r.read_u16();
                h.file_size = r.read_u32();
                h.header_size = r.read_u16();
                h.section_count = r.read_u16();
            } else {
                h.header_size = r.read_u16();
                h.version = r.read_u32();
                h.file_size = r.read_u32();
                h.section_count = r.read_u16();
                r.skip(2);
            }
            h.platform = detect_platform(h);
            return h;
        }

        font_info read_info(byte_reader& r) {
            expect_tag(r, "FINF");
            font_info info;
            info.section_size = r.read_u32();
            info.font_type = r.read_u8();
            info.height = r.read_u8();
            info.width = r.read_u8();
            info.ascent = r.read_u8();
            info.line_feed = r.read_u16();
            info.alter_char_index = r.read_u16();
            info.default_width.left = r.read_s8();
            info.default_width.glyph_width = r.read_u8();
            info.default_width.char_width = r.read_u8();
            info.encoding = r.read_u8();
            info.tglp_offset = r.read_u32();
            info.cwdh_offset = r.read_u32();
            info.cmap_offset = r.read_u32();
            return info;
        }

        texture_page read_texture_page(byte_reader& r, std::uint32_t offset) {
            seek_section(r, offset, "TGLP");
            expect_tag(r, "TGLP");

            texture_page page;
            page.section_size = r.read_u32();
            page.cell_width = r.read_u8();
            page.cell_height = r.read_u8();
            page.sheet_count = r.read_u8();
            page.max_char_width = r.read_u8();
            page.sheet_size = r.read_u32();
            page.baseline = r.read_u16();
            const auto format = r.read_u16();
            THROW_IF(format > max_texture_format, format_error, "Unsupported TGLP texture format", format);
            page.format = static_cast<texture_format>(format);
            page.cells_per_row = r.read_u16();
            page.cells_per_column = r.read_u16();
            page.sheet_width = r.read_u16();
            page.sheet_height = r.read_u16();
            page.sheet_data_offset = r.read_u32();

            legacy_sheets legacy;
            if (page.sheet_data_offset == 0) {
                page.payload = std::move(legacy);
                return page;
            }

            r.seek(page.sheet_data_offset);
            if (r.peek_tag("BNTX")) {
                const auto saved = r.order();
                r.set_order(byte_order::little);
                r.seek(page.sheet_data_offset + bntx_size_field);
                const auto declared = r.read_u32();
                r.set_order(saved);

                r.seek(page.sheet_data_offset);
                const std::size_t total = std::min<std::size_t>(declared, r.remaining());
                if (total != declared) {
                    LOG_WARN("BNTX container at offset", page.sheet_data_offset, "declares", declared,
                             "bytes but only", total, "remain; using the rest of the data");
                }
                auto bytes = r.read_bytes(total);
                page.payload = embedded_texture{std::vector<std::uint8_t>(bytes.begin(), bytes.end())};
                LOG_DEBUG("TGLP holds a", total, "byte BNTX container at offset", page.sheet_data_offset);
            } else {
                legacy.sheets.reserve(page.sheet_count);
                for (std::size_t i = 0; i < page.sheet_count; ++i) {
                    auto bytes = r.read_bytes(page.sheet_size);
                    legacy.sheets.emplace_back(bytes.begin(), bytes.end());
                }
                page.payload = std::move(legacy);
                LOG_DEBUG("TGLP holds", static_cast<unsigned>(page.sheet_count), "sheets of", page.sheet_size, "bytes");
            }
            return page;
        }

        std::vector<width_node> read_width_chain(byte_reader& r, std::uint32_t offset) {
            std::vector<width_node> chain;
            std::set<std::uint32_t> visited;

            while (offset != 0) {
                THROW_IF(!visited.insert(offset).second, format_error,
                         "CWDH chain loops back to offset", offset);
                seek_section(r, offset, "CWDH");
                expect_tag(r, "CWDH");

                width_node node;
                node.section_size = r.read_u32();
                node.first_index = r.read_u16();
                node.last_index = r.read_u16();
                node.next_offset = r.read_u32();

                if (node.last_index >= node.first_index) {
                    const std::size_t count = static_cast<std::size_t>(node.last_index - node.first_index) + 1;
                    node.records.reserve(count);
                    for (std::size_t i = 0; i < count; ++i) {
                        width_record w;
                        w.left = r.read_s8();
                        w.glyph_width = r.read_u8();
                        w.char_width = r.read_u8();
                        node.records.push_back(w);
                    }
                }

                offset = node.next_offset;
                chain.push_back(std::move(node));
            }
            return chain;
        }

        mapping_data read_mapping(byte_reader& r, const map_node& node, mapping_type type, bool wide) {
            switch (type) {
                case mapping_type::DIRECT:
                    return direct_mapping{r.read_u16()};

                case mapping_type::TABLE: {
                    table_mapping t;
                    if (node.code_end >= node.code_begin) {
                        const std::size_t count = static_cast<std::size_t>(node.code_end - node.code_begin) + 1;
                        THROW_IF(count > r.remaining() / 2, truncation_error,
                                 "CMAP table for codes", node.code_begin, "-", node.code_end,
                                 "runs past end of data");
                        t.table.reserve(count);
                        for (std::size_t i = 0; i < count; ++i) {
                            t.table.push_back(r.read_s16());
                        }
                    }
                    return t;
                }

                case mapping_type::SCAN: {
                    scan_mapping s;
                    const auto count = r.read_u16();
                    if (wide) {
                        r.skip(2);
                    }
                    s.entries.reserve(count);
                    for (std::size_t i = 0; i < count; ++i) {
                        scan_entry e;
                        if (wide) {
                            e.code = r.read_u32();
                            e.glyph = r.read_s16();
                            r.skip(2);
                        } else {
                            e.code = r.read_u16();
                            e.glyph = r.read_s16();
                        }
                        s.entries.push_back(e);
                    }
                    return s;
                }
            }
            THROW_RUNTIME("Unhandled CMAP mapping type", static_cast<unsigned>(type));
        }

        std::vector<map_node> read_map_chain(byte_reader& r, std::uint32_t offset, bool wide) {
            std::vector<map_node> chain;
            std::set<std::uint32_t> visited;

            while (offset != 0) {
                THROW_IF(!visited.insert(offset).second, format_error,
                         "CMAP chain loops back to offset", offset);
                seek_section(r, offset, "CMAP");
                expect_tag(r, "CMAP");

                map_node node;
                node.section_size = r.read_u32();
                if (wide) {
                    node.code_begin = r.read_u32();
                    node.code_end = r.read_u32();
                } else {
                    node.code_begin = r.read_u16();
                    node.code_end = r.read_u16();
                }
                const auto type = r.read_u16();
                THROW_IF(type > max_mapping_type, format_error,
                         "Unsupported CMAP mapping type", type, "at offset", offset);
                r.skip(2);
                node.next_offset = r.read_u32();
                node.mapping = read_mapping(r, node, static_cast<mapping_type>(type), wide);

                offset = node.next_offset;
                chain.push_back(std::move(node));
            }
            return chain;
        }

        // Best-effort scan; any inconsistency means "no kerning"
        std::optional<kerning_blob> find_kerning(std::span<const std::uint8_t> data, std::size_t from,
                                                 const font_header& header) {
            const std::size_t limit = std::min<std::size_t>(header.file_size, data.size());
            const auto order = header.little_endian() ? byte_order::little : byte_order::big;

            for (std::size_t pos = align_up(from, section_alignment); pos + section_prefix_size <= limit;
                 pos += section_alignment) {
                byte_reader r(data, order);
                r.seek(pos);
                if (!r.peek_tag("KRNG")) {
                    continue;
                }
                r.skip(tag_size);
                kerning_blob blob;
                blob.section_size = r.read_u32();
                if (blob.section_size < section_prefix_size ||
                    blob.section_size - section_prefix_size > r.remaining()) {
                    LOG_DEBUG("KRNG section at offset", pos, "declares implausible size", blob.section_size);
                    return std::nullopt;
                }
                auto bytes = r.read_bytes(blob.section_size - section_prefix_size);
                blob.data.assign(bytes.begin(), bytes.end());
                LOG_DEBUG("Found KRNG section at offset", pos, "of", blob.section_size, "bytes");
                return blob;
            }
            LOG_DEBUG("No KRNG section");
            return std::nullopt;
        }
    }

    font_file font_reader::read(std::span<const std::uint8_t> data) {
        byte_reader r(data, byte_order::big);

        auto header = read_header(r);
        r.seek(header.header_size);
        auto info = read_info(r);
        auto page = read_texture_page(r, info.tglp_offset);

        std::vector<width_node> widths;
        if (info.cwdh_offset != 0) {
            widths = read_width_chain(r, info.cwdh_offset);
        }

        std::vector<map_node> maps;
        if (info.cmap_offset != 0) {
            maps = read_map_chain(r, info.cmap_offset, header.wide_codes());
        }

        auto kerning = find_kerning(data, r.tell(), header);

        font_file result;
        result.m_char_map = flatten_map_chain(maps);
        result.m_header = std::move(header);
        result.m_info = info;
        result.m_page = std::move(page);
        result.m_widths = std::move(widths);
        result.m_maps = std::move(maps);
        result.m_kerning = std::move(kerning);

        LOG_DEBUG("Parsed", result.m_header.magic, "font:", result.m_widths.size(), "CWDH and",
                  result.m_maps.size(), "CMAP sections,", result.m_char_map.size(), "mapped codes");
        return result;
    }
}
