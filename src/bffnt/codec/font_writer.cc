//
// Created by bffnt_kit contributors on 05/10/2026.
//
// BFFNT container writer
//
// Sections are emitted in a fixed order with placeholder sizes and offsets,
// which are patched once the positions they refer to are known:
//
//   header | FINF | TGLP header | pad to 0x1000 | sheet payload |
//   CWDH chain | CMAP chain | KRNG
//

#include "sections.hh"
#include <bffnt/errors.hh>
#include <bffnt/utils/byte_stream.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>

#include "../utils/overloaded.hh"

namespace bffnt::internal {
    namespace {
        constexpr std::size_t legacy_header_size = 0x10;
        constexpr std::size_t header_size = 0x14;
        constexpr std::size_t info_size = 0x20;

        constexpr std::uint32_t max_narrow_code = 0xFFFF;
        constexpr std::size_t max_scan_entries = 0xFFFF;

        // Every value must fit the field it is written to; narrowing would
        // produce a file that reads back as a different map.
        void check_map_chain(const std::vector<map_node>& chain, bool wide) {
            for (const auto& node : chain) {
                if (!wide) {
                    THROW_IF(node.code_begin > max_narrow_code || node.code_end > max_narrow_code, format_error,
                             "CMAP range", node.code_begin, "-", node.code_end,
                             "does not fit the 16-bit codes of this platform");
                }
                if (const auto* s = std::get_if<scan_mapping>(&node.mapping)) {
                    THROW_IF(s->entries.size() > max_scan_entries, format_error,
                             "CMAP scan section holds", s->entries.size(), "entries, at most",
                             max_scan_entries, "fit");
                    if (!wide) {
                        for (const auto& e : s->entries) {
                            THROW_IF(e.code > max_narrow_code, format_error,
                                     "CMAP code", e.code, "does not fit the 16-bit codes of this platform");
                        }
                    }
                }
            }
        }

        void write_header(byte_writer& w, const font_header& h, std::uint32_t file_size) {
            w.write_tag(h.magic);
            w.write_u16_be(h.bom);
            if (h.legacy_layout()) {
                w.write_u16(static_cast<std::uint16_t>(h.version));
                w.write_u32(file_size);
                w.write_u16(h.header_size);
                w.write_u16(h.section_count);
            } else {
                w.write_u16(h.header_size);
                w.write_u32(h.version);
                w.write_u32(file_size);
                w.write_u16(h.section_count);
                w.write_u16(0);
            }
        }

        void write_info(byte_writer& w, const font_info& info,
                        std::uint32_t tglp, std::uint32_t cwdh, std::uint32_t cmap) {
            w.write_tag("FINF");
            w.write_u32(info.section_size);
            w.write_u8(info.font_type);
            w.write_u8(info.height);
            w.write_u8(info.width);
            w.write_u8(info.ascent);
            w.write_u16(info.line_feed);
            w.write_u16(info.alter_char_index);
            w.write_s8(info.default_width.left);
            w.write_u8(info.default_width.glyph_width);
            w.write_u8(info.default_width.char_width);
            w.write_u8(info.encoding);
            w.write_u32(tglp);
            w.write_u32(cwdh);
            w.write_u32(cmap);
        }

        void write_page_header(byte_writer& w, const texture_page& page,
                               std::uint32_t section_size, std::uint32_t data_offset) {
            w.write_tag("TGLP");
            w.write_u32(section_size);
            w.write_u8(page.cell_width);
            w.write_u8(page.cell_height);
            w.write_u8(page.sheet_count);
            w.write_u8(page.max_char_width);
            w.write_u32(page.sheet_size);
            w.write_u16(page.baseline);
            w.write_u16(static_cast<std::uint16_t>(page.format));
            w.write_u16(page.cells_per_row);
            w.write_u16(page.cells_per_column);
            w.write_u16(page.sheet_width);
            w.write_u16(page.sheet_height);
            w.write_u32(data_offset);
        }

        void write_payload(byte_writer& w, const sheet_payload& payload) {
            std::visit(overloaded{
                [&](const legacy_sheets& l) {
                    for (const auto& sheet : l.sheets) {
                        w.write_bytes(sheet);
                    }
                },
                [&](const embedded_texture& e) {
                    w.write_bytes(e.bntx);
                }
            }, payload);
        }

        // Writes one chain node through body(), then patches its size and,
        // unless it is the last node, the next offset.
        template<typename Body>
        void write_chain_node(byte_writer& w, std::string_view tag, bool last, Body&& body) {
            const std::size_t start = w.tell();
            w.write_tag(tag);
            const std::size_t size_pos = w.tell();
            w.write_u32(0);

            const std::size_t next_pos = body();

            w.align(section_alignment);
            const std::size_t end = w.tell();
            w.patch_u32(size_pos, static_cast<std::uint32_t>(end - start));
            if (!last) {
                w.patch_u32(next_pos, static_cast<std::uint32_t>(end + section_prefix_size));
            }
        }

        void write_width_chain(byte_writer& w, const std::vector<width_node>& chain) {
            for (std::size_t i = 0; i < chain.size(); ++i) {
                const auto& node = chain[i];
                write_chain_node(w, "CWDH", i + 1 == chain.size(), [&] {
                    w.write_u16(node.first_index);
                    w.write_u16(node.last_index);
                    const std::size_t next_pos = w.tell();
                    w.write_u32(0);
                    for (const auto& rec : node.records) {
                        w.write_s8(rec.left);
                        w.write_u8(rec.glyph_width);
                        w.write_u8(rec.char_width);
                    }
                    return next_pos;
                });
            }
        }

        void write_mapping(byte_writer& w, const mapping_data& mapping, bool wide) {
            std::visit(overloaded{
                [&](const direct_mapping& d) {
                    w.write_u16(d.offset);
                },
                [&](const table_mapping& t) {
                    for (const auto glyph : t.table) {
                        w.write_s16(glyph);
                    }
                },
                [&](const scan_mapping& s) {
                    w.write_u16(static_cast<std::uint16_t>(s.entries.size()));
                    if (wide) {
                        w.write_u16(0);
                    }
                    for (const auto& e : s.entries) {
                        if (wide) {
                            w.write_u32(e.code);
                            w.write_s16(e.glyph);
                            w.write_u16(0);
                        } else {
                            w.write_u16(static_cast<std::uint16_t>(e.code));
                            w.write_s16(e.glyph);
                        }
                    }
                }
            }, mapping);
        }

        void write_map_chain(byte_writer& w, const std::vector<map_node>& chain, bool wide) {
            for (std::size_t i = 0; i < chain.size(); ++i) {
                const auto& node = chain[i];
                write_chain_node(w, "CMAP", i + 1 == chain.size(), [&] {
                    if (wide) {
                        w.write_u32(node.code_begin);
                        w.write_u32(node.code_end);
                    } else {
                        w.write_u16(static_cast<std::uint16_t>(node.code_begin));
                        w.write_u16(static_cast<std::uint16_t>(node.code_end));
                    }
                    w.write_u16(static_cast<std::uint16_t>(node.type()));
                    w.write_u16(0);
                    const std::size_t next_pos = w.tell();
                    w.write_u32(0);
                    write_mapping(w, node.mapping, wide);
                    return next_pos;
                });
            }
        }
    }

    std::vector<std::uint8_t> font_writer::write(const font_file& font) {
        const auto& header = font.get_header();
        const auto& info = font.get_info();
        const auto& page = font.get_texture_page();
        const auto& widths = font.get_width_chain();
        const auto& maps = font.get_map_chain();

        check_map_chain(maps, header.wide_codes());

        byte_writer w(header.little_endian() ? byte_order::little : byte_order::big);

        const std::size_t fixed_header = header.legacy_layout() ? legacy_header_size : header_size;
        w.write_zeros(std::max<std::size_t>(header.header_size, fixed_header));

        const std::size_t info_start = w.tell();
        w.write_zeros(std::max<std::size_t>(info.section_size, info_size));

        const std::size_t page_start = w.tell();
        write_page_header(w, page, 0, 0);

        // A page that declared no sheet data and still has none stays that way
        const bool no_sheet_data = page.sheet_data_offset == 0 && page.payload_size() == 0;
        if (!no_sheet_data) {
            w.align(texture_alignment);
        }
        const std::size_t data_start = w.tell();
        write_payload(w, page.payload);

        w.align(section_alignment);
        const std::size_t widths_start = w.tell();
        write_width_chain(w, widths);

        w.align(section_alignment);
        const std::size_t maps_start = w.tell();
        write_map_chain(w, maps, header.wide_codes());

        if (const auto& kerning = font.get_kerning()) {
            w.write_tag("KRNG");
            w.write_u32(kerning->section_size);
            w.write_bytes(kerning->data);
        }

        const auto file_size = static_cast<std::uint32_t>(w.size());
        const auto page_size = static_cast<std::uint32_t>(data_start - page_start + page.payload_size());

        w.seek(page_start);
        write_page_header(w, page, page_size, no_sheet_data ? 0 : static_cast<std::uint32_t>(data_start));

        w.seek(info_start);
        write_info(w, info,
                   static_cast<std::uint32_t>(page_start + section_prefix_size),
                   widths.empty() ? 0 : static_cast<std::uint32_t>(widths_start + section_prefix_size),
                   maps.empty() ? 0 : static_cast<std::uint32_t>(maps_start + section_prefix_size));

        w.seek(0);
        write_header(w, header, file_size);

        LOG_DEBUG("Wrote", header.magic, "font of", file_size, "bytes, sheet data at", data_start);
        return std::move(w).release();
    }
}
