//
// Created by bffnt_kit contributors on 11/10/2026.
//
// BFFNT in-memory model
//

#include <bffnt/font_file.hh>
#include <bffnt/errors.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>

namespace bffnt {
    font_file::font_file() = default;

    const font_header& font_file::get_header() const {
        return m_header;
    }

    const font_info& font_file::get_info() const {
        return m_info;
    }

    const texture_page& font_file::get_texture_page() const {
        return m_page;
    }

    const std::vector<width_node>& font_file::get_width_chain() const {
        return m_widths;
    }

    const std::vector<map_node>& font_file::get_map_chain() const {
        return m_maps;
    }

    const std::optional<kerning_blob>& font_file::get_kerning() const {
        return m_kerning;
    }

    void font_file::set_info(const font_info& info) {
        m_info = info;
    }

    const code_map& font_file::get_char_map() const {
        return m_char_map;
    }

    void font_file::set_char_map(const code_map& map) {
        m_char_map = map;
        std::erase_if(m_char_map, [](const auto& kv) { return kv.second == unmapped_glyph; });
    }

    std::uint16_t font_file::glyph_index(std::uint32_t code) const {
        auto it = m_char_map.find(code);
        return it != m_char_map.end() ? it->second : unmapped_glyph;
    }

    std::optional<std::uint32_t> font_file::code_for_glyph(std::uint16_t glyph) const {
        for (const auto& [code, g] : m_char_map) {
            if (g == glyph) {
                return code;
            }
        }
        return std::nullopt;
    }

    // =============================================================================
    // Width chain
    // =============================================================================

    std::optional<width_record> font_file::lookup_width(std::uint16_t glyph) const {
        for (const auto& node : m_widths) {
            if (node.contains(glyph)) {
                return node.records[glyph - node.first_index];
            }
        }
        return std::nullopt;
    }

    width_record& font_file::ensure_width(std::uint16_t glyph) {
        for (auto& node : m_widths) {
            if (node.contains(glyph)) {
                return node.records[glyph - node.first_index];
            }
        }

        const width_record fill = m_info.default_width;

        if (m_widths.empty()) {
            width_node node;
            node.first_index = glyph;
            node.last_index = glyph;
            node.records.push_back(fill);
            m_widths.push_back(std::move(node));
            ++m_header.section_count;
            LOG_DEBUG("Created CWDH section for glyph", glyph);
            return m_widths.back().records.back();
        }

        auto& last = m_widths.back();
        if (glyph > last.last_index && glyph >= last.first_index) {
            last.records.resize(static_cast<std::size_t>(glyph - last.first_index) + 1, fill);
            last.last_index = glyph;
            return last.records.back();
        }

        auto& first = m_widths.front();
        if (glyph < first.first_index) {
            const auto grow = static_cast<std::size_t>(first.first_index - glyph);
            first.records.insert(first.records.begin(), grow, fill);
            first.first_index = glyph;
            return first.records.front();
        }

        // Strictly between two nodes
        auto pos = std::find_if(m_widths.begin(), m_widths.end(), [glyph](const width_node& n) {
            return n.first_index > glyph;
        });
        width_node node;
        node.first_index = glyph;
        node.last_index = glyph;
        node.records.push_back(fill);
        pos = m_widths.insert(pos, std::move(node));
        ++m_header.section_count;
        LOG_DEBUG("Inserted CWDH section for glyph", glyph, "between existing ranges");
        return pos->records.front();
    }

    bool font_file::set_width(std::uint16_t glyph, const width_record& record) {
        for (auto& node : m_widths) {
            if (node.contains(glyph)) {
                node.records[glyph - node.first_index] = record;
                return true;
            }
        }
        return false;
    }

    glyph_location font_file::glyph_position(std::uint16_t glyph) const {
        const std::uint32_t per_row = m_page.cells_per_row;
        const std::uint32_t per_sheet = per_row * m_page.cells_per_column;
        THROW_IF(per_sheet == 0, geometry_error,
                 "TGLP declares", m_page.cells_per_row, "x", m_page.cells_per_column, "cells per sheet");

        const std::uint32_t local = glyph % per_sheet;
        return {glyph / per_sheet, local / per_row, local % per_row};
    }

    map_sync_result font_file::sync_char_map() {
        auto result = sync_map_chain(m_maps, m_char_map);
        m_header.section_count = static_cast<std::uint16_t>(m_header.section_count + result.created_nodes);
        return result;
    }
}
