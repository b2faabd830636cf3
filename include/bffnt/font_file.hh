/**
 * @file font_file.hh
 * @brief In-memory model of a BFFNT font container.
 *
 * A font_file owns every section of a parsed container: header, FINF
 * metrics, the TGLP texture page, the CWDH width chain, the CMAP map chain
 * and the optional KRNG kerning blob. It also owns the flattened
 * code -> glyph map that editors work on.
 *
 * @section model_views Two views of the character map
 *
 * The map chain is what the file stores; the flattened map is what callers
 * query and edit. After set_char_map() the two disagree until
 * sync_char_map() runs. font_codec::save() synchronizes before writing, so
 * callers only need to call it themselves when they write through
 * font_codec::write() directly.
 *
 * @section model_widths Width records
 *
 * Width records are addressed by glyph index. lookup_width() reads them,
 * ensure_width() creates missing ones from the FINF default metrics:
 *
 * @code{.cpp}
 * auto font = font_codec::load("ui.bffnt");
 *
 * // Map a new character to glyph 812 and give it metrics
 * auto map = font.get_char_map();
 * map[0x20AC] = 812;
 * font.set_char_map(map);
 *
 * width_record& w = font.ensure_width(812);
 * w.char_width = 14;
 *
 * font_codec::save(font, "ui_patched.bffnt");
 * @endcode
 *
 * @see font_codec For parsing and writing containers
 * @see sheet_codec For decoding and replacing texture sheets
 */

#pragma once

#include <bffnt/export.h>
#include <bffnt/font_types.hh>
#include <bffnt/char_map.hh>
#include <cstdint>
#include <optional>
#include <vector>

namespace bffnt {
    namespace internal {
        struct font_reader;
    }

    struct sheet_codec;

    /**
     * @brief A parsed (or freshly assembled) BFFNT container.
     *
     * Chains are kept in file order. Offsets stored in the records reflect the
     * file that was parsed; the writer recomputes all of them.
     */
    class BFFNT_EXPORT font_file {
        friend struct internal::font_reader;
        friend struct sheet_codec;

    public:
        /**
         * @brief Construct an empty NX font with no sections.
         */
        font_file();

        [[nodiscard]] const font_header& get_header() const;
        [[nodiscard]] const font_info& get_info() const;
        [[nodiscard]] const texture_page& get_texture_page() const;
        [[nodiscard]] const std::vector<width_node>& get_width_chain() const;
        [[nodiscard]] const std::vector<map_node>& get_map_chain() const;
        [[nodiscard]] const std::optional<kerning_blob>& get_kerning() const;

        /**
         * @brief Replace the FINF metrics.
         *
         * The section offsets in info are ignored by the writer.
         */
        void set_info(const font_info& info);

        /**
         * @brief Get the flattened code -> glyph map.
         */
        [[nodiscard]] const code_map& get_char_map() const;

        /**
         * @brief Replace the flattened map.
         *
         * Entries mapping to unmapped_glyph are dropped. The map chain is not
         * touched until sync_char_map().
         */
        void set_char_map(const code_map& map);

        /**
         * @brief Glyph index of a character code.
         * @return unmapped_glyph if the code has no mapping
         */
        [[nodiscard]] std::uint16_t glyph_index(std::uint32_t code) const;

        /**
         * @brief Lowest character code mapped to a glyph, if any.
         */
        [[nodiscard]] std::optional<std::uint32_t> code_for_glyph(std::uint16_t glyph) const;

        /**
         * @brief Width record of a glyph.
         *
         * Scans the width chain in order and indexes into the first node whose
         * range holds the glyph.
         */
        [[nodiscard]] std::optional<width_record> lookup_width(std::uint16_t glyph) const;

        /**
         * @brief Get the width record of a glyph, creating it if needed.
         *
         * - Empty chain: a new node covering only glyph.
         * - Above the last node: that node grows up to glyph.
         * - Below the first node: that node grows down to glyph.
         * - Between two nodes: a one-record node is inserted in order.
         *
         * Created records copy the FINF default width. New nodes count toward
         * the header's section count.
         *
         * @return Reference into the width chain, valid until the chain changes
         */
        width_record& ensure_width(std::uint16_t glyph);

        /**
         * @brief Overwrite an existing width record.
         * @return false if no node holds the glyph
         */
        bool set_width(std::uint16_t glyph, const width_record& record);

        /**
         * @brief Sheet, row and column of a glyph's cell.
         * @throws geometry_error if the page declares no cells
         */
        [[nodiscard]] glyph_location glyph_position(std::uint16_t glyph) const;

        /**
         * @brief Rewrite the map chain so it flattens to get_char_map().
         * @see sync_map_chain
         */
        map_sync_result sync_char_map();

    private:
        font_header m_header;
        font_info m_info;
        texture_page m_page;
        std::vector<width_node> m_widths;
        std::vector<map_node> m_maps;
        code_map m_char_map;
        std::optional<kerning_blob> m_kerning;
    };
}
