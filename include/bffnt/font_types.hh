/**
 * @file font_types.hh
 * @brief Section records of a BFFNT font container.
 *
 * A BFFNT file is a header followed by tagged sections. Each section starts
 * with a 4-byte ASCII tag and a 32-bit section size:
 *
 * @code
 *   +--------+  FFNT / CFNT / RFNT / TNFR header
 *   | header |
 *   +--------+
 *   |  FINF  |  font info: metrics + absolute offsets to TGLP, CWDH, CMAP
 *   +--------+
 *   |  TGLP  |  texture page: cell geometry + sheet payload (4096-aligned)
 *   +--------+
 *   |  CWDH  |--+  width tables, linked by absolute next offsets
 *   +--------+  |
 *   |  CWDH  |<-+
 *   +--------+
 *   |  CMAP  |--+  character maps, linked the same way
 *   +--------+  |
 *   |  CMAP  |<-+
 *   +--------+
 *   |  KRNG  |  optional kerning table, kept as opaque bytes
 *   +--------+
 * @endcode
 *
 * Every offset stored in the file points 8 bytes past the start of the
 * section it references, i.e. just after that section's tag and size.
 *
 * The linked lists are held in memory as plain vectors; offsets are
 * recomputed when the font is written.
 */

#pragma once

#include <bffnt/export.h>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace bffnt {
    /**
     * @brief Console family a font file was built for.
     *
     * Derived once from the header magic, byte order and version.
     * It decides the width of character codes in CMAP sections.
     */
    enum class platform_type {
        WII,  ///< RFNT/TNFR, big endian, 16-bit codes
        CTR,  ///< CFNT (3DS), or FFNT below version 4.1 little endian
        CAFE, ///< FFNT big endian (Wii U)
        NX    ///< FFNT little endian, version 4.1+ (Switch), 32-bit codes, BNTX sheets
    };

    /**
     * @brief Pixel format of TGLP texture sheets.
     */
    enum class texture_format : std::uint16_t {
        RGBA8888 = 0,
        RGB888 = 1,
        RGB5A1 = 2,
        RGB565 = 3,
        RGBA4444 = 4,
        LA8 = 5,
        HILO8 = 6,
        L8 = 7,
        A8 = 8,
        LA4 = 9,
        L4 = 10,
        A4 = 11,
        BC4 = 12, ///< Single-channel block compression, 8 bytes per 4x4 block
        BC1 = 13,
        BC2 = 14,
        BC3 = 15,
        BC7 = 16,
        BC5 = 17
    };

    /**
     * @brief How a CMAP section turns character codes into glyph indices.
     */
    enum class mapping_type : std::uint16_t {
        DIRECT = 0, ///< glyph = code - code_begin + offset
        TABLE = 1,  ///< one glyph index per code in range
        SCAN = 2    ///< explicit (code, glyph) pairs
    };

    /// Glyph index returned for codes without a mapping.
    inline constexpr std::uint16_t unmapped_glyph = 0xFFFF;

    /// Table and scan entry marking a code without a mapping.
    inline constexpr std::int16_t unmapped_entry = -1;

    /// Flattened character map: code -> glyph index, ordered by code.
    using code_map = std::map<std::uint32_t, std::uint16_t>;

    /**
     * @brief File header.
     */
    struct BFFNT_EXPORT font_header {
        std::string magic = "FFNT";        ///< One of FFNT, CFNT, RFNT, TNFR
        std::uint16_t bom = 0xFFFE;        ///< 0xFFFE little endian, 0xFEFF big endian (read big endian)
        std::uint16_t header_size = 0x14;  ///< Offset of the FINF section
        std::uint32_t version = 0x04010000;
        std::uint32_t file_size = 0;
        std::uint16_t section_count = 0;
        platform_type platform = platform_type::NX;

        [[nodiscard]] bool little_endian() const noexcept { return bom == 0xFFFE; }

        /// True when CMAP codes are 32-bit (NX) instead of 16-bit.
        [[nodiscard]] bool wide_codes() const noexcept { return platform == platform_type::NX; }

        /// True for the RFNT/TNFR header layout.
        [[nodiscard]] bool legacy_layout() const noexcept { return magic == "RFNT" || magic == "TNFR"; }

        bool operator==(const font_header&) const = default;
    };

    /**
     * @brief Horizontal metrics of one glyph.
     */
    struct BFFNT_EXPORT width_record {
        std::int8_t left = 0;           ///< Offset from the cell's left edge to the glyph
        std::uint8_t glyph_width = 0;   ///< Width of the glyph image
        std::uint8_t char_width = 0;    ///< Advance to the next character

        bool operator==(const width_record&) const = default;
    };

    /**
     * @brief FINF section: global metrics and the offsets of the other sections.
     *
     * The three offsets are whatever the file held when it was parsed; the
     * writer recomputes them every time.
     */
    struct BFFNT_EXPORT font_info {
        std::uint32_t section_size = 0x20;
        std::uint8_t font_type = 0;
        std::uint8_t height = 0;
        std::uint8_t width = 0;
        std::uint8_t ascent = 0;
        std::uint16_t line_feed = 0;
        std::uint16_t alter_char_index = 0;
        width_record default_width;     ///< Used to backfill new width records
        std::uint8_t encoding = 0;
        std::uint32_t tglp_offset = 0;
        std::uint32_t cwdh_offset = 0;
        std::uint32_t cmap_offset = 0;

        bool operator==(const font_info&) const = default;
    };

    /**
     * @brief Sheet payload stored as one blob per sheet (3DS, Wii, Wii U).
     */
    struct BFFNT_EXPORT legacy_sheets {
        std::vector<std::vector<std::uint8_t>> sheets;

        bool operator==(const legacy_sheets&) const = default;
    };

    /**
     * @brief Sheet payload stored as one BNTX container holding every sheet
     *        as an array layer (Switch).
     */
    struct BFFNT_EXPORT embedded_texture {
        std::vector<std::uint8_t> bntx;

        bool operator==(const embedded_texture&) const = default;
    };

    using sheet_payload = std::variant<legacy_sheets, embedded_texture>;

    /**
     * @brief TGLP section: glyph cell layout and the encoded texture sheets.
     */
    struct BFFNT_EXPORT texture_page {
        std::uint32_t section_size = 0;
        std::uint8_t cell_width = 0;
        std::uint8_t cell_height = 0;
        std::uint8_t sheet_count = 0;
        std::uint8_t max_char_width = 0;
        std::uint32_t sheet_size = 0;   ///< Declared bytes per sheet
        std::uint16_t baseline = 0;
        texture_format format = texture_format::BC4;
        std::uint16_t cells_per_row = 0;
        std::uint16_t cells_per_column = 0;
        std::uint16_t sheet_width = 0;
        std::uint16_t sheet_height = 0;
        std::uint32_t sheet_data_offset = 0;
        sheet_payload payload;

        [[nodiscard]] bool has_embedded_texture() const noexcept {
            return std::holds_alternative<embedded_texture>(payload);
        }

        /// Total payload size in bytes, as written to the file.
        [[nodiscard]] std::size_t payload_size() const noexcept;

        /// Payload bytes concatenated in file order.
        [[nodiscard]] std::vector<std::uint8_t> payload_bytes() const;

        bool operator==(const texture_page&) const = default;
    };

    /**
     * @brief CWDH section: width records for the glyph range [first_index, last_index].
     */
    struct BFFNT_EXPORT width_node {
        std::uint32_t section_size = 0;
        std::uint16_t first_index = 0;
        std::uint16_t last_index = 0;
        std::uint32_t next_offset = 0;
        std::vector<width_record> records;

        [[nodiscard]] bool contains(std::uint32_t glyph) const noexcept {
            return glyph >= first_index && glyph <= last_index &&
                   glyph - first_index < records.size();
        }

        bool operator==(const width_node&) const = default;
    };

    struct BFFNT_EXPORT direct_mapping {
        std::uint16_t offset = 0; ///< Glyph index of code_begin

        bool operator==(const direct_mapping&) const = default;
    };

    struct BFFNT_EXPORT table_mapping {
        std::vector<std::int16_t> table; ///< One entry per code, -1 when unmapped

        bool operator==(const table_mapping&) const = default;
    };

    struct BFFNT_EXPORT scan_entry {
        std::uint32_t code = 0;
        std::int16_t glyph = unmapped_entry;

        bool operator==(const scan_entry&) const = default;
    };

    struct BFFNT_EXPORT scan_mapping {
        std::vector<scan_entry> entries;

        bool operator==(const scan_mapping&) const = default;
    };

    using mapping_data = std::variant<direct_mapping, table_mapping, scan_mapping>;

    /**
     * @brief CMAP section: mapping for the code range [code_begin, code_end].
     */
    struct BFFNT_EXPORT map_node {
        std::uint32_t section_size = 0;
        std::uint32_t code_begin = 0;
        std::uint32_t code_end = 0;
        std::uint32_t next_offset = 0;
        mapping_data mapping;

        [[nodiscard]] mapping_type type() const noexcept {
            return static_cast<mapping_type>(mapping.index());
        }

        [[nodiscard]] bool covers(std::uint32_t code) const noexcept {
            return code >= code_begin && code <= code_end;
        }

        bool operator==(const map_node&) const = default;
    };

    /**
     * @brief KRNG section, preserved byte for byte.
     */
    struct BFFNT_EXPORT kerning_blob {
        std::uint32_t section_size = 0;   ///< As stored; includes tag and size field
        std::vector<std::uint8_t> data;

        bool operator==(const kerning_blob&) const = default;
    };

    /**
     * @brief Location of a glyph cell inside the texture sheets.
     */
    struct BFFNT_EXPORT glyph_location {
        std::uint32_t sheet = 0;
        std::uint32_t row = 0;
        std::uint32_t column = 0;

        bool operator==(const glyph_location&) const = default;
    };
}
