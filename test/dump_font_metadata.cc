//
// Diagnostic tool to dump BFFNT container metadata
//

#include <bffnt/font_codec.hh>
#include <bffnt/sheet_codec.hh>
#include <bffnt/texture/bntx.hh>
#include <iostream>
#include <iomanip>
#include <filesystem>
#include <sstream>
#include <string>

using namespace bffnt;

namespace {
    void print_separator(const std::string& title) {
        std::cout << "\n" << std::string(70, '=') << "\n";
        std::cout << title << "\n";
        std::cout << std::string(70, '=') << "\n";
    }

    void print_subsection(const std::string& title) {
        std::cout << "\n--- " << title << " ---\n";
    }

    std::string hex(std::uint32_t v) {
        std::ostringstream os;
        os << "0x" << std::hex << std::uppercase << v;
        return os.str();
    }

    void dump_header(const font_file& font) {
        const auto& h = font.get_header();
        std::cout << "Magic: " << h.magic << "\n";
        std::cout << "Platform: " << font_codec::platform_name(h.platform) << "\n";
        std::cout << "Byte order: " << (h.little_endian() ? "little" : "big") << " endian\n";
        std::cout << "Version: " << hex(h.version) << "\n";
        std::cout << "File size: " << h.file_size << " bytes\n";
        std::cout << "Sections: " << h.section_count << "\n";

        const auto& info = font.get_info();
        print_subsection("FINF");
        std::cout << "  font_type: " << static_cast<int>(info.font_type) << "\n";
        std::cout << "  height: " << static_cast<int>(info.height) << "\n";
        std::cout << "  width: " << static_cast<int>(info.width) << "\n";
        std::cout << "  ascent: " << static_cast<int>(info.ascent) << "\n";
        std::cout << "  line_feed: " << info.line_feed << "\n";
        std::cout << "  alter_char_index: " << info.alter_char_index << "\n";
        std::cout << "  default_width: left=" << static_cast<int>(info.default_width.left)
                  << " glyph=" << static_cast<int>(info.default_width.glyph_width)
                  << " char=" << static_cast<int>(info.default_width.char_width) << "\n";
        std::cout << "  encoding: " << static_cast<int>(info.encoding) << "\n";
    }

    void dump_texture(const font_file& font) {
        const auto& page = font.get_texture_page();
        print_subsection("TGLP");
        std::cout << "  cell: " << static_cast<int>(page.cell_width) << "x"
                  << static_cast<int>(page.cell_height) << "\n";
        std::cout << "  cells per sheet: " << page.cells_per_row << "x" << page.cells_per_column << "\n";
        std::cout << "  sheet: " << page.sheet_width << "x" << page.sheet_height << "\n";
        std::cout << "  sheet_count: " << static_cast<int>(page.sheet_count) << "\n";
        std::cout << "  sheet_size: " << page.sheet_size << " bytes\n";
        std::cout << "  baseline: " << page.baseline << "\n";
        std::cout << "  format: " << font_codec::texture_format_name(page.format)
                  << " (" << static_cast<int>(page.format) << ")\n";
        std::cout << "  payload: " << page.payload_size() << " bytes at " << hex(page.sheet_data_offset) << "\n";

        if (const auto* e = std::get_if<embedded_texture>(&page.payload)) {
            try {
                const auto tex = bntx_container::parse(e->bntx);
                std::cout << "  BNTX texture \"" << tex.name << "\": " << tex.width << "x" << tex.height
                          << ", format " << hex(tex.format_code)
                          << ", layers " << tex.array_count
                          << ", block_height_log2 " << tex.block_height_log2
                          << ", image_size " << tex.image_size << "\n";
            } catch (const std::exception& ex) {
                std::cout << "  BNTX error: " << ex.what() << "\n";
            }
        }

        try {
            const auto sheets = sheet_codec::decode_sheets(font);
            std::cout << "  decoded sheets: " << sheets.size() << "\n";
        } catch (const std::exception& ex) {
            std::cout << "  decode error: " << ex.what() << "\n";
        }
    }

    void dump_widths(const font_file& font) {
        print_subsection("CWDH");
        for (const auto& node : font.get_width_chain()) {
            std::cout << "  [" << node.first_index << ", " << node.last_index << "] "
                      << node.records.size() << " records\n";
        }
    }

    void dump_maps(const font_file& font, std::size_t sample) {
        print_subsection("CMAP");
        for (const auto& node : font.get_map_chain()) {
            std::cout << "  " << std::setw(6) << font_codec::mapping_type_name(node.type())
                      << " " << hex(node.code_begin) << " - " << hex(node.code_end) << "\n";
        }

        const auto& map = font.get_char_map();
        std::cout << "  mapped codes: " << map.size() << "\n";
        std::size_t shown = 0;
        for (const auto& [code, glyph] : map) {
            if (shown++ == sample) {
                std::cout << "    ...\n";
                break;
            }
            const auto pos = font.glyph_position(glyph);
            std::cout << "    U+" << std::hex << std::uppercase << std::setw(4) << std::setfill('0') << code
                      << std::dec << std::setfill(' ') << " -> glyph " << glyph
                      << " (sheet " << pos.sheet << ", row " << pos.row << ", column " << pos.column << ")";
            if (const auto w = font.lookup_width(glyph)) {
                std::cout << " width " << static_cast<int>(w->char_width);
            }
            std::cout << "\n";
        }

        if (const auto& kerning = font.get_kerning()) {
            print_subsection("KRNG");
            std::cout << "  " << kerning->data.size() << " bytes\n";
        }
    }

    bool dump_font(const std::filesystem::path& path) {
        print_separator(path.filename().string());
        try {
            const auto font = font_codec::load(path);
            dump_header(font);
            dump_texture(font);
            dump_widths(font);
            dump_maps(font, 16);
        } catch (const std::exception& e) {
            std::cout << "  Error: " << e.what() << "\n";
            return false;
        }
        return true;
    }
}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <font.bffnt> [more fonts...]\n";
        return 1;
    }

    int failures = 0;
    for (int i = 1; i < argc; ++i) {
        if (!dump_font(argv[i])) {
            ++failures;
        }
    }

    std::cout << "\n" << std::string(70, '=') << "\n";
    std::cout << "Done.\n";

    return failures == 0 ? 0 : 2;
}
