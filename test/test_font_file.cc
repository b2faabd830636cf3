//
// Created by bffnt_kit contributors on 15/10/2026.
//
// Tests for font_file width records, cell positions and map edits
//

#include <doctest/doctest.h>
#include <bffnt/font_codec.hh>
#include <bffnt/errors.hh>
#include "test_data.hh"

using namespace bffnt;
using namespace bffnt::test;

namespace {
    font_file parse_with_widths(std::vector<std::pair<std::uint16_t, std::vector<width_record>>> widths) {
        synthetic_font spec;
        spec.widths = std::move(widths);
        return font_codec::parse(spec.build());
    }

    const width_record default_width{0, 6, 7};
}

TEST_SUITE("font_file") {

    TEST_CASE("lookup_width indexes into the covering node") {
        const auto font = font_codec::parse(synthetic_font{}.build());
        CHECK(font.lookup_width(1) == width_record{1, 2, 3});
        CHECK(font.lookup_width(3) == width_record{0, 1, 2});
        CHECK_FALSE(font.lookup_width(4));
    }

    TEST_CASE("ensure_width on an empty chain creates one node") {
        auto font = parse_with_widths({});
        const auto sections = font.get_header().section_count;

        CHECK(font.ensure_width(5) == default_width);
        REQUIRE(font.get_width_chain().size() == 1);
        CHECK(font.get_width_chain()[0].first_index == 5);
        CHECK(font.get_width_chain()[0].last_index == 5);
        CHECK(font.get_header().section_count == sections + 1);
    }

    TEST_CASE("ensure_width one above the last glyph adds one record") {
        auto font = font_codec::parse(synthetic_font{}.build());
        const auto sections = font.get_header().section_count;

        font.ensure_width(4);
        REQUIRE(font.get_width_chain().size() == 1);
        CHECK(font.get_width_chain()[0].last_index == 4);
        CHECK(font.get_width_chain()[0].records.size() == 5);
        CHECK(font.get_header().section_count == sections);
    }

    TEST_CASE("ensure_width far above backfills with default records") {
        auto font = font_codec::parse(synthetic_font{}.build());

        font.ensure_width(10);
        const auto& node = font.get_width_chain()[0];
        CHECK(node.last_index == 10);
        CHECK(node.records.size() == 4 + (10 - 3));
        for (std::uint16_t g = 4; g <= 10; ++g) {
            CHECK(font.lookup_width(g) == default_width);
        }
        CHECK(font.lookup_width(2) == width_record{-1, 3, 3});
    }

    TEST_CASE("ensure_width below the first node grows it downwards") {
        auto font = parse_with_widths({{5, {{1, 1, 1}}}});

        font.ensure_width(2);
        REQUIRE(font.get_width_chain().size() == 1);
        const auto& node = font.get_width_chain()[0];
        CHECK(node.first_index == 2);
        CHECK(node.records.size() == 4);
        CHECK(font.lookup_width(5) == width_record{1, 1, 1});
        CHECK(font.lookup_width(3) == default_width);
    }

    TEST_CASE("ensure_width between nodes inserts a new node") {
        auto font = parse_with_widths({{0, {{1, 1, 1}}}, {10, {{2, 2, 2}}}});
        const auto sections = font.get_header().section_count;

        font.ensure_width(5);
        const auto& chain = font.get_width_chain();
        REQUIRE(chain.size() == 3);
        CHECK(chain[1].first_index == 5);
        CHECK(chain[1].last_index == 5);
        CHECK(chain[2].first_index == 10);
        CHECK(font.get_header().section_count == sections + 1);
    }

    TEST_CASE("ensure_width returns the existing record") {
        auto font = font_codec::parse(synthetic_font{}.build());
        font.ensure_width(1).char_width = 9;
        CHECK(font.lookup_width(1)->char_width == 9);
        CHECK(font.get_width_chain()[0].records.size() == 4);
    }

    TEST_CASE("set_width only touches covered glyphs") {
        auto font = font_codec::parse(synthetic_font{}.build());
        CHECK(font.set_width(0, {2, 2, 2}));
        CHECK(font.lookup_width(0) == width_record{2, 2, 2});
        CHECK_FALSE(font.set_width(40, {2, 2, 2}));
        CHECK_FALSE(font.lookup_width(40));
    }

    TEST_CASE("extended width chain survives a write") {
        auto font = parse_with_widths({{0, {{1, 1, 1}}}, {10, {{2, 2, 2}}}});
        font.ensure_width(5) = {3, 3, 3};
        font.ensure_width(12);

        const auto reparsed = font_codec::parse(font_codec::write(font));
        CHECK(reparsed.get_width_chain().size() == 3);
        CHECK(reparsed.lookup_width(5) == width_record{3, 3, 3});
        CHECK(reparsed.lookup_width(11) == default_width);
        CHECK(reparsed.get_header().section_count == font.get_header().section_count);
    }

    TEST_CASE("set_info changes metrics but not section offsets") {
        auto font = font_codec::parse(synthetic_font{}.build());
        auto info = font.get_info();
        info.line_feed = 12;
        info.default_width = {1, 4, 5};
        info.cmap_offset = 0xDEAD;
        font.set_info(info);

        const auto bytes = font_codec::write(font);
        const auto reparsed = font_codec::parse(bytes);
        CHECK(reparsed.get_info().line_feed == 12);
        CHECK(reparsed.get_info().default_width == width_record{1, 4, 5});
        CHECK(reparsed.get_char_map() == font.get_char_map());

        auto fresh = parse_with_widths({});
        fresh.set_info(info);
        CHECK(fresh.ensure_width(0) == width_record{1, 4, 5});
    }

    TEST_CASE("glyph_position walks cells row by row") {
        const auto font = font_codec::parse(synthetic_font{}.build());
        CHECK(font.glyph_position(0) == glyph_location{0, 0, 0});
        CHECK(font.glyph_position(3) == glyph_location{0, 1, 1});
        CHECK(font.glyph_position(5) == glyph_location{1, 0, 1});
    }

    TEST_CASE("glyph_position without cells is a geometry error") {
        auto bytes = synthetic_font{}.build();
        bytes[0x48] = 0;    // cells per row
        const auto font = font_codec::parse(bytes);
        CHECK_THROWS_AS((void)font.glyph_position(0), geometry_error);
    }

    TEST_CASE("set_char_map drops unmapped entries") {
        auto font = font_codec::parse(synthetic_font{}.build());
        font.set_char_map({{0x41, 0}, {0x42, unmapped_glyph}, {0x43, 4}});
        CHECK(font.get_char_map() == code_map{{0x41, 0}, {0x43, 4}});
    }

    TEST_CASE("sync_char_map rewrites the chain") {
        auto font = font_codec::parse(synthetic_font{}.build());
        font.set_char_map({{0x41, 3}, {0x3042, 2}});

        const auto result = font.sync_char_map();
        CHECK(result.updated == 1);
        CHECK(result.added == 1);
        CHECK(result.deleted == 1);
        CHECK(flatten_map_chain(font.get_map_chain()) == font.get_char_map());
        CHECK_FALSE(font.sync_char_map().changed());
    }
}
