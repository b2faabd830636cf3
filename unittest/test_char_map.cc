//
// Created by bffnt_kit contributors on 13/10/2026.
//
// Unit tests for CMAP chain flattening and synchronization
//

#include <doctest/doctest.h>
#include <bffnt/char_map.hh>
#include <vector>

using namespace bffnt;

namespace {
    map_node direct(std::uint32_t begin, std::uint32_t end, std::uint16_t offset) {
        map_node node;
        node.code_begin = begin;
        node.code_end = end;
        node.mapping = direct_mapping{offset};
        return node;
    }

    map_node table(std::uint32_t begin, std::vector<std::int16_t> entries) {
        map_node node;
        node.code_begin = begin;
        node.code_end = begin + static_cast<std::uint32_t>(entries.size()) - 1;
        node.mapping = table_mapping{std::move(entries)};
        return node;
    }

    map_node scan(std::vector<scan_entry> entries) {
        map_node node;
        node.code_begin = entries.empty() ? 0 : entries.front().code;
        node.code_end = entries.empty() ? 0 : entries.back().code;
        node.mapping = scan_mapping{std::move(entries)};
        return node;
    }

    std::vector<std::int16_t> table_10_to_20(std::size_t index, std::int16_t glyph) {
        std::vector<std::int16_t> t(11, unmapped_entry);
        t[index] = glyph;
        return t;
    }
}

TEST_SUITE("char_map") {

    TEST_CASE("direct maps a code range") {
        const auto flat = flatten_map_chain({direct(0x20, 0x22, 5)});
        CHECK(flat == code_map{{0x20, 5}, {0x21, 6}, {0x22, 7}});
    }

    TEST_CASE("direct stops below the unmapped glyph") {
        const auto flat = flatten_map_chain({direct(100, 110, 0xFFFC)});
        CHECK(flat == code_map{{100, 0xFFFC}, {101, 0xFFFD}, {102, 0xFFFE}});
    }

    TEST_CASE("table and scan skip -1 entries") {
        const auto flat = flatten_map_chain({table(5, {3, -1, 4}), scan({{9, -1}, {12, 8}})});
        CHECK(flat == code_map{{5, 3}, {7, 4}, {12, 8}});
    }

    TEST_CASE("direct first, table entry on code 10") {
        // Table [999, -1, ...] maps code 10; code 15 keeps its Direct glyph
        const auto flat = flatten_map_chain({direct(10, 20, 100), table(10, table_10_to_20(0, 999))});
        CHECK(flat.at(15) == 105);
        CHECK(flat.at(10) == 999);
        CHECK(flat.size() == 11);
    }

    TEST_CASE("table first, direct never overwrites") {
        const auto flat = flatten_map_chain({table(10, table_10_to_20(0, 999)), direct(10, 20, 100)});
        CHECK(flat.at(10) == 999);
        CHECK(flat.at(15) == 105);
    }

    TEST_CASE("table entry on code 15 wins in both orders") {
        const auto direct_first = flatten_map_chain({direct(10, 20, 100), table(10, table_10_to_20(5, 999))});
        const auto table_first = flatten_map_chain({table(10, table_10_to_20(5, 999)), direct(10, 20, 100)});
        CHECK(direct_first.at(15) == 999);
        CHECK(table_first.at(15) == 999);
        CHECK(direct_first.at(14) == 104);
    }

    TEST_CASE("later scan overwrites earlier table") {
        const auto flat = flatten_map_chain({table(1, {10, 11}), scan({{2, 50}})});
        CHECK(flat.at(1) == 10);
        CHECK(flat.at(2) == 50);
    }

    TEST_CASE("sync with no change leaves the chain alone") {
        std::vector<map_node> chain = {direct(10, 12, 1), scan({{40, 9}})};
        const auto before = chain;
        const auto result = sync_map_chain(chain, flatten_map_chain(chain));
        CHECK_FALSE(result.changed());
        CHECK(chain == before);
    }

    TEST_CASE("update inside a direct section converts it to scan") {
        std::vector<map_node> chain = {direct(10, 12, 1), scan({{40, 9}})};
        auto live = flatten_map_chain(chain);
        live[11] = 77;

        const auto result = sync_map_chain(chain, live);
        CHECK(result.updated == 1);
        CHECK(result.converted_nodes == 1);
        CHECK(result.created_nodes == 0);
        REQUIRE(chain.size() == 2);
        CHECK(chain[0].type() == mapping_type::SCAN);
        CHECK(chain[0].code_begin == 10);
        CHECK(chain[0].code_end == 12);
        CHECK(flatten_map_chain(chain) == live);
    }

    TEST_CASE("update of a table entry stays in the table") {
        std::vector<map_node> chain = {table(0, {1, 2, 3})};
        auto live = flatten_map_chain(chain);
        live[1] = 20;

        sync_map_chain(chain, live);
        REQUIRE(chain.size() == 1);
        CHECK(std::get<table_mapping>(chain[0].mapping).table == std::vector<std::int16_t>{1, 20, 3});
    }

    TEST_CASE("delete from every section") {
        std::vector<map_node> chain = {direct(10, 12, 1), table(10, {5, 6, 7}), scan({{11, 9}, {30, 3}})};
        auto live = flatten_map_chain(chain);
        live.erase(11);
        live.erase(30);

        const auto result = sync_map_chain(chain, live);
        CHECK(result.deleted == 2);
        CHECK(flatten_map_chain(chain) == live);
        CHECK(std::get<table_mapping>(chain[1].mapping).table[1] == unmapped_entry);
        const auto& entries = std::get<scan_mapping>(chain[2].mapping).entries;
        CHECK(entries.empty());
    }

    TEST_CASE("deleted code no longer produced by a direct section") {
        std::vector<map_node> chain = {direct(0, 3, 0)};
        auto live = flatten_map_chain(chain);
        live.erase(2);

        sync_map_chain(chain, live);
        CHECK(chain[0].type() == mapping_type::SCAN);
        CHECK(flatten_map_chain(chain) == code_map{{0, 0}, {1, 1}, {3, 3}});
    }

    TEST_CASE("additions prefer a covering table") {
        std::vector<map_node> chain = {table(0, {1, -1, 3}), scan({{100, 4}})};
        auto live = flatten_map_chain(chain);
        live[1] = 2;

        const auto result = sync_map_chain(chain, live);
        CHECK(result.added == 1);
        CHECK(std::get<table_mapping>(chain[0].mapping).table[1] == 2);
        CHECK(std::get<scan_mapping>(chain[1].mapping).entries.size() == 1);
    }

    TEST_CASE("additions go into the last scan, sorted") {
        std::vector<map_node> chain = {scan({{5, 1}}), direct(20, 21, 2), scan({{50, 3}, {60, 4}})};
        auto live = flatten_map_chain(chain);
        live[55] = 9;
        live[70] = 10;
        live[1] = 11;

        sync_map_chain(chain, live);
        REQUIRE(chain.size() == 3);
        const auto& entries = std::get<scan_mapping>(chain[2].mapping).entries;
        REQUIRE(entries.size() == 5);
        CHECK(entries[0].code == 1);
        CHECK(entries[2].code == 55);
        CHECK(entries[4].code == 70);
        CHECK(chain[2].code_begin == 1);
        CHECK(chain[2].code_end == 70);
        CHECK(flatten_map_chain(chain) == live);
    }

    TEST_CASE("additions create a scan section when none exists") {
        std::vector<map_node> chain = {direct(0, 1, 0)};
        auto live = flatten_map_chain(chain);
        live[0x3042] = 7;

        const auto result = sync_map_chain(chain, live);
        CHECK(result.created_nodes == 1);
        REQUIRE(chain.size() == 2);
        CHECK(chain[1].type() == mapping_type::SCAN);
        CHECK(chain[1].code_begin == 0x3042);
        CHECK(flatten_map_chain(chain) == live);
    }

    TEST_CASE("unmapped glyph value means absent") {
        std::vector<map_node> chain = {scan({{1, 1}, {2, 2}})};
        auto live = flatten_map_chain(chain);
        live[2] = unmapped_glyph;

        const auto result = sync_map_chain(chain, live);
        CHECK(result.deleted == 1);
        CHECK(flatten_map_chain(chain) == code_map{{1, 1}});
    }

    TEST_CASE("sync is idempotent") {
        std::vector<map_node> chain = {direct(10, 20, 100), table(30, {1, -1, 2}), scan({{90, 5}})};
        auto live = flatten_map_chain(chain);
        live[15] = 500;
        live.erase(30);
        live[31] = 6;
        live[200] = 7;

        sync_map_chain(chain, live);
        const auto once = chain;
        const auto second = sync_map_chain(chain, live);
        CHECK_FALSE(second.changed());
        CHECK(chain == once);
        CHECK(flatten_map_chain(chain) == live);
    }
}
