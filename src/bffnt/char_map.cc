//
// Created by bffnt_kit contributors on 11/10/2026.
//
// CMAP chain flattening and in-place synchronization
//

#include <bffnt/char_map.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <map>
#include <set>

#include "utils/overloaded.hh"

namespace bffnt {

    namespace {
        // Last code of a Direct section whose glyph is still below 0xFFFF.
        // Returns false if no code of the section maps.
        bool direct_valid_end(const map_node& node, const direct_mapping& d, std::uint32_t& last) {
            if (node.code_end < node.code_begin || d.offset >= unmapped_glyph) {
                return false;
            }
            const std::uint32_t span = static_cast<std::uint32_t>(unmapped_glyph - 1 - d.offset);
            const std::uint64_t limit = static_cast<std::uint64_t>(node.code_begin) + span;
            last = static_cast<std::uint32_t>(std::min<std::uint64_t>(limit, node.code_end));
            return true;
        }

        std::uint16_t direct_glyph(const map_node& node, const direct_mapping& d, std::uint32_t code) {
            return static_cast<std::uint16_t>(code - node.code_begin + d.offset);
        }

        bool entry_mapped(std::int16_t glyph) {
            return glyph != unmapped_entry;
        }

        // Walk the chain with flattening precedence, calling sink(code, glyph, node_index)
        // for every write that lands in the flattened map.
        template<typename Sink>
        void walk_chain(const std::vector<map_node>& chain, code_map& flat, Sink&& sink) {
            for (std::size_t i = 0; i < chain.size(); ++i) {
                const auto& node = chain[i];
                std::visit(overloaded{
                    [&](const direct_mapping& d) {
                        std::uint32_t last = 0;
                        if (!direct_valid_end(node, d, last)) {
                            return;
                        }
                        for (std::uint64_t code = node.code_begin; code <= last; ++code) {
                            const auto c = static_cast<std::uint32_t>(code);
                            if (flat.emplace(c, direct_glyph(node, d, c)).second) {
                                sink(c, i);
                            }
                        }
                    },
                    [&](const table_mapping& t) {
                        for (std::size_t k = 0; k < t.table.size(); ++k) {
                            if (!entry_mapped(t.table[k])) {
                                continue;
                            }
                            const auto c = static_cast<std::uint32_t>(node.code_begin + k);
                            flat[c] = static_cast<std::uint16_t>(t.table[k]);
                            sink(c, i);
                        }
                    },
                    [&](const scan_mapping& s) {
                        for (const auto& e : s.entries) {
                            if (!entry_mapped(e.glyph)) {
                                continue;
                            }
                            flat[e.code] = static_cast<std::uint16_t>(e.glyph);
                            sink(e.code, i);
                        }
                    }
                }, node.mapping);
            }
        }

        void fit_scan_range(map_node& node) {
            const auto& entries = std::get<scan_mapping>(node.mapping).entries;
            if (entries.empty()) {
                return;
            }
            auto [lo, hi] = std::minmax_element(entries.begin(), entries.end(),
                                                [](const scan_entry& a, const scan_entry& b) {
                                                    return a.code < b.code;
                                                });
            node.code_begin = lo->code;
            node.code_end = hi->code;
        }

        // Rewrite a Direct section as Scan, keeping only the codes it owned.
        void convert_direct(std::vector<map_node>& chain, std::size_t index,
                            const std::map<std::uint32_t, std::size_t>& owners,
                            const code_map& updated, const std::set<std::uint32_t>& deleted) {
            auto& node = chain[index];
            const auto d = std::get<direct_mapping>(node.mapping);

            scan_mapping scan;
            std::uint32_t last = 0;
            if (direct_valid_end(node, d, last)) {
                for (std::uint64_t code = node.code_begin; code <= last; ++code) {
                    const auto c = static_cast<std::uint32_t>(code);
                    if (deleted.contains(c)) {
                        continue;
                    }
                    auto owner = owners.find(c);
                    if (owner == owners.end() || owner->second != index) {
                        continue;
                    }
                    auto upd = updated.find(c);
                    const std::uint16_t glyph = upd != updated.end() ? upd->second : direct_glyph(node, d, c);
                    scan.entries.push_back({c, static_cast<std::int16_t>(glyph)});
                }
            }

            node.mapping = std::move(scan);
            fit_scan_range(node);
        }
    }

    code_map flatten_map_chain(const std::vector<map_node>& chain) {
        code_map flat;
        walk_chain(chain, flat, [](std::uint32_t, std::size_t) {});
        return flat;
    }

    map_sync_result sync_map_chain(std::vector<map_node>& chain, const code_map& live) {
        map_sync_result result;

        code_map wanted;
        for (const auto& [code, glyph] : live) {
            if (glyph != unmapped_glyph) {
                wanted.emplace(code, glyph);
            }
        }

        code_map old_flat;
        std::map<std::uint32_t, std::size_t> owners;
        walk_chain(chain, old_flat, [&](std::uint32_t code, std::size_t node) { owners[code] = node; });

        if (old_flat == wanted) {
            return result;
        }

        code_map added;
        code_map updated;
        std::set<std::uint32_t> deleted;
        for (const auto& [code, glyph] : wanted) {
            auto it = old_flat.find(code);
            if (it == old_flat.end()) {
                added.emplace(code, glyph);
            } else if (it->second != glyph) {
                updated.emplace(code, glyph);
            }
        }
        for (const auto& [code, glyph] : old_flat) {
            if (!wanted.contains(code)) {
                deleted.insert(code);
            }
        }
        result.added = added.size();
        result.updated = updated.size();
        result.deleted = deleted.size();

        // Direct sections that must become Scan: owners of updated codes, and any
        // Direct still producing a deleted code.
        std::set<std::size_t> to_convert;
        for (const auto& [code, glyph] : updated) {
            const std::size_t owner = owners.at(code);
            if (chain[owner].type() == mapping_type::DIRECT) {
                to_convert.insert(owner);
            }
        }
        for (const auto code : deleted) {
            for (std::size_t i = 0; i < chain.size(); ++i) {
                const auto* d = std::get_if<direct_mapping>(&chain[i].mapping);
                std::uint32_t last = 0;
                if (d && direct_valid_end(chain[i], *d, last) && code >= chain[i].code_begin && code <= last) {
                    to_convert.insert(i);
                }
            }
        }
        for (const auto index : to_convert) {
            convert_direct(chain, index, owners, updated, deleted);
        }
        result.converted_nodes = to_convert.size();

        // Updates owned by Table or Scan sections are written in place.
        std::set<std::size_t> touched_scans;
        for (const auto& [code, glyph] : updated) {
            const std::size_t owner = owners.at(code);
            if (to_convert.contains(owner)) {
                continue;
            }
            auto& node = chain[owner];
            if (auto* t = std::get_if<table_mapping>(&node.mapping)) {
                t->table[code - node.code_begin] = static_cast<std::int16_t>(glyph);
            } else if (auto* s = std::get_if<scan_mapping>(&node.mapping)) {
                for (auto& e : s->entries) {
                    if (e.code == code) {
                        e.glyph = static_cast<std::int16_t>(glyph);
                    }
                }
                touched_scans.insert(owner);
            }
        }

        // Deletions are cleared from every Table and Scan section.
        if (!deleted.empty()) {
            for (std::size_t i = 0; i < chain.size(); ++i) {
                if (to_convert.contains(i)) {
                    continue;
                }
                auto& node = chain[i];
                if (auto* t = std::get_if<table_mapping>(&node.mapping)) {
                    for (std::size_t k = 0; k < t->table.size(); ++k) {
                        if (deleted.contains(static_cast<std::uint32_t>(node.code_begin + k))) {
                            t->table[k] = unmapped_entry;
                        }
                    }
                } else if (auto* s = std::get_if<scan_mapping>(&node.mapping)) {
                    const auto before = s->entries.size();
                    std::erase_if(s->entries, [&](const scan_entry& e) { return deleted.contains(e.code); });
                    if (s->entries.size() != before) {
                        touched_scans.insert(i);
                    }
                }
            }
        }
        for (const auto index : touched_scans) {
            fit_scan_range(chain[index]);
        }

        // Additions: Table sections covering the code first.
        for (auto& node : chain) {
            auto* t = std::get_if<table_mapping>(&node.mapping);
            if (!t || added.empty()) {
                continue;
            }
            for (auto it = added.begin(); it != added.end();) {
                const std::uint32_t code = it->first;
                if (node.covers(code) && code - node.code_begin < t->table.size()) {
                    t->table[code - node.code_begin] = static_cast<std::int16_t>(it->second);
                    it = added.erase(it);
                } else {
                    ++it;
                }
            }
        }

        // Then the last Scan section, or a new one.
        if (!added.empty()) {
            auto last_scan = std::find_if(chain.rbegin(), chain.rend(), [](const map_node& n) {
                return n.type() == mapping_type::SCAN;
            });

            if (last_scan == chain.rend()) {
                map_node node;
                auto& entries = node.mapping.emplace<scan_mapping>().entries;
                for (const auto& [code, glyph] : added) {
                    entries.push_back({code, static_cast<std::int16_t>(glyph)});
                }
                fit_scan_range(node);
                chain.push_back(std::move(node));
                result.created_nodes = 1;
            } else {
                auto& entries = std::get<scan_mapping>(last_scan->mapping).entries;
                for (const auto& [code, glyph] : added) {
                    entries.push_back({code, static_cast<std::int16_t>(glyph)});
                }
                std::stable_sort(entries.begin(), entries.end(), [](const scan_entry& a, const scan_entry& b) {
                    return a.code < b.code;
                });
                fit_scan_range(*last_scan);
            }
        }

        LOG_DEBUG("CMAP sync:", result.added, "added,", result.updated, "updated,", result.deleted,
                  "deleted,", result.converted_nodes, "direct sections converted,",
                  result.created_nodes, "sections created");

        if (flatten_map_chain(chain) != wanted) {
            LOG_WARN("CMAP chain does not reproduce the character map after synchronization");
        }
        return result;
    }
}
