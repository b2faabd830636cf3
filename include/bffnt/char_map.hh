/**
 * @file char_map.hh
 * @brief Flattening and synchronization of CMAP chains.
 *
 * A font keeps two views of its character map:
 *
 * - the **chain**: CMAP sections exactly as stored on disk, each one a
 *   Direct, Table or Scan mapping over a code range;
 * - the **flattened map**: a code -> glyph dictionary that editors work on.
 *
 * flatten_map_chain() builds the second from the first. sync_map_chain()
 * goes the other way: it edits the chain in place until it flattens to a
 * given map, touching as few sections as it can. Some games look only at
 * Table sections for certain code ranges, so the on-disk shape is kept
 * wherever possible instead of regenerating the chain from scratch.
 *
 * @section flatten_rules Precedence
 *
 * Sections are applied in chain order:
 * - Direct sections only fill codes that are still missing;
 * - Table and Scan sections overwrite whatever was there.
 *
 * @code{.cpp}
 * std::vector<map_node> chain = font.get_map_chain();
 * code_map live = flatten_map_chain(chain);
 * live['A'] = 42;               // remap
 * live.erase('B');              // unmap
 * live[0x3042] = 900;           // add
 * auto stats = sync_map_chain(chain, live);
 * assert(flatten_map_chain(chain) == live);
 * @endcode
 */

#pragma once

#include <bffnt/export.h>
#include <bffnt/font_types.hh>
#include <cstddef>
#include <vector>

namespace bffnt {
    /**
     * @brief What a synchronization pass changed.
     */
    struct BFFNT_EXPORT map_sync_result {
        std::size_t added = 0;            ///< Codes absent from the old flattening
        std::size_t updated = 0;          ///< Codes whose glyph changed
        std::size_t deleted = 0;          ///< Codes no longer mapped
        std::size_t converted_nodes = 0;  ///< Direct sections rewritten as Scan
        std::size_t created_nodes = 0;    ///< Scan sections appended to the chain

        [[nodiscard]] bool changed() const noexcept {
            return added + updated + deleted != 0;
        }
    };

    /**
     * @brief Build the code -> glyph map a chain describes.
     *
     * Direct glyphs of 0xFFFF and above, and Table/Scan entries equal to -1,
     * produce no mapping.
     */
    [[nodiscard]] BFFNT_EXPORT code_map flatten_map_chain(const std::vector<map_node>& chain);

    /**
     * @brief Edit a chain in place so that it flattens to live.
     *
     * - Updates go to the section that owns the code (the one whose value
     *   wins in flatten_map_chain). A Direct owner cannot hold a single
     *   changed code, so it is rewritten as a Scan section once.
     * - Deletions are removed from every section that maps the code.
     * - Additions first go into Table sections whose range covers the code,
     *   then into the last Scan section (re-sorted, range widened), or into a
     *   new Scan section appended to the chain.
     *
     * Entries of live equal to unmapped_glyph are treated as absent.
     * Calling it again with the same map changes nothing.
     *
     * @param chain CMAP chain to edit
     * @param live Desired flattened map
     * @return Counts of what changed
     */
    BFFNT_EXPORT map_sync_result sync_map_chain(std::vector<map_node>& chain, const code_map& live);
}
