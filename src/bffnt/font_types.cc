//
// Created by bffnt_kit contributors on 11/10/2026.
//
// Section record helpers
//

#include <bffnt/font_types.hh>

#include "utils/overloaded.hh"

namespace bffnt {
    std::size_t texture_page::payload_size() const noexcept {
        return std::visit(overloaded{
            [](const legacy_sheets& l) {
                std::size_t total = 0;
                for (const auto& sheet : l.sheets) {
                    total += sheet.size();
                }
                return total;
            },
            [](const embedded_texture& e) {
                return e.bntx.size();
            }
        }, payload);
    }

    std::vector<std::uint8_t> texture_page::payload_bytes() const {
        return std::visit(overloaded{
            [](const legacy_sheets& l) {
                std::vector<std::uint8_t> out;
                for (const auto& sheet : l.sheets) {
                    out.insert(out.end(), sheet.begin(), sheet.end());
                }
                return out;
            },
            [](const embedded_texture& e) {
                return e.bntx;
            }
        }, payload);
    }
}
