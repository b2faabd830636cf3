//
// Created by bffnt_kit contributors on 05/10/2026.
//
// Internal BFFNT section reader and writer declarations
//

#pragma once

#include <bffnt/font_file.hh>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace bffnt::internal {

    /// Chain nodes are padded to this boundary
    inline constexpr std::size_t section_alignment = 4;

    /// The sheet payload starts on this boundary, measured from the file start
    inline constexpr std::size_t texture_alignment = 0x1000;

    /// Offsets stored in the file point this far past the start of a section
    inline constexpr std::uint32_t section_prefix_size = 8;

    /// Parse a complete BFFNT container
    struct font_reader {
        static font_file read(std::span<const std::uint8_t> data);
    };

    /// Serialize a font_file, recomputing every size and offset
    struct font_writer {
        static std::vector<std::uint8_t> write(const font_file& font);
    };

}  // namespace bffnt::internal
