/**
 * @file font_codec.hh
 * @brief Reading and writing BFFNT font containers.
 *
 * font_codec is the entry point for turning bytes into a font_file and
 * back. It understands every platform variant of the container:
 *
 * | Magic | Byte order | Version | Platform | Codes | Sheets |
 * |-------|------------|---------|----------|-------|--------|
 * | RFNT / TNFR | any | any | WII | 16-bit | per-sheet blobs |
 * | CFNT | any | any | CTR | 16-bit | per-sheet blobs |
 * | FFNT | little | < 4.1 | CTR | 16-bit | per-sheet blobs |
 * | FFNT | big | any | CAFE | 16-bit | per-sheet blobs |
 * | FFNT | little | >= 4.1 | NX | 32-bit | one BNTX container |
 *
 * @section codec_errors Errors
 *
 * - format_error: unknown magic or byte order mark, wrong section tag,
 *   unsupported texture format or mapping type, looping chain; on write, a
 *   character code too wide for the platform
 * - truncation_error: a field or section runs past the end of the data
 * - std::runtime_error: a file cannot be opened, read or written
 *
 * A failed parse never yields a partially filled font.
 *
 * @section codec_usage Usage
 *
 * @code{.cpp}
 * auto font = font_codec::load("ui.bffnt");
 * std::cout << font_codec::platform_name(font.get_header().platform) << "\n";
 *
 * auto map = font.get_char_map();
 * map.erase(U'?');
 * font.set_char_map(map);
 *
 * font_codec::save(font, "ui_patched.bffnt");   // synchronizes CMAP first
 * @endcode
 */

#pragma once

#include <bffnt/export.h>
#include <bffnt/font_file.hh>
#include <cstdint>
#include <filesystem>
#include <span>
#include <string_view>
#include <vector>

namespace bffnt {
    /**
     * @brief Static entry points for parsing and serializing fonts.
     */
    struct BFFNT_EXPORT font_codec {
        /**
         * @brief Check whether data starts like a font container this library reads.
         *
         * Only the magic is inspected.
         */
        [[nodiscard]] static bool is_font(std::span<const std::uint8_t> data);

        /**
         * @brief Parse a complete container.
         * @throws format_error, truncation_error
         */
        [[nodiscard]] static font_file parse(std::span<const std::uint8_t> data);

        /**
         * @brief Read and parse a container file.
         * @throws std::runtime_error if the file cannot be read
         */
        [[nodiscard]] static font_file load(const std::filesystem::path& path);

        /**
         * @brief Serialize a font.
         *
         * The map chain is written as it is; call font_file::sync_char_map()
         * first if the flattened map was edited. An unmodified parsed font
         * serializes to the bytes it was parsed from.
         *
         * @throws format_error if a character code does not fit the 16-bit
         *         codes of a non-NX font, or a Scan section holds more than
         *         65535 entries
         */
        [[nodiscard]] static std::vector<std::uint8_t> write(const font_file& font);

        /**
         * @brief Synchronize the character map, serialize and store a font.
         * @throws format_error as write() does
         * @throws std::runtime_error if the file cannot be written
         */
        static void save(font_file& font, const std::filesystem::path& path);

        /**
         * @brief Get human-readable platform name.
         * @return Name like "NX (Switch)"
         */
        [[nodiscard]] static std::string_view platform_name(platform_type platform);

        /**
         * @brief Get human-readable texture format name.
         * @return Name like "BC4"
         */
        [[nodiscard]] static std::string_view texture_format_name(texture_format format);

        /**
         * @brief Get human-readable mapping type name.
         */
        [[nodiscard]] static std::string_view mapping_type_name(mapping_type type);
    };
}
