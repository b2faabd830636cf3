/**
 * @file errors.hh
 * @brief Exception types raised by the BFFNT/BNTX codec.
 *
 * Every failure of the codec is reported as one of three exception types,
 * all derived from std::runtime_error so callers that do not care about the
 * classification can catch the base class:
 *
 * | Exception | Raised when |
 * |-----------|-------------|
 * | format_error | a section tag, byte-order mark, mapping type or pixel format is not what the format allows |
 * | truncation_error | the stream ends before a field or a declared section does |
 * | geometry_error | declared texture dimensions produce zero blocks, or more texels than the payload holds |
 *
 * Messages always name the section being decoded (e.g. "CMAP", "BRTI").
 *
 * @code{.cpp}
 * try {
 *     auto font = font_codec::load("nintendo_ext.bffnt");
 * } catch (const bffnt::format_error& e) {
 *     std::cerr << "Not a font: " << e.what() << "\n";
 * } catch (const bffnt::truncation_error& e) {
 *     std::cerr << "File is cut short: " << e.what() << "\n";
 * }
 * @endcode
 */

#pragma once

#include <bffnt/export.h>
#include <stdexcept>

namespace bffnt {
    /**
     * @brief A tag, marker or enumerated field holds a value the format does not allow.
     */
    class BFFNT_EXPORT format_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief The byte stream is shorter than a field or declared section requires.
     */
    class BFFNT_EXPORT truncation_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };

    /**
     * @brief Declared texture dimensions describe no pixel block, or more than the data holds.
     */
    class BFFNT_EXPORT geometry_error : public std::runtime_error {
    public:
        using std::runtime_error::runtime_error;
    };
}
