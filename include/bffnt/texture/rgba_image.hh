/**
 * @file rgba_image.hh
 * @brief Straight-alpha RGBA8 pixel buffer for decoded texture sheets.
 *
 * Decoded sheets and glyph cells are handed to callers as rgba_image.
 * Pixels are stored row-major, top row first, 4 bytes per pixel in
 * R, G, B, A order.
 *
 * @section rgba_usage Usage
 *
 * @code{.cpp}
 * auto sheets = sheet_codec::decode_sheets(font);
 * rgba_image& sheet = sheets[0];
 *
 * // Alpha of a pixel
 * uint8_t a = sheet.pixel(10, 4).a;
 *
 * // Hand the buffer to an image writer
 * write_png("sheet0.png", sheet.width(), sheet.height(), sheet.data());
 * @endcode
 */

#pragma once

#include <bffnt/export.h>
#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <vector>

namespace bffnt {
    /**
     * @brief One RGBA8 pixel.
     */
    struct BFFNT_EXPORT rgba {
        std::uint8_t r = 0;
        std::uint8_t g = 0;
        std::uint8_t b = 0;
        std::uint8_t a = 0;

        bool operator==(const rgba&) const = default;
    };

    /**
     * @brief In-memory RGBA8 image.
     */
    class BFFNT_EXPORT rgba_image {
    public:
        static constexpr std::size_t channels = 4;

        rgba_image() = default;

        /**
         * @brief Construct a transparent black image.
         * @param width Width in pixels
         * @param height Height in pixels
         * @pre width >= 0 && height >= 0
         */
        rgba_image(int width, int height)
            : m_width(width)
              , m_height(height)
              , m_data(static_cast<std::size_t>(width) * static_cast<std::size_t>(height) * channels, 0) {
        }

        [[nodiscard]] int width() const noexcept { return m_width; }
        [[nodiscard]] int height() const noexcept { return m_height; }

        [[nodiscard]] const std::uint8_t* data() const noexcept { return m_data.data(); }
        [[nodiscard]] std::uint8_t* data() noexcept { return m_data.data(); }

        /**
         * @brief Size of the pixel buffer in bytes.
         */
        [[nodiscard]] std::size_t size() const noexcept { return m_data.size(); }

        /**
         * @brief Get pixel at position.
         * @return Pixel value, or transparent black if out of bounds
         */
        [[nodiscard]] rgba pixel(int x, int y) const noexcept {
            if (!contains(x, y)) {
                return {};
            }
            const std::uint8_t* p = m_data.data() + offset(x, y);
            return {p[0], p[1], p[2], p[3]};
        }

        /**
         * @brief Set pixel at position; out of bounds writes are ignored.
         */
        void set_pixel(int x, int y, rgba value) noexcept {
            if (!contains(x, y)) {
                return;
            }
            std::uint8_t* p = m_data.data() + offset(x, y);
            p[0] = value.r;
            p[1] = value.g;
            p[2] = value.b;
            p[3] = value.a;
        }

        /**
         * @brief Alpha channel, row-major, one byte per pixel.
         */
        [[nodiscard]] std::vector<std::uint8_t> alpha() const {
            std::vector<std::uint8_t> out(m_data.size() / channels);
            for (std::size_t i = 0; i < out.size(); ++i) {
                out[i] = m_data[i * channels + 3];
            }
            return out;
        }

        /**
         * @brief Mirror the image top to bottom.
         */
        void flip_vertical() noexcept {
            const std::size_t row = static_cast<std::size_t>(m_width) * channels;
            for (int top = 0, bottom = m_height - 1; top < bottom; ++top, --bottom) {
                std::swap_ranges(m_data.begin() + static_cast<std::ptrdiff_t>(top * row),
                                 m_data.begin() + static_cast<std::ptrdiff_t>((top + 1) * row),
                                 m_data.begin() + static_cast<std::ptrdiff_t>(bottom * row));
            }
        }

        /**
         * @brief Copy a w x h region starting at (x, y).
         *
         * Parts of the region outside the image come back transparent.
         */
        [[nodiscard]] rgba_image crop(int x, int y, int w, int h) const {
            rgba_image out(w, h);
            for (int row = 0; row < h; ++row) {
                for (int col = 0; col < w; ++col) {
                    out.set_pixel(col, row, pixel(x + col, y + row));
                }
            }
            return out;
        }

        /**
         * @brief Copy src into this image with its top-left corner at (x, y).
         *
         * The copy is clipped to this image's bounds.
         */
        void blit(const rgba_image& src, int x, int y) {
            for (int row = 0; row < src.height(); ++row) {
                const int dst_y = y + row;
                if (dst_y < 0 || dst_y >= m_height) continue;

                int copy_start = 0;
                int copy_end = src.width();

                // Clip to image bounds
                if (x < 0) {
                    copy_start = -x;
                }
                if (x + copy_end > m_width) {
                    copy_end = m_width - x;
                }

                if (copy_start < copy_end) {
                    std::memcpy(m_data.data() + offset(x + copy_start, dst_y),
                                src.data() + src.offset(copy_start, row),
                                static_cast<std::size_t>(copy_end - copy_start) * channels);
                }
            }
        }

        bool operator==(const rgba_image&) const = default;

    private:
        [[nodiscard]] bool contains(int x, int y) const noexcept {
            return x >= 0 && x < m_width && y >= 0 && y < m_height;
        }

        [[nodiscard]] std::size_t offset(int x, int y) const noexcept {
            return (static_cast<std::size_t>(y) * static_cast<std::size_t>(m_width) +
                    static_cast<std::size_t>(x)) * channels;
        }

        int m_width = 0;
        int m_height = 0;
        std::vector<std::uint8_t> m_data;
    };
}
