/**
 * @file byte_stream.hh
 * @brief Endian-aware cursor reader and seekable writer over byte buffers.
 *
 * The container formats handled by this library mix big- and little-endian
 * files, reference sections through absolute offsets, and get written with a
 * placeholder-then-backpatch strategy. These two classes cover exactly that:
 *
 * - byte_reader: bounds-checked cursor over a read-only span. Every read past
 *   the end throws truncation_error.
 * - byte_writer: growable buffer with a movable cursor. Writing at a position
 *   before the end overwrites, writing at the end appends, so a field can be
 *   emitted as a placeholder and patched after the data it describes exists.
 *
 * @code{.cpp}
 * byte_writer w(byte_order::little);
 * w.write_tag("CWDH");
 * const auto size_pos = w.tell();
 * w.write_u32(0);                 // placeholder
 * ...
 * w.align(4);
 * w.patch_u32(size_pos, static_cast<uint32_t>(w.tell() - start));
 * @endcode
 */

#pragma once

#include <bffnt/export.h>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace bffnt {
    /**
     * @brief Byte order of multi-byte integers in a stream.
     */
    enum class byte_order {
        little, ///< Least significant byte first (Switch, 3DS)
        big     ///< Most significant byte first (Wii, Wii U)
    };

    /**
     * @brief Length of every section tag ("FINF", "BNTX", ...).
     */
    inline constexpr std::size_t tag_size = 4;

    /**
     * @brief Bounds-checked reading cursor over a byte span.
     *
     * The reader does not own the bytes; the span must outlive it.
     */
    class BFFNT_EXPORT byte_reader {
    public:
        explicit byte_reader(std::span<const std::uint8_t> data,
                             byte_order order = byte_order::little) noexcept;

        [[nodiscard]] byte_order order() const noexcept;
        void set_order(byte_order order) noexcept;

        [[nodiscard]] std::size_t tell() const noexcept;
        [[nodiscard]] std::size_t size() const noexcept;
        [[nodiscard]] std::size_t remaining() const noexcept;

        /**
         * @brief Move the cursor to an absolute position.
         * @throws truncation_error if pos is beyond the end of the data
         */
        void seek(std::size_t pos);

        /**
         * @brief Advance the cursor by n bytes.
         * @throws truncation_error if fewer than n bytes remain
         */
        void skip(std::size_t n);

        [[nodiscard]] std::uint8_t read_u8();
        [[nodiscard]] std::int8_t read_s8();
        [[nodiscard]] std::uint16_t read_u16();
        [[nodiscard]] std::int16_t read_s16();
        [[nodiscard]] std::uint32_t read_u32();
        [[nodiscard]] std::int64_t read_s64();

        /**
         * @brief Read a 16-bit value in big-endian order regardless of order().
         *
         * Byte-order marks are always stored this way.
         */
        [[nodiscard]] std::uint16_t read_u16_be();

        /**
         * @brief Read a 4-character ASCII tag.
         */
        [[nodiscard]] std::string read_tag();

        /**
         * @brief Check whether the bytes at the cursor spell a tag, without moving.
         * @return false if the tag does not match or not enough bytes remain
         */
        [[nodiscard]] bool peek_tag(std::string_view tag) const noexcept;

        /**
         * @brief Read n raw bytes.
         * @return View into the underlying data
         */
        [[nodiscard]] std::span<const std::uint8_t> read_bytes(std::size_t n);

    private:
        void require(std::size_t n) const;
        [[nodiscard]] std::uint64_t read_uint(std::size_t n, byte_order order);

        std::span<const std::uint8_t> m_data;
        std::size_t m_pos = 0;
        byte_order m_order;
    };

    /**
     * @brief Growable, seekable byte buffer writer.
     *
     * Seeking is allowed anywhere inside the written range. Writes overwrite
     * existing bytes and extend the buffer when they run past its end.
     */
    class BFFNT_EXPORT byte_writer {
    public:
        explicit byte_writer(byte_order order = byte_order::little);

        [[nodiscard]] byte_order order() const noexcept;
        [[nodiscard]] std::size_t tell() const noexcept;
        [[nodiscard]] std::size_t size() const noexcept;

        /**
         * @brief Move the cursor to an absolute position within the written range.
         */
        void seek(std::size_t pos);

        void write_u8(std::uint8_t v);
        void write_s8(std::int8_t v);
        void write_u16(std::uint16_t v);
        void write_s16(std::int16_t v);
        void write_u32(std::uint32_t v);
        void write_s64(std::int64_t v);
        void write_u16_be(std::uint16_t v);

        /**
         * @brief Write a tag; must be exactly 4 characters.
         */
        void write_tag(std::string_view tag);

        void write_bytes(std::span<const std::uint8_t> bytes);
        void write_zeros(std::size_t n);

        /**
         * @brief Zero-fill up to the next multiple of alignment, measured from position 0.
         */
        void align(std::size_t alignment);

        /**
         * @brief Overwrite a 32-bit field at pos, leaving the cursor where it was.
         */
        void patch_u32(std::size_t pos, std::uint32_t v);

        [[nodiscard]] const std::vector<std::uint8_t>& data() const noexcept;
        [[nodiscard]] std::vector<std::uint8_t> release() &&;

    private:
        void put(const std::uint8_t* bytes, std::size_t n);
        void write_uint(std::uint64_t v, std::size_t n, byte_order order);

        std::vector<std::uint8_t> m_data;
        std::size_t m_pos = 0;
        byte_order m_order;
    };

    /**
     * @brief Round value up to a multiple of alignment (alignment must be a power of two).
     */
    [[nodiscard]] constexpr std::size_t align_up(std::size_t value, std::size_t alignment) noexcept {
        return (value + alignment - 1) & ~(alignment - 1);
    }
}
