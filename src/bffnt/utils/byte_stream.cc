//
// Created by bffnt_kit contributors on 02/10/2026.
//
// Endian-aware byte cursor and backpatching writer
//

#include <bffnt/utils/byte_stream.hh>
#include <bffnt/errors.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <utility>

namespace bffnt {
    // =============================================================================
    // byte_reader
    // =============================================================================
    byte_reader::byte_reader(std::span<const std::uint8_t> data, byte_order order) noexcept
        : m_data(data), m_order(order) {
    }

    byte_order byte_reader::order() const noexcept { return m_order; }

    void byte_reader::set_order(byte_order order) noexcept { m_order = order; }

    std::size_t byte_reader::tell() const noexcept { return m_pos; }

    std::size_t byte_reader::size() const noexcept { return m_data.size(); }

    std::size_t byte_reader::remaining() const noexcept { return m_data.size() - m_pos; }

    void byte_reader::seek(std::size_t pos) {
        THROW_IF(pos > m_data.size(), truncation_error,
                 "Seek to offset", pos, "past end of", m_data.size(), "byte stream");
        m_pos = pos;
    }

    void byte_reader::skip(std::size_t n) {
        require(n);
        m_pos += n;
    }

    void byte_reader::require(std::size_t n) const {
        THROW_IF(n > m_data.size() - m_pos, truncation_error,
                 "Need", n, "bytes at offset", m_pos, "but stream is", m_data.size(), "bytes");
    }

    std::uint64_t byte_reader::read_uint(std::size_t n, byte_order order) {
        require(n);
        const std::uint8_t* p = m_data.data() + m_pos;
        std::uint64_t v = 0;
        if (order == byte_order::little) {
            for (std::size_t i = n; i > 0; --i) {
                v = (v << 8) | p[i - 1];
            }
        } else {
            for (std::size_t i = 0; i < n; ++i) {
                v = (v << 8) | p[i];
            }
        }
        m_pos += n;
        return v;
    }

    std::uint8_t byte_reader::read_u8() {
        return static_cast<std::uint8_t>(read_uint(1, m_order));
    }

    std::int8_t byte_reader::read_s8() {
        return static_cast<std::int8_t>(read_u8());
    }

    std::uint16_t byte_reader::read_u16() {
        return static_cast<std::uint16_t>(read_uint(2, m_order));
    }

    std::int16_t byte_reader::read_s16() {
        return static_cast<std::int16_t>(read_u16());
    }

    std::uint32_t byte_reader::read_u32() {
        return static_cast<std::uint32_t>(read_uint(4, m_order));
    }

    std::int64_t byte_reader::read_s64() {
        return static_cast<std::int64_t>(read_uint(8, m_order));
    }

    std::uint16_t byte_reader::read_u16_be() {
        return static_cast<std::uint16_t>(read_uint(2, byte_order::big));
    }

    std::string byte_reader::read_tag() {
        auto bytes = read_bytes(tag_size);
        return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
    }

    bool byte_reader::peek_tag(std::string_view tag) const noexcept {
        if (tag.size() > m_data.size() - m_pos) {
            return false;
        }
        return std::equal(tag.begin(), tag.end(), m_data.begin() + static_cast<std::ptrdiff_t>(m_pos),
                          [](char a, std::uint8_t b) { return static_cast<std::uint8_t>(a) == b; });
    }

    std::span<const std::uint8_t> byte_reader::read_bytes(std::size_t n) {
        require(n);
        auto out = m_data.subspan(m_pos, n);
        m_pos += n;
        return out;
    }

    // =============================================================================
    // byte_writer
    // =============================================================================
    byte_writer::byte_writer(byte_order order)
        : m_order(order) {
    }

    byte_order byte_writer::order() const noexcept { return m_order; }

    std::size_t byte_writer::tell() const noexcept { return m_pos; }

    std::size_t byte_writer::size() const noexcept { return m_data.size(); }

    void byte_writer::seek(std::size_t pos) {
        ENFORCE(pos <= m_data.size());
        m_pos = pos;
    }

    void byte_writer::put(const std::uint8_t* bytes, std::size_t n) {
        if (m_pos + n > m_data.size()) {
            m_data.resize(m_pos + n, 0);
        }
        std::copy(bytes, bytes + n, m_data.begin() + static_cast<std::ptrdiff_t>(m_pos));
        m_pos += n;
    }

    void byte_writer::write_uint(std::uint64_t v, std::size_t n, byte_order order) {
        std::uint8_t buf[8];
        for (std::size_t i = 0; i < n; ++i) {
            const std::size_t shift = (order == byte_order::little) ? i : (n - 1 - i);
            buf[i] = static_cast<std::uint8_t>((v >> (shift * 8)) & 0xFFu);
        }
        put(buf, n);
    }

    void byte_writer::write_u8(std::uint8_t v) { write_uint(v, 1, m_order); }

    void byte_writer::write_s8(std::int8_t v) { write_u8(static_cast<std::uint8_t>(v)); }

    void byte_writer::write_u16(std::uint16_t v) { write_uint(v, 2, m_order); }

    void byte_writer::write_s16(std::int16_t v) { write_u16(static_cast<std::uint16_t>(v)); }

    void byte_writer::write_u32(std::uint32_t v) { write_uint(v, 4, m_order); }

    void byte_writer::write_s64(std::int64_t v) { write_uint(static_cast<std::uint64_t>(v), 8, m_order); }

    void byte_writer::write_u16_be(std::uint16_t v) { write_uint(v, 2, byte_order::big); }

    void byte_writer::write_tag(std::string_view tag) {
        ENFORCE(tag.size() == tag_size);
        put(reinterpret_cast<const std::uint8_t*>(tag.data()), tag.size());
    }

    void byte_writer::write_bytes(std::span<const std::uint8_t> bytes) {
        put(bytes.data(), bytes.size());
    }

    void byte_writer::write_zeros(std::size_t n) {
        const std::vector<std::uint8_t> zeros(n, 0);
        put(zeros.data(), n);
    }

    void byte_writer::align(std::size_t alignment) {
        const std::size_t aligned = align_up(m_pos, alignment);
        if (aligned > m_pos) {
            write_zeros(aligned - m_pos);
        }
    }

    void byte_writer::patch_u32(std::size_t pos, std::uint32_t v) {
        const std::size_t saved = m_pos;
        seek(pos);
        write_u32(v);
        m_pos = saved;
    }

    const std::vector<std::uint8_t>& byte_writer::data() const noexcept { return m_data; }

    std::vector<std::uint8_t> byte_writer::release() && {
        return std::move(m_data);
    }
}
