#pragma once

#include "common.hpp"

#include <stdexcept>

namespace pactflow
{
    // Little-endian byte codec used by transports that leave the process.
    class WireWriter
    {
    public:
        void write_u32(std::uint32_t v) { write_uint_(v, 4); }
        void write_u64(std::uint64_t v) { write_uint_(v, 8); }

        template <class I>
        void write_int(I v)
        {
            static_assert(std::is_integral_v<I>, "write_int requires an integral type");
            write_uint_(static_cast<std::uint64_t>(static_cast<std::make_unsigned_t<I>>(v)), sizeof(I));
        }

        // Host-order copy of a trivially copyable value.
        void write_raw(const void *data, std::size_t n)
        {
            const auto *p = static_cast<const std::byte *>(data);
            m_buf.insert(m_buf.end(), p, p + n);
        }

        void write_bytes(std::span<const std::byte> bytes)
        {
            write_u32(static_cast<std::uint32_t>(bytes.size()));
            m_buf.insert(m_buf.end(), bytes.begin(), bytes.end());
        }

        std::size_t size() const noexcept { return m_buf.size(); }

        ByteBuffer take() { return std::move(m_buf); }

    private:
        void write_uint_(std::uint64_t v, std::size_t width)
        {
            for (std::size_t i = 0; i < width; ++i)
            {
                m_buf.push_back(static_cast<std::byte>((v >> (8 * i)) & 0xFFu));
            }
        }

        ByteBuffer m_buf;
    };

    class WireReader
    {
    public:
        explicit WireReader(std::span<const std::byte> bytes) : m_bytes(bytes) {}

        bool eof() const { return m_pos >= m_bytes.size(); }
        std::size_t remaining() const { return m_bytes.size() - m_pos; }

        std::uint32_t read_u32() { return static_cast<std::uint32_t>(read_uint_(4)); }
        std::uint64_t read_u64() { return read_uint_(8); }

        template <class I>
        I read_int()
        {
            static_assert(std::is_integral_v<I>, "read_int requires an integral type");
            return static_cast<I>(static_cast<std::make_unsigned_t<I>>(read_uint_(sizeof(I))));
        }

        void read_raw(void *out, std::size_t n)
        {
            require_(n);
            if (n != 0)
            {
                std::memcpy(out, m_bytes.data() + m_pos, n);
            }
            m_pos += n;
        }

        ByteBuffer read_bytes()
        {
            const auto n = read_u32();
            require_(n);
            ByteBuffer out;
            out.insert(out.end(), m_bytes.begin() + static_cast<std::ptrdiff_t>(m_pos), m_bytes.begin() + static_cast<std::ptrdiff_t>(m_pos + n));
            m_pos += n;
            return out;
        }

    private:
        std::uint64_t read_uint_(std::size_t width)
        {
            require_(width);
            std::uint64_t out = 0;
            for (std::size_t i = 0; i < width; ++i)
            {
                out |= (static_cast<std::uint64_t>(static_cast<std::uint8_t>(m_bytes[m_pos++])) << (8 * i));
            }
            return out;
        }

        void require_(std::size_t n) const
        {
            if (n > m_bytes.size() - m_pos)
            {
                throw std::runtime_error("WireReader: truncated buffer");
            }
        }

        std::span<const std::byte> m_bytes;
        std::size_t m_pos = 0;
    };
}
