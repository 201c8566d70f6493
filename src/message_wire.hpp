#pragma once

#include "message.hpp"
#include "wire.hpp"

#include <algorithm>
#include <cstring>
#include <string>

namespace pactflow
{
    // Serialization of timestamps and records for inter-process channels.
    //
    // Integral values are fixed-width little-endian; other trivially copyable values
    // are copied in host byte order, so they only travel between like machines.
    // Specialize WireCodec for anything else.
    template <class T>
    struct WireCodec
    {
        static_assert(std::is_trivially_copyable_v<T>, "WireCodec: type is not trivially copyable; provide a specialization");

        static void encode(WireWriter &w, const T &v)
        {
            if constexpr (std::is_integral_v<T>)
            {
                w.write_int(v);
            }
            else
            {
                w.write_raw(&v, sizeof(T));
            }
        }

        static T decode(WireReader &r)
        {
            if constexpr (std::is_integral_v<T>)
            {
                return r.read_int<T>();
            }
            else
            {
                T v{};
                r.read_raw(&v, sizeof(T));
                return v;
            }
        }
    };

    template <>
    struct WireCodec<std::string>
    {
        static void encode(WireWriter &w, const std::string &s)
        {
            w.write_bytes(std::as_bytes(std::span<const char>(s.data(), s.size())));
        }

        static std::string decode(WireReader &r)
        {
            const ByteBuffer b = r.read_bytes();
            std::string out(b.size(), '\0');
            if (!b.empty())
            {
                std::memcpy(out.data(), b.data(), b.size());
            }
            return out;
        }
    };

    // One byte, 0 or 1. Any other value is rejected as corrupt.
    template <>
    struct WireCodec<bool>
    {
        static void encode(WireWriter &w, bool v) { w.write_int<std::uint8_t>(v ? 1 : 0); }

        static bool decode(WireReader &r)
        {
            const auto v = r.read_int<std::uint8_t>();
            if (v > 1)
            {
                throw std::runtime_error("WireCodec: bad bool byte");
            }
            return v == 1;
        }
    };

    template <class A, class B>
    struct WireCodec<std::pair<A, B>>
    {
        static void encode(WireWriter &w, const std::pair<A, B> &p)
        {
            WireCodec<A>::encode(w, p.first);
            WireCodec<B>::encode(w, p.second);
        }

        static std::pair<A, B> decode(WireReader &r)
        {
            A a = WireCodec<A>::decode(r);
            B b = WireCodec<B>::decode(r);
            return {std::move(a), std::move(b)};
        }
    };

    template <class D>
    struct WireCodec<std::vector<D>>
    {
        static void encode(WireWriter &w, const std::vector<D> &items)
        {
            w.write_u32(static_cast<std::uint32_t>(items.size()));
            for (const D &item : items)
            {
                WireCodec<D>::encode(w, item);
            }
        }

        static std::vector<D> decode(WireReader &r)
        {
            const std::uint32_t n = r.read_u32();
            std::vector<D> out;
            // Every item takes at least one byte; bounds the reservation on corrupt input.
            out.reserve(std::min<std::size_t>(n, r.remaining()));
            for (std::uint32_t i = 0; i < n; ++i)
            {
                out.push_back(WireCodec<D>::decode(r));
            }
            return out;
        }
    };

    template <class M>
    struct MessageCodec;

    // Layout: u64 seq | u32 from | time | data
    template <class T, class C>
    inline ByteBuffer encode_message(const Message<T, C> &msg)
    {
        WireWriter w;
        w.write_u64(msg.seq);
        w.write_u32(msg.from);
        WireCodec<T>::encode(w, msg.time);
        WireCodec<C>::encode(w, msg.data);
        return w.take();
    }

    template <class T, class C>
    inline Message<T, C> decode_message(std::span<const std::byte> bytes)
    {
        WireReader r(bytes);
        Message<T, C> msg;
        msg.seq = r.read_u64();
        msg.from = r.read_u32();
        msg.time = WireCodec<T>::decode(r);
        msg.data = WireCodec<C>::decode(r);
        if (!r.eof())
        {
            throw std::runtime_error("decode_message: trailing bytes");
        }
        return msg;
    }

    template <class T, class C>
    struct MessageCodec<Message<T, C>>
    {
        static ByteBuffer encode(const Message<T, C> &msg) { return encode_message(msg); }
        static Message<T, C> decode(std::span<const std::byte> bytes) { return decode_message<T, C>(bytes); }
    };
}
