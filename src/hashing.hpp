#pragma once

#include "common.hpp"

#include <string_view>

namespace pactflow
{
    // Stable record hashes for Exchange. Unlike std::hash these give the same value
    // in every process and build, so records keep their destination across MPI ranks
    // and across versions.

    inline constexpr std::uint64_t splitmix64(std::uint64_t x) noexcept
    {
        x += 0x9e3779b97f4a7c15ULL;
        x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
        x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
        return x ^ (x >> 31);
    }

    inline constexpr std::uint64_t fnv1a64(std::string_view s) noexcept
    {
        std::uint64_t h = 1469598103934665603ULL;
        for (const char c : s)
        {
            h ^= static_cast<std::uint64_t>(static_cast<unsigned char>(c));
            h *= 1099511628211ULL;
        }
        return h;
    }

    // Hash for integral keys that should spread evenly (identity would route
    // sequential keys round-robin, which is often fine but skews on strided keys).
    struct MixHash
    {
        template <class I>
        std::uint64_t operator()(const I &key) const noexcept
        {
            static_assert(std::is_integral_v<I>, "MixHash requires an integral key");
            return splitmix64(static_cast<std::uint64_t>(key));
        }
    };

    struct StringHash
    {
        std::uint64_t operator()(std::string_view s) const noexcept { return fnv1a64(s); }
    };

    // Hashes the first element of a pair, for keyed records.
    template <class KeyHash>
    struct KeyOfPair
    {
        KeyHash keyHash{};

        template <class K, class V>
        std::uint64_t operator()(const std::pair<K, V> &kv) const
        {
            return keyHash(kv.first);
        }
    };
}
