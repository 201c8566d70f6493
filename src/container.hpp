#pragma once

#include "common.hpp"

#include <iterator>

namespace pactflow
{
    // Batch-of-records abstraction. The fabric only needs a length for trace events;
    // the exchange fan-out additionally iterates items and rebuilds per-destination
    // batches. Specialize for containers that are not plain sequences.
    template <class C>
    struct ContainerTraits
    {
        using Item = typename C::value_type;

        static std::size_t length(const C &c) { return static_cast<std::size_t>(c.size()); }

        static bool empty(const C &c) { return c.empty(); }

        static void clear(C &c) { c.clear(); }

        static void push(C &c, Item item) { c.push_back(std::move(item)); }

        static auto begin(C &c) { return std::begin(c); }
        static auto end(C &c) { return std::end(c); }
    };

    template <class C>
    inline std::size_t record_count(const C &c)
    {
        return ContainerTraits<C>::length(c);
    }
}
