#pragma once

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <limits>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace pactflow
{
    using WorkerIndex = std::uint32_t;
    using ChannelId = std::uint32_t;
    using SeqNo = std::uint64_t;

    using ByteBuffer = std::vector<std::byte>;

    // Structural path of the operator that owns a channel. Shared and immutable so
    // every endpoint of an edge can hold it without copying.
    using Address = std::shared_ptr<const std::vector<std::size_t>>;

    inline Address make_address(std::vector<std::size_t> path)
    {
        return std::make_shared<const std::vector<std::size_t>>(std::move(path));
    }

    inline std::string address_to_string(const Address &addr)
    {
        std::string out = "[";
        if (addr)
        {
            for (std::size_t i = 0; i < addr->size(); ++i)
            {
                if (i != 0)
                {
                    out += ',';
                }
                out += std::to_string((*addr)[i]);
            }
        }
        out += ']';
        return out;
    }
}
