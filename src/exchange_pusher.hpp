#pragma once

#include "container.hpp"
#include "message.hpp"
#include "push_pull.hpp"

#include <stdexcept>

namespace pactflow
{
    inline constexpr std::size_t kDefaultExchangeBufferCapacity = 1024;

    // Destination worker for a record hash. This rule is part of the exchange
    // protocol: changing it moves keys to different workers, which breaks any state
    // partitioned by an earlier version.
    inline constexpr std::size_t exchange_destination(std::uint64_t hash, std::size_t peers) noexcept
    {
        return static_cast<std::size_t>(hash % static_cast<std::uint64_t>(peers));
    }

    // Fan-out pusher for the Exchange pact. Re-batches records per destination worker
    // and forwards each batch as a new message to the matching pusher.
    //
    // Buffered records always share one timestamp: a message at a different time
    // flushes every buffer first. A buffer reaching `capacity` records is sent
    // immediately. An empty slot flushes all buffers and is then forwarded to every
    // destination.
    template <class T, class C, class P, class H>
    class ExchangePusher final : public IPush<Message<T, C>>
    {
    public:
        using Item = typename ContainerTraits<C>::Item;

        ExchangePusher(std::vector<P> pushers, H hash, std::size_t capacity = kDefaultExchangeBufferCapacity)
            : m_pushers(std::move(pushers)), m_hash(std::move(hash)), m_capacity(capacity)
        {
            if (m_pushers.empty())
            {
                throw std::runtime_error("ExchangePusher: no destinations");
            }
            if (m_capacity == 0)
            {
                throw std::runtime_error("ExchangePusher: zero buffer capacity");
            }
            m_buffers.resize(m_pushers.size());
        }

        void push(std::optional<Message<T, C>> &slot) override
        {
            // A single destination needs no partitioning.
            if (m_pushers.size() == 1)
            {
                detail::endpoint(m_pushers[0]).push(slot);
                return;
            }

            if (!slot)
            {
                flush_all_();
                m_current.reset();
                for (auto &p : m_pushers)
                {
                    std::optional<Message<T, C>> none;
                    detail::endpoint(p).push(none);
                }
                return;
            }

            Message<T, C> &msg = *slot;
            if (m_current && !(*m_current == msg.time))
            {
                flush_all_();
            }
            m_current = msg.time;

            const std::size_t peers = m_pushers.size();
            for (auto it = ContainerTraits<C>::begin(msg.data); it != ContainerTraits<C>::end(msg.data); ++it)
            {
                const std::size_t dst = exchange_destination(static_cast<std::uint64_t>(m_hash(*it)), peers);
                ContainerTraits<C>::push(m_buffers[dst], std::move(*it));
                if (ContainerTraits<C>::length(m_buffers[dst]) >= m_capacity)
                {
                    flush_(dst);
                }
            }
            ContainerTraits<C>::clear(msg.data);
        }

        std::size_t peers() const noexcept { return m_pushers.size(); }
        std::size_t capacity() const noexcept { return m_capacity; }

        // Records buffered for `dst` and not yet sent.
        std::size_t buffered(std::size_t dst) const { return ContainerTraits<C>::length(m_buffers.at(dst)); }

    private:
        void flush_(std::size_t dst)
        {
            if (ContainerTraits<C>::empty(m_buffers[dst]))
            {
                return;
            }
            Message<T, C>::push_at(m_buffers[dst], *m_current, m_pushers[dst]);
        }

        void flush_all_()
        {
            if (!m_current)
            {
                return;
            }
            for (std::size_t dst = 0; dst < m_buffers.size(); ++dst)
            {
                flush_(dst);
            }
        }

        std::vector<P> m_pushers;
        std::vector<C> m_buffers;
        H m_hash;
        std::size_t m_capacity = kDefaultExchangeBufferCapacity;
        std::optional<T> m_current;
    };
}
