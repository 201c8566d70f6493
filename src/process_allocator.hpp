#pragma once

#include "log.hpp"
#include "push_pull.hpp"
#include "thread_allocator.hpp"

#include <deque>
#include <map>
#include <mutex>
#include <stdexcept>
#include <typeindex>
#include <typeinfo>

namespace pactflow
{
    // Inbound queue of one worker for one channel. Thread-safe for MPSC use; a single
    // queue per destination keeps every source's messages in push order.
    template <class M>
    class Mailbox
    {
    public:
        void push(M msg)
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_queue.push_back(std::move(msg));
        }

        std::optional<M> pop()
        {
            std::lock_guard<std::mutex> lk(m_mu);
            if (m_queue.empty())
            {
                return std::nullopt;
            }
            M out = std::move(m_queue.front());
            m_queue.pop_front();
            return out;
        }

    private:
        mutable std::mutex m_mu;
        std::deque<M> m_queue;
    };

    template <class M>
    class MailboxPusher final : public IPush<M>
    {
    public:
        explicit MailboxPusher(std::shared_ptr<Mailbox<M>> box) : m_box(std::move(box)) {}

        void push(std::optional<M> &slot) override
        {
            if (slot)
            {
                m_box->push(std::move(*slot));
                slot.reset();
            }
        }

    private:
        std::shared_ptr<Mailbox<M>> m_box;
    };

    template <class M>
    class MailboxPuller final : public IPull<M>
    {
    public:
        explicit MailboxPuller(std::shared_ptr<Mailbox<M>> box) : m_box(std::move(box)) {}

        std::optional<M> &pull() override
        {
            m_current = m_box->pop();
            return m_current;
        }

    private:
        std::shared_ptr<Mailbox<M>> m_box;
        std::optional<M> m_current;
    };

    // State shared by all workers of one process: the per-channel mailboxes.
    class ProcessFabric
    {
    public:
        explicit ProcessFabric(std::size_t workers) : m_workers(workers)
        {
            if (m_workers == 0)
            {
                throw std::runtime_error("ProcessFabric: zero workers");
            }
            if (m_workers > std::numeric_limits<WorkerIndex>::max())
            {
                throw std::runtime_error("ProcessFabric: too many workers");
            }
        }

        ProcessFabric(const ProcessFabric &) = delete;
        ProcessFabric &operator=(const ProcessFabric &) = delete;

        std::size_t workers() const noexcept { return m_workers; }

        // Returns the mailboxes of `channel`, one per destination worker, creating them
        // on first use. Each worker may claim a channel once.
        template <class M>
        std::shared_ptr<std::vector<std::shared_ptr<Mailbox<M>>>> claim(ChannelId channel, WorkerIndex worker)
        {
            using Boxes = std::vector<std::shared_ptr<Mailbox<M>>>;

            if (worker >= m_workers)
            {
                throw std::runtime_error("ProcessFabric: worker index out of range");
            }

            std::lock_guard<std::mutex> lk(m_mu);
            auto it = m_channels.find(channel);
            if (it == m_channels.end())
            {
                auto boxes = std::make_shared<Boxes>();
                boxes->reserve(m_workers);
                for (std::size_t i = 0; i < m_workers; ++i)
                {
                    boxes->push_back(std::make_shared<Mailbox<M>>());
                }
                ChannelEntry entry{std::type_index(typeid(M)), boxes, std::vector<bool>(m_workers, false)};
                it = m_channels.emplace(channel, std::move(entry)).first;
            }

            ChannelEntry &entry = it->second;
            if (entry.type != std::type_index(typeid(M)))
            {
                throw std::runtime_error("ProcessFabric: channel reused with a different message type");
            }
            if (entry.claimed[worker])
            {
                throw std::runtime_error("ProcessFabric: channel already allocated by this worker");
            }
            entry.claimed[worker] = true;
            return std::static_pointer_cast<Boxes>(entry.mailboxes);
        }

    private:
        struct ChannelEntry
        {
            std::type_index type;
            std::shared_ptr<void> mailboxes;
            std::vector<bool> claimed;
        };

        std::size_t m_workers = 0;
        std::mutex m_mu;
        std::map<ChannelId, ChannelEntry> m_channels;
    };

    // Allocator handle for one worker of an in-process fabric. Used only by that
    // worker's thread.
    class ProcessAllocator
    {
    public:
        ProcessAllocator(std::shared_ptr<ProcessFabric> fabric, WorkerIndex index)
            : m_fabric(std::move(fabric)), m_index(index)
        {
            if (!m_fabric)
            {
                throw std::runtime_error("ProcessAllocator: null fabric");
            }
            if (m_index >= m_fabric->workers())
            {
                throw std::runtime_error("ProcessAllocator: worker index out of range");
            }
        }

        WorkerIndex index() const noexcept { return m_index; }
        std::size_t peers() const noexcept { return m_fabric->workers(); }

        template <class M>
        std::pair<ThreadPusher<M>, ThreadPuller<M>> pipeline(ChannelId channel, const Address &address)
        {
            Logger::instance().logf(LogLevel::Debug, m_index, channel, "pipeline channel at %s", address_to_string(address).c_str());
            return make_thread_channel<M>();
        }

        template <class M>
        std::pair<std::vector<BoxedPush<M>>, BoxedPull<M>> allocate(ChannelId channel, const Address &address)
        {
            auto boxes = m_fabric->claim<M>(channel, m_index);
            Logger::instance().logf(LogLevel::Debug, m_index, channel, "exchange channel at %s (%zu peers)",
                                    address_to_string(address).c_str(), boxes->size());

            std::vector<BoxedPush<M>> pushers;
            pushers.reserve(boxes->size());
            for (const auto &box : *boxes)
            {
                pushers.push_back(std::make_unique<MailboxPusher<M>>(box));
            }
            return {std::move(pushers), std::make_unique<MailboxPuller<M>>((*boxes)[m_index])};
        }

    private:
        std::shared_ptr<ProcessFabric> m_fabric;
        WorkerIndex m_index = 0;
    };

    inline std::vector<ProcessAllocator> make_process_allocators(std::size_t workers)
    {
        auto fabric = std::make_shared<ProcessFabric>(workers);
        std::vector<ProcessAllocator> out;
        out.reserve(workers);
        for (std::size_t i = 0; i < workers; ++i)
        {
            out.emplace_back(fabric, static_cast<WorkerIndex>(i));
        }
        return out;
    }
}
