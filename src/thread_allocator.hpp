#pragma once

#include "log.hpp"
#include "push_pull.hpp"

#include <deque>

namespace pactflow
{
    // Intra-worker FIFO shared by one ThreadPusher and one ThreadPuller. Not
    // synchronized: both halves live on the same worker thread.
    template <class M>
    using ThreadQueue = std::deque<M>;

    template <class M>
    class ThreadPusher final : public IPush<M>
    {
    public:
        explicit ThreadPusher(std::shared_ptr<ThreadQueue<M>> queue) : m_queue(std::move(queue)) {}

        void push(std::optional<M> &slot) override
        {
            if (slot)
            {
                m_queue->push_back(std::move(*slot));
                slot.reset();
            }
        }

    private:
        std::shared_ptr<ThreadQueue<M>> m_queue;
    };

    template <class M>
    class ThreadPuller final : public IPull<M>
    {
    public:
        explicit ThreadPuller(std::shared_ptr<ThreadQueue<M>> queue) : m_queue(std::move(queue)) {}

        std::optional<M> &pull() override
        {
            if (m_queue->empty())
            {
                m_current.reset();
            }
            else
            {
                m_current.emplace(std::move(m_queue->front()));
                m_queue->pop_front();
            }
            return m_current;
        }

    private:
        std::shared_ptr<ThreadQueue<M>> m_queue;
        std::optional<M> m_current;
    };

    template <class M>
    inline std::pair<ThreadPusher<M>, ThreadPuller<M>> make_thread_channel()
    {
        auto queue = std::make_shared<ThreadQueue<M>>();
        return {ThreadPusher<M>(queue), ThreadPuller<M>(queue)};
    }

    // Allocator for a single worker. Every channel is a thread channel.
    class ThreadAllocator
    {
    public:
        WorkerIndex index() const noexcept { return 0; }
        std::size_t peers() const noexcept { return 1; }

        template <class M>
        std::pair<ThreadPusher<M>, ThreadPuller<M>> pipeline(ChannelId channel, const Address &address)
        {
            Logger::instance().logf(LogLevel::Debug, 0, channel, "pipeline channel at %s", address_to_string(address).c_str());
            return make_thread_channel<M>();
        }

        template <class M>
        std::pair<std::vector<BoxedPush<M>>, BoxedPull<M>> allocate(ChannelId channel, const Address &address)
        {
            Logger::instance().logf(LogLevel::Debug, 0, channel, "exchange channel at %s (1 peer)", address_to_string(address).c_str());
            auto [pusher, puller] = make_thread_channel<M>();
            std::vector<BoxedPush<M>> pushers;
            pushers.push_back(std::make_unique<ThreadPusher<M>>(std::move(pusher)));
            return {std::move(pushers), std::make_unique<ThreadPuller<M>>(std::move(puller))};
        }
    };
}
