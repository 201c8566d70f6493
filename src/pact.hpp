#pragma once

#include "exchange_pusher.hpp"
#include "log_endpoints.hpp"
#include "message.hpp"
#include "messages_log.hpp"
#include "thread_allocator.hpp"

#include <type_traits>

namespace pactflow
{
    // Parallelization contracts.
    //
    // A pact decides how the records of one dataflow edge are distributed among
    // workers. Every pact exposes the same factory:
    //
    //   std::move(pact).connect(allocator, channel, address, logging) -> (Pusher, Puller)
    //
    // where `allocator` provides index(), peers(), pipeline<M>() and allocate<M>()
    // (see ThreadAllocator, ProcessAllocator, MpiAllocator). connect() is the only
    // place a pact creates transport resources; allocator failures propagate as
    // exceptions.
    //
    // The one requirement of a pact is that it does not change the number of records
    // at any timestamp. Progress tracking relies on this independent of the pact used.

    // A direct connection: records stay on the worker that produced them.
    template <class T, class C>
    class Pipeline
    {
    public:
        using MessageType = Message<T, C>;
        using Pusher = LogPusher<T, C, ThreadPusher<MessageType>>;
        using Puller = LogPuller<T, C, ThreadPuller<MessageType>>;

        template <class A>
        std::pair<Pusher, Puller> connect(A &allocator, ChannelId channel, Address address, std::optional<MessagesLogger> logging) &&
        {
            auto [pusher, puller] = allocator.template pipeline<MessageType>(channel, address);
            const WorkerIndex index = allocator.index();
            return {Pusher(std::move(pusher), index, index, channel, logging),
                    Puller(std::move(puller), index, channel, std::move(logging))};
        }
    };

    // Distributes records among all workers by a hash of each record. A record with
    // hash h goes to worker exchange_destination(h, peers), i.e. h % peers.
    //
    // H must be a pure function of the record: every worker must route equal records
    // to the same destination, or records are lost to progress tracking.
    template <class T, class C, class H>
    class Exchange
    {
    public:
        using MessageType = Message<T, C>;
        using Item = typename ContainerTraits<C>::Item;
        using DestinationPusher = LogPusher<T, C, BoxedPush<MessageType>>;
        using Pusher = ExchangePusher<T, C, DestinationPusher, H>;
        using Puller = LogPuller<T, C, BoxedPull<MessageType>>;

        static_assert(std::is_convertible_v<std::invoke_result_t<H &, const Item &>, std::uint64_t>,
                      "Exchange hash must map a record to a 64-bit key");

        explicit Exchange(H hash, std::size_t bufferCapacity = kDefaultExchangeBufferCapacity)
            : m_hash(std::move(hash)), m_bufferCapacity(bufferCapacity)
        {
        }

        template <class A>
        std::pair<Pusher, Puller> connect(A &allocator, ChannelId channel, Address address, std::optional<MessagesLogger> logging) &&
        {
            auto [senders, receiver] = allocator.template allocate<MessageType>(channel, address);
            const WorkerIndex index = allocator.index();

            std::vector<DestinationPusher> pushers;
            pushers.reserve(senders.size());
            for (std::size_t i = 0; i < senders.size(); ++i)
            {
                pushers.emplace_back(std::move(senders[i]), index, static_cast<WorkerIndex>(i), channel, logging);
            }

            return {Pusher(std::move(pushers), std::move(m_hash), m_bufferCapacity),
                    Puller(std::move(receiver), index, channel, std::move(logging))};
        }

    private:
        H m_hash;
        std::size_t m_bufferCapacity = kDefaultExchangeBufferCapacity;
    };

    template <class T, class C, class H>
    inline Exchange<T, C, std::decay_t<H>> make_exchange(H &&hash, std::size_t bufferCapacity = kDefaultExchangeBufferCapacity)
    {
        return Exchange<T, C, std::decay_t<H>>(std::forward<H>(hash), bufferCapacity);
    }

    // Connects any pact. Kept as a free function so operator code can stay generic
    // over the pact type.
    template <class Pact, class A>
    inline auto connect_pact(Pact pact, A &allocator, ChannelId channel, Address address, std::optional<MessagesLogger> logging)
    {
        return std::move(pact).connect(allocator, channel, std::move(address), std::move(logging));
    }
}
