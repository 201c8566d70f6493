/*
Purpose: Per-destination batching inside the Exchange fan-out.

What this tests: a full buffer is sent immediately, a message at a new timestamp
flushes older buffers first, the empty-slot flush sends the rest and is forwarded to
every destination, every batch is stamped per destination, and the incoming
container is handed back cleared. With a single worker the message passes through
without re-batching.
*/

#include "pact.hpp"
#include "thread_allocator.hpp"

#include <cassert>
#include <cstdint>
#include <memory>
#include <vector>

namespace
{
    using C = std::vector<std::uint64_t>;
    using Msg = pactflow::Message<std::uint64_t, C>;

    struct Delivery
    {
        std::vector<Msg> messages;
        int flushes = 0;
    };

    class RecordingPush final : public pactflow::IPush<Msg>
    {
    public:
        explicit RecordingPush(std::shared_ptr<Delivery> out) : m_out(std::move(out)) {}

        void push(std::optional<Msg> &slot) override
        {
            if (!slot)
            {
                ++m_out->flushes;
                return;
            }
            m_out->messages.push_back(std::move(*slot));
            slot.reset();
        }

    private:
        std::shared_ptr<Delivery> m_out;
    };

    // Three workers, this one is worker 1. Sends land in per-destination records.
    class RecordingAllocator
    {
    public:
        RecordingAllocator()
        {
            for (int i = 0; i < 3; ++i)
            {
                deliveries.push_back(std::make_shared<Delivery>());
            }
        }

        pactflow::WorkerIndex index() const { return 1; }
        std::size_t peers() const { return deliveries.size(); }

        template <class M>
        std::pair<std::vector<pactflow::BoxedPush<M>>, pactflow::BoxedPull<M>> allocate(pactflow::ChannelId, const pactflow::Address &)
        {
            std::vector<pactflow::BoxedPush<M>> pushers;
            for (const auto &d : deliveries)
            {
                pushers.push_back(std::make_unique<RecordingPush>(d));
            }
            auto [unused, puller] = pactflow::make_thread_channel<M>();
            (void)unused;
            return {std::move(pushers), std::make_unique<pactflow::ThreadPuller<M>>(std::move(puller))};
        }

        std::vector<std::shared_ptr<Delivery>> deliveries;
    };

    std::uint64_t identity(const std::uint64_t &r) { return r; }
}

int main()
{
    {
        RecordingAllocator alloc;
        auto sink = std::make_shared<pactflow::BufferedMessagesSink>();
        auto [pusher, puller] = pactflow::connect_pact(pactflow::make_exchange<std::uint64_t, C>(&identity, /*bufferCapacity=*/2),
                                                       alloc, 4, pactflow::make_address({}), pactflow::MessagesLogger(sink));
        (void)puller;
        assert(pusher.peers() == 3);
        assert(pusher.capacity() == 2);

        // 0 and 3 fill destination 0; 1 waits in destination 1.
        std::optional<Msg> slot(std::in_place, 5, C{0, 3, 1});
        pusher.push(slot);
        assert(slot);
        assert(slot->data.empty());

        assert(alloc.deliveries[0]->messages.size() == 1);
        assert((alloc.deliveries[0]->messages[0].data == C{0, 3}));
        assert(alloc.deliveries[0]->messages[0].time == 5);
        assert(alloc.deliveries[1]->messages.empty());
        assert(pusher.buffered(1) == 1);

        // New timestamp: the pending record for time 5 goes out first.
        pusher.send(Msg(6, {4}));
        assert(alloc.deliveries[1]->messages.size() == 1);
        assert(alloc.deliveries[1]->messages[0].time == 5);
        assert((alloc.deliveries[1]->messages[0].data == C{1}));
        assert(pusher.buffered(1) == 1);

        pusher.done();
        assert(alloc.deliveries[1]->messages.size() == 2);
        assert(alloc.deliveries[1]->messages[1].time == 6);
        assert((alloc.deliveries[1]->messages[1].data == C{4}));
        for (const auto &d : alloc.deliveries)
        {
            assert(d->flushes == 1);
        }
        assert(alloc.deliveries[2]->messages.empty());

        // Stamps are per destination.
        assert(alloc.deliveries[0]->messages[0].seq == 0);
        assert(alloc.deliveries[1]->messages[0].seq == 0);
        assert(alloc.deliveries[1]->messages[1].seq == 1);
        for (const auto &d : alloc.deliveries)
        {
            for (const auto &m : d->messages)
            {
                assert(m.from == 1);
            }
        }

        const auto events = sink->events();
        assert(events.size() == 3);
        assert(events[0].target == 0 && events[0].length == 2);
        assert(events[1].target == 1 && events[1].seqNo == 0);
        assert(events[2].target == 1 && events[2].seqNo == 1);
    }

    {
        pactflow::ThreadAllocator alloc;
        auto [pusher, puller] = pactflow::connect_pact(pactflow::make_exchange<std::uint64_t, C>(&identity, /*bufferCapacity=*/2),
                                                       alloc, 1, pactflow::make_address({0}), std::nullopt);
        pusher.send(Msg(3, {9, 8, 7, 6, 5}));

        auto msg = puller.recv();
        assert(msg);
        assert(msg->time == 3);
        assert((msg->data == C{9, 8, 7, 6, 5}));
        assert(msg->seq == 0);
        assert(!puller.recv());
    }

    return 0;
}
