/*
Purpose: Sequence numbering and provenance stamped by LogPusher.

What this tests: successive non-empty pushes get seq 0,1,2,... and from=source,
each one produces a send event with the right fields, and an empty slot is forwarded
to the wrapped pusher untouched without consuming a sequence number.
*/

#include "log_endpoints.hpp"

#include <cassert>
#include <cstdint>
#include <memory>
#include <vector>

namespace
{
    using Msg = pactflow::Message<std::uint64_t, std::vector<int>>;

    class CapturePush final : public pactflow::IPush<Msg>
    {
    public:
        void push(std::optional<Msg> &slot) override
        {
            if (slot)
            {
                seen.push_back(std::move(*slot));
                slot.reset();
            }
            else
            {
                ++flushes;
            }
        }

        std::vector<Msg> seen;
        int flushes = 0;
    };
}

int main()
{
    auto sink = std::make_shared<pactflow::BufferedMessagesSink>();
    pactflow::LogPusher<std::uint64_t, std::vector<int>, CapturePush> pusher(
        CapturePush{}, /*source=*/3, /*target=*/5, /*channel=*/11, pactflow::MessagesLogger(sink));

    for (int i = 0; i < 3; ++i)
    {
        std::vector<int> data(static_cast<std::size_t>(i + 1), i);
        pusher.send(Msg(static_cast<std::uint64_t>(10 + i), std::move(data)));
    }

    // Flush signal: forwarded, not stamped, not logged.
    pusher.done();

    const auto &seen = pusher.inner().seen;
    assert(seen.size() == 3);
    for (std::size_t i = 0; i < seen.size(); ++i)
    {
        assert(seen[i].seq == i);
        assert(seen[i].from == 3);
        assert(seen[i].time == 10 + i);
        assert(seen[i].data.size() == i + 1);
    }
    assert(pusher.inner().flushes == 1);
    assert(pusher.counter() == 3);

    const auto events = sink->events();
    assert(events.size() == 3);
    for (std::size_t i = 0; i < events.size(); ++i)
    {
        assert(events[i].isSend);
        assert(events[i].channel == 11);
        assert(events[i].source == 3);
        assert(events[i].target == 5);
        assert(events[i].seqNo == i);
        assert(events[i].length == i + 1);
    }

    // Without a logger the stamping is identical.
    pactflow::LogPusher<std::uint64_t, std::vector<int>, CapturePush> quiet(CapturePush{}, 1, 0, 2, std::nullopt);
    quiet.send(Msg(0, {1}));
    quiet.done();
    quiet.send(Msg(0, {2}));
    assert(quiet.inner().seen.size() == 2);
    assert(quiet.inner().seen[0].seq == 0);
    assert(quiet.inner().seen[1].seq == 1);
    assert(quiet.inner().seen[1].from == 1);

    // A second pusher on the same channel numbers independently.
    pactflow::LogPusher<std::uint64_t, std::vector<int>, CapturePush> other(CapturePush{}, 3, 6, 11, pactflow::MessagesLogger(sink));
    other.send(Msg(0, {}));
    assert(other.inner().seen[0].seq == 0);

    return 0;
}
