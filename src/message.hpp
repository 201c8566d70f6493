#pragma once

#include "common.hpp"
#include "container.hpp"
#include "push_pull.hpp"

namespace pactflow
{
    // Unit of transfer along a dataflow edge.
    //
    // `seq` and `from` are transport metadata: they stay zero until a LogPusher stamps
    // them, exactly once, when the message is first handed to the transport.
    template <class T, class C>
    struct Message
    {
        T time{};
        C data{};
        SeqNo seq = 0;
        WorkerIndex from = 0;

        Message() = default;
        Message(T t, C d) : time(std::move(t)), data(std::move(d)) {}

        std::size_t length() const { return record_count(data); }

        // Builds a message from `buffer` at `time` and pushes it. If the transport
        // hands a message back, its cleared container becomes the new `buffer`;
        // otherwise `buffer` is left empty.
        template <class P>
        static void push_at(C &buffer, T time, P &pusher)
        {
            std::optional<Message> slot(std::in_place, std::move(time), std::move(buffer));
            detail::endpoint(pusher).push(slot);

            buffer = C{};
            if (slot)
            {
                buffer = std::move(slot->data);
                ContainerTraits<C>::clear(buffer);
            }
        }
    };
}
