#pragma once

#include "message.hpp"
#include "messages_log.hpp"
#include "push_pull.hpp"

namespace pactflow
{
    // Wraps a Message pusher: stamps sequence number and provenance on every message
    // and reports it to the optional messages logger. P is either a concrete pusher or
    // an owning pointer to one.
    template <class T, class C, class P>
    class LogPusher final : public IPush<Message<T, C>>
    {
    public:
        LogPusher(P pusher, WorkerIndex source, WorkerIndex target, ChannelId channel, std::optional<MessagesLogger> logging)
            : m_pusher(std::move(pusher)), m_channel(channel), m_source(source), m_target(target), m_logging(std::move(logging))
        {
        }

        LogPusher(LogPusher &&) = default;
        LogPusher &operator=(LogPusher &&) = default;

        void push(std::optional<Message<T, C>> &slot) override
        {
            if (slot)
            {
                ++m_counter;

                slot->seq = m_counter - 1;
                slot->from = m_source;

                if (m_logging)
                {
                    MessagesEvent ev;
                    ev.isSend = true;
                    ev.channel = m_channel;
                    ev.source = m_source;
                    ev.target = m_target;
                    ev.seqNo = m_counter - 1;
                    ev.length = record_count(slot->data);
                    m_logging->log(ev);
                }
            }

            detail::endpoint(m_pusher).push(slot);
        }

        // Number of messages stamped so far; the next message gets this as its seq.
        SeqNo counter() const noexcept { return m_counter; }

        P &inner() noexcept { return m_pusher; }

    private:
        P m_pusher;
        ChannelId m_channel = 0;
        SeqNo m_counter = 0;
        WorkerIndex m_source = 0;
        WorkerIndex m_target = 0;
        std::optional<MessagesLogger> m_logging;
    };

    // Wraps a Message puller and reports every received message to the optional
    // messages logger. The slot is returned untouched.
    template <class T, class C, class P>
    class LogPuller final : public IPull<Message<T, C>>
    {
    public:
        LogPuller(P puller, WorkerIndex index, ChannelId channel, std::optional<MessagesLogger> logging)
            : m_puller(std::move(puller)), m_channel(channel), m_index(index), m_logging(std::move(logging))
        {
        }

        LogPuller(LogPuller &&) = default;
        LogPuller &operator=(LogPuller &&) = default;

        std::optional<Message<T, C>> &pull() override
        {
            std::optional<Message<T, C>> &result = detail::endpoint(m_puller).pull();
            if (result && m_logging)
            {
                MessagesEvent ev;
                ev.isSend = false;
                ev.channel = m_channel;
                ev.source = result->from;
                ev.target = m_index;
                ev.seqNo = result->seq;
                ev.length = record_count(result->data);
                m_logging->log(ev);
            }
            return result;
        }

    private:
        P m_puller;
        ChannelId m_channel = 0;
        WorkerIndex m_index = 0;
        std::optional<MessagesLogger> m_logging;
    };
}
