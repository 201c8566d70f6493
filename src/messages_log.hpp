#pragma once

#include "common.hpp"
#include "log.hpp"

#include <mutex>
#include <stdexcept>

namespace pactflow
{
    // One message crossing a channel endpoint. Emitted by LogPusher on send and by
    // LogPuller on receive.
    struct MessagesEvent
    {
        bool isSend = false;
        ChannelId channel = 0;
        WorkerIndex source = 0;
        WorkerIndex target = 0;
        SeqNo seqNo = 0;
        std::size_t length = 0;

        friend bool operator==(const MessagesEvent &, const MessagesEvent &) = default;
    };

    class IMessagesSink
    {
    public:
        virtual ~IMessagesSink() = default;

        // Called synchronously on the worker thread that moved the message.
        virtual void on_message(const MessagesEvent &ev) = 0;
    };

    // Cheap copyable handle to a shared sink. Endpoints hold it as
    // std::optional<MessagesLogger>; an absent logger disables tracing.
    class MessagesLogger
    {
    public:
        explicit MessagesLogger(std::shared_ptr<IMessagesSink> sink) : m_sink(std::move(sink))
        {
            if (!m_sink)
            {
                throw std::runtime_error("MessagesLogger: null sink");
            }
        }

        void log(const MessagesEvent &ev) const { m_sink->on_message(ev); }

    private:
        std::shared_ptr<IMessagesSink> m_sink;
    };

    // Records every event. Safe to share between workers.
    class BufferedMessagesSink final : public IMessagesSink
    {
    public:
        void on_message(const MessagesEvent &ev) override
        {
            std::lock_guard<std::mutex> lk(m_mu);
            m_events.push_back(ev);
        }

        std::vector<MessagesEvent> events() const
        {
            std::lock_guard<std::mutex> lk(m_mu);
            return m_events;
        }

    private:
        mutable std::mutex m_mu;
        std::vector<MessagesEvent> m_events;
    };

    // Formats events through the process Logger at Trace level.
    class TextMessagesSink final : public IMessagesSink
    {
    public:
        explicit TextMessagesSink(WorkerIndex worker) : m_worker(worker) {}

        void on_message(const MessagesEvent &ev) override
        {
            Logger::instance().logf(LogLevel::Trace, m_worker, ev.channel,
                                    "%s src=%u dst=%u seq=%llu len=%zu",
                                    ev.isSend ? "send" : "recv",
                                    static_cast<unsigned>(ev.source),
                                    static_cast<unsigned>(ev.target),
                                    static_cast<unsigned long long>(ev.seqNo),
                                    ev.length);
        }

    private:
        WorkerIndex m_worker = 0;
    };
}
