#pragma once

#include "log.hpp"
#include "message_wire.hpp"
#include "push_pull.hpp"
#include "thread_allocator.hpp"

#include <mpi.h>

#include <set>
#include <stdexcept>

namespace pactflow
{
    // Nonblocking sends still in flight for one rank. Buffers must stay alive until
    // MPI reports completion.
    class MpiSendQueue
    {
    public:
        MpiSendQueue() = default;
        MpiSendQueue(const MpiSendQueue &) = delete;
        MpiSendQueue &operator=(const MpiSendQueue &) = delete;

        ~MpiSendQueue()
        {
            if (m_pending.empty())
            {
                return;
            }
            std::vector<MPI_Request> reqs = requests_();
            if (MPI_Waitall(static_cast<int>(reqs.size()), reqs.data(), MPI_STATUSES_IGNORE) != MPI_SUCCESS)
            {
                MPI_Abort(MPI_COMM_WORLD, 6);
            }
        }

        void send(ByteBuffer buf, int dst, int tag, MPI_Comm comm)
        {
            drain();

            PendingSend pending;
            pending.buf = std::move(buf);
            pending.req = MPI_REQUEST_NULL;

            const int rc = MPI_Isend(pending.buf.data(), static_cast<int>(pending.buf.size()), MPI_BYTE, dst, tag, comm, &pending.req);
            if (rc != MPI_SUCCESS)
            {
                throw std::runtime_error("MpiAllocator: MPI_Isend failed");
            }
            m_pending.push_back(std::move(pending));
        }

        void drain()
        {
            for (std::size_t i = 0; i < m_pending.size();)
            {
                int done = 0;
                const int rc = MPI_Test(&m_pending[i].req, &done, MPI_STATUS_IGNORE);
                if (rc != MPI_SUCCESS)
                {
                    throw std::runtime_error("MpiAllocator: MPI_Test failed");
                }
                if (done)
                {
                    m_pending[i] = std::move(m_pending.back());
                    m_pending.pop_back();
                    continue;
                }
                ++i;
            }
        }

        void wait_all()
        {
            if (m_pending.empty())
            {
                return;
            }
            std::vector<MPI_Request> reqs = requests_();
            if (MPI_Waitall(static_cast<int>(reqs.size()), reqs.data(), MPI_STATUSES_IGNORE) != MPI_SUCCESS)
            {
                throw std::runtime_error("MpiAllocator: MPI_Waitall failed");
            }
            m_pending.clear();
        }

    private:
        struct PendingSend
        {
            ByteBuffer buf;
            MPI_Request req = MPI_REQUEST_NULL;
        };

        std::vector<MPI_Request> requests_() const
        {
            std::vector<MPI_Request> reqs;
            reqs.reserve(m_pending.size());
            for (const auto &p : m_pending)
            {
                reqs.push_back(p.req);
            }
            return reqs;
        }

        std::vector<PendingSend> m_pending;
    };

    template <class M>
    class MpiPusher final : public IPush<M>
    {
    public:
        MpiPusher(MPI_Comm comm, int dst, int tag, std::shared_ptr<MpiSendQueue> sends)
            : m_comm(comm), m_dst(dst), m_tag(tag), m_sends(std::move(sends))
        {
        }

        void push(std::optional<M> &slot) override
        {
            if (slot)
            {
                m_sends->send(MessageCodec<M>::encode(*slot), m_dst, m_tag, m_comm);
                slot.reset();
            }
        }

    private:
        MPI_Comm m_comm;
        int m_dst = 0;
        int m_tag = 0;
        std::shared_ptr<MpiSendQueue> m_sends;
    };

    // Receives messages from any rank on one channel tag. MPI does not overtake
    // messages between a pair of ranks on one tag, so each source stays FIFO.
    template <class M>
    class MpiPuller final : public IPull<M>
    {
    public:
        MpiPuller(MPI_Comm comm, int tag, std::shared_ptr<MpiSendQueue> sends)
            : m_comm(comm), m_tag(tag), m_sends(std::move(sends))
        {
        }

        std::optional<M> &pull() override
        {
            m_sends->drain();
            m_current.reset();

            MPI_Status status;
            int flag = 0;
            int rc = MPI_Iprobe(MPI_ANY_SOURCE, m_tag, m_comm, &flag, &status);
            if (rc != MPI_SUCCESS)
            {
                throw std::runtime_error("MpiAllocator: MPI_Iprobe failed");
            }
            if (!flag)
            {
                return m_current;
            }

            int count = 0;
            rc = MPI_Get_count(&status, MPI_BYTE, &count);
            if (rc != MPI_SUCCESS || count <= 0)
            {
                throw std::runtime_error("MpiAllocator: MPI_Get_count failed");
            }

            ByteBuffer buf(static_cast<std::size_t>(count));
            rc = MPI_Recv(buf.data(), count, MPI_BYTE, status.MPI_SOURCE, status.MPI_TAG, m_comm, MPI_STATUS_IGNORE);
            if (rc != MPI_SUCCESS)
            {
                throw std::runtime_error("MpiAllocator: MPI_Recv failed");
            }

            m_current = MessageCodec<M>::decode(std::span<const std::byte>(buf.data(), buf.size()));
            return m_current;
        }

    private:
        MPI_Comm m_comm;
        int m_tag = 0;
        std::shared_ptr<MpiSendQueue> m_sends;
        std::optional<M> m_current;
    };

    // Allocator where every MPI rank is one worker. Exchange channels travel as one
    // MPI message per envelope, tagged with the channel id; pipeline channels never
    // leave the rank.
    class MpiAllocator
    {
    public:
        explicit MpiAllocator(MPI_Comm comm = MPI_COMM_WORLD) : m_comm(comm)
        {
            if (m_comm == MPI_COMM_NULL)
            {
                throw std::runtime_error("MpiAllocator: null communicator");
            }

            int rank = -1;
            int size = 0;
            if (MPI_Comm_rank(m_comm, &rank) != MPI_SUCCESS || MPI_Comm_size(m_comm, &size) != MPI_SUCCESS)
            {
                throw std::runtime_error("MpiAllocator: cannot query communicator");
            }
            m_index = static_cast<WorkerIndex>(rank);
            m_peers = static_cast<std::size_t>(size);

            void *attr = nullptr;
            int found = 0;
            if (MPI_Comm_get_attr(m_comm, MPI_TAG_UB, &attr, &found) != MPI_SUCCESS)
            {
                throw std::runtime_error("MpiAllocator: cannot query MPI_TAG_UB");
            }
            // The standard guarantees at least 32767.
            m_tagUpperBound = (found && attr) ? *static_cast<int *>(attr) : 32767;

            m_sends = std::make_shared<MpiSendQueue>();
        }

        MpiAllocator(const MpiAllocator &) = delete;
        MpiAllocator &operator=(const MpiAllocator &) = delete;

        WorkerIndex index() const noexcept { return m_index; }
        std::size_t peers() const noexcept { return m_peers; }

        template <class M>
        std::pair<ThreadPusher<M>, ThreadPuller<M>> pipeline(ChannelId channel, const Address &address)
        {
            Logger::instance().logf(LogLevel::Debug, m_index, channel, "pipeline channel at %s", address_to_string(address).c_str());
            return make_thread_channel<M>();
        }

        template <class M>
        std::pair<std::vector<BoxedPush<M>>, BoxedPull<M>> allocate(ChannelId channel, const Address &address)
        {
            if (channel > static_cast<ChannelId>(m_tagUpperBound))
            {
                throw std::runtime_error("MpiAllocator: channel id exceeds MPI_TAG_UB");
            }
            if (!m_channels.insert(channel).second)
            {
                throw std::runtime_error("MpiAllocator: channel already allocated");
            }
            Logger::instance().logf(LogLevel::Debug, m_index, channel, "exchange channel at %s (%zu ranks)",
                                    address_to_string(address).c_str(), m_peers);

            const int tag = static_cast<int>(channel);
            std::vector<BoxedPush<M>> pushers;
            pushers.reserve(m_peers);
            for (std::size_t dst = 0; dst < m_peers; ++dst)
            {
                pushers.push_back(std::make_unique<MpiPusher<M>>(m_comm, static_cast<int>(dst), tag, m_sends));
            }
            return {std::move(pushers), std::make_unique<MpiPuller<M>>(m_comm, tag, m_sends)};
        }

        // Blocks until every send issued through this allocator has completed.
        void flush() { m_sends->wait_all(); }

    private:
        MPI_Comm m_comm;
        WorkerIndex m_index = 0;
        std::size_t m_peers = 0;
        int m_tagUpperBound = 32767;
        std::shared_ptr<MpiSendQueue> m_sends;
        std::set<ChannelId> m_channels;
    };
}
