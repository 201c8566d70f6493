#pragma once

#include "common.hpp"

namespace pactflow
{
    // Send half of a single-slot channel. push() takes ownership of the message in
    // `slot` (if any). A transport may hand a spent message back through the slot so
    // the caller can reuse its allocation. Pushing an empty slot is a flush signal
    // and must be forwarded untouched.
    template <class M>
    class IPush
    {
    public:
        virtual ~IPush() = default;

        virtual void push(std::optional<M> &slot) = 0;

        void send(M msg)
        {
            std::optional<M> slot(std::move(msg));
            push(slot);
        }

        void done()
        {
            std::optional<M> slot;
            push(slot);
        }
    };

    // Receive half. pull() returns a slot that is empty when nothing is available.
    // The caller takes ownership by moving out of the slot; the endpoint never
    // observes the message again.
    template <class M>
    class IPull
    {
    public:
        virtual ~IPull() = default;

        virtual std::optional<M> &pull() = 0;

        std::optional<M> recv()
        {
            std::optional<M> out;
            out.swap(pull());
            return out;
        }
    };

    template <class M>
    using BoxedPush = std::unique_ptr<IPush<M>>;

    template <class M>
    using BoxedPull = std::unique_ptr<IPull<M>>;

    namespace detail
    {
        template <class P>
        inline P &endpoint(P &p) noexcept
        {
            return p;
        }

        template <class P>
        inline P &endpoint(std::unique_ptr<P> &p) noexcept
        {
            return *p;
        }
    }
}
