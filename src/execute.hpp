#pragma once

#include "config.hpp"
#include "log.hpp"
#include "messages_log.hpp"
#include "process_allocator.hpp"

#include <exception>
#include <functional>
#include <mutex>
#include <thread>

namespace pactflow
{
    // Everything a worker body gets from execute().
    struct WorkerContext
    {
        ProcessAllocator &allocator;
        const FabricConfig &config;
        // Present when config.traceMessages is set.
        std::optional<MessagesLogger> logging;
    };

    namespace detail
    {
        inline void join_all(std::vector<std::thread> &threads)
        {
            for (auto &t : threads)
            {
                if (t.joinable())
                {
                    t.join();
                }
            }
        }

        // Starts `count` threads via `launch`. If a launch throws (e.g. std::system_error
        // when the OS refuses a thread), the threads already running are joined before
        // the exception propagates, so none outlives the state it references.
        inline std::vector<std::thread> launch_all(std::size_t count, const std::function<std::thread(std::size_t)> &launch)
        {
            std::vector<std::thread> threads;
            threads.reserve(count);
            try
            {
                for (std::size_t i = 0; i < count; ++i)
                {
                    threads.push_back(launch(i));
                }
            }
            catch (...)
            {
                join_all(threads);
                throw;
            }
            return threads;
        }
    }

    // Runs `body` once per worker, each on its own thread with its own allocator over
    // a shared in-process fabric. Returns after every worker finishes. If any worker
    // throws, the first exception is rethrown here.
    inline void execute(const FabricConfig &cfg, const std::function<void(WorkerContext &)> &body)
    {
        if (!body)
        {
            throw std::runtime_error("execute: null worker body");
        }

        apply_config(cfg);
        std::vector<ProcessAllocator> allocators = make_process_allocators(cfg.workers);

        std::mutex errMu;
        std::exception_ptr firstError;

        auto run_worker = [&](std::size_t i)
        {
            ProcessAllocator &alloc = allocators[i];
            try
            {
                std::optional<MessagesLogger> logging;
                if (cfg.traceMessages)
                {
                    logging.emplace(std::make_shared<TextMessagesSink>(alloc.index()));
                }
                WorkerContext ctx{alloc, cfg, std::move(logging)};
                body(ctx);
            }
            catch (...)
            {
                std::lock_guard<std::mutex> lk(errMu);
                if (!firstError)
                {
                    firstError = std::current_exception();
                }
                Logger::instance().logf(LogLevel::Error, alloc.index(), 0, "worker failed");
            }
        };

        std::vector<std::thread> threads = detail::launch_all(cfg.workers, [&](std::size_t i)
                                                              { return std::thread(run_worker, i); });
        detail::join_all(threads);

        if (firstError)
        {
            std::rethrow_exception(firstError);
        }
    }
}
