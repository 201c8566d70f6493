#include "config.hpp"
#include "execute.hpp"
#include "hashing.hpp"
#include "pact.hpp"

#include <algorithm>
#include <atomic>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace
{
    using Time = std::uint64_t;
    using Lines = std::vector<std::string>;
    using Counts = std::vector<std::pair<std::string, std::uint64_t>>;

    const char *const kVocabulary[] = {
        "stream", "worker", "channel", "record", "batch", "exchange",
        "pipeline", "timestamp", "progress", "frontier", "operator", "edge"};

    // Deterministic synthetic input: each worker produces its own lines per epoch.
    Lines make_lines(pactflow::WorkerIndex worker, Time epoch, std::size_t count)
    {
        Lines out;
        for (std::size_t i = 0; i < count; ++i)
        {
            std::string line;
            const std::uint64_t seed = pactflow::splitmix64((static_cast<std::uint64_t>(worker) << 40) ^ (epoch << 20) ^ i);
            const std::size_t words = 3 + static_cast<std::size_t>(seed % 6);
            for (std::size_t w = 0; w < words; ++w)
            {
                const std::uint64_t pick = pactflow::splitmix64(seed + w) % std::size(kVocabulary);
                if (!line.empty())
                {
                    line += ' ';
                }
                line += kVocabulary[pick];
            }
            out.push_back(std::move(line));
        }
        return out;
    }

    void split_words(const std::string &line, Counts &out)
    {
        std::size_t pos = 0;
        while (pos < line.size())
        {
            const std::size_t next = line.find(' ', pos);
            const std::size_t end = (next == std::string::npos) ? line.size() : next;
            if (end > pos)
            {
                out.emplace_back(line.substr(pos, end - pos), 1);
            }
            pos = end + 1;
        }
    }

    [[noreturn]] void usage_and_exit()
    {
        std::cerr << "word_count\n"
                  << "  --workers N\n"
                  << "  --epochs E\n"
                  << "  --lines L          lines per worker per epoch\n"
                  << "  --exchange-capacity N\n"
                  << "  --log-level error|warn|info|debug|trace|off\n"
                  << "  --trace-messages\n";
        std::exit(2);
    }
}

int main(int argc, char **argv)
{
    std::vector<std::string_view> rest;
    pactflow::FabricConfig cfg;
    try
    {
        cfg = pactflow::parse_fabric_args(argc, argv, &rest);
    }
    catch (const std::runtime_error &e)
    {
        std::cerr << e.what() << "\n";
        usage_and_exit();
    }

    std::uint64_t epochs = 3;
    std::size_t linesPerEpoch = 100;
    for (std::size_t i = 0; i < rest.size(); ++i)
    {
        auto value = [&]() -> std::size_t
        {
            if (i + 1 >= rest.size())
            {
                usage_and_exit();
            }
            try
            {
                return static_cast<std::size_t>(std::stoull(std::string(rest[++i])));
            }
            catch (const std::exception &)
            {
                usage_and_exit();
            }
        };
        if (rest[i] == "--epochs")
        {
            epochs = value();
        }
        else if (rest[i] == "--lines")
        {
            linesPerEpoch = value();
        }
        else
        {
            usage_and_exit();
        }
    }

    std::mutex outMu;
    std::map<Time, std::map<std::string, std::uint64_t>> totals;
    std::atomic<std::size_t> finished{0};

    pactflow::execute(cfg, [&](pactflow::WorkerContext &ctx)
                      {
        const pactflow::WorkerIndex me = ctx.allocator.index();

        // Edge 0: source -> splitter, same worker.
        auto [linePush, linePull] = pactflow::connect_pact(pactflow::Pipeline<Time, Lines>{},
                                                           ctx.allocator, 0, pactflow::make_address({0}), ctx.logging);

        // Edge 1: splitter -> counter, partitioned by word.
        auto [wordPush, wordPull] = pactflow::connect_pact(
            pactflow::make_exchange<Time, Counts>(pactflow::KeyOfPair<pactflow::StringHash>{}, ctx.config.exchangeBufferCapacity),
            ctx.allocator, 1, pactflow::make_address({1}), ctx.logging);

        for (Time epoch = 0; epoch < epochs; ++epoch)
        {
            Lines lines = make_lines(me, epoch, linesPerEpoch);
            pactflow::Message<Time, Lines>::push_at(lines, epoch, linePush);

            while (auto msg = linePull.recv())
            {
                Counts words;
                for (const std::string &line : msg->data)
                {
                    split_words(line, words);
                }
                pactflow::Message<Time, Counts>::push_at(words, msg->time, wordPush);
            }
        }
        wordPush.done();

        finished.fetch_add(1);
        while (finished.load() < ctx.config.workers)
        {
            std::this_thread::yield();
        }

        std::map<Time, std::map<std::string, std::uint64_t>> local;
        while (auto msg = wordPull.recv())
        {
            for (const auto &[word, n] : msg->data)
            {
                local[msg->time][word] += n;
            }
        }

        std::uint64_t counted = 0;
        std::lock_guard<std::mutex> lk(outMu);
        for (const auto &[epoch, counts] : local)
        {
            for (const auto &[word, n] : counts)
            {
                // Each word is owned by exactly one worker.
                totals[epoch][word] = n;
                counted += n;
            }
        }
        pactflow::Logger::instance().logf(pactflow::LogLevel::Info, me, 1, "counted %llu words",
                                          static_cast<unsigned long long>(counted)); });

    for (const auto &[epoch, counts] : totals)
    {
        std::uint64_t sum = 0;
        for (const auto &[word, n] : counts)
        {
            sum += n;
        }
        std::cout << "epoch " << epoch << ": " << sum << " words\n";
        for (const auto &[word, n] : counts)
        {
            std::cout << "  " << word << " " << n << "\n";
        }
    }
    return 0;
}
