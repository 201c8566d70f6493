/*
Purpose: Command-line configuration.

What this tests: defaults, every known flag, pass-through of unknown arguments when
the caller asks for them, and rejection of malformed values.
*/

#include "config.hpp"

#include <cassert>
#include <stdexcept>
#include <string_view>
#include <vector>

namespace
{
    template <typename Fn>
    void expect_throw(Fn &&fn)
    {
        bool threw = false;
        try
        {
            fn();
        }
        catch (const std::runtime_error &)
        {
            threw = true;
        }
        assert(threw);
    }

    pactflow::FabricConfig parse(std::vector<const char *> args, std::vector<std::string_view> *rest = nullptr)
    {
        args.insert(args.begin(), "prog");
        return pactflow::parse_fabric_args(static_cast<int>(args.size()), const_cast<char **>(args.data()), rest);
    }
}

int main()
{
    {
        const pactflow::FabricConfig cfg = parse({});
        assert(cfg.workers == 1);
        assert(cfg.logLevel == pactflow::LogLevel::Off);
        assert(cfg.exchangeBufferCapacity == pactflow::kDefaultExchangeBufferCapacity);
        assert(!cfg.traceMessages);
    }

    {
        const pactflow::FabricConfig cfg = parse({"--workers", "8", "--log-level", "debug", "--exchange-capacity", "64", "--trace-messages"});
        assert(cfg.workers == 8);
        assert(cfg.logLevel == pactflow::LogLevel::Debug);
        assert(cfg.exchangeBufferCapacity == 64);
        assert(cfg.traceMessages);
    }

    {
        std::vector<std::string_view> rest;
        const pactflow::FabricConfig cfg = parse({"input.txt", "--workers", "2", "-v"}, &rest);
        assert(cfg.workers == 2);
        assert(rest.size() == 2);
        assert(rest[0] == "input.txt");
        assert(rest[1] == "-v");
    }

    assert(pactflow::parse_log_level("trace") == pactflow::LogLevel::Trace);
    assert(pactflow::parse_log_level("off") == pactflow::LogLevel::Off);

    expect_throw([]
                 { (void)parse({"--workers"}); });
    expect_throw([]
                 { (void)parse({"--workers", "0"}); });
    expect_throw([]
                 { (void)parse({"--workers", "two"}); });
    expect_throw([]
                 { (void)parse({"--exchange-capacity", "12x"}); });
    expect_throw([]
                 { (void)parse({"--log-level", "loud"}); });
    expect_throw([]
                 { (void)parse({"--bogus"}); });

    return 0;
}
