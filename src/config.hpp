#pragma once

#include "exchange_pusher.hpp"
#include "log.hpp"

#include <charconv>
#include <stdexcept>
#include <string_view>

namespace pactflow
{
    struct FabricConfig
    {
        // Worker threads started by execute().
        std::size_t workers = 1;

        // Process logger level (disabled by default).
        LogLevel logLevel = LogLevel::Off;

        // Records buffered per destination before an exchange batch is sent.
        std::size_t exchangeBufferCapacity = kDefaultExchangeBufferCapacity;

        // If set, execute() gives every worker a TextMessagesSink so each message
        // send/receive is logged at Trace level.
        bool traceMessages = false;
    };

    inline LogLevel parse_log_level(std::string_view s)
    {
        if (s == "error")
            return LogLevel::Error;
        if (s == "warn")
            return LogLevel::Warn;
        if (s == "info")
            return LogLevel::Info;
        if (s == "debug")
            return LogLevel::Debug;
        if (s == "trace")
            return LogLevel::Trace;
        if (s == "off")
            return LogLevel::Off;
        throw std::runtime_error("parse_log_level: unknown level '" + std::string(s) + "'");
    }

    namespace detail
    {
        inline std::size_t parse_size(std::string_view flag, std::string_view s)
        {
            unsigned long long v = 0;
            auto r = std::from_chars(s.data(), s.data() + s.size(), v);
            if (r.ec != std::errc() || r.ptr != s.data() + s.size() || v > std::numeric_limits<std::size_t>::max())
            {
                throw std::runtime_error("parse_fabric_args: bad value for " + std::string(flag) + ": '" + std::string(s) + "'");
            }
            return static_cast<std::size_t>(v);
        }
    }

    // Understands:
    //   --workers N  --log-level NAME  --exchange-capacity N  --trace-messages
    // Arguments it does not know are left for the caller and reported in `rest`.
    inline FabricConfig parse_fabric_args(int argc, char **argv, std::vector<std::string_view> *rest = nullptr)
    {
        FabricConfig cfg;
        for (int i = 1; i < argc; ++i)
        {
            std::string_view a(argv[i]);
            auto need = [&]() -> std::string_view
            {
                if (i + 1 >= argc)
                {
                    throw std::runtime_error("parse_fabric_args: missing value for " + std::string(a));
                }
                return std::string_view(argv[++i]);
            };

            if (a == "--workers")
            {
                cfg.workers = detail::parse_size(a, need());
                if (cfg.workers == 0)
                {
                    throw std::runtime_error("parse_fabric_args: --workers must be positive");
                }
            }
            else if (a == "--log-level")
            {
                cfg.logLevel = parse_log_level(need());
            }
            else if (a == "--exchange-capacity")
            {
                cfg.exchangeBufferCapacity = detail::parse_size(a, need());
                if (cfg.exchangeBufferCapacity == 0)
                {
                    throw std::runtime_error("parse_fabric_args: --exchange-capacity must be positive");
                }
            }
            else if (a == "--trace-messages")
            {
                cfg.traceMessages = true;
            }
            else if (rest)
            {
                rest->push_back(a);
            }
            else
            {
                throw std::runtime_error("parse_fabric_args: unknown argument " + std::string(a));
            }
        }
        return cfg;
    }

    inline void apply_config(const FabricConfig &cfg)
    {
        Logger::instance().set_level(cfg.logLevel);
    }
}
