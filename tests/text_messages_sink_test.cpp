/*
Purpose: Text rendering of message events through the process logger.

What this tests: a TextMessagesSink writes one Trace line per event in the logger's
"[LEVEL][worker=W][channel=C]" format, and writes nothing when the level is lower.
*/

#include "messages_log.hpp"

#include <cassert>
#include <cstdio>
#include <memory>
#include <string>

namespace
{
    std::string read_all(FILE *f)
    {
        std::string out;
        std::rewind(f);
        char buf[256];
        std::size_t n = 0;
        while ((n = std::fread(buf, 1, sizeof(buf), f)) > 0)
        {
            out.append(buf, n);
        }
        return out;
    }
}

int main()
{
    FILE *f = std::tmpfile();
    assert(f);

    auto &log = pactflow::Logger::instance();
    log.set_sink(f);
    log.set_level(pactflow::LogLevel::Trace);

    pactflow::MessagesLogger logger(std::make_shared<pactflow::TextMessagesSink>(2));

    pactflow::MessagesEvent ev;
    ev.isSend = true;
    ev.channel = 9;
    ev.source = 0;
    ev.target = 1;
    ev.seqNo = 3;
    ev.length = 4;
    logger.log(ev);

    ev.isSend = false;
    ev.seqNo = 4;
    logger.log(ev);

    log.set_level(pactflow::LogLevel::Debug);
    logger.log(ev);

    const std::string text = read_all(f);
    assert(text ==
           "[TRACE][worker=2][channel=9] send src=0 dst=1 seq=3 len=4\n"
           "[TRACE][worker=2][channel=9] recv src=0 dst=1 seq=4 len=4\n");

    log.set_level(pactflow::LogLevel::Off);
    log.set_sink(stderr);
    std::fclose(f);

    bool threw = false;
    try
    {
        pactflow::MessagesLogger bad(nullptr);
    }
    catch (const std::runtime_error &)
    {
        threw = true;
    }
    assert(threw);

    return 0;
}
