#include "EventSourceFactory.hpp"
#include "EventChannelClient.hpp"
#include "LogTailSource.hpp"

#include <plog/Log.h>

namespace ipc
{

std::unique_ptr<IEventSource> createEventSource(const EventsSection& cfg)
{
    switch (cfg.source)
    {
    case EventsSection::Source::File:
        PLOG_INFO << "Event source: log file " << cfg.log_path;
        return std::make_unique<LogTailSource>(cfg.log_path);
    case EventsSection::Source::Tcp:
        break;
    }
    PLOG_INFO << "Event source: tcp " << cfg.host << ":" << cfg.port;
    return std::make_unique<EventChannelClient>(cfg.host, cfg.port, cfg.reconnect_delay_ms);
}

} // namespace ipc
