#pragma once

#include "LogEvent.hpp"

#include <vector>

namespace ipc
{
    // Background producer of activity events. Events are read on a worker
    // thread and handed to the main loop by poll().
    class IEventSource
    {
    public:
        virtual ~IEventSource() = default;

        virtual bool start() = 0;
        virtual void stop() = 0;

        // Appends queued events in arrival order; false when there were none
        virtual bool poll(std::vector<LogEvent>& out) = 0;

        virtual ChannelStatus status() const = 0;
        virtual const char* lastError() const = 0;
        virtual const char* name() const = 0;
    };
}
