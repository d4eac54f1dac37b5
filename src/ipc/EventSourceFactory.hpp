#pragma once

#include "IEventSource.hpp"
#include "config/AppConfig.hpp"

#include <memory>

namespace ipc
{
    std::unique_ptr<IEventSource> createEventSource(const EventsSection& cfg);
}
