#pragma once

#include "ChatTypes.hpp"

#include <vector>

namespace chat
{

// One streaming request at a time. Events are produced on a worker thread
// and handed over through drain() on the caller's thread, in arrival order.
class IChatTransport
{
public:
    virtual ~IChatTransport() = default;

    virtual bool begin(const ChatRequest& request) = 0;
    virtual void drain(std::vector<TransportEvent>& out) = 0;
    virtual void cancel() = 0;
    virtual bool active() const = 0;
    virtual const char* lastError() const = 0;
};

} // namespace chat
