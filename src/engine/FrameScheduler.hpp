#pragma once

#include "Clock.hpp"

#include <cstdint>
#include <functional>
#include <vector>

namespace engine
{

// Display-refresh registry. The main loop calls tick() once per presented
// frame; every registered callback runs once per tick on that thread.
// Callbacks may add or remove registrations (their own included) while a
// tick is running: removals take effect immediately, additions on the next tick.
class FrameScheduler
{
public:
    using Handle = std::uint64_t;
    using FrameCallback = std::function<void(TimePoint now)>;

    static constexpr Handle kInvalidHandle = 0;

    Handle add(FrameCallback cb);
    bool remove(Handle handle);
    void tick(TimePoint now);

    std::size_t size() const;
    bool contains(Handle handle) const;
    std::uint64_t tickCount() const { return ticks_; }

private:
    struct Entry
    {
        Handle handle;
        FrameCallback callback;
        bool alive;
    };

    std::vector<Entry> entries_;
    Handle next_handle_ = 1;
    std::uint64_t ticks_ = 0;
    bool ticking_ = false;
};

} // namespace engine
