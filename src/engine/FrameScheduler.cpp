#include "FrameScheduler.hpp"

#include <algorithm>

namespace engine
{

FrameScheduler::Handle FrameScheduler::add(FrameCallback cb)
{
    if (!cb)
        return kInvalidHandle;

    Handle h = next_handle_++;
    entries_.push_back({ h, std::move(cb), true });
    return h;
}

bool FrameScheduler::remove(Handle handle)
{
    auto it = std::find_if(entries_.begin(), entries_.end(),
                           [handle](const Entry& e) { return e.handle == handle && e.alive; });
    if (it == entries_.end())
        return false;

    if (ticking_)
    {
        // Erasing would invalidate the tick loop; compacted after the tick
        it->alive = false;
    }
    else
    {
        entries_.erase(it);
    }
    return true;
}

void FrameScheduler::tick(TimePoint now)
{
    ++ticks_;
    ticking_ = true;

    // Entries appended during the loop wait for the next tick
    const std::size_t count = entries_.size();
    for (std::size_t i = 0; i < count; ++i)
    {
        if (!entries_[i].alive)
            continue;
        // Copy: the callback may push_back into entries_ and reallocate
        FrameCallback cb = entries_[i].callback;
        cb(now);
    }

    ticking_ = false;
    entries_.erase(std::remove_if(entries_.begin(), entries_.end(), [](const Entry& e) { return !e.alive; }),
                   entries_.end());
}

std::size_t FrameScheduler::size() const
{
    return static_cast<std::size_t>(
        std::count_if(entries_.begin(), entries_.end(), [](const Entry& e) { return e.alive; }));
}

bool FrameScheduler::contains(Handle handle) const
{
    return std::any_of(entries_.begin(), entries_.end(),
                       [handle](const Entry& e) { return e.handle == handle && e.alive; });
}

} // namespace engine
