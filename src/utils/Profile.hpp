#pragma once

#include <algorithm>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <string>
#include <string_view>

// GHOST_PROFILING_LEVEL is set via CMake:
//   0 = Disabled
//   1 = Scope timers and frame stats through plog
//   2 = Tracy zones on top of level 1

#ifndef GHOST_PROFILING_LEVEL
#define GHOST_PROFILING_LEVEL 0
#endif

#if GHOST_PROFILING_LEVEL >= 2
#include <tracy/Tracy.hpp>
#endif

#if GHOST_PROFILING_LEVEL >= 1
#include <plog/Log.h>
#endif

namespace profiling
{

#if GHOST_PROFILING_LEVEL >= 1
constexpr int kProfilingLogInstance = 2;
#endif

namespace detail
{

#if GHOST_PROFILING_LEVEL >= 1
/**
 * @brief Logs the lifetime of a scope to the profiling logger
 */
class ScopeTimer
{
public:
    explicit ScopeTimer(std::string_view name) noexcept
        : name_(name)
        , start_(std::chrono::steady_clock::now())
    {
    }

    ~ScopeTimer() noexcept
    {
        auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - start_);
        PLOG_DEBUG_(profiling::kProfilingLogInstance) << "[PROFILE] " << name_ << " took " << elapsed.count() << " us";
    }

    ScopeTimer(const ScopeTimer&) = delete;
    ScopeTimer& operator=(const ScopeTimer&) = delete;

private:
    std::string_view name_;
    std::chrono::steady_clock::time_point start_;
};

/**
 * @brief Summarizes frame times every N frames
 *
 * The indicator redraws every display refresh, so per-frame lines would
 * drown the log. Only min/avg/max per interval are written.
 */
class FrameStatsAccumulator
{
public:
    explicit FrameStatsAccumulator(std::size_t log_interval = 120) noexcept
        : log_interval_(log_interval)
        , last_(std::chrono::steady_clock::now())
    {
    }

    void recordFrame() noexcept
    {
        auto now = std::chrono::steady_clock::now();
        double ms = std::chrono::duration<double, std::milli>(now - last_).count();
        last_ = now;

        min_ms_ = std::min(min_ms_, ms);
        max_ms_ = std::max(max_ms_, ms);
        total_ms_ += ms;

        if (++frames_ < log_interval_)
            return;

        double avg = total_ms_ / static_cast<double>(frames_);
        PLOG_DEBUG_(profiling::kProfilingLogInstance)
            << "[PROFILE] " << frames_ << " frames: avg=" << avg << "ms min=" << min_ms_ << "ms max=" << max_ms_
            << "ms fps=" << (avg > 0.0 ? 1000.0 / avg : 0.0);

        frames_ = 0;
        min_ms_ = std::numeric_limits<double>::max();
        max_ms_ = 0.0;
        total_ms_ = 0.0;
    }

private:
    std::size_t log_interval_;
    std::size_t frames_ = 0;
    double min_ms_ = std::numeric_limits<double>::max();
    double max_ms_ = 0.0;
    double total_ms_ = 0.0;
    std::chrono::steady_clock::time_point last_;
};
#endif

#if GHOST_PROFILING_LEVEL >= 2
inline constexpr std::uint16_t clampLength(std::size_t length) noexcept
{
    return length > 0xFFFFu ? static_cast<std::uint16_t>(0xFFFF) : static_cast<std::uint16_t>(length);
}

inline void SetThreadName(const char* name) noexcept
{
    if (name)
        tracy::SetThreadName(name);
}
#endif

} // namespace detail

} // namespace profiling

#if GHOST_PROFILING_LEVEL == 0
#define PROFILE_SCOPE() ((void)0)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ((void)sizeof(nameExpr))
#define PROFILE_THREAD_NAME(nameExpr) ((void)0)
#define PROFILE_FRAME_MARK() ((void)0)
#define PROFILE_FRAME_STATS(accumulator) ((void)0)

#elif GHOST_PROFILING_LEVEL == 1
#define PROFILE_SCOPE() ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr) ::profiling::detail::ScopeTimer __profiling_timer(nameExpr)
#define PROFILE_THREAD_NAME(nameExpr) ((void)0)
#define PROFILE_FRAME_MARK() ((void)0)
#define PROFILE_FRAME_STATS(accumulator) (accumulator).recordFrame()

#else
#define PROFILE_SCOPE() \
    ZoneScoped;         \
    ::profiling::detail::ScopeTimer __profiling_timer(__FUNCTION__)
#define PROFILE_SCOPE_CUSTOM(nameExpr)                                                         \
    ZoneScoped;                                                                                \
    ::profiling::detail::ScopeTimer __profiling_timer(nameExpr);                               \
    ZoneName(std::string_view(nameExpr).data(),                                               \
             ::profiling::detail::clampLength(std::string_view(nameExpr).size()))
#define PROFILE_THREAD_NAME(nameExpr) ::profiling::detail::SetThreadName(nameExpr)
#define PROFILE_FRAME_MARK() FrameMark
#define PROFILE_FRAME_STATS(accumulator) (accumulator).recordFrame()
#endif
