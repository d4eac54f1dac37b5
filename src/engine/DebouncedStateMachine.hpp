#pragma once

#include "Clock.hpp"
#include "ControlState.hpp"

#include <chrono>
#include <optional>

namespace engine
{

enum class ActivationPhase
{
    Idle,
    Pending,
    Active
};

struct SmoothingRates
{
    float rise = 0.05f;  // working, waiting, spike moving up
    float fall = 0.02f;  // same channels moving down
    float error = 0.08f; // error in both directions
};

/**
 * @brief Delayed-on / instant-off gate for the working and waiting channels
 *
 * set(true) on an idle channel arms an activation deadline; the target only
 * flips to 1 once update() observes the deadline. set(false) cancels any armed
 * deadline and drops the target in the same call. Repeated set(true) calls
 * while pending or active are ignored, so a burst never creates a second
 * deadline.
 *
 * triggerSpike() raises error.target at once and (re)arms a single reset
 * deadline; the latest trigger decides when error falls back to 0.
 *
 * Nothing here reads a clock: callers pass the frame timestamp.
 */
class DebouncedStateMachine
{
public:
    static constexpr std::chrono::milliseconds kSpikeHold{ 2000 };

    DebouncedStateMachine(std::chrono::milliseconds activation_delay, SmoothingRates rates);

    void setWorking(bool active, TimePoint now);
    void setWaiting(bool active, TimePoint now);
    void triggerSpike(TimePoint now);

    // Fires due activations and the spike reset. Call once per frame before smooth().
    void update(TimePoint now);

    // One exponential smoothing step for working, waiting, spike and error.
    void smooth();

    void reset();

    ActivationPhase workingPhase() const { return working_.phase; }
    ActivationPhase waitingPhase() const { return waiting_.phase; }
    bool hasPendingActivation() const;
    std::optional<TimePoint> workingDeadline() const { return working_.deadline; }
    std::optional<TimePoint> waitingDeadline() const { return waiting_.deadline; }
    std::optional<TimePoint> spikeResetDeadline() const { return spike_reset_; }

    std::chrono::milliseconds activationDelay() const { return delay_; }
    const SmoothingRates& rates() const { return rates_; }

    ControlState& state() { return state_; }
    const ControlState& state() const { return state_; }

private:
    struct Gate
    {
        ActivationPhase phase = ActivationPhase::Idle;
        std::optional<TimePoint> deadline;
    };

    void set(Gate& gate, Channel& channel, bool active, TimePoint now);
    void fire(Gate& gate, Channel& channel, TimePoint now);
    void smoothDirectional(Channel& channel) const;

    std::chrono::milliseconds delay_;
    SmoothingRates rates_;
    ControlState state_;
    Gate working_;
    Gate waiting_;
    std::optional<TimePoint> spike_reset_;
};

} // namespace engine
