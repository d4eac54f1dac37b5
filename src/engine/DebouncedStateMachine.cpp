#include "DebouncedStateMachine.hpp"

namespace engine
{

DebouncedStateMachine::DebouncedStateMachine(std::chrono::milliseconds activation_delay, SmoothingRates rates)
    : delay_(activation_delay)
    , rates_(rates)
{
}

void DebouncedStateMachine::setWorking(bool active, TimePoint now) { set(working_, state_.working, active, now); }

void DebouncedStateMachine::setWaiting(bool active, TimePoint now) { set(waiting_, state_.waiting, active, now); }

void DebouncedStateMachine::set(Gate& gate, Channel& channel, bool active, TimePoint now)
{
    if (!active)
    {
        gate.deadline.reset();
        gate.phase = ActivationPhase::Idle;
        channel.target = 0.0f;
        return;
    }

    if (gate.phase != ActivationPhase::Idle)
        return;

    gate.phase = ActivationPhase::Pending;
    gate.deadline = now + delay_;
}

void DebouncedStateMachine::triggerSpike(TimePoint now)
{
    state_.error.target = 1.0f;
    spike_reset_ = now + kSpikeHold;
}

void DebouncedStateMachine::fire(Gate& gate, Channel& channel, TimePoint now)
{
    if (gate.phase != ActivationPhase::Pending || !gate.deadline || now < *gate.deadline)
        return;

    gate.deadline.reset();
    gate.phase = ActivationPhase::Active;
    channel.target = 1.0f;
}

void DebouncedStateMachine::update(TimePoint now)
{
    fire(working_, state_.working, now);
    fire(waiting_, state_.waiting, now);

    if (spike_reset_ && now >= *spike_reset_)
    {
        spike_reset_.reset();
        state_.error.target = 0.0f;
    }
}

void DebouncedStateMachine::smoothDirectional(Channel& channel) const
{
    channel.smooth(channel.rising() ? rates_.rise : rates_.fall);
}

void DebouncedStateMachine::smooth()
{
    smoothDirectional(state_.working);
    smoothDirectional(state_.waiting);
    smoothDirectional(state_.spike);
    state_.error.smooth(rates_.error);
}

bool DebouncedStateMachine::hasPendingActivation() const
{
    return working_.phase == ActivationPhase::Pending || waiting_.phase == ActivationPhase::Pending;
}

void DebouncedStateMachine::reset()
{
    working_ = Gate{};
    waiting_ = Gate{};
    spike_reset_.reset();
    state_ = ControlState{};
}

} // namespace engine
