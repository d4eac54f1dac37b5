#include "ThinkingAnimation.hpp"

namespace chat
{

void ThinkingAnimation::reset()
{
    accum_ = 0.0f;
    dots_ = 1;
}

bool ThinkingAnimation::advance(float dt)
{
    if (dt <= 0.0f)
        return false;

    bool changed = false;
    accum_ += dt;
    while (accum_ >= kStepSeconds)
    {
        accum_ -= kStepSeconds;
        dots_ = dots_ % 3 + 1;
        changed = true;
    }
    return changed;
}

std::string ThinkingAnimation::label() const { return "Thinking" + std::string(static_cast<std::size_t>(dots_), '.'); }

} // namespace chat
