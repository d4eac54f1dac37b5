#pragma once

#include <string>

namespace chat
{

// "Thinking." -> "Thinking.." -> "Thinking..." -> "Thinking." ...
class ThinkingAnimation
{
public:
    static constexpr float kStepSeconds = 0.4f;

    void reset();
    // Returns true when the label changed
    bool advance(float dt);
    std::string label() const;
    int dots() const { return dots_; }

private:
    float accum_ = 0.0f;
    int dots_ = 1;
};

} // namespace chat
