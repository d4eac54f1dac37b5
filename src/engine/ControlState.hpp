#pragma once

namespace engine
{

// A smoothed scalar. Triggers write target; only smoothing moves current.
struct Channel
{
    float current = 0.0f;
    float target = 0.0f;

    void smooth(float rate) { current += (target - current) * rate; }
    bool rising() const { return target > current; }
};

struct ControlState
{
    Channel error;
    Channel working;
    Channel waiting;
    Channel spike;
    Channel colorBlend; // palette cursor, advanced by triggerNextColor()
    Channel shapeSpeed; // graph only

    float activity() const { return working.current > waiting.current ? working.current : waiting.current; }
    bool activityRequested() const { return working.target > 0.5f || waiting.target > 0.5f; }
};

} // namespace engine
