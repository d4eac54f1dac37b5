#pragma once

#include "engine/Clock.hpp"
#include "engine/Color.hpp"
#include "ipc/LogEvent.hpp"
#include "processing/SignalClassifier.hpp"

#include <chrono>
#include <optional>
#include <string>

namespace engine
{
class IAnimationEngine;
}

namespace app
{

// Latest activity symbol shown next to the indicator
struct BadgeState
{
    std::string symbol;
    std::uint32_t color = processing::kDefaultAccentColor;
    float opacity = 0.0f;
    float scale = 1.0f;
    bool working = false; // steady, no flash on new events
};

struct CaptionState
{
    std::string text;
    bool visible = false;
};

/**
 * @brief Turns inbound activity events and chat turn boundaries into
 *        indicator triggers, badge and caption state
 *
 * All timers are deadlines checked in update(); nothing runs on its own.
 */
class ActivityController
{
public:
    using Millis = std::chrono::milliseconds;

    static constexpr Millis kFlashDuration{ 150 };
    static constexpr float kFlashScale = 1.2f;
    static constexpr Millis kWorkingBadgeHold{ 60000 };
    static constexpr Millis kIdleBadgeHold{ 2000 };
    static constexpr Millis kBadgeFade{ 300 };
    static constexpr Millis kWorkTimeout{ 60000 };
    static constexpr Millis kCaptionHold{ 2000 };

    static constexpr const char* kTurnSymbol = "\U0001F9E0";  // brain
    static constexpr const char* kDoneSymbol = "✅";      // check mark

    explicit ActivityController(engine::IAnimationEngine& engine);

    void handleEvent(const ipc::LogEvent& ev, engine::TimePoint now);

    void beginTurn(engine::TimePoint now);
    void endTurn(engine::TimePoint now);
    void reportTurnError();

    void update(engine::TimePoint now);

    // Re-applies the busy state to a freshly swapped engine
    void syncEngine();

    bool turnActive() const { return turn_active_; }
    bool busy() const { return turn_active_ || work_timeout_at_.has_value(); }
    const BadgeState& badge() const { return badge_; }
    const CaptionState& caption() const { return caption_; }
    std::size_t eventCount() const { return event_count_; }

    // Text after "PLANNER MONOLOGUE:", nullopt when the marker is absent or
    // nothing follows it
    static std::optional<std::string> extractMonologue(const std::string& content);
    static bool mentionsMonologue(const std::string& content);

private:
    void showSymbol(const processing::SignalClassification& cls, engine::TimePoint now);
    void applySymbolState(const processing::SignalClassification& cls, engine::TimePoint now);
    void flashBadge(engine::TimePoint now);
    void showCaption(const std::string& text, engine::TimePoint now);
    void setBusy(bool busy);

    engine::IAnimationEngine& engine_;

    bool turn_active_ = false;
    std::size_t event_count_ = 0;

    BadgeState badge_;
    std::optional<engine::TimePoint> flash_until_;
    std::optional<engine::TimePoint> badge_hide_at_;
    std::optional<engine::TimePoint> work_timeout_at_;

    CaptionState caption_;
    std::optional<engine::TimePoint> caption_hide_at_;
};

} // namespace app
