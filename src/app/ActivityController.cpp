#include "ActivityController.hpp"
#include "engine/IAnimationEngine.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <regex>

namespace app
{

namespace
{

std::string trimCopy(const std::string& s)
{
    const char* ws = " \t\r\n";
    auto first = s.find_first_not_of(ws);
    if (first == std::string::npos)
        return {};
    auto last = s.find_last_not_of(ws);
    return s.substr(first, last - first + 1);
}

} // namespace

ActivityController::ActivityController(engine::IAnimationEngine& engine)
    : engine_(engine)
{
}

bool ActivityController::mentionsMonologue(const std::string& content)
{
    return content.find("PLANNER MONOLOGUE") != std::string::npos;
}

std::optional<std::string> ActivityController::extractMonologue(const std::string& content)
{
    static const std::regex monologue_pattern(R"(PLANNER MONOLOGUE\s*:\s*(.*))");
    std::smatch match;
    if (!std::regex_search(content, match, monologue_pattern) || match[1].length() == 0)
        return std::nullopt;
    std::string text = trimCopy(match[1].str());
    if (text.empty())
        return std::nullopt;
    return text;
}

void ActivityController::handleEvent(const ipc::LogEvent& ev, engine::TimePoint now)
{
    if (ev.type != "log")
    {
        PLOG_DEBUG << "Ignoring event of type '" << ev.type << "'";
        return;
    }
    ++event_count_;

    processing::SignalClassification cls = processing::classify(ev.content);
    PLOG_INFO_(utils::kEventLogInstance) << (ev.is_error ? "[error] " : "") << "["
                                         << processing::categoryName(cls.category) << "] " << ev.content;

    if (mentionsMonologue(ev.content))
        engine_.triggerSmallPulse();
    else
        engine_.triggerPulse(engine::Color::fromRgb(cls.color));

    if (cls.hasSymbol())
    {
        showSymbol(cls, now);
        applySymbolState(cls, now);
        if (cls.alert)
            engine_.triggerSpike();
    }
    flashBadge(now);
    if (ev.is_error)
        engine_.triggerSpike();

    if (auto text = extractMonologue(ev.content))
        showCaption(*text, now);
}

void ActivityController::showSymbol(const processing::SignalClassification& cls, engine::TimePoint now)
{
    badge_.symbol = cls.symbol;
    badge_.color = cls.color;
    badge_.opacity = 1.0f;

    badge_hide_at_.reset();
    if (!turn_active_)
    {
        auto hold = cls.category == processing::SignalCategory::Working ? kWorkingBadgeHold : kIdleBadgeHold;
        badge_hide_at_ = now + hold;
    }
}

void ActivityController::applySymbolState(const processing::SignalClassification& cls, engine::TimePoint now)
{
    // The chat turn owns the busy state while it runs
    if (turn_active_)
        return;

    if (cls.category == processing::SignalCategory::Working)
    {
        setBusy(true);
        badge_.working = true;
        work_timeout_at_ = now + kWorkTimeout;
    }
    else if (cls.category == processing::SignalCategory::Idle)
    {
        setBusy(false);
        badge_.working = false;
        work_timeout_at_.reset();
    }
}

void ActivityController::flashBadge(engine::TimePoint now)
{
    if (badge_.working)
        return;
    badge_.scale = kFlashScale;
    flash_until_ = now + kFlashDuration;
}

void ActivityController::showCaption(const std::string& text, engine::TimePoint now)
{
    caption_.text = text;
    caption_.visible = true;
    caption_hide_at_.reset();
    if (!turn_active_)
        caption_hide_at_ = now + kCaptionHold;
}

void ActivityController::setBusy(bool busy)
{
    engine_.setWorkingState(busy);
    engine_.setWaitingState(busy);
}

void ActivityController::beginTurn(engine::TimePoint now)
{
    (void)now;
    turn_active_ = true;
    setBusy(true);

    badge_hide_at_.reset();
    badge_.symbol = kTurnSymbol;
    badge_.color = processing::classify(kTurnSymbol).color;
    badge_.opacity = 1.0f;
    badge_.working = true;
}

void ActivityController::endTurn(engine::TimePoint now)
{
    turn_active_ = false;
    setBusy(false);
    work_timeout_at_.reset();
    badge_.working = false;

    showSymbol(processing::classify(kDoneSymbol), now);
    if (caption_.visible)
        caption_hide_at_ = now + kCaptionHold;
}

void ActivityController::syncEngine() { setBusy(busy()); }

void ActivityController::reportTurnError() { engine_.triggerSpike(); }

void ActivityController::update(engine::TimePoint now)
{
    if (flash_until_ && now >= *flash_until_)
    {
        badge_.scale = 1.0f;
        flash_until_.reset();
    }

    if (work_timeout_at_ && now >= *work_timeout_at_)
    {
        work_timeout_at_.reset();
        if (!turn_active_)
        {
            PLOG_DEBUG << "No activity for " << kWorkTimeout.count() << " ms, going idle";
            setBusy(false);
            badge_.working = false;
        }
    }

    if (badge_hide_at_ && now >= *badge_hide_at_ && !turn_active_)
    {
        auto faded = std::chrono::duration<float, std::milli>(now - *badge_hide_at_).count();
        badge_.opacity = 1.0f - std::min(faded / static_cast<float>(kBadgeFade.count()), 1.0f);
        if (badge_.opacity <= 0.0f)
        {
            badge_.symbol.clear();
            badge_.opacity = 0.0f;
            badge_hide_at_.reset();
        }
    }

    if (caption_hide_at_ && now >= *caption_hide_at_)
    {
        caption_.visible = false;
        caption_hide_at_.reset();
    }
}

} // namespace app
