#pragma once

#include "config/AppConfig.hpp"
#include "engine/Canvas.hpp"
#include "engine/Clock.hpp"
#include "engine/FrameScheduler.hpp"

#include <SDL3/SDL.h>

#include <memory>

class AppContext;
class ConfigManager;
class ErrorDialog;
class FontManager;
class IndicatorView;
class ActivityOverlay;
class ChatWindow;

namespace engine
{
class EngineHost;
}

namespace chat
{
class ChatSession;
class IChatTransport;
} // namespace chat

namespace ipc
{
class IEventSource;
}

namespace app
{
class ActivityController;
}

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();
    void requestExit();

private:
    bool initialize();
    bool initializeLogging();
    void setupSDLLogging();
    void initializeConfig();
    void setupEngine();
    void setupChat();
    void setupEvents();

    void mainLoop();
    float calculateDeltaTime();
    void processEvents();
    void handleKey(const SDL_KeyboardEvent& key);
    void applyConfigChanges(const AppConfig& previous);

    void renderFrame(float delta_time, engine::TimePoint now);
    void renderToolbar();
    void renderIndicatorPanel(engine::TimePoint now);
    void renderChatPanel(float delta_time);
    void handleErrors();

    void setZenMode(bool zen);
    void selectVariant(EngineSection::Variant variant);
    void handleQuitRequests();
    void cleanup();

    AppConfig cfg_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<AppContext> context_;
    std::unique_ptr<FontManager> font_manager_;
    std::unique_ptr<ErrorDialog> error_dialog_;

    engine::Canvas canvas_;
    engine::FrameScheduler scheduler_;
    std::unique_ptr<engine::EngineHost> engine_;
    std::unique_ptr<IndicatorView> indicator_view_;
    std::unique_ptr<ActivityOverlay> overlay_;
    std::unique_ptr<app::ActivityController> activity_;

    std::unique_ptr<chat::IChatTransport> transport_;
    std::unique_ptr<ChatWindow> chat_window_;
    std::unique_ptr<chat::ChatSession> session_;

    std::unique_ptr<ipc::IEventSource> events_;

    bool quit_requested_ = false;
    bool running_ = true;
    bool cleaned_up_ = false;
    Uint64 last_time_ = 0;
    float config_check_timer_ = 0.0f;

    [[maybe_unused]] int argc_ = 0;
    [[maybe_unused]] char** argv_ = nullptr;
};
