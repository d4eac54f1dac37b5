#include "Application.hpp"
#include "ActivityController.hpp"
#include "chat/ChatSession.hpp"
#include "chat/CprChatTransport.hpp"
#include "config/ConfigManager.hpp"
#include "config/StateSerializer.hpp"
#include "engine/EngineHost.hpp"
#include "ipc/EventSourceFactory.hpp"
#include "ui/ActivityOverlay.hpp"
#include "ui/AppContext.hpp"
#include "ui/ChatWindow.hpp"
#include "ui/ErrorDialog.hpp"
#include "ui/FontManager.hpp"
#include "ui/IndicatorView.hpp"
#include "ui/UITheme.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"
#include "utils/Profile.hpp"

#include <imgui.h>
#include <plog/Log.h>

#include <cstring>
#include <string>

namespace
{

#if GHOST_PROFILING_LEVEL >= 1
profiling::detail::FrameStatsAccumulator frame_stats_{ 120 };
#endif

constexpr float kConfigCheckInterval = 1.0f;
constexpr float kChatPanelRatio = 0.38f;
constexpr float kFontSize = 16.0f;

std::string g_config_path = "config.toml";

static void SDLCALL SDLLogBridge(void* userdata, int category, SDL_LogPriority priority, const char* message)
{
    (void)userdata;
    switch (priority)
    {
    case SDL_LOG_PRIORITY_VERBOSE:
        PLOG_VERBOSE << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_DEBUG:
        PLOG_DEBUG << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_INFO:
        PLOG_INFO << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_WARN:
        PLOG_WARNING << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_ERROR:
        PLOG_ERROR << "[SDL:" << category << "] " << message;
        break;
    case SDL_LOG_PRIORITY_CRITICAL:
        PLOG_FATAL << "[SDL:" << category << "] " << message;
        break;
    default:
        PLOG_INFO << "[SDL:" << category << "] " << message;
        break;
    }
}

engine::EngineKind toEngineKind(EngineSection::Variant variant)
{
    return variant == EngineSection::Variant::Surface ? engine::EngineKind::Surface : engine::EngineKind::Graph;
}

chat::ChatSessionConfig toSessionConfig(const ChatSection& s)
{
    chat::ChatSessionConfig c;
    c.endpoint = s.endpoint;
    c.model = s.model;
    c.connect_timeout_ms = s.connect_timeout_ms;
    c.timeout_ms = s.timeout_ms;
    c.scroll_follow_threshold = s.scroll_follow_threshold;
    return c;
}

bool sameEventSource(const EventsSection& a, const EventsSection& b)
{
    return a.source == b.source && a.host == b.host && a.port == b.port && a.log_path == b.log_path &&
           a.reconnect_delay_ms == b.reconnect_delay_ms;
}

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
    for (int i = 1; i + 1 < argc; ++i)
    {
        if (std::strcmp(argv[i], "--config") == 0)
            g_config_path = argv[i + 1];
    }
}

Application::~Application() { cleanup(); }

bool Application::initialize()
{
    PROFILE_SCOPE();

    if (!initializeLogging())
        return false;

    initializeConfig();

    context_ = std::make_unique<AppContext>();
    if (!context_->initialize(cfg_.window.width, cfg_.window.height))
        return false;

    setupSDLLogging();
    SDL_SetAppMetadata("Ghost Interface", "1.0.0", "ghost-interface");

    font_manager_ = std::make_unique<FontManager>();
    font_manager_->load(kFontSize);
    error_dialog_ = std::make_unique<ErrorDialog>();

    context_->setWindowAlwaysOnTop(cfg_.window.always_on_top);

    setupEngine();
    setupChat();
    setupEvents();

    last_time_ = SDL_GetTicks();
    return true;
}

bool Application::initializeLogging()
{
    PROFILE_SCOPE();

    if (!utils::LogManager::Initialize(g_config_path))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    PLOG_INFO << "Ghost Interface starting (config: " << g_config_path << ")";
    return true;
}

void Application::setupSDLLogging()
{
    SDL_SetLogOutputFunction(SDLLogBridge, nullptr);
    SDL_SetLogPriority(SDL_LOG_CATEGORY_APPLICATION, SDL_LOG_PRIORITY_INFO);
}

void Application::initializeConfig()
{
    PROFILE_SCOPE();

    config_ = std::make_unique<ConfigManager>(g_config_path);
    StateSerializer::registerAll(*config_, cfg_);

    if (!config_->load())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to load configuration",
                                            config_->lastError());
    }

    utils::LogManager::SetLevel(cfg_.app.logging_level);
}

void Application::setupEngine()
{
    engine::EngineContext ctx;
    ctx.canvas = &canvas_;
    ctx.scheduler = &scheduler_;
    ctx.clock = engine::systemClock();
    ctx.seed = cfg_.engine.seed;
    ctx.surface_subdivisions = cfg_.engine.surface_subdivisions;

    engine_ = std::make_unique<engine::EngineHost>(ctx);
    indicator_view_ = std::make_unique<IndicatorView>();
    overlay_ = std::make_unique<ActivityOverlay>();
    activity_ = std::make_unique<app::ActivityController>(*engine_);

    if (!engine_->swap(toEngineKind(cfg_.engine.variant)))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Rendering, "The activity indicator failed to start",
                                          std::string("engine: ") + engine::engineKindName(engine_->kind()));
    }
}

void Application::setupChat()
{
    transport_ = std::make_unique<chat::CprChatTransport>();
    chat_window_ = std::make_unique<ChatWindow>(
        [this](const std::string& text)
        {
            if (session_)
                session_->send(text, engine::Clock::now());
        });

    chat::TurnCallbacks callbacks;
    callbacks.on_turn_started = [this] { activity_->beginTurn(engine::Clock::now()); };
    callbacks.on_turn_finished = [this] { activity_->endTurn(engine::Clock::now()); };
    callbacks.on_error = [this] { activity_->reportTurnError(); };

    session_ = std::make_unique<chat::ChatSession>(*chat_window_, *transport_, toSessionConfig(cfg_.chat),
                                                   std::move(callbacks));
}

void Application::setupEvents()
{
    if (events_)
        events_->stop();
    events_ = ipc::createEventSource(cfg_.events);
    if (!events_->start())
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::EventChannel, "Activity feed could not be started",
                                          events_->lastError());
    }
}

int Application::run()
{
    PROFILE_THREAD_NAME("MainThread");
    if (!initialize())
        return -1;
    mainLoop();
    return 0;
}

void Application::requestExit()
{
    PLOG_INFO << "Application exit requested";
    quit_requested_ = true;
}

void Application::mainLoop()
{
    PROFILE_SCOPE();

    while (running_)
    {
        float delta_time = calculateDeltaTime();
        processEvents();

        engine::TimePoint now = engine::Clock::now();

        std::vector<ipc::LogEvent> inbound;
        if (events_ && events_->poll(inbound))
        {
            for (const auto& ev : inbound)
                activity_->handleEvent(ev, now);
        }
        session_->update(now);
        activity_->update(now);

        config_check_timer_ += delta_time;
        if (config_check_timer_ >= kConfigCheckInterval)
        {
            config_check_timer_ = 0.0f;
            AppConfig previous = cfg_;
            if (config_->reloadIfChanged())
                applyConfigChanges(previous);
        }

        renderFrame(delta_time, now);
        handleQuitRequests();

        PROFILE_FRAME_STATS(frame_stats_);
    }
}

void Application::applyConfigChanges(const AppConfig& previous)
{
    PLOG_INFO << "Configuration reloaded";

    if (previous.app.logging_level != cfg_.app.logging_level)
        utils::LogManager::SetLevel(cfg_.app.logging_level);
    if (previous.window.always_on_top != cfg_.window.always_on_top)
        context_->setWindowAlwaysOnTop(cfg_.window.always_on_top);

    session_->setConfig(toSessionConfig(cfg_.chat));

    if (previous.engine.variant != cfg_.engine.variant)
    {
        engine_->swap(toEngineKind(cfg_.engine.variant));
        activity_->syncEngine();
    }
    if (!sameEventSource(previous.events, cfg_.events))
        setupEvents();
}

float Application::calculateDeltaTime()
{
    Uint64 current_time = SDL_GetTicks();
    float delta_time = (current_time - last_time_) / 1000.0f;
    last_time_ = current_time;
    return delta_time;
}

void Application::processEvents()
{
    SDL_Event event;
    while (SDL_PollEvent(&event))
    {
        if (context_->processEvent(event))
            quit_requested_ = true;
        if (event.type == SDL_EVENT_KEY_DOWN)
            handleKey(event.key);
    }
}

void Application::handleKey(const SDL_KeyboardEvent& key)
{
    if (key.repeat)
        return;
    // Typing a 'z' into the chat box must not toggle the layout
    if (key.key == SDLK_Z && !ImGui::GetIO().WantTextInput)
        setZenMode(!cfg_.window.zen_mode);
}

void Application::setZenMode(bool zen)
{
    cfg_.window.zen_mode = zen;
    PLOG_DEBUG << "Zen mode " << (zen ? "on" : "off");
}

void Application::selectVariant(EngineSection::Variant variant)
{
    if (variant == cfg_.engine.variant)
        return;
    cfg_.engine.variant = variant;
    if (!engine_->swap(toEngineKind(variant)))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Rendering, "The activity indicator failed to start",
                                          std::string("engine: ") + engine::engineKindName(engine_->kind()));
    }
    activity_->syncEngine();
    if (!config_->save())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to save configuration",
                                            config_->lastError());
    }
}

void Application::renderFrame(float delta_time, engine::TimePoint now)
{
    context_->beginFrame();

    const ImGuiViewport* viewport = ImGui::GetMainViewport();
    ImGui::SetNextWindowPos(viewport->WorkPos);
    ImGui::SetNextWindowSize(viewport->WorkSize);
    ImGuiWindowFlags flags = ImGuiWindowFlags_NoDecoration | ImGuiWindowFlags_NoMove |
                             ImGuiWindowFlags_NoBringToFrontOnFocus | ImGuiWindowFlags_NoSavedSettings |
                             ImGuiWindowFlags_NoScrollWithMouse;
    ImGui::PushStyleVar(ImGuiStyleVar_WindowRounding, 0.0f);
    ImGui::PushStyleVar(ImGuiStyleVar_WindowPadding, ImVec2(0.0f, 0.0f));
    ImGui::Begin("##ghost_root", nullptr, flags);
    ImGui::PopStyleVar(2);

    renderToolbar();

    const float avail = ImGui::GetContentRegionAvail().x;
    const float chat_width = cfg_.window.zen_mode ? 0.0f : avail * kChatPanelRatio;

    ImGui::BeginChild("##indicator_panel", ImVec2(avail - chat_width, 0), false,
                      ImGuiWindowFlags_NoScrollbar | ImGuiWindowFlags_NoScrollWithMouse);
    renderIndicatorPanel(now);
    ImGui::EndChild();

    if (!cfg_.window.zen_mode)
    {
        ImGui::SameLine(0.0f, 0.0f);
        UITheme::pushPanelStyle(0.82f, ImVec2(12.0f, 12.0f), 0.0f, 1.0f);
        ImGui::BeginChild("##chat_panel", ImVec2(0, 0), true, ImGuiWindowFlags_NoScrollbar);
        renderChatPanel(delta_time);
        ImGui::EndChild();
        UITheme::popPanelStyle();
    }

    ImGui::End();

    handleErrors();
    context_->endFrame();
    PROFILE_FRAME_MARK();
}

void Application::renderToolbar()
{
    ImGui::SetCursorPos(ImVec2(8.0f, 6.0f));
    ImGui::TextColored(UITheme::accentColor(), "GHOST");
    ImGui::SameLine();

    int variant = cfg_.engine.variant == EngineSection::Variant::Surface ? 1 : 0;
    const char* variants[] = { "Graph", "Surface" };
    ImGui::SetNextItemWidth(110.0f);
    if (ImGui::Combo("##engine_variant", &variant, variants, IM_ARRAYSIZE(variants)))
        selectVariant(variant == 1 ? EngineSection::Variant::Surface : EngineSection::Variant::Graph);
    ImGui::SameLine();

    if (ImGui::Button(cfg_.window.zen_mode ? "Exit zen" : "Zen"))
        setZenMode(!cfg_.window.zen_mode);
    ImGui::SameLine();

    if (ImGui::Checkbox("On top", &cfg_.window.always_on_top))
        context_->setWindowAlwaysOnTop(cfg_.window.always_on_top);

    ImGui::SetCursorPosY(ImGui::GetCursorPosY() + 2.0f);
}

void Application::renderIndicatorPanel(engine::TimePoint now)
{
    PROFILE_SCOPE_CUSTOM("Application::renderIndicatorPanel");

    indicator_view_->layout(canvas_);
    // Engines draw into the canvas from their frame callbacks
    scheduler_.tick(now);
    indicator_view_->draw(canvas_);

    overlay_->draw(indicator_view_->origin(), indicator_view_->size(), activity_->badge(), activity_->caption(),
                   events_ ? events_->status() : ipc::ChannelStatus::Disconnected, font_manager_->badgeFont());
}

void Application::renderChatPanel(float delta_time)
{
    chat_window_->render(delta_time, session_->busy());
}

void Application::handleErrors()
{
    if (utils::ErrorReporter::HasPendingErrors())
        error_dialog_->Show(utils::ErrorReporter::GetPendingErrors());

    if (error_dialog_->Render())
        quit_requested_ = true;
}

void Application::handleQuitRequests()
{
    if (!quit_requested_)
        return;
    running_ = false;
}

void Application::cleanup()
{
    if (cleaned_up_)
        return;
    cleaned_up_ = true;

    if (events_)
        events_->stop();
    if (session_)
        session_->cancel();
    if (engine_)
        engine_->destroy();

    if (context_)
    {
        int w = 0, h = 0;
        context_->windowSize(w, h);
        if (w > 0 && h > 0)
        {
            cfg_.window.width = w;
            cfg_.window.height = h;
        }
    }
    if (config_ && !config_->save())
        PLOG_WARNING << "Failed to save configuration: " << config_->lastError();

    session_.reset();
    chat_window_.reset();
    transport_.reset();
    activity_.reset();
    engine_.reset();
    context_.reset();
    PLOG_INFO << "Ghost Interface stopped";
    utils::LogManager::Shutdown();
}
