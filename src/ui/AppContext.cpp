#include "AppContext.hpp"
#include "UITheme.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/NativeMessageBox.hpp"

#include <imgui.h>
#include <backends/imgui_impl_sdl3.h>
#include <backends/imgui_impl_sdlrenderer3.h>
#include <plog/Log.h>

#include <cmath>

AppContext::AppContext() = default;

AppContext::~AppContext() { shutdown(); }

bool AppContext::initialize(int width, int height)
{
    if (initialized_)
        return true;

    if (!initializeSDL())
        return false;
    if (!createWindow(width, height))
        return false;
    if (!createRenderer())
        return false;
    if (!initializeImGui())
        return false;

    initialized_ = true;
    return true;
}

// Safe on a partially initialized context
void AppContext::shutdown()
{
    if (imgui_ready_)
    {
        ImGui_ImplSDLRenderer3_Shutdown();
        ImGui_ImplSDL3_Shutdown();
        ImGui::DestroyContext();
        imgui_ready_ = false;
    }
    else if (ImGui::GetCurrentContext())
    {
        ImGui::DestroyContext();
    }

    if (renderer_)
    {
        SDL_DestroyRenderer(renderer_);
        renderer_ = nullptr;
    }
    if (window_)
    {
        SDL_DestroyWindow(window_);
        window_ = nullptr;
    }
    if (sdl_ready_)
    {
        SDL_Quit();
        sdl_ready_ = false;
    }
    initialized_ = false;
}

bool AppContext::processEvent(const SDL_Event& event)
{
    ImGui_ImplSDL3_ProcessEvent(&event);

    if (event.type == SDL_EVENT_WINDOW_PIXEL_SIZE_CHANGED || event.type == SDL_EVENT_WINDOW_DISPLAY_SCALE_CHANGED)
    {
        if (window_ && renderer_ && event.window.windowID == SDL_GetWindowID(window_))
            updateRendererScale();
    }

    if (event.type == SDL_EVENT_WINDOW_CLOSE_REQUESTED && window_ &&
        event.window.windowID == SDL_GetWindowID(window_))
        return true;

    return event.type == SDL_EVENT_QUIT;
}

void AppContext::beginFrame()
{
    ImGui_ImplSDLRenderer3_NewFrame();
    ImGui_ImplSDL3_NewFrame();
    ImGui::NewFrame();
}

void AppContext::endFrame()
{
    ImGui::Render();
    SDL_SetRenderDrawColor(renderer_, 0, 0, 0, 255);
    SDL_RenderClear(renderer_);
    ImGui_ImplSDLRenderer3_RenderDrawData(ImGui::GetDrawData(), renderer_);
    SDL_RenderPresent(renderer_);
}

void AppContext::updateRendererScale()
{
    if (!window_ || !renderer_)
        return;
    if (SDL_GetWindowFlags(window_) & SDL_WINDOW_MINIMIZED)
        return;

    int w = 0, h = 0;
    int pw = 0, ph = 0;
    SDL_GetWindowSize(window_, &w, &h);
    SDL_GetWindowSizeInPixels(window_, &pw, &ph);

    float sx = (w > 0) ? (float)pw / (float)w : 1.0f;
    float sy = (h > 0) ? (float)ph / (float)h : 1.0f;
    if (sx <= 0.0f || !std::isfinite(sx))
        sx = 1.0f;
    if (sy <= 0.0f || !std::isfinite(sy))
        sy = 1.0f;

    float curx = 1.0f, cury = 1.0f;
    SDL_GetRenderScale(renderer_, &curx, &cury);
    if (std::fabs(curx - sx) < 0.001f && std::fabs(cury - sy) < 0.001f)
        return;

    if (!SDL_SetRenderScale(renderer_, sx, sy))
        PLOG_WARNING << "SDL_SetRenderScale(" << sx << "," << sy << ") failed: " << SDL_GetError();
}

void AppContext::setWindowAlwaysOnTop(bool topmost)
{
    if (!window_)
        return;
    if (!SDL_SetWindowAlwaysOnTop(window_, topmost))
        PLOG_WARNING << "SDL_SetWindowAlwaysOnTop failed: " << SDL_GetError();
}

void AppContext::windowSize(int& w, int& h) const
{
    if (!window_)
    {
        w = h = 0;
        return;
    }
    SDL_GetWindowSize(window_, &w, &h);
}

bool AppContext::initializeSDL()
{
    if (!SDL_Init(SDL_INIT_VIDEO))
    {
        reportInitError("SDL", "Graphics could not be initialized.", std::string("SDL_Init failed: ") + SDL_GetError());
        return false;
    }
    sdl_ready_ = true;
    return true;
}

bool AppContext::createWindow(int width, int height)
{
    const SDL_WindowFlags window_flags = SDL_WINDOW_RESIZABLE | SDL_WINDOW_HIGH_PIXEL_DENSITY;
    window_ = SDL_CreateWindow("Ghost Interface", width, height, window_flags);
    if (!window_)
    {
        reportInitError("Window", "The main window could not be created.",
                        std::string("SDL_CreateWindow failed: ") + SDL_GetError());
        shutdown();
        return false;
    }
    return true;
}

bool AppContext::createRenderer()
{
    renderer_ = SDL_CreateRenderer(window_, nullptr);
    if (!renderer_)
    {
        reportInitError("Renderer", "No usable renderer was found.",
                        std::string("SDL_CreateRenderer failed: ") + SDL_GetError());
        shutdown();
        return false;
    }

    // The indicator advances one step per presented frame
    if (!SDL_SetRenderVSync(renderer_, 1))
        PLOG_WARNING << "Failed to enable VSync: " << SDL_GetError() << " (will continue without VSync)";

    updateRendererScale();
    SDL_SetRenderDrawBlendMode(renderer_, SDL_BLENDMODE_BLEND);
    return true;
}

bool AppContext::initializeImGui()
{
    IMGUI_CHECKVERSION();
    ImGui::CreateContext();
    {
        ImGuiIO& io = ImGui::GetIO();
        io.ConfigFlags |= ImGuiConfigFlags_NavEnableKeyboard;
        io.IniFilename = nullptr;
    }
    ImGui::StyleColorsDark();
    UITheme::applyTheme();

    if (!ImGui_ImplSDL3_InitForSDLRenderer(window_, renderer_))
    {
        reportInitError("ImGui SDL3 Backend", "The user interface could not be initialized.",
                        "ImGui_ImplSDL3_InitForSDLRenderer returned false");
        shutdown();
        return false;
    }
    if (!ImGui_ImplSDLRenderer3_Init(renderer_))
    {
        ImGui_ImplSDL3_Shutdown();
        reportInitError("ImGui Renderer Backend", "The user interface could not be initialized.",
                        "ImGui_ImplSDLRenderer3_Init returned false");
        shutdown();
        return false;
    }
    imgui_ready_ = true;
    return true;
}

void AppContext::reportInitError(const char* phase, const char* user_message, const std::string& details)
{
    PLOG_FATAL << phase << " initialization failed: " << details;
    utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Initialization, user_message, details);
    utils::NativeMessageBox::ShowFatalError(user_message, details, window_);
}
