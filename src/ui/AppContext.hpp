#pragma once

#include <SDL3/SDL.h>
#include <string>

// SDL window, renderer and the Dear ImGui backends bound to them
class AppContext
{
public:
    AppContext();
    ~AppContext();

    bool initialize(int width, int height);
    void shutdown();

    // Returns true for a quit request
    bool processEvent(const SDL_Event& event);
    void beginFrame();
    void endFrame();

    SDL_Window* window() const { return window_; }
    SDL_Renderer* renderer() const { return renderer_; }

    void setWindowAlwaysOnTop(bool topmost);
    void windowSize(int& w, int& h) const;

private:
    void updateRendererScale();

    bool initializeSDL();
    bool createWindow(int width, int height);
    bool createRenderer();
    bool initializeImGui();
    void reportInitError(const char* phase, const char* user_message, const std::string& details);

    SDL_Window* window_ = nullptr;
    SDL_Renderer* renderer_ = nullptr;
    bool sdl_ready_ = false;
    bool imgui_ready_ = false;
    bool initialized_ = false;
};
