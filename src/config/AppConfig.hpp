#pragma once

#include <cstdint>
#include <string>

struct AppSection
{
    int logging_level = 4; // plog::info
    bool append_logs = true;
};

struct WindowSection
{
    int width = 1100;
    int height = 760;
    bool always_on_top = false;
    bool zen_mode = false;
};

struct EngineSection
{
    enum class Variant
    {
        Graph,
        Surface
    };

    Variant variant = Variant::Graph;
    std::uint32_t seed = 0; // 0 = random per run
    int surface_subdivisions = 4;
};

struct ChatSection
{
    std::string endpoint = "http://127.0.0.1:8000/api/chat";
    std::string model = "Qwen3-8B-Instruct-2507";
    int connect_timeout_ms = 5000;
    int timeout_ms = 600000;
    float scroll_follow_threshold = 50.0f;
};

struct EventsSection
{
    enum class Source
    {
        Tcp,
        File
    };

    Source source = Source::Tcp;
    std::string host = "127.0.0.1";
    int port = 8765;
    std::string log_path = "agent.log";
    int reconnect_delay_ms = 3000;
};

struct AppConfig
{
    AppSection app;
    WindowSection window;
    EngineSection engine;
    ChatSection chat;
    EventsSection events;
};
