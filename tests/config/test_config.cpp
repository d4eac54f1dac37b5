#include <catch2/catch_test_macros.hpp>

#include "config/AppConfig.hpp"
#include "config/ConfigManager.hpp"
#include "config/StateSerializer.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace {

struct TempConfig {
    fs::path path;

    TempConfig()
    {
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        path = fs::temp_directory_path() / ("ghost_config_" + std::to_string(stamp) + ".toml");
    }

    ~TempConfig()
    {
        std::error_code ec;
        fs::remove(path, ec);
        fs::remove(path.string() + ".tmp", ec);
    }

    void write(const std::string& text)
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out << text;
    }

    std::string read() const
    {
        std::ifstream in(path, std::ios::binary);
        std::stringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }
};

} // namespace

TEST_CASE("Sections round-trip through TOML tables", "[config]")
{
    AppConfig cfg;
    cfg.window.width = 1280;
    cfg.window.zen_mode = true;
    cfg.engine.variant = EngineSection::Variant::Surface;
    cfg.engine.seed = 99;
    cfg.chat.endpoint = "http://example.test/api/chat";
    cfg.chat.scroll_follow_threshold = 80.0f;
    cfg.events.source = EventsSection::Source::File;
    cfg.events.log_path = "/var/log/agent.log";

    AppConfig loaded;
    StateSerializer::deserializeWindow(StateSerializer::serializeWindow(cfg.window), loaded.window);
    StateSerializer::deserializeEngine(StateSerializer::serializeEngine(cfg.engine), loaded.engine);
    StateSerializer::deserializeChat(StateSerializer::serializeChat(cfg.chat), loaded.chat);
    StateSerializer::deserializeEvents(StateSerializer::serializeEvents(cfg.events), loaded.events);

    REQUIRE(loaded.window.width == 1280);
    REQUIRE(loaded.window.zen_mode);
    REQUIRE(loaded.engine.variant == EngineSection::Variant::Surface);
    REQUIRE(loaded.engine.seed == 99u);
    REQUIRE(loaded.chat.endpoint == "http://example.test/api/chat");
    REQUIRE(loaded.chat.scroll_follow_threshold == 80.0f);
    REQUIRE(loaded.events.source == EventsSection::Source::File);
    REQUIRE(loaded.events.log_path == "/var/log/agent.log");
}

TEST_CASE("Out-of-range and unknown values fall back safely", "[config]")
{
    toml::table engine{ { "variant", "hologram" }, { "surface_subdivisions", 42 } };
    EngineSection e;
    StateSerializer::deserializeEngine(engine, e);
    REQUIRE(e.variant == EngineSection::Variant::Graph);
    REQUIRE(e.surface_subdivisions == 6);

    toml::table events{ { "source", "carrier-pigeon" }, { "port", 70000 }, { "host", "" } };
    EventsSection ev;
    StateSerializer::deserializeEvents(events, ev);
    REQUIRE(ev.source == EventsSection::Source::Tcp);
    REQUIRE(ev.port == 65535);
    REQUIRE(ev.host == "127.0.0.1");

    toml::table window{ { "width", 10 } };
    WindowSection w;
    StateSerializer::deserializeWindow(window, w);
    REQUIRE(w.width == 320);
}

TEST_CASE("Variant and source names", "[config]")
{
    REQUIRE(StateSerializer::parseVariant("graph") == EngineSection::Variant::Graph);
    REQUIRE(StateSerializer::parseVariant("surface") == EngineSection::Variant::Surface);
    REQUIRE_FALSE(StateSerializer::parseVariant("Surface").has_value());
    REQUIRE(StateSerializer::variantName(EngineSection::Variant::Surface) == "surface");
    REQUIRE(StateSerializer::parseSource("file") == EventsSection::Source::File);
    REQUIRE(StateSerializer::sourceName(EventsSection::Source::Tcp) == "tcp");
}

TEST_CASE("ConfigManager loads registered sections and keeps unknown keys", "[config]")
{
    TempConfig file;
    file.write("[engine]\n"
               "variant = \"surface\"\n"
               "custom_note = \"keep me\"\n"
               "\n"
               "[chat]\n"
               "model = \"tiny\"\n"
               "\n"
               "[extra]\n"
               "answer = 42\n");

    AppConfig cfg;
    ConfigManager manager(file.path.string());
    REQUIRE(StateSerializer::registerAll(manager, cfg));
    REQUIRE(manager.load());

    REQUIRE(cfg.engine.variant == EngineSection::Variant::Surface);
    REQUIRE(cfg.chat.model == "tiny");
    REQUIRE(cfg.window.width == WindowSection{}.width);

    cfg.window.always_on_top = true;
    REQUIRE(manager.save());

    auto saved = toml::parse(file.read());
    REQUIRE(saved["engine"]["custom_note"].value<std::string>() == "keep me");
    REQUIRE(saved["extra"]["answer"].value<int64_t>() == 42);
    REQUIRE(saved["window"]["always_on_top"].value<bool>() == true);
    REQUIRE(saved["engine"]["variant"].value<std::string>() == "surface");
}

TEST_CASE("ConfigManager keeps defaults when the file is missing or broken", "[config]")
{
    TempConfig file;

    SECTION("missing file")
    {
        AppConfig cfg;
        ConfigManager manager(file.path.string());
        StateSerializer::registerAll(manager, cfg);
        REQUIRE(manager.load());
        REQUIRE(cfg.chat.endpoint == ChatSection{}.endpoint);
    }

    SECTION("syntax error")
    {
        file.write("[chat\nendpoint = ");
        AppConfig cfg;
        ConfigManager manager(file.path.string());
        StateSerializer::registerAll(manager, cfg);
        REQUIRE_FALSE(manager.load());
        REQUIRE(std::string(manager.lastError()).find("parse error") != std::string::npos);
        REQUIRE(cfg.chat.endpoint == ChatSection{}.endpoint);
    }
}

TEST_CASE("Registering the same table twice is refused", "[config]")
{
    ConfigManager manager("unused.toml");
    TableCallbacks cb{ [](const toml::table&) {}, [] { return toml::table{}; } };
    REQUIRE(manager.registerTable("chat", cb, { "model" }));
    REQUIRE_FALSE(manager.registerTable("chat", cb, { "model" }));
}
