#include "StateSerializer.hpp"
#include "ConfigManager.hpp"

#include <plog/Log.h>
#include <algorithm>

namespace
{

template <typename T>
T clampedInt(const toml::table& tbl, const char* key, T current, T lo, T hi)
{
    auto v = tbl[key].value<int64_t>();
    if (!v)
        return current;
    if (*v < static_cast<int64_t>(lo) || *v > static_cast<int64_t>(hi))
    {
        PLOG_WARNING << "Config key '" << key << "' = " << *v << " out of range [" << lo << ", " << hi
                     << "], clamped";
    }
    return static_cast<T>(std::clamp<int64_t>(*v, static_cast<int64_t>(lo), static_cast<int64_t>(hi)));
}

void readString(const toml::table& tbl, const char* key, std::string& out)
{
    if (auto v = tbl[key].value<std::string>())
    {
        if (v->empty())
        {
            PLOG_WARNING << "Config key '" << key << "' is empty, keeping '" << out << "'";
            return;
        }
        out = *v;
    }
}

} // namespace

std::string_view StateSerializer::variantName(EngineSection::Variant v)
{
    return v == EngineSection::Variant::Surface ? "surface" : "graph";
}

std::optional<EngineSection::Variant> StateSerializer::parseVariant(std::string_view name)
{
    if (name == "graph")
        return EngineSection::Variant::Graph;
    if (name == "surface")
        return EngineSection::Variant::Surface;
    return std::nullopt;
}

std::string_view StateSerializer::sourceName(EventsSection::Source s)
{
    return s == EventsSection::Source::File ? "file" : "tcp";
}

std::optional<EventsSection::Source> StateSerializer::parseSource(std::string_view name)
{
    if (name == "tcp")
        return EventsSection::Source::Tcp;
    if (name == "file")
        return EventsSection::Source::File;
    return std::nullopt;
}

toml::table StateSerializer::serializeApp(const AppSection& s)
{
    toml::table t;
    t.insert("logging_level", s.logging_level);
    t.insert("append_logs", s.append_logs);
    return t;
}

toml::table StateSerializer::serializeWindow(const WindowSection& s)
{
    toml::table t;
    t.insert("width", s.width);
    t.insert("height", s.height);
    t.insert("always_on_top", s.always_on_top);
    t.insert("zen_mode", s.zen_mode);
    return t;
}

toml::table StateSerializer::serializeEngine(const EngineSection& s)
{
    toml::table t;
    t.insert("variant", std::string(variantName(s.variant)));
    t.insert("seed", static_cast<int64_t>(s.seed));
    t.insert("surface_subdivisions", s.surface_subdivisions);
    return t;
}

toml::table StateSerializer::serializeChat(const ChatSection& s)
{
    toml::table t;
    t.insert("endpoint", s.endpoint);
    t.insert("model", s.model);
    t.insert("connect_timeout_ms", s.connect_timeout_ms);
    t.insert("timeout_ms", s.timeout_ms);
    t.insert("scroll_follow_threshold", static_cast<double>(s.scroll_follow_threshold));
    return t;
}

toml::table StateSerializer::serializeEvents(const EventsSection& s)
{
    toml::table t;
    t.insert("source", std::string(sourceName(s.source)));
    t.insert("host", s.host);
    t.insert("port", s.port);
    t.insert("log_path", s.log_path);
    t.insert("reconnect_delay_ms", s.reconnect_delay_ms);
    return t;
}

void StateSerializer::deserializeApp(const toml::table& tbl, AppSection& s)
{
    s.logging_level = clampedInt(tbl, "logging_level", s.logging_level, 0, 6);
    if (auto v = tbl["append_logs"].value<bool>())
        s.append_logs = *v;
}

void StateSerializer::deserializeWindow(const toml::table& tbl, WindowSection& s)
{
    s.width = clampedInt(tbl, "width", s.width, 320, 7680);
    s.height = clampedInt(tbl, "height", s.height, 240, 4320);
    if (auto v = tbl["always_on_top"].value<bool>())
        s.always_on_top = *v;
    if (auto v = tbl["zen_mode"].value<bool>())
        s.zen_mode = *v;
}

void StateSerializer::deserializeEngine(const toml::table& tbl, EngineSection& s)
{
    if (auto v = tbl["variant"].value<std::string>())
    {
        if (auto parsed = parseVariant(*v))
        {
            s.variant = *parsed;
        }
        else
        {
            PLOG_WARNING << "Unknown engine variant '" << *v << "', using '" << variantName(s.variant) << "'";
        }
    }
    s.seed = clampedInt<std::uint32_t>(tbl, "seed", s.seed, 0u, 0xFFFFFFFFu);
    s.surface_subdivisions = clampedInt(tbl, "surface_subdivisions", s.surface_subdivisions, 1, 6);
}

void StateSerializer::deserializeChat(const toml::table& tbl, ChatSection& s)
{
    readString(tbl, "endpoint", s.endpoint);
    readString(tbl, "model", s.model);
    s.connect_timeout_ms = clampedInt(tbl, "connect_timeout_ms", s.connect_timeout_ms, 100, 60000);
    s.timeout_ms = clampedInt(tbl, "timeout_ms", s.timeout_ms, 1000, 3600000);
    if (auto v = tbl["scroll_follow_threshold"].value<double>())
    {
        s.scroll_follow_threshold = std::clamp(static_cast<float>(*v), 0.0f, 1000.0f);
    }
}

void StateSerializer::deserializeEvents(const toml::table& tbl, EventsSection& s)
{
    if (auto v = tbl["source"].value<std::string>())
    {
        if (auto parsed = parseSource(*v))
        {
            s.source = *parsed;
        }
        else
        {
            PLOG_WARNING << "Unknown event source '" << *v << "', using '" << sourceName(s.source) << "'";
        }
    }
    readString(tbl, "host", s.host);
    s.port = clampedInt(tbl, "port", s.port, 1, 65535);
    readString(tbl, "log_path", s.log_path);
    s.reconnect_delay_ms = clampedInt(tbl, "reconnect_delay_ms", s.reconnect_delay_ms, 100, 600000);
}

bool StateSerializer::registerAll(ConfigManager& manager, AppConfig& cfg)
{
    bool ok = true;
    ok &= manager.registerTable(
        "app", { [&cfg](const toml::table& t) { deserializeApp(t, cfg.app); }, [&cfg] { return serializeApp(cfg.app); } },
        { "logging_level", "append_logs" });
    ok &= manager.registerTable("window",
                                { [&cfg](const toml::table& t) { deserializeWindow(t, cfg.window); },
                                  [&cfg] { return serializeWindow(cfg.window); } },
                                { "width", "height", "always_on_top", "zen_mode" });
    ok &= manager.registerTable("engine",
                                { [&cfg](const toml::table& t) { deserializeEngine(t, cfg.engine); },
                                  [&cfg] { return serializeEngine(cfg.engine); } },
                                { "variant", "seed", "surface_subdivisions" });
    ok &= manager.registerTable("chat",
                                { [&cfg](const toml::table& t) { deserializeChat(t, cfg.chat); },
                                  [&cfg] { return serializeChat(cfg.chat); } },
                                { "endpoint", "model", "connect_timeout_ms", "timeout_ms", "scroll_follow_threshold" });
    ok &= manager.registerTable("events",
                                { [&cfg](const toml::table& t) { deserializeEvents(t, cfg.events); },
                                  [&cfg] { return serializeEvents(cfg.events); } },
                                { "source", "host", "port", "log_path", "reconnect_delay_ms" });
    return ok;
}
