#pragma once

#include "AppConfig.hpp"

#include <toml++/toml.h>
#include <string>
#include <string_view>
#include <optional>

class ConfigManager;

// TOML <-> AppConfig. Out-of-range values are clamped, unknown enum names
// fall back to the default; both cases log a warning.
class StateSerializer
{
public:
    static toml::table serializeApp(const AppSection& s);
    static toml::table serializeWindow(const WindowSection& s);
    static toml::table serializeEngine(const EngineSection& s);
    static toml::table serializeChat(const ChatSection& s);
    static toml::table serializeEvents(const EventsSection& s);

    static void deserializeApp(const toml::table& tbl, AppSection& s);
    static void deserializeWindow(const toml::table& tbl, WindowSection& s);
    static void deserializeEngine(const toml::table& tbl, EngineSection& s);
    static void deserializeChat(const toml::table& tbl, ChatSection& s);
    static void deserializeEvents(const toml::table& tbl, EventsSection& s);

    // Wires every section of cfg into the manager's table handlers
    static bool registerAll(ConfigManager& manager, AppConfig& cfg);

    static std::string_view variantName(EngineSection::Variant v);
    static std::optional<EngineSection::Variant> parseVariant(std::string_view name);
    static std::string_view sourceName(EventsSection::Source s);
    static std::optional<EventsSection::Source> parseSource(std::string_view name);
};
