#pragma once

#include <string>
#include <memory>
#include <functional>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    std::function<toml::table()> save;
};

// Owns config.toml. Each subsystem registers the table it owns together with
// the keys it writes; unknown keys already in the file are preserved on save.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);
    bool load();
    bool reloadIfChanged();
    bool save();
    const toml::table& root() const;

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    toml::table* resolveTablePath(toml::table& root, const std::string& path);
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;
    void dispatchLoad();

    std::string config_path_;
    std::string last_error_;
    long long last_mtime_ = 0;

    struct HandlerEntry
    {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
