#pragma once

#include <string>
#include <string_view>
#include <functional>
#include <memory>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
    // Optional; restores defaults before every load so keys removed from the file do not linger
    std::function<void()> reset;
};

// Loads a TOML file and hands each registered section to its owner.
// Keys found in a section that no owner declared are logged and ignored.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);
    bool load();
    bool loadFromString(std::string_view document);
    bool reloadIfChanged();
    const toml::table& root() const;

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    bool apply(toml::table parsed);
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;

    std::string config_path_;
    std::string last_error_;
    long long last_mtime_ = 0;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
        std::vector<std::string> ownedKeys;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
