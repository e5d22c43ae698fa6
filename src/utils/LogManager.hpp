#pragma once

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
class DynamicAppender;
}

namespace utils
{

// Owns the plog appenders of the process.
// Instance 0 carries application messages, processing::Diagnostics::kLogInstance
// the per-character classification traces.
class LogManager
{
public:
    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        std::size_t max_file_size = 10 * 1024 * 1024;
        std::size_t backup_count = 3;
        bool add_console_appender = false;
    };

    // Reads [logging] from config_path (a missing file means defaults)
    // and creates the log directory.
    static bool Initialize(const std::string& config_path = "config.toml");

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    // sjisguard.log on instance 0, classification.log on the diagnostics
    // instance, profiling.log when scope timers are compiled in.
    static bool RegisterStandardLoggers();

    static void Shutdown();

    static bool IsInitialized();
    static bool IsAppendMode();
    static bool IsConsoleEnabled();
    static plog::Severity GetDefaultLogLevel();
    static const std::string& GetLogDirectory();

private:
    LogManager() = default;

    struct Registration
    {
        plog::DynamicAppender* sink;
        std::unique_ptr<plog::IAppender> appender;
    };

    static bool ReadConfig(const std::string& config_path);
    static bool PrepareLogDirectory();
    static std::string LogPath(const std::string& file_name);

    static bool s_initialized;
    static bool s_append_logs;
    static bool s_console;
    static plog::Severity s_default_level;
    static std::string s_directory;
    static std::vector<Registration> s_appenders;
};

} // namespace utils
