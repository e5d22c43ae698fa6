#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../processing/Diagnostics.hpp"
#include "Profile.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/DynamicAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <toml++/toml.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
bool LogManager::s_console = false;
plog::Severity LogManager::s_default_level = plog::info;
std::string LogManager::s_directory = "logs";
std::vector<LogManager::Registration> LogManager::s_appenders;

namespace
{

// plog loggers live for the whole process and cannot drop an appender, so each
// instance gets one DynamicAppender up front and the real appenders are attached
// to it. Shutdown() detaches them before they are destroyed.
template <int InstanceId>
plog::DynamicAppender& instanceSink(plog::Severity level)
{
    static plog::DynamicAppender sink;
    static plog::Logger<InstanceId>& logger = plog::init<InstanceId>(level, &sink);
    logger.setMaxSeverity(level);
    return sink;
}

} // namespace

bool LogManager::Initialize(const std::string& config_path)
{
    if (s_initialized)
        return true;

    if (!ReadConfig(config_path))
        return false;

    if (!PrepareLogDirectory())
        return false;

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        if (!config.append_override.value_or(s_append_logs))
            std::ofstream(config.filepath, std::ios::trunc).close();

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, static_cast<int>(config.backup_count));

        plog::DynamicAppender& sink = instanceSink<InstanceId>(config.level_override.value_or(s_default_level));
        sink.addAppender(file_appender.get());
        s_appenders.push_back({ &sink, std::move(file_appender) });

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            sink.addAppender(console_appender.get());
            s_appenders.push_back({ &sink, std::move(console_appender) });
        }

        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);
template bool LogManager::RegisterLogger<processing::Diagnostics::kLogInstance>(const LoggerConfig&);

#if SJISGUARD_PROFILING_LEVEL >= 1
template bool LogManager::RegisterLogger<profiling::kProfilingLogInstance>(const LoggerConfig&);
#endif

bool LogManager::RegisterStandardLoggers()
{
    bool ok = RegisterLogger<0>({ .name = "main",
                                  .filepath = LogPath("sjisguard.log"),
                                  .append_override = std::nullopt,
                                  .level_override = std::nullopt,
                                  .add_console_appender = s_console });

    // Traces are only emitted in verbose mode, so the file takes everything it gets
    ok = RegisterLogger<processing::Diagnostics::kLogInstance>({ .name = "classification",
                                                                 .filepath = LogPath("classification.log"),
                                                                 .append_override = std::nullopt,
                                                                 .level_override = plog::debug,
                                                                 .add_console_appender = false }) &&
         ok;

#if SJISGUARD_PROFILING_LEVEL >= 1
    ok = RegisterLogger<profiling::kProfilingLogInstance>({ .name = "profiling",
                                                            .filepath = LogPath("profiling.log"),
                                                            .append_override = std::nullopt,
                                                            .level_override = plog::debug,
                                                            .add_console_appender = false }) &&
         ok;
#endif

    return ok;
}

void LogManager::Shutdown()
{
    for (auto& registration : s_appenders)
        registration.sink->removeAppender(registration.appender.get());
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

bool LogManager::IsAppendMode() { return s_append_logs; }

bool LogManager::IsConsoleEnabled() { return s_console; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

const std::string& LogManager::GetLogDirectory() { return s_directory; }

bool LogManager::PrepareLogDirectory()
{
    std::error_code ec;
    std::filesystem::create_directories(s_directory, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Unable to create log directory",
                                   s_directory + ": " + ec.message());
        return false;
    }
    return true;
}

std::string LogManager::LogPath(const std::string& file_name)
{
    return (std::filesystem::path(s_directory) / file_name).string();
}

bool LogManager::ReadConfig(const std::string& config_path)
{
    s_append_logs = true;
    s_console = false;
    s_default_level = plog::info;
    s_directory = "logs";

    std::error_code ec;
    if (!std::filesystem::exists(config_path, ec))
        return true;

    try
    {
        auto cfg = toml::parse_file(config_path);
        const toml::table* logging = cfg["logging"].as_table();
        if (!logging)
            return true;

        if (auto append = (*logging)["append_logs"].value<bool>())
            s_append_logs = *append;

        if (auto console = (*logging)["console"].value<bool>())
            s_console = *console;

        if (auto directory = (*logging)["directory"].value<std::string>())
        {
            if (!directory->empty())
                s_directory = *directory;
        }

        if (auto level = (*logging)["level"].value<int64_t>())
        {
            if (*level >= plog::none && *level <= plog::verbose)
            {
                s_default_level = static_cast<plog::Severity>(*level);
            }
            else
            {
                ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Ignoring invalid logging level",
                                             "logging.level = " + std::to_string(*level));
            }
        }

        return true;
    }
    catch (const toml::parse_error& pe)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Configuration, "Logging configuration could not be parsed",
                                     std::string(pe.description()));
        return true;
    }
}

} // namespace utils
