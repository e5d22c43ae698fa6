#pragma once

#include <array>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logger setup, ICU converter
    Configuration,  // TOML parsing, invalid config values
    Encoding,       // unexpected failures while classifying text
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // degraded, defaults used
    Error,   // operation failed, caller can continue
    Fatal    // caller should stop
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;      // short, actionable
    std::string technical_details; // offending value, parser message, ...
    std::string timestamp;
    bool is_fatal = false;

    ErrorReport() = default;
    ErrorReport(ErrorCategory cat, ErrorSeverity sev, std::string user_msg, std::string tech_details);

    // "[Configuration] message | Details: ..."
    std::string describe() const;
};

/**
 * @brief Thread-safe error reporter
 *
 * Every report is logged through plog, kept in a bounded queue for the
 * embedding application to drain, and counted per category. Counts survive
 * GetPendingErrors() so callers can tell how many configuration or encoding
 * problems were seen over the process lifetime.
 *
 * Usage:
 *   ErrorReporter::ReportWarning(ErrorCategory::Configuration,
 *                                "Invalid strictness in config.toml",
 *                                "validation.strictness = 7");
 *
 *   for (const auto& report : ErrorReporter::GetPendingErrors())
 *       show(report.describe());
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                       const std::string& technical_details = "");

    static void ReportFatal(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");
    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    static bool HasPendingErrors();

    // Drains the queue
    static std::vector<ErrorReport> GetPendingErrors();

    static ErrorReport GetLastError();

    // Reports seen for a category since start-up or the last ClearErrors()
    static std::size_t CountFor(ErrorCategory category);

    // Empties the queue and resets the counters
    static void ClearErrors();

    static const char* CategoryToString(ErrorCategory category);
    static const char* SeverityToString(ErrorSeverity severity);
    static std::string GetTimestamp();

private:
    static constexpr std::size_t MAX_QUEUE_SIZE = 100;
    static constexpr std::size_t CATEGORY_COUNT = static_cast<std::size_t>(ErrorCategory::Unknown) + 1;

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_error_queue;
    static std::array<std::size_t, CATEGORY_COUNT> s_counts;
};

} // namespace utils
