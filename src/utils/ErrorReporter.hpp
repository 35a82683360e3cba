#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace utils
{

enum class ErrorCategory
{
    Initialization, // Log file and directory setup
    Configuration,  // TOML parsing, invalid config values
    Lookup          // Lookups that ended without a result
};

/// Position in a config file (or in-memory TOML text) a report refers to.
struct SourcePosition
{
    std::string source;
    std::size_t line = 0;
    std::size_t column = 0;
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Lookup;
    bool warning = false;
    std::string message;
    std::string detail;
    std::optional<SourcePosition> position;

    /// "lookup.toml:3:1: Failed to parse config: expected '='"
    std::string describe() const;
};

/// Collects failures of the config, logging and CLI layers until the CLI prints them.
/// Every report is also written to the log.
class ErrorReporter
{
public:
    static void ReportError(ErrorReport report);
    static void ReportWarning(ErrorReport report);

    /// Drains the queue.
    static std::vector<ErrorReport> GetPendingErrors();
    static void ClearErrors();

private:
    static void Enqueue(ErrorReport report);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_pending;
    static constexpr std::size_t kMaxPending = 100;
};

} // namespace utils
