#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace config
{

/// Settings read from the [lookup] and [logging] tables of the TOML config.
struct LookupConfig
{
    double similarity_threshold = 0.6;
    int logging_level = 4; // plog::Severity, 0 (none) .. 6 (verbose)
    bool append_logs = true;
    std::string log_file = "logs/lookup.log";
    bool console_log = false;
};

/// Parses TOML text. Syntax errors are reported through utils::ErrorReporter and yield std::nullopt.
/// Missing keys keep their defaults; out-of-range values are reported and replaced by defaults.
std::optional<LookupConfig> parseLookupConfig(std::string_view toml_text, std::string_view source = "<memory>");

/// Same as parseLookupConfig() for a file on disk. A missing file is an error.
std::optional<LookupConfig> loadLookupConfig(const std::string& path);

} // namespace config
