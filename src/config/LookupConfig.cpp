#include "LookupConfig.hpp"
#include "../utils/ErrorReporter.hpp"

#include <cstdint>
#include <filesystem>

#include <plog/Log.h>
#include <toml++/toml.h>

using utils::ErrorCategory;
using utils::ErrorReporter;
using utils::SourcePosition;

namespace config
{

namespace
{

SourcePosition positionOf(const toml::source_region& region, std::string_view source)
{
    return { .source = std::string(source), .line = region.begin.line, .column = region.begin.column };
}

void reportOutOfRange(const toml::node& node, std::string_view source, std::string message, std::string value)
{
    ErrorReporter::ReportWarning({ .category = ErrorCategory::Configuration,
                                   .message = std::move(message),
                                   .detail = std::move(value),
                                   .position = positionOf(node.source(), source) });
}

LookupConfig fromTable(const toml::table& root, std::string_view source)
{
    LookupConfig cfg;

    if (auto lookup = root["lookup"].as_table())
    {
        auto node = (*lookup)["similarity_threshold"];
        if (auto th = node.value<double>())
        {
            if (*th >= 0.0 && *th <= 1.0)
                cfg.similarity_threshold = *th;
            else
                reportOutOfRange(*node.node(), source, "similarity_threshold must be within [0, 1]; using default",
                                 std::to_string(*th));
        }
    }

    if (auto logging = root["logging"].as_table())
    {
        auto node = (*logging)["level"];
        if (auto level = node.value<int64_t>())
        {
            if (*level >= 0 && *level <= 6)
                cfg.logging_level = static_cast<int>(*level);
            else
                reportOutOfRange(*node.node(), source, "logging level must be within [0, 6]; using default",
                                 std::to_string(*level));
        }
        if (auto append = (*logging)["append"].value<bool>())
            cfg.append_logs = *append;
        if (auto file = (*logging)["file"].value<std::string>())
            cfg.log_file = *file;
        if (auto console = (*logging)["console"].value<bool>())
            cfg.console_log = *console;
    }

    return cfg;
}

void reportParseError(const toml::parse_error& pe, std::string_view source)
{
    ErrorReporter::ReportError({ .category = ErrorCategory::Configuration,
                                 .message = "Failed to parse config",
                                 .detail = std::string(pe.description()),
                                 .position = positionOf(pe.source(), source) });
}

} // namespace

std::optional<LookupConfig> parseLookupConfig(std::string_view toml_text, std::string_view source)
{
    try
    {
        toml::table root = toml::parse(toml_text, source);
        return fromTable(root, source);
    }
    catch (const toml::parse_error& pe)
    {
        reportParseError(pe, source);
        return std::nullopt;
    }
}

std::optional<LookupConfig> loadLookupConfig(const std::string& path)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec))
    {
        ErrorReporter::ReportError(
            { .category = ErrorCategory::Configuration, .message = "Config file not found", .detail = path });
        return std::nullopt;
    }

    try
    {
        toml::table root = toml::parse_file(path);
        PLOG_DEBUG << "Loaded config from " << path;
        return fromTable(root, path);
    }
    catch (const toml::parse_error& pe)
    {
        reportParseError(pe, path);
        return std::nullopt;
    }
}

} // namespace config
