#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../config/LookupConfig.hpp"

#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <vector>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

namespace
{

constexpr size_t kMaxFileSize = 10 * 1024 * 1024;
constexpr int kBackupCount = 3;

class SessionAppender : public plog::IAppender
{
public:
    void write(const plog::Record& record) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& sink : sinks_)
            sink->write(record);
    }

    void replace(std::vector<std::unique_ptr<plog::IAppender>> sinks)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        sinks_ = std::move(sinks);
    }

private:
    std::mutex mutex_;
    std::vector<std::unique_ptr<plog::IAppender>> sinks_;
};

// Registered with plog once and kept for the process lifetime.
SessionAppender& sessionAppender()
{
    static SessionAppender appender;
    return appender;
}

void prepareLogFile(const config::LookupConfig& cfg)
{
    auto dir = std::filesystem::path(cfg.log_file).parent_path();
    if (!dir.empty())
    {
        std::error_code ec;
        std::filesystem::create_directories(dir, ec);
        if (ec)
        {
            ErrorReporter::ReportWarning({ .category = ErrorCategory::Initialization,
                                           .message = "Unable to prepare log directory",
                                           .detail = ec.message() });
        }
    }

    if (!cfg.append_logs)
        std::ofstream(cfg.log_file, std::ios::trunc).close();
}

} // namespace

bool LogManager::s_initialized = false;

bool LogManager::Initialize(const config::LookupConfig& cfg)
{
    if (s_initialized)
        return true;

    plog::Severity level = plog::info;
    if (cfg.logging_level >= plog::none && cfg.logging_level <= plog::verbose)
        level = static_cast<plog::Severity>(cfg.logging_level);

    prepareLogFile(cfg);

    try
    {
        std::vector<std::unique_ptr<plog::IAppender>> sinks;
        sinks.push_back(std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            cfg.log_file.c_str(), kMaxFileSize, kBackupCount));
        if (cfg.console_log)
            sinks.push_back(std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>());
        sessionAppender().replace(std::move(sinks));
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError({ .category = ErrorCategory::Initialization,
                                     .message = "Failed to open log file " + cfg.log_file,
                                     .detail = ex.what() });
        return false;
    }

    // plog constructs its logger only once and ignores the severity on later init calls.
    if (auto* logger = plog::get())
        logger->setMaxSeverity(level);
    else
        plog::init(level, &sessionAppender());

    s_initialized = true;
    return true;
}

void LogManager::Shutdown()
{
    if (auto* logger = plog::get())
        logger->setMaxSeverity(plog::none);
    sessionAppender().replace({});
    s_initialized = false;
}

bool LogManager::IsInitialized()
{
    return s_initialized;
}

} // namespace utils
