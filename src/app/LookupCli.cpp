#include "LookupCli.hpp"
#include "../config/LookupConfig.hpp"
#include "../lookup/Lookup.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"

#include <ostream>

#include <plog/Log.h>

namespace app
{

LookupCli::LookupCli(int argc, char** argv, std::ostream& out, std::ostream& err)
    : out_(out)
    , err_(err)
{
    for (int i = 1; i < argc; ++i)
        args_.emplace_back(argv[i]);
}

int LookupCli::run()
{
    if (!parseArgs())
    {
        printUsage();
        return Usage;
    }

    config::LookupConfig cfg;
    if (config_path_)
    {
        auto loaded = config::loadLookupConfig(*config_path_);
        if (!loaded)
        {
            for (const auto& report : utils::ErrorReporter::GetPendingErrors())
            {
                err_ << "item-lookup: " << report.describe() << "\n";
            }
            return ConfigError;
        }
        cfg = *loaded;

        // The lookup still runs without a log file.
        if (!utils::LogManager::Initialize(cfg))
        {
            for (const auto& report : utils::ErrorReporter::GetPendingErrors())
                err_ << "item-lookup: warning: " << report.describe() << "\n";
        }
    }

    if (exact_)
        return lookupExact();

    return lookupSimilar(threshold_.value_or(cfg.similarity_threshold));
}

bool LookupCli::parseArgs()
{
    std::vector<std::string> positional;
    for (size_t i = 0; i < args_.size(); ++i)
    {
        const std::string& arg = args_[i];
        if (arg == "--exact")
        {
            exact_ = true;
        }
        else if (arg == "--config" || arg == "--threshold")
        {
            if (i + 1 >= args_.size())
            {
                err_ << "item-lookup: " << arg << " requires a value\n";
                return false;
            }
            const std::string& value = args_[++i];
            if (arg == "--config")
            {
                config_path_ = value;
                continue;
            }

            try
            {
                size_t consumed = 0;
                double th = std::stod(value, &consumed);
                if (consumed != value.size() || th < 0.0 || th > 1.0)
                {
                    err_ << "item-lookup: threshold must be a number within [0, 1]\n";
                    return false;
                }
                threshold_ = th;
            }
            catch (const std::exception&)
            {
                err_ << "item-lookup: threshold must be a number within [0, 1]\n";
                return false;
            }
        }
        else
        {
            positional.push_back(arg);
        }
    }

    if (positional.size() < 2)
        return false;

    target_ = positional.front();
    candidates_.assign(positional.begin() + 1, positional.end());
    return true;
}

void LookupCli::printUsage() const
{
    err_ << "usage: item-lookup [--config <file>] [--threshold <th>] [--exact] <target> <candidate>...\n";
}

int LookupCli::lookupExact() const
{
    try
    {
        out_ << lookup::findOne([this](const std::string& c) { return c == target_; }, candidates_) << "\n";
        return Found;
    }
    catch (const lookup::MultipleItemFoundError& e)
    {
        err_ << "item-lookup: " << e.what() << "\n";
        return NotFound;
    }
    catch (const lookup::ItemNotFoundError& e)
    {
        err_ << "item-lookup: " << e.what() << "\n";
        return NotFound;
    }
}

int LookupCli::lookupSimilar(double threshold) const
{
    try
    {
        out_ << lookup::findSimilarOne(target_, candidates_, std::identity{}, threshold) << "\n";
        return Found;
    }
    catch (const lookup::SuggestionError& e)
    {
        PLOG_INFO << "Suggested '" << e.suggestions().front().second.value_or("") << "' for '" << target_ << "'";
        err_ << "item-lookup: " << e.what() << "\n";
        return Suggested;
    }
    catch (const lookup::ItemNotFoundError& e)
    {
        utils::ErrorReporter::ReportWarning(
            { .category = utils::ErrorCategory::Lookup, .message = e.what(), .detail = target_ });
        err_ << "item-lookup: " << e.what() << "\n";
        return NotFound;
    }
}

} // namespace app
