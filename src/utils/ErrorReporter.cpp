#include "ErrorReporter.hpp"

#include <plog/Log.h>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_pending;

std::string ErrorReport::describe() const
{
    std::string text;
    if (position)
    {
        text = position->source + ":" + std::to_string(position->line) + ":" + std::to_string(position->column) +
               ": ";
    }
    text += message;
    if (!detail.empty())
        text += ": " + detail;
    return text;
}

void ErrorReporter::ReportError(ErrorReport report)
{
    report.warning = false;
    PLOG_ERROR << report.describe();
    Enqueue(std::move(report));
}

void ErrorReporter::ReportWarning(ErrorReport report)
{
    report.warning = true;
    PLOG_WARNING << report.describe();
    Enqueue(std::move(report));
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> reports;
    reports.swap(s_pending);
    return reports;
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_pending.clear();
}

void ErrorReporter::Enqueue(ErrorReport report)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    if (s_pending.size() == kMaxPending)
        s_pending.erase(s_pending.begin());
    s_pending.push_back(std::move(report));
}

} // namespace utils
