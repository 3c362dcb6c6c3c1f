#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::vector<ErrorReport> ErrorReporter::s_queue;
RunErrorSummary ErrorReporter::s_summary;
std::string ErrorReporter::s_log_path;

namespace
{

constexpr const char* kCategoryNames[kErrorCategoryCount] = {
    "Initialization", "Configuration", "Document", "Extraction", "Recognition",
    "Matching",       "Routing",       "Roster",   "Unknown",
};

void tally(RunErrorSummary& summary, const ErrorReport& report)
{
    switch (report.severity)
    {
    case ErrorSeverity::Info:
        return;
    case ErrorSeverity::Warning:
        ++summary.warnings;
        break;
    case ErrorSeverity::Error:
        ++summary.errors;
        break;
    case ErrorSeverity::Fatal:
        ++summary.fatals;
        break;
    }
    ++summary.by_category[static_cast<std::size_t>(report.category)];
}

std::string plural(std::size_t n, const char* noun)
{
    return std::to_string(n) + " " + noun + (n == 1 ? "" : "s");
}

} // namespace

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                           const std::string& details)
{
    ErrorReport report;
    report.category = category;
    report.severity = severity;
    report.message = message;
    report.details = details;
    report.timestamp = GetTimestamp();

    // plog severities: fatal=1 error=2 warning=3 info=4
    static constexpr plog::Severity kLevels[] = { plog::info, plog::warning, plog::error, plog::fatal };
    PLOG(kLevels[static_cast<int>(severity)]) << "[" << CategoryToString(category) << "] " << message
                                              << (details.empty() ? "" : " | ") << details;

    std::lock_guard<std::mutex> lock(s_mutex);
    tally(s_summary, report);
    if (s_queue.size() >= kMaxQueued)
    {
        // Oldest first out; the tally keeps counting it
        AppendToLogLocked({ s_queue.front() });
        s_queue.erase(s_queue.begin());
        ++s_summary.dropped;
    }
    s_queue.push_back(std::move(report));
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Warning, message, details);
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Error, message, details);
}

void ErrorReporter::ReportFatal(ErrorCategory category, const std::string& message, const std::string& details)
{
    Report(category, ErrorSeverity::Fatal, message, details);
}

void ErrorReporter::BeginRun()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.clear();
    s_summary = RunErrorSummary{};
    s_log_path.clear();
}

bool ErrorReporter::SetLogFile(const std::string& log_path)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_log_path.clear();

    std::ofstream ofs(log_path, std::ios::app);
    if (!ofs)
    {
        PLOG_WARNING << "Cannot open error log " << log_path << "; problems are only logged";
        return false;
    }
    ofs << "\n=== Run started " << GetTimestamp() << " ===\n";
    s_log_path = log_path;
    return true;
}

std::vector<ErrorReport> ErrorReporter::TakePending()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> taken;
    taken.swap(s_queue);
    AppendToLogLocked(taken);
    return taken;
}

void ErrorReporter::FlushPending()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    AppendToLogLocked(s_queue);
    s_queue.clear();
}

RunErrorSummary ErrorReporter::Summary()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_summary;
}

std::string ErrorReporter::FormatSummary(const RunErrorSummary& summary)
{
    if (summary.total() == 0)
        return {};

    std::vector<std::string> parts;
    if (summary.fatals)
        parts.push_back(plural(summary.fatals, "fatal error"));
    if (summary.errors)
        parts.push_back(plural(summary.errors, "error"));
    if (summary.warnings)
        parts.push_back(plural(summary.warnings, "warning"));

    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i)
        out += (i ? ", " : "") + parts[i];

    std::string categories;
    for (std::size_t i = 0; i < kErrorCategoryCount; ++i)
    {
        if (summary.by_category[i] == 0)
            continue;
        categories += (categories.empty() ? "" : ", ") + std::string(kCategoryNames[i]) + ": " +
                      std::to_string(summary.by_category[i]);
    }
    out += " (" + categories + ")";

    if (summary.dropped)
        out += "; " + std::to_string(summary.dropped) + " only in errors.log";
    return out;
}

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    auto index = static_cast<std::size_t>(category);
    return index < kErrorCategoryCount ? kCategoryNames[index] : "Unknown";
}

const char* ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

std::string ErrorReporter::GetTimestamp()
{
    std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

void ErrorReporter::AppendToLogLocked(const std::vector<ErrorReport>& reports)
{
    if (s_log_path.empty() || reports.empty())
        return;

    std::ofstream ofs(s_log_path, std::ios::app);
    if (!ofs)
        return;

    for (const auto& report : reports)
    {
        ofs << report.timestamp << " " << SeverityToString(report.severity) << " "
            << CategoryToString(report.category) << ": " << report.message;
        if (!report.details.empty())
            ofs << " | " << report.details;
        ofs << '\n';
    }
}

} // namespace utils
