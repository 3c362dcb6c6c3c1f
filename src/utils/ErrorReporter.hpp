#pragma once

#include <array>
#include <cstddef>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization,   // Logging, worker startup
    Configuration,    // TOML parsing, invalid config values
    Document,         // Source PDF open / page export / encryption
    Extraction,       // Direct text extraction
    Recognition,      // Rendering and OCR
    Matching,         // Identity matching
    Routing,          // Output directory / file creation
    Roster,           // Roster file I/O and roster names
    Unknown
};

inline constexpr std::size_t kErrorCategoryCount = static_cast<std::size_t>(ErrorCategory::Unknown) + 1;

enum class ErrorSeverity
{
    Info,    // Shown in the log only
    Warning, // The run continues with degraded output (a page unreadable, a backup skipped)
    Error,   // An operation failed; the run may still finish
    Fatal    // The run stops
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string message;   // One line for the operator
    std::string details;   // Paths, library messages
    std::string timestamp;
};

// Tally of one run. Info reports are not counted.
struct RunErrorSummary
{
    std::array<std::size_t, kErrorCategoryCount> by_category{};
    std::size_t warnings = 0;
    std::size_t errors = 0;
    std::size_t fatals = 0;
    // Reports that fell out of the bounded queue before the CLI printed them
    std::size_t dropped = 0;

    std::size_t total() const { return warnings + errors + fatals; }
    std::size_t count(ErrorCategory category) const { return by_category[static_cast<std::size_t>(category)]; }
};

/**
 * @brief Process-wide collector for problems met during a run.
 *
 * Any thread may report. Each report is logged through plog right away and
 * queued for the CLI, which drains the queue with TakePending() after the
 * command finishes and prints Summary() as the last line. Drained reports
 * are appended to errors.log in the logs directory once SetLogFile() named it.
 * Reports made before that (config parsing runs before logging is set up)
 * stay queued and are written with the rest.
 *
 *   ErrorReporter::ReportWarning(ErrorCategory::Recognition,
 *                                "Pipeline stage failed", "ocr page 12: ...");
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& message,
                       const std::string& details = "");

    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportFatal(ErrorCategory category, const std::string& message, const std::string& details = "");

    // Starts a new run: clears the queue and the tally. The error log is closed
    // until SetLogFile() names one.
    static void BeginRun();

    // Appends a run header to `log_path` and mirrors drained reports there.
    // False if the file cannot be opened; reports then only reach plog.
    static bool SetLogFile(const std::string& log_path);

    // Queued reports in arrival order; the queue is empty afterwards.
    static std::vector<ErrorReport> TakePending();

    // Writes queued reports to the error log without handing them out.
    static void FlushPending();

    static RunErrorSummary Summary();

    // "2 warnings, 1 error (Recognition: 2, Roster: 1)"; empty for a clean run.
    static std::string FormatSummary(const RunErrorSummary& summary);

    static const char* CategoryToString(ErrorCategory category);
    static const char* SeverityToString(ErrorSeverity severity);

    // Local time as "YYYY-MM-DD HH:MM:SS".
    static std::string GetTimestamp();

    static constexpr std::size_t kMaxQueued = 100;

private:
    static void AppendToLogLocked(const std::vector<ErrorReport>& reports);

    static std::mutex s_mutex;
    static std::vector<ErrorReport> s_queue;
    static RunErrorSummary s_summary;
    static std::string s_log_path;
};

} // namespace utils
