#include "UnmatchedPageLog.hpp"

#include "../../processing/TextUtils.hpp"
#include "../../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <filesystem>
#include <fstream>

namespace slipsort
{

UnmatchedPageLog::UnmatchedPageLog(std::string path)
    : path_(std::move(path))
{
}

bool UnmatchedPageLog::append(int page_number, const std::string& text)
{
    std::lock_guard<std::mutex> lock(mutex_);

    std::error_code ec;
    auto parent = std::filesystem::path(path_).parent_path();
    if (!parent.empty())
        std::filesystem::create_directories(parent, ec);

    std::ofstream file(path_, std::ios::app | std::ios::binary);
    if (!file.is_open())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Matching, "Failed to write unmatched page log",
                                            "Path: " + path_ + (ec ? " | Error: " + ec.message() : std::string()));
        return false;
    }

    file << "=== Unmatched page (" << utils::ErrorReporter::GetTimestamp() << ") ===\n";
    file << "Page number: " << page_number << "\n";
    file << "Extracted text:\n" << processing::truncateCodepoints(text, kMaxTextCodepoints) << "...\n\n";

    if (!file.good())
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Matching, "Error writing unmatched page log",
                                            "Path: " + path_);
        return false;
    }

    PLOG_DEBUG << "Logged unmatched page " << page_number;
    return true;
}

} // namespace slipsort
