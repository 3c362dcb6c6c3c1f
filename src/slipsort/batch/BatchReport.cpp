#include "BatchReport.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <sstream>

using json = nlohmann::json;

namespace slipsort
{

namespace
{
std::string fileTimestamp()
{
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    std::ostringstream ss;
    ss << std::put_time(&tm_buf, "%Y%m%d%H%M%S");
    return ss.str();
}

BatchState stateFromString(const std::string& s)
{
    if (s == "running")
        return BatchState::Running;
    if (s == "completed")
        return BatchState::Completed;
    if (s == "cancelled")
        return BatchState::Cancelled;
    if (s == "failed")
        return BatchState::Failed;
    return BatchState::Idle;
}
} // namespace

std::string BatchReport::serialize(const BatchResult& result, const BatchReportInfo& info) const
{
    json report;
    report["source"] = info.source;
    report["period"] = {{"month", info.period.month}, {"year", info.period.year}};
    report["started_at"] = info.started_at;
    report["finished_at"] = info.finished_at;
    report["state"] = toString(result.final_state);
    report["total_pages"] = result.total_pages;
    report["pages_processed"] = result.pages_processed;
    report["identified_pages"] = result.identified_pages;
    report["unidentified_pages"] = result.unidentified_pages;
    report["identities_found"] = json::array();
    for (const auto& identity : result.identities_found)
        report["identities_found"].push_back(identity);
    report["errors"] = result.errors;
    report["outputs"] = result.outputs;
    return report.dump(2);
}

bool BatchReport::write(const std::string& logs_dir, const BatchResult& result, const BatchReportInfo& info,
                        std::string& outPath, std::string& outError) const
{
    std::error_code ec;
    std::filesystem::create_directories(logs_dir, ec);
    if (ec)
    {
        outError = "Cannot create report directory " + logs_dir + ": " + ec.message();
        PLOG_ERROR << outError;
        return false;
    }

    auto path = std::filesystem::path(logs_dir) / ("batch_report_" + fileTimestamp() + ".json");
    std::ofstream file(path, std::ios::trunc | std::ios::binary);
    if (!file.is_open())
    {
        outError = "Cannot open report file " + path.string();
        PLOG_ERROR << outError;
        return false;
    }

    file << serialize(result, info) << '\n';
    if (!file.good())
    {
        outError = "Error writing report file " + path.string();
        PLOG_ERROR << outError;
        return false;
    }

    outPath = path.string();
    PLOG_INFO << "Batch report written to " << outPath;
    return true;
}

bool BatchReport::parse(const std::string& jsonContent, BatchResult& outResult, std::string& outError)
{
    try
    {
        json report = json::parse(jsonContent);

        if (!report.contains("pages_processed"))
        {
            outError = "Report missing 'pages_processed' field";
            return false;
        }

        outResult.total_pages = report.value("total_pages", 0);
        outResult.pages_processed = report.value("pages_processed", 0);
        outResult.identified_pages = report.value("identified_pages", 0);
        outResult.unidentified_pages = report.value("unidentified_pages", 0);
        outResult.final_state = stateFromString(report.value("state", ""));

        outResult.identities_found.clear();
        if (report.contains("identities_found") && report["identities_found"].is_array())
        {
            for (const auto& identity : report["identities_found"])
                outResult.identities_found.insert(identity.get<std::string>());
        }
        outResult.errors = report.value("errors", std::vector<std::string>{});
        outResult.outputs = report.value("outputs", std::vector<std::string>{});
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        PLOG_ERROR << outError;
        return false;
    }
}

} // namespace slipsort
