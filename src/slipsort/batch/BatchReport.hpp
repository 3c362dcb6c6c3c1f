#pragma once

#include "BatchTypes.hpp"
#include "Period.hpp"

#include <string>

namespace slipsort
{

struct BatchReportInfo
{
    std::string source;
    Period period;
    std::string started_at;  // "YYYY-MM-DD HH:MM:SS"
    std::string finished_at;
};

// JSON summary of a run, written next to the logs as batch_report_<yyyyMMddHHmmss>.json
class BatchReport
{
public:
    BatchReport() = default;
    ~BatchReport() = default;

    // Pretty-printed JSON document
    std::string serialize(const BatchResult& result, const BatchReportInfo& info) const;

    bool write(const std::string& logs_dir, const BatchResult& result, const BatchReportInfo& info,
               std::string& outPath, std::string& outError) const;

    // Read back the counters of a report; used by tooling and tests
    static bool parse(const std::string& jsonContent, BatchResult& outResult, std::string& outError);
};

} // namespace slipsort
