#pragma once

#include "StageResult.hpp"
#include "Diagnostics.hpp"
#include <chrono>
#include <string>
#include <plog/Log.h>
#include <utility>
#include <exception>

#include "../utils/Profile.hpp"
#include "../utils/ErrorReporter.hpp"

namespace processing {

// Runs a stage (callable returning T) and produces StageResult<T>.
// Measures duration; exceptions become a failed result and a warning report.
template<typename T, typename Fn>
StageResult<T> run_stage(const std::string& stage_name, Fn&& fn,
                         utils::ErrorCategory category = utils::ErrorCategory::Extraction)
{
    PROFILE_SCOPE_CUSTOM(stage_name);

    using namespace std::chrono;
    auto start = high_resolution_clock::now();
    try
    {
        T res = fn();
        auto end = high_resolution_clock::now();
        auto dur = duration_cast<std::chrono::microseconds>(end - start);
        auto sr = StageResult<T>::success(std::move(res), dur, stage_name);
        if (Diagnostics::IsVerbose()) {
            PLOG_INFO_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' succeeded in " << dur.count() << "us";
        }
        return sr;
    }
    catch (const std::exception& ex)
    {
        auto end = high_resolution_clock::now();
        auto dur = duration_cast<std::chrono::microseconds>(end - start);
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed in " << dur.count() << "us: " << ex.what();
        utils::ErrorReporter::ReportWarning(category, "Pipeline stage failed", stage_name + ": " + ex.what());
        return StageResult<T>::failure(ex.what(), dur, stage_name);
    }
    catch (...)
    {
        auto end = high_resolution_clock::now();
        auto dur = duration_cast<std::chrono::microseconds>(end - start);
        PLOG_ERROR_(Diagnostics::kLogInstance) << "Stage '" << stage_name << "' failed with unknown exception in " << dur.count() << "us";
        utils::ErrorReporter::ReportWarning(category, "Pipeline stage failed", stage_name + ": unknown exception");
        return StageResult<T>::failure("unknown exception", dur, stage_name);
    }
}

} // namespace processing
