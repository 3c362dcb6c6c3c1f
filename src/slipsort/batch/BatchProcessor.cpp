#include "BatchProcessor.hpp"
#include "Period.hpp"
#include "UnmatchedPageLog.hpp"
#include "../acquisition/TextAcquirer.hpp"
#include "../matching/IdentityMatcher.hpp"
#include "../roster/Roster.hpp"
#include "../routing/PageRouter.hpp"

#include "../../processing/Diagnostics.hpp"
#include "../../utils/ErrorReporter.hpp"
#include "../../utils/Profile.hpp"

#include <plog/Log.h>

#include <stdexcept>

namespace slipsort
{

namespace
{
std::string pageError(int page_index, const std::string& what)
{
    return "Page " + std::to_string(page_index + 1) + ": " + what;
}
} // namespace

BatchProcessor::BatchProcessor(const BatchProcessorCreateInfo& create_info)
    : acquirer_(create_info.acquirer)
    , matcher_(create_info.matcher)
    , router_(create_info.router)
    , unmatched_log_(create_info.unmatched_log)
    , open_document_(create_info.open_document)
    , record_sink_(create_info.record_sink)
{
    if (!acquirer_ || !matcher_ || !router_)
    {
        throw std::invalid_argument("BatchProcessor requires an acquirer, a matcher and a router");
    }
    if (!open_document_)
    {
        open_document_ = DocumentFactory::DefaultOpener();
    }
}

BatchProcessor::~BatchProcessor() = default;

BatchResult BatchProcessor::processBatch(const std::string& source_path, const Period& period, const Roster& roster,
                                         const BatchOptions& options, const ProgressSink& progress,
                                         const CancelPoll& cancel_poll)
{
    PROFILE_SCOPE_FUNCTION();
    setState(BatchState::Running);

    std::unique_ptr<IDocument> document;
    try
    {
        document = open_document_(source_path);
        if (!document)
        {
            throw SourceUnavailableError("Unable to open source document: " + source_path);
        }
    }
    catch (const SourceUnavailableError& e)
    {
        setState(BatchState::Failed);
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Document, "Source document unavailable", e.what());
        throw;
    }
    catch (const std::exception& e)
    {
        setState(BatchState::Failed);
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Document, "Source document unavailable", e.what());
        throw SourceUnavailableError(std::string("Unable to open source document: ") + e.what());
    }

    BatchResult result;
    result.total_pages = document->pageCount();
    result.final_state = BatchState::Running;

    PLOG_INFO << "Processing " << source_path << ": " << result.total_pages << " page(s), " << roster.size()
              << " roster name(s), period " << period.label() << (options.use_fuzzy_matching ? ", fuzzy on" : "");

#if SLIPSORT_PROFILING_LEVEL >= 1
    profiling::detail::PageStatsAccumulator page_stats;
#endif

    try
    {
        for (int page_index = 0; page_index < result.total_pages; ++page_index)
        {
            if (cancel_poll && cancel_poll())
            {
                PLOG_INFO << "Cancellation requested before page " << (page_index + 1);
                result.final_state = BatchState::Cancelled;
                break;
            }

            if (progress)
            {
                progress(page_index + 1, result.total_pages);
            }

            PROFILE_PAGE_BEGIN(page_stats);

            PageRecord record;
            record.page_index = page_index;
            try
            {
                TextAcquisition acquisition = acquirer_->acquire(*document, page_index, options);
                if (acquisition.error)
                {
                    result.errors.push_back(pageError(page_index, *acquisition.error));
                }
                record.text = std::move(acquisition.text);
                record.acquisition = acquisition.method;

                MatchOutcome outcome = matcher_->identify(record.text, roster, options);
                record.identity = outcome.identity;
                record.match_method = outcome.method;
                record.score = outcome.score;

                if (outcome.identified())
                {
                    std::string path = router_->routePage(*document, page_index, *outcome.identity, period);
                    record.output_path = path;
                    result.outputs.push_back(std::move(path));
                    result.identities_found.insert(*outcome.identity);
                    ++result.identified_pages;

                    PLOG_INFO_IF(processing::Diagnostics::IsVerbose())
                        << "Page " << (page_index + 1) << " -> " << *outcome.identity << " ("
                        << toString(outcome.method) << ")";
                }
                else
                {
                    ++result.unidentified_pages;
                    PLOG_INFO << "No roster name found on page " << (page_index + 1) << " ("
                              << toString(record.acquisition) << ")";
                    if (unmatched_log_)
                    {
                        unmatched_log_->append(page_index + 1, record.text);
                    }
                    PLOG_DEBUG_(processing::Diagnostics::kLogInstance)
                        << "Unmatched page " << (page_index + 1) << ": " << processing::Diagnostics::Preview(record.text);
                }
            }
            catch (const RoutingError&)
            {
                throw;
            }
            catch (const std::exception& e)
            {
                result.errors.push_back(pageError(page_index, e.what()));
                ++result.unidentified_pages;
                record.identity.reset();
                record.match_method = MatchMethod::None;
                record.score.reset();
                utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Matching, "Page skipped after error",
                                                    pageError(page_index, e.what()));
            }

            ++result.pages_processed;
            PROFILE_PAGE_END(page_stats);

            if (record_sink_)
            {
                record_sink_(record);
            }
        }
    }
    catch (const RoutingError& e)
    {
        // The failing page is the one after the last processed page
        result.errors.push_back(pageError(result.pages_processed, e.what()));
        result.final_state = BatchState::Failed;
        setState(BatchState::Failed);
        PLOG_ERROR << "Batch aborted after " << result.pages_processed << " page(s): " << e.what();
        throw BatchAbortedError(e.what(), std::move(result));
    }
    catch (const std::exception& e)
    {
        // Progress or cancel callbacks threw; nothing more can be trusted
        setState(BatchState::Failed);
        utils::ErrorReporter::ReportFatal(utils::ErrorCategory::Unknown, "Batch stopped unexpectedly", e.what());
        throw;
    }

    if (result.final_state != BatchState::Cancelled)
    {
        result.final_state = BatchState::Completed;
    }
    setState(result.final_state);

    PLOG_INFO << "Batch " << toString(result.final_state) << ": " << result.pages_processed << "/"
              << result.total_pages << " page(s), " << result.identified_pages << " identified, "
              << result.unidentified_pages << " unidentified, " << result.errors.size() << " error(s)";
    return result;
}

std::string BatchProcessor::processRanges(const std::string& source_path, const std::vector<PageRange>& ranges,
                                          const std::string& identity, const Period& period)
{
    PROFILE_SCOPE_FUNCTION();

    std::unique_ptr<IDocument> document = open_document_(source_path);
    if (!document)
    {
        throw SourceUnavailableError("Unable to open source document: " + source_path);
    }
    return router_->routeRanges(*document, ranges, identity, period);
}

} // namespace slipsort
