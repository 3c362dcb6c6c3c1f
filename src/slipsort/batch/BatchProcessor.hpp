#pragma once

#include "BatchTypes.hpp"
#include "../document/DocumentFactory.hpp"

#include <atomic>
#include <string>
#include <vector>

namespace slipsort
{

class IdentityMatcher;
class PageRouter;
class Roster;
class TextAcquirer;
class UnmatchedPageLog;
struct PageRange;
struct Period;

struct BatchProcessorCreateInfo
{
    // Required collaborators; must outlive the processor.
    const TextAcquirer* acquirer = nullptr;
    const IdentityMatcher* matcher = nullptr;
    PageRouter* router = nullptr;

    // Optional: unidentified pages are only counted when null.
    UnmatchedPageLog* unmatched_log = nullptr;

    // Defaults to DocumentFactory::DefaultOpener().
    DocumentOpener open_document;

    // Receives every page record after it is handled.
    RecordSink record_sink;
};

/**
 * @brief Runs one source document through acquire -> identify -> route.
 *
 * Pages are handled strictly in ascending order. Cancellation is polled
 * before each page; pages already routed stay on disk. A page-level failure
 * is recorded as "Page N: <reason>" and the page counts as unidentified. A
 * routing failure stops the batch with BatchAbortedError.
 */
class BatchProcessor
{
public:
    explicit BatchProcessor(const BatchProcessorCreateInfo& create_info);
    ~BatchProcessor();

    BatchProcessor(const BatchProcessor&) = delete;
    BatchProcessor& operator=(const BatchProcessor&) = delete;

    // Throws SourceUnavailableError before any page; BatchAbortedError on routing failure.
    BatchResult processBatch(const std::string& source_path, const Period& period, const Roster& roster,
                             const BatchOptions& options, const ProgressSink& progress = {},
                             const CancelPoll& cancel_poll = {});

    // Routes the given (clamped) page ranges of a source to one identity as a single file.
    std::string processRanges(const std::string& source_path, const std::vector<PageRange>& ranges,
                              const std::string& identity, const Period& period);

    BatchState state() const { return state_.load(std::memory_order_acquire); }

private:
    void setState(BatchState state) { state_.store(state, std::memory_order_release); }

    const TextAcquirer* acquirer_;
    const IdentityMatcher* matcher_;
    PageRouter* router_;
    UnmatchedPageLog* unmatched_log_;
    DocumentOpener open_document_;
    RecordSink record_sink_;
    std::atomic<BatchState> state_{ BatchState::Idle };
};

} // namespace slipsort
