#pragma once

#include "BatchTypes.hpp"
#include "Period.hpp"
#include "../roster/Roster.hpp"

#include <atomic>
#include <future>
#include <string>
#include <thread>
#include <utility>

namespace slipsort
{

class BatchProcessor;

struct BatchRequest
{
    std::string source_path;
    Period period;
    Roster roster;
    BatchOptions options;
    ProgressSink progress;     // called on the worker thread
    CancelPoll cancel_poll;    // polled on the worker thread, in addition to requestCancel()
};

/**
 * @brief Runs one batch at a time on a dedicated thread.
 *
 * The caller keeps its own thread responsive: it polls progress(), may call
 * requestCancel() at any time and collects the result with wait(). Pages are
 * never processed in parallel.
 */
class BatchWorker
{
public:
    explicit BatchWorker(BatchProcessor& processor);
    ~BatchWorker();

    BatchWorker(const BatchWorker&) = delete;
    BatchWorker& operator=(const BatchWorker&) = delete;

    // False if a batch is still running or its result has not been collected.
    bool start(BatchRequest request);

    // Honored before the next page.
    void requestCancel();

    bool running() const { return running_.load(std::memory_order_acquire); }

    // True once the result is ready and not yet collected by wait().
    bool finished() const;

    // Last (current, total) reported by the processor; (0, 0) before the first page.
    std::pair<int, int> progress() const;

    // Blocks until the batch ends. Rethrows SourceUnavailableError / BatchAbortedError.
    BatchResult wait();

    BatchState state() const;

private:
    BatchProcessor& processor_;
    std::jthread thread_;
    std::future<BatchResult> result_;
    std::atomic<bool> running_{ false };
    std::atomic<int> current_{ 0 };
    std::atomic<int> total_{ 0 };
};

} // namespace slipsort
