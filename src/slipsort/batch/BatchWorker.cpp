#include "BatchWorker.hpp"
#include "BatchProcessor.hpp"

#include "../../utils/CrashHandler.hpp"
#include "../../utils/Profile.hpp"

#include <plog/Log.h>

#include <chrono>
#include <exception>
#include <stdexcept>

namespace slipsort
{

BatchWorker::BatchWorker(BatchProcessor& processor)
    : processor_(processor)
{
}

BatchWorker::~BatchWorker()
{
    if (thread_.joinable())
    {
        thread_.request_stop();
        thread_.join();
    }
}

bool BatchWorker::start(BatchRequest request)
{
    if (running() || result_.valid())
    {
        PLOG_WARNING << "Batch already in progress; start ignored";
        return false;
    }

    if (thread_.joinable())
    {
        thread_.join();
    }

    current_.store(0, std::memory_order_relaxed);
    total_.store(0, std::memory_order_relaxed);
    running_.store(true, std::memory_order_release);

    std::promise<BatchResult> promise;
    result_ = promise.get_future();

    thread_ = std::jthread(
        [this, request = std::move(request), promise = std::move(promise)](std::stop_token stoken) mutable
        {
            PROFILE_THREAD_NAME("BatchWorker");
            utils::CrashHandler::SetContext("batch worker");

            auto progress = [this, &request](int current, int total)
            {
                current_.store(current, std::memory_order_relaxed);
                total_.store(total, std::memory_order_relaxed);
                if (request.progress)
                {
                    request.progress(current, total);
                }
            };
            auto cancel = [&stoken, &request]()
            { return stoken.stop_requested() || (request.cancel_poll && request.cancel_poll()); };

            BatchResult result;
            std::exception_ptr failure;
            try
            {
                result = processor_.processBatch(request.source_path, request.period, request.roster, request.options,
                                                 progress, cancel);
            }
            catch (const std::exception& e)
            {
                PLOG_ERROR << "Batch worker stopped: " << e.what();
                failure = std::current_exception();
            }
            catch (...)
            {
                PLOG_ERROR << "Batch worker stopped by unknown exception";
                failure = std::current_exception();
            }

            // Cleared before the future becomes ready: finished() implies !running()
            running_.store(false, std::memory_order_release);
            if (failure)
                promise.set_exception(failure);
            else
                promise.set_value(std::move(result));
        });
    return true;
}

void BatchWorker::requestCancel()
{
    if (thread_.joinable())
    {
        PLOG_INFO << "Cancellation requested";
        thread_.request_stop();
    }
}

std::pair<int, int> BatchWorker::progress() const
{
    return { current_.load(std::memory_order_relaxed), total_.load(std::memory_order_relaxed) };
}

bool BatchWorker::finished() const
{
    return result_.valid() && result_.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
}

BatchResult BatchWorker::wait()
{
    if (!result_.valid())
    {
        throw std::logic_error("No batch started");
    }

    auto future = std::move(result_);
    if (thread_.joinable())
    {
        thread_.join();
    }
    return future.get();
}

BatchState BatchWorker::state() const { return processor_.state(); }

} // namespace slipsort
