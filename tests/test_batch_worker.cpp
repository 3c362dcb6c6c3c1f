#include <catch2/catch_test_macros.hpp>
#include "slipsort/acquisition/TextAcquirer.hpp"
#include "slipsort/batch/BatchProcessor.hpp"
#include "slipsort/batch/BatchWorker.hpp"
#include "slipsort/matching/IdentityMatcher.hpp"
#include "slipsort/routing/PageRouter.hpp"
#include "utils/fake_document.hpp"
#include "utils/temp_dir.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <stdexcept>
#include <thread>

using namespace slipsort;
using namespace test_utils;

namespace {

// Blocks the worker inside the progress callback until the test releases it.
class Gate {
public:
    void arrive()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        arrived_ = true;
        cv_.notify_all();
        cv_.wait(lock, [this] { return open_; });
    }

    void waitArrived()
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait(lock, [this] { return arrived_; });
    }

    void open()
    {
        std::lock_guard<std::mutex> lock(mutex_);
        open_ = true;
        cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::condition_variable cv_;
    bool arrived_ = false;
    bool open_ = false;
};

struct WorkerFixture {
    TempDir dir{"batch_worker"};
    TextAcquirer acquirer{nullptr};
    IdentityMatcher matcher;
    PageRouter router{dir.file("output"), "Recibo"};
    std::vector<FakePage> pages;
    bool source_missing = false;
    BatchProcessor processor{makeInfo()};

    BatchProcessorCreateInfo makeInfo()
    {
        BatchProcessorCreateInfo info;
        info.acquirer = &acquirer;
        info.matcher = &matcher;
        info.router = &router;
        info.open_document = [this](const std::string& path) -> std::unique_ptr<IDocument> {
            if (source_missing)
                throw SourceUnavailableError("Source document not found: " + path);
            return std::make_unique<FakeDocument>(pages, path);
        };
        return info;
    }

    BatchRequest request()
    {
        BatchRequest req;
        req.source_path = "folha.pdf";
        req.period = Period{"03", "2024"};
        req.roster = Roster::fromNames({"ANA LIMA"});
        return req;
    }
};

const std::string kSlip = "RECIBO DE PAGAMENTO DE SALARIO - ANA LIMA - Competencia 03/2024 - Liquido 1.234,56";

} // namespace

TEST_CASE("BatchWorker - Runs to completion", "[worker]")
{
    WorkerFixture fx;
    fx.pages = {FakePage{kSlip}, FakePage{kSlip}};
    BatchWorker worker(fx.processor);

    std::atomic<std::thread::id> callback_thread{};
    auto req = fx.request();
    req.progress = [&](int, int) { callback_thread = std::this_thread::get_id(); };

    REQUIRE(worker.start(std::move(req)));
    BatchResult result = worker.wait();

    REQUIRE(result.final_state == BatchState::Completed);
    REQUIRE(result.identified_pages == 2);
    REQUIRE(worker.state() == BatchState::Completed);
    REQUIRE(worker.progress() == std::pair<int, int>{2, 2});
    REQUIRE_FALSE(worker.running());
    REQUIRE(callback_thread.load() != std::this_thread::get_id());
}

TEST_CASE("BatchWorker - Cancel from the caller thread", "[worker][cancel]")
{
    WorkerFixture fx;
    for (int i = 0; i < 6; ++i)
        fx.pages.push_back(FakePage{kSlip});
    BatchWorker worker(fx.processor);

    Gate gate;
    auto req = fx.request();
    req.progress = [&](int current, int) {
        if (current == 2)
            gate.arrive();
    };

    REQUIRE(worker.start(std::move(req)));
    gate.waitArrived();
    REQUIRE(worker.running());
    REQUIRE_FALSE(worker.start(fx.request()));

    worker.requestCancel();
    gate.open();

    BatchResult result = worker.wait();
    REQUIRE(result.final_state == BatchState::Cancelled);
    REQUIRE(result.pages_processed == 2);
    REQUIRE(result.total_pages == 6);
}

TEST_CASE("BatchWorker - Cancel poll in the request", "[worker][cancel]")
{
    WorkerFixture fx;
    fx.pages = {FakePage{kSlip}, FakePage{kSlip}, FakePage{kSlip}};
    BatchWorker worker(fx.processor);

    auto req = fx.request();
    req.cancel_poll = [] { return true; };

    REQUIRE(worker.start(std::move(req)));
    BatchResult result = worker.wait();
    REQUIRE(result.final_state == BatchState::Cancelled);
    REQUIRE(result.pages_processed == 0);
}

TEST_CASE("BatchWorker - Errors surface on wait", "[worker][errors]")
{
    WorkerFixture fx;
    BatchWorker worker(fx.processor);

    REQUIRE_THROWS_AS(worker.wait(), std::logic_error);

    fx.source_missing = true;
    REQUIRE(worker.start(fx.request()));
    REQUIRE_THROWS_AS(worker.wait(), SourceUnavailableError);
    REQUIRE(worker.state() == BatchState::Failed);

    // The worker accepts a new batch once the failure was collected
    fx.source_missing = false;
    fx.pages = {FakePage{kSlip}};
    REQUIRE(worker.start(fx.request()));
    REQUIRE(worker.wait().identified_pages == 1);
}

TEST_CASE("BatchWorker - Running flag is cleared before the result is ready", "[worker]")
{
    WorkerFixture fx;
    BatchWorker worker(fx.processor);
    REQUIRE_FALSE(worker.finished());

    SECTION("Completed batch")
    {
        fx.pages = {FakePage{kSlip}, FakePage{kSlip}};
        REQUIRE(worker.start(fx.request()));
    }

    SECTION("Failed batch")
    {
        fx.source_missing = true;
        REQUIRE(worker.start(fx.request()));
    }

    // No join here: the observation happens while the worker thread may still be unwinding
    while (!worker.finished())
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    REQUIRE_FALSE(worker.running());

    if (fx.source_missing)
        REQUIRE_THROWS_AS(worker.wait(), SourceUnavailableError);
    else
        REQUIRE(worker.wait().identified_pages == 2);
    REQUIRE_FALSE(worker.finished());
}

TEST_CASE("BatchWorker - Callback exceptions surface unchanged on wait", "[worker][errors]")
{
    WorkerFixture fx;
    fx.pages = {FakePage{kSlip}, FakePage{kSlip}};
    BatchWorker worker(fx.processor);

    auto req = fx.request();
    req.progress = [](int, int) { throw std::runtime_error("progress sink closed"); };

    REQUIRE(worker.start(std::move(req)));
    try
    {
        worker.wait();
        FAIL("wait() returned normally");
    }
    catch (const SourceUnavailableError&)
    {
        FAIL("reported as a missing source");
    }
    catch (const BatchAbortedError&)
    {
        FAIL("reported as a routing abort");
    }
    catch (const std::runtime_error& e)
    {
        REQUIRE(std::string(e.what()) == "progress sink closed");
    }
    REQUIRE_FALSE(worker.running());
    REQUIRE(worker.state() == BatchState::Failed);

    fx.pages = {FakePage{kSlip}};
    REQUIRE(worker.start(fx.request()));
    REQUIRE(worker.wait().identified_pages == 1);
}
