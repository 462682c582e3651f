// =============================================================================
// Scheduler.cpp
// =============================================================================

#include "Scheduler.h"
#include "CurlHandle.h"
#include "CurlMulti.h"
#include "Log.h"

#include <algorithm>
#include <functional>
#include <system_error>
#include <thread>
#include <vector>

namespace SegmentedDownloader {

namespace {

constexpr const char* TAG = "Scheduler";

} // namespace

Scheduler::Scheduler(EngineConfig config, IJobStore& store,
                     ConnectionBudget& budget, JobControl& control,
                     IHostPolicy* hostPolicy)
    : Scheduler(std::move(config), store, budget, control,
                []() -> std::unique_ptr<IHttpHandle> {
                    return std::make_unique<CurlHandle>();
                },
                []() -> std::unique_ptr<IMultiHandle> {
                    return std::make_unique<CurlMulti>();
                },
                hostPolicy) {}

Scheduler::Scheduler(EngineConfig config, IJobStore& store,
                     ConnectionBudget& budget, JobControl& control,
                     HttpHandleFactory handleFactory,
                     MultiHandleFactory multiFactory, IHostPolicy* hostPolicy)
    : store_(store)
    , executor_(config, store, budget, control, std::move(handleFactory),
                std::move(multiFactory), hostPolicy)
    , maxConcurrentJobs_(std::max<size_t>(1, config.maxConcurrentJobs)) {}

size_t Scheduler::recover() {
    std::call_once(recoverOnce_, [this]() {
        const size_t n = store_.recoverStaleRunning();
        if (n > 0) {
            SEGDL_LOG_INFO(TAG, "re-queued " << n << " stale running job(s)");
        }
        recovered_.store(n, std::memory_order_release);
    });
    return recovered_.load(std::memory_order_acquire);
}

std::optional<JobState> Scheduler::runNext() {
    recover();
    auto job = store_.claimNextQueued();
    if (!job) {
        return std::nullopt;
    }
    return executor_.run(*job);
}

void Scheduler::workerLoop(std::atomic<size_t>& executed) {
    for (;;) {
        std::optional<Job> job;
        try {
            job = store_.claimNextQueued();
        } catch (const std::exception& e) {
            SEGDL_LOG_ERROR(TAG, "claim failed: " << e.what());
            return;
        }
        if (!job) {
            return;
        }
        executor_.run(*job);
        executed.fetch_add(1, std::memory_order_relaxed);
    }
}

size_t Scheduler::runAll() {
    recover();
    std::atomic<size_t> executed{0};

    if (maxConcurrentJobs_ == 1) {
        workerLoop(executed);
        return executed.load();
    }

    std::vector<std::thread> workers;
    workers.reserve(maxConcurrentJobs_);
    for (size_t i = 0; i < maxConcurrentJobs_; ++i) {
        try {
            workers.emplace_back(&Scheduler::workerLoop, this, std::ref(executed));
        } catch (const std::system_error& e) {
            SEGDL_LOG_WARN(TAG, "failed to start job worker " << i << ": " << e.what());
            break;
        }
    }
    if (workers.empty()) {
        // スレッドを起動できない場合は呼び出し側スレッドで処理する
        workerLoop(executed);
    }
    for (auto& worker : workers) {
        worker.join();
    }
    return executed.load();
}

} // namespace SegmentedDownloader
