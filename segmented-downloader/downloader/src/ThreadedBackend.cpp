// =============================================================================
// ThreadedBackend.cpp
//
// 設計方針:
//  - 未完了セグメントを共有キューに積み、ワーカーが 1 件ずつ取り出す
//  - ワーカーは取り出したセグメントについて必ず 1 件の結果を返す
//  - 致命的エラー / pause・cancel 時はキューに残ったセグメントを回収し、
//    その件数を受信待ち件数から差し引く (結果が来ないものを待ち続けない)
//  - 実行中の転送は内部の停止トークン経由で中断する
// =============================================================================

#include "ThreadedBackend.h"
#include "BackendSupport.h"
#include "Log.h"
#include "StorageWriter.h"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <system_error>
#include <thread>

namespace SegmentedDownloader {

namespace {

constexpr const char* TAG = "Threaded";

/// ワーカーが取り出すセグメントキュー
class WorkQueue {
public:
    explicit WorkQueue(const std::vector<size_t>& indices)
        : items_(indices.begin(), indices.end()) {}

    std::optional<size_t> pop() {
        std::lock_guard<std::mutex> lock(mutex_);
        if (items_.empty()) return std::nullopt;
        const size_t index = items_.front();
        items_.pop_front();
        return index;
    }

    /// 残りを破棄して件数を返す
    size_t drain() {
        std::lock_guard<std::mutex> lock(mutex_);
        const size_t n = items_.size();
        items_.clear();
        return n;
    }

private:
    std::mutex         mutex_;
    std::deque<size_t> items_;
};

struct SegmentResult {
    size_t         index = 0;
    SegmentOutcome outcome;
};

/// ワーカー → 集約スレッドの結果チャネル
class ResultChannel {
public:
    void push(SegmentResult result) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            results_.push_back(std::move(result));
        }
        cv_.notify_one();
    }

    /// @return false: timeout までに結果が届かなかった
    bool popFor(SegmentResult& out, std::chrono::milliseconds timeout) {
        std::unique_lock<std::mutex> lock(mutex_);
        if (!cv_.wait_for(lock, timeout, [this]() { return !results_.empty(); })) {
            return false;
        }
        out = std::move(results_.front());
        results_.pop_front();
        return true;
    }

private:
    std::mutex                mutex_;
    std::condition_variable   cv_;
    std::deque<SegmentResult> results_;
};

/// ワーカー間で共有する統計
struct SharedSummary {
    std::atomic<uint32_t> attempts{0};
    std::atomic<uint32_t> retries{0};
    std::atomic<uint32_t> throttleEvents{0};
    std::atomic<uint32_t> errorEvents{0};
};

/// 1 セグメントをリトライ込みで転送する
SegmentOutcome runWithRetry(IHttpHandle& handle, const TransferRequest& request,
                            size_t index,
                            const std::shared_ptr<const AbortToken>& stop,
                            SharedSummary& summary) {
    for (uint32_t attempt = 1;; ++attempt) {
        SegmentTransfer transfer(index, request.segments[index], *request.storage,
                                 request.rangeRequests, stop,
                                 detail::counterFor(request, index));
        transfer.configure(handle, request.url, request.headers, request.http);
        SegmentOutcome outcome = transfer.run(handle);
        summary.attempts.fetch_add(1, std::memory_order_relaxed);

        if (outcome.ok() || outcome.kind == ErrorKind::ABORTED) {
            return outcome;
        }
        if (outcome.throttled()) {
            summary.throttleEvents.fetch_add(1, std::memory_order_relaxed);
        } else {
            summary.errorEvents.fetch_add(1, std::memory_order_relaxed);
        }

        const RetryDecision decision = request.retryPolicy.decide(attempt, outcome.kind);
        if (!decision.retry) {
            return outcome;
        }
        summary.retries.fetch_add(1, std::memory_order_relaxed);
        SEGDL_LOG_WARN(TAG, outcome.message << "; retry " << attempt << "/"
                            << request.retryPolicy.maxAttempts << " in "
                            << decision.delay.count() << " ms");

        if (stop->waitFor(decision.delay)) {
            outcome.kind    = ErrorKind::ABORTED;
            outcome.message = "aborted during backoff";
            return outcome;
        }
    }
}

/// ワーカースレッド本体
void workerLoop(const TransferRequest& request, const HttpHandleFactory& factory,
                WorkQueue& queue, ResultChannel& results,
                const std::shared_ptr<const AbortToken>& stop,
                SharedSummary& summary) {
    std::unique_ptr<IHttpHandle> handle;
    std::string handleError = "transport handle factory returned null";
    try {
        handle = factory();
    } catch (const std::exception& e) {
        handleError = e.what();
    }

    for (;;) {
        // ディスパッチごとに中断を確認する
        if (stop->isAborted()) {
            return;
        }
        const auto index = queue.pop();
        if (!index) {
            return;
        }

        // 取り出したセグメントは例外が起きても必ず結果を返す
        SegmentResult result;
        result.index = *index;
        try {
            if (handle) {
                result.outcome = runWithRetry(*handle, request, *index, stop, summary);
            } else {
                result.outcome.kind    = ErrorKind::OTHER;
                result.outcome.message = "failed to create transport handle: " + handleError;
            }
        } catch (const std::exception& e) {
            result.outcome.kind    = ErrorKind::OTHER;
            result.outcome.message = std::string("worker exception: ") + e.what();
        } catch (...) {
            result.outcome.kind    = ErrorKind::OTHER;
            result.outcome.message = "unknown worker exception";
        }
        results.push(std::move(result));
    }
}

} // namespace

ThreadedBackend::ThreadedBackend(HttpHandleFactory factory)
    : factory_(std::move(factory)) {}

Status ThreadedBackend::transfer(const TransferRequest& request,
                                 SegmentBitmap& bitmap,
                                 TransferSummary& summary) {
    if (!request.storage) {
        return Status::error(ErrorKind::OTHER, "no storage attached");
    }
    const std::vector<size_t> incomplete = detail::incompleteSegments(request, bitmap);
    if (incomplete.empty()) {
        return Status::ok();
    }

    WorkQueue     queue(incomplete);
    ResultChannel results;
    SharedSummary shared;
    // 致命的エラーで他のワーカーを止めるための子トークン
    auto stop = std::make_shared<AbortToken>(request.abort);
    std::shared_ptr<const AbortToken> stopView = stop;

    const size_t workerCount =
        std::max<size_t>(1, std::min(request.maxConcurrent, incomplete.size()));
    std::vector<std::thread> workers;
    workers.reserve(workerCount);
    for (size_t i = 0; i < workerCount; ++i) {
        try {
            workers.emplace_back(workerLoop, std::cref(request), std::cref(factory_),
                                 std::ref(queue), std::ref(results),
                                 std::cref(stopView), std::ref(shared));
        } catch (const std::system_error& e) {
            SEGDL_LOG_WARN(TAG, "failed to start worker " << i << ": " << e.what());
            break;
        }
    }
    if (workers.empty()) {
        return Status::error(ErrorKind::OTHER, "could not start any worker thread");
    }
    SEGDL_LOG_DEBUG(TAG, incomplete.size() << " segments on " << workers.size()
                         << " workers");

    detail::CommitCoalescer commits(request, bitmap);
    size_t toReceive  = incomplete.size();
    bool   stopped    = false;
    bool   userAbort  = false;
    Status firstError;

    auto stopAll = [&]() {
        if (stopped) return;
        stopped = true;
        stop->abort();
        // 未ディスパッチ分は結果が来ないので差し引く
        toReceive -= queue.drain();
    };

    while (toReceive > 0) {
        if (!stopped && request.abort && request.abort->isAborted()) {
            userAbort = true;
            stopAll();
            if (toReceive == 0) break;
        }

        SegmentResult result;
        if (!results.popFor(result, request.pollInterval)) {
            continue;
        }
        --toReceive;

        if (result.outcome.ok()) {
            const Status committed = commits.markCompleted(result.index);
            if (!committed.isOk() && firstError.isOk()) {
                SEGDL_LOG_ERROR(TAG, committed.message());
                firstError = committed;
                stopAll();
            }
            continue;
        }
        if (result.outcome.kind == ErrorKind::ABORTED) {
            continue;
        }
        if (firstError.isOk()) {
            SEGDL_LOG_ERROR(TAG, result.outcome.message);
            firstError = Status::error(result.outcome.kind, result.outcome.message);
        }
        stopAll();
    }

    for (auto& worker : workers) {
        worker.join();
    }
    const Status flushed = commits.flush();
    if (!flushed.isOk() && firstError.isOk()) {
        firstError = flushed;
    }

    summary.attempts       += shared.attempts.load();
    summary.retries        += shared.retries.load();
    summary.throttleEvents += shared.throttleEvents.load();
    summary.errorEvents    += shared.errorEvents.load();

    if (!firstError.isOk()) {
        return firstError;
    }
    if (bitmap.allCompleted()) {
        return Status::ok();
    }
    if (userAbort || (request.abort && request.abort->isAborted())) {
        return Status::error(ErrorKind::ABORTED, "transfer aborted by request");
    }
    return Status::error(ErrorKind::OTHER, "transfer ended with incomplete segments");
}

} // namespace SegmentedDownloader
