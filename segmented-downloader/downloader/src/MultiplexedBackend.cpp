// =============================================================================
// MultiplexedBackend.cpp
// =============================================================================

#include "MultiplexedBackend.h"
#include "BackendSupport.h"
#include "Log.h"
#include "StorageWriter.h"
#include "ThreadedBackend.h"

#include <algorithm>
#include <chrono>
#include <deque>
#include <queue>
#include <thread>

namespace SegmentedDownloader {

namespace {

constexpr const char* TAG = "Multi";

using Clock = std::chrono::steady_clock;

/// 転送中の 1 スロット
struct Slot {
    size_t                           index   = 0;
    uint32_t                         attempt = 1;
    std::unique_ptr<IHttpHandle>     handle;
    std::unique_ptr<SegmentTransfer> transfer;
};

/// リトライ待ちのセグメント
struct RetryEntry {
    Clock::time_point deadline;
    size_t            index   = 0;
    uint32_t          attempt = 1; ///< 次に行う試行番号

    bool operator>(const RetryEntry& other) const { return deadline > other.deadline; }
};

using RetryQueue = std::priority_queue<RetryEntry, std::vector<RetryEntry>,
                                       std::greater<RetryEntry>>;

std::chrono::milliseconds untilDeadline(const RetryQueue& retries,
                                        std::chrono::milliseconds cap) {
    if (retries.empty()) return cap;
    const auto now = Clock::now();
    if (retries.top().deadline <= now) return std::chrono::milliseconds(0);
    const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
        retries.top().deadline - now);
    // 切り捨てで期限前に起きて空回りしないよう 1ms 足す
    return std::min(cap, wait + std::chrono::milliseconds(1));
}

} // namespace

MultiplexedBackend::MultiplexedBackend(MultiHandleFactory factory)
    : factory_(std::move(factory)) {}

Status MultiplexedBackend::transfer(const TransferRequest& request,
                                    SegmentBitmap& bitmap,
                                    TransferSummary& summary) {
    if (!request.storage) {
        return Status::error(ErrorKind::OTHER, "no storage attached");
    }
    const std::vector<size_t> incomplete = detail::incompleteSegments(request, bitmap);
    if (incomplete.empty()) {
        return Status::ok();
    }

    std::unique_ptr<IMultiHandle> multi;
    try {
        multi = factory_();
    } catch (const std::exception& e) {
        return Status::error(ErrorKind::OTHER,
                             std::string("failed to create event loop: ") + e.what());
    }
    if (!multi) {
        return Status::error(ErrorKind::OTHER, "event loop factory returned null");
    }

    std::deque<size_t>                 pending(incomplete.begin(), incomplete.end());
    RetryQueue                         retries;
    std::vector<std::unique_ptr<Slot>> active;
    const size_t capacity =
        std::max<size_t>(1, std::min(request.maxConcurrent, incomplete.size()));

    detail::CommitCoalescer commits(request, bitmap);
    Status firstError;
    bool   aborted = false;

    // スロットに転送を開始する
    auto startSlot = [&](size_t index, uint32_t attempt) {
        auto slot      = std::make_unique<Slot>();
        slot->index    = index;
        slot->attempt  = attempt;
        try {
            slot->handle = multi->createHandle();
        } catch (const std::exception& e) {
            firstError = Status::error(ErrorKind::OTHER,
                                       std::string("failed to create transfer: ") + e.what());
            return;
        }
        slot->transfer = std::make_unique<SegmentTransfer>(
            index, request.segments[index], *request.storage,
            request.rangeRequests, request.abort,
            detail::counterFor(request, index));
        slot->transfer->configure(*slot->handle, request.url, request.headers,
                                  request.http);
        if (!multi->addHandle(slot->handle.get())) {
            firstError = Status::error(ErrorKind::OTHER,
                                       "failed to add transfer: " + multi->getLastError());
            return;
        }
        ++summary.attempts;
        active.push_back(std::move(slot));
    };

    // 完了した転送の結果を処理する
    auto completeSlot = [&](const CompletedTransfer& done) {
        auto it = std::find_if(active.begin(), active.end(),
                               [&](const std::unique_ptr<Slot>& s) {
                                   return s->handle.get() == done.handle;
                               });
        if (it == active.end()) return;

        std::unique_ptr<Slot> slot = std::move(*it);
        active.erase(it);
        multi->removeHandle(slot->handle.get());

        const SegmentOutcome outcome = slot->transfer->finish(
            done.result, slot->handle->getHttpResponseCode(),
            done.result == TransportResult::OK ? std::string()
                                               : slot->handle->getLastError());
        if (outcome.ok()) {
            const Status committed = commits.markCompleted(slot->index);
            if (!committed.isOk() && firstError.isOk()) {
                SEGDL_LOG_ERROR(TAG, committed.message());
                firstError = committed;
            }
            return;
        }
        if (outcome.kind == ErrorKind::ABORTED) {
            aborted = true;
            return;
        }

        if (outcome.throttled()) {
            ++summary.throttleEvents;
        } else {
            ++summary.errorEvents;
        }
        const RetryDecision decision =
            request.retryPolicy.decide(slot->attempt, outcome.kind);
        if (decision.retry) {
            ++summary.retries;
            SEGDL_LOG_WARN(TAG, outcome.message << "; retry " << slot->attempt << "/"
                                << request.retryPolicy.maxAttempts << " in "
                                << decision.delay.count() << " ms");
            retries.push({Clock::now() + decision.delay, slot->index, slot->attempt + 1});
            return;
        }
        if (firstError.isOk()) {
            SEGDL_LOG_ERROR(TAG, outcome.message);
            firstError = Status::error(outcome.kind, outcome.message);
        }
    };

    for (;;) {
        // イベントループ 1 周ごとに中断を確認する
        if (aborted || (request.abort && request.abort->isAborted())) {
            aborted = true;
            break;
        }

        // スロット補充: 未試行 → 期限の来たリトライ
        while (firstError.isOk() && active.size() < capacity) {
            if (!pending.empty()) {
                const size_t index = pending.front();
                pending.pop_front();
                startSlot(index, 1);
            } else if (!retries.empty() && retries.top().deadline <= Clock::now()) {
                const RetryEntry entry = retries.top();
                retries.pop();
                startSlot(entry.index, entry.attempt);
            } else {
                break;
            }
        }
        if (!firstError.isOk()) {
            break;
        }

        if (active.empty()) {
            if (retries.empty()) {
                break; // すべて完了
            }
            // 次のリトライ期限まで待つ (中断されたら即座に戻る)
            if (request.abort) {
                request.abort->waitFor(untilDeadline(retries, request.pollInterval));
            } else {
                std::this_thread::sleep_for(untilDeadline(retries, request.pollInterval));
            }
            continue;
        }

        int running = 0;
        if (!multi->perform(running)) {
            firstError = Status::error(ErrorKind::OTHER,
                                       "event loop failed: " + multi->getLastError());
            break;
        }
        for (const auto& done : multi->readCompleted()) {
            completeSlot(done);
        }
        if (!firstError.isOk()) {
            break;
        }

        if (!active.empty()) {
            // スロットが埋まっている間は期限切れのリトライを開始できないので
            // リトライ期限ではなく I/O か pollInterval まで待つ
            const std::chrono::milliseconds wait =
                active.size() < capacity ? untilDeadline(retries, request.pollInterval)
                                         : std::max(request.pollInterval,
                                                    std::chrono::milliseconds(1));
            if (!multi->poll(wait)) {
                firstError = Status::error(ErrorKind::OTHER,
                                           "event loop wait failed: " + multi->getLastError());
                break;
            }
        }
    }

    // 実行中の転送は待たずに破棄する
    for (auto& slot : active) {
        multi->removeHandle(slot->handle.get());
    }
    active.clear();
    const Status flushed = commits.flush();
    if (!flushed.isOk() && firstError.isOk()) {
        firstError = flushed;
    }

    if (!firstError.isOk()) {
        return firstError;
    }
    if (bitmap.allCompleted()) {
        return Status::ok();
    }
    if (aborted) {
        return Status::error(ErrorKind::ABORTED, "transfer aborted by request");
    }
    return Status::error(ErrorKind::OTHER, "transfer ended with incomplete segments");
}

// =============================================================================
// バックエンド選択
// =============================================================================

std::unique_ptr<IDownloadBackend> makeBackend(BackendKind kind,
                                              HttpHandleFactory handleFactory,
                                              MultiHandleFactory multiFactory) {
    switch (kind) {
    case BackendKind::MULTIPLEXED:
        return std::make_unique<MultiplexedBackend>(std::move(multiFactory));
    case BackendKind::THREADED:
        break;
    }
    return std::make_unique<ThreadedBackend>(std::move(handleFactory));
}

} // namespace SegmentedDownloader
