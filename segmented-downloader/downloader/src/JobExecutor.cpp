// =============================================================================
// JobExecutor.cpp
// ジョブ 1 件の実行
// =============================================================================

#include "JobExecutor.h"
#include "IDownloadBackend.h"
#include "Log.h"
#include "ProgressTracker.h"
#include "ResumeValidator.h"
#include "Segment.h"
#include "StorageWriter.h"
#include "UrlUtil.h"

#include <algorithm>
#include <filesystem>
#include <system_error>

namespace SegmentedDownloader {

namespace fs = std::filesystem;

namespace {

constexpr const char* TAG = "Job";

} // namespace

JobExecutor::JobExecutor(EngineConfig config, IJobStore& store,
                         ConnectionBudget& budget, JobControl& control,
                         HttpHandleFactory handleFactory,
                         MultiHandleFactory multiFactory, IHostPolicy* hostPolicy)
    : config_(std::move(config))
    , store_(store)
    , budget_(budget)
    , control_(control)
    , handleFactory_(std::move(handleFactory))
    , multiFactory_(std::move(multiFactory))
    , hostPolicy_(hostPolicy)
    , prober_(handleFactory_, config_.probe) {}

// =============================================================================
// Observer 管理
// =============================================================================

void JobExecutor::addObserver(IJobObserver* observer) {
    if (!observer) return;
    std::lock_guard<std::mutex> lock(observerMutex_);
    auto it = std::find(observers_.begin(), observers_.end(), observer);
    if (it == observers_.end()) {
        observers_.push_back(observer);
    }
}

void JobExecutor::removeObserver(IJobObserver* observer) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    observers_.erase(
        std::remove(observers_.begin(), observers_.end(), observer),
        observers_.end());
}

// =============================================================================
// 実行
// =============================================================================

JobState JobExecutor::run(const Job& job) {
    JobRegistration registration(control_, job.id);

    // 例外はすべてここでキャッチして ERROR に変換する
    try {
        return execute(job, registration.token());
    } catch (const std::exception& e) {
        return fail(job.id, Status::error(ErrorKind::OTHER,
                                          std::string("unexpected exception: ") + e.what()));
    }
}

JobState JobExecutor::execute(const Job& job, const std::shared_ptr<AbortToken>& token) {
    const JobId id = job.id;
    SEGDL_LOG_INFO(TAG, "job " << id << " started: " << job.url);
    transition(id, JobState::RUNNING);

    // 開始前に届いていた pause/cancel は何も通信せずに反映する
    if (token->isAborted()) {
        SEGDL_LOG_INFO(TAG, "job " << id << " " << toString(token->signal())
                            << " requested before start");
        transition(id, JobState::PAUSED);
        return JobState::PAUSED;
    }

    // --------------------------------------------------------
    // (1) プローブ
    // --------------------------------------------------------
    RemoteMetadata remote;
    const Status probed = prober_.probe(job.url, job.settings.customHeaders, remote);
    if (!probed.isOk()) {
        return fail(id, probed);
    }
    if (hostPolicy_) {
        hostPolicy_->recordRangeSupport(job.url, remote.acceptRanges);
    }

    // --------------------------------------------------------
    // (2) レジューム検証
    //     変更を検出したら強制指定が無い限り何も触らずに止める
    // --------------------------------------------------------
    JobMetadata meta = job.metadata;
    const ResumeValidation validation = validateForResume(meta, remote);
    if (!validation.isValid()) {
        if (!config_.forceRestart) {
            return fail(id, Status::error(ErrorKind::REMOTE_CHANGED, validation.describe()));
        }
        SEGDL_LOG_WARN(TAG, "job " << id << ": " << validation.describe()
                            << "; restarting from scratch");
    }

    const bool segmented = remote.acceptRanges && remote.contentLength &&
                           *remote.contentLength > 0;
    const bool hasPlan   = meta.segmentCount > 0 && meta.totalSize.has_value();
    const bool replan    = !segmented || !hasPlan || config_.forceRestart ||
                           !validation.isValid();

    // --------------------------------------------------------
    // (3) ファイル名と上書き確認 (転送前に失敗させる)
    // --------------------------------------------------------
    const fs::path dir = job.settings.downloadDir.empty()
                             ? fs::path(config_.downloadDir)
                             : fs::path(job.settings.downloadDir);
    const std::string finalName = meta.finalFilename
                                      ? *meta.finalFilename
                                      : deriveFilename(job.url, remote.contentDisposition);
    const fs::path finalPath = dir / finalName;
    const fs::path tempPath  = StorageWriter::tempPathFor(finalPath);
    const bool overwrite     = job.settings.overwrite || config_.overwrite;

    std::error_code ec;
    if (!overwrite && fs::exists(finalPath, ec)) {
        return fail(id, Status::error(ErrorKind::STORAGE,
                                      "destination already exists: " + finalPath.string()));
    }
    fs::create_directories(dir, ec);
    if (ec) {
        return fail(id, Status::error(ErrorKind::STORAGE,
                                      "cannot create " + dir.string() + ": " + ec.message()));
    }

    // --------------------------------------------------------
    // (4) 分割計画 / ビットマップ読込
    // --------------------------------------------------------
    std::vector<Segment> segments;
    SegmentBitmap        bitmap;
    if (!segmented) {
        // Range 非対応 or 長さ不明: 分割しない単一ストリーム
        segments = {Segment{0, remote.contentLength ? *remote.contentLength : kUnknownEnd}};
        bitmap   = SegmentBitmap(1);
    } else if (replan) {
        const size_t count = chooseSegmentCount(
            *remote.contentLength, config_.minSegments, config_.maxSegments,
            hostPolicy_ ? hostPolicy_->recommendedSegments(job.url) : std::nullopt);
        segments = planSegments(*remote.contentLength, count);
        bitmap   = SegmentBitmap(segments.size());
    } else {
        segments = planSegments(*meta.totalSize, meta.segmentCount);
        bitmap   = SegmentBitmap::fromBytes(meta.completedBitmap, segments.size());
    }
    const int64_t totalSize = remote.contentLength.value_or(-1);

    // --------------------------------------------------------
    // (5) 一時ファイル
    // --------------------------------------------------------
    std::unique_ptr<StorageWriter> storage;
    try {
        auto createFresh = [&]() {
            bitmap.clear();
            storage = StorageWriter::create(tempPath);
            if (totalSize > 0) {
                storage->preallocate(totalSize);
            }
        };

        if (replan) {
            // 古いレイアウトの内容が新しい計画に混ざらないよう先に削除する
            fs::remove(tempPath, ec);
            createFresh();
        } else if (fs::exists(tempPath, ec)) {
            storage = StorageWriter::openExisting(tempPath);
            if (storage->size() != totalSize) {
                SEGDL_LOG_WARN(TAG, "job " << id << ": temp file size mismatch, restarting");
                storage.reset();
                createFresh();
            }
        } else {
            if (bitmap.completedCount() > 0) {
                SEGDL_LOG_WARN(TAG, "job " << id << ": temp file missing, restarting");
            }
            createFresh();
        }
    } catch (const std::system_error& e) {
        return fail(id, Status::error(ErrorKind::STORAGE, e.what()));
    }

    meta.finalFilename   = finalName;
    meta.tempFilename    = tempPath.filename().string();
    meta.totalSize       = remote.contentLength;
    meta.etag            = remote.etag;
    meta.lastModified    = remote.lastModified;
    meta.segmentCount    = segmented ? segments.size() : 0;
    meta.completedBitmap = segmented ? bitmap.toBytes() : std::vector<uint8_t>{};
    store_.updateMetadata(id, meta);

    const size_t remaining = segments.size() - bitmap.completedCount();
    SEGDL_LOG_INFO(TAG, "job " << id << ": " << finalName << ", "
                        << (segmented ? std::to_string(segments.size()) + " segments, " +
                                            std::to_string(remaining) + " remaining"
                                      : std::string("single stream")));

    // --------------------------------------------------------
    // (6) 接続枠 - スコープを抜けると必ず返却される
    // --------------------------------------------------------
    const std::string host = hostKeyFor(job.url);
    const size_t desired   = std::max<size_t>(
        1, std::min(config_.maxConnectionsPerHost, remaining));
    const size_t granted   = budget_.reserveWait(host, desired, token.get(),
                                                 config_.controlPollInterval);
    if (granted == 0) {
        SEGDL_LOG_INFO(TAG, "job " << id << " paused while waiting for connections");
        transition(id, JobState::PAUSED);
        return JobState::PAUSED;
    }
    BudgetReservation reservation(budget_, host, granted);

    // --------------------------------------------------------
    // (7) 転送
    // --------------------------------------------------------
    auto tracker = std::make_shared<ProgressTracker>(segments);

    TransferRequest request;
    request.url           = job.url;
    request.headers       = job.settings.customHeaders;
    request.segments      = segments;
    request.rangeRequests = segmented;
    request.storage       = storage.get();
    request.retryPolicy   = config_.retry;
    request.http          = config_.http;
    request.maxConcurrent = reservation.granted();
    request.abort         = token;
    request.commitEvery   = config_.commitEvery;
    request.progress      = tracker;
    request.pollInterval  = config_.controlPollInterval;
    request.onCommit      = [&](const SegmentBitmap& current) {
        return commitProgress(id, *storage, current, segmented, *tracker);
    };

    auto backend = makeBackend(config_.backend, handleFactory_, multiFactory_);
    TransferSummary summary;
    const auto started = std::chrono::steady_clock::now();
    const Status transferred = backend->transfer(request, bitmap, summary);

    if (hostPolicy_) {
        JobOutcome outcome;
        outcome.segmentCount   = segments.size();
        outcome.bytes          = tracker->transferredBytes();
        outcome.duration       = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        outcome.throttleEvents = summary.throttleEvents;
        outcome.errorEvents    = summary.errorEvents;
        hostPolicy_->recordOutcome(job.url, outcome);
    }

    if (transferred.kind() == ErrorKind::ABORTED) {
        SEGDL_LOG_INFO(TAG, "job " << id << " paused with "
                            << bitmap.completedCount() << "/" << segments.size()
                            << " segments complete");
        transition(id, JobState::PAUSED);
        return JobState::PAUSED;
    }
    if (!transferred.isOk()) {
        return fail(id, transferred);
    }

    // --------------------------------------------------------
    // (8) 確定
    // --------------------------------------------------------
    try {
        storage->sync();
        if (totalSize < 0) {
            meta.totalSize = tracker->transferredBytes();
        }
        meta.completedBitmap = segmented ? bitmap.toBytes() : std::vector<uint8_t>{};
        store_.updateMetadata(id, meta);
        storage->finalize(finalPath, overwrite);
    } catch (const std::system_error& e) {
        return fail(id, Status::error(ErrorKind::STORAGE, e.what()));
    }

    notifyProgress(id, tracker->snapshot(bitmap));
    SEGDL_LOG_INFO(TAG, "job " << id << " completed: " << finalPath.string());
    transition(id, JobState::COMPLETED);
    return JobState::COMPLETED;
}

// =============================================================================
// 状態遷移・永続化ヘルパー
// =============================================================================

JobState JobExecutor::fail(JobId id, const Status& status) {
    SEGDL_LOG_ERROR(TAG, "job " << id << " failed: " << status.toString());
    notifyError(id, status);
    try {
        store_.setState(id, JobState::ERROR);
    } catch (const std::exception& e) {
        SEGDL_LOG_ERROR(TAG, "job " << id << ": cannot record error state: " << e.what());
    }
    notifyState(id, JobState::ERROR);
    return JobState::ERROR;
}

void JobExecutor::transition(JobId id, JobState state) {
    store_.setState(id, state);
    notifyState(id, state);
}

Status JobExecutor::commitProgress(JobId id, StorageWriter& storage,
                                   const SegmentBitmap& bitmap, bool persistBitmap,
                                   const ProgressTracker& tracker) {
    if (persistBitmap) {
        // ビットが立った範囲は必ずディスク上に書き込み済みでなければならない
        try {
            if (config_.syncOnCommit) {
                storage.sync();
            }
            store_.updateBitmap(id, bitmap.toBytes());
        } catch (const std::exception& e) {
            return Status::error(ErrorKind::STORAGE,
                                 std::string("progress commit failed: ") + e.what());
        }
    }
    notifyProgress(id, tracker.snapshot(bitmap));
    return Status::ok();
}

// =============================================================================
// Observer 通知ヘルパー
// =============================================================================

void JobExecutor::notifyState(JobId id, JobState state) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    for (auto* obs : observers_) {
        obs->onStateChanged(id, state);
    }
}

void JobExecutor::notifyProgress(JobId id, const ProgressStats& stats) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    for (auto* obs : observers_) {
        obs->onProgress(id, stats);
    }
}

void JobExecutor::notifyError(JobId id, const Status& status) {
    std::lock_guard<std::mutex> lock(observerMutex_);
    for (auto* obs : observers_) {
        obs->onError(id, status);
    }
}

} // namespace SegmentedDownloader
