#pragma once
// =============================================================================
// JobExecutor.h
// 取得済み (RUNNING) のジョブ 1 件を最後まで実行する
//
// 処理順:
//   プローブ → レジューム検証 → ファイル名決定 → 分割計画 / ビットマップ読込
//   → 一時ファイル準備 → 接続枠確保 → バックエンド転送 → sync → 確定
//
// 終了状態:
//   COMPLETED : 全セグメント完了・最終名へ rename 済み
//   PAUSED    : pause/cancel による中断 (進捗は永続化済み)
//   ERROR     : 致命的エラー (ビットマップと一時ファイルは残す)
// =============================================================================

#include "ConnectionBudget.h"
#include "EngineConfig.h"
#include "HostPolicy.h"
#include "IHttpHandle.h"
#include "IJobObserver.h"
#include "IJobStore.h"
#include "IMultiHandle.h"
#include "JobControl.h"
#include "MetadataProber.h"

#include <memory>
#include <mutex>
#include <vector>

namespace SegmentedDownloader {

class StorageWriter;

class JobExecutor {
public:
    /// @param hostPolicy 任意 (nullptr の場合は既定のセグメント数を使う)
    JobExecutor(EngineConfig config, IJobStore& store, ConnectionBudget& budget,
                JobControl& control, HttpHandleFactory handleFactory,
                MultiHandleFactory multiFactory, IHostPolicy* hostPolicy = nullptr);

    JobExecutor(const JobExecutor&)            = delete;
    JobExecutor& operator=(const JobExecutor&) = delete;

    void addObserver(IJobObserver* observer);
    void removeObserver(IJobObserver* observer);

    /// @brief claimNextQueued で取得したジョブを実行する
    /// 実行中はジョブ ID で AbortToken を登録する
    /// @return 最終状態
    JobState run(const Job& job);

    const EngineConfig& config() const { return config_; }

private:
    JobState execute(const Job& job, const std::shared_ptr<AbortToken>& token);

    /// ERROR に遷移させて通知する
    JobState fail(JobId id, const Status& status);

    /// 状態を保存して通知する
    void transition(JobId id, JobState state);

    /// ビットマップを (sync 後に) 永続化し、進捗を通知する
    /// @return 永続化に失敗した場合は STORAGE
    Status commitProgress(JobId id, StorageWriter& storage, const SegmentBitmap& bitmap,
                        bool persistBitmap, const ProgressTracker& tracker);

    void notifyState(JobId id, JobState state);
    void notifyProgress(JobId id, const ProgressStats& stats);
    void notifyError(JobId id, const Status& status);

    EngineConfig       config_;
    IJobStore&         store_;
    ConnectionBudget&  budget_;
    JobControl&        control_;
    HttpHandleFactory  handleFactory_;
    MultiHandleFactory multiFactory_;
    IHostPolicy*       hostPolicy_;
    MetadataProber     prober_;

    mutable std::mutex         observerMutex_;
    std::vector<IJobObserver*> observers_;
};

} // namespace SegmentedDownloader
