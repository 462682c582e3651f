#pragma once
// =============================================================================
// IJobObserver.h
// ジョブ実行の通知を受け取るオブザーバーインターフェース
// Observer パターンによりUIや上位モジュールへの疎結合な通知を実現する
// =============================================================================

#include "IJobStore.h"
#include "ProgressTracker.h"
#include "Status.h"

namespace SegmentedDownloader {

/// @brief ジョブのイベントを受け取るオブザーバーインターフェース
/// コールバックはジョブを実行しているスレッドから発火されることに注意。
class IJobObserver {
public:
    virtual ~IJobObserver() = default;

    /// @brief 状態遷移通知 (RUNNING / PAUSED / ERROR / COMPLETED)
    virtual void onStateChanged(JobId id, JobState state) = 0;

    /// @brief 進捗通知 (ビットマップ永続化ごとと終了時)
    virtual void onProgress(JobId id, const ProgressStats& stats) = 0;

    /// @brief エラー通知 (ERROR 遷移の直前に呼ばれる)
    virtual void onError(JobId id, const Status& error) = 0;
};

} // namespace SegmentedDownloader
