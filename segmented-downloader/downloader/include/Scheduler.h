#pragma once
// =============================================================================
// Scheduler.h
// ジョブストアからジョブを取得して実行するスケジューラ
//
// スレッドモデル:
//   - runAll() は maxConcurrentJobs 本のスレッドを起動し、各スレッドが
//     キューが空になるまで claimNextQueued → JobExecutor::run を繰り返す
//   - 全ジョブで 1 つの ConnectionBudget を共有する
//
// 起動時に一度だけ recoverStaleRunning を呼んでから新しいジョブを受け付ける
// =============================================================================

#include "ConnectionBudget.h"
#include "EngineConfig.h"
#include "HostPolicy.h"
#include "IJobObserver.h"
#include "IJobStore.h"
#include "JobControl.h"
#include "JobExecutor.h"

#include <atomic>
#include <mutex>
#include <optional>

namespace SegmentedDownloader {

class Scheduler {
public:
    /// @brief 本番用コンストラクタ (CurlHandle / CurlMulti を使用)
    Scheduler(EngineConfig config, IJobStore& store, ConnectionBudget& budget,
              JobControl& control, IHostPolicy* hostPolicy = nullptr);

    /// @brief テスト用コンストラクタ (トランスポートを外部注入)
    Scheduler(EngineConfig config, IJobStore& store, ConnectionBudget& budget,
              JobControl& control, HttpHandleFactory handleFactory,
              MultiHandleFactory multiFactory, IHostPolicy* hostPolicy = nullptr);

    Scheduler(const Scheduler&)            = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    void addObserver(IJobObserver* observer) { executor_.addObserver(observer); }
    void removeObserver(IJobObserver* observer) { executor_.removeObserver(observer); }

    /// @brief RUNNING のまま残ったジョブを QUEUED に戻す (最初の 1 回のみ有効)
    /// @return 戻した件数
    size_t recover();

    /// @brief キューから 1 件取得して実行する
    /// @return 実行したジョブの最終状態 (キューが空なら nullopt)
    std::optional<JobState> runNext();

    /// @brief キューが空になるまで並列に実行する
    /// @return 実行したジョブ数
    size_t runAll();

private:
    void workerLoop(std::atomic<size_t>& executed);

    IJobStore&       store_;
    JobExecutor      executor_;
    size_t           maxConcurrentJobs_;
    std::once_flag   recoverOnce_;
    std::atomic<size_t> recovered_{0};
};

} // namespace SegmentedDownloader
