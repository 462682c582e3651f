#pragma once
// =============================================================================
// JobControl.h
// 実行中ジョブへの pause/cancel 要求を中継するコントロールプレーン
//
// 各ジョブは実行中だけ AbortToken をジョブ ID で登録する
// ジョブストアを渡した場合、QUEUED または登録前の RUNNING のジョブへの
// 要求は保留され、registerJob 時に新しいトークンへ適用される
// 外部からの要求はトークンのフラグを立てるだけで、スレッドを強制停止しない
// バックエンドは一定間隔でフラグを確認し、新しいセグメントを開始しなくなる
// =============================================================================

#include "IJobStore.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace SegmentedDownloader {

/// 外部から届く制御信号
enum class ControlSignal {
    NONE,
    PAUSE,
    CANCEL
};

const char* toString(ControlSignal signal);

/// @brief 協調的な中断フラグ
/// 親トークンを持つ場合、親が中断されると子も中断扱いになる
class AbortToken {
public:
    AbortToken() = default;
    explicit AbortToken(std::shared_ptr<const AbortToken> parent)
        : parent_(std::move(parent)) {}

    AbortToken(const AbortToken&)            = delete;
    AbortToken& operator=(const AbortToken&) = delete;

    /// @brief 中断を要求する
    void abort(ControlSignal signal = ControlSignal::CANCEL);

    bool isAborted() const;

    /// 最初に受け取った信号 (親の信号は含まない)
    ControlSignal signal() const { return signal_.load(std::memory_order_acquire); }

    /// @brief duration だけ待機する。中断されたら即座に戻る
    /// @return true: 中断された / false: 時間経過
    bool waitFor(std::chrono::milliseconds duration) const;

private:
    std::shared_ptr<const AbortToken> parent_;
    std::atomic<bool>                 aborted_{false};
    std::atomic<ControlSignal>        signal_{ControlSignal::NONE};

    mutable std::mutex                mutex_;
    mutable std::condition_variable   cv_;
};

/// パース済みの制御コマンド
struct ControlCommand {
    ControlSignal signal = ControlSignal::NONE;
    JobId         jobId  = 0;
};

/// @brief "pause <id>" / "cancel <id>" を解析する
std::optional<ControlCommand> parseControlCommand(const std::string& line);

/// @brief ジョブ ID → AbortToken のレジストリ
class JobControl {
public:
    /// @param store 未登録ジョブの状態確認に使う (nullptr なら保留しない)
    explicit JobControl(const IJobStore* store = nullptr) : store_(store) {}

    JobControl(const JobControl&)            = delete;
    JobControl& operator=(const JobControl&) = delete;

    /// @brief ジョブのトークンを登録する (既存なら置き換える)
    /// 保留中の信号があれば返すトークンは中断済みになっている
    std::shared_ptr<AbortToken> registerJob(JobId id);

    void unregisterJob(JobId id);

    /// @brief 実行中ジョブに中断を要求する
    /// 未登録でも実行待ち・開始直前のジョブなら信号を保留する
    /// @return false: 該当ジョブが実行中でも実行待ちでもない
    bool requestAbort(JobId id, ControlSignal signal);

    /// @brief 制御コマンド 1 行を処理し、応答文字列を返す
    /// "ok" / "unknown job" / "bad command"
    std::string handleCommand(const std::string& line);

    bool isRegistered(JobId id) const;

    /// @brief 登録待ちの信号 (無ければ NONE)
    ControlSignal pendingSignal(JobId id) const;

private:
    /// store_ 上でまだ開始していない、または登録前のジョブか
    bool awaitingRegistration(JobId id) const;

    const IJobStore*                              store_ = nullptr;
    mutable std::mutex                            mutex_;
    std::map<JobId, std::shared_ptr<AbortToken>> tokens_;
    std::map<JobId, ControlSignal>                pending_;
};

/// @brief スコープ終了時にトークンを登録解除する (RAII)
class JobRegistration {
public:
    JobRegistration(JobControl& control, JobId id)
        : control_(control), id_(id), token_(control.registerJob(id)) {}

    ~JobRegistration() { control_.unregisterJob(id_); }

    JobRegistration(const JobRegistration&)            = delete;
    JobRegistration& operator=(const JobRegistration&) = delete;

    const std::shared_ptr<AbortToken>& token() const { return token_; }

private:
    JobControl&                 control_;
    JobId                       id_;
    std::shared_ptr<AbortToken> token_;
};

} // namespace SegmentedDownloader
