#pragma once
// =============================================================================
// ConnectionBudget.h
// 全体・ホスト単位の同時接続数を制限する共有カウンター
//
// 複数ジョブが同時に reserve/release するため、カウンターは atomic の
// CAS ループで更新し、release は 0 未満に下がらない (ラップしない)
// ホスト単位のカウンターは使用中の間だけ保持し、0 に戻ると破棄する
// =============================================================================

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace SegmentedDownloader {

class AbortToken;

class ConnectionBudget {
public:
    ConnectionBudget(size_t maxTotal, size_t maxPerHost);

    ConnectionBudget(const ConnectionBudget&)            = delete;
    ConnectionBudget& operator=(const ConnectionBudget&) = delete;

    /// @brief 最大 requested 本の接続枠を確保する (ブロックしない)
    /// @return 実際に確保した本数 (全体・ホストの空きの小さい方, 0 もあり得る)
    size_t reserve(const std::string& host, size_t requested);

    /// @brief 1 本以上確保できるまで待機する
    /// @return 確保した本数。abort で中断された場合は 0
    size_t reserveWait(const std::string& host, size_t requested,
                       const AbortToken* abort,
                       std::chrono::milliseconds pollInterval);

    /// @brief 確保した枠を返却する
    void release(const std::string& host, size_t count);

    size_t inUse() const;
    size_t inUse(const std::string& host) const;
    /// @brief 接続を保持しているホストの数
    size_t trackedHosts() const;
    size_t maxTotal() const { return maxTotal_; }
    size_t maxPerHost() const { return maxPerHost_; }

private:
    /// hosts_ のロック下でホスト枠を確保/返却する
    size_t acquireHost(const std::string& host, size_t requested);
    void   releaseHost(const std::string& host, size_t count);

    /// counter を最大 requested (上限 limit) だけ増やし、増分を返す
    static size_t tryAcquire(std::atomic<size_t>& counter, size_t limit,
                             size_t requested);

    /// counter を count だけ減らす (0 で止める)
    static void releaseFloor(std::atomic<size_t>& counter, size_t count);

    const size_t        maxTotal_;
    const size_t        maxPerHost_;
    std::atomic<size_t> total_{0};

    mutable std::mutex  hostsMutex_; ///< hosts_ の参照・追加・削除用
    std::map<std::string, std::unique_ptr<std::atomic<size_t>>> hosts_;

    std::mutex              waitMutex_;
    std::condition_variable released_;
};

/// @brief 確保した接続枠をスコープ終了時に必ず返却する (RAII)
class BudgetReservation {
public:
    BudgetReservation(ConnectionBudget& budget, std::string host, size_t granted)
        : budget_(&budget), host_(std::move(host)), granted_(granted) {}

    ~BudgetReservation() {
        if (budget_ && granted_ > 0) {
            budget_->release(host_, granted_);
        }
    }

    BudgetReservation(const BudgetReservation&)            = delete;
    BudgetReservation& operator=(const BudgetReservation&) = delete;

    size_t granted() const { return granted_; }

private:
    ConnectionBudget* budget_;
    std::string       host_;
    size_t            granted_;
};

} // namespace SegmentedDownloader
