#pragma once
// =============================================================================
// ProgressTracker.h
// 表示用の進捗統計 (正しさの判断には使わない)
//
// 各セグメントの受信バイト数は転送中のコールバックと完了後の検査で共有するため、
// shared_ptr<atomic<int64_t>> で保持する
// =============================================================================

#include "Segment.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <vector>

namespace SegmentedDownloader {

/// 進捗スナップショット
struct ProgressStats {
    int64_t                   bytesDone     = 0; ///< 完了セグメントの合計
    int64_t                   bytesInFlight = 0; ///< 転送中セグメントの受信済み
    int64_t                   totalBytes    = -1; ///< 不明なら -1
    std::chrono::milliseconds elapsed{0};
    size_t                    segmentsDone  = 0;
    size_t                    segmentCount  = 0;

    double bytesPerSecond() const;

    /// 残り秒数 (算出できない場合は -1)
    double etaSeconds() const;

    /// 0.0〜1.0 (不明なら -1.0)
    double fraction() const;
};

class ProgressTracker {
public:
    explicit ProgressTracker(std::vector<Segment> segments);

    ProgressTracker(const ProgressTracker&)            = delete;
    ProgressTracker& operator=(const ProgressTracker&) = delete;

    /// @brief セグメント index の受信カウンター
    std::shared_ptr<std::atomic<int64_t>> counter(size_t index) const;

    /// @brief ビットマップと受信カウンターから統計を作る
    ProgressStats snapshot(const SegmentBitmap& bitmap) const;

    /// 今回の実行で実際に受信したバイト数
    int64_t transferredBytes() const;

private:
    std::vector<Segment>                               segments_;
    std::vector<std::shared_ptr<std::atomic<int64_t>>> counters_;
    std::chrono::steady_clock::time_point              startedAt_;
};

} // namespace SegmentedDownloader
