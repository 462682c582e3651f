#pragma once
// =============================================================================
// HostPolicy.h
// ホストごとの観測結果 (Range 対応・スループット・スロットリング) と
// セグメント数の推奨値
// =============================================================================

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace SegmentedDownloader {

/// 1 ジョブ分の転送結果
struct JobOutcome {
    size_t                    segmentCount   = 0;
    int64_t                   bytes          = 0;
    std::chrono::milliseconds duration{0};
    uint32_t                  throttleEvents = 0; ///< 429/503 の回数
    uint32_t                  errorEvents    = 0; ///< その他の失敗試行の回数
};

/// @brief ホストポリシーのインターフェース
/// 推奨値が無くてもオーケストレータは既定のヒューリスティックで動作する
class IHostPolicy {
public:
    virtual ~IHostPolicy() = default;

    virtual void recordRangeSupport(const std::string& url, bool supported) = 0;
    virtual void recordOutcome(const std::string& url, const JobOutcome& outcome) = 0;

    virtual std::optional<bool> rangeSupport(const std::string& url) const = 0;
    virtual std::optional<size_t> recommendedSegments(const std::string& url) const = 0;
};

/// @brief インメモリのホストポリシー
/// 推奨値は 4 から始め、制限・エラーなしで 1 MiB/s 以上なら 4→8→16 と増やし、
/// 制限やエラーがあれば半減する
class HostPolicy final : public IHostPolicy {
public:
    HostPolicy() = default;

    void recordRangeSupport(const std::string& url, bool supported) override;
    void recordOutcome(const std::string& url, const JobOutcome& outcome) override;
    std::optional<bool> rangeSupport(const std::string& url) const override;
    std::optional<size_t> recommendedSegments(const std::string& url) const override;

private:
    struct Entry {
        std::optional<bool>   rangeSupport;
        std::optional<size_t> segments;
    };

    mutable std::mutex           mutex_;
    std::map<std::string, Entry> hosts_;
};

} // namespace SegmentedDownloader
