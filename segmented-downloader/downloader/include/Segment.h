#pragma once
// =============================================================================
// Segment.h
// セグメント分割と完了ビットマップ
//
// セグメントは半開区間 [start, end) で、先頭から連続・非重複に全体を覆う
// ビットマップはセグメント index ごとに 1 bit (LSB = セグメント 0)
// =============================================================================

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace SegmentedDownloader {

/// 長さ不明 (チャンク転送など) を表す end 値
constexpr int64_t kUnknownEnd = -1;

/// @brief バイト範囲 [start, end)
struct Segment {
    int64_t start = 0;
    int64_t end   = 0; ///< kUnknownEnd の場合は EOF まで

    bool hasKnownEnd() const { return end != kUnknownEnd; }

    /// 長さ (不明な場合は -1)
    int64_t length() const { return hasKnownEnd() ? end - start : -1; }

    /// Range ヘッダー値 "bytes=start-(end-1)"
    std::string rangeHeaderValue() const;

    bool operator==(const Segment& other) const {
        return start == other.start && end == other.end;
    }
};

/// @brief totalSize を segmentCount 個の範囲に分割する
/// 各セグメントは totalSize / segmentCount バイトで、余りは最後のセグメントが吸収する
/// @return totalSize == 0 または segmentCount == 0 の場合は空
std::vector<Segment> planSegments(int64_t totalSize, size_t segmentCount);

/// @brief セグメント数を決定する
/// @param hint ホストポリシーからの推奨値 (無い場合は minSegments)
/// @return [minSegments, maxSegments] に収め、totalSize 以下・1 以上にした値
size_t chooseSegmentCount(int64_t totalSize, size_t minSegments,
                          size_t maxSegments, std::optional<size_t> hint);

/// @brief セグメント完了ビットマップ
/// 永続化はバイト列 (長さ (n+7)/8) で行う
class SegmentBitmap {
public:
    SegmentBitmap() = default;
    explicit SegmentBitmap(size_t segmentCount);

    /// @brief 永続化されたバイト列から復元する
    /// 余分なバイトは無視し、不足分は未完了として扱う
    static SegmentBitmap fromBytes(const std::vector<uint8_t>& bytes,
                                   size_t segmentCount);

    std::vector<uint8_t> toBytes() const { return bits_; }

    void setCompleted(size_t index);
    bool isCompleted(size_t index) const;
    bool allCompleted() const;
    size_t completedCount() const;
    size_t segmentCount() const { return count_; }

    /// 全ビットを未完了に戻す
    void clear();

    bool operator==(const SegmentBitmap& other) const {
        return count_ == other.count_ && bits_ == other.bits_;
    }

private:
    size_t               count_ = 0;
    std::vector<uint8_t> bits_;
};

} // namespace SegmentedDownloader
