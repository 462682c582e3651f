// =============================================================================
// Segment.cpp
// =============================================================================

#include "Segment.h"

#include <algorithm>

namespace SegmentedDownloader {

std::string Segment::rangeHeaderValue() const {
    if (!hasKnownEnd()) {
        return "bytes=" + std::to_string(start) + "-";
    }
    return "bytes=" + std::to_string(start) + "-" + std::to_string(end - 1);
}

std::vector<Segment> planSegments(int64_t totalSize, size_t segmentCount) {
    std::vector<Segment> segments;
    if (totalSize <= 0 || segmentCount == 0) {
        return segments;
    }

    // セグメント数がバイト数を超えると空セグメントができるので丸める
    const int64_t count = std::min<int64_t>(static_cast<int64_t>(segmentCount),
                                            totalSize);
    const int64_t base  = totalSize / count;

    segments.reserve(static_cast<size_t>(count));
    int64_t start = 0;
    for (int64_t i = 0; i < count; ++i) {
        const int64_t end = (i == count - 1) ? totalSize : start + base;
        segments.push_back(Segment{start, end});
        start = end;
    }
    return segments;
}

size_t chooseSegmentCount(int64_t totalSize, size_t minSegments,
                          size_t maxSegments, std::optional<size_t> hint) {
    const size_t lower = std::max<size_t>(1, minSegments);
    const size_t upper = std::max(lower, maxSegments);

    size_t count = std::clamp(hint.value_or(lower), lower, upper);
    if (totalSize > 0 && static_cast<int64_t>(count) > totalSize) {
        count = static_cast<size_t>(totalSize);
    }
    return std::max<size_t>(1, count);
}

// -----------------------------------------------------------------------------
// SegmentBitmap
// -----------------------------------------------------------------------------

SegmentBitmap::SegmentBitmap(size_t segmentCount)
    : count_(segmentCount)
    , bits_((segmentCount + 7) / 8, 0) {}

SegmentBitmap SegmentBitmap::fromBytes(const std::vector<uint8_t>& bytes,
                                       size_t segmentCount) {
    SegmentBitmap bitmap(segmentCount);
    const size_t n = std::min(bytes.size(), bitmap.bits_.size());
    std::copy(bytes.begin(), bytes.begin() + static_cast<std::ptrdiff_t>(n),
              bitmap.bits_.begin());

    // 最終バイトのセグメント数を超える bit は落とす
    const size_t tail = segmentCount % 8;
    if (tail != 0 && !bitmap.bits_.empty()) {
        bitmap.bits_.back() &= static_cast<uint8_t>((1u << tail) - 1);
    }
    return bitmap;
}

void SegmentBitmap::setCompleted(size_t index) {
    if (index >= count_) return;
    bits_[index / 8] |= static_cast<uint8_t>(1u << (index % 8));
}

bool SegmentBitmap::isCompleted(size_t index) const {
    if (index >= count_) return false;
    return (bits_[index / 8] & (1u << (index % 8))) != 0;
}

bool SegmentBitmap::allCompleted() const {
    return completedCount() == count_;
}

size_t SegmentBitmap::completedCount() const {
    size_t done = 0;
    for (size_t i = 0; i < count_; ++i) {
        if (isCompleted(i)) ++done;
    }
    return done;
}

void SegmentBitmap::clear() {
    std::fill(bits_.begin(), bits_.end(), 0);
}

} // namespace SegmentedDownloader
