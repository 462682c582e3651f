// =============================================================================
// ProgressTracker.cpp
// =============================================================================

#include "ProgressTracker.h"

namespace SegmentedDownloader {

double ProgressStats::bytesPerSecond() const {
    if (elapsed.count() <= 0) return 0.0;
    return static_cast<double>(bytesDone + bytesInFlight) * 1000.0 /
           static_cast<double>(elapsed.count());
}

double ProgressStats::etaSeconds() const {
    const double rate = bytesPerSecond();
    if (totalBytes < 0 || rate <= 0.0) return -1.0;
    const int64_t remaining = totalBytes - bytesDone - bytesInFlight;
    return remaining > 0 ? static_cast<double>(remaining) / rate : 0.0;
}

double ProgressStats::fraction() const {
    if (totalBytes < 0) return -1.0;
    if (totalBytes == 0) return 1.0;
    return static_cast<double>(bytesDone + bytesInFlight) /
           static_cast<double>(totalBytes);
}

ProgressTracker::ProgressTracker(std::vector<Segment> segments)
    : segments_(std::move(segments))
    , startedAt_(std::chrono::steady_clock::now()) {
    counters_.reserve(segments_.size());
    for (size_t i = 0; i < segments_.size(); ++i) {
        counters_.push_back(std::make_shared<std::atomic<int64_t>>(0));
    }
}

std::shared_ptr<std::atomic<int64_t>> ProgressTracker::counter(size_t index) const {
    if (index >= counters_.size()) {
        return std::make_shared<std::atomic<int64_t>>(0);
    }
    return counters_[index];
}

ProgressStats ProgressTracker::snapshot(const SegmentBitmap& bitmap) const {
    ProgressStats stats;
    stats.segmentCount = segments_.size();
    stats.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - startedAt_);

    bool lengthKnown = true;
    int64_t total    = 0;
    for (size_t i = 0; i < segments_.size(); ++i) {
        const Segment& seg = segments_[i];
        if (!seg.hasKnownEnd()) {
            lengthKnown = false;
        } else {
            total += seg.length();
        }

        if (bitmap.isCompleted(i)) {
            ++stats.segmentsDone;
            stats.bytesDone += seg.hasKnownEnd()
                                   ? seg.length()
                                   : counters_[i]->load(std::memory_order_relaxed);
        } else {
            stats.bytesInFlight += counters_[i]->load(std::memory_order_relaxed);
        }
    }
    stats.totalBytes = lengthKnown ? total : -1;
    return stats;
}

int64_t ProgressTracker::transferredBytes() const {
    int64_t sum = 0;
    for (const auto& c : counters_) {
        sum += c->load(std::memory_order_relaxed);
    }
    return sum;
}

} // namespace SegmentedDownloader
