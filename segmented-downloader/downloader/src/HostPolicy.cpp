// =============================================================================
// HostPolicy.cpp
// =============================================================================

#include "HostPolicy.h"
#include "Log.h"
#include "UrlUtil.h"

#include <algorithm>

namespace SegmentedDownloader {

namespace {

constexpr size_t  INITIAL_SEGMENTS   = 4;
constexpr size_t  MAX_ADAPTIVE       = 16;
constexpr double  FAST_BYTES_PER_SEC = 1024.0 * 1024.0;

} // namespace

void HostPolicy::recordRangeSupport(const std::string& url, bool supported) {
    std::lock_guard<std::mutex> lock(mutex_);
    hosts_[hostKeyFor(url)].rangeSupport = supported;
}

void HostPolicy::recordOutcome(const std::string& url, const JobOutcome& outcome) {
    const std::string key = hostKeyFor(url);
    std::lock_guard<std::mutex> lock(mutex_);
    Entry& entry = hosts_[key];
    const size_t current = entry.segments.value_or(INITIAL_SEGMENTS);

    size_t next = current;
    if (outcome.throttleEvents > 0 || outcome.errorEvents > 0) {
        next = std::max<size_t>(1, current / 2);
    } else if (outcome.duration.count() > 0) {
        const double seconds = static_cast<double>(outcome.duration.count()) / 1000.0;
        const double rate    = static_cast<double>(outcome.bytes) / seconds;
        if (rate >= FAST_BYTES_PER_SEC) {
            next = std::min(MAX_ADAPTIVE, current * 2);
        }
    }

    if (next != current) {
        SEGDL_LOG_DEBUG("HostPolicy", key << " segments " << current << " -> " << next);
    }
    entry.segments = next;
}

std::optional<bool> HostPolicy::rangeSupport(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hosts_.find(hostKeyFor(url));
    if (it == hosts_.end()) return std::nullopt;
    return it->second.rangeSupport;
}

std::optional<size_t> HostPolicy::recommendedSegments(const std::string& url) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = hosts_.find(hostKeyFor(url));
    if (it == hosts_.end()) return std::nullopt;
    return it->second.segments;
}

} // namespace SegmentedDownloader
