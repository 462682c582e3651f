// =============================================================================
// ConnectionBudget.cpp
// =============================================================================

#include "ConnectionBudget.h"
#include "JobControl.h"

#include <algorithm>

namespace SegmentedDownloader {

ConnectionBudget::ConnectionBudget(size_t maxTotal, size_t maxPerHost)
    : maxTotal_(maxTotal), maxPerHost_(maxPerHost) {}

size_t ConnectionBudget::acquireHost(const std::string& host, size_t requested) {
    std::lock_guard<std::mutex> lock(hostsMutex_);
    auto& slot = hosts_[host];
    if (!slot) {
        slot = std::make_unique<std::atomic<size_t>>(0);
    }
    const size_t granted = tryAcquire(*slot, maxPerHost_, requested);
    if (slot->load(std::memory_order_acquire) == 0) {
        hosts_.erase(host);
    }
    return granted;
}

void ConnectionBudget::releaseHost(const std::string& host, size_t count) {
    std::lock_guard<std::mutex> lock(hostsMutex_);
    auto it = hosts_.find(host);
    if (it == hosts_.end()) return;
    releaseFloor(*it->second, count);
    // 使用中の接続がなくなったホストは保持しない
    if (it->second->load(std::memory_order_acquire) == 0) {
        hosts_.erase(it);
    }
}

size_t ConnectionBudget::tryAcquire(std::atomic<size_t>& counter, size_t limit,
                                    size_t requested) {
    size_t current = counter.load(std::memory_order_acquire);
    for (;;) {
        const size_t available = current < limit ? limit - current : 0;
        const size_t take      = std::min(requested, available);
        if (take == 0) {
            return 0;
        }
        if (counter.compare_exchange_weak(current, current + take,
                                          std::memory_order_acq_rel,
                                          std::memory_order_acquire)) {
            return take;
        }
    }
}

void ConnectionBudget::releaseFloor(std::atomic<size_t>& counter, size_t count) {
    size_t current = counter.load(std::memory_order_acquire);
    for (;;) {
        const size_t next = current > count ? current - count : 0;
        if (counter.compare_exchange_weak(current, next,
                                          std::memory_order_acq_rel,
                                          std::memory_order_acquire)) {
            return;
        }
    }
}

size_t ConnectionBudget::reserve(const std::string& host, size_t requested) {
    if (requested == 0) return 0;

    const size_t global = tryAcquire(total_, maxTotal_, requested);
    if (global == 0) return 0;

    const size_t granted = acquireHost(host, global);
    if (granted < global) {
        // ホスト側で足りなかった分は全体へ戻す
        releaseFloor(total_, global - granted);
        released_.notify_all();
    }
    return granted;
}

size_t ConnectionBudget::reserveWait(const std::string& host, size_t requested,
                                     const AbortToken* abort,
                                     std::chrono::milliseconds pollInterval) {
    for (;;) {
        if (abort && abort->isAborted()) {
            return 0;
        }
        const size_t granted = reserve(host, requested);
        if (granted > 0) {
            return granted;
        }
        std::unique_lock<std::mutex> lock(waitMutex_);
        released_.wait_for(lock, pollInterval);
    }
}

void ConnectionBudget::release(const std::string& host, size_t count) {
    if (count == 0) return;
    releaseHost(host, count);
    releaseFloor(total_, count);
    {
        // 待機側が wait に入る前に通知が失われないようロックを経由する
        std::lock_guard<std::mutex> lock(waitMutex_);
    }
    released_.notify_all();
}

size_t ConnectionBudget::inUse() const {
    return total_.load(std::memory_order_acquire);
}

size_t ConnectionBudget::inUse(const std::string& host) const {
    std::lock_guard<std::mutex> lock(hostsMutex_);
    auto it = hosts_.find(host);
    if (it == hosts_.end()) return 0;
    return it->second->load(std::memory_order_acquire);
}

size_t ConnectionBudget::trackedHosts() const {
    std::lock_guard<std::mutex> lock(hostsMutex_);
    return hosts_.size();
}

} // namespace SegmentedDownloader
