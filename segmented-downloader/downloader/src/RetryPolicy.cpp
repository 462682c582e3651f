// =============================================================================
// RetryPolicy.cpp
// =============================================================================

#include "RetryPolicy.h"

#include <algorithm>

namespace SegmentedDownloader {

namespace {

/// 2^8 倍でほぼ確実に maxDelay を超えるので指数を打ち切る
constexpr uint32_t MAX_BACKOFF_EXPONENT = 8;

} // namespace

RetryDecision RetryPolicy::decide(uint32_t attempt, ErrorKind kind) const {
    RetryDecision decision;
    if (!isRetryable(kind) || attempt >= maxAttempts) {
        return decision;
    }
    decision.retry = true;
    decision.delay = backoff(attempt);
    return decision;
}

std::chrono::milliseconds RetryPolicy::backoff(uint32_t attempt) const {
    const uint32_t exponent = std::min(attempt > 0 ? attempt - 1 : 0,
                                       MAX_BACKOFF_EXPONENT);
    const auto delay = baseDelay * (int64_t{1} << exponent);
    return std::min(delay, maxDelay);
}

ErrorKind classifyHttpStatus(long httpCode) {
    if (httpCode == 408 || httpCode == 429 ||
        (httpCode >= 500 && httpCode < 600)) {
        return ErrorKind::CONNECTION;
    }
    return ErrorKind::OTHER;
}

bool isThrottleStatus(long httpCode) {
    return httpCode == 429 || httpCode == 503;
}

ErrorKind classifyTransport(TransportResult result) {
    switch (result) {
    case TransportResult::OK:
        return ErrorKind::NONE;
    case TransportResult::TIMEOUT:
    case TransportResult::NETWORK_ERROR:
        return ErrorKind::CONNECTION;
    case TransportResult::PARTIAL_FILE:
        return ErrorKind::PARTIAL_TRANSFER;
    case TransportResult::RANGE_NOT_SATISFIED:
        return ErrorKind::PROTOCOL_VIOLATION;
    case TransportResult::ABORTED_BY_CALLBACK:
    case TransportResult::WRITE_ERROR:
    case TransportResult::TOO_MANY_REDIRECTS:
    case TransportResult::OTHER_ERROR:
        return ErrorKind::OTHER;
    }
    return ErrorKind::OTHER;
}

} // namespace SegmentedDownloader
