#pragma once
// =============================================================================
// RetryPolicy.h
// セグメント転送失敗の分類とリトライ判定
// =============================================================================

#include "IHttpHandle.h"
#include "Status.h"

#include <chrono>
#include <cstdint>

namespace SegmentedDownloader {

/// リトライ判定結果
struct RetryDecision {
    bool                      retry = false;
    std::chrono::milliseconds delay{0};
};

/// @brief 指数バックオフによるリトライポリシー
/// delay = min(baseDelay * 2^(attempt-1), maxDelay)
struct RetryPolicy {
    uint32_t                  maxAttempts = 5;
    std::chrono::milliseconds baseDelay{250};
    std::chrono::milliseconds maxDelay{30000};

    /// @brief attempt 回目 (1 始まり) の失敗後にリトライするか判定する
    RetryDecision decide(uint32_t attempt, ErrorKind kind) const;

    /// @brief attempt 回目の失敗後の待機時間
    std::chrono::milliseconds backoff(uint32_t attempt) const;
};

/// @brief HTTP ステータスを分類する
/// 408/429/5xx は CONNECTION、その他の 4xx は OTHER
ErrorKind classifyHttpStatus(long httpCode);

/// @brief 429/503 (サーバ側の流量制限)
bool isThrottleStatus(long httpCode);

/// @brief トランスポート結果を分類する (OK 以外を渡すこと)
ErrorKind classifyTransport(TransportResult result);

} // namespace SegmentedDownloader
