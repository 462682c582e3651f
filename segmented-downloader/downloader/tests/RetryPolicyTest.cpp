// =============================================================================
// RetryPolicyTest.cpp
// リトライ判定とエラー分類のテスト
// =============================================================================

#include "RetryPolicy.h"

#include <gtest/gtest.h>

using namespace SegmentedDownloader;
using std::chrono::milliseconds;

/// 待機時間は 2 倍ずつ伸び、上限で頭打ちになる
TEST(RetryPolicyTest, Backoff_DoublesUntilCap) {
    RetryPolicy policy;
    policy.baseDelay = milliseconds(100);
    policy.maxDelay  = milliseconds(1000);

    EXPECT_EQ(policy.backoff(1), milliseconds(100));
    EXPECT_EQ(policy.backoff(2), milliseconds(200));
    EXPECT_EQ(policy.backoff(3), milliseconds(400));
    EXPECT_EQ(policy.backoff(4), milliseconds(800));
    EXPECT_EQ(policy.backoff(5), milliseconds(1000));
    EXPECT_EQ(policy.backoff(60), milliseconds(1000));
}

/// 接続系と途中切断は試行回数の上限までリトライする
TEST(RetryPolicyTest, TransientKinds_RetriedUntilMaxAttempts) {
    RetryPolicy policy;
    policy.maxAttempts = 3;

    EXPECT_TRUE(policy.decide(1, ErrorKind::CONNECTION).retry);
    EXPECT_TRUE(policy.decide(2, ErrorKind::PARTIAL_TRANSFER).retry);
    EXPECT_FALSE(policy.decide(3, ErrorKind::CONNECTION).retry);
    EXPECT_EQ(policy.decide(2, ErrorKind::CONNECTION).delay, policy.backoff(2));
}

/// 致命的な分類はリトライしない
TEST(RetryPolicyTest, FatalKinds_NeverRetried) {
    RetryPolicy policy;
    for (ErrorKind kind : {ErrorKind::PROTOCOL_VIOLATION, ErrorKind::STORAGE,
                           ErrorKind::REMOTE_CHANGED, ErrorKind::ABORTED,
                           ErrorKind::OTHER}) {
        EXPECT_FALSE(policy.decide(1, kind).retry) << toString(kind);
    }
}

/// 408/429/5xx は一時的、その他の 4xx は致命的
TEST(RetryPolicyTest, HttpStatus_Classified) {
    EXPECT_EQ(classifyHttpStatus(408), ErrorKind::CONNECTION);
    EXPECT_EQ(classifyHttpStatus(429), ErrorKind::CONNECTION);
    EXPECT_EQ(classifyHttpStatus(500), ErrorKind::CONNECTION);
    EXPECT_EQ(classifyHttpStatus(503), ErrorKind::CONNECTION);
    EXPECT_EQ(classifyHttpStatus(404), ErrorKind::OTHER);
    EXPECT_EQ(classifyHttpStatus(403), ErrorKind::OTHER);

    EXPECT_TRUE(isThrottleStatus(429));
    EXPECT_TRUE(isThrottleStatus(503));
    EXPECT_FALSE(isThrottleStatus(500));
}

/// トランスポート結果の分類
TEST(RetryPolicyTest, TransportResult_Classified) {
    EXPECT_EQ(classifyTransport(TransportResult::TIMEOUT), ErrorKind::CONNECTION);
    EXPECT_EQ(classifyTransport(TransportResult::NETWORK_ERROR), ErrorKind::CONNECTION);
    EXPECT_EQ(classifyTransport(TransportResult::PARTIAL_FILE), ErrorKind::PARTIAL_TRANSFER);
    EXPECT_EQ(classifyTransport(TransportResult::RANGE_NOT_SATISFIED),
              ErrorKind::PROTOCOL_VIOLATION);
    EXPECT_EQ(classifyTransport(TransportResult::TOO_MANY_REDIRECTS), ErrorKind::OTHER);
}
