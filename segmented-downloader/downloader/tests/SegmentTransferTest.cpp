// =============================================================================
// SegmentTransferTest.cpp
// 1 セグメント転送の検証ロジックのテスト
// =============================================================================

#include "MockHttpHandle.h"
#include "SegmentTransfer.h"
#include "StorageWriter.h"

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <iterator>

using namespace SegmentedDownloader;
using namespace SegmentedDownloader::Test;
namespace fs = std::filesystem;

// =============================================================================
// テストフィクスチャ
// =============================================================================

class SegmentTransferTest : public ::testing::Test {
protected:
    static constexpr int64_t SIZE = 8192;

    void SetUp() override {
        tempPath_ = fs::temp_directory_path() /
                    ("segdl_transfer_" +
                     std::string(::testing::UnitTest::GetInstance()->current_test_info()->name()) +
                     ".part");
        storage_ = StorageWriter::create(tempPath_);
        storage_->preallocate(SIZE);

        cfg_.body      = makeBody(SIZE);
        cfg_.chunkSize = 1000;
    }

    void TearDown() override {
        storage_.reset();
        fs::remove(tempPath_);
    }

    /// segment を 1 回転送した結果
    SegmentOutcome runOnce(MockHttpServer& server, const Segment& segment,
                           bool rangeRequest = true,
                           std::shared_ptr<const AbortToken> abort = nullptr) {
        auto handle = server.factory()();
        SegmentTransfer transfer(0, segment, *storage_, rangeRequest, std::move(abort), nullptr);
        transfer.configure(*handle, "http://mock.example/file.bin", {}, HttpOptions{});
        return transfer.run(*handle);
    }

    std::string fileContent() {
        storage_->sync();
        std::ifstream in(tempPath_, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    fs::path                       tempPath_;
    std::unique_ptr<StorageWriter> storage_;
    MockServerConfig               cfg_;
};

/// 206 と一致する Content-Range なら正しい位置に書き込まれる
TEST_F(SegmentTransferTest, MatchingPartialContent_WritesAtOffset) {
    MockHttpServer server(cfg_);
    const Segment segment{2048, 4096};

    const SegmentOutcome outcome = runOnce(server, segment);
    EXPECT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_EQ(outcome.bytesWritten, 2048);
    EXPECT_EQ(outcome.httpCode, 206);
    EXPECT_EQ(fileContent().substr(2048, 2048), cfg_.body.substr(2048, 2048));
}

/// 302 → 206 のリダイレクトは最終レスポンスで判定される
TEST_F(SegmentTransferTest, RedirectThenPartial_Ok) {
    cfg_.redirectFirst = true;
    MockHttpServer server(cfg_);

    const SegmentOutcome outcome = runOnce(server, Segment{0, 1024});
    EXPECT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_EQ(outcome.httpCode, 206);
}

/// Range を無視した 200 は 1 バイトも書かずに PROTOCOL_VIOLATION
TEST_F(SegmentTransferTest, IgnoredRange_ProtocolViolationWithoutWriting) {
    MockHttpServer server(cfg_);
    server.injectFault(4096, Fault{FaultKind::IGNORE_RANGE});

    const SegmentOutcome outcome = runOnce(server, Segment{4096, 6144});
    EXPECT_EQ(outcome.kind, ErrorKind::PROTOCOL_VIOLATION);
    EXPECT_EQ(outcome.bytesWritten, 0);
    EXPECT_EQ(fileContent(), std::string(SIZE, '\0'));
}

/// Content-Range の位置が要求と違えば PROTOCOL_VIOLATION
TEST_F(SegmentTransferTest, MismatchedContentRange_ProtocolViolation) {
    MockHttpServer server(cfg_);
    server.injectFault(1024, Fault{FaultKind::WRONG_RANGE});

    const SegmentOutcome outcome = runOnce(server, Segment{1024, 2048});
    EXPECT_EQ(outcome.kind, ErrorKind::PROTOCOL_VIOLATION);
    EXPECT_EQ(outcome.bytesWritten, 0);
}

/// 途中で切断されたら PARTIAL_TRANSFER (リトライ可能)
TEST_F(SegmentTransferTest, Truncated_PartialTransfer) {
    MockHttpServer server(cfg_);
    server.injectFault(0, Fault{FaultKind::TRUNCATE});

    const SegmentOutcome outcome = runOnce(server, Segment{0, 4096});
    EXPECT_EQ(outcome.kind, ErrorKind::PARTIAL_TRANSFER);
    EXPECT_LT(outcome.bytesWritten, 4096);
    EXPECT_TRUE(isRetryable(outcome.kind));
}

/// 503 は CONNECTION で、スロットリングとして数えられる
TEST_F(SegmentTransferTest, ServiceUnavailable_ThrottledConnection) {
    MockHttpServer server(cfg_);
    server.injectFault(0, Fault{FaultKind::STATUS, 1, 503});

    const SegmentOutcome outcome = runOnce(server, Segment{0, 4096});
    EXPECT_EQ(outcome.kind, ErrorKind::CONNECTION);
    EXPECT_TRUE(outcome.throttled());
    EXPECT_EQ(outcome.bytesWritten, 0);
}

/// 書き込み失敗は STORAGE として即座に中断される
TEST_F(SegmentTransferTest, StorageFailure_ReportsStorage) {
    MockHttpServer server(cfg_);
    storage_->close();

    const SegmentOutcome outcome = runOnce(server, Segment{0, 4096});
    EXPECT_EQ(outcome.kind, ErrorKind::STORAGE);
    EXPECT_EQ(outcome.bytesWritten, 0);
}

/// 中断済みトークンでは ABORTED になり何も書かない
TEST_F(SegmentTransferTest, Aborted_ReportsAborted) {
    MockHttpServer server(cfg_);
    auto token = std::make_shared<AbortToken>();
    token->abort(ControlSignal::PAUSE);

    const SegmentOutcome outcome = runOnce(server, Segment{0, 4096}, true, token);
    EXPECT_EQ(outcome.kind, ErrorKind::ABORTED);
    EXPECT_EQ(outcome.bytesWritten, 0);
}

/// 単一ストリームは Range 無しの 200 を受け付ける
TEST_F(SegmentTransferTest, SingleStream_AcceptsFullResponse) {
    MockHttpServer server(cfg_);

    const SegmentOutcome outcome = runOnce(server, Segment{0, SIZE}, false);
    EXPECT_TRUE(outcome.ok()) << outcome.message;
    EXPECT_EQ(outcome.httpCode, 200);
    EXPECT_EQ(fileContent(), cfg_.body);

    const auto requests = server.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].first, -1);
}
