#pragma once
// =============================================================================
// SegmentTransfer.h
// 1 セグメント 1 試行分の転送処理 (両バックエンド共通)
//
//  - 事前検証: 本文の最初のバイトを書く前に、最終レスポンスのステータスと
//    Content-Range を検査する。不一致なら 0 バイトのまま転送を中断する
//  - 書き込み失敗: ストレージ例外を保持して即座に中断し STORAGE として返す
//  - 事後検証: 書き込んだバイト数がセグメント長と一致しなければ PARTIAL_TRANSFER
// =============================================================================

#include "EngineConfig.h"
#include "IHttpHandle.h"
#include "JobControl.h"
#include "ResponseHeaders.h"
#include "Segment.h"
#include "Status.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace SegmentedDownloader {

class StorageWriter;

/// 1 試行の結果
struct SegmentOutcome {
    ErrorKind   kind = ErrorKind::NONE;
    std::string message;
    long        httpCode     = 0;
    int64_t     bytesWritten = 0;

    bool ok() const { return kind == ErrorKind::NONE; }

    /// 429/503 による失敗か
    bool throttled() const;
};

class SegmentTransfer {
public:
    /// @param rangeRequest false の場合は Range を付けずに全体を取得する
    /// @param written      受信バイト数の共有カウンター (0 にリセットされる)
    SegmentTransfer(size_t index, Segment segment, StorageWriter& storage,
                    bool rangeRequest,
                    std::shared_ptr<const AbortToken> abort,
                    std::shared_ptr<std::atomic<int64_t>> written);

    SegmentTransfer(const SegmentTransfer&)            = delete;
    SegmentTransfer& operator=(const SegmentTransfer&) = delete;

    /// @brief ハンドルに URL・Range・コールバックを設定する
    /// ハンドルより先に破棄しないこと (コールバックが this を参照する)
    void configure(IHttpHandle& handle, const std::string& url,
                   const HeaderList& headers, const HttpOptions& options);

    /// @brief 設定済みハンドルで同期的に転送する
    SegmentOutcome run(IHttpHandle& handle);

    /// @brief 転送終了後に結果を判定する
    SegmentOutcome finish(TransportResult result, long httpCode,
                          const std::string& transportError);

    // ハンドルから呼ばれるコールバック
    void   onHeaderLine(const std::string& line);
    size_t onBody(const char* data, size_t size);
    int    onProgress() const;

    size_t index() const { return index_; }
    const Segment& segment() const { return segment_; }
    int64_t bytesWritten() const { return written_->load(std::memory_order_acquire); }

private:
    /// 検証による拒否理由
    enum class Rejection {
        NONE,
        HTTP_STATUS, ///< 4xx/5xx などのエラーステータス
        PROTOCOL     ///< Range 要求に対する不正な応答
    };

    /// 最終レスポンスのヘッダーを検査する (1 回だけ)
    bool validate();

    size_t                                index_;
    Segment                               segment_;
    StorageWriter&                        storage_;
    bool                                  rangeRequest_;
    std::shared_ptr<const AbortToken>     abort_;
    std::shared_ptr<std::atomic<int64_t>> written_;

    ResponseHeaders headers_;
    bool            validated_ = false;
    bool            accepted_  = false;
    Rejection       rejection_ = Rejection::NONE;
    std::string     rejectReason_;
    bool            storageFailed_ = false;
    std::string     storageError_;
};

} // namespace SegmentedDownloader
