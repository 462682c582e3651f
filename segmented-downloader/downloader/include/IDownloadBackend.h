#pragma once
// =============================================================================
// IDownloadBackend.h
// セグメント転送エンジンの共通契約
//
// ビットマップ上で未完了のセグメントだけを転送し、成功して戻った時点で
// 全ビットが立ち、対応する範囲がすべて書き込み済みであることを保証する
//
// 実装:
//   ThreadedBackend    - ワーカースレッドごとに 1 接続
//   MultiplexedBackend - 単一スレッドのイベントループで複数接続
// どちらを使うかは EngineConfig::backend で選択する
// =============================================================================

#include "EngineConfig.h"
#include "IHttpHandle.h"
#include "IMultiHandle.h"
#include "JobControl.h"
#include "RetryPolicy.h"
#include "Segment.h"
#include "Status.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace SegmentedDownloader {

class ProgressTracker;
class StorageWriter;

/// ビットマップ永続化コールバック (バックエンドを呼んだスレッドから呼ばれる)
/// 失敗を返した場合、バックエンドは転送を打ち切ってそのエラーを返す
using BitmapCommitFn = std::function<Status(const SegmentBitmap& bitmap)>;

/// 転送要求
struct TransferRequest {
    std::string          url;
    HeaderList           headers;
    std::vector<Segment> segments;
    bool                 rangeRequests = true; ///< false = 分割なしの単一ストリーム
    StorageWriter*       storage       = nullptr;
    RetryPolicy          retryPolicy;
    HttpOptions          http;
    size_t               maxConcurrent = 1;    ///< 確保済みの接続枠
    std::shared_ptr<const AbortToken> abort;   ///< ユーザーの pause/cancel
    size_t               commitEvery   = 2;    ///< 何件の完了ごとに永続化するか
    BitmapCommitFn       onCommit;
    std::shared_ptr<ProgressTracker> progress; ///< 任意
    std::chrono::milliseconds pollInterval{100}; ///< 中断フラグ確認の最大間隔
};

/// 転送中の統計 (ホストポリシー用)
struct TransferSummary {
    uint32_t attempts       = 0;
    uint32_t retries        = 0;
    uint32_t throttleEvents = 0;
    uint32_t errorEvents    = 0;
};

class IDownloadBackend {
public:
    virtual ~IDownloadBackend() = default;

    /// @brief 未完了セグメントを転送する
    /// @return 成功 / ABORTED (pause・cancel) / 致命的エラー
    virtual Status transfer(const TransferRequest& request,
                            SegmentBitmap& bitmap,
                            TransferSummary& summary) = 0;
};

/// @brief 設定に応じたバックエンドを生成する
std::unique_ptr<IDownloadBackend> makeBackend(BackendKind kind,
                                              HttpHandleFactory handleFactory,
                                              MultiHandleFactory multiFactory);

} // namespace SegmentedDownloader
