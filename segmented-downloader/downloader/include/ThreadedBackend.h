#pragma once
// =============================================================================
// ThreadedBackend.h
// ワーカースレッドごとに 1 接続を持つ転送バックエンド
//
// スレッドモデル:
//   - 呼び出し側スレッド : 結果を集約し、ビットマップを更新・永続化する
//   - ワーカースレッド   : 共有キューから未完了セグメントを取り出して転送する
//                          (リトライ・バックオフはワーカー内で行う)
// ワーカー数 = min(確保済み接続枠, 未完了セグメント数)
// =============================================================================

#include "IDownloadBackend.h"

namespace SegmentedDownloader {

class ThreadedBackend final : public IDownloadBackend {
public:
    explicit ThreadedBackend(HttpHandleFactory factory);

    Status transfer(const TransferRequest& request,
                    SegmentBitmap& bitmap,
                    TransferSummary& summary) override;

private:
    HttpHandleFactory factory_;
};

} // namespace SegmentedDownloader
