#pragma once
// =============================================================================
// MultiplexedBackend.h
// 単一スレッドのイベントループで複数の Range 転送を駆動するバックエンド
//
// スロット (同時転送数 = 確保済み接続枠) が空くたびに
//   (a) 未試行のセグメント
//   (b) リトライ待機が明けたセグメント (期限の早い順)
// の順で補充する。次の待機時間は最も近いリトライ期限までに制限する
// =============================================================================

#include "IDownloadBackend.h"

namespace SegmentedDownloader {

class MultiplexedBackend final : public IDownloadBackend {
public:
    explicit MultiplexedBackend(MultiHandleFactory factory);

    Status transfer(const TransferRequest& request,
                    SegmentBitmap& bitmap,
                    TransferSummary& summary) override;

private:
    MultiHandleFactory factory_;
};

} // namespace SegmentedDownloader
