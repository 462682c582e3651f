#pragma once
// =============================================================================
// BackendSupport.h
// バックエンド実装間で共有する内部ヘルパー
// =============================================================================

#include "IDownloadBackend.h"
#include "ProgressTracker.h"
#include "SegmentTransfer.h"

#include <algorithm>
#include <vector>

namespace SegmentedDownloader {
namespace detail {

/// @brief 完了ビットを立て、commitEvery 件ごとに永続化する
/// 一度永続化に失敗すると以降は永続化せず、同じエラーを返し続ける
class CommitCoalescer {
public:
    CommitCoalescer(const TransferRequest& request, SegmentBitmap& bitmap)
        : request_(request), bitmap_(bitmap) {}

    Status markCompleted(size_t index) {
        bitmap_.setCompleted(index);
        if (++pending_ >= std::max<size_t>(1, request_.commitEvery)) {
            return flush();
        }
        return failure_;
    }

    /// 未永続化の完了があれば永続化する
    Status flush() {
        if (pending_ == 0 || !failure_.isOk()) return failure_;
        pending_ = 0;
        if (request_.onCommit) {
            failure_ = request_.onCommit(bitmap_);
        }
        return failure_;
    }

private:
    const TransferRequest& request_;
    SegmentBitmap&         bitmap_;
    size_t                 pending_ = 0;
    Status                 failure_;
};

/// ビットマップ上で未完了のセグメント index
inline std::vector<size_t> incompleteSegments(const TransferRequest& request,
                                              const SegmentBitmap& bitmap) {
    std::vector<size_t> indices;
    for (size_t i = 0; i < request.segments.size(); ++i) {
        if (!bitmap.isCompleted(i)) {
            indices.push_back(i);
        }
    }
    return indices;
}

/// セグメント index の受信カウンター (進捗トラッカーが無ければ単独のもの)
inline std::shared_ptr<std::atomic<int64_t>> counterFor(const TransferRequest& request,
                                                        size_t index) {
    if (request.progress) {
        return request.progress->counter(index);
    }
    return std::make_shared<std::atomic<int64_t>>(0);
}

} // namespace detail
} // namespace SegmentedDownloader
