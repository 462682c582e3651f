#pragma once
// =============================================================================
// ResumeValidator.h
// 永続化済みメタデータと最新プローブ結果を比較し、レジュームの可否を判定する
// =============================================================================

#include "IJobStore.h"
#include "MetadataProber.h"

#include <string>

namespace SegmentedDownloader {

/// 判定結果
struct ResumeValidation {
    bool etagChanged         = false;
    bool lastModifiedChanged = false;
    bool sizeChanged         = false;

    /// 変更なし = 未完了セグメントのみ再取得してよい
    bool isValid() const { return !etagChanged && !lastModifiedChanged && !sizeChanged; }

    /// "remote resource changed (ETag, size); ..." 形式の説明
    std::string describe() const;
};

/// @brief 永続化済みメタデータが最新のリモートと一致するか判定する
/// 一度もプローブしていない (識別子もサイズも無い) ジョブは常に有効
ResumeValidation validateForResume(const JobMetadata& stored,
                                   const RemoteMetadata& fresh);

} // namespace SegmentedDownloader
