#pragma once
// =============================================================================
// MetadataProber.h
// リモートリソースのメタデータ取得
//
// 1. HEAD (リダイレクト追跡)
// 2. HEAD が拒否された (>= 400) か長さが不明な場合は GET Range: bytes=0-0
//    206 なら Content-Range の total から長さと Range 対応を得る
//    200 なら Content-Length から長さを得る (本文は最初のチャンクで受信拒否する)
// =============================================================================

#include "EngineConfig.h"
#include "IHttpHandle.h"
#include "Status.h"

#include <cstdint>
#include <optional>
#include <string>

namespace SegmentedDownloader {

/// プローブ結果
struct RemoteMetadata {
    std::optional<int64_t>     contentLength;
    bool                       acceptRanges = false;
    std::optional<std::string> etag;         ///< 引用符を外した値 (弱いタグは "W/" 付き)
    std::optional<std::string> lastModified;
    std::optional<std::string> contentDisposition;
    std::string                effectiveUrl; ///< プローブに使った URL

    /// 識別子 (強い ETag > 弱い ETag > Last-Modified)
    std::optional<std::string> identityTag() const;
};

class MetadataProber {
public:
    MetadataProber(HttpHandleFactory factory, HttpOptions options);

    /// @brief メタデータを取得する
    /// @param out 成功時のみ有効
    Status probe(const std::string& url, const HeaderList& headers,
                 RemoteMetadata& out) const;

private:
    /// HEAD による取得。status はレスポンスコード
    TransportResult probeHead(const std::string& url, const HeaderList& headers,
                              RemoteMetadata& out, long& status,
                              std::string& error) const;

    /// GET Range: bytes=0-0 による取得
    Status probeRangeGet(const std::string& url, const HeaderList& headers,
                         RemoteMetadata& out) const;

    HttpHandleFactory factory_;
    HttpOptions       options_;
};

} // namespace SegmentedDownloader
