#pragma once
// =============================================================================
// ResponseHeaders.h
// レスポンスヘッダーの収集と解析
//
// リダイレクトチェーンでは 302 → 206 のように複数のレスポンスが届く
// 新しいステータス行 ("HTTP/") を受け取るたびに内容をリセットするため、
// 保持するのは常に最終レスポンスのヘッダーのみとなる
// =============================================================================

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace SegmentedDownloader {

/// Content-Range: bytes first-last/total
struct ContentRange {
    int64_t first = 0;
    int64_t last  = 0;  ///< 両端含む
    int64_t total = -1; ///< "*" の場合は -1
};

/// @brief "bytes a-b/total" を解析する
std::optional<ContentRange> parseContentRange(const std::string& value);

/// @brief ETag の前後の引用符を外す ("W/" は残す)
std::string normalizeEtag(const std::string& value);

class ResponseHeaders {
public:
    /// @brief ヘッダー行を 1 行追加する (CRLF 付きでも可)
    void addLine(const std::string& rawLine);

    /// 全ヘッダーとステータスを破棄する
    void reset();

    /// 最終レスポンスのステータスコード (未受信なら 0)
    long statusCode() const { return statusCode_; }

    /// 何らかのステータス行を受信済みか
    bool hasStatus() const { return statusCode_ != 0; }

    /// @brief ヘッダー値を取得する (名前は大文字小文字を区別しない)
    std::optional<std::string> get(const std::string& name) const;

    std::optional<int64_t> contentLength() const;
    std::optional<ContentRange> contentRange() const;
    bool acceptsByteRanges() const;
    std::optional<std::string> etag() const;
    std::optional<std::string> lastModified() const;
    std::optional<std::string> contentDisposition() const;

private:
    long                               statusCode_ = 0;
    std::map<std::string, std::string> fields_; ///< キーは小文字
};

} // namespace SegmentedDownloader
