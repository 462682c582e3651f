#pragma once
// =============================================================================
// UrlUtil.h
// URL からのホストキー・ファイル名の導出 (curl_url API を使用)
// =============================================================================

#include <optional>
#include <string>

namespace SegmentedDownloader {

/// 既定のファイル名
constexpr const char* kDefaultFilename = "download.bin";

/// @brief "scheme://host:port" 形式のホストキー
/// 解析できない URL はそのまま返す
std::string hostKeyFor(const std::string& url);

/// @brief Content-Disposition から filename を取り出す
/// filename*=UTF-8''... を filename= より優先する
std::optional<std::string> filenameFromContentDisposition(const std::string& value);

/// @brief パス区切り・制御文字を '_' に置換する
/// 空・"."・".." は kDefaultFilename になる
std::string sanitizeFilename(const std::string& name);

/// @brief 保存ファイル名を決める
/// Content-Disposition → URL パス末尾 (パーセントデコード) → kDefaultFilename
std::string deriveFilename(const std::string& url,
                           const std::optional<std::string>& contentDisposition);

} // namespace SegmentedDownloader
