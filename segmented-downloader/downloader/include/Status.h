#pragma once
// =============================================================================
// Status.h
// エンジン全体で共通のエラー分類と結果型
// バックエンド・プローブ・ジョブ実行の戻り値として使用する
// =============================================================================

#include <string>

namespace SegmentedDownloader {

/// 失敗の分類
enum class ErrorKind {
    NONE,               ///< 成功
    CONNECTION,         ///< タイムアウト・接続断・429/503/5xx (リトライ可)
    PROTOCOL_VIOLATION, ///< Range 要求に対する不正な応答 (致命的)
    STORAGE,            ///< ローカル I/O エラー (致命的)
    REMOTE_CHANGED,     ///< リモートリソースが変更された (強制再開が必要)
    PARTIAL_TRANSFER,   ///< 受信バイト数がセグメント長と不一致 (リトライ可)
    ABORTED,            ///< pause/cancel による中断 (エラーではない)
    OTHER               ///< その他の致命的エラー
};

/// @brief ErrorKind を表示用文字列に変換する
const char* toString(ErrorKind kind);

/// @brief リトライ対象の分類かどうか
/// PARTIAL_TRANSFER は接続断とみなして CONNECTION と同様に扱う
bool isRetryable(ErrorKind kind);

/// @brief 処理結果 (成功 or 分類付きエラー)
class Status {
public:
    Status() = default;

    static Status ok() { return Status(); }
    static Status error(ErrorKind kind, std::string message) {
        return Status(kind, std::move(message));
    }

    bool isOk() const { return kind_ == ErrorKind::NONE; }
    ErrorKind kind() const { return kind_; }
    const std::string& message() const { return message_; }

    /// "kind: message" 形式の文字列
    std::string toString() const;

private:
    Status(ErrorKind kind, std::string message)
        : kind_(kind), message_(std::move(message)) {}

    ErrorKind   kind_ = ErrorKind::NONE;
    std::string message_;
};

} // namespace SegmentedDownloader
