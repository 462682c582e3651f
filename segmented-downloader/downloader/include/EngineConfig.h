#pragma once
// =============================================================================
// EngineConfig.h
// ダウンロードエンジンの動作パラメータ
// =============================================================================

#include "IHttpHandle.h"
#include "RetryPolicy.h"

#include <chrono>
#include <cstddef>
#include <string>

namespace SegmentedDownloader {

/// 転送バックエンドの種類
enum class BackendKind {
    THREADED,   ///< 1 接続 1 スレッド
    MULTIPLEXED ///< 単一スレッドのイベントループ
};

// =============================================================================
// HttpOptions: リクエスト共通の curl オプション
// =============================================================================
struct HttpOptions {
    long connectTimeoutSec = 30;     ///< 接続タイムアウト (秒)
    long timeoutSec        = 3600;   ///< 転送全体のタイムアウト (秒)
    long lowSpeedLimit     = 1024;   ///< これ未満 (B/s) が続いたら中断
    long lowSpeedTimeSec   = 60;
    bool followRedirects   = true;   ///< リダイレクトを追跡するか
    long maxRedirects      = 10;
    bool sslVerify         = true;   ///< SSL 証明書を検証するか
    std::string userAgent  = "segdl/1.0";
};

/// @brief ハンドルに共通オプションとカスタムヘッダーを適用する
void applyHttpOptions(IHttpHandle& handle, const HttpOptions& options,
                      const HeaderList& headers);

// =============================================================================
// EngineConfig
// =============================================================================
struct EngineConfig {
    size_t maxTotalConnections   = 64;  ///< 全ジョブ合計の同時接続数
    size_t maxConnectionsPerHost = 16;  ///< ホストごとの同時接続数
    size_t minSegments           = 4;
    size_t maxSegments           = 16;
    size_t maxConcurrentJobs     = 1;

    BackendKind backend = BackendKind::THREADED;

    size_t commitEvery  = 2;    ///< ビットマップ永続化をまとめる完了数
    bool   syncOnCommit = true; ///< ビットマップ永続化の前に fsync する

    bool forceRestart = false;  ///< リモート変更時に進捗を破棄して再計画する
    bool overwrite    = false;  ///< 既存の最終ファイルを上書きする
    std::string downloadDir = ".";

    RetryPolicy retry;
    HttpOptions http;
    HttpOptions probe{15, 30, 1024, 60, true, 10, true, "segdl/1.0"};

    /// 中断フラグ確認の最大間隔
    std::chrono::milliseconds controlPollInterval{100};
};

} // namespace SegmentedDownloader
