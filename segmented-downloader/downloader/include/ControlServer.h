#pragma once
// =============================================================================
// ControlServer.h
// 外部プロセスから pause/cancel を受け付ける Unix ドメインソケットサーバ
//
// プロトコル: 1 行 1 コマンド ("pause <id>\n" / "cancel <id>\n")
// 応答:       "ok\n" / "unknown job\n" / "bad command\n"
//
// スレッドモデル:
//   - リスナースレッド : poll でリスナーと全クライアントを多重化し、
//     届いた行を JobControl へ中継する。無言のクライアントが他の
//     クライアントの応答を遅らせることはない
//   - 一定時間無通信のクライアントは切断する
//   - stop() / デストラクタでスレッドを終了しソケットファイルを削除する
// =============================================================================

#include "JobControl.h"

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace SegmentedDownloader {

class ControlServer {
public:
    explicit ControlServer(JobControl& control);

    /// @brief デストラクタ - stop() を保証 (RAII)
    ~ControlServer();

    ControlServer(const ControlServer&)            = delete;
    ControlServer& operator=(const ControlServer&) = delete;

    /// @brief socketPath で待ち受けを開始する
    /// @throws std::system_error bind/listen に失敗した場合
    void start(const std::string& socketPath);

    void stop();

    bool isRunning() const { return running_.load(std::memory_order_acquire); }

private:
    /// 接続中のクライアント
    struct Client {
        int                                   fd = -1;
        std::string                           buffer; ///< 未完成の行
        std::chrono::steady_clock::time_point lastActivity;
    };

    void acceptLoop();
    void acceptClient(std::vector<Client>& clients);

    /// @return false: 切断すべきクライアント
    bool serveClient(Client& client);

    JobControl&       control_;
    std::string       socketPath_;
    int               listenFd_{-1};
    std::atomic<bool> running_{false};
    std::thread       thread_;
};

/// @brief 制御コマンドを送信して応答行を返す
/// @throws std::system_error 接続・送受信に失敗した場合
std::string sendControlCommand(const std::string& socketPath,
                               const std::string& command,
                               std::chrono::milliseconds timeout = std::chrono::seconds(5));

} // namespace SegmentedDownloader
