// =============================================================================
// ControlServerTest.cpp
// Unix ドメインソケットによる制御チャネルのテスト
// =============================================================================

#include "ControlServer.h"
#include "JobControl.h"

#include <gtest/gtest.h>

#include <chrono>
#include <cstring>
#include <filesystem>
#include <string>
#include <system_error>

#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

using namespace SegmentedDownloader;
namespace fs = std::filesystem;

// =============================================================================
// テストフィクスチャ
// =============================================================================

class ControlServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        // sun_path の長さ制限があるため短いパスにする
        socketPath_ = (fs::temp_directory_path() /
                       ("segdl_" + std::to_string(::getpid()) + ".sock")).string();
        fs::remove(socketPath_);
    }

    void TearDown() override {
        fs::remove(socketPath_);
    }

    /// 接続だけして何も送らないクライアント
    int connectRaw() const {
        const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (fd < 0) return -1;
        sockaddr_un addr{};
        addr.sun_family = AF_UNIX;
        std::strncpy(addr.sun_path, socketPath_.c_str(), sizeof(addr.sun_path) - 1);
        if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
            ::close(fd);
            return -1;
        }
        return fd;
    }

    std::string socketPath_;
};

/// 登録中のジョブへの pause が ok で応答され、トークンが中断される
TEST_F(ControlServerTest, Pause_ReachesRegisteredJob) {
    JobControl control;
    ControlServer server(control);
    server.start(socketPath_);
    ASSERT_TRUE(server.isRunning());

    JobRegistration registration(control, 5);
    EXPECT_EQ(sendControlCommand(socketPath_, "pause 5"), "ok");
    EXPECT_TRUE(registration.token()->isAborted());
    EXPECT_EQ(registration.token()->signal(), ControlSignal::PAUSE);
}

/// 未知のジョブと不正なコマンドにはエラー応答を返す
TEST_F(ControlServerTest, UnknownAndMalformed_ErrorReplies) {
    JobControl control;
    ControlServer server(control);
    server.start(socketPath_);

    EXPECT_EQ(sendControlCommand(socketPath_, "cancel 99"), "unknown job");
    EXPECT_EQ(sendControlCommand(socketPath_, "stop everything"), "bad command");
}

/// 停止後はソケットファイルが削除され、接続できない
TEST_F(ControlServerTest, Stop_RemovesSocket) {
    JobControl control;
    ControlServer server(control);
    server.start(socketPath_);
    EXPECT_TRUE(fs::exists(socketPath_));

    server.stop();
    EXPECT_FALSE(server.isRunning());
    EXPECT_FALSE(fs::exists(socketPath_));
    EXPECT_THROW(sendControlCommand(socketPath_, "pause 1"), std::system_error);
}

/// 無言のまま接続を保持するクライアントがいても他のクライアントは即座に応答を得る
TEST_F(ControlServerTest, IdleClient_DoesNotBlockOthers) {
    JobControl control;
    ControlServer server(control);
    server.start(socketPath_);
    JobRegistration registration(control, 5);

    const int idle = connectRaw();
    ASSERT_GE(idle, 0);
    // 行の途中まで送って止まるクライアント
    const int partial = connectRaw();
    ASSERT_GE(partial, 0);
    ASSERT_EQ(::send(partial, "pau", 3, MSG_NOSIGNAL), 3);

    const auto started = std::chrono::steady_clock::now();
    EXPECT_EQ(sendControlCommand(socketPath_, "pause 5", std::chrono::seconds(2)), "ok");
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(1));
    EXPECT_TRUE(registration.token()->isAborted());

    ::close(idle);
    ::close(partial);
}

/// 1 つの接続で複数のコマンドを順に送れる
TEST_F(ControlServerTest, PersistentConnection_RepliesPerLine) {
    JobControl control;
    ControlServer server(control);
    server.start(socketPath_);
    JobRegistration registration(control, 7);

    const int fd = connectRaw();
    ASSERT_GE(fd, 0);
    const std::string commands = "cancel 99\ncancel 7\n";
    ASSERT_EQ(::send(fd, commands.data(), commands.size(), MSG_NOSIGNAL),
              static_cast<ssize_t>(commands.size()));

    std::string replies;
    char chunk[64];
    const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
    while (replies.size() < std::strlen("unknown job\nok\n") &&
           std::chrono::steady_clock::now() < deadline) {
        const ssize_t n = ::recv(fd, chunk, sizeof(chunk), MSG_DONTWAIT);
        if (n > 0) {
            replies.append(chunk, static_cast<size_t>(n));
        } else {
            ::usleep(5000);
        }
    }
    ::close(fd);

    EXPECT_EQ(replies, "unknown job\nok\n");
    EXPECT_EQ(registration.token()->signal(), ControlSignal::CANCEL);
}
