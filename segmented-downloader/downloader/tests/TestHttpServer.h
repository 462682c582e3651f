#pragma once
// =============================================================================
// TestHttpServer.h
// 結合テスト用のループバック HTTP/1.1 サーバ
//
// - 127.0.0.1 の空きポートで待ち受け、接続ごとにスレッドで応答する
// - HEAD / GET と単一の Range (bytes=a-b, bytes=a-) に対応
// - 1 リクエストごとに Connection: close で切断する
// =============================================================================

#include <algorithm>
#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstdint>
#include <cstring>
#include <mutex>
#include <string>
#include <system_error>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace SegmentedDownloader {
namespace Test {

class TestHttpServer {
public:
    /// @param path 配信するパス (例: "/data/file.bin")
    TestHttpServer(std::string path, std::string body)
        : path_(std::move(path)), body_(std::move(body)) {}

    ~TestHttpServer() { stop(); }

    TestHttpServer(const TestHttpServer&)            = delete;
    TestHttpServer& operator=(const TestHttpServer&) = delete;

    /// @brief 待ち受けを開始する
    /// @throws std::system_error ソケットを用意できない場合
    void start() {
        listenFd_ = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        if (listenFd_ < 0) {
            throw std::system_error(errno, std::generic_category(), "socket");
        }
        const int one = 1;
        ::setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

        sockaddr_in addr{};
        addr.sin_family      = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port        = 0;
        socklen_t len        = sizeof(addr);
        if (::bind(listenFd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::listen(listenFd_, 32) != 0 ||
            ::getsockname(listenFd_, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            const int err = errno;
            ::close(listenFd_);
            listenFd_ = -1;
            throw std::system_error(err, std::generic_category(), "bind/listen");
        }
        port_ = ntohs(addr.sin_port);

        running_.store(true);
        acceptThread_ = std::thread(&TestHttpServer::acceptLoop, this);
    }

    void stop() {
        if (!running_.exchange(false)) {
            return;
        }
        if (acceptThread_.joinable()) {
            acceptThread_.join();
        }
        std::vector<std::thread> clients;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            clients.swap(clients_);
        }
        for (auto& t : clients) {
            if (t.joinable()) t.join();
        }
        ::close(listenFd_);
        listenFd_ = -1;
    }

    std::string url() const {
        return "http://127.0.0.1:" + std::to_string(port_) + path_;
    }

    size_t getCount() const { return getCount_.load(); }
    size_t rangeGetCount() const { return rangeGetCount_.load(); }

private:
    void acceptLoop() {
        while (running_.load()) {
            pollfd pfd{listenFd_, POLLIN, 0};
            if (::poll(&pfd, 1, 50) <= 0) {
                continue;
            }
            const int client = ::accept4(listenFd_, nullptr, nullptr, SOCK_CLOEXEC);
            if (client < 0) {
                continue;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            clients_.emplace_back([this, client]() {
                serve(client);
                ::close(client);
            });
        }
    }

    void serve(int fd) {
        std::string request;
        char chunk[1024];
        while (request.find("\r\n\r\n") == std::string::npos) {
            pollfd pfd{fd, POLLIN, 0};
            if (::poll(&pfd, 1, 2000) <= 0) return;
            const ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
            if (n <= 0) return;
            request.append(chunk, static_cast<size_t>(n));
        }

        const size_t lineEnd = request.find("\r\n");
        const std::string requestLine = request.substr(0, lineEnd);
        const size_t sp1 = requestLine.find(' ');
        const size_t sp2 = requestLine.find(' ', sp1 + 1);
        if (sp1 == std::string::npos || sp2 == std::string::npos) {
            sendAll(fd, "HTTP/1.1 400 Bad Request\r\nContent-Length: 0\r\n"
                        "Connection: close\r\n\r\n");
            return;
        }
        const std::string method = requestLine.substr(0, sp1);
        const std::string target = requestLine.substr(sp1 + 1, sp2 - sp1 - 1);
        const bool head = method == "HEAD";

        if (target != path_) {
            sendAll(fd, "HTTP/1.1 404 Not Found\r\nContent-Length: 9\r\n"
                        "Connection: close\r\n\r\nnot found");
            return;
        }

        const int64_t size = static_cast<int64_t>(body_.size());
        int64_t first = -1;
        int64_t last  = -1;
        parseRange(request, first, last);
        if (!head) {
            getCount_.fetch_add(1);
            if (first >= 0) rangeGetCount_.fetch_add(1);
        }

        std::string response;
        std::string payload;
        if (first >= 0 && !head) {
            if (first >= size) {
                sendAll(fd, "HTTP/1.1 416 Range Not Satisfiable\r\n"
                            "Content-Range: bytes */" + std::to_string(size) +
                            "\r\nContent-Length: 0\r\nConnection: close\r\n\r\n");
                return;
            }
            if (last < 0 || last >= size) last = size - 1;
            payload  = body_.substr(static_cast<size_t>(first),
                                    static_cast<size_t>(last - first + 1));
            response = "HTTP/1.1 206 Partial Content\r\n"
                       "Content-Range: bytes " + std::to_string(first) + "-" +
                       std::to_string(last) + "/" + std::to_string(size) + "\r\n";
        } else {
            payload  = head ? std::string() : body_;
            response = "HTTP/1.1 200 OK\r\n";
        }
        response += "Content-Length: " +
                    std::to_string(head ? size : static_cast<int64_t>(payload.size())) +
                    "\r\nAccept-Ranges: bytes\r\nETag: \"integration\"\r\n"
                    "Content-Type: application/octet-stream\r\n"
                    "Connection: close\r\n\r\n";
        sendAll(fd, response);
        if (!head) sendAll(fd, payload);
    }

    /// "Range: bytes=a-b" を解釈する (大文字小文字を区別しない)
    static void parseRange(const std::string& request, int64_t& first, int64_t& last) {
        std::string lower = request;
        std::transform(lower.begin(), lower.end(), lower.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        const size_t pos = lower.find("\r\nrange: bytes=");
        if (pos == std::string::npos) return;
        const size_t start = pos + std::strlen("\r\nrange: bytes=");
        const size_t end   = lower.find("\r\n", start);
        const std::string rangeValue = request.substr(start, end - start);
        const size_t dash = rangeValue.find('-');
        if (dash == std::string::npos || dash == 0) return;
        first = std::stoll(rangeValue.substr(0, dash));
        if (dash + 1 < rangeValue.size()) {
            last = std::stoll(rangeValue.substr(dash + 1));
        }
    }

    static void sendAll(int fd, const std::string& data) {
        size_t done = 0;
        while (done < data.size()) {
            const ssize_t n = ::send(fd, data.data() + done, data.size() - done, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                return; // クライアントが切断した
            }
            done += static_cast<size_t>(n);
        }
    }

    std::string              path_;
    std::string              body_;
    int                      listenFd_ = -1;
    uint16_t                 port_     = 0;
    std::atomic<bool>        running_{false};
    std::thread              acceptThread_;
    std::mutex               mutex_;
    std::vector<std::thread> clients_;
    std::atomic<size_t>      getCount_{0};
    std::atomic<size_t>      rangeGetCount_{0};
};

} // namespace Test
} // namespace SegmentedDownloader
