// =============================================================================
// ControlServer.cpp
// =============================================================================

#include "ControlServer.h"
#include "Log.h"

#include <cerrno>
#include <chrono>
#include <cstring>
#include <system_error>
#include <vector>

#include <poll.h>
#include <sys/socket.h>
#include <sys/un.h>
#include <unistd.h>

namespace SegmentedDownloader {

namespace {

constexpr const char* TAG = "ControlServer";

/// stop 要求を確認する間隔
constexpr int ACCEPT_POLL_MS = 100;

/// 1 コマンド行の上限
constexpr size_t MAX_LINE = 256;

/// これ以上無通信のクライアントは切断する
constexpr std::chrono::seconds CLIENT_IDLE_TIMEOUT{30};

/// 同時に保持するクライアント数の上限
constexpr size_t MAX_CLIENTS = 32;

[[noreturn]] void throwErrno(const std::string& what) {
    throw std::system_error(errno, std::generic_category(), what);
}

sockaddr_un makeAddress(const std::string& path) {
    sockaddr_un addr{};
    addr.sun_family = AF_UNIX;
    if (path.size() >= sizeof(addr.sun_path)) {
        throw std::system_error(ENAMETOOLONG, std::generic_category(),
                                "socket path too long: " + path);
    }
    std::memcpy(addr.sun_path, path.c_str(), path.size() + 1);
    return addr;
}

/// fd が読み取り可能になるまで待つ
bool waitReadable(int fd, int timeoutMs) {
    pollfd pfd{fd, POLLIN, 0};
    int rc = 0;
    do {
        rc = ::poll(&pfd, 1, timeoutMs);
    } while (rc < 0 && errno == EINTR);
    return rc > 0;
}

void writeAll(int fd, const std::string& data) {
    size_t done = 0;
    while (done < data.size()) {
        const ssize_t n = ::send(fd, data.data() + done, data.size() - done, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                pollfd pfd{fd, POLLOUT, 0};
                if (::poll(&pfd, 1, ACCEPT_POLL_MS) > 0) continue;
            }
            throwErrno("send");
        }
        done += static_cast<size_t>(n);
    }
}

} // namespace

ControlServer::ControlServer(JobControl& control) : control_(control) {}

ControlServer::~ControlServer() {
    stop();
}

void ControlServer::start(const std::string& socketPath) {
    if (running_.load(std::memory_order_acquire)) {
        return;
    }

    const sockaddr_un addr = makeAddress(socketPath);
    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throwErrno("socket");
    }

    // 前回の異常終了で残ったソケットファイルを削除する
    ::unlink(socketPath.c_str());
    if (::bind(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0 ||
        ::listen(fd, 8) != 0) {
        const int err = errno;
        ::close(fd);
        throw std::system_error(err, std::generic_category(), "bind/listen " + socketPath);
    }

    socketPath_ = socketPath;
    listenFd_   = fd;
    running_.store(true, std::memory_order_release);
    thread_ = std::thread(&ControlServer::acceptLoop, this);
    SEGDL_LOG_INFO(TAG, "listening on " << socketPath_);
}

void ControlServer::stop() {
    if (!running_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }
    if (thread_.joinable()) {
        thread_.join();
    }
    if (listenFd_ >= 0) {
        ::close(listenFd_);
        listenFd_ = -1;
    }
    ::unlink(socketPath_.c_str());
}

void ControlServer::acceptLoop() {
    std::vector<Client> clients;

    while (running_.load(std::memory_order_acquire)) {
        std::vector<pollfd> fds;
        fds.reserve(clients.size() + 1);
        fds.push_back({listenFd_, POLLIN, 0});
        for (const auto& client : clients) {
            fds.push_back({client.fd, POLLIN, 0});
        }

        const int rc = ::poll(fds.data(), fds.size(), ACCEPT_POLL_MS);
        if (rc < 0 && errno != EINTR) {
            SEGDL_LOG_WARN(TAG, "poll failed: " << std::strerror(errno));
        }

        // fds[i + 1] が clients[i] に対応する (accept で増えた分は次の周回で見る)
        const auto now = std::chrono::steady_clock::now();
        std::vector<Client> alive;
        alive.reserve(clients.size() + 1);
        for (size_t i = 0; i < clients.size(); ++i) {
            Client& client = clients[i];
            bool keep = true;
            if (rc > 0 && (fds[i + 1].revents & (POLLIN | POLLHUP | POLLERR)) != 0) {
                client.lastActivity = now;
                try {
                    keep = serveClient(client);
                } catch (const std::system_error& e) {
                    SEGDL_LOG_WARN(TAG, "client error: " << e.what());
                    keep = false;
                }
            } else if (now - client.lastActivity > CLIENT_IDLE_TIMEOUT) {
                SEGDL_LOG_DEBUG(TAG, "closing idle client");
                keep = false;
            }
            if (keep) {
                alive.push_back(std::move(client));
            } else {
                ::close(client.fd);
            }
        }
        clients.swap(alive);

        if (rc > 0 && (fds[0].revents & POLLIN) != 0) {
            acceptClient(clients);
        }
    }

    for (const auto& client : clients) {
        ::close(client.fd);
    }
}

void ControlServer::acceptClient(std::vector<Client>& clients) {
    const int fd = ::accept4(listenFd_, nullptr, nullptr, SOCK_CLOEXEC | SOCK_NONBLOCK);
    if (fd < 0) {
        if (errno != EINTR && errno != EAGAIN && errno != EWOULDBLOCK) {
            SEGDL_LOG_WARN(TAG, "accept failed: " << std::strerror(errno));
        }
        return;
    }
    if (clients.size() >= MAX_CLIENTS) {
        SEGDL_LOG_WARN(TAG, "too many control clients, rejecting connection");
        ::close(fd);
        return;
    }
    clients.push_back({fd, std::string(), std::chrono::steady_clock::now()});
}

bool ControlServer::serveClient(Client& client) {
    char chunk[128];
    const ssize_t n = ::recv(client.fd, chunk, sizeof(chunk), 0);
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return true;
        throwErrno("recv");
    }
    if (n == 0) {
        return false; // クライアントが閉じた
    }
    client.buffer.append(chunk, static_cast<size_t>(n));

    size_t newline;
    while ((newline = client.buffer.find('\n')) != std::string::npos) {
        std::string line = client.buffer.substr(0, newline);
        client.buffer.erase(0, newline + 1);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        writeAll(client.fd, control_.handleCommand(line) + "\n");
    }
    if (client.buffer.size() > MAX_LINE) {
        writeAll(client.fd, "bad command\n");
        return false;
    }
    return true;
}

// =============================================================================
// クライアント
// =============================================================================

std::string sendControlCommand(const std::string& socketPath,
                               const std::string& command,
                               std::chrono::milliseconds timeout) {
    const sockaddr_un addr = makeAddress(socketPath);
    const int fd = ::socket(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (fd < 0) {
        throwErrno("socket");
    }

    // fd を確実に閉じるためのガード
    struct FdGuard {
        int fd;
        ~FdGuard() { ::close(fd); }
    } guard{fd};

    if (::connect(fd, reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) != 0) {
        throwErrno("connect " + socketPath);
    }
    writeAll(fd, command + "\n");

    std::string reply;
    char chunk[128];
    while (reply.find('\n') == std::string::npos) {
        if (!waitReadable(fd, static_cast<int>(timeout.count()))) {
            throw std::system_error(ETIMEDOUT, std::generic_category(),
                                    "no reply from " + socketPath);
        }
        const ssize_t n = ::recv(fd, chunk, sizeof(chunk), 0);
        if (n < 0) {
            if (errno == EINTR) continue;
            throwErrno("recv");
        }
        if (n == 0) break;
        reply.append(chunk, static_cast<size_t>(n));
    }
    const size_t newline = reply.find('\n');
    return newline == std::string::npos ? reply : reply.substr(0, newline);
}

} // namespace SegmentedDownloader
