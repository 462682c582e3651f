#pragma once
// =============================================================================
// MockHttpHandle.h
// テスト用 IHttpHandle モック実装
//
// 設計方針:
//  - curl ネットワーク呼び出しを一切行わずに HTTP サーバの応答をシミュレートする
//  - MockHttpServer が「リモートリソース」を保持し、複数ハンドルから共有される
//  - perform() はヘッダー行 → 本文チャンクの順にコールバックへ送る
//  - Range 非対応・HEAD 拒否・リダイレクト・障害注入を設定で再現する
//  - 完全に制御可能なため、再現性のあるテストが書ける
// =============================================================================

#include "IHttpHandle.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace SegmentedDownloader {
namespace Test {

/// @brief サーバの振る舞い - テストケースごとに変える
struct MockServerConfig {
    std::string                body;
    std::optional<std::string> etag         = std::string("\"v1\"");
    std::optional<std::string> lastModified = std::string("Wed, 21 Oct 2015 07:28:00 GMT");
    std::optional<std::string> contentDisposition;

    bool headAllowed     = true;  ///< false: HEAD に 405 を返す
    bool advertiseLength = true;  ///< false: HEAD で Content-Length を返さない
    bool advertiseRanges = true;  ///< HEAD で Accept-Ranges: bytes を返すか
    bool supportRanges   = true;  ///< false: Range を無視して 200 で全体を返す
    bool redirectFirst   = false; ///< 全リクエストを一度 302 でリダイレクトする

    size_t chunkSize = 1024;      ///< 1回の write コールバックサイズ
    /// チャンク間のスリープ (テストを遅くしすぎないため小さくする)
    std::chrono::milliseconds chunkDelay{0};
};

/// 注入する障害の種類
enum class FaultKind {
    NETWORK,     ///< 接続失敗 (ヘッダー前)
    TRUNCATE,    ///< 本文の半分で接続断
    STATUS,      ///< 指定ステータスで応答
    WRONG_RANGE, ///< Content-Range の開始位置をずらす
    IGNORE_RANGE ///< Range を無視して 200 で全体を返す
};

struct Fault {
    FaultKind kind   = FaultKind::NETWORK;
    int       times  = 1;   ///< 何回発生させるか
    long      status = 503; ///< STATUS 用
};

/// 受け付けたリクエストの記録
struct RequestRecord {
    bool    head  = false;
    int64_t first = -1; ///< Range 無しなら -1
    int64_t last  = -1;
    HeaderList headers; ///< 送信されたカスタムヘッダー
};

class MockHttpServer;

/// @brief IHttpHandle のモック実装
class MockHttpHandle final : public IHttpHandle {
public:
    explicit MockHttpHandle(MockHttpServer& server) : server_(server) {}

    // -------------------------------------------------------------------------
    // IHttpHandle インターフェース実装
    // -------------------------------------------------------------------------

    void setUrl(const std::string& url) override { url_ = url; }

    void setRange(int64_t first, int64_t last) override {
        rangeFirst_ = first;
        rangeLast_  = first < 0 ? -1 : last;
    }

    void clearRange() override { rangeFirst_ = rangeLast_ = -1; }

    void setRequestHeaders(const HeaderList& headers) override { requestHeaders_ = headers; }
    void setNoBody(bool noBody) override { noBody_ = noBody; }

    void setWriteCallback(WriteCallback cb) override { writeCallback_ = std::move(cb); }
    void setHeaderCallback(HeaderCallback cb) override { headerCallback_ = std::move(cb); }
    void setProgressCallback(ProgressCallback cb) override { progressCallback_ = std::move(cb); }

    void setConnectTimeout(long seconds) override { connectTimeout_ = seconds; }
    void setTimeout(long /*seconds*/) override {}
    void setLowSpeedLimit(long /*bytesPerSec*/, long /*seconds*/) override {}
    void setUserAgent(const std::string& ua) override { userAgent_ = ua; }
    void setFollowLocation(bool follow, long /*maxRedirects*/) override { followLocation_ = follow; }
    void setSslVerify(bool /*verify*/) override {}

    /// @brief 仮想リクエストを実行する (定義は MockHttpServer の後)
    TransportResult perform() override;

    long getHttpResponseCode() const override { return httpCode_; }
    std::string getLastError() const override { return lastError_; }

    // -------------------------------------------------------------------------
    // 検証用アクセサ
    // -------------------------------------------------------------------------
    const HeaderList& requestHeaders() const { return requestHeaders_; }
    const std::string& userAgent() const { return userAgent_; }

private:
    void emitHeader(const std::string& line) {
        if (headerCallback_) headerCallback_(line);
    }

    MockHttpServer&  server_;
    std::string      url_;
    int64_t          rangeFirst_ = -1;
    int64_t          rangeLast_  = -1;
    bool             noBody_     = false;
    HeaderList       requestHeaders_;
    WriteCallback    writeCallback_;
    HeaderCallback   headerCallback_;
    ProgressCallback progressCallback_;
    long             connectTimeout_ = 0;
    std::string      userAgent_;
    bool             followLocation_ = false;
    long             httpCode_       = 0;
    std::string      lastError_;
};

/// @brief 複数ハンドルで共有する仮想リモートリソース (スレッドセーフ)
class MockHttpServer {
public:
    explicit MockHttpServer(MockServerConfig config = {}) : config_(std::move(config)) {}

    /// @brief このサーバに接続するハンドルのファクトリ
    HttpHandleFactory factory() {
        return [this]() -> std::unique_ptr<IHttpHandle> {
            return std::make_unique<MockHttpHandle>(*this);
        };
    }

    /// @brief 設定を書き換える (リモート変更の再現など)
    void update(const std::function<void(MockServerConfig&)>& fn) {
        std::lock_guard<std::mutex> lock(mutex_);
        fn(config_);
    }

    MockServerConfig snapshot() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return config_;
    }

    /// @brief first から始まる GET に障害を注入する (Range 無しは 0)
    void injectFault(int64_t first, Fault fault) {
        std::lock_guard<std::mutex> lock(mutex_);
        faults_[first] = fault;
    }

    /// @brief 本文チャンクを送るたびに呼ばれるフック (累計チャンク数)
    void setChunkHook(std::function<void(size_t)> hook) {
        std::lock_guard<std::mutex> lock(mutex_);
        chunkHook_ = std::move(hook);
    }

    // -------------------------------------------------------------------------
    // MockHttpHandle から呼ばれる
    // -------------------------------------------------------------------------

    std::optional<Fault> takeFault(int64_t first) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = faults_.find(first);
        if (it == faults_.end()) return std::nullopt;
        Fault fault = it->second;
        if (--it->second.times <= 0) {
            faults_.erase(it);
        }
        return fault;
    }

    void beginRequest(const RequestRecord& record) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(record);
        }
        // 同時接続数は本文を要求する GET だけを数える
        if (record.head) return;
        const int now = active_.fetch_add(1) + 1;
        int prev = maxActive_.load();
        while (now > prev && !maxActive_.compare_exchange_weak(prev, now)) {
        }
    }

    void endRequest(const RequestRecord& record) {
        if (!record.head) active_.fetch_sub(1);
    }

    void afterChunk() {
        std::function<void(size_t)> hook;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hook = chunkHook_;
        }
        const size_t n = chunks_.fetch_add(1) + 1;
        if (hook) hook(n);
    }

    // -------------------------------------------------------------------------
    // 検証用アクセサ（スレッドセーフ）
    // -------------------------------------------------------------------------

    std::vector<RequestRecord> requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

    /// 本文を要求した GET の Range 開始位置
    std::vector<int64_t> getStarts() const {
        std::vector<int64_t> starts;
        for (const auto& r : requests()) {
            if (!r.head) starts.push_back(r.first < 0 ? 0 : r.first);
        }
        std::sort(starts.begin(), starts.end());
        return starts;
    }

    size_t getCount() const {
        size_t n = 0;
        for (const auto& r : requests()) {
            if (!r.head) ++n;
        }
        return n;
    }

    /// GET の最大同時実行数
    int maxConcurrent() const { return maxActive_.load(); }

    void resetStats() {
        std::lock_guard<std::mutex> lock(mutex_);
        requests_.clear();
        maxActive_.store(0);
        chunks_.store(0);
    }

private:
    mutable std::mutex             mutex_;
    MockServerConfig               config_;
    std::map<int64_t, Fault>       faults_;
    std::function<void(size_t)>    chunkHook_;
    std::vector<RequestRecord>     requests_;
    std::atomic<int>               active_{0};
    std::atomic<int>               maxActive_{0};
    std::atomic<size_t>            chunks_{0};
};

// =============================================================================
// MockHttpHandle::perform
// =============================================================================

inline TransportResult MockHttpHandle::perform() {
    const MockServerConfig cfg = server_.snapshot();
    const int64_t size = static_cast<int64_t>(cfg.body.size());

    RequestRecord record;
    record.head  = noBody_;
    record.first = rangeFirst_;
    record.last  = rangeLast_;
    record.headers = requestHeaders_;
    server_.beginRequest(record);

    // スコープを抜けたら同時接続数を戻す
    struct EndGuard {
        MockHttpServer&      server;
        const RequestRecord& record;
        ~EndGuard() { server.endRequest(record); }
    } guard{server_, record};

    httpCode_ = 0;
    lastError_.clear();

    if (cfg.redirectFirst) {
        emitHeader("HTTP/1.1 302 Found\r\n");
        emitHeader("Location: /moved\r\n");
        emitHeader("Content-Length: 0\r\n");
        emitHeader("\r\n");
        if (!followLocation_) {
            httpCode_ = 302;
            return TransportResult::OK;
        }
    }

    auto emitIdentity = [&]() {
        if (cfg.etag) emitHeader("ETag: " + *cfg.etag + "\r\n");
        if (cfg.lastModified) emitHeader("Last-Modified: " + *cfg.lastModified + "\r\n");
        if (cfg.contentDisposition) {
            emitHeader("Content-Disposition: " + *cfg.contentDisposition + "\r\n");
        }
    };

    // ---------------- HEAD ----------------
    if (noBody_) {
        if (!cfg.headAllowed) {
            httpCode_ = 405;
            emitHeader("HTTP/1.1 405 Method Not Allowed\r\n");
            emitHeader("\r\n");
            return TransportResult::OK;
        }
        httpCode_ = 200;
        emitHeader("HTTP/1.1 200 OK\r\n");
        if (cfg.advertiseLength) emitHeader("Content-Length: " + std::to_string(size) + "\r\n");
        if (cfg.advertiseRanges) emitHeader("Accept-Ranges: bytes\r\n");
        emitIdentity();
        emitHeader("\r\n");
        return TransportResult::OK;
    }

    // ---------------- GET ----------------
    const std::optional<Fault> fault = server_.takeFault(rangeFirst_ < 0 ? 0 : rangeFirst_);
    if (fault && fault->kind == FaultKind::NETWORK) {
        lastError_ = "Failed to connect: Connection refused";
        return TransportResult::NETWORK_ERROR;
    }

    // エラーステータスは短い本文付きで返す (curl は 4xx/5xx でも OK を返す)
    auto errorResponse = [&](long status, const std::string& reason) {
        httpCode_ = status;
        const std::string text = reason + "\n";
        emitHeader("HTTP/1.1 " + std::to_string(status) + " " + reason + "\r\n");
        emitHeader("Content-Length: " + std::to_string(text.size()) + "\r\n");
        emitHeader("\r\n");
        if (writeCallback_ && writeCallback_(text.data(), text.size()) != text.size()) {
            return TransportResult::WRITE_ERROR;
        }
        return TransportResult::OK;
    };

    if (fault && fault->kind == FaultKind::STATUS) {
        return errorResponse(fault->status, "Injected");
    }

    const bool partial = rangeFirst_ >= 0 && cfg.supportRanges &&
                         !(fault && fault->kind == FaultKind::IGNORE_RANGE);
    int64_t first = 0;
    int64_t last  = size - 1;
    if (partial) {
        if (rangeFirst_ >= size) {
            return errorResponse(416, "Range Not Satisfiable");
        }
        first = rangeFirst_;
        last  = rangeLast_ < 0 ? size - 1 : std::min(rangeLast_, size - 1);
        const int64_t shown = (fault && fault->kind == FaultKind::WRONG_RANGE) ? first + 1 : first;
        httpCode_ = 206;
        emitHeader("HTTP/1.1 206 Partial Content\r\n");
        emitHeader("Content-Range: bytes " + std::to_string(shown) + "-" +
                   std::to_string(last) + "/" + std::to_string(size) + "\r\n");
    } else {
        httpCode_ = 200;
        emitHeader("HTTP/1.1 200 OK\r\n");
    }
    const int64_t length = last - first + 1;
    emitHeader("Content-Length: " + std::to_string(std::max<int64_t>(length, 0)) + "\r\n");
    if (cfg.supportRanges) emitHeader("Accept-Ranges: bytes\r\n");
    emitIdentity();
    emitHeader("\r\n");

    // 障害注入: 本文の半分で切断
    const int64_t deliver = (fault && fault->kind == FaultKind::TRUNCATE) ? length / 2 : length;

    int64_t sent = 0;
    while (sent < deliver) {
        if (progressCallback_ && progressCallback_(length, sent) != 0) {
            lastError_ = "Callback aborted";
            return TransportResult::ABORTED_BY_CALLBACK;
        }
        const size_t n = static_cast<size_t>(
            std::min<int64_t>(static_cast<int64_t>(cfg.chunkSize), deliver - sent));
        const char* data = cfg.body.data() + first + sent;
        if (writeCallback_ && writeCallback_(data, n) != n) {
            lastError_ = "Failure writing output to destination";
            return TransportResult::WRITE_ERROR;
        }
        sent += static_cast<int64_t>(n);
        server_.afterChunk();
        if (cfg.chunkDelay.count() > 0) {
            std::this_thread::sleep_for(cfg.chunkDelay);
        }
    }

    if (deliver < length) {
        lastError_ = "transfer closed with " + std::to_string(length - deliver) +
                     " bytes remaining to read";
        return TransportResult::PARTIAL_FILE;
    }
    if (progressCallback_ && progressCallback_(length, sent) != 0) {
        lastError_ = "Callback aborted";
        return TransportResult::ABORTED_BY_CALLBACK;
    }
    return TransportResult::OK;
}

/// テスト用の決定的な本文 (位置ごとに異なるバイト)
inline std::string makeBody(size_t size, unsigned seed = 7) {
    std::string body(size, '\0');
    uint32_t x = seed;
    for (size_t i = 0; i < size; ++i) {
        x = x * 1103515245u + 12345u;
        body[i] = static_cast<char>((x >> 16) & 0xFF);
    }
    return body;
}

} // namespace Test
} // namespace SegmentedDownloader
