// =============================================================================
// CurlHandle.cpp
// libcurl をラップする本番実装
// =============================================================================

#include "CurlHandle.h"

#include <stdexcept>
#include <cstring>

namespace SegmentedDownloader {

// =============================================================================
// グローバル curl 初期化 (プロセス単位で一度だけ実施)
// =============================================================================

/// RAII でプロセス全体の curl グローバル状態を管理するクラス
class CurlGlobalInit {
public:
    CurlGlobalInit() {
        // curl_global_init はスレッドセーフではないため、
        // 静的初期化でプロセス開始時に一度だけ呼ぶ
        curl_global_init(CURL_GLOBAL_ALL);
    }
    ~CurlGlobalInit() {
        curl_global_cleanup();
    }
};

static CurlGlobalInit g_curlGlobalInit;

const char* toString(TransportResult result) {
    switch (result) {
    case TransportResult::OK:                  return "ok";
    case TransportResult::ABORTED_BY_CALLBACK: return "aborted by callback";
    case TransportResult::WRITE_ERROR:         return "write refused";
    case TransportResult::TIMEOUT:             return "timeout";
    case TransportResult::NETWORK_ERROR:       return "network error";
    case TransportResult::PARTIAL_FILE:        return "partial file";
    case TransportResult::RANGE_NOT_SATISFIED: return "range not satisfied";
    case TransportResult::TOO_MANY_REDIRECTS:  return "too many redirects";
    case TransportResult::OTHER_ERROR:         return "other error";
    }
    return "unknown";
}

// -----------------------------------------------------------------------------
// コンストラクタ / デストラクタ
// -----------------------------------------------------------------------------

CurlHandle::CurlHandle() {
    handle_ = curl_easy_init();
    if (!handle_) {
        throw std::runtime_error("curl_easy_init() failed");
    }

    // エラーバッファを curl に登録（詳細なエラーメッセージを取得するため）
    curl_easy_setopt(handle_, CURLOPT_ERRORBUFFER, errorBuffer_);

    // 進捗コールバックを有効化するために必要
    curl_easy_setopt(handle_, CURLOPT_NOPROGRESS, 0L);

    // マルチスレッドでシグナルを使わない
    curl_easy_setopt(handle_, CURLOPT_NOSIGNAL, 1L);
}

CurlHandle::~CurlHandle() {
    if (handle_) {
        curl_easy_cleanup(handle_);
        handle_ = nullptr;
    }
    if (requestHeaders_) {
        curl_slist_free_all(requestHeaders_);
        requestHeaders_ = nullptr;
    }
}

// -----------------------------------------------------------------------------
// 設定メソッド
// -----------------------------------------------------------------------------

void CurlHandle::setUrl(const std::string& url) {
    url_ = url;
    curl_easy_setopt(handle_, CURLOPT_URL, url_.c_str());
}

void CurlHandle::setRange(int64_t first, int64_t last) {
    if (first < 0) {
        clearRange();
        return;
    }
    // "first-last" (last < 0 は末尾まで)
    std::string range = std::to_string(first) + "-";
    if (last >= 0) {
        range += std::to_string(last);
    }
    curl_easy_setopt(handle_, CURLOPT_RANGE, range.c_str());
}

void CurlHandle::clearRange() {
    curl_easy_setopt(handle_, CURLOPT_RANGE, static_cast<char*>(nullptr));
}

void CurlHandle::setRequestHeaders(const HeaderList& headers) {
    curl_slist* list = nullptr;
    for (const auto& header : headers) {
        const std::string line = header.first + ": " + header.second;
        curl_slist* next = curl_slist_append(list, line.c_str());
        if (!next) {
            curl_slist_free_all(list);
            throw std::runtime_error("curl_slist_append() failed");
        }
        list = next;
    }

    // curl は perform 時まで slist を参照するため、差し替えてから旧リストを解放する
    curl_easy_setopt(handle_, CURLOPT_HTTPHEADER, list);
    if (requestHeaders_) {
        curl_slist_free_all(requestHeaders_);
    }
    requestHeaders_ = list;
}

void CurlHandle::setNoBody(bool noBody) {
    curl_easy_setopt(handle_, CURLOPT_NOBODY, noBody ? 1L : 0L);
    if (!noBody) {
        curl_easy_setopt(handle_, CURLOPT_HTTPGET, 1L);
    }
}

void CurlHandle::setWriteCallback(WriteCallback cb) {
    writeCallback_ = std::move(cb);
    curl_easy_setopt(handle_, CURLOPT_WRITEFUNCTION,
                     &CurlHandle::curlWriteCallback);
    curl_easy_setopt(handle_, CURLOPT_WRITEDATA, this);
}

void CurlHandle::setHeaderCallback(HeaderCallback cb) {
    headerCallback_ = std::move(cb);
    curl_easy_setopt(handle_, CURLOPT_HEADERFUNCTION,
                     &CurlHandle::curlHeaderCallback);
    curl_easy_setopt(handle_, CURLOPT_HEADERDATA, this);
}

void CurlHandle::setProgressCallback(ProgressCallback cb) {
    progressCallback_ = std::move(cb);
    curl_easy_setopt(handle_, CURLOPT_XFERINFOFUNCTION,
                     &CurlHandle::curlProgressCallback);
    curl_easy_setopt(handle_, CURLOPT_XFERINFODATA, this);
}

void CurlHandle::setConnectTimeout(long seconds) {
    curl_easy_setopt(handle_, CURLOPT_CONNECTTIMEOUT, seconds);
}

void CurlHandle::setTimeout(long seconds) {
    curl_easy_setopt(handle_, CURLOPT_TIMEOUT, seconds);
}

void CurlHandle::setLowSpeedLimit(long bytesPerSec, long seconds) {
    curl_easy_setopt(handle_, CURLOPT_LOW_SPEED_LIMIT, bytesPerSec);
    curl_easy_setopt(handle_, CURLOPT_LOW_SPEED_TIME, seconds);
}

void CurlHandle::setUserAgent(const std::string& ua) {
    curl_easy_setopt(handle_, CURLOPT_USERAGENT, ua.c_str());
}

void CurlHandle::setFollowLocation(bool follow, long maxRedirects) {
    curl_easy_setopt(handle_, CURLOPT_FOLLOWLOCATION, follow ? 1L : 0L);
    curl_easy_setopt(handle_, CURLOPT_MAXREDIRS, maxRedirects);
}

void CurlHandle::setSslVerify(bool verify) {
    curl_easy_setopt(handle_, CURLOPT_SSL_VERIFYPEER, verify ? 1L : 0L);
    curl_easy_setopt(handle_, CURLOPT_SSL_VERIFYHOST, verify ? 2L : 0L);
}

// -----------------------------------------------------------------------------
// 転送実行
// -----------------------------------------------------------------------------

void CurlHandle::prepareTransfer() {
    errorBuffer_[0] = '\0';
}

TransportResult CurlHandle::perform() {
    prepareTransfer();
    CURLcode code = curl_easy_perform(handle_);
    return toTransportResult(code);
}

long CurlHandle::getHttpResponseCode() const {
    long httpCode = 0;
    curl_easy_getinfo(handle_, CURLINFO_RESPONSE_CODE, &httpCode);
    return httpCode;
}

std::string CurlHandle::getLastError() const {
    if (errorBuffer_[0] != '\0') {
        return std::string(errorBuffer_);
    }
    return "Unknown curl error";
}

// -----------------------------------------------------------------------------
// 静的コールバックブリッジ
// -----------------------------------------------------------------------------

size_t CurlHandle::curlWriteCallback(char* ptr, size_t size,
                                     size_t nmemb, void* userdata) {
    auto* self = static_cast<CurlHandle*>(userdata);
    const size_t total = size * nmemb;
    if (!self->writeCallback_) {
        return total; // 捨てる
    }
    return self->writeCallback_(ptr, total);
}

size_t CurlHandle::curlHeaderCallback(char* buffer, size_t size,
                                      size_t nitems, void* userdata) {
    auto* self = static_cast<CurlHandle*>(userdata);
    const size_t total = size * nitems;
    if (self->headerCallback_) {
        self->headerCallback_(std::string(buffer, total));
    }
    return total;
}

int CurlHandle::curlProgressCallback(void* clientp,
                                     curl_off_t dltotal, curl_off_t dlnow,
                                     curl_off_t /*ultotal*/, curl_off_t /*ulnow*/) {
    auto* self = static_cast<CurlHandle*>(clientp);
    if (!self->progressCallback_) {
        return 0;
    }
    return self->progressCallback_(static_cast<int64_t>(dltotal),
                                   static_cast<int64_t>(dlnow));
}

// -----------------------------------------------------------------------------
// CURLcode → TransportResult 変換
// -----------------------------------------------------------------------------

TransportResult CurlHandle::toTransportResult(CURLcode code) {
    switch (code) {
    case CURLE_OK:
        return TransportResult::OK;
    case CURLE_ABORTED_BY_CALLBACK:
        return TransportResult::ABORTED_BY_CALLBACK;
    case CURLE_WRITE_ERROR:
        return TransportResult::WRITE_ERROR;
    case CURLE_OPERATION_TIMEDOUT:
        return TransportResult::TIMEOUT;
    case CURLE_COULDNT_CONNECT:
    case CURLE_COULDNT_RESOLVE_HOST:
    case CURLE_COULDNT_RESOLVE_PROXY:
    case CURLE_RECV_ERROR:
    case CURLE_SEND_ERROR:
    case CURLE_GOT_NOTHING:
    case CURLE_HTTP2:
    case CURLE_HTTP2_STREAM:
    case CURLE_SSL_CONNECT_ERROR:
        return TransportResult::NETWORK_ERROR;
    case CURLE_PARTIAL_FILE:
        return TransportResult::PARTIAL_FILE;
    case CURLE_RANGE_ERROR:
        return TransportResult::RANGE_NOT_SATISFIED;
    case CURLE_TOO_MANY_REDIRECTS:
        return TransportResult::TOO_MANY_REDIRECTS;
    default:
        return TransportResult::OTHER_ERROR;
    }
}

} // namespace SegmentedDownloader
