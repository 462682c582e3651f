#pragma once
// =============================================================================
// CurlHandle.h
// IHttpHandle の本番実装 - libcurl をラップする
// =============================================================================

#include "IHttpHandle.h"

#include <curl/curl.h>
#include <string>

namespace SegmentedDownloader {

/// @brief libcurl の CURL* ハンドルを RAII でラップするクラス
/// IHttpHandle インターフェースを実装し、curl_easy_* API を安全に使用する
/// CurlMulti に登録した場合は perform() を呼ばず、マルチハンドルが転送を駆動する
class CurlHandle final : public IHttpHandle {
public:
    /// @brief コンストラクタ - curl_easy_init() を呼び出す
    /// @throws std::runtime_error curl 初期化に失敗した場合
    CurlHandle();

    /// @brief デストラクタ - curl_easy_cleanup() を呼び出す (RAII)
    ~CurlHandle() override;

    // コピー不可
    CurlHandle(const CurlHandle&)            = delete;
    CurlHandle& operator=(const CurlHandle&) = delete;

    // IHttpHandle インターフェース実装
    void setUrl(const std::string& url) override;
    void setRange(int64_t first, int64_t last) override;
    void clearRange() override;
    void setRequestHeaders(const HeaderList& headers) override;
    void setNoBody(bool noBody) override;
    void setWriteCallback(WriteCallback cb) override;
    void setHeaderCallback(HeaderCallback cb) override;
    void setProgressCallback(ProgressCallback cb) override;
    void setConnectTimeout(long seconds) override;
    void setTimeout(long seconds) override;
    void setLowSpeedLimit(long bytesPerSec, long seconds) override;
    void setUserAgent(const std::string& ua) override;
    void setFollowLocation(bool follow, long maxRedirects) override;
    void setSslVerify(bool verify) override;
    TransportResult perform() override;
    long getHttpResponseCode() const override;
    std::string getLastError() const override;

    /// CurlMulti への登録用
    CURL* native() const { return handle_; }

    /// マルチハンドル経由で転送する前にエラーバッファをクリアする
    void prepareTransfer();

    /// CURLcode を TransportResult に変換する
    static TransportResult toTransportResult(CURLcode code);

private:
    /// curl 書き込みコールバックの静的ブリッジ関数
    static size_t curlWriteCallback(char* ptr, size_t size,
                                    size_t nmemb, void* userdata);

    /// curl ヘッダーコールバックの静的ブリッジ関数
    static size_t curlHeaderCallback(char* buffer, size_t size,
                                     size_t nitems, void* userdata);

    /// curl 進捗コールバックの静的ブリッジ関数 (xferinfo)
    static int curlProgressCallback(void* clientp,
                                    curl_off_t dltotal, curl_off_t dlnow,
                                    curl_off_t ultotal, curl_off_t ulnow);

    CURL*              handle_{nullptr};     ///< libcurl ハンドル
    curl_slist*        requestHeaders_{nullptr}; ///< setRequestHeaders の所有リスト
    std::string        url_;                 ///< curl は文字列をコピーするが参照用に保持
    WriteCallback      writeCallback_;       ///< ユーザー指定の書き込み CB
    HeaderCallback     headerCallback_;      ///< ユーザー指定のヘッダー CB
    ProgressCallback   progressCallback_;    ///< ユーザー指定の進捗 CB
    char               errorBuffer_[CURL_ERROR_SIZE]{'\0'}; ///< エラー詳細バッファ
};

} // namespace SegmentedDownloader
