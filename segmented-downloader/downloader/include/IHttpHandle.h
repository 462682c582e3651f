#pragma once
// =============================================================================
// IHttpHandle.h
// 1 リクエスト分の HTTP 転送を抽象化するインターフェース
// テスト時はモックに差し替え可能にし、curl 依存を分離する
// =============================================================================

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace SegmentedDownloader {

/// リクエストに付与するカスタムヘッダー (名前, 値)
using HeaderList = std::vector<std::pair<std::string, std::string>>;

/// curl_easy_perform の戻り値相当
enum class TransportResult {
    OK,
    ABORTED_BY_CALLBACK, ///< 進捗コールバックからの中断
    WRITE_ERROR,         ///< 書き込みコールバックが受け取りを拒否した
    TIMEOUT,             ///< 接続・低速・全体タイムアウト
    NETWORK_ERROR,       ///< 接続失敗・送受信エラーなど
    PARTIAL_FILE,        ///< 宣言長に満たないまま接続が閉じられた
    RANGE_NOT_SATISFIED, ///< 416 / Range 非対応
    TOO_MANY_REDIRECTS,
    OTHER_ERROR
};

const char* toString(TransportResult result);

/// @brief HTTP ハンドル操作を抽象化するインターフェース
/// 本番実装は CurlHandle, テスト用はモッククラスを用意する
/// 同じハンドルで複数回 perform してよい (設定は呼び出しごとに上書きする)
class IHttpHandle {
public:
    virtual ~IHttpHandle() = default;

    /// @brief 書き込みコールバック型
    /// @return 受け取ったバイト数。それ以外を返すと転送が中断する
    using WriteCallback = std::function<size_t(const char* data, size_t size)>;

    /// @brief ヘッダー行コールバック型
    /// リダイレクトチェーン中の全レスポンスのステータス行・ヘッダー行が順に届く
    /// (行末の CRLF を含む)
    using HeaderCallback = std::function<void(const std::string& line)>;

    /// @brief 進捗コールバック型
    /// @return 0 継続, 非0 で転送が中断する
    using ProgressCallback =
        std::function<int(int64_t dltotal, int64_t dlnow)>;

    virtual void setUrl(const std::string& url) = 0;

    /// @brief Range を設定する (両端含む)。first < 0 で解除
    virtual void setRange(int64_t first, int64_t last) = 0;

    /// @brief Range を解除する
    virtual void clearRange() = 0;

    virtual void setRequestHeaders(const HeaderList& headers) = 0;

    /// @brief true で HEAD リクエストにする
    virtual void setNoBody(bool noBody) = 0;

    virtual void setWriteCallback(WriteCallback cb) = 0;
    virtual void setHeaderCallback(HeaderCallback cb) = 0;
    virtual void setProgressCallback(ProgressCallback cb) = 0;

    /// @brief 接続タイムアウト (秒)
    virtual void setConnectTimeout(long seconds) = 0;

    /// @brief 転送全体のタイムアウト (秒, 0 で無制限)
    virtual void setTimeout(long seconds) = 0;

    /// @brief bytesPerSec 未満が seconds 秒続いたら中断する
    virtual void setLowSpeedLimit(long bytesPerSec, long seconds) = 0;

    virtual void setUserAgent(const std::string& ua) = 0;

    /// @brief リダイレクト追跡の有無と最大回数
    virtual void setFollowLocation(bool follow, long maxRedirects) = 0;

    /// @brief SSL 証明書検証の有効/無効
    virtual void setSslVerify(bool verify) = 0;

    /// @brief 転送を実行する (ブロッキング)
    virtual TransportResult perform() = 0;

    /// @brief 最後の HTTP レスポンスコードを取得する
    virtual long getHttpResponseCode() const = 0;

    /// @brief 直前のエラーメッセージを取得する
    virtual std::string getLastError() const = 0;
};

/// ハンドル生成関数 (テストではモックを返す)
using HttpHandleFactory = std::function<std::unique_ptr<IHttpHandle>()>;

} // namespace SegmentedDownloader
