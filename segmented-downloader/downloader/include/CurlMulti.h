#pragma once
// =============================================================================
// CurlMulti.h
// IMultiHandle の本番実装 - curl_multi をラップする
// =============================================================================

#include "IMultiHandle.h"

#include <curl/curl.h>
#include <map>

namespace SegmentedDownloader {

class CurlHandle;

/// @brief CURLM* を RAII でラップするクラス
/// 登録するハンドルは createHandle() で生成した CurlHandle であること
class CurlMulti final : public IMultiHandle {
public:
    /// @throws std::runtime_error curl_multi_init() に失敗した場合
    CurlMulti();
    ~CurlMulti() override;

    CurlMulti(const CurlMulti&)            = delete;
    CurlMulti& operator=(const CurlMulti&) = delete;

    std::unique_ptr<IHttpHandle> createHandle() override;
    bool addHandle(IHttpHandle* handle) override;
    void removeHandle(IHttpHandle* handle) override;
    bool perform(int& running) override;
    bool poll(std::chrono::milliseconds timeout) override;
    std::vector<CompletedTransfer> readCompleted() override;
    std::string getLastError() const override { return lastError_; }

private:
    CURLM*                      multi_{nullptr};
    std::map<CURL*, CurlHandle*> attached_; ///< 登録中の easy → ラッパー
    std::string                 lastError_;
};

} // namespace SegmentedDownloader
