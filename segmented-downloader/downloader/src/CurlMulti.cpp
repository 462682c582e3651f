// =============================================================================
// CurlMulti.cpp
// curl_multi による単一スレッド多重転送
// =============================================================================

#include "CurlMulti.h"
#include "CurlHandle.h"

#include <stdexcept>

namespace SegmentedDownloader {

CurlMulti::CurlMulti() {
    multi_ = curl_multi_init();
    if (!multi_) {
        throw std::runtime_error("curl_multi_init() failed");
    }
}

CurlMulti::~CurlMulti() {
    // 登録中のハンドルを外してから破棄する (easy ハンドル自体は所有者が解放する)
    for (auto& entry : attached_) {
        curl_multi_remove_handle(multi_, entry.first);
    }
    attached_.clear();
    if (multi_) {
        curl_multi_cleanup(multi_);
        multi_ = nullptr;
    }
}

std::unique_ptr<IHttpHandle> CurlMulti::createHandle() {
    return std::make_unique<CurlHandle>();
}

bool CurlMulti::addHandle(IHttpHandle* handle) {
    auto* curl = dynamic_cast<CurlHandle*>(handle);
    if (!curl) {
        lastError_ = "handle was not created by CurlMulti";
        return false;
    }
    curl->prepareTransfer();
    const CURLMcode rc = curl_multi_add_handle(multi_, curl->native());
    if (rc != CURLM_OK) {
        lastError_ = curl_multi_strerror(rc);
        return false;
    }
    attached_[curl->native()] = curl;
    return true;
}

void CurlMulti::removeHandle(IHttpHandle* handle) {
    auto* curl = dynamic_cast<CurlHandle*>(handle);
    if (!curl) return;
    auto it = attached_.find(curl->native());
    if (it == attached_.end()) return;
    curl_multi_remove_handle(multi_, it->first);
    attached_.erase(it);
}

bool CurlMulti::perform(int& running) {
    const CURLMcode rc = curl_multi_perform(multi_, &running);
    if (rc != CURLM_OK) {
        lastError_ = curl_multi_strerror(rc);
        return false;
    }
    return true;
}

bool CurlMulti::poll(std::chrono::milliseconds timeout) {
    int numFds = 0;
    const CURLMcode rc = curl_multi_poll(multi_, nullptr, 0,
                                         static_cast<int>(timeout.count()), &numFds);
    if (rc != CURLM_OK) {
        lastError_ = curl_multi_strerror(rc);
        return false;
    }
    return true;
}

std::vector<CompletedTransfer> CurlMulti::readCompleted() {
    std::vector<CompletedTransfer> done;
    int remaining = 0;
    while (CURLMsg* msg = curl_multi_info_read(multi_, &remaining)) {
        if (msg->msg != CURLMSG_DONE) continue;
        auto it = attached_.find(msg->easy_handle);
        if (it == attached_.end()) continue;
        done.push_back({it->second, CurlHandle::toTransportResult(msg->data.result)});
    }
    return done;
}

} // namespace SegmentedDownloader
