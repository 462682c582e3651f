// =============================================================================
// MetadataProber.cpp
// =============================================================================

#include "MetadataProber.h"
#include "Log.h"
#include "ResponseHeaders.h"
#include "RetryPolicy.h"

namespace SegmentedDownloader {

namespace {

constexpr const char* TAG = "Probe";

void fillIdentity(const ResponseHeaders& headers, RemoteMetadata& out) {
    out.etag               = headers.etag();
    out.lastModified       = headers.lastModified();
    out.contentDisposition = headers.contentDisposition();
}

Status transportFailure(TransportResult result, const std::string& error) {
    return Status::error(classifyTransport(result),
                         std::string("probe failed (") + toString(result) + "): " + error);
}

} // namespace

std::optional<std::string> RemoteMetadata::identityTag() const {
    // ETag は強弱どちらでも Last-Modified より優先する
    if (etag) return etag;
    return lastModified;
}

MetadataProber::MetadataProber(HttpHandleFactory factory, HttpOptions options)
    : factory_(std::move(factory)), options_(std::move(options)) {}

Status MetadataProber::probe(const std::string& url, const HeaderList& headers,
                             RemoteMetadata& out) const {
    out              = RemoteMetadata{};
    out.effectiveUrl = url;

    long        status = 0;
    std::string error;
    const TransportResult result = probeHead(url, headers, out, status, error);
    if (result != TransportResult::OK) {
        return transportFailure(result, error);
    }

    if (status >= 400) {
        // HEAD を受け付けないサーバ (405 など)
        SEGDL_LOG_DEBUG(TAG, "HEAD rejected with " << status
                             << ", falling back to range GET");
        return probeRangeGet(url, headers, out);
    }

    if (!out.contentLength) {
        // 長さ不明: Range GET で Content-Range の total を試す
        RemoteMetadata fallback = out;
        const Status st = probeRangeGet(url, headers, fallback);
        if (st.isOk() && fallback.contentLength) {
            out = fallback;
        }
    }

    SEGDL_LOG_DEBUG(TAG, url << " length="
                         << (out.contentLength ? std::to_string(*out.contentLength) : "?")
                         << " ranges=" << out.acceptRanges);
    return Status::ok();
}

TransportResult MetadataProber::probeHead(const std::string& url,
                                          const HeaderList& headers,
                                          RemoteMetadata& out, long& status,
                                          std::string& error) const {
    auto handle = factory_();
    ResponseHeaders response;

    handle->setUrl(url);
    applyHttpOptions(*handle, options_, headers);
    handle->clearRange();
    handle->setNoBody(true);
    handle->setHeaderCallback([&response](const std::string& line) {
        response.addLine(line);
    });

    const TransportResult result = handle->perform();
    if (result != TransportResult::OK) {
        error = handle->getLastError();
        return result;
    }

    status = response.hasStatus() ? response.statusCode()
                                  : handle->getHttpResponseCode();
    if (status < 400) {
        out.contentLength = response.contentLength();
        out.acceptRanges  = response.acceptsByteRanges();
        fillIdentity(response, out);
    }
    return result;
}

Status MetadataProber::probeRangeGet(const std::string& url,
                                     const HeaderList& headers,
                                     RemoteMetadata& out) const {
    auto handle = factory_();
    ResponseHeaders response;
    bool refusedBody = false;

    handle->setUrl(url);
    applyHttpOptions(*handle, options_, headers);
    handle->setNoBody(false);
    handle->setRange(0, 0);
    handle->setHeaderCallback([&response](const std::string& line) {
        response.addLine(line);
    });
    handle->setWriteCallback([&response, &refusedBody](const char*, size_t size) -> size_t {
        // 206 なら 1 バイトだけなので受け取る。全文が返ってきたら即座に打ち切る
        if (response.statusCode() == 206) {
            return size;
        }
        refusedBody = true;
        return 0;
    });

    const TransportResult result = handle->perform();
    if (result != TransportResult::OK &&
        !(result == TransportResult::WRITE_ERROR && refusedBody)) {
        return transportFailure(result, handle->getLastError());
    }

    const long status = response.hasStatus() ? response.statusCode()
                                             : handle->getHttpResponseCode();
    if (status >= 400) {
        return Status::error(classifyHttpStatus(status),
                             "probe failed: HTTP " + std::to_string(status));
    }

    if (status == 206) {
        auto range = response.contentRange();
        if (!range || range->first != 0) {
            return Status::error(ErrorKind::PROTOCOL_VIOLATION,
                                 "probe: invalid Content-Range in 206 response");
        }
        out.acceptRanges = true;
        if (range->total >= 0) {
            out.contentLength = range->total;
        } else {
            out.contentLength.reset();
        }
    } else {
        out.acceptRanges  = false;
        out.contentLength = response.contentLength();
    }
    fillIdentity(response, out);
    return Status::ok();
}

} // namespace SegmentedDownloader
