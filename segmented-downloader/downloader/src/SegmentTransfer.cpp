// =============================================================================
// SegmentTransfer.cpp
// =============================================================================

#include "SegmentTransfer.h"
#include "RetryPolicy.h"
#include "StorageWriter.h"

#include <system_error>

namespace SegmentedDownloader {

bool SegmentOutcome::throttled() const {
    return isThrottleStatus(httpCode);
}

SegmentTransfer::SegmentTransfer(size_t index, Segment segment,
                                 StorageWriter& storage, bool rangeRequest,
                                 std::shared_ptr<const AbortToken> abort,
                                 std::shared_ptr<std::atomic<int64_t>> written)
    : index_(index)
    , segment_(segment)
    , storage_(storage)
    , rangeRequest_(rangeRequest)
    , abort_(std::move(abort))
    , written_(written ? std::move(written)
                       : std::make_shared<std::atomic<int64_t>>(0)) {
    written_->store(0, std::memory_order_release);
}

void SegmentTransfer::configure(IHttpHandle& handle, const std::string& url,
                                const HeaderList& headers,
                                const HttpOptions& options) {
    handle.setUrl(url);
    applyHttpOptions(handle, options, headers);
    handle.setNoBody(false);
    if (rangeRequest_) {
        handle.setRange(segment_.start,
                        segment_.hasKnownEnd() ? segment_.end - 1 : -1);
    } else {
        handle.clearRange();
    }
    handle.setHeaderCallback([this](const std::string& line) { onHeaderLine(line); });
    handle.setWriteCallback([this](const char* data, size_t size) { return onBody(data, size); });
    handle.setProgressCallback([this](int64_t, int64_t) { return onProgress(); });
}

SegmentOutcome SegmentTransfer::run(IHttpHandle& handle) {
    const TransportResult result = handle.perform();
    return finish(result, handle.getHttpResponseCode(),
                  result == TransportResult::OK ? std::string() : handle.getLastError());
}

// -----------------------------------------------------------------------------
// コールバック
// -----------------------------------------------------------------------------

void SegmentTransfer::onHeaderLine(const std::string& line) {
    // リダイレクト後の新しいステータス行で前のレスポンスのヘッダーは破棄される
    headers_.addLine(line);
}

size_t SegmentTransfer::onBody(const char* data, size_t size) {
    if (abort_ && abort_->isAborted()) {
        return 0;
    }
    if (!validate()) {
        return 0;
    }

    const int64_t already = written_->load(std::memory_order_relaxed);
    if (segment_.hasKnownEnd() &&
        already + static_cast<int64_t>(size) > segment_.length()) {
        rejection_    = Rejection::PROTOCOL;
        rejectReason_ = "server sent more than the requested " +
                        std::to_string(segment_.length()) + " bytes";
        return 0;
    }

    try {
        storage_.writeAt(segment_.start + already, data, size);
    } catch (const std::system_error& e) {
        storageFailed_ = true;
        storageError_  = e.what();
        return 0;
    }

    written_->fetch_add(static_cast<int64_t>(size), std::memory_order_acq_rel);
    return size;
}

int SegmentTransfer::onProgress() const {
    return (abort_ && abort_->isAborted()) ? 1 : 0;
}

// -----------------------------------------------------------------------------
// 検証
// -----------------------------------------------------------------------------

bool SegmentTransfer::validate() {
    if (validated_) {
        return accepted_;
    }
    validated_ = true;

    const long status = headers_.statusCode();
    if (status >= 400 || (!rangeRequest_ && (status < 200 || status >= 300))) {
        rejection_    = Rejection::HTTP_STATUS;
        rejectReason_ = "HTTP " + std::to_string(status);
        return accepted_ = false;
    }

    if (rangeRequest_) {
        if (status != 206) {
            rejection_    = Rejection::PROTOCOL;
            rejectReason_ = "expected 206 Partial Content for range " +
                            segment_.rangeHeaderValue() + ", got " +
                            std::to_string(status);
            return accepted_ = false;
        }
        const auto range = headers_.contentRange();
        const int64_t expectedLast = segment_.hasKnownEnd() ? segment_.end - 1 : -1;
        if (!range || range->first != segment_.start ||
            (expectedLast >= 0 && range->last != expectedLast)) {
            rejection_    = Rejection::PROTOCOL;
            rejectReason_ = "Content-Range " +
                            headers_.get("content-range").value_or("<missing>") +
                            " does not match " + segment_.rangeHeaderValue();
            return accepted_ = false;
        }
    }
    return accepted_ = true;
}

SegmentOutcome SegmentTransfer::finish(TransportResult result, long httpCode,
                                       const std::string& transportError) {
    SegmentOutcome outcome;
    outcome.bytesWritten = written_->load(std::memory_order_acquire);
    outcome.httpCode     = headers_.hasStatus() ? headers_.statusCode() : httpCode;

    const std::string where = "segment " + std::to_string(index_) + " (" +
                              segment_.rangeHeaderValue() + "): ";

    if (storageFailed_) {
        outcome.kind    = ErrorKind::STORAGE;
        outcome.message = where + storageError_;
        return outcome;
    }

    // 本文が無かった場合はここで検証する
    if (result == TransportResult::OK && !validated_) {
        validate();
    }

    if (rejection_ == Rejection::HTTP_STATUS) {
        outcome.kind    = classifyHttpStatus(outcome.httpCode);
        outcome.message = where + rejectReason_;
        return outcome;
    }
    if (rejection_ == Rejection::PROTOCOL) {
        outcome.kind    = ErrorKind::PROTOCOL_VIOLATION;
        outcome.message = where + rejectReason_;
        return outcome;
    }

    if (result != TransportResult::OK) {
        if (abort_ && abort_->isAborted()) {
            outcome.kind    = ErrorKind::ABORTED;
            outcome.message = where + "aborted";
        } else {
            outcome.kind    = classifyTransport(result);
            outcome.message = where + toString(result) + ": " + transportError;
        }
        return outcome;
    }

    if (segment_.hasKnownEnd() && outcome.bytesWritten != segment_.length()) {
        outcome.kind    = ErrorKind::PARTIAL_TRANSFER;
        outcome.message = where + "expected " + std::to_string(segment_.length()) +
                          " bytes, received " + std::to_string(outcome.bytesWritten);
        return outcome;
    }
    return outcome;
}

} // namespace SegmentedDownloader
