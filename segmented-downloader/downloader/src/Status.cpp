// =============================================================================
// Status.cpp
// =============================================================================

#include "Status.h"

namespace SegmentedDownloader {

const char* toString(ErrorKind kind) {
    switch (kind) {
    case ErrorKind::NONE:               return "ok";
    case ErrorKind::CONNECTION:         return "connection";
    case ErrorKind::PROTOCOL_VIOLATION: return "protocol violation";
    case ErrorKind::STORAGE:            return "storage";
    case ErrorKind::REMOTE_CHANGED:     return "remote changed";
    case ErrorKind::PARTIAL_TRANSFER:   return "partial transfer";
    case ErrorKind::ABORTED:            return "aborted";
    case ErrorKind::OTHER:              return "other";
    }
    return "unknown";
}

bool isRetryable(ErrorKind kind) {
    return kind == ErrorKind::CONNECTION ||
           kind == ErrorKind::PARTIAL_TRANSFER;
}

std::string Status::toString() const {
    if (isOk()) {
        return "ok";
    }
    std::string text = SegmentedDownloader::toString(kind_);
    if (!message_.empty()) {
        text += ": ";
        text += message_;
    }
    return text;
}

} // namespace SegmentedDownloader
