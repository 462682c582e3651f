// =============================================================================
// ResumeValidator.cpp
// =============================================================================

#include "ResumeValidator.h"

#include <vector>

namespace SegmentedDownloader {

std::string ResumeValidation::describe() const {
    if (isValid()) {
        return "remote resource unchanged";
    }
    std::vector<const char*> fields;
    if (etagChanged)         fields.push_back("ETag");
    if (lastModifiedChanged) fields.push_back("Last-Modified");
    if (sizeChanged)         fields.push_back("size");

    std::string text = "remote resource changed (";
    for (size_t i = 0; i < fields.size(); ++i) {
        if (i > 0) text += ", ";
        text += fields[i];
    }
    text += "); use --force to discard progress and restart";
    return text;
}

ResumeValidation validateForResume(const JobMetadata& stored,
                                   const RemoteMetadata& fresh) {
    ResumeValidation result;
    if (!stored.etag && !stored.lastModified && !stored.totalSize) {
        return result;
    }
    // 片方だけ値がある場合も変更とみなす
    result.etagChanged         = stored.etag != fresh.etag;
    result.lastModifiedChanged = stored.lastModified != fresh.lastModified;
    result.sizeChanged         = stored.totalSize != fresh.contentLength;
    return result;
}

} // namespace SegmentedDownloader
