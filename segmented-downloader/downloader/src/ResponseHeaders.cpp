// =============================================================================
// ResponseHeaders.cpp
// =============================================================================

#include "ResponseHeaders.h"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>

namespace SegmentedDownloader {

namespace {

std::string trim(const std::string& s) {
    size_t begin = 0;
    size_t end   = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(begin, end - begin);
}

std::string toLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return s;
}

/// 10 進数の非負整数のみ受け付ける
std::optional<int64_t> parseNonNegative(const std::string& s) {
    if (s.empty()) return std::nullopt;
    int64_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        if (value > (INT64_MAX - (c - '0')) / 10) return std::nullopt;
        value = value * 10 + (c - '0');
    }
    return value;
}

} // namespace

std::optional<ContentRange> parseContentRange(const std::string& value) {
    std::string v = trim(value);
    const std::string unit = "bytes ";
    if (v.size() <= unit.size() || toLower(v.substr(0, unit.size())) != unit) {
        return std::nullopt;
    }
    v = trim(v.substr(unit.size()));

    const size_t dash  = v.find('-');
    const size_t slash = v.find('/');
    if (dash == std::string::npos || slash == std::string::npos || dash > slash) {
        return std::nullopt;
    }

    auto first = parseNonNegative(v.substr(0, dash));
    auto last  = parseNonNegative(v.substr(dash + 1, slash - dash - 1));
    if (!first || !last || *last < *first) {
        return std::nullopt;
    }

    ContentRange range;
    range.first = *first;
    range.last  = *last;

    const std::string total = v.substr(slash + 1);
    if (total != "*") {
        auto t = parseNonNegative(total);
        if (!t) return std::nullopt;
        range.total = *t;
    }
    return range;
}

std::string normalizeEtag(const std::string& value) {
    std::string v = trim(value);
    std::string prefix;
    if (v.size() >= 2 && (v[0] == 'W' || v[0] == 'w') && v[1] == '/') {
        prefix = "W/";
        v      = v.substr(2);
    }
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        v = v.substr(1, v.size() - 2);
    }
    return prefix + v;
}

// -----------------------------------------------------------------------------
// ResponseHeaders
// -----------------------------------------------------------------------------

void ResponseHeaders::addLine(const std::string& rawLine) {
    const std::string line = trim(rawLine);
    if (line.empty()) {
        return; // ヘッダー終端の空行
    }

    // 新しいレスポンスの開始 (リダイレクト・100 Continue を含む)
    if (line.compare(0, 5, "HTTP/") == 0) {
        reset();
        const size_t sp = line.find(' ');
        if (sp != std::string::npos) {
            statusCode_ = std::strtol(line.c_str() + sp + 1, nullptr, 10);
        }
        return;
    }

    const size_t colon = line.find(':');
    if (colon == std::string::npos) {
        return;
    }
    fields_[toLower(trim(line.substr(0, colon)))] = trim(line.substr(colon + 1));
}

void ResponseHeaders::reset() {
    statusCode_ = 0;
    fields_.clear();
}

std::optional<std::string> ResponseHeaders::get(const std::string& name) const {
    auto it = fields_.find(toLower(name));
    if (it == fields_.end()) return std::nullopt;
    return it->second;
}

std::optional<int64_t> ResponseHeaders::contentLength() const {
    auto v = get("content-length");
    if (!v) return std::nullopt;
    return parseNonNegative(*v);
}

std::optional<ContentRange> ResponseHeaders::contentRange() const {
    auto v = get("content-range");
    if (!v) return std::nullopt;
    return parseContentRange(*v);
}

bool ResponseHeaders::acceptsByteRanges() const {
    auto v = get("accept-ranges");
    return v && toLower(*v).find("bytes") != std::string::npos;
}

std::optional<std::string> ResponseHeaders::etag() const {
    auto v = get("etag");
    if (!v || v->empty()) return std::nullopt;
    return normalizeEtag(*v);
}

std::optional<std::string> ResponseHeaders::lastModified() const {
    auto v = get("last-modified");
    if (!v || v->empty()) return std::nullopt;
    return v;
}

std::optional<std::string> ResponseHeaders::contentDisposition() const {
    return get("content-disposition");
}

} // namespace SegmentedDownloader
