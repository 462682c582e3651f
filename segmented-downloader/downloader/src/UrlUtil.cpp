// =============================================================================
// UrlUtil.cpp
// =============================================================================

#include "UrlUtil.h"

#include <curl/curl.h>

#include <cctype>
#include <memory>

namespace SegmentedDownloader {

namespace {

/// CURLU* の RAII ラッパー
struct CurlUrlDeleter {
    void operator()(CURLU* u) const { curl_url_cleanup(u); }
};
using CurlUrlPtr = std::unique_ptr<CURLU, CurlUrlDeleter>;

CurlUrlPtr parseUrl(const std::string& url) {
    CurlUrlPtr u(curl_url());
    if (!u) return nullptr;
    if (curl_url_set(u.get(), CURLUPART_URL, url.c_str(), 0) != CURLUE_OK) {
        return nullptr;
    }
    return u;
}

std::optional<std::string> urlPart(CURLU* u, CURLUPart part, unsigned int flags) {
    char* value = nullptr;
    if (curl_url_get(u, part, &value, flags) != CURLUE_OK || !value) {
        return std::nullopt;
    }
    std::string result(value);
    curl_free(value);
    return result;
}

std::string trimQuotes(std::string v) {
    while (!v.empty() && std::isspace(static_cast<unsigned char>(v.front()))) v.erase(0, 1);
    while (!v.empty() && std::isspace(static_cast<unsigned char>(v.back()))) v.pop_back();
    if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
        v = v.substr(1, v.size() - 2);
    }
    return v;
}

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string percentDecode(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '%' && i + 2 < s.size()) {
            const int hi = hexValue(s[i + 1]);
            const int lo = hexValue(s[i + 2]);
            if (hi >= 0 && lo >= 0) {
                out.push_back(static_cast<char>(hi * 16 + lo));
                i += 2;
                continue;
            }
        }
        out.push_back(s[i]);
    }
    return out;
}

} // namespace

std::string hostKeyFor(const std::string& url) {
    auto u = parseUrl(url);
    if (!u) return url;

    auto scheme = urlPart(u.get(), CURLUPART_SCHEME, 0);
    auto host   = urlPart(u.get(), CURLUPART_HOST, 0);
    auto port   = urlPart(u.get(), CURLUPART_PORT, CURLU_DEFAULT_PORT);
    if (!scheme || !host) return url;

    std::string key = *scheme + "://" + *host;
    if (port) key += ":" + *port;
    return key;
}

std::optional<std::string> filenameFromContentDisposition(const std::string& value) {
    std::optional<std::string> plain;
    std::optional<std::string> extended;

    size_t pos = 0;
    while (pos < value.size()) {
        size_t end = value.find(';', pos);
        if (end == std::string::npos) end = value.size();
        const std::string param = value.substr(pos, end - pos);
        pos = end + 1;

        const size_t eq = param.find('=');
        if (eq == std::string::npos) continue;
        std::string name = trimQuotes(param.substr(0, eq));
        for (auto& c : name) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        const std::string raw = trimQuotes(param.substr(eq + 1));

        if (name == "filename*") {
            // charset'lang'percent-encoded
            const size_t q = raw.rfind('\'');
            extended = percentDecode(q == std::string::npos ? raw : raw.substr(q + 1));
        } else if (name == "filename") {
            plain = raw;
        }
    }
    if (extended && !extended->empty()) return extended;
    if (plain && !plain->empty()) return plain;
    return std::nullopt;
}

std::string sanitizeFilename(const std::string& name) {
    std::string out;
    out.reserve(name.size());
    for (char c : name) {
        const auto uc = static_cast<unsigned char>(c);
        if (c == '/' || c == '\\' || uc < 0x20 || uc == 0x7f) {
            out.push_back('_');
        } else {
            out.push_back(c);
        }
    }
    if (out.empty() || out == "." || out == "..") {
        return kDefaultFilename;
    }
    return out;
}

std::string deriveFilename(const std::string& url,
                           const std::optional<std::string>& contentDisposition) {
    if (contentDisposition) {
        if (auto name = filenameFromContentDisposition(*contentDisposition)) {
            return sanitizeFilename(*name);
        }
    }

    if (auto u = parseUrl(url)) {
        if (auto path = urlPart(u.get(), CURLUPART_PATH, CURLU_URLDECODE)) {
            const size_t slash = path->rfind('/');
            const std::string last = slash == std::string::npos ? *path
                                                                : path->substr(slash + 1);
            if (!last.empty()) {
                return sanitizeFilename(last);
            }
        }
    }
    return kDefaultFilename;
}

} // namespace SegmentedDownloader
