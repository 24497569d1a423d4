#include "webber/url.hpp"

#include <curl/curl.h>

namespace webber {

namespace {

// RAII wrapper for a libcurl URL handle
class CurlUrl {
public:
    CurlUrl() : handle_(curl_url()) {}
    ~CurlUrl() { if (handle_) curl_url_cleanup(handle_); }

    CurlUrl(const CurlUrl&) = delete;
    CurlUrl& operator=(const CurlUrl&) = delete;

    CURLU* get() { return handle_; }
    explicit operator bool() const { return handle_ != nullptr; }

private:
    CURLU* handle_;
};

// Internationalized hosts are returned in their ASCII (punycode) form
#ifdef CURLU_PUNYCODE
constexpr unsigned int HOST_FLAGS = CURLU_PUNYCODE;
#else
constexpr unsigned int HOST_FLAGS = 0;
#endif

// Fetch one URL component; nullopt when curl reports it missing
std::optional<std::string> get_part(CURLU* url, CURLUPart what, unsigned int flags = 0) {
    char* part = nullptr;
    if (curl_url_get(url, what, &part, flags) != CURLUE_OK || part == nullptr) {
        return std::nullopt;
    }
    std::string value(part);
    curl_free(part);
    return value;
}

} // namespace

ParsedUrl parse_url(const std::string& text) {
    ParsedUrl result;

    if (text.empty()) {
        result.error = "empty URL";
        return result;
    }

    CurlUrl url;
    if (!url) {
        result.error = "failed to allocate URL handle";
        return result;
    }

    CURLUcode rc = curl_url_set(url.get(), CURLUPART_URL, text.c_str(), CURLU_NON_SUPPORT_SCHEME);
    if (rc != CURLUE_OK) {
        result.error = std::string("invalid URL: ") + curl_url_strerror(rc);
        return result;
    }

    result.scheme = get_part(url.get(), CURLUPART_SCHEME).value_or("");

    auto host = get_part(url.get(), CURLUPART_HOST, HOST_FLAGS);
    if (!host) {
        // libcurl built without IDN support cannot encode the host
        host = get_part(url.get(), CURLUPART_HOST);
    }
    if (host && !host->empty()) {
        result.host = std::move(host);
    }

    result.path = get_part(url.get(), CURLUPART_PATH).value_or("/");
    result.ok = true;
    return result;
}

std::string last_path_segment(const std::string& path) {
    auto slash = path.rfind('/');
    if (slash == std::string::npos) {
        return path;
    }
    return path.substr(slash + 1);
}

} // namespace webber
