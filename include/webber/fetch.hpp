#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace webber {

// ============================================================================
// HTTP Fetching
// ============================================================================

struct FetchResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
    long http_status = 0;
    std::string content_type;
};

// Zero means unbounded
struct FetchOptions {
    long connect_timeout_seconds = 0;
    long timeout_seconds = 0;
};

// Fetch a resource over http or https with libcurl.
// Follows redirects and verifies TLS certificates. Any transport failure
// or non-2xx status is reported as !ok.
FetchResult http_fetch(const std::string& url, const FetchOptions& options = {});

// Injectable fetch operation used by the build pipeline
using Fetcher = std::function<FetchResult(const std::string& url)>;

// Fetcher backed by http_fetch with the given options
Fetcher make_http_fetcher(const FetchOptions& options = {});

} // namespace webber
