#pragma once

#include <optional>
#include <string>

namespace webber {

// ============================================================================
// URL Parsing
// ============================================================================

// Components of a successfully parsed URL. `host` is absent for URLs
// that carry no authority (file:///x, scheme:opaque).
struct ParsedUrl {
    bool ok = false;
    std::string error;
    std::string scheme;
    std::optional<std::string> host;
    std::string path;   // Percent-encoded path, "/" when the URL has none
};

// Parse an absolute URL with libcurl's URL API.
// Never throws; failures are reported through `ok`/`error`.
ParsedUrl parse_url(const std::string& text);

// Last '/'-separated segment of a URL path ("" for "/" or an empty path)
std::string last_path_segment(const std::string& path);

} // namespace webber
