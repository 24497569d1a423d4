#pragma once

#include "webber/fetch.hpp"
#include "webber/types.hpp"

#include <string>

namespace webber {

// ============================================================================
// Icon Resolution
// ============================================================================

inline constexpr const char* DEFAULT_ICON_FILENAME = "icon.svg";

enum class IconSourceKind {
    Remote,     // Fetch from the icon URL
    Bundled     // Use the built-in SVG
};

// Decision for where the icon comes from
struct IconSource {
    IconSourceKind kind = IconSourceKind::Bundled;
    std::string url;        // Set for Remote
    std::string extension;  // Set for Remote, without the dot
    std::string filename;   // "icon.<extension>" or "icon.svg"
};

// Decide between fetching the icon and using the bundled one.
// Remote only when `icon_url` parses and its last path segment has a
// non-empty dot-delimited suffix. Never fails.
IconSource select_icon_source(const std::string& icon_url);

// Bytes of the bundled default icon (SVG)
const std::string& default_icon_svg();

struct IconResult {
    bool ok = false;
    std::string error;
    BuildErrorKind error_kind = BuildErrorKind::Filesystem;
    std::string filename;   // Name of the icon file written into the directory
};

// Materialize the icon into `data_dir`.
// A fetch failure for a Remote source is fatal; there is no fallback to
// the bundled icon once a fetchable URL was identified.
IconResult resolve_icon(const std::string& icon_url,
                        const std::string& data_dir,
                        const Fetcher& fetcher);

} // namespace webber
