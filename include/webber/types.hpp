#pragma once

#include <string>

namespace webber {

// ============================================================================
// Package Request
// ============================================================================

// Description of the web site to package. All fields are taken verbatim
// from the caller; nothing here is validated up front.
struct PackageRequest {
    std::string url;            // Site address, also used to derive the identifier
    std::string name;           // Display title
    std::string theme_color;    // Splash color token, embedded verbatim
    std::string icon_url;       // Remote icon location (may be unparseable)
    std::string url_patterns;   // Pattern expression for the launcher
};

// ============================================================================
// Build Errors
// ============================================================================

enum class BuildErrorKind {
    Filesystem,
    Network,
    Archive
};

inline const char* error_kind_to_string(BuildErrorKind kind) {
    switch (kind) {
        case BuildErrorKind::Filesystem: return "filesystem";
        case BuildErrorKind::Network: return "network";
        case BuildErrorKind::Archive: return "archive";
        default: return "unknown";
    }
}

// A fatal failure of one pipeline step.
//   operation: what was being done ("write control/manifest", "fetch icon")
//   cause:     the underlying reason as reported by the OS or library
struct BuildError {
    BuildErrorKind kind = BuildErrorKind::Filesystem;
    std::string operation;
    std::string cause;

    std::string message() const {
        return operation + ": " + cause;
    }
};

} // namespace webber
