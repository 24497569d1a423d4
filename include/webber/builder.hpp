#pragma once

#include "webber/fetch.hpp"
#include "webber/types.hpp"

#include <string>
#include <vector>

namespace webber {

// ============================================================================
// Package Build
// ============================================================================

inline constexpr const char* PACKAGE_FILENAME = "shortcut.click";

struct BuildOptions {
    // Directory used as the staging area. Empty selects default_staging_root().
    // Builds sharing a root must not overlap.
    std::string staging_root;

    // Icon fetch operation. Empty selects the libcurl fetcher.
    Fetcher fetcher;
};

struct BuildResult {
    bool ok = false;
    BuildError error;

    std::string package_path;   // <staging_root>/shortcut.click
    std::string package_sha256;
    std::string identifier;
    std::string icon_filename;
};

// Fixed container member order
std::vector<std::string> container_member_names();

// Build a package for `request`.
// The staging root is cleared first; on success the finished package is at
// <staging_root>/shortcut.click and the staging tree is left in place.
// The pipeline stops at the first failure.
BuildResult build_package(const PackageRequest& request, const BuildOptions& options = {});

} // namespace webber
