#pragma once

#include "webber/fetch.hpp"
#include "webber/types.hpp"

#include <string>

namespace webber {

// ============================================================================
// Staging Area
// ============================================================================
//
// Layout under a staging root:
//   <root>/debian-binary
//   <root>/click_binary
//   <root>/control/{control, manifest}
//   <root>/data/{preinst, shortcut.apparmor, shortcut.desktop, icon.*}
//   <root>/control.tar.gz, <root>/data.tar.gz      (tarball step)
//   <root>/shortcut.click                           (container step)

struct StagingPaths {
    std::string root;
    std::string control_dir;
    std::string data_dir;
    std::string debian_binary;
    std::string click_binary;
    std::string control_tarball;
    std::string data_tarball;
    std::string package;
};

StagingPaths get_staging_paths(const std::string& staging_root);

// Default staging root: $XDG_CACHE_HOME/webber.timsueberkrueb/click-build,
// then $HOME/.cache/..., then a relative .cache/...
std::string default_staging_root();

struct StagingResult {
    bool ok = false;
    BuildError error;
    std::string identifier;
    std::string icon_filename;
};

// Remove the staging root if present and recreate it with empty
// control/ and data/ subtrees. A non-empty root holding anything other
// than staging entries is left untouched and reported as an error.
StagingResult reset_staging_area(const StagingPaths& paths);

// Write every generated file and the icon for `request` into a freshly
// reset staging area.
StagingResult populate_staging_area(const StagingPaths& paths,
                                    const PackageRequest& request,
                                    const Fetcher& fetcher);

} // namespace webber
