#include "webber/staging.hpp"
#include "webber/content.hpp"
#include "webber/icon.hpp"
#include "webber/identifier.hpp"
#include "webber/platform.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <system_error>

namespace webber {

namespace fs = std::filesystem;

namespace {

constexpr const char* CACHE_SUBDIR = "webber.timsueberkrueb/click-build";

StagingResult fail(const std::string& operation, const std::string& cause,
                   BuildErrorKind kind = BuildErrorKind::Filesystem) {
    StagingResult result;
    result.error.kind = kind;
    result.error.operation = operation;
    result.error.cause = cause;
    return result;
}

// A directory may be cleared only if it is empty or holds nothing but
// entries of the staging layout
bool looks_like_staging_area(const StagingPaths& paths, std::string& reason) {
    std::error_code ec;
    if (!fs::exists(paths.root, ec)) {
        return true;
    }
    if (!fs::is_directory(paths.root, ec)) {
        reason = "not a directory";
        return false;
    }

    const fs::path root(paths.root);
    const fs::path known[] = {
        fs::path(paths.control_dir).lexically_relative(root),
        fs::path(paths.data_dir).lexically_relative(root),
        fs::path(paths.debian_binary).lexically_relative(root),
        fs::path(paths.click_binary).lexically_relative(root),
        fs::path(paths.control_tarball).lexically_relative(root),
        fs::path(paths.data_tarball).lexically_relative(root),
        fs::path(paths.package).lexically_relative(root),
    };

    for (fs::directory_iterator it(root, ec), end; !ec && it != end; it.increment(ec)) {
        fs::path name = it->path().filename();
        if (std::find(std::begin(known), std::end(known), name) == std::end(known)) {
            reason = "unexpected entry " + name.string();
            return false;
        }
    }
    if (ec) {
        reason = ec.message();
        return false;
    }
    return true;
}

// Write one staged file; `label` is the path relative to the staging root
bool stage_file(const std::string& path, const std::string& label,
                const std::string& content, StagingResult& failure) {
    auto written = write_file(path, content);
    if (!written.ok) {
        failure = fail("write " + label, written.error);
        return false;
    }
    spdlog::debug("staged {} ({} bytes)", label, content.size());
    return true;
}

} // namespace

StagingPaths get_staging_paths(const std::string& staging_root) {
    StagingPaths paths;
    paths.root = staging_root;
    paths.control_dir = join_path(staging_root, "control");
    paths.data_dir = join_path(staging_root, "data");
    paths.debian_binary = join_path(staging_root, "debian-binary");
    paths.click_binary = join_path(staging_root, "click_binary");
    paths.control_tarball = join_path(staging_root, "control.tar.gz");
    paths.data_tarball = join_path(staging_root, "data.tar.gz");
    paths.package = join_path(staging_root, "shortcut.click");
    return paths;
}

std::string default_staging_root() {
    auto xdg_cache = get_env("XDG_CACHE_HOME");
    if (xdg_cache && !xdg_cache->empty()) {
        return join_path(*xdg_cache, CACHE_SUBDIR);
    }

    auto home = get_env("HOME");
    if (home && !home->empty()) {
        return join_path(join_path(*home, ".cache"), CACHE_SUBDIR);
    }

    return join_path(".cache", CACHE_SUBDIR);
}

StagingResult reset_staging_area(const StagingPaths& paths) {
    if (paths.root.empty()) {
        return fail("prepare staging area", "staging root is empty");
    }

    std::string reason;
    if (!looks_like_staging_area(paths, reason)) {
        return fail("refusing to clear " + paths.root + " (not a staging area)", reason);
    }

    auto removed = remove_directory(paths.root);
    if (!removed.ok) {
        return fail("clear staging area " + paths.root, removed.error);
    }

    std::error_code ec;
    fs::create_directories(paths.root, ec);
    if (ec) {
        return fail("create staging area " + paths.root, ec.message());
    }

    for (const auto& dir : {paths.control_dir, paths.data_dir}) {
        auto created = create_directory(dir);
        if (!created.ok) {
            return fail("create directory " + dir, created.error);
        }
    }

    spdlog::debug("staging area ready at {}", paths.root);

    StagingResult result;
    result.ok = true;
    return result;
}

StagingResult populate_staging_area(const StagingPaths& paths,
                                    const PackageRequest& request,
                                    const Fetcher& fetcher) {
    StagingResult failure;
    std::string identifier = derive_identifier(request.url);

    if (!stage_file(paths.click_binary, "click_binary", click_binary_content(), failure) ||
        !stage_file(paths.debian_binary, "debian-binary", debian_binary_content(), failure)) {
        return failure;
    }

    if (!stage_file(join_path(paths.control_dir, "control"), "control/control",
                    control_content(identifier), failure) ||
        !stage_file(join_path(paths.control_dir, "manifest"), "control/manifest",
                    manifest_content(identifier, request.name), failure)) {
        return failure;
    }

    if (!stage_file(join_path(paths.data_dir, "preinst"), "data/preinst",
                    preinst_content(), failure) ||
        !stage_file(join_path(paths.data_dir, APPARMOR_FILENAME),
                    std::string("data/") + APPARMOR_FILENAME, apparmor_content(), failure)) {
        return failure;
    }

    auto icon = resolve_icon(request.icon_url, paths.data_dir, fetcher);
    if (!icon.ok) {
        std::string operation = icon.error_kind == BuildErrorKind::Network
            ? "fetch icon " + request.icon_url
            : "write icon";
        return fail(operation, icon.error, icon.error_kind);
    }

    if (!stage_file(join_path(paths.data_dir, DESKTOP_FILENAME),
                    std::string("data/") + DESKTOP_FILENAME,
                    desktop_content(request.name, request.url, request.url_patterns,
                                    icon.filename, request.theme_color),
                    failure)) {
        return failure;
    }

    StagingResult result;
    result.ok = true;
    result.identifier = identifier;
    result.icon_filename = icon.filename;
    return result;
}

} // namespace webber
