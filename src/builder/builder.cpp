#include "webber/builder.hpp"
#include "webber/ar_archive.hpp"
#include "webber/digest.hpp"
#include "webber/platform.hpp"
#include "webber/staging.hpp"
#include "webber/tarball.hpp"

#include <spdlog/spdlog.h>

namespace webber {

namespace {

BuildResult fail(BuildErrorKind kind, const std::string& operation, const std::string& cause) {
    BuildResult result;
    result.error.kind = kind;
    result.error.operation = operation;
    result.error.cause = cause;
    spdlog::error("build failed: {}: {}", operation, cause);
    return result;
}

// Pack one staged subtree and store the tarball next to it
bool build_tarball(const std::string& dir, const std::string& output,
                   const std::string& label, BuildResult& failure) {
    auto packed = pack_subtree(dir);
    if (!packed.ok) {
        failure = fail(BuildErrorKind::Archive, "create " + label, packed.error);
        return false;
    }

    auto written = write_file(output, packed.archive_data);
    if (!written.ok) {
        failure = fail(BuildErrorKind::Filesystem, "write " + label, written.error);
        return false;
    }

    spdlog::debug("created {} ({} bytes)", label, packed.archive_data.size());
    return true;
}

} // namespace

std::vector<std::string> container_member_names() {
    return {"debian-binary", "control.tar.gz", "data.tar.gz", "_click-binary"};
}

BuildResult build_package(const PackageRequest& request, const BuildOptions& options) {
    std::string root = options.staging_root.empty() ? default_staging_root() : options.staging_root;
    Fetcher fetcher = options.fetcher ? options.fetcher : make_http_fetcher();

    spdlog::info("building package for {} in {}", request.url, root);

    StagingPaths paths = get_staging_paths(root);

    auto reset = reset_staging_area(paths);
    if (!reset.ok) {
        return fail(reset.error.kind, reset.error.operation, reset.error.cause);
    }

    auto staged = populate_staging_area(paths, request, fetcher);
    if (!staged.ok) {
        return fail(staged.error.kind, staged.error.operation, staged.error.cause);
    }

    BuildResult failure;
    if (!build_tarball(paths.control_dir, paths.control_tarball, "control.tar.gz", failure) ||
        !build_tarball(paths.data_dir, paths.data_tarball, "data.tar.gz", failure)) {
        return failure;
    }

    auto names = container_member_names();
    std::vector<ArchiveMember> members = {
        {paths.debian_binary, names[0]},
        {paths.control_tarball, names[1]},
        {paths.data_tarball, names[2]},
        {paths.click_binary, names[3]},
    };

    auto archived = write_ar_archive(paths.package, members);
    if (!archived.ok) {
        return fail(BuildErrorKind::Archive, "assemble " + std::string(PACKAGE_FILENAME), archived.error);
    }

    auto digest = compute_sha256(paths.package);
    if (!digest.ok) {
        return fail(BuildErrorKind::Filesystem, "hash " + std::string(PACKAGE_FILENAME), digest.error);
    }

    BuildResult result;
    result.ok = true;
    result.package_path = paths.package;
    result.package_sha256 = digest.hex_digest;
    result.identifier = staged.identifier;
    result.icon_filename = staged.icon_filename;

    spdlog::info("created {} ({})", result.package_path, result.identifier);
    return result;
}

} // namespace webber
