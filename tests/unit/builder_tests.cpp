#include <doctest/doctest.h>
#include <webber/ar_archive.hpp>
#include <webber/builder.hpp>
#include <webber/content.hpp>
#include <webber/icon.hpp>
#include <webber/platform.hpp>
#include <webber/tarball.hpp>

#include "test_helpers.hpp"

#include <nlohmann/json.hpp>

#include <filesystem>

namespace fs = std::filesystem;

using namespace webber;
using webber::test::TempDir;
using webber::test::to_string;

namespace {

struct FakeFetcher {
    std::vector<std::string> requests;
    std::vector<uint8_t> body = {0x89, 'P', 'N', 'G', '\r', '\n'};
    bool fail = false;

    Fetcher fetcher() {
        return [this](const std::string& url) {
            requests.push_back(url);
            FetchResult result;
            if (fail) {
                result.error = "HTTP 503";
                result.http_status = 503;
                return result;
            }
            result.ok = true;
            result.http_status = 200;
            result.data = body;
            return result;
        };
    }
};

PackageRequest example_request() {
    PackageRequest request;
    request.url = "https://Example.COM/path";
    request.name = "Example";
    request.theme_color = "#336699";
    request.icon_url = "https://example.com/icon";
    request.url_patterns = "https?://example.com/*";
    return request;
}

ArListing read_package(const std::string& path) {
    auto file = read_file(path);
    REQUIRE(file.ok);
    return read_ar_archive(file.data);
}

std::vector<std::string> tar_paths(const std::vector<uint8_t>& data) {
    auto listing = read_tarball(data);
    REQUIRE(listing.ok);
    std::vector<std::string> paths;
    for (const auto& entry : listing.entries) {
        paths.push_back(entry.path);
    }
    return paths;
}

std::string tar_file(const std::vector<uint8_t>& data, const std::string& path) {
    auto listing = read_tarball(data);
    REQUIRE(listing.ok);
    for (const auto& entry : listing.entries) {
        if (entry.path == path) {
            return to_string(entry.data);
        }
    }
    FAIL("missing tar entry " << path);
    return {};
}

} // namespace

TEST_CASE("build_package produces a four-member container in fixed order") {
    TempDir dir;
    FakeFetcher fake;

    BuildOptions options;
    options.staging_root = dir.sub("stage");
    options.fetcher = fake.fetcher();

    auto result = build_package(example_request(), options);
    REQUIRE(result.ok);

    CHECK(result.package_path == join_path(options.staging_root, "shortcut.click"));
    CHECK(result.identifier == "webapp-example-com");
    CHECK(result.icon_filename == "icon.svg");
    CHECK(result.package_sha256.size() == 64);
    CHECK(fake.requests.empty());

    auto listing = read_package(result.package_path);
    REQUIRE(listing.ok);
    REQUIRE(listing.members.size() == 4);

    std::vector<std::string> names;
    for (const auto& member : listing.members) {
        names.push_back(member.name);
    }
    CHECK(names == container_member_names());
    CHECK(names == std::vector<std::string>{"debian-binary", "control.tar.gz", "data.tar.gz", "_click-binary"});

    CHECK(to_string(listing.members[0].data) == "2.0\n");
    CHECK(to_string(listing.members[3].data) == "0.4\n");
}

TEST_CASE("build_package tarballs unpack at the archive root") {
    TempDir dir;
    FakeFetcher fake;

    BuildOptions options;
    options.staging_root = dir.sub("stage");
    options.fetcher = fake.fetcher();

    auto result = build_package(example_request(), options);
    REQUIRE(result.ok);

    auto listing = read_package(result.package_path);
    REQUIRE(listing.ok);
    REQUIRE(listing.members.size() == 4);

    CHECK(tar_paths(listing.members[1].data) ==
          std::vector<std::string>{"./", "./control", "./manifest"});
    CHECK(tar_paths(listing.members[2].data) ==
          std::vector<std::string>{"./", "./icon.svg", "./preinst", "./shortcut.apparmor", "./shortcut.desktop"});
}

TEST_CASE("build_package manifest hooks match the control package name") {
    TempDir dir;
    FakeFetcher fake;

    BuildOptions options;
    options.staging_root = dir.sub("stage");
    options.fetcher = fake.fetcher();

    auto result = build_package(example_request(), options);
    REQUIRE(result.ok);

    auto listing = read_package(result.package_path);
    REQUIRE(listing.ok);

    std::string control = tar_file(listing.members[1].data, "./control");
    auto manifest = nlohmann::json::parse(tar_file(listing.members[1].data, "./manifest"));

    std::string package_line = "Package: " + result.identifier + ".webber\n";
    CHECK(control.find(package_line) == 0);

    REQUIRE(manifest["hooks"].size() == 1);
    CHECK(manifest["hooks"].begin().key() == result.identifier + ".webber");
    CHECK(manifest["name"] == result.identifier + ".webber");
    CHECK(manifest["title"] == "Example");
}

TEST_CASE("build_package stores fetched icons verbatim") {
    TempDir dir;
    FakeFetcher fake;

    BuildOptions options;
    options.staging_root = dir.sub("stage");
    options.fetcher = fake.fetcher();

    auto request = example_request();
    request.icon_url = "https://example.com/static/icon.png";

    auto result = build_package(request, options);
    REQUIRE(result.ok);
    CHECK(result.icon_filename == "icon.png");
    CHECK(fake.requests == std::vector<std::string>{"https://example.com/static/icon.png"});

    auto listing = read_package(result.package_path);
    REQUIRE(listing.ok);
    CHECK(tar_file(listing.members[2].data, "./icon.png") == to_string(fake.body));
    CHECK(tar_file(listing.members[2].data, "./shortcut.desktop").find("Icon=icon.png\n") != std::string::npos);
}

TEST_CASE("build_package fails on icon fetch errors and leaves no package") {
    TempDir dir;
    FakeFetcher fake;
    fake.fail = true;

    BuildOptions options;
    options.staging_root = dir.sub("stage");
    options.fetcher = fake.fetcher();

    auto request = example_request();
    request.icon_url = "https://example.com/icon.png";

    auto result = build_package(request, options);
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == BuildErrorKind::Network);
    CHECK(result.error.cause == "HTTP 503");
    CHECK(result.error.message().find("HTTP 503") != std::string::npos);
    CHECK_FALSE(fs::exists(join_path(options.staging_root, "shortcut.click")));
    CHECK_FALSE(fs::exists(join_path(options.staging_root, "data/icon.svg")));
}

TEST_CASE("build_package discards a stale package from an earlier build") {
    TempDir dir;
    FakeFetcher fake;

    BuildOptions options;
    options.staging_root = dir.sub("stage");
    options.fetcher = fake.fetcher();

    REQUIRE(build_package(example_request(), options).ok);

    fake.fail = true;
    auto request = example_request();
    request.icon_url = "https://example.com/icon.png";

    CHECK_FALSE(build_package(request, options).ok);
    CHECK_FALSE(fs::exists(join_path(options.staging_root, "shortcut.click")));
}

TEST_CASE("back-to-back builds leave no residue") {
    TempDir dir;
    FakeFetcher fake;

    BuildOptions options;
    options.staging_root = dir.sub("stage");
    options.fetcher = fake.fetcher();

    auto first_request = example_request();
    first_request.icon_url = "https://example.com/icon.png";
    auto first = build_package(first_request, options);
    REQUIRE(first.ok);
    CHECK(fs::exists(join_path(options.staging_root, "data/icon.png")));

    auto second_request = example_request();
    second_request.url = "https://other.org";
    second_request.name = "Other";
    auto second = build_package(second_request, options);
    REQUIRE(second.ok);

    CHECK(second.identifier == "webapp-other-org");
    CHECK_FALSE(fs::exists(join_path(options.staging_root, "data/icon.png")));
    CHECK(fs::exists(join_path(options.staging_root, "data/icon.svg")));

    auto listing = read_package(second.package_path);
    REQUIRE(listing.ok);
    CHECK(tar_paths(listing.members[2].data) ==
          std::vector<std::string>{"./", "./icon.svg", "./preinst", "./shortcut.apparmor", "./shortcut.desktop"});
    auto manifest = nlohmann::json::parse(tar_file(listing.members[1].data, "./manifest"));
    CHECK(manifest["title"] == "Other");
}

TEST_CASE("build_package is reproducible") {
    TempDir dir;
    FakeFetcher fake;

    BuildOptions first_options;
    first_options.staging_root = dir.sub("one");
    first_options.fetcher = fake.fetcher();

    BuildOptions second_options = first_options;
    second_options.staging_root = dir.sub("two");

    auto first = build_package(example_request(), first_options);
    auto second = build_package(example_request(), second_options);
    REQUIRE(first.ok);
    REQUIRE(second.ok);
    CHECK(first.package_sha256 == second.package_sha256);
}

TEST_CASE("build_package surfaces staging errors") {
    TempDir dir;
    REQUIRE(write_file(dir.sub("blocker"), "file").ok);

    FakeFetcher fake;
    BuildOptions options;
    options.staging_root = dir.sub("blocker/stage");
    options.fetcher = fake.fetcher();

    auto result = build_package(example_request(), options);
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == BuildErrorKind::Filesystem);
    CHECK_FALSE(result.error.operation.empty());
}

TEST_CASE("build_package keeps files in a staging root it did not create") {
    TempDir dir;
    REQUIRE(create_directory(dir.sub("home")).ok);
    REQUIRE(write_file(dir.sub("home/thesis.tex"), "months of work").ok);

    FakeFetcher fake;
    BuildOptions options;
    options.staging_root = dir.sub("home");
    options.fetcher = fake.fetcher();

    auto result = build_package(example_request(), options);
    CHECK_FALSE(result.ok);
    CHECK(result.error.kind == BuildErrorKind::Filesystem);
    CHECK(webber::test::read_text(dir.sub("home/thesis.tex")) == "months of work");
}
