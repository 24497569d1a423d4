#include <doctest/doctest.h>
#include <webber/digest.hpp>
#include <webber/platform.hpp>

#include "test_helpers.hpp"

#include <filesystem>

namespace fs = std::filesystem;

using namespace webber;
using webber::test::TempDir;
using webber::test::read_text;
using webber::test::to_bytes;

TEST_CASE("write_file truncates existing content") {
    TempDir dir;
    std::string path = dir.sub("file.txt");

    REQUIRE(write_file(path, "a much longer first version").ok);
    REQUIRE(write_file(path, "short").ok);
    CHECK(read_text(path) == "short");
}

TEST_CASE("write_file reports missing parent directories") {
    TempDir dir;
    auto result = write_file(dir.sub("missing/file.txt"), "x");
    CHECK_FALSE(result.ok);
    CHECK(result.error.find("failed to create file") != std::string::npos);
}

TEST_CASE("read_file round trips binary data") {
    TempDir dir;
    std::vector<uint8_t> data = {0x00, 0x01, 0xfe, 0xff, '\n'};
    REQUIRE(write_file(dir.sub("bin"), data).ok);

    auto result = read_file(dir.sub("bin"));
    REQUIRE(result.ok);
    CHECK(result.data == data);

    CHECK_FALSE(read_file(dir.sub("absent")).ok);
}

TEST_CASE("create_directory and remove_directory") {
    TempDir dir;
    std::string sub = dir.sub("sub");

    REQUIRE(create_directory(sub).ok);
    CHECK(fs::is_directory(sub));
    CHECK_FALSE(create_directory(sub).ok);

    REQUIRE(write_file(sub + "/f", "x").ok);
    REQUIRE(remove_directory(sub).ok);
    CHECK_FALSE(path_exists(sub));

    // Removing something that is not there is not an error
    CHECK(remove_directory(sub).ok);
}

TEST_CASE("join_path uses forward slashes") {
    CHECK(join_path("/a/b", "c") == "/a/b/c");
    CHECK(to_portable_path("a\\b\\c") == "a/b/c");
}

TEST_CASE("compute_sha256 of known inputs") {
    auto empty = compute_sha256(std::vector<uint8_t>{});
    REQUIRE(empty.ok);
    CHECK(empty.hex_digest == "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    auto abc = compute_sha256(to_bytes("abc"));
    REQUIRE(abc.ok);
    CHECK(abc.hex_digest == "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST_CASE("compute_sha256 of a file matches the in-memory digest") {
    TempDir dir;
    REQUIRE(write_file(dir.sub("abc"), "abc").ok);

    auto from_file = compute_sha256(dir.sub("abc"));
    REQUIRE(from_file.ok);
    CHECK(from_file.hex_digest == compute_sha256(to_bytes("abc")).hex_digest);

    CHECK_FALSE(compute_sha256(dir.sub("absent")).ok);
}
