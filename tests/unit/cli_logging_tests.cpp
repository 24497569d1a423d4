#include <doctest/doctest.h>

#include "common.hpp"

using webber::cli::GlobalOptions;
using webber::cli::configure_logging;
using webber::cli::log_level_for;

TEST_CASE("log_level_for defaults to warnings") {
    GlobalOptions opts;
    CHECK(log_level_for(opts) == spdlog::level::warn);
}

TEST_CASE("log_level_for keeps errors when quiet") {
    GlobalOptions opts;
    opts.quiet = true;
    CHECK(log_level_for(opts) == spdlog::level::err);

    GlobalOptions json;
    json.json = true;
    CHECK(log_level_for(json) == spdlog::level::err);
}

TEST_CASE("log_level_for lets verbose win") {
    GlobalOptions opts;
    opts.verbose = true;
    opts.quiet = true;
    CHECK(log_level_for(opts) == spdlog::level::debug);
}

TEST_CASE("configure_logging installs the level and can run twice") {
    GlobalOptions opts;
    opts.quiet = true;
    configure_logging(opts);
    configure_logging(opts);
    CHECK(spdlog::default_logger()->level() == spdlog::level::err);
    CHECK(spdlog::default_logger()->should_log(spdlog::level::err));
    CHECK_FALSE(spdlog::default_logger()->should_log(spdlog::level::warn));

    configure_logging(GlobalOptions{});
    CHECK(spdlog::get_level() == spdlog::level::warn);
}
