/**
 * webber CLI - Common utilities and types
 */

#pragma once

#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <iostream>
#include <memory>
#include <string>

namespace webber::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Log level selected by the global flags: -v wins, -q and --json
 * leave only errors, warnings otherwise.
 */
inline spdlog::level::level_enum log_level_for(const GlobalOptions& opts) {
    if (opts.verbose) {
        return spdlog::level::debug;
    }
    if (opts.quiet || opts.json) {
        return spdlog::level::err;
    }
    return spdlog::level::warn;
}

/**
 * Route library logging to stderr at a level matching the flags.
 * stdout is reserved for command output, so JSON stays parseable.
 */
inline void configure_logging(const GlobalOptions& opts) {
    auto logger = std::make_shared<spdlog::logger>(
        "webber", std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    spdlog::set_default_logger(logger);
    spdlog::set_level(log_level_for(opts));
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    std::cout << j.dump(2) << std::endl;
}

} // namespace webber::cli
