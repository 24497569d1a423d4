/**
 * webber CLI - build command
 *
 * Stage, pack and assemble a click package for one web site.
 */

#include "../common.hpp"
#include <webber/builder.hpp>
#include <webber/staging.hpp>
#include <CLI/CLI.hpp>

namespace webber::cli::commands {

namespace {

struct BuildCommandOptions {
    webber::PackageRequest request;
    std::string staging_dir;
    long timeout = 0;
};

int cmd_build(const GlobalOptions& opts, const BuildCommandOptions& build_opts) {
    configure_logging(opts);

    webber::BuildOptions options;
    options.staging_root = build_opts.staging_dir.empty()
        ? webber::default_staging_root()
        : build_opts.staging_dir;

    webber::FetchOptions fetch_options;
    fetch_options.timeout_seconds = build_opts.timeout;
    fetch_options.connect_timeout_seconds = build_opts.timeout;
    options.fetcher = webber::make_http_fetcher(fetch_options);

    auto result = webber::build_package(build_opts.request, options);

    if (!result.ok) {
        if (opts.json) {
            nlohmann::json j;
            j["ok"] = false;
            j["error"] = result.error.message();
            j["kind"] = webber::error_kind_to_string(result.error.kind);
            j["operation"] = result.error.operation;
            j["cause"] = result.error.cause;
            output_json(j);
        } else {
            print_error(result.error.message(), false);
        }
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["package"] = result.package_path;
        j["sha256"] = result.package_sha256;
        j["identifier"] = result.identifier;
        j["icon"] = result.icon_filename;
        output_json(j);
    } else if (opts.quiet) {
        std::cout << result.package_path << std::endl;
    } else {
        std::cout << "Created package: " << result.package_path << std::endl;
        std::cout << "  Identifier: " << result.identifier << std::endl;
        std::cout << "  Icon: " << result.icon_filename << std::endl;
        std::cout << "  SHA-256: " << result.package_sha256 << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_build(CLI::App* app, GlobalOptions& opts) {
    static BuildCommandOptions build_opts;

    app->add_option("--url", build_opts.request.url, "Web site address")->required();
    app->add_option("--name", build_opts.request.name, "Display name")->required();
    app->add_option("--theme-color", build_opts.request.theme_color, "Splash screen color");
    app->add_option("--icon-url", build_opts.request.icon_url, "Icon location");
    app->add_option("--url-patterns", build_opts.request.url_patterns,
                    "URL patterns kept inside the app");
    app->add_option("--staging-dir", build_opts.staging_dir,
                    "Staging directory, cleared before each build; must be empty or an earlier staging directory (default: cache directory)");
    app->add_option("--timeout", build_opts.timeout, "Icon download timeout in seconds (0 = none)")
        ->check(CLI::NonNegativeNumber);

    app->callback([&opts]() {
        std::exit(cmd_build(opts, build_opts));
    });
}

} // namespace webber::cli::commands
