/**
 * webber CLI - appname command
 */

#include "../common.hpp"
#include <webber/identifier.hpp>
#include <CLI/CLI.hpp>

namespace webber::cli::commands {

namespace {

struct AppnameOptions {
    std::string url;
};

int cmd_appname(const GlobalOptions& opts, const AppnameOptions& appname_opts) {
    configure_logging(opts);

    auto selection = webber::select_identifier_source(appname_opts.url);
    std::string identifier = webber::derive_identifier(appname_opts.url);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["identifier"] = identifier;
        j["package"] = webber::package_name(identifier);
        j["source"] = selection.source == webber::IdentifierSource::Host ? "host" : "raw";
        output_json(j);
    } else {
        std::cout << identifier << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_appname(CLI::App* app, GlobalOptions& opts) {
    static AppnameOptions appname_opts;

    app->add_option("url", appname_opts.url, "Web site address")->required();

    app->callback([&opts]() {
        std::exit(cmd_appname(opts, appname_opts));
    });
}

} // namespace webber::cli::commands
