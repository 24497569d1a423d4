/**
 * webber CLI - Entry Point
 *
 * Turns a web site description into an installable click package.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

namespace webber::cli::commands {
    void setup_build(CLI::App* app, GlobalOptions& opts);
    void setup_inspect(CLI::App* app, GlobalOptions& opts);
    void setup_appname(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace webber::cli;

    CLI::App app{"webber - package web sites as click applications"};
    app.set_version_flag("-V,--version", WEBBER_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    auto* build_cmd = app.add_subcommand("build", "Build a package for a web site");
    commands::setup_build(build_cmd, opts);

    auto* inspect_cmd = app.add_subcommand("inspect", "List the contents of a package");
    commands::setup_inspect(inspect_cmd, opts);

    auto* appname_cmd = app.add_subcommand("appname", "Print the identifier derived from a URL");
    commands::setup_appname(appname_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
