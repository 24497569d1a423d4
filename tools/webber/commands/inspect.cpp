/**
 * webber CLI - inspect command
 *
 * List container members and the entries of each tarball member.
 */

#include "../common.hpp"
#include <webber/ar_archive.hpp>
#include <webber/platform.hpp>
#include <webber/tarball.hpp>
#include <CLI/CLI.hpp>

namespace webber::cli::commands {

namespace {

struct InspectOptions {
    std::string package;
};

bool is_tarball_member(const std::string& name) {
    const std::string suffix = ".tar.gz";
    return name.size() > suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
}

int cmd_inspect(const GlobalOptions& opts, const InspectOptions& inspect_opts) {
    configure_logging(opts);

    auto file = webber::read_file(inspect_opts.package);
    if (!file.ok) {
        print_error(file.error, opts.json);
        return 1;
    }

    auto listing = webber::read_ar_archive(file.data);
    if (!listing.ok) {
        print_error(inspect_opts.package + ": " + listing.error, opts.json);
        return 1;
    }

    nlohmann::json members = nlohmann::json::array();

    for (const auto& member : listing.members) {
        nlohmann::json m;
        m["name"] = member.name;
        m["size"] = member.data.size();

        if (!opts.json) {
            std::cout << member.name << " (" << member.data.size() << " bytes)" << std::endl;
        }

        if (is_tarball_member(member.name)) {
            auto tar = webber::read_tarball(member.data);
            if (!tar.ok) {
                print_error(member.name + ": " + tar.error, opts.json);
                return 1;
            }

            nlohmann::json entries = nlohmann::json::array();
            for (const auto& entry : tar.entries) {
                entries.push_back(entry.path);
                if (!opts.json) {
                    std::cout << "  " << entry.path;
                    if (entry.type == webber::TarEntryType::RegularFile) {
                        std::cout << " (" << entry.data.size() << " bytes)";
                    }
                    std::cout << std::endl;
                }
            }
            m["entries"] = entries;
        }

        members.push_back(m);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["package"] = inspect_opts.package;
        j["members"] = members;
        output_json(j);
    }
    return 0;
}

} // anonymous namespace

void setup_inspect(CLI::App* app, GlobalOptions& opts) {
    static InspectOptions inspect_opts;

    app->add_option("package", inspect_opts.package, "Package file (.click)")->required();

    app->callback([&opts]() {
        std::exit(cmd_inspect(opts, inspect_opts));
    });
}

} // namespace webber::cli::commands
