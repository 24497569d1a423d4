#include "webber/content.hpp"
#include "webber/identifier.hpp"

#include <nlohmann/json.hpp>

#include <sstream>

namespace webber {

namespace {

// 4-space indented, trailing newline. Invalid UTF-8 in user-supplied
// strings is replaced rather than thrown.
std::string dump_json(const nlohmann::ordered_json& j) {
    return j.dump(4, ' ', false, nlohmann::ordered_json::error_handler_t::replace) + "\n";
}

} // namespace

std::string control_content(const std::string& identifier) {
    std::ostringstream out;
    out << "Package: " << package_name(identifier) << "\n"
        << "Version: " << PACKAGE_VERSION << "\n"
        << "Click-Version: " << CLICK_VERSION << "\n"
        << "Architecture: all\n"
        << "Maintainer: " << PACKAGE_MAINTAINER << "\n"
        << "Description: " << PACKAGE_DESCRIPTION << "\n";
    return out.str();
}

std::string manifest_content(const std::string& identifier, const std::string& title) {
    nlohmann::ordered_json hook;
    hook["apparmor"] = APPARMOR_FILENAME;
    hook["desktop"] = DESKTOP_FILENAME;

    nlohmann::ordered_json j;
    j["architecture"] = "all";
    j["description"] = PACKAGE_DESCRIPTION;
    j["framework"] = PACKAGE_FRAMEWORK;
    j["hooks"][package_name(identifier)] = hook;
    j["installed-size"] = PACKAGE_INSTALLED_SIZE;
    j["maintainer"] = PACKAGE_MAINTAINER;
    j["name"] = package_name(identifier);
    j["title"] = title;
    j["version"] = PACKAGE_VERSION;
    return dump_json(j);
}

std::string preinst_content() {
    return "#! /bin/sh\n"
           "echo \"Click packages may not be installed directly using dpkg.\"\n"
           "echo \"Use 'click install' instead.\"\n"
           "exit 1";
}

std::string apparmor_content() {
    nlohmann::ordered_json j;
    j["template"] = "ubuntu-webapp";
    j["policy_groups"] = nlohmann::ordered_json::array({"networking", "webview"});
    j["policy_version"] = 16.04;
    return dump_json(j);
}

std::string desktop_content(const std::string& title,
                            const std::string& url,
                            const std::string& url_patterns,
                            const std::string& icon_filename,
                            const std::string& theme_color) {
    std::ostringstream out;
    out << "[Desktop Entry]\n"
        << "Name=" << title << "\n"
        << "Exec=webapp-container --webappUrlPatterns=" << url_patterns
        << " --store-session-cookies " << url << "\n"
        << "Icon=" << icon_filename << "\n"
        << "Terminal=false\n"
        << "Type=Application\n"
        << "X-Ubuntu-Touch=true\n"
        << "X-Ubuntu-Splash-Color=" << theme_color << "\n";
    return out.str();
}

std::string debian_binary_content() {
    return std::string(DEBIAN_BINARY_VERSION) + "\n";
}

std::string click_binary_content() {
    return std::string(CLICK_VERSION) + "\n";
}

} // namespace webber
