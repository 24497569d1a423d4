#pragma once

#include <string>

namespace webber {

// ============================================================================
// Generated File Contents
// ============================================================================
//
// Pure builders for every text file staged into a package. Same inputs
// always produce byte-identical output.

inline constexpr const char* PACKAGE_VERSION = "1.0.0";
inline constexpr const char* CLICK_VERSION = "0.4";
inline constexpr const char* DEBIAN_BINARY_VERSION = "2.0";
inline constexpr const char* PACKAGE_MAINTAINER = "Webber <noreply@ubports.com>";
inline constexpr const char* PACKAGE_DESCRIPTION = "Shortcut";
inline constexpr const char* PACKAGE_FRAMEWORK = "ubuntu-sdk-16.04";
inline constexpr const char* PACKAGE_INSTALLED_SIZE = "30";

inline constexpr const char* APPARMOR_FILENAME = "shortcut.apparmor";
inline constexpr const char* DESKTOP_FILENAME = "shortcut.desktop";

// control/control
std::string control_content(const std::string& identifier);

// control/manifest (JSON)
std::string manifest_content(const std::string& identifier, const std::string& title);

// data/preinst
std::string preinst_content();

// data/shortcut.apparmor (JSON)
std::string apparmor_content();

// data/shortcut.desktop
std::string desktop_content(const std::string& title,
                            const std::string& url,
                            const std::string& url_patterns,
                            const std::string& icon_filename,
                            const std::string& theme_color);

// debian-binary marker
std::string debian_binary_content();

// click_binary marker (stored as _click-binary)
std::string click_binary_content();

} // namespace webber
