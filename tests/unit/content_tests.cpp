#include <doctest/doctest.h>
#include <webber/content.hpp>

#include <nlohmann/json.hpp>

using namespace webber;

TEST_CASE("control_content") {
    CHECK(control_content("webapp-example-com") ==
          "Package: webapp-example-com.webber\n"
          "Version: 1.0.0\n"
          "Click-Version: 0.4\n"
          "Architecture: all\n"
          "Maintainer: Webber <noreply@ubports.com>\n"
          "Description: Shortcut\n");
}

TEST_CASE("manifest_content matches the expected layout") {
    CHECK(manifest_content("webapp-example-com", "Example") ==
          "{\n"
          "    \"architecture\": \"all\",\n"
          "    \"description\": \"Shortcut\",\n"
          "    \"framework\": \"ubuntu-sdk-16.04\",\n"
          "    \"hooks\": {\n"
          "        \"webapp-example-com.webber\": {\n"
          "            \"apparmor\": \"shortcut.apparmor\",\n"
          "            \"desktop\": \"shortcut.desktop\"\n"
          "        }\n"
          "    },\n"
          "    \"installed-size\": \"30\",\n"
          "    \"maintainer\": \"Webber <noreply@ubports.com>\",\n"
          "    \"name\": \"webapp-example-com.webber\",\n"
          "    \"title\": \"Example\",\n"
          "    \"version\": \"1.0.0\"\n"
          "}\n");
}

TEST_CASE("manifest_content escapes the title") {
    std::string title = "Say \"hi\" \\ bye\n";
    auto j = nlohmann::json::parse(manifest_content("webapp-x", title));
    CHECK(j["title"] == title);
    CHECK(j["name"] == "webapp-x.webber");
    CHECK(j["hooks"].contains("webapp-x.webber"));
}

TEST_CASE("manifest_content keeps UTF-8 titles") {
    auto j = nlohmann::json::parse(manifest_content("webapp-x", "Caf\xc3\xa9"));
    CHECK(j["title"] == "Caf\xc3\xa9");
}

TEST_CASE("apparmor_content") {
    CHECK(apparmor_content() ==
          "{\n"
          "    \"template\": \"ubuntu-webapp\",\n"
          "    \"policy_groups\": [\n"
          "        \"networking\",\n"
          "        \"webview\"\n"
          "    ],\n"
          "    \"policy_version\": 16.04\n"
          "}\n");
}

TEST_CASE("preinst_content refuses direct installation") {
    std::string script = preinst_content();
    CHECK(script.rfind("#! /bin/sh\n", 0) == 0);
    CHECK(script.find("click install") != std::string::npos);
    CHECK(script.find("exit 1") != std::string::npos);
}

TEST_CASE("desktop_content") {
    CHECK(desktop_content("Example", "https://example.com", "https?://example.com/*",
                          "icon.png", "#ff0000") ==
          "[Desktop Entry]\n"
          "Name=Example\n"
          "Exec=webapp-container --webappUrlPatterns=https?://example.com/* "
          "--store-session-cookies https://example.com\n"
          "Icon=icon.png\n"
          "Terminal=false\n"
          "Type=Application\n"
          "X-Ubuntu-Touch=true\n"
          "X-Ubuntu-Splash-Color=#ff0000\n");
}

TEST_CASE("generators are deterministic") {
    CHECK(manifest_content("webapp-a", "A") == manifest_content("webapp-a", "A"));
    CHECK(desktop_content("A", "u", "p", "icon.svg", "c") ==
          desktop_content("A", "u", "p", "icon.svg", "c"));
}

TEST_CASE("marker files") {
    CHECK(debian_binary_content() == "2.0\n");
    CHECK(click_binary_content() == "0.4\n");
}
