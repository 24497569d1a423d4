#include "webber/icon.hpp"
#include "webber/platform.hpp"
#include "webber/url.hpp"

#include <spdlog/spdlog.h>

namespace webber {

namespace {

const char* const DEFAULT_ICON = R"SVG(<?xml version="1.0" encoding="UTF-8"?>
<svg xmlns="http://www.w3.org/2000/svg" width="256" height="256" viewBox="0 0 256 256">
  <rect width="256" height="256" rx="48" fill="#2c5d8f"/>
  <circle cx="128" cy="128" r="76" fill="none" stroke="#ffffff" stroke-width="12"/>
  <ellipse cx="128" cy="128" rx="32" ry="76" fill="none" stroke="#ffffff" stroke-width="10"/>
  <line x1="52" y1="128" x2="204" y2="128" stroke="#ffffff" stroke-width="10"/>
  <path d="M66 88 H190 M66 168 H190" fill="none" stroke="#ffffff" stroke-width="8"/>
</svg>
)SVG";

} // namespace

IconSource select_icon_source(const std::string& icon_url) {
    IconSource bundled;
    bundled.kind = IconSourceKind::Bundled;
    bundled.filename = DEFAULT_ICON_FILENAME;

    auto parsed = parse_url(icon_url);
    if (!parsed.ok) {
        return bundled;
    }

    std::string segment = last_path_segment(parsed.path);
    auto dot = segment.rfind('.');
    if (dot == std::string::npos || dot + 1 >= segment.size()) {
        return bundled;
    }

    IconSource remote;
    remote.kind = IconSourceKind::Remote;
    remote.url = icon_url;
    remote.extension = segment.substr(dot + 1);
    remote.filename = "icon." + remote.extension;
    return remote;
}

const std::string& default_icon_svg() {
    static const std::string icon(DEFAULT_ICON);
    return icon;
}

IconResult resolve_icon(const std::string& icon_url,
                        const std::string& data_dir,
                        const Fetcher& fetcher) {
    IconResult result;

    IconSource source = select_icon_source(icon_url);
    std::string target = join_path(data_dir, source.filename);

    if (source.kind == IconSourceKind::Bundled) {
        spdlog::debug("icon URL '{}' has no usable file suffix, using bundled icon", icon_url);
        auto written = write_file(target, default_icon_svg());
        if (!written.ok) {
            result.error = written.error;
            return result;
        }
        result.filename = source.filename;
        result.ok = true;
        return result;
    }

    if (!fetcher) {
        result.error_kind = BuildErrorKind::Network;
        result.error = "no fetcher configured";
        return result;
    }

    auto fetched = fetcher(source.url);
    if (!fetched.ok) {
        result.error_kind = BuildErrorKind::Network;
        result.error = fetched.error;
        return result;
    }

    auto written = write_file(target, fetched.data);
    if (!written.ok) {
        result.error = written.error;
        return result;
    }

    spdlog::debug("stored {} bytes as {}", fetched.data.size(), source.filename);

    result.filename = source.filename;
    result.ok = true;
    return result;
}

} // namespace webber
