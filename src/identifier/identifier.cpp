#include "webber/identifier.hpp"
#include "webber/url.hpp"

namespace webber {

IdentifierSelection select_identifier_source(const std::string& url) {
    IdentifierSelection selection;

    auto parsed = parse_url(url);
    if (parsed.ok && parsed.host) {
        selection.source = IdentifierSource::Host;
        selection.text = *parsed.host;
        return selection;
    }

    selection.source = IdentifierSource::Raw;
    selection.text = url;
    return selection;
}

std::string sanitize_identifier_text(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    for (char raw : text) {
        char c = raw;
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }

        if (c == '.' || c == '_') {
            out.push_back('-');
        } else if ((c >= 'a' && c < 'z') || (c >= '0' && c <= '9')) {
            out.push_back(c);
        }
        // Everything else (including 'z', '-' and non-ASCII bytes) is dropped
    }

    return out;
}

std::string derive_identifier(const std::string& url) {
    return std::string(IDENTIFIER_PREFIX) + sanitize_identifier_text(select_identifier_source(url).text);
}

std::string package_name(const std::string& identifier) {
    return identifier + ".webber";
}

} // namespace webber
