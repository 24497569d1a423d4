#pragma once

#include <string>

namespace webber {

// ============================================================================
// Application Identifier
// ============================================================================

inline constexpr const char* IDENTIFIER_PREFIX = "webapp-";

// Where the identifier text came from
enum class IdentifierSource {
    Host,   // Host component of a parsed URL
    Raw     // URL did not parse or had no host; the raw string was used
};

struct IdentifierSelection {
    IdentifierSource source = IdentifierSource::Raw;
    std::string text;
};

// Choose the string the identifier is derived from: the URL's host when
// it parses and has one, the raw input otherwise.
IdentifierSelection select_identifier_source(const std::string& url);

// Lower-case `text`, map '.' and '_' to '-', keep [a-y0-9] and drop the rest.
// 'z' is outside the retained range; existing identifiers depend on that.
std::string sanitize_identifier_text(const std::string& text);

// Derive the application identifier ("webapp-<sanitized>") for a URL.
// Deterministic and never fails.
std::string derive_identifier(const std::string& url);

// Package name used in control data and manifest hooks ("<identifier>.webber")
std::string package_name(const std::string& identifier);

} // namespace webber
