#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace webber {

// ============================================================================
// File Operations
// ============================================================================

struct FileOpResult {
    bool ok = false;
    std::string error;
};

// Create `path` (truncating any existing file) and write `content` to it.
// The one write primitive used for every staged file.
FileOpResult write_file(const std::string& path, const std::string& content);
FileOpResult write_file(const std::string& path, const std::vector<uint8_t>& content);

struct ReadFileResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> data;
};

ReadFileResult read_file(const std::string& path);

// Create a single directory; fails if it already exists
FileOpResult create_directory(const std::string& path);

// Recursively remove `path`; succeeds when it does not exist
FileOpResult remove_directory(const std::string& path);

// ============================================================================
// Path Utilities
// ============================================================================

// Convert a path to use forward slashes (tar and ar member names)
std::string to_portable_path(const std::string& path);

std::string join_path(const std::string& base, const std::string& rel);

bool path_exists(const std::string& path);

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

} // namespace webber
