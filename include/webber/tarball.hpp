#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace webber {

// ============================================================================
// Deterministic Tar+Gzip Archives
// ============================================================================

enum class TarEntryType {
    RegularFile,
    Directory,
    Symlink,    // Rejected when packing
    Hardlink,   // Rejected when packing
    Other       // Rejected when packing
};

struct TarEntry {
    std::string path;           // Archive member name, e.g. "./control"
    TarEntryType type = TarEntryType::RegularFile;
    std::vector<uint8_t> data;  // Empty for directories
    bool executable = false;    // 0755 instead of 0644
};

struct TarballResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> archive_data;
};

// Build a gzip-compressed tar archive from entries.
//   - Ordering: lexicographic by path, directories first within a directory
//   - Metadata: uid=0, gid=0, empty uname/gname, mtime=0
//   - Modes: dirs 0755, files 0644 (0755 when executable)
//   - Gzip: mtime=0, no file name, OS=255
TarballResult create_tarball(const std::vector<TarEntry>& entries);

struct CollectResult {
    bool ok = false;
    std::string error;
    std::vector<TarEntry> entries;
};

// Collect a directory's contents as entries rooted at ".": the directory
// itself becomes "./" and every file below it "./<relative path>". The
// directory's own name never appears in an entry path.
CollectResult collect_subtree_entries(const std::string& dir_path);

// Pack a directory into a tarball rooted at "." (collect + create)
TarballResult pack_subtree(const std::string& dir_path);

// ============================================================================
// Reading
// ============================================================================

struct TarListing {
    bool ok = false;
    std::string error;
    std::vector<TarEntry> entries;  // In archive order, paths as stored
};

// Decompress and list a tarball without touching the filesystem
TarListing read_tarball(const std::vector<uint8_t>& archive_data);

} // namespace webber
