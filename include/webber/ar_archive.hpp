#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace webber {

// ============================================================================
// ar Container
// ============================================================================
//
// Common ar format as read by dpkg and click:
//   "!<arch>\n"
//   per member: 60-byte text header, data, '\n' pad to an even offset
// Header fields are written with mtime=0, uid=0, gid=0, mode=100644 so the
// container is reproducible.

inline constexpr size_t AR_NAME_SIZE = 16;

// A file on disk stored under `member_name`
struct ArchiveMember {
    std::string source_path;
    std::string member_name;
};

struct ArMemberData {
    std::string name;
    std::vector<uint8_t> data;
};

struct ArEncodeResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> archive_data;
};

// Frame members in the given order. Names must be non-empty, at most
// AR_NAME_SIZE bytes and free of '/' and whitespace.
ArEncodeResult encode_ar_archive(const std::vector<ArMemberData>& members);

struct ArWriteResult {
    bool ok = false;
    std::string error;
};

// Read each member's source file and write the container to `output_path`
ArWriteResult write_ar_archive(const std::string& output_path,
                               const std::vector<ArchiveMember>& members);

struct ArListing {
    bool ok = false;
    std::string error;
    std::vector<ArMemberData> members;  // In archive order
};

ArListing read_ar_archive(const std::vector<uint8_t>& archive_data);

} // namespace webber
