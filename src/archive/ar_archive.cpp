#include "webber/ar_archive.hpp"
#include "webber/platform.hpp"

#include <cctype>
#include <cstring>

namespace webber {

// ============================================================================
// ar Format Constants
// ============================================================================

static constexpr char AR_MAGIC[] = "!<arch>\n";
static constexpr size_t AR_MAGIC_SIZE = 8;
static constexpr size_t AR_MTIME_SIZE = 12;
static constexpr size_t AR_UID_SIZE = 6;
static constexpr size_t AR_GID_SIZE = 6;
static constexpr size_t AR_MODE_SIZE = 8;
static constexpr size_t AR_SIZE_SIZE = 10;
static constexpr size_t AR_FMAG_SIZE = 2;

static constexpr const char* AR_MEMBER_MODE = "100644";

#pragma pack(push, 1)
struct ArHeader {
    char name[AR_NAME_SIZE];
    char mtime[AR_MTIME_SIZE];
    char uid[AR_UID_SIZE];
    char gid[AR_GID_SIZE];
    char mode[AR_MODE_SIZE];
    char size[AR_SIZE_SIZE];
    char fmag[AR_FMAG_SIZE];
};
#pragma pack(pop)

static_assert(sizeof(ArHeader) == 60, "ArHeader must be 60 bytes");

// ============================================================================
// Helpers
// ============================================================================

// Left-justified, space padded text field
static bool write_field(char* dest, size_t size, const std::string& value) {
    if (value.size() > size) {
        return false;
    }
    std::memset(dest, ' ', size);
    std::memcpy(dest, value.data(), value.size());
    return true;
}

static std::string read_field(const char* src, size_t size) {
    std::string value(src, size);
    auto end = value.find_last_not_of(' ');
    return end == std::string::npos ? std::string() : value.substr(0, end + 1);
}

static bool parse_decimal(const std::string& text, uint64_t& value) {
    if (text.empty()) return false;
    value = 0;
    for (char c : text) {
        if (!std::isdigit(static_cast<unsigned char>(c))) return false;
        value = value * 10 + static_cast<uint64_t>(c - '0');
    }
    return true;
}

static std::string validate_member_name(const std::string& name) {
    if (name.empty()) {
        return "empty member name";
    }
    if (name.size() > AR_NAME_SIZE) {
        return "member name longer than " + std::to_string(AR_NAME_SIZE) + " bytes: " + name;
    }
    for (char c : name) {
        if (c == '/' || std::isspace(static_cast<unsigned char>(c))) {
            return "invalid character in member name: " + name;
        }
    }
    return {};
}

// ============================================================================
// Public API
// ============================================================================

ArEncodeResult encode_ar_archive(const std::vector<ArMemberData>& members) {
    ArEncodeResult result;

    result.archive_data.assign(AR_MAGIC, AR_MAGIC + AR_MAGIC_SIZE);

    for (const auto& member : members) {
        std::string name_error = validate_member_name(member.name);
        if (!name_error.empty()) {
            result.archive_data.clear();
            result.error = name_error;
            return result;
        }

        ArHeader header;
        bool fits = write_field(header.name, AR_NAME_SIZE, member.name) &&
                    write_field(header.mtime, AR_MTIME_SIZE, "0") &&
                    write_field(header.uid, AR_UID_SIZE, "0") &&
                    write_field(header.gid, AR_GID_SIZE, "0") &&
                    write_field(header.mode, AR_MODE_SIZE, AR_MEMBER_MODE) &&
                    write_field(header.size, AR_SIZE_SIZE, std::to_string(member.data.size()));
        if (!fits) {
            result.archive_data.clear();
            result.error = "member too large: " + member.name;
            return result;
        }
        header.fmag[0] = '`';
        header.fmag[1] = '\n';

        const uint8_t* header_bytes = reinterpret_cast<const uint8_t*>(&header);
        result.archive_data.insert(result.archive_data.end(), header_bytes, header_bytes + sizeof(header));
        result.archive_data.insert(result.archive_data.end(), member.data.begin(), member.data.end());

        // Members start on an even offset
        if (member.data.size() % 2 != 0) {
            result.archive_data.push_back('\n');
        }
    }

    result.ok = true;
    return result;
}

ArWriteResult write_ar_archive(const std::string& output_path,
                               const std::vector<ArchiveMember>& members) {
    ArWriteResult result;

    std::vector<ArMemberData> loaded;
    loaded.reserve(members.size());

    for (const auto& member : members) {
        auto file = read_file(member.source_path);
        if (!file.ok) {
            result.error = file.error;
            return result;
        }
        loaded.push_back({member.member_name, std::move(file.data)});
    }

    auto encoded = encode_ar_archive(loaded);
    if (!encoded.ok) {
        result.error = encoded.error;
        return result;
    }

    auto written = write_file(output_path, encoded.archive_data);
    if (!written.ok) {
        result.error = written.error;
        return result;
    }

    result.ok = true;
    return result;
}

ArListing read_ar_archive(const std::vector<uint8_t>& archive_data) {
    ArListing result;

    if (archive_data.size() < AR_MAGIC_SIZE ||
        std::memcmp(archive_data.data(), AR_MAGIC, AR_MAGIC_SIZE) != 0) {
        result.error = "invalid archive signature";
        return result;
    }

    size_t offset = AR_MAGIC_SIZE;
    while (offset < archive_data.size()) {
        if (offset + sizeof(ArHeader) > archive_data.size()) {
            result.error = "truncated member header";
            return result;
        }

        const auto* header = reinterpret_cast<const ArHeader*>(archive_data.data() + offset);
        if (header->fmag[0] != '`' || header->fmag[1] != '\n') {
            result.error = "invalid member header";
            return result;
        }

        uint64_t size = 0;
        if (!parse_decimal(read_field(header->size, AR_SIZE_SIZE), size)) {
            result.error = "invalid member size";
            return result;
        }

        // GNU ar terminates names with '/'
        std::string name = read_field(header->name, AR_NAME_SIZE);
        if (!name.empty() && name.back() == '/') {
            name.pop_back();
        }

        offset += sizeof(ArHeader);
        if (offset + size > archive_data.size()) {
            result.error = "archive is too short: " + name;
            return result;
        }

        ArMemberData member;
        member.name = std::move(name);
        member.data.assign(archive_data.begin() + static_cast<std::ptrdiff_t>(offset),
                           archive_data.begin() + static_cast<std::ptrdiff_t>(offset + size));
        result.members.push_back(std::move(member));

        offset += size + (size % 2);
    }

    result.ok = true;
    return result;
}

} // namespace webber
