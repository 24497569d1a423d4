#include "webber/tarball.hpp"
#include "webber/platform.hpp"

#include <algorithm>
#include <cstdio>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <zlib.h>

namespace fs = std::filesystem;

namespace webber {

// ============================================================================
// Tar Format Constants (POSIX ustar)
// ============================================================================

static constexpr size_t TAR_BLOCK_SIZE = 512;
static constexpr size_t TAR_NAME_SIZE = 100;
static constexpr size_t TAR_MODE_SIZE = 8;
static constexpr size_t TAR_UID_SIZE = 8;
static constexpr size_t TAR_GID_SIZE = 8;
static constexpr size_t TAR_SIZE_SIZE = 12;
static constexpr size_t TAR_MTIME_SIZE = 12;
static constexpr size_t TAR_CHKSUM_SIZE = 8;
static constexpr size_t TAR_LINKNAME_SIZE = 100;
static constexpr size_t TAR_MAGIC_SIZE = 6;
static constexpr size_t TAR_VERSION_SIZE = 2;
static constexpr size_t TAR_UNAME_SIZE = 32;
static constexpr size_t TAR_GNAME_SIZE = 32;
static constexpr size_t TAR_PREFIX_SIZE = 155;

static constexpr char TAR_REGTYPE = '0';
static constexpr char TAR_LNKTYPE = '1';
static constexpr char TAR_SYMTYPE = '2';
static constexpr char TAR_DIRTYPE = '5';

static constexpr const char* ROOT_ENTRY = ".";

#pragma pack(push, 1)
struct TarHeader {
    char name[TAR_NAME_SIZE];       // 0
    char mode[TAR_MODE_SIZE];       // 100
    char uid[TAR_UID_SIZE];         // 108
    char gid[TAR_GID_SIZE];         // 116
    char size[TAR_SIZE_SIZE];       // 124
    char mtime[TAR_MTIME_SIZE];     // 136
    char chksum[TAR_CHKSUM_SIZE];   // 148
    char typeflag;                   // 156
    char linkname[TAR_LINKNAME_SIZE]; // 157
    char magic[TAR_MAGIC_SIZE];     // 257
    char version[TAR_VERSION_SIZE]; // 263
    char uname[TAR_UNAME_SIZE];     // 265
    char gname[TAR_GNAME_SIZE];     // 297
    char devmajor[8];               // 329
    char devminor[8];               // 337
    char prefix[TAR_PREFIX_SIZE];   // 345
    char padding[12];               // 500
};
#pragma pack(pop)

static_assert(sizeof(TarHeader) == TAR_BLOCK_SIZE, "TarHeader must be 512 bytes");

// ============================================================================
// Header Helpers
// ============================================================================

// Octal value with leading zeros, NUL terminated
static void write_octal(char* dest, size_t size, uint64_t value) {
    size_t digits = size - 1;
    dest[digits] = '\0';
    for (size_t i = digits; i > 0; --i) {
        dest[i - 1] = static_cast<char>('0' + (value & 7));
        value >>= 3;
    }
}

// Checksum field counts as spaces
static uint32_t calculate_checksum(const TarHeader& header) {
    const uint8_t* bytes = reinterpret_cast<const uint8_t*>(&header);
    uint32_t sum = 0;

    for (size_t i = 0; i < sizeof(TarHeader); ++i) {
        if (i >= 148 && i < 156) {
            sum += ' ';
        } else {
            sum += bytes[i];
        }
    }

    return sum;
}

static uint64_t parse_octal(const char* data, size_t size) {
    uint64_t result = 0;
    size_t i = 0;
    while (i < size && data[i] == ' ') ++i;
    for (; i < size && data[i] != '\0' && data[i] != ' '; ++i) {
        if (data[i] >= '0' && data[i] <= '7') {
            result = (result << 3) | static_cast<uint64_t>(data[i] - '0');
        }
    }
    return result;
}

static std::string entry_name(const TarEntry& entry) {
    std::string path = entry.path;
    if (entry.type == TarEntryType::Directory && !path.empty() && path.back() != '/') {
        path += '/';
    }
    return path;
}

// Fails only when the path cannot be represented in name/prefix
static bool create_tar_header(const TarEntry& entry, TarHeader& header) {
    std::memset(&header, 0, sizeof(header));

    std::string path = entry_name(entry);

    if (path.size() <= TAR_NAME_SIZE) {
        std::memcpy(header.name, path.data(), path.size());
    } else {
        size_t split = path.rfind('/', TAR_NAME_SIZE);
        if (split == std::string::npos || split > TAR_PREFIX_SIZE ||
            path.size() - split - 1 > TAR_NAME_SIZE) {
            return false;
        }
        std::memcpy(header.prefix, path.data(), split);
        std::memcpy(header.name, path.data() + split + 1, path.size() - split - 1);
    }

    uint32_t mode;
    if (entry.type == TarEntryType::Directory) {
        mode = 0755;
    } else {
        mode = entry.executable ? 0755 : 0644;
    }
    write_octal(header.mode, TAR_MODE_SIZE, mode);

    write_octal(header.uid, TAR_UID_SIZE, 0);
    write_octal(header.gid, TAR_GID_SIZE, 0);

    if (entry.type == TarEntryType::Directory) {
        write_octal(header.size, TAR_SIZE_SIZE, 0);
    } else {
        write_octal(header.size, TAR_SIZE_SIZE, entry.data.size());
    }

    write_octal(header.mtime, TAR_MTIME_SIZE, 0);

    header.typeflag = entry.type == TarEntryType::Directory ? TAR_DIRTYPE : TAR_REGTYPE;

    std::memcpy(header.magic, "ustar", 5);
    header.magic[5] = '\0';
    header.version[0] = '0';
    header.version[1] = '0';

    // 6 octal digits + NUL + space
    uint32_t checksum = calculate_checksum(header);
    char chksum_str[8];
    std::snprintf(chksum_str, sizeof(chksum_str), "%06o", checksum);
    std::memcpy(header.chksum, chksum_str, 6);
    header.chksum[6] = '\0';
    header.chksum[7] = ' ';

    return true;
}

// ============================================================================
// Gzip
// ============================================================================

// mtime=0, no original filename, OS=255 (unknown)
static std::vector<uint8_t> gzip_compress(const std::vector<uint8_t>& data) {
    std::vector<uint8_t> result = {
        0x1f, 0x8b,             // Magic
        0x08,                   // Deflate
        0x00,                   // No flags
        0x00, 0x00, 0x00, 0x00, // mtime
        0x00,                   // Extra flags
        0xff                    // OS
    };

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    // Raw deflate; header and trailer are written by hand
    if (deflateInit2(&strm, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -15, 8, Z_DEFAULT_STRATEGY) != Z_OK) {
        return {};
    }

    strm.next_in = const_cast<Bytef*>(data.data());
    strm.avail_in = static_cast<uInt>(data.size());

    std::vector<uint8_t> compressed;
    compressed.resize(deflateBound(&strm, static_cast<uLong>(data.size())));

    strm.next_out = compressed.data();
    strm.avail_out = static_cast<uInt>(compressed.size());

    int ret = deflate(&strm, Z_FINISH);
    deflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return {};
    }

    compressed.resize(strm.total_out);
    result.insert(result.end(), compressed.begin(), compressed.end());

    uint32_t crc = static_cast<uint32_t>(crc32(0, data.data(), static_cast<uInt>(data.size())));
    for (int shift = 0; shift < 32; shift += 8) {
        result.push_back(static_cast<uint8_t>((crc >> shift) & 0xff));
    }

    uint32_t size = static_cast<uint32_t>(data.size());
    for (int shift = 0; shift < 32; shift += 8) {
        result.push_back(static_cast<uint8_t>((size >> shift) & 0xff));
    }

    return result;
}

// Decompression limits for archives read back from disk
constexpr size_t INFLATE_CHUNK_SIZE = 64 * 1024;
constexpr size_t MAX_INFLATED_SIZE = 512 * 1024 * 1024;

static bool gzip_decompress(const std::vector<uint8_t>& data, std::vector<uint8_t>& out) {
    if (data.size() < 18 || data[0] != 0x1f || data[1] != 0x8b) {
        return false;
    }

    size_t offset = 10;
    uint8_t flags = data[3];

    if (flags & 0x04) {
        if (offset + 2 > data.size()) return false;
        uint16_t xlen = static_cast<uint16_t>(data[offset] | (data[offset + 1] << 8));
        offset += 2 + xlen;
    }
    if (flags & 0x08) {
        while (offset < data.size() && data[offset] != 0) offset++;
        offset++;
    }
    if (flags & 0x10) {
        while (offset < data.size() && data[offset] != 0) offset++;
        offset++;
    }
    if (flags & 0x02) {
        offset += 2;
    }

    if (offset + 8 > data.size()) {
        return false;
    }

    uint32_t orig_size = static_cast<uint32_t>(data[data.size() - 4]) |
                         (static_cast<uint32_t>(data[data.size() - 3]) << 8) |
                         (static_cast<uint32_t>(data[data.size() - 2]) << 16) |
                         (static_cast<uint32_t>(data[data.size() - 1]) << 24);

    z_stream strm;
    std::memset(&strm, 0, sizeof(strm));

    if (inflateInit2(&strm, -15) != Z_OK) {
        return false;
    }

    strm.next_in = const_cast<Bytef*>(data.data() + offset);
    strm.avail_in = static_cast<uInt>(data.size() - offset - 8);

    // The trailer size comes from the input, so the output grows as data
    // is actually inflated instead of being allocated up front
    out.clear();
    int ret = Z_OK;
    while (ret == Z_OK) {
        if (out.size() >= MAX_INFLATED_SIZE) {
            break;
        }
        size_t produced = out.size();
        out.resize(produced + INFLATE_CHUNK_SIZE);
        strm.next_out = out.data() + produced;
        strm.avail_out = static_cast<uInt>(INFLATE_CHUNK_SIZE);

        ret = inflate(&strm, Z_NO_FLUSH);
        out.resize(produced + (INFLATE_CHUNK_SIZE - strm.avail_out));
    }
    inflateEnd(&strm);

    if (ret != Z_STREAM_END) {
        return false;
    }

    uint32_t crc = static_cast<uint32_t>(crc32(0, out.data(), static_cast<uInt>(out.size())));
    uint32_t stored_crc = static_cast<uint32_t>(data[data.size() - 8]) |
                          (static_cast<uint32_t>(data[data.size() - 7]) << 8) |
                          (static_cast<uint32_t>(data[data.size() - 6]) << 16) |
                          (static_cast<uint32_t>(data[data.size() - 5]) << 24);

    return static_cast<uint32_t>(out.size()) == orig_size && crc == stored_crc;
}

// ============================================================================
// Entry Ordering
// ============================================================================

// Lexicographic by full path, directories before files within the same parent
static bool compare_entries(const TarEntry& a, const TarEntry& b) {
    std::string path_a = entry_name(a);
    std::string path_b = entry_name(b);

    size_t slash_a = path_a.rfind('/');
    size_t slash_b = path_b.rfind('/');

    std::string prefix_a = (slash_a != std::string::npos) ? path_a.substr(0, slash_a + 1) : "";
    std::string prefix_b = (slash_b != std::string::npos) ? path_b.substr(0, slash_b + 1) : "";

    if (prefix_a == prefix_b) {
        if (a.type == TarEntryType::Directory && b.type != TarEntryType::Directory) {
            return true;
        }
        if (a.type != TarEntryType::Directory && b.type == TarEntryType::Directory) {
            return false;
        }
    }

    return path_a < path_b;
}

// ============================================================================
// Public API
// ============================================================================

TarballResult create_tarball(const std::vector<TarEntry>& entries) {
    TarballResult result;

    for (const auto& entry : entries) {
        if (entry.type == TarEntryType::Symlink) {
            result.error = "symlinks are not permitted: " + entry.path;
            return result;
        }
        if (entry.type == TarEntryType::Hardlink) {
            result.error = "hardlinks are not permitted: " + entry.path;
            return result;
        }
        if (entry.type == TarEntryType::Other) {
            result.error = "unsupported entry type: " + entry.path;
            return result;
        }
        if (entry.path.empty()) {
            result.error = "entry with empty path";
            return result;
        }
    }

    std::vector<TarEntry> sorted_entries = entries;
    std::sort(sorted_entries.begin(), sorted_entries.end(), compare_entries);

    std::vector<uint8_t> tar_data;

    for (const auto& entry : sorted_entries) {
        TarHeader header;
        if (!create_tar_header(entry, header)) {
            result.error = "path too long for tar header: " + entry.path;
            return result;
        }
        const uint8_t* header_bytes = reinterpret_cast<const uint8_t*>(&header);
        tar_data.insert(tar_data.end(), header_bytes, header_bytes + TAR_BLOCK_SIZE);

        if (entry.type == TarEntryType::RegularFile && !entry.data.empty()) {
            tar_data.insert(tar_data.end(), entry.data.begin(), entry.data.end());

            size_t padding = (TAR_BLOCK_SIZE - (entry.data.size() % TAR_BLOCK_SIZE)) % TAR_BLOCK_SIZE;
            tar_data.insert(tar_data.end(), padding, 0);
        }
    }

    // End of archive
    tar_data.insert(tar_data.end(), TAR_BLOCK_SIZE * 2, 0);

    result.archive_data = gzip_compress(tar_data);
    if (result.archive_data.empty()) {
        result.error = "gzip compression failed";
        return result;
    }

    result.ok = true;
    return result;
}

CollectResult collect_subtree_entries(const std::string& dir_path) {
    CollectResult result;

    std::error_code ec;
    if (!fs::is_directory(dir_path, ec)) {
        result.error = "directory not found: " + dir_path;
        return result;
    }

    TarEntry root;
    root.path = ROOT_ENTRY;
    root.type = TarEntryType::Directory;
    result.entries.push_back(std::move(root));

    fs::path base_path = fs::path(dir_path);

    try {
        for (const auto& entry : fs::recursive_directory_iterator(dir_path)) {
            std::string rel = to_portable_path(fs::relative(entry.path(), base_path).string());

            TarEntry tar_entry;
            tar_entry.path = std::string(ROOT_ENTRY) + "/" + rel;

            if (entry.is_symlink()) {
                result.error = "symlinks are not permitted: " + rel;
                return result;
            }

            if (entry.is_directory()) {
                tar_entry.type = TarEntryType::Directory;
            } else if (entry.is_regular_file()) {
                tar_entry.type = TarEntryType::RegularFile;

                std::ifstream file(entry.path(), std::ios::binary);
                if (!file) {
                    result.error = "failed to read file: " + rel;
                    return result;
                }
                tar_entry.data = std::vector<uint8_t>(
                    (std::istreambuf_iterator<char>(file)),
                    std::istreambuf_iterator<char>());

                auto perms = entry.status().permissions();
                tar_entry.executable = (perms & fs::perms::owner_exec) != fs::perms::none ||
                                       (perms & fs::perms::group_exec) != fs::perms::none ||
                                       (perms & fs::perms::others_exec) != fs::perms::none;
            } else {
                result.error = "unsupported file type: " + rel;
                return result;
            }

            result.entries.push_back(std::move(tar_entry));
        }
    } catch (const fs::filesystem_error& e) {
        result.entries.clear();
        result.error = std::string("filesystem error: ") + e.what();
        return result;
    }

    result.ok = true;
    return result;
}

TarballResult pack_subtree(const std::string& dir_path) {
    auto collect_result = collect_subtree_entries(dir_path);
    if (!collect_result.ok) {
        TarballResult result;
        result.error = collect_result.error;
        return result;
    }

    return create_tarball(collect_result.entries);
}

TarListing read_tarball(const std::vector<uint8_t>& archive_data) {
    TarListing result;

    std::vector<uint8_t> tar_data;
    if (!gzip_decompress(archive_data, tar_data)) {
        result.error = "failed to decompress archive";
        return result;
    }

    size_t offset = 0;
    while (offset + TAR_BLOCK_SIZE <= tar_data.size()) {
        const auto* header = reinterpret_cast<const TarHeader*>(tar_data.data() + offset);

        bool empty = std::all_of(tar_data.begin() + static_cast<std::ptrdiff_t>(offset),
                                 tar_data.begin() + static_cast<std::ptrdiff_t>(offset + TAR_BLOCK_SIZE),
                                 [](uint8_t b) { return b == 0; });
        if (empty) break;

        std::string path;
        if (header->prefix[0] != '\0') {
            path = std::string(header->prefix, strnlen(header->prefix, TAR_PREFIX_SIZE));
            path += '/';
        }
        path += std::string(header->name, strnlen(header->name, TAR_NAME_SIZE));

        char typeflag = header->typeflag;
        if (typeflag == '\0') typeflag = TAR_REGTYPE;

        uint64_t size = parse_octal(header->size, TAR_SIZE_SIZE);
        uint64_t mode = parse_octal(header->mode, TAR_MODE_SIZE);

        TarEntry entry;
        entry.path = path;
        entry.executable = (mode & 0111) != 0;

        switch (typeflag) {
            case TAR_REGTYPE: entry.type = TarEntryType::RegularFile; break;
            case TAR_DIRTYPE: entry.type = TarEntryType::Directory; break;
            case TAR_SYMTYPE: entry.type = TarEntryType::Symlink; break;
            case TAR_LNKTYPE: entry.type = TarEntryType::Hardlink; break;
            default: entry.type = TarEntryType::Other; break;
        }

        offset += TAR_BLOCK_SIZE;

        if (entry.type == TarEntryType::RegularFile) {
            if (offset + size > tar_data.size()) {
                result.error = "truncated archive: " + path;
                return result;
            }
            entry.data.assign(tar_data.begin() + static_cast<std::ptrdiff_t>(offset),
                              tar_data.begin() + static_cast<std::ptrdiff_t>(offset + size));
        }
        if (entry.type != TarEntryType::Directory) {
            offset += ((size + TAR_BLOCK_SIZE - 1) / TAR_BLOCK_SIZE) * TAR_BLOCK_SIZE;
        }

        result.entries.push_back(std::move(entry));
    }

    result.ok = true;
    return result;
}

} // namespace webber
