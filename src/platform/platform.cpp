#include "webber/platform.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>

#ifndef _WIN32
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#endif

namespace webber {

namespace fs = std::filesystem;

FileOpResult write_file(const std::string& path, const std::string& content) {
    return write_file(path, std::vector<uint8_t>(content.begin(), content.end()));
}

FileOpResult write_file(const std::string& path, const std::vector<uint8_t>& content) {
    FileOpResult result;

#ifdef _WIN32
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
        result.error = "failed to create file";
        return result;
    }

    file.write(reinterpret_cast<const char*>(content.data()),
               static_cast<std::streamsize>(content.size()));
    file.close();
    if (!file) {
        result.error = "failed to write content";
        return result;
    }
#else
    int fd = open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        result.error = "failed to create file: " + std::string(strerror(errno));
        return result;
    }

    size_t offset = 0;
    while (offset < content.size()) {
        ssize_t written = write(fd, content.data() + offset, content.size() - offset);
        if (written < 0) {
            if (errno == EINTR) continue;
            std::string cause = strerror(errno);
            close(fd);
            result.error = "failed to write content: " + cause;
            return result;
        }
        offset += static_cast<size_t>(written);
    }

    if (close(fd) != 0) {
        result.error = "failed to close file: " + std::string(strerror(errno));
        return result;
    }
#endif

    result.ok = true;
    return result;
}

ReadFileResult read_file(const std::string& path) {
    ReadFileResult result;

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        result.error = "failed to open file: " + path;
        return result;
    }

    result.data = std::vector<uint8_t>(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>());

    if (file.bad()) {
        result.error = "failed to read file: " + path;
        result.data.clear();
        return result;
    }

    result.ok = true;
    return result;
}

FileOpResult create_directory(const std::string& path) {
    FileOpResult result;

    std::error_code ec;
    if (!fs::create_directory(path, ec)) {
        result.error = ec ? ec.message() : "already exists";
        return result;
    }

    result.ok = true;
    return result;
}

FileOpResult remove_directory(const std::string& path) {
    FileOpResult result;

    std::error_code ec;
    fs::remove_all(path, ec);
    if (ec) {
        result.error = ec.message();
        return result;
    }

    result.ok = true;
    return result;
}

std::string to_portable_path(const std::string& path) {
    std::string result = path;
    std::replace(result.begin(), result.end(), '\\', '/');
    return result;
}

std::string join_path(const std::string& base, const std::string& rel) {
    fs::path p(base);
    p /= rel;
    return to_portable_path(p.string());
}

bool path_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec);
}

std::optional<std::string> get_env(const std::string& name) {
#ifdef _MSC_VER
    char* val = nullptr;
    size_t len = 0;
    if (_dupenv_s(&val, &len, name.c_str()) == 0 && val != nullptr) {
        std::string result(val);
        free(val);
        return result;
    }
    return std::nullopt;
#else
    const char* val = std::getenv(name.c_str());
    if (val) {
        return std::string(val);
    }
    return std::nullopt;
#endif
}

} // namespace webber
