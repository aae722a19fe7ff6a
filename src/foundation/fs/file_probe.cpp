/// @file file_probe.cpp
/// @brief Filesystem probe implementation on top of std::filesystem.

#include "fwr/foundation/file_probe.hpp"

#include <chrono>
#include <system_error>

namespace fs = std::filesystem;

namespace fwr::foundation {

bool isDir(const fs::path& path) {
    std::error_code ec;
    return fs::is_directory(path, ec);
}

bool isFile(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

int64_t modifiedTime(const fs::path& path) {
    std::error_code ec;
    auto writeTime = fs::last_write_time(path, ec);
    if (ec) {
        return 0;
    }
    auto sysTime = std::chrono::file_clock::to_sys(writeTime);
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               sysTime.time_since_epoch())
        .count();
}

int64_t nowNanos() {
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string cleanPath(std::string_view path) {
    if (path.empty()) {
        return ".";
    }
    auto normal = fs::path(path).lexically_normal().string();
    while (normal.size() > 1 && normal.back() == '/') {
        normal.pop_back();
    }
    return normal.empty() ? std::string(".") : normal;
}

std::string parentDir(std::string_view path) {
    auto parent = fs::path(cleanPath(path)).parent_path().string();
    return parent.empty() ? std::string(".") : parent;
}

} // namespace fwr::foundation
