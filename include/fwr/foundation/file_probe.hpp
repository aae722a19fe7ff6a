#pragma once

/// @file file_probe.hpp
/// @brief Filesystem probes and timestamps shared by the watch and dispatch layers.
///
/// All timestamps are nanoseconds since the Unix epoch so that file
/// modification times and "now" can be subtracted directly.

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

namespace fwr::foundation {

/// True if @p path exists and is a directory (symlinks followed).
[[nodiscard]] bool isDir(const std::filesystem::path& path);

/// True if @p path exists and is a regular file (symlinks followed).
[[nodiscard]] bool isFile(const std::filesystem::path& path);

/// Last modification time of @p path in ns since the epoch, 0 if unavailable.
[[nodiscard]] int64_t modifiedTime(const std::filesystem::path& path);

/// Current wall-clock time in ns since the epoch.
[[nodiscard]] int64_t nowNanos();

/// Lexically normalize a path: collapse separators, resolve "." and "..",
/// drop a trailing separator. An empty result becomes ".".
[[nodiscard]] std::string cleanPath(std::string_view path);

/// Parent directory of a cleaned path; "." when the path has no directory part.
[[nodiscard]] std::string parentDir(std::string_view path);

} // namespace fwr::foundation
