#pragma once

/// @file directory_resolver.hpp
/// @brief Computes the directories to watch for a set of path patterns.

#include <cstddef>
#include <string>
#include <vector>

namespace fwr::watch {

/// Resolve the concrete directories that must be watched to observe every
/// file the patterns can match, including files that do not exist yet.
///
/// For each pattern, in order:
///   1. the literal (glob-free) prefix of the pattern's parent directory,
///      if it is an existing directory;
///   2. directories matched by the pattern, and parents of matched files;
///   3. directories matched by the pattern's parent directory.
///
/// The result is deduplicated and keeps insertion order. Resolution stops as
/// soon as more than @p maxDirs directories are collected; the returned
/// (over-limit) list lets the caller report what overflowed.
[[nodiscard]] std::vector<std::string>
resolveWatchDirectories(const std::vector<std::string>& patterns, std::size_t maxDirs);

/// Literal prefix of @p patternDir if it names an existing directory,
/// otherwise an empty string.
[[nodiscard]] std::string findRealDirectory(const std::string& patternDir);

} // namespace fwr::watch
