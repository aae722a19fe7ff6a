#pragma once

/// @file glob.hpp
/// @brief Path pattern expansion and matching.
///
/// Supported syntax: `*`, `?`, `[...]` and `\` escapes within one path
/// segment (fnmatch semantics), `{a,b}` alternatives, and `**` matching zero
/// or more whole segments.

#include <string>
#include <string_view>
#include <vector>

namespace fwr::foundation {

/// Existing paths matched by a pattern, split by kind.
struct GlobMatches {
    std::vector<std::string> files;
    std::vector<std::string> dirs;
};

/// True if @p segment contains any of the metacharacters `* ? [ { \`.
[[nodiscard]] bool hasGlobMeta(std::string_view segment);

/// Leading segments of @p pattern up to (not including) the first segment
/// with a metacharacter, joined with '/'. Empty if the first segment is a glob.
[[nodiscard]] std::string literalPrefix(std::string_view pattern);

/// Expand `{a,b}` groups into every alternative, left to right.
[[nodiscard]] std::vector<std::string> expandBraces(std::string_view pattern);

/// Match a cleaned path against a pattern.
[[nodiscard]] bool globMatch(std::string_view pattern, std::string_view path);

/// Expand a pattern against the filesystem.
[[nodiscard]] GlobMatches globFind(std::string_view pattern);

} // namespace fwr::foundation
