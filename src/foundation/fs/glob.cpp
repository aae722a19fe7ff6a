/// @file glob.cpp
/// @brief Glob expansion via glob(3) and a recursive walk for `**`.

#include "fwr/foundation/glob.hpp"

#include <filesystem>
#include <system_error>
#include <unordered_set>

#include <fnmatch.h>
#include <glob.h>

#include "fwr/foundation/file_probe.hpp"

namespace fs = std::filesystem;

namespace fwr::foundation {

namespace {

std::vector<std::string> splitSegments(std::string_view path) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        auto pos = path.find('/', start);
        if (pos == std::string_view::npos) {
            segments.emplace_back(path.substr(start));
            break;
        }
        segments.emplace_back(path.substr(start, pos - start));
        start = pos + 1;
    }
    return segments;
}

bool matchSegments(const std::vector<std::string>& pattern, std::size_t pi,
                   const std::vector<std::string>& path, std::size_t si) {
    if (pi == pattern.size()) {
        return si == path.size();
    }
    if (pattern[pi] == "**") {
        for (auto k = si; k <= path.size(); ++k) {
            if (matchSegments(pattern, pi + 1, path, k)) {
                return true;
            }
        }
        return false;
    }
    if (si == path.size()) {
        return false;
    }
    if (::fnmatch(pattern[pi].c_str(), path[si].c_str(), 0) != 0) {
        return false;
    }
    return matchSegments(pattern, pi + 1, path, si + 1);
}

/// Position of the '}' closing the group opened at @p open, or npos.
std::size_t closingBrace(std::string_view pattern, std::size_t open) {
    int depth = 0;
    for (auto i = open; i < pattern.size(); ++i) {
        if (pattern[i] == '\\') {
            ++i;
        } else if (pattern[i] == '{') {
            ++depth;
        } else if (pattern[i] == '}' && --depth == 0) {
            return i;
        }
    }
    return std::string_view::npos;
}

class Collector {
public:
    void add(const std::string& path) {
        auto cleaned = cleanPath(path);
        if (!seen_.insert(cleaned).second) {
            return;
        }
        if (isFile(cleaned)) {
            matches_.files.push_back(cleaned);
        } else if (isDir(cleaned)) {
            matches_.dirs.push_back(cleaned);
        }
    }

    GlobMatches take() { return std::move(matches_); }

private:
    std::unordered_set<std::string> seen_;
    GlobMatches matches_;
};

void expandWithGlob(const std::string& pattern, Collector& out) {
    glob_t found{};
    int rc = ::glob(pattern.c_str(), 0, nullptr, &found);
    if (rc == 0) {
        for (std::size_t i = 0; i < found.gl_pathc; ++i) {
            out.add(found.gl_pathv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        }
    }
    ::globfree(&found);
}

void expandWithWalk(const std::string& pattern, Collector& out) {
    auto base = literalPrefix(pattern);
    if (base.empty()) {
        base = ".";
    }
    if (!isDir(base)) {
        return;
    }
    if (globMatch(pattern, base)) {
        out.add(base);
    }

    std::error_code ec;
    fs::recursive_directory_iterator it(
        base, fs::directory_options::skip_permission_denied, ec);
    for (; !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
        auto candidate = cleanPath(it->path().string());
        if (globMatch(pattern, candidate)) {
            out.add(candidate);
        }
    }
}

}  // namespace

bool hasGlobMeta(std::string_view segment) {
    return segment.find_first_of("*?[{\\") != std::string_view::npos;
}

std::string literalPrefix(std::string_view pattern) {
    std::string prefix;
    bool first = true;
    for (const auto& segment : splitSegments(pattern)) {
        if (hasGlobMeta(segment)) {
            break;
        }
        if (!first) {
            prefix += '/';
        }
        prefix += segment;
        first = false;
    }
    // "/x" splits into {"", "x"}; a lone root segment is "/".
    if (prefix.empty() && !pattern.empty() && pattern.front() == '/') {
        return "/";
    }
    return prefix;
}

std::vector<std::string> expandBraces(std::string_view pattern) {
    std::size_t open = std::string_view::npos;
    for (std::size_t i = 0; i < pattern.size(); ++i) {
        if (pattern[i] == '\\') {
            ++i;
        } else if (pattern[i] == '{') {
            open = i;
            break;
        }
    }
    if (open == std::string_view::npos) {
        return {std::string(pattern)};
    }
    auto close = closingBrace(pattern, open);
    if (close == std::string_view::npos) {
        return {std::string(pattern)};
    }

    // Split the group body on top-level commas.
    std::vector<std::string_view> alternatives;
    int depth = 0;
    auto start = open + 1;
    for (auto i = open + 1; i < close; ++i) {
        char c = pattern[i];
        if (c == '\\') {
            ++i;
        } else if (c == '{') {
            ++depth;
        } else if (c == '}') {
            --depth;
        } else if (c == ',' && depth == 0) {
            alternatives.push_back(pattern.substr(start, i - start));
            start = i + 1;
        }
    }
    alternatives.push_back(pattern.substr(start, close - start));

    auto head = pattern.substr(0, open);
    auto tail = pattern.substr(close + 1);
    std::vector<std::string> expanded;
    for (auto alternative : alternatives) {
        std::string candidate;
        candidate.reserve(head.size() + alternative.size() + tail.size());
        candidate.append(head).append(alternative).append(tail);
        for (auto& result : expandBraces(candidate)) {
            expanded.push_back(std::move(result));
        }
    }
    return expanded;
}

bool globMatch(std::string_view pattern, std::string_view path) {
    auto pathSegments = splitSegments(cleanPath(path));
    for (const auto& alternative : expandBraces(pattern)) {
        auto patternSegments = splitSegments(cleanPath(alternative));
        if (matchSegments(patternSegments, 0, pathSegments, 0)) {
            return true;
        }
    }
    return false;
}

GlobMatches globFind(std::string_view pattern) {
    Collector out;
    for (const auto& alternative : expandBraces(cleanPath(pattern))) {
        if (alternative.find("**") != std::string::npos) {
            expandWithWalk(alternative, out);
        } else {
            expandWithGlob(alternative, out);
        }
    }
    return out.take();
}

} // namespace fwr::foundation
