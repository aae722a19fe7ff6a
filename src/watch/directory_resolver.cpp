/// @file directory_resolver.cpp
/// @brief Watch directory resolution from glob patterns.

#include "fwr/watch/directory_resolver.hpp"

#include <unordered_set>
#include <utility>

#include "fwr/foundation/file_probe.hpp"
#include "fwr/foundation/glob.hpp"

namespace fwr::watch {

using foundation::cleanPath;
using foundation::globFind;
using foundation::isDir;
using foundation::parentDir;

namespace {

/// Insertion-ordered set of directory paths.
class OrderedDirSet {
public:
    void add(const std::string& dir) {
        if (seen_.insert(dir).second) {
            ordered_.push_back(dir);
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return ordered_.size(); }

    std::vector<std::string> take() { return std::move(ordered_); }

private:
    std::unordered_set<std::string> seen_;
    std::vector<std::string> ordered_;
};

}  // namespace

std::string findRealDirectory(const std::string& patternDir) {
    auto prefix = foundation::literalPrefix(cleanPath(patternDir));
    if (prefix.empty()) {
        prefix = ".";
    }
    return isDir(prefix) ? prefix : std::string();
}

std::vector<std::string>
resolveWatchDirectories(const std::vector<std::string>& patterns, std::size_t maxDirs) {
    OrderedDirSet targets;

    for (const auto& rawPattern : patterns) {
        auto pattern = cleanPath(rawPattern);
        auto patternDir = parentDir(pattern);

        auto realDir = findRealDirectory(patternDir);
        if (!realDir.empty()) {
            targets.add(realDir);
        }
        if (targets.size() > maxDirs) {
            return targets.take();
        }

        auto matched = globFind(pattern);
        for (const auto& dir : matched.dirs) {
            targets.add(dir);
        }
        for (const auto& file : matched.files) {
            targets.add(parentDir(file));
        }
        if (targets.size() > maxDirs) {
            return targets.take();
        }

        for (const auto& dir : globFind(patternDir).dirs) {
            targets.add(dir);
        }
        if (targets.size() > maxDirs) {
            return targets.take();
        }
    }
    return targets.take();
}

} // namespace fwr::watch
