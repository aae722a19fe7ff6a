#pragma once

/// @file inotify_watch_source.hpp
/// @brief Linux inotify implementation of WatchSource.

#include <atomic>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "fwr/watch/watch_source.hpp"

namespace fwr::watch {

/// Watches directories through one inotify descriptor.
///
/// Mask translation:
/// | inotify                      | Op     |
/// |------------------------------|--------|
/// | IN_CREATE                    | Create |
/// | IN_MODIFY                    | Write  |
/// | IN_MOVED_TO (new name)       | Rename |
/// | IN_MOVED_FROM, IN_MOVE_SELF  | Rename |
/// | IN_DELETE, IN_DELETE_SELF    | Remove |
/// | IN_ATTRIB                    | Chmod  |
///
/// IN_Q_OVERFLOW is reported as a WatchSourceError. A self-pipe wakes a
/// blocked next() when close() is called from another thread.
class InotifyWatchSource final : public WatchSource {
    // Restricts construction to create() while still allowing make_unique.
    struct Token {
        explicit Token() = default;
    };

public:
    InotifyWatchSource(Token, int inotifyFd, int wakeReadFd, int wakeWriteFd);

    /// Initialize inotify and the wake pipe.
    /// @return The source, or WatchInitFailed.
    static foundation::WatchResult<std::unique_ptr<InotifyWatchSource>> create();

    ~InotifyWatchSource() override;

    InotifyWatchSource(const InotifyWatchSource&) = delete;
    InotifyWatchSource& operator=(const InotifyWatchSource&) = delete;
    InotifyWatchSource(InotifyWatchSource&&) = delete;
    InotifyWatchSource& operator=(InotifyWatchSource&&) = delete;

    foundation::WatchResult<void> add(const std::filesystem::path& dir) override;

    std::optional<foundation::WatchResult<RawEvent>> next() override;

    void close() override;

    /// Number of live inotify watch descriptors.
    [[nodiscard]] std::size_t watchCount() const;

private:
    /// Drain one read() worth of inotify records into pending_.
    void readBatch();

    int inotifyFd_;
    int wakeReadFd_;
    int wakeWriteFd_;

    mutable std::mutex mutex_;
    std::unordered_map<int, std::string> wdToPath_;

    // Only touched by the thread calling next().
    std::deque<foundation::WatchResult<RawEvent>> pending_;

    std::atomic<bool> closed_{false};
};

} // namespace fwr::watch
