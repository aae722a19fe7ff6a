#pragma once

/// @file notifier.hpp
/// @brief Event normalizer: turns raw filesystem notifications into
///        debounced "file was updated" events.
///
/// "create + rename" (atomic save) is regarded as an update; bursts of
/// writes from one save are coalesced into a single event.

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "fwr/foundation/channel.hpp"
#include "fwr/foundation/watch_result.hpp"
#include "fwr/watch/raw_event.hpp"
#include "fwr/watch/watch_source.hpp"

namespace fwr::watch {

/// A logical update of one regular file.
struct Event {
    std::string name;  ///< Normalized file path.
    int64_t time = 0;  ///< Acceptance time, ns since the epoch.

    bool operator==(const Event&) const = default;
};

/// Watches the directories resolved from a pattern list and publishes
/// logical update events.
///
/// A dedicated feed thread drains the WatchSource, grows the watch set when
/// directories are created, applies the acceptance rules and hands accepted
/// events to events(). Sends are rendezvous: if nobody receives, the feed
/// thread (and therefore the watch source) stalls instead of dropping.
///
/// Acceptance rules for a normalized path and op:
///   - op must be Write, Rename, or Create (when create detection is on);
///   - the path must currently be a regular file;
///   - Write/Create: mtime - lastExecution >= pendingPeriod;
///   - Rename: now - mtime <= regardRenameAsModPeriod.
///
/// Usage:
/// @code
///   auto notifier = Notifier::create({"src/**/*.cpp"}, 100);
///   if (notifier) {
///       while (auto event = notifier.value()->events().receive()) {
///           std::cout << event->name << "\n";
///       }
///   }
/// @endcode
class Notifier {
    // Restricts construction to create() while still allowing make_unique.
    struct Token {
        explicit Token() = default;
    };

public:
    Notifier(Token, std::unique_ptr<WatchSource> source);

    static constexpr int64_t kDefaultPendingPeriodMs = 100;
    static constexpr int64_t kRegardRenameAsModPeriodMs = 1000;

    /// Resolve watch directories and start watching them with inotify.
    /// @return TooManyTargets if more than @p maxWatchDirs directories
    ///         resolve, WatchInitFailed if inotify cannot be initialized.
    static foundation::WatchResult<std::unique_ptr<Notifier>>
    create(const std::vector<std::string>& patterns, std::size_t maxWatchDirs);

    /// Same as above with a caller-provided watch source.
    static foundation::WatchResult<std::unique_ptr<Notifier>>
    create(const std::vector<std::string>& patterns, std::size_t maxWatchDirs,
           std::unique_ptr<WatchSource> source);

    ~Notifier();

    Notifier(const Notifier&) = delete;
    Notifier& operator=(const Notifier&) = delete;
    Notifier(Notifier&&) = delete;
    Notifier& operator=(Notifier&&) = delete;

    /// Accepted update events.
    [[nodiscard]] foundation::Channel<Event>& events() noexcept { return events_; }

    /// Errors reported by the watch source, forwarded verbatim.
    [[nodiscard]] foundation::Channel<foundation::WatchError>& errors() noexcept {
        return errors_;
    }

    /// Set the write-coalescing window in milliseconds.
    void setPendingPeriod(int64_t ms) noexcept;

    [[nodiscard]] int64_t pendingPeriod() const noexcept;

    /// Enable or disable treating Create as an update (default: enabled).
    void setDetectCreate(bool enabled) noexcept;

    /// Push an event back onto events() for a later receive.
    ///
    /// Does not wait for a receiver, so a consumer may call it from its own
    /// thread. The event is delivered before any event still held by the
    /// feed thread.
    void requeue(Event event);

    /// Snapshot of the watch set (grows only).
    [[nodiscard]] std::vector<std::string> watchedDirectories() const;

    /// Close the watch source and both channels, then join the feed thread.
    /// Safe to call more than once.
    void close();

    [[nodiscard]] bool isClosed() const noexcept;

private:
    /// Add @p dir to the watch source, logging instead of failing.
    void addWatch(const std::string& dir);

    void feedLoop();

    /// @return false once the event channel is closed.
    bool handle(const RawEvent& raw);

    bool shouldExecute(const std::string& path, Op op);

    std::unique_ptr<WatchSource> source_;
    foundation::Channel<Event> events_;
    foundation::Channel<foundation::WatchError> errors_;

    std::atomic<int64_t> pendingPeriodMs_{kDefaultPendingPeriodMs};
    std::atomic<bool> detectCreate_{true};
    std::atomic<bool> closed_{false};

    // Last acceptance time per path; owned by the feed thread.
    std::unordered_map<std::string, int64_t> times_;

    mutable std::mutex dirsMutex_;
    std::vector<std::string> watchDirs_;

    std::thread feedThread_;
};

} // namespace fwr::watch
