#pragma once

/// @file watch_source.hpp
/// @brief Abstract producer of raw filesystem notifications.

#include <filesystem>
#include <optional>

#include "fwr/foundation/watch_result.hpp"
#include "fwr/watch/raw_event.hpp"

namespace fwr::watch {

/// A set of watched directories delivering raw events and errors.
///
/// next() is called from exactly one thread (the Notifier feed thread),
/// which is also the only caller of add() once watching has started.
/// close() may be called from any thread and must wake a blocked next().
class WatchSource {
public:
    virtual ~WatchSource() = default;

    /// Subscribe one directory (non-recursive).
    virtual foundation::WatchResult<void> add(const std::filesystem::path& dir) = 0;

    /// Block until the next raw event or source error.
    /// @return std::nullopt once the source is closed.
    virtual std::optional<foundation::WatchResult<RawEvent>> next() = 0;

    /// Release OS resources and wake any blocked next(). Idempotent.
    virtual void close() = 0;
};

} // namespace fwr::watch
