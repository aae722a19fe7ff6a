#pragma once

/// @file process.hpp
/// @brief Subprocess supervision: start, wait with timeout, forced kill.

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>

#include <sys/types.h>

#include "fwr/foundation/watch_result.hpp"

namespace fwr::dispatch {

/// One external command running as `/bin/sh -c <command>`.
///
/// The child leads its own process group, so kill() also terminates
/// anything the shell started. Exactly one thread should call waitFor();
/// kill() may be called from any other thread.
///
/// Usage:
/// @code
///   auto proc = Process::spawn("make test");
///   if (proc) {
///       auto done = proc.value()->waitFor(std::chrono::seconds(30));
///       if (!done) {
///           log(done.error().message());
///       }
///   }
/// @endcode
class Process {
    // Restricts construction to spawn() while still allowing make_shared.
    struct Token {
        explicit Token() = default;
    };

public:
    Process(Token, pid_t pid, std::string command);

    /// Start @p command.
    /// @return The running process, or ProcessStartFailed.
    static foundation::WatchResult<std::shared_ptr<Process>> spawn(const std::string& command);

    ~Process() = default;

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;
    Process(Process&&) = delete;
    Process& operator=(Process&&) = delete;

    /// Wait for the process to exit.
    ///
    /// With @p timeout > 0 the process group is killed once the timeout
    /// elapses and ProcessTimeout is returned. A non-zero exit status yields
    /// ProcessExitFailure and death by signal yields ProcessSignaled.
    ///
    /// A stop request on @p stopToken interrupts the process group with
    /// SIGINT, then SIGKILL if it is still alive after a grace period. An
    /// interrupted process reports success.
    foundation::WatchResult<void> waitFor(std::chrono::seconds timeout,
                                          std::stop_token stopToken = {});

    /// Forcibly terminate the process group, logging @p reason.
    ///
    /// Best effort: failures are logged, never returned. Returns once the
    /// waiting thread has reaped the child, or after a short grace period.
    void kill(std::string_view reason);

    [[nodiscard]] pid_t pid() const noexcept { return pid_; }

    [[nodiscard]] const std::string& command() const noexcept { return command_; }

    /// True once the child has been reaped.
    [[nodiscard]] bool finished() const noexcept;

private:
    /// Send @p sig to the process group; logs failures other than ESRCH.
    bool signalGroup(int sig, std::string_view what);

    void markFinished();

    pid_t pid_;
    std::string command_;

    std::atomic<bool> finished_{false};
    mutable std::mutex mutex_;
    std::condition_variable exited_;
};

/// Start @p command and wait for it, honoring @p timeout (0 = no timeout).
foundation::WatchResult<void> executeOrTimeout(const std::string& command,
                                               std::chrono::seconds timeout);

} // namespace fwr::dispatch
