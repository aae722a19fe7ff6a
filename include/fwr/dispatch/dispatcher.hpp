#pragma once

/// @file dispatcher.hpp
/// @brief Runs the configured command for every updated file.

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "fwr/dispatch/command_table.hpp"
#include "fwr/dispatch/process.hpp"
#include "fwr/foundation/watch_result.hpp"
#include "fwr/watch/notifier.hpp"

namespace fwr::dispatch {

/// Consumes Notifier events, filters them by the watch patterns and runs
/// the matching command.
///
/// Per event: pattern filter -> 10 ms dispatch debounce -> command lookup ->
/// counter increment -> kill of the tracked restartable process -> start.
/// In blocking mode the loop waits for each command; in restart mode each
/// command is supervised on its own thread and the next matching event kills
/// it before starting a new one, so at most one restartable command is alive.
///
/// Usage:
/// @code
///   std::stop_source stop;
///   auto dispatcher = Dispatcher::create({"src/*.py"}, 100, stop.get_token());
///   if (dispatcher) {
///       dispatcher.value()->run(commands, std::chrono::seconds(0), true);
///   }
/// @endcode
class Dispatcher {
public:
    /// Minimum spacing between a dispatch and the next file modification.
    static constexpr int64_t kIgnorePeriodNs = 10'000'000;

    /// Create a Notifier for @p patterns and wrap it.
    /// @return Any Notifier construction error (e.g. TooManyTargets).
    static foundation::WatchResult<std::unique_ptr<Dispatcher>>
    create(const std::vector<std::string>& patterns, std::size_t maxWatchDirs,
           std::stop_token stopToken);

    Dispatcher(const std::vector<std::string>& patterns,
               std::unique_ptr<watch::Notifier> notifier, std::stop_token stopToken);

    ~Dispatcher();

    Dispatcher(const Dispatcher&) = delete;
    Dispatcher& operator=(const Dispatcher&) = delete;
    Dispatcher(Dispatcher&&) = delete;
    Dispatcher& operator=(Dispatcher&&) = delete;

    /// Dispatch events until the stop token fires or the event stream closes.
    ///
    /// In blocking mode a stop request also interrupts the running command.
    /// A command still running in restart mode is left alone on return;
    /// close() terminates it.
    foundation::WatchResult<void> run(const CommandTable& commands,
                                      std::chrono::seconds timeout, bool restart);

    /// Number of commands dispatched so far.
    [[nodiscard]] uint64_t counter() const noexcept;

    [[nodiscard]] watch::Notifier& notifier() noexcept { return *notifier_; }

    /// Close the Notifier, kill the tracked restartable command and join
    /// supervision threads. A restartable command started concurrently with
    /// close() is killed as well. Safe to call more than once.
    void close();

private:
    struct Supervisor {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    [[nodiscard]] bool matchAny(const std::string& path) const;

    void handleEvent(const watch::Event& event, const CommandTable& commands,
                     std::chrono::seconds timeout, bool restart);

    void superviseAsync(std::shared_ptr<Process> process, std::chrono::seconds timeout);

    void killOngoing(std::string_view reason);

    /// Join finished supervisors, or all of them when @p all is set.
    void joinSupervisors(bool all);

    std::vector<std::string> patterns_;
    std::unique_ptr<watch::Notifier> notifier_;
    std::stop_token stopToken_;

    std::atomic<uint64_t> counter_{0};

    // Owned by the run() loop.
    int64_t lastExecutionTime_ = 0;

    std::mutex ongoingMutex_;
    std::shared_ptr<Process> ongoing_;

    // Lock order: supervisorsMutex_ before ongoingMutex_.
    std::mutex supervisorsMutex_;
    std::vector<Supervisor> supervisors_;
    bool accepting_ = true;

    std::thread errorThread_;
    std::atomic<bool> closed_{false};
};

} // namespace fwr::dispatch
