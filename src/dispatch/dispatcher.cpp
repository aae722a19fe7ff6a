/// @file dispatcher.cpp
/// @brief Event-to-command dispatch loop and restartable supervision.

#include "fwr/dispatch/dispatcher.hpp"

#include <algorithm>
#include <iterator>
#include <utility>

#include "fwr/foundation/file_probe.hpp"
#include "fwr/foundation/glob.hpp"
#include "fwr/foundation/watch_logger.hpp"

namespace fwr::dispatch {

using foundation::LogCategory;
using foundation::WatchResult;

WatchResult<std::unique_ptr<Dispatcher>>
Dispatcher::create(const std::vector<std::string>& patterns, std::size_t maxWatchDirs,
                   std::stop_token stopToken) {
    std::vector<std::string> cleanPatterns;
    cleanPatterns.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        cleanPatterns.push_back(foundation::cleanPath(pattern));
    }

    auto notifier = watch::Notifier::create(cleanPatterns, maxWatchDirs);
    if (!notifier) {
        return WatchResult<std::unique_ptr<Dispatcher>>::err(notifier.error());
    }
    return WatchResult<std::unique_ptr<Dispatcher>>::ok(std::make_unique<Dispatcher>(
        cleanPatterns, std::move(notifier).value(), std::move(stopToken)));
}

Dispatcher::Dispatcher(const std::vector<std::string>& patterns,
                       std::unique_ptr<watch::Notifier> notifier, std::stop_token stopToken)
    : notifier_(std::move(notifier)), stopToken_(std::move(stopToken)) {
    patterns_.reserve(patterns.size());
    for (const auto& pattern : patterns) {
        patterns_.push_back(foundation::cleanPath(pattern));
    }

    errorThread_ = std::thread([this] {
        while (auto error = notifier_->errors().receive()) {
            FWR_LOG_ERROR(LogCategory::Watch, std::string(error->message()));
        }
    });
}

Dispatcher::~Dispatcher() {
    close();
}

WatchResult<void> Dispatcher::run(const CommandTable& commands,
                                  std::chrono::seconds timeout, bool restart) {
    while (!stopToken_.stop_requested()) {
        auto event = notifier_->events().receive(stopToken_);
        if (!event) {
            break;
        }
        FWR_LOG_DEBUG(LogCategory::Dispatch, "Receive: " + event->name);
        handleEvent(*event, commands, timeout, restart);
        joinSupervisors(false);
    }
    return WatchResult<void>::ok();
}

uint64_t Dispatcher::counter() const noexcept {
    return counter_.load(std::memory_order_relaxed);
}

void Dispatcher::close() {
    if (closed_.exchange(true)) {
        return;
    }
    notifier_->close();
    if (errorThread_.joinable()) {
        errorThread_.join();
    }
    {
        // Commands started from here on are killed by superviseAsync.
        std::lock_guard lock(supervisorsMutex_);
        accepting_ = false;
    }
    killOngoing("Shutdown");
    joinSupervisors(true);
}

bool Dispatcher::matchAny(const std::string& path) const {
    return std::any_of(patterns_.begin(), patterns_.end(), [&](const std::string& pattern) {
        return foundation::globMatch(pattern, path);
    });
}

void Dispatcher::handleEvent(const watch::Event& event, const CommandTable& commands,
                             std::chrono::seconds timeout, bool restart) {
    if (!matchAny(event.name)) {
        return;
    }

    int64_t modified = foundation::modifiedTime(event.name);
    if (modified - lastExecutionTime_ < kIgnorePeriodNs) {
        FWR_LOG_DEBUG(LogCategory::Dispatch, "skipped: " + event.name + " (too frequent)");
        return;
    }

    const auto* rule = commands.match(event.name);
    if (rule == nullptr) {
        FWR_LOG_DEBUG(LogCategory::Dispatch, "Command not found: " + event.name);
        return;
    }
    auto commandString = renderCommand(rule->run, event.name);

    counter_.fetch_add(1, std::memory_order_relaxed);
    FWR_LOG_INFO(LogCategory::Dispatch, "[" + commandString + "]");

    killOngoing("Restart");

    lastExecutionTime_ = foundation::nowNanos();
    auto process = Process::spawn(commandString);
    if (!process) {
        FWR_LOG_ERROR(LogCategory::Process, std::string(process.error().message()));
        return;
    }

    if (!restart) {
        auto result = process.value()->waitFor(timeout, stopToken_);
        if (!result) {
            FWR_LOG_WARN(LogCategory::Process, std::string(result.error().message()));
        }
        return;
    }
    superviseAsync(std::move(process).value(), timeout);
}

void Dispatcher::superviseAsync(std::shared_ptr<Process> process, std::chrono::seconds timeout) {
    std::unique_lock lock(supervisorsMutex_);
    if (!accepting_) {
        lock.unlock();
        std::thread reaper([process] {
            static_cast<void>(process->waitFor(std::chrono::seconds(0)));
        });
        process->kill("Shutdown");
        reaper.join();
        return;
    }

    {
        std::lock_guard ongoingLock(ongoingMutex_);
        ongoing_ = process;
    }

    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([this, process = std::move(process), timeout, done] {
        auto result = process->waitFor(timeout);
        if (!result) {
            FWR_LOG_WARN(LogCategory::Process, std::string(result.error().message()));
        }
        {
            std::lock_guard ongoingLock(ongoingMutex_);
            if (ongoing_ == process) {
                ongoing_.reset();
            }
        }
        done->store(true, std::memory_order_release);
    });
    supervisors_.push_back(Supervisor{std::move(thread), std::move(done)});
}

void Dispatcher::killOngoing(std::string_view reason) {
    std::shared_ptr<Process> victim;
    {
        std::lock_guard lock(ongoingMutex_);
        victim = std::move(ongoing_);
        ongoing_.reset();
    }
    // Outside the lock: kill() waits for the supervisor, which takes it.
    if (victim) {
        victim->kill(reason);
    }
}

void Dispatcher::joinSupervisors(bool all) {
    std::vector<Supervisor> finished;
    {
        std::lock_guard lock(supervisorsMutex_);
        auto split = std::stable_partition(
            supervisors_.begin(), supervisors_.end(), [all](const Supervisor& s) {
                return !all && !s.done->load(std::memory_order_acquire);
            });
        std::move(split, supervisors_.end(), std::back_inserter(finished));
        supervisors_.erase(split, supervisors_.end());
    }
    for (auto& supervisor : finished) {
        if (supervisor.thread.joinable()) {
            supervisor.thread.join();
        }
    }
}

} // namespace fwr::dispatch
