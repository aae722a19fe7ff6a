/// @file process.cpp
/// @brief fork/exec based subprocess supervision.

#include "fwr/dispatch/process.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>

#include <sys/wait.h>
#include <unistd.h>

#include "fwr/foundation/watch_logger.hpp"

namespace fwr::dispatch {

using foundation::ErrorCode;
using foundation::LogCategory;
using foundation::LogContext;
using foundation::LogLevel;
using foundation::WatchError;
using foundation::WatchResult;

namespace {

constexpr auto kPollInterval = std::chrono::milliseconds(10);
constexpr auto kKillGrace = std::chrono::milliseconds(500);
constexpr auto kInterruptGrace = std::chrono::seconds(2);

}  // namespace

WatchResult<std::shared_ptr<Process>> Process::spawn(const std::string& command) {
    using ResultType = WatchResult<std::shared_ptr<Process>>;

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        return ResultType::err(WatchError(ErrorCode::ProcessStartFailed,
                                          std::string("fork: ") + std::strerror(err), err));
    }
    if (pid == 0) {
        // Child: only async-signal-safe calls until exec.
        ::setpgid(0, 0);
        ::execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char*>(nullptr));
        ::_exit(127);
    }
    // Also set from the parent so the group exists before any kill().
    ::setpgid(pid, pid);

    LogContext ctx;
    ctx.pid = static_cast<int>(pid);
    foundation::WatchLogger::instance().logWithContext(
        LogLevel::Debug, LogCategory::Process, "started: " + command, ctx);

    return ResultType::ok(std::make_shared<Process>(Token{}, pid, command));
}

Process::Process(Token, pid_t pid, std::string command)
    : pid_(pid), command_(std::move(command)) {}

bool Process::finished() const noexcept {
    return finished_.load(std::memory_order_acquire);
}

void Process::markFinished() {
    {
        std::lock_guard lock(mutex_);
        finished_.store(true, std::memory_order_release);
    }
    exited_.notify_all();
}

WatchResult<void> Process::waitFor(std::chrono::seconds timeout, std::stop_token stopToken) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    bool timedOut = false;
    bool interrupted = false;
    bool forced = false;
    std::chrono::steady_clock::time_point interruptDeadline;
    int status = 0;

    while (true) {
        pid_t rc = ::waitpid(pid_, &status, WNOHANG);
        if (rc == pid_) {
            break;
        }
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            int err = errno;
            markFinished();
            return WatchResult<void>::err(WatchError(
                ErrorCode::ProcessExitFailure, std::string("waitpid: ") + std::strerror(err), err));
        }

        auto now = std::chrono::steady_clock::now();
        if (!interrupted && !timedOut && stopToken.stop_requested()) {
            interrupted = true;
            interruptDeadline = now + kInterruptGrace;
            signalGroup(SIGINT, "interrupt");
        }
        if (interrupted && !forced && now >= interruptDeadline) {
            forced = true;
            signalGroup(SIGKILL, "kill interrupted");
        }
        if (!timedOut && !interrupted && timeout.count() > 0 && now >= deadline) {
            timedOut = true;
            signalGroup(SIGKILL, "kill timed out");
        }
        std::this_thread::sleep_for(kPollInterval);
    }
    markFinished();

    if (interrupted) {
        FWR_LOG_INFO(LogCategory::Process, "interrupted: " + command_);
        return WatchResult<void>::ok();
    }
    if (timedOut) {
        return WatchResult<void>::err(WatchError(
            ErrorCode::ProcessTimeout,
            "timeout: " + std::to_string(timeout.count()) + "s has passed: " + command_));
    }
    if (WIFEXITED(status) && WEXITSTATUS(status) != 0) {
        return WatchResult<void>::err(WatchError(
            ErrorCode::ProcessExitFailure,
            "exit status " + std::to_string(WEXITSTATUS(status)) + ": " + command_));
    }
    if (WIFSIGNALED(status)) {
        return WatchResult<void>::err(WatchError(
            ErrorCode::ProcessSignaled,
            std::string("signal: ") + ::strsignal(WTERMSIG(status)) + ": " + command_));
    }
    return WatchResult<void>::ok();
}

bool Process::signalGroup(int sig, std::string_view what) {
    if (::kill(-pid_, sig) == 0) {
        return true;
    }
    if (errno != ESRCH) {
        FWR_LOG_WARN(LogCategory::Process, std::string(what) + " " + std::to_string(pid_) +
                                               ": " + std::strerror(errno));
    }
    return false;
}

void Process::kill(std::string_view reason) {
    if (finished()) {
        FWR_LOG_DEBUG(LogCategory::Process,
                      "kill skipped, already exited: " + std::to_string(pid_));
        return;
    }

    LogContext ctx;
    ctx.pid = static_cast<int>(pid_);
    foundation::WatchLogger::instance().logWithContext(
        LogLevel::Info, LogCategory::Process, "kill: " + std::string(reason), ctx);

    if (!signalGroup(SIGKILL, "kill")) {
        return;
    }

    std::unique_lock lock(mutex_);
    if (!exited_.wait_for(lock, kKillGrace, [this] { return finished(); })) {
        FWR_LOG_WARN(LogCategory::Process,
                     "process " + std::to_string(pid_) + " not reaped after kill");
    }
}

WatchResult<void> executeOrTimeout(const std::string& command, std::chrono::seconds timeout) {
    auto process = Process::spawn(command);
    if (!process) {
        return WatchResult<void>::err(process.error());
    }
    return process.value()->waitFor(timeout);
}

} // namespace fwr::dispatch
