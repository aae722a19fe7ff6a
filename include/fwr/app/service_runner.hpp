#pragma once

/// @file service_runner.hpp
/// @brief Entry-point utilities for the fwr executable.
///
/// Provides signal handling, CLI argument parsing, configuration lookup and
/// the translation of configuration into dispatcher settings.

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include "fwr/dispatch/command_table.hpp"
#include "fwr/foundation/config_manager.hpp"
#include "fwr/foundation/watch_logger.hpp"
#include "fwr/foundation/watch_result.hpp"

namespace fwr::app {

/// Installs SIGINT and SIGTERM handlers and exposes a shutdown flag.
///
/// Only one SignalHandler instance should exist per process.
/// The handler writes to a static atomic flag in an async-signal-safe
/// manner (relaxed store on a lock-free atomic).
///
/// The default handlers are restored on destruction so that a signal
/// arriving during teardown terminates the process immediately.
class SignalHandler {
public:
    SignalHandler();
    ~SignalHandler();

    SignalHandler(const SignalHandler&) = delete;
    SignalHandler& operator=(const SignalHandler&) = delete;

    /// Returns true after SIGINT or SIGTERM is received.
    [[nodiscard]] bool shutdownRequested() const noexcept;

    /// Start a thread that calls @p source.request_stop() once a shutdown
    /// signal arrives. Stopping the returned thread ends the watch early.
    [[nodiscard]] std::jthread forwardTo(std::stop_source source) const;

private:
    static std::atomic<bool> shutdownFlag_;
    static void handler(int signal);
};

/// Parsed command line.
///
/// Optional members are only set when the flag was given, so that unset
/// flags leave configuration file values in effect.
struct CliOptions {
    std::vector<std::string> patterns;
    std::optional<std::string> command;
    bool restart = false;
    std::optional<int64_t> timeoutSeconds;
    std::optional<int64_t> pendingPeriodMs;
    std::optional<int64_t> maxWatchDirs;
    std::filesystem::path configPath;
    std::optional<foundation::LogLevel> logLevel;
    bool showHelp = false;
    bool showVersion = false;
};

/// Effective settings after configuration and CLI overrides are merged.
struct RunSettings {
    std::chrono::seconds timeout{0};
    bool restart = false;
    int64_t pendingPeriodMs = 100;
    std::size_t maxWatchDirs = 100;
    foundation::LogLevel logLevel = foundation::LogLevel::Info;
};

/// Parse `fwr [options] <pattern>...`.
///
/// @return InvalidArgument for unknown options, missing or malformed
///         option values, and a missing pattern (unless help or version
///         was requested).
[[nodiscard]] foundation::WatchResult<CliOptions> parseArgs(int argc, char* argv[]);

/// Usage text for @p program.
[[nodiscard]] std::string usage(std::string_view program);

/// Load configuration into @p config.
///
/// The file is resolved in order:
///   1. @p cliPath (from `--config`), if not empty
///   2. FWR_CONFIG_PATH environment variable (if set)
///   3. `~/.fwr.yml` (if it exists)
///   4. the built-in default command table
///
/// @return The file that was loaded (empty for the built-in default), or
///         ConfigLoadFailed.
[[nodiscard]] foundation::WatchResult<std::filesystem::path>
loadConfig(foundation::ConfigManager& config, const std::filesystem::path& cliPath);

/// Write the flags given in @p options over the loaded configuration.
void applyCliOverrides(foundation::ConfigManager& config, const CliOptions& options);

/// Read dispatcher settings from @p config, using defaults for absent keys.
/// @return ConfigTypeMismatch or ConfigInvalidValue for bad values.
[[nodiscard]] foundation::WatchResult<RunSettings>
buildRunSettings(const foundation::ConfigManager& config);

/// The command table to dispatch with: a single rule for `--command`,
/// otherwise the `commands` list of @p config.
[[nodiscard]] foundation::WatchResult<dispatch::CommandTable>
buildCommandTable(const foundation::ConfigManager& config, const CliOptions& options);

} // namespace fwr::app
