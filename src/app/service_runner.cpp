/// @file service_runner.cpp
/// @brief Implementation of the fwr entry-point utilities.

#include "fwr/app/service_runner.hpp"

#include <charconv>
#include <csignal>
#include <cstdlib>
#include <sstream>
#include <system_error>

namespace fwr::app {

using foundation::ConfigManager;
using foundation::ErrorCode;
using foundation::LogLevel;
using foundation::WatchError;
using foundation::WatchResult;

// -- SignalHandler -----------------------------------------------------------

std::atomic<bool> SignalHandler::shutdownFlag_{false};

void SignalHandler::handler(int /*signal*/) {
    // async-signal-safe: relaxed store on a lock-free atomic.
    shutdownFlag_.store(true, std::memory_order_relaxed);
}

SignalHandler::SignalHandler() {
    shutdownFlag_.store(false, std::memory_order_relaxed);
    std::signal(SIGINT, &SignalHandler::handler);
    std::signal(SIGTERM, &SignalHandler::handler);
}

SignalHandler::~SignalHandler() {
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wold-style-cast"
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#if defined(__GNUC__) || defined(__clang__)
#pragma GCC diagnostic pop
#endif
}

bool SignalHandler::shutdownRequested() const noexcept {
    return shutdownFlag_.load(std::memory_order_relaxed);
}

std::jthread SignalHandler::forwardTo(std::stop_source source) const {
    return std::jthread([source](std::stop_token own) mutable {
        using namespace std::chrono_literals;
        while (!own.stop_requested()) {
            if (shutdownFlag_.load(std::memory_order_relaxed)) {
                source.request_stop();
                return;
            }
            std::this_thread::sleep_for(50ms);
        }
    });
}

// -- CLI argument parsing ----------------------------------------------------

namespace {

WatchError invalidArgument(std::string message) {
    return WatchError(ErrorCode::InvalidArgument, std::move(message));
}

std::optional<int64_t> parseNonNegative(std::string_view text) {
    int64_t value = 0;
    const auto* end = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc() || ptr != end || value < 0) {
        return std::nullopt;
    }
    return value;
}

} // namespace

WatchResult<CliOptions> parseArgs(int argc, char* argv[]) {
    CliOptions options;
    bool optionsDone = false;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg(argv[i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)

        if (optionsDone || arg.empty() || arg.front() != '-' || arg == "-") {
            options.patterns.emplace_back(arg);
            continue;
        }
        if (arg == "--") {
            optionsDone = true;
            continue;
        }

        auto takeValue = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= argc) {
                return std::nullopt;
            }
            return std::string_view(argv[++i]);  // NOLINT(cppcoreguidelines-pro-bounds-pointer-arithmetic)
        };
        auto takeNumber = [&](std::string_view flag) -> WatchResult<int64_t> {
            auto value = takeValue();
            if (!value) {
                return WatchResult<int64_t>::err(
                    invalidArgument("option requires a value: " + std::string(flag)));
            }
            auto number = parseNonNegative(*value);
            if (!number) {
                return WatchResult<int64_t>::err(invalidArgument(
                    "invalid value for " + std::string(flag) + ": " + std::string(*value)));
            }
            return WatchResult<int64_t>::ok(*number);
        };

        if (arg == "-h" || arg == "--help") {
            options.showHelp = true;
        } else if (arg == "--version") {
            options.showVersion = true;
        } else if (arg == "-r" || arg == "--restart") {
            options.restart = true;
        } else if (arg == "-v" || arg == "--verbose" || arg == "--debug") {
            options.logLevel = LogLevel::Debug;
        } else if (arg == "-q" || arg == "--quiet") {
            options.logLevel = LogLevel::Warning;
        } else if (arg == "-c" || arg == "--command" || arg == "--config") {
            auto value = takeValue();
            if (!value) {
                return WatchResult<CliOptions>::err(
                    invalidArgument("option requires a value: " + std::string(arg)));
            }
            if (arg == "--config") {
                options.configPath = std::string(*value);
            } else {
                options.command = std::string(*value);
            }
        } else if (arg == "-t" || arg == "--timeout") {
            auto number = takeNumber(arg);
            if (!number) {
                return WatchResult<CliOptions>::err(number.error());
            }
            options.timeoutSeconds = number.value();
        } else if (arg == "-p" || arg == "--pending") {
            auto number = takeNumber(arg);
            if (!number) {
                return WatchResult<CliOptions>::err(number.error());
            }
            options.pendingPeriodMs = number.value();
        } else if (arg == "-m" || arg == "--max-watch-dirs") {
            auto number = takeNumber(arg);
            if (!number) {
                return WatchResult<CliOptions>::err(number.error());
            }
            options.maxWatchDirs = number.value();
        } else {
            return WatchResult<CliOptions>::err(
                invalidArgument("unknown option: " + std::string(arg)));
        }
    }

    if (options.patterns.empty() && !options.showHelp && !options.showVersion) {
        return WatchResult<CliOptions>::err(invalidArgument("no watch pattern given"));
    }
    return WatchResult<CliOptions>::ok(std::move(options));
}

std::string usage(std::string_view program) {
    std::ostringstream oss;
    oss << "Usage: " << program << " [options] <pattern>...\n"
        << "\n"
        << "Run a command whenever a file matching <pattern> is updated.\n"
        << "\n"
        << "Options:\n"
        << "  -c, --command <cmd>         run <cmd> for every matching file\n"
        << "  -r, --restart               kill the running command on the next update\n"
        << "  -t, --timeout <sec>         kill commands running longer than <sec> (0 = none)\n"
        << "  -p, --pending <ms>          coalesce writes within <ms> (default 100)\n"
        << "  -m, --max-watch-dirs <n>    refuse to watch more than <n> directories (default 100)\n"
        << "      --config <path>         YAML configuration file\n"
        << "  -v, --verbose, --debug      debug logging\n"
        << "  -q, --quiet                 warnings and errors only\n"
        << "  -h, --help                  show this help\n"
        << "      --version               show the version\n"
        << "\n"
        << "Placeholders in commands: {{file}} {{ext}} {{base}} {{base0}} {{dir}} {{abs}}\n";
    return oss.str();
}

// -- Config loading ----------------------------------------------------------

WatchResult<std::filesystem::path>
loadConfig(ConfigManager& config, const std::filesystem::path& cliPath) {
    std::filesystem::path configPath = cliPath;

    if (configPath.empty()) {
        const char* envPath = std::getenv("FWR_CONFIG_PATH");
        if (envPath != nullptr && *envPath != '\0') {
            configPath = envPath;
        }
    }
    if (configPath.empty()) {
        const char* home = std::getenv("HOME");
        if (home != nullptr && *home != '\0') {
            std::error_code ec;
            auto candidate = std::filesystem::path(home) / ".fwr.yml";
            if (std::filesystem::is_regular_file(candidate, ec)) {
                configPath = candidate;
            }
        }
    }

    if (configPath.empty()) {
        auto result = config.loadString(dispatch::defaultCommandYaml());
        if (!result) {
            return WatchResult<std::filesystem::path>::err(result.error());
        }
        return WatchResult<std::filesystem::path>::ok(std::filesystem::path{});
    }

    auto result = config.load(configPath);
    if (!result) {
        return WatchResult<std::filesystem::path>::err(result.error());
    }
    return WatchResult<std::filesystem::path>::ok(configPath);
}

void applyCliOverrides(ConfigManager& config, const CliOptions& options) {
    if (options.restart) {
        config.set("dispatch.restart", true);
    }
    if (options.timeoutSeconds) {
        config.set("dispatch.timeout_seconds", *options.timeoutSeconds);
    }
    if (options.pendingPeriodMs) {
        config.set("notify.pending_period_ms", *options.pendingPeriodMs);
    }
    if (options.maxWatchDirs) {
        config.set("watch.max_dirs", *options.maxWatchDirs);
    }
    if (options.logLevel) {
        config.set("log.level", std::string(foundation::logLevelName(*options.logLevel)));
    }
}

WatchResult<RunSettings> buildRunSettings(const ConfigManager& config) {
    RunSettings settings;

    auto timeout = config.getOr<int64_t>("dispatch.timeout_seconds", 0);
    if (!timeout) {
        return WatchResult<RunSettings>::err(timeout.error());
    }
    if (timeout.value() < 0) {
        return WatchResult<RunSettings>::err(WatchError(
            ErrorCode::ConfigInvalidValue, "dispatch.timeout_seconds must not be negative"));
    }
    settings.timeout = std::chrono::seconds(timeout.value());

    auto restart = config.getOr<bool>("dispatch.restart", false);
    if (!restart) {
        return WatchResult<RunSettings>::err(restart.error());
    }
    settings.restart = restart.value();

    auto pending = config.getOr<int64_t>("notify.pending_period_ms", settings.pendingPeriodMs);
    if (!pending) {
        return WatchResult<RunSettings>::err(pending.error());
    }
    if (pending.value() < 0) {
        return WatchResult<RunSettings>::err(WatchError(
            ErrorCode::ConfigInvalidValue, "notify.pending_period_ms must not be negative"));
    }
    settings.pendingPeriodMs = pending.value();

    auto maxDirs = config.getOr<int64_t>("watch.max_dirs", 100);
    if (!maxDirs) {
        return WatchResult<RunSettings>::err(maxDirs.error());
    }
    if (maxDirs.value() <= 0) {
        return WatchResult<RunSettings>::err(
            WatchError(ErrorCode::ConfigInvalidValue, "watch.max_dirs must be positive"));
    }
    settings.maxWatchDirs = static_cast<std::size_t>(maxDirs.value());

    auto levelName = config.getOr<std::string>("log.level", "info");
    if (!levelName) {
        return WatchResult<RunSettings>::err(levelName.error());
    }
    auto level = foundation::parseLogLevel(levelName.value());
    if (!level) {
        return WatchResult<RunSettings>::err(level.error());
    }
    settings.logLevel = level.value();

    return WatchResult<RunSettings>::ok(settings);
}

WatchResult<dispatch::CommandTable>
buildCommandTable(const ConfigManager& config, const CliOptions& options) {
    if (options.command) {
        return WatchResult<dispatch::CommandTable>::ok(
            dispatch::CommandTable::singleCommand(*options.command));
    }

    auto commands = config.getNode("commands");
    if (!commands) {
        return WatchResult<dispatch::CommandTable>::err(WatchError(
            ErrorCode::ConfigKeyNotFound, "no commands configured and no --command given"));
    }
    return dispatch::CommandTable::fromYaml(commands.value());
}

} // namespace fwr::app
