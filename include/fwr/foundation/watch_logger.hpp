#pragma once

/// @file watch_logger.hpp
/// @brief WatchLogger wrapping the kcenon common_system logger interface.
///
/// Provides category-based filtering, structured logging with context,
/// and per-category runtime log level control.

#include <array>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

#include "fwr/foundation/watch_result.hpp"

namespace fwr::foundation {

/// Log severity levels.
///
/// Maps to kcenon::common::interfaces::log_level internally:
///   Trace -> trace, Debug -> debug, Info -> info, Warning -> warning,
///   Error -> error, Critical -> critical, Off -> off
enum class LogLevel : uint8_t {
    Trace    = 0,
    Debug    = 1,
    Info     = 2,
    Warning  = 3,
    Error    = 4,
    Critical = 5,
    Off      = 6
};

/// Log categories, one per subsystem.
enum class LogCategory : uint8_t {
    Core     = 0, ///< Application wiring and CLI
    Watch    = 1, ///< Watch source and directory resolution
    Notify   = 2, ///< Event normalization and debounce decisions
    Dispatch = 3, ///< Command matching and dispatch
    Process  = 4, ///< Subprocess lifecycle
    Config   = 5  ///< Configuration loading
};

inline constexpr std::size_t kLogCategoryCount = 6;

constexpr std::string_view logCategoryName(LogCategory cat) {
    constexpr std::array<std::string_view, kLogCategoryCount> names = {
        "Core", "Watch", "Notify", "Dispatch", "Process", "Config"
    };
    auto idx = static_cast<std::size_t>(cat);
    return idx < kLogCategoryCount ? names[idx] : "Unknown";
}

constexpr std::string_view logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return "TRACE";
        case LogLevel::Debug:    return "DEBUG";
        case LogLevel::Info:     return "INFO";
        case LogLevel::Warning:  return "WARNING";
        case LogLevel::Error:    return "ERROR";
        case LogLevel::Critical: return "CRITICAL";
        case LogLevel::Off:      return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name ("debug", "WARNING", ...). Case-insensitive.
/// @return The level, or ConfigInvalidValue for an unknown name.
WatchResult<LogLevel> parseLogLevel(std::string_view name);

/// Structured context attached to a log entry.
///
/// Example:
/// @code
///   LogContext ctx;
///   ctx.path = "src/main.py";
///   ctx.pid = 4242;
///   logger.logWithContext(LogLevel::Debug, LogCategory::Process,
///                         "process started", ctx);
/// @endcode
struct LogContext {
    std::optional<std::string> path;
    std::optional<int> pid;
    std::unordered_map<std::string, std::string> extra;
};

/// Logger wrapping kcenon's logging system.
///
/// Every category defaults to Info. Uses PIMPL to keep kcenon headers out
/// of the public API.
///
/// Example:
/// @code
///   WatchLogger logger;
///   logger.log(LogLevel::Info, LogCategory::Watch, "gazing at: src");
///   logger.setAllCategoryLevels(LogLevel::Debug);
/// @endcode
class WatchLogger {
public:
    WatchLogger();
    ~WatchLogger();

    WatchLogger(const WatchLogger&) = delete;
    WatchLogger& operator=(const WatchLogger&) = delete;
    WatchLogger(WatchLogger&&) noexcept;
    WatchLogger& operator=(WatchLogger&&) noexcept;

    /// Log a message under the given category.
    /// No-op if the level is below the category's minimum level.
    void log(LogLevel level, LogCategory cat, std::string_view msg);

    /// Log a message with structured context appended as `{key=val, ...}`.
    void logWithContext(LogLevel level, LogCategory cat,
                        std::string_view msg, const LogContext& ctx);

    void setCategoryLevel(LogCategory cat, LogLevel minLevel);

    /// Apply one minimum level to every category (used by -v / -q).
    void setAllCategoryLevels(LogLevel minLevel);

    [[nodiscard]] LogLevel getCategoryLevel(LogCategory cat) const;

    [[nodiscard]] bool isEnabled(LogLevel level, LogCategory cat) const;

    /// Flush the default logger registered with kcenon.
    WatchResult<void> flush();

    /// Process-wide instance used by the FWR_LOG macros.
    static WatchLogger& instance();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace fwr::foundation

// ---------------------------------------------------------------------------
// Convenience macros (global scope)
// ---------------------------------------------------------------------------

/// @name FWR_LOG Macros
/// FWR_MIN_LOG_LEVEL may be defined before including this header to compile
/// out calls below the threshold.
/// Values: 0=Trace, 1=Debug, 2=Info, 3=Warning, 4=Error, 5=Critical, 6=Off
/// @{

#ifndef FWR_MIN_LOG_LEVEL
    #define FWR_MIN_LOG_LEVEL 0
#endif

#define FWR_LOG(level, cat, msg)                                                  \
    do {                                                                          \
        _Pragma("GCC diagnostic push")                                            \
        _Pragma("GCC diagnostic ignored \"-Wtype-limits\"")                       \
        if (static_cast<int>(level) >= FWR_MIN_LOG_LEVEL &&                       \
            ::fwr::foundation::WatchLogger::instance().isEnabled((level), (cat)))  \
        {                                                                         \
            ::fwr::foundation::WatchLogger::instance().log((level), (cat), (msg)); \
        }                                                                         \
        _Pragma("GCC diagnostic pop")                                             \
    } while (0)

#define FWR_LOG_DEBUG(cat, msg) \
    FWR_LOG(::fwr::foundation::LogLevel::Debug, (cat), (msg))

#define FWR_LOG_INFO(cat, msg) \
    FWR_LOG(::fwr::foundation::LogLevel::Info, (cat), (msg))

#define FWR_LOG_WARN(cat, msg) \
    FWR_LOG(::fwr::foundation::LogLevel::Warning, (cat), (msg))

#define FWR_LOG_ERROR(cat, msg) \
    FWR_LOG(::fwr::foundation::LogLevel::Error, (cat), (msg))

/// @}
