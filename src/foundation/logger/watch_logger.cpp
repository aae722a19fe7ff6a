/// @file watch_logger.cpp
/// @brief WatchLogger implementation wrapping kcenon common_system logging.

#include "fwr/foundation/watch_logger.hpp"

// kcenon logger headers (hidden behind PIMPL)
#include <kcenon/common/interfaces/global_logger_registry.h>
#include <kcenon/common/interfaces/logger_interface.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <sstream>
#include <string>

namespace fwr::foundation {

namespace kci = kcenon::common::interfaces;

static kci::log_level mapLevel(LogLevel level) {
    switch (level) {
        case LogLevel::Trace:    return kci::log_level::trace;
        case LogLevel::Debug:    return kci::log_level::debug;
        case LogLevel::Info:     return kci::log_level::info;
        case LogLevel::Warning:  return kci::log_level::warning;
        case LogLevel::Error:    return kci::log_level::error;
        case LogLevel::Critical: return kci::log_level::critical;
        case LogLevel::Off:      return kci::log_level::off;
    }
    return kci::log_level::info;
}

WatchResult<LogLevel> parseLogLevel(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    for (auto level : {LogLevel::Trace, LogLevel::Debug, LogLevel::Info,
                       LogLevel::Warning, LogLevel::Error, LogLevel::Critical,
                       LogLevel::Off}) {
        std::string candidate(logLevelName(level));
        std::transform(candidate.begin(), candidate.end(), candidate.begin(),
                       [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
        if (candidate == lowered) {
            return WatchResult<LogLevel>::ok(level);
        }
    }
    if (lowered == "warn") {
        return WatchResult<LogLevel>::ok(LogLevel::Warning);
    }
    return WatchResult<LogLevel>::err(
        WatchError(ErrorCode::ConfigInvalidValue,
                   "unknown log level: " + std::string(name)));
}

static std::string formatContext(const LogContext& ctx) {
    std::ostringstream oss;
    bool first = true;

    auto append = [&](std::string_view key, std::string_view val) {
        if (!first) {
            oss << ", ";
        }
        oss << key << '=' << val;
        first = false;
    };

    if (ctx.path && !ctx.path->empty()) {
        append("path", *ctx.path);
    }
    if (ctx.pid) {
        append("pid", std::to_string(*ctx.pid));
    }
    for (const auto& [key, val] : ctx.extra) {
        append(key, val);
    }

    return oss.str();
}

// ---------------------------------------------------------------------------
// Impl
// ---------------------------------------------------------------------------
struct WatchLogger::Impl {
    std::array<std::atomic<LogLevel>, kLogCategoryCount> categoryLevels;

    // Named loggers looked up in GlobalLoggerRegistry, one per category
    std::array<std::string, kLogCategoryCount> loggerNames;

    Impl() {
        for (std::size_t i = 0; i < kLogCategoryCount; ++i) {
            categoryLevels[i].store(LogLevel::Info, std::memory_order_relaxed);
            loggerNames[i] = std::string("fwr.") +
                std::string(logCategoryName(static_cast<LogCategory>(i)));
        }
    }

    std::shared_ptr<kci::ILogger> getLogger(LogCategory cat) const {
        auto idx = static_cast<std::size_t>(cat);
        if (idx >= kLogCategoryCount) {
            return kci::GlobalLoggerRegistry::null_logger();
        }
        // Named logger first; unregistered names resolve to the null logger.
        auto& registry = kci::GlobalLoggerRegistry::instance();
        auto logger = registry.get_logger(loggerNames[idx]);
        if (logger == kci::GlobalLoggerRegistry::null_logger()) {
            return registry.get_default_logger();
        }
        return logger;
    }

    void emit(LogLevel level, LogCategory cat, std::string_view msg,
              std::string_view suffix) const {
        std::string formatted;
        formatted.reserve(msg.size() + suffix.size() + 20);
        formatted += '[';
        formatted += logCategoryName(cat);
        formatted += "] ";
        formatted += msg;
        if (!suffix.empty()) {
            formatted += " {";
            formatted += suffix;
            formatted += '}';
        }
        // A failing sink has nowhere else to report to.
        static_cast<void>(getLogger(cat)->log(mapLevel(level), formatted));
    }
};

WatchLogger::WatchLogger() : impl_(std::make_unique<Impl>()) {}

WatchLogger::~WatchLogger() = default;

WatchLogger::WatchLogger(WatchLogger&&) noexcept = default;
WatchLogger& WatchLogger::operator=(WatchLogger&&) noexcept = default;

void WatchLogger::log(LogLevel level, LogCategory cat, std::string_view msg) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, {});
}

void WatchLogger::logWithContext(LogLevel level, LogCategory cat,
                                 std::string_view msg, const LogContext& ctx) {
    if (!isEnabled(level, cat)) {
        return;
    }
    impl_->emit(level, cat, msg, formatContext(ctx));
}

void WatchLogger::setCategoryLevel(LogCategory cat, LogLevel minLevel) {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        impl_->categoryLevels[idx].store(minLevel, std::memory_order_release);
    }
}

void WatchLogger::setAllCategoryLevels(LogLevel minLevel) {
    for (auto& level : impl_->categoryLevels) {
        level.store(minLevel, std::memory_order_release);
    }
}

LogLevel WatchLogger::getCategoryLevel(LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx < kLogCategoryCount) {
        return impl_->categoryLevels[idx].load(std::memory_order_acquire);
    }
    return LogLevel::Off;
}

bool WatchLogger::isEnabled(LogLevel level, LogCategory cat) const {
    auto idx = static_cast<std::size_t>(cat);
    if (idx >= kLogCategoryCount || level == LogLevel::Off) {
        return false;
    }
    auto minLevel = impl_->categoryLevels[idx].load(std::memory_order_acquire);
    return static_cast<uint8_t>(level) >= static_cast<uint8_t>(minLevel);
}

WatchResult<void> WatchLogger::flush() {
    auto& registry = kci::GlobalLoggerRegistry::instance();
    auto result = registry.get_default_logger()->flush();
    if (result.is_err()) {
        return WatchResult<void>::err(
            WatchError(ErrorCode::LoggerFlushFailed, "failed to flush logger"));
    }
    return WatchResult<void>::ok();
}

WatchLogger& WatchLogger::instance() {
    static WatchLogger inst;
    return inst;
}

} // namespace fwr::foundation
