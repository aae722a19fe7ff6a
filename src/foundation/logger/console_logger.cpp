/// @file console_logger.cpp
/// @brief ConsoleLogger: stderr sink for the kcenon logger registry.

#include "fwr/foundation/console_logger.hpp"

#include <iostream>

namespace fwr::foundation {

namespace kci = kcenon::common::interfaces;

static std::string_view levelTag(kci::log_level level) {
    switch (level) {
        case kci::log_level::trace:    return "trace";
        case kci::log_level::debug:    return "debug";
        case kci::log_level::info:     return "info";
        case kci::log_level::warning:  return "warn";
        case kci::log_level::error:    return "error";
        case kci::log_level::critical: return "fatal";
        default:                       return "";
    }
}

kcenon::common::VoidResult ConsoleLogger::log(kci::log_level level,
                                              const std::string& message) {
    if (!is_enabled(level)) {
        return kcenon::common::VoidResult::ok(std::monostate{});
    }
    std::lock_guard lock(mutex_);
    std::cerr << levelTag(level) << ": " << message << '\n';
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kcenon::common::VoidResult ConsoleLogger::log(kci::log_level level,
                                              std::string_view message,
                                              const kci::source_location& /*loc*/) {
    return log(level, std::string(message));
}

kcenon::common::VoidResult ConsoleLogger::log(const kci::log_entry& entry) {
    return log(entry.level, entry.message);
}

bool ConsoleLogger::is_enabled(kci::log_level level) const {
    return level != kci::log_level::off &&
           level >= minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::set_level(kci::log_level level) {
    minLevel_.store(level, std::memory_order_release);
    return kcenon::common::VoidResult::ok(std::monostate{});
}

kci::log_level ConsoleLogger::get_level() const {
    return minLevel_.load(std::memory_order_acquire);
}

kcenon::common::VoidResult ConsoleLogger::flush() {
    std::lock_guard lock(mutex_);
    std::cerr.flush();
    return kcenon::common::VoidResult::ok(std::monostate{});
}

} // namespace fwr::foundation
