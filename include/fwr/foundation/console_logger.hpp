#pragma once

/// @file console_logger.hpp
/// @brief ILogger implementation that writes formatted lines to stderr.
///
/// Registered by the executable as the GlobalLoggerRegistry default logger
/// so WatchLogger output reaches the terminal.

#include <atomic>
#include <mutex>
#include <string>
#include <string_view>

#include <kcenon/common/interfaces/logger_interface.h>

namespace fwr::foundation {

class ConsoleLogger : public kcenon::common::interfaces::ILogger {
public:
    ConsoleLogger() = default;

    kcenon::common::VoidResult log(kcenon::common::interfaces::log_level level,
                                   const std::string& message) override;

    kcenon::common::VoidResult log(
        kcenon::common::interfaces::log_level level, std::string_view message,
        const kcenon::common::interfaces::source_location& loc) override;

    kcenon::common::VoidResult log(
        const kcenon::common::interfaces::log_entry& entry) override;

    bool is_enabled(kcenon::common::interfaces::log_level level) const override;

    kcenon::common::VoidResult set_level(
        kcenon::common::interfaces::log_level level) override;

    kcenon::common::interfaces::log_level get_level() const override;

    kcenon::common::VoidResult flush() override;

private:
    mutable std::mutex mutex_;
    std::atomic<kcenon::common::interfaces::log_level> minLevel_{
        kcenon::common::interfaces::log_level::trace};
};

} // namespace fwr::foundation
