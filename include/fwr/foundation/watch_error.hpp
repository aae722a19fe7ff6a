#pragma once

/// @file watch_error.hpp
/// @brief Error type used with Result<T, WatchError>.

#include <string>
#include <string_view>
#include <utility>

#include "fwr/foundation/error_code.hpp"

namespace fwr::foundation {

/// Error carrying a categorized code, a human-readable message and,
/// for OS-level failures, the originating errno value.
class WatchError {
public:
    WatchError() = default;

    explicit WatchError(ErrorCode code)
        : code_(code) {}

    WatchError(ErrorCode code, std::string message)
        : code_(code), message_(std::move(message)) {}

    WatchError(ErrorCode code, std::string message, int sysErrno)
        : code_(code), message_(std::move(message)), sysErrno_(sysErrno) {}

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }

    [[nodiscard]] std::string_view message() const noexcept { return message_; }

    /// The subsystem that produced this error.
    [[nodiscard]] std::string_view subsystem() const noexcept {
        return errorSubsystem(code_);
    }

    /// errno captured at the failure site, 0 when not applicable.
    [[nodiscard]] int sysErrno() const noexcept { return sysErrno_; }

    [[nodiscard]] bool isSuccess() const noexcept {
        return code_ == ErrorCode::Success;
    }

private:
    ErrorCode code_ = ErrorCode::Unknown;
    std::string message_;
    int sysErrno_ = 0;
};

} // namespace fwr::foundation
