#pragma once

/// @file raw_event.hpp
/// @brief Raw filesystem notification as delivered by a WatchSource.

#include <cstdint>
#include <string>
#include <string_view>

namespace fwr::watch {

/// Filesystem operation kinds (bit flags; a raw event normally carries one).
enum class Op : uint32_t {
    None   = 0,
    Create = 1u << 0,
    Write  = 1u << 1,
    Remove = 1u << 2,
    Rename = 1u << 3,
    Chmod  = 1u << 4,
};

constexpr Op operator|(Op lhs, Op rhs) noexcept {
    return static_cast<Op>(static_cast<uint32_t>(lhs) | static_cast<uint32_t>(rhs));
}

constexpr Op operator&(Op lhs, Op rhs) noexcept {
    return static_cast<Op>(static_cast<uint32_t>(lhs) & static_cast<uint32_t>(rhs));
}

/// True if @p op carries any bit of @p flags.
constexpr bool hasOp(Op op, Op flags) noexcept {
    return (op & flags) != Op::None;
}

/// Render an op as "CREATE|WRITE" style text for logs.
std::string opName(Op op);

/// One raw notification.
struct RawEvent {
    std::string name;
    Op op = Op::None;
};

} // namespace fwr::watch
