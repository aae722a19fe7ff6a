#pragma once

/// @file watch_result.hpp
/// @brief WatchResult<T> type alias used by every fallible fwr operation.

#include "fwr/core/result.hpp"
#include "fwr/foundation/watch_error.hpp"

namespace fwr::foundation {

/// Result type specialized with WatchError.
///
/// Example:
/// @code
///   WatchResult<int64_t> probe(const std::string& path) {
///       if (!isFile(path)) {
///           return WatchResult<int64_t>::err(
///               WatchError(ErrorCode::NotFound, path + ": not a file"));
///       }
///       return WatchResult<int64_t>::ok(modifiedTime(path));
///   }
/// @endcode
template <typename T>
using WatchResult = fwr::Result<T, WatchError>;

}  // namespace fwr::foundation
