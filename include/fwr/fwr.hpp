#pragma once

/// @file fwr.hpp
/// @brief Umbrella header: version, Result type and the public watch/dispatch API.

#include "fwr/core/result.hpp"
#include "fwr/dispatch/command_table.hpp"
#include "fwr/dispatch/dispatcher.hpp"
#include "fwr/dispatch/process.hpp"
#include "fwr/foundation/watch_result.hpp"
#include "fwr/version.hpp"
#include "fwr/watch/notifier.hpp"
