#pragma once

/// @file core.hpp
/// @brief Main include file for arbor_core module
///
/// This header includes all arbor_core components in dependency order.

// Forward declarations
#include "fwd.hpp"

// Error handling and logging
#include "error.hpp"
#include "log.hpp"

/// @namespace arbor_core
/// @brief Shared infrastructure for the arbor libraries
///
/// - **Error Handling**: Result<T> monadic error handling plus an Exception
///   type for failures that unwind through caller callbacks
/// - **Logging**: spdlog-backed named loggers
///
/// Example usage:
/// @code
/// #include <arbor/core/core.hpp>
///
/// using namespace arbor_core;
///
/// Result<int> divide(int a, int b) {
///     if (b == 0) {
///         return Err<int>(Error(ErrorCode::InvalidArgument, "Division by zero"));
///     }
///     return Ok(a / b);
/// }
/// @endcode

namespace arbor_core {

/// Get library version string
[[nodiscard]] inline const char* arbor_version_string() {
    return "arbor 0.1.0";
}

} // namespace arbor_core
