#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for arbor_core module

#include <cstdint>

namespace arbor_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
struct DraftError;
struct PatchError;
class Error;
class Exception;

template<typename T, typename E = Error>
class Result;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace arbor_core
