#pragma once

/// @file log.hpp
/// @brief spdlog-backed loggers for the arbor libraries

#include <spdlog/spdlog.h>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

// =============================================================================
// Logging Macros
// =============================================================================

#define ARBOR_TREE_TRACE(...) ::arbor_core::tree_logger()->trace(__VA_ARGS__)
#define ARBOR_TREE_DEBUG(...) ::arbor_core::tree_logger()->debug(__VA_ARGS__)
#define ARBOR_TREE_WARN(...) ::arbor_core::tree_logger()->warn(__VA_ARGS__)
#define ARBOR_TREE_ERROR(...) ::arbor_core::tree_logger()->error(__VA_ARGS__)

namespace arbor_core {

// =============================================================================
// Log Configuration
// =============================================================================

/// Sinks and level shared by every arbor logger
struct LogConfig {
    bool console_enabled = true;

    /// Rotating file sink, written to <log_directory>/arbor.log when set
    std::string log_directory;
    std::size_t max_file_size = 4 * 1024 * 1024;
    std::size_t max_files = 3;

    spdlog::level::level_enum level = spdlog::level::warn;
    std::string pattern = "[%H:%M:%S.%e] [%^%l%$] [%n] %v";

    /// Defaults, with the level taken from ARBOR_LOG_LEVEL when it parses
    [[nodiscard]] static LogConfig from_env();
};

/// Rebuild the shared sinks and reattach every registered logger to them
void configure_logging(const LogConfig& config);

// =============================================================================
// Named Loggers
// =============================================================================

/// Get or create a named logger attached to the shared sinks
std::shared_ptr<spdlog::logger> get_logger(const std::string& name);

/// Logger for error bookkeeping ("arbor_core")
std::shared_ptr<spdlog::logger> core_logger();

/// Logger for scopes, finalization and patches ("arbor_tree")
std::shared_ptr<spdlog::logger> tree_logger();

// =============================================================================
// Levels
// =============================================================================

void set_global_log_level(spdlog::level::level_enum level);

/// No-op for names that were never registered
void set_logger_level(const std::string& name, spdlog::level::level_enum level);

spdlog::level::level_enum get_global_log_level();

/// Accepts spdlog names plus "warning" and "fatal"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& str);

const char* log_level_name(spdlog::level::level_enum level);

// =============================================================================
// Structured Logging
// =============================================================================

/// Log message followed by {key="value", ...}
void log_structured(
    spdlog::level::level_enum level,
    const std::string& logger_name,
    const std::string& message,
    const std::map<std::string, std::string>& fields);

// =============================================================================
// LogScope
// =============================================================================

/// Traces entry and exit of a block with its duration
class LogScope {
public:
    explicit LogScope(std::string name, std::shared_ptr<spdlog::logger> logger = tree_logger());
    ~LogScope();

    LogScope(const LogScope&) = delete;
    LogScope& operator=(const LogScope&) = delete;

private:
    std::string m_name;
    std::shared_ptr<spdlog::logger> m_logger;
    std::chrono::steady_clock::time_point m_start;
};

#define ARBOR_LOG_CONCAT_INNER(a, b) a##b
#define ARBOR_LOG_CONCAT(a, b) ARBOR_LOG_CONCAT_INNER(a, b)
#define ARBOR_LOG_SCOPE(name) ::arbor_core::LogScope ARBOR_LOG_CONCAT(arbor_log_scope_, __LINE__)(name)

// =============================================================================
// Lifecycle
// =============================================================================

void flush_all_loggers();

/// Flush, then drop every arbor logger from the spdlog registry
void shutdown_logging();

} // namespace arbor_core
