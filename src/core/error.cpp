/// @file error.cpp
/// @brief Error handling implementation for arbor_core
///
/// Error formatting, raise() and the debug error counters.

#include <arbor/core/error.hpp>
#include <atomic>
#include <sstream>

namespace arbor_core {

// =============================================================================
// Error Message Formatting (Out-of-line for complex cases)
// =============================================================================

namespace detail {

/// Format draft error with full context
std::string format_draft_error(const DraftError& err) {
    std::ostringstream oss;
    oss << "[DraftError:" << draft_error_kind_name(err.kind) << "] " << err.message;

    if (!err.key.empty()) {
        oss << " (key: " << err.key << ")";
    }

    return oss.str();
}

/// Format patch error with full context
std::string format_patch_error(const PatchError& err) {
    std::ostringstream oss;
    oss << "[PatchError] " << err.message;

    if (!err.op.empty()) {
        oss << " (op: " << err.op << ")";
    }

    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    // Error code
    oss << "[" << error_code_name(error.code()) << "] ";

    // Main message based on variant type
    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, DraftError>) {
            oss << detail::format_draft_error(err);
        } else if constexpr (std::is_same_v<T, PatchError>) {
            oss << detail::format_patch_error(err);
        }
    }, error.variant());

    // Context entries
    if (!error.context().empty()) {
        oss << " {";
        bool first = true;
        for (const auto& [key, value] : error.context()) {
            if (!first) oss << ", ";
            oss << key << "=" << value;
            first = false;
        }
        oss << "}";
    }

    return oss.str();
}

void raise(Error error) {
    throw Exception(std::move(error));
}

// =============================================================================
// Error Statistics (Debug/Development)
// =============================================================================

namespace debug {

/// Global error statistics for debugging
struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> draft_errors{0};
    std::atomic<std::uint64_t> patch_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

/// Record error occurrence
void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<DraftError>()) {
        s_error_stats.draft_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<PatchError>()) {
        s_error_stats.patch_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

/// Get total error count
std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

/// Reset error statistics
void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.draft_errors.store(0, std::memory_order_relaxed);
    s_error_stats.patch_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

/// Get error statistics as formatted string
std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Draft: " << s_error_stats.draft_errors.load() << "\n"
        << "  Patch: " << s_error_stats.patch_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace arbor_core
