#pragma once

/// @file error.hpp
/// @brief Error handling types for arbor_core

#include "fwd.hpp"
#include <cstdint>
#include <exception>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace arbor_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    NotSupported,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Draft lifecycle errors
struct DraftError {
    enum class Kind : std::uint8_t {
        InvalidArgument,    // Wrong kind of value or callable
        DoubleReturn,       // Recipe modified its draft and returned a replacement
        AlreadyFinalized,   // finish_draft called twice
        CyclicReference,    // Value assigned as its own descendant
        Revoked,            // Draft used after its scope ended
    };

    Kind kind;
    std::string message;
    std::string key;  // Offending property, when known

    /// Factory methods
    [[nodiscard]] static DraftError invalid_argument(const std::string& reason) {
        return DraftError{Kind::InvalidArgument, "Invalid argument: " + reason, {}};
    }

    [[nodiscard]] static DraftError double_return() {
        return DraftError{Kind::DoubleReturn,
            "A recipe returned a new value *and* modified its draft. "
            "Either return a new value *or* modify the draft.", {}};
    }

    [[nodiscard]] static DraftError already_finalized() {
        return DraftError{Kind::AlreadyFinalized, "The draft has already been finished", {}};
    }

    [[nodiscard]] static DraftError cyclic_reference(const std::string& key) {
        return DraftError{Kind::CyclicReference,
            "Circular reference at property '" + key + "'", key};
    }

    [[nodiscard]] static DraftError revoked(const std::string& operation) {
        return DraftError{Kind::Revoked,
            "Cannot perform '" + operation + "' on a draft whose scope has ended", {}};
    }
};

/// Get draft error kind name
[[nodiscard]] inline const char* draft_error_kind_name(DraftError::Kind kind) {
    switch (kind) {
        case DraftError::Kind::InvalidArgument: return "InvalidArgument";
        case DraftError::Kind::DoubleReturn: return "DoubleReturn";
        case DraftError::Kind::AlreadyFinalized: return "AlreadyFinalized";
        case DraftError::Kind::CyclicReference: return "CyclicReference";
        case DraftError::Kind::Revoked: return "Revoked";
        default: return "Unknown";
    }
}

/// Patch decoding and replay errors
struct PatchError {
    enum class Kind : std::uint8_t {
        UnknownOp,      // Unrecognized patch operation
        InvalidPath,    // Path does not resolve against the target
        MissingValue,   // add/replace without a value
    };

    Kind kind;
    std::string message;
    std::string op;    // For UnknownOp
    std::string path;  // Rendered path, when known

    [[nodiscard]] static PatchError unknown_op(const std::string& op_name) {
        return PatchError{Kind::UnknownOp, "Unsupported patch operation: " + op_name, op_name, {}};
    }

    [[nodiscard]] static PatchError invalid_path(const std::string& rendered, const std::string& reason) {
        return PatchError{Kind::InvalidPath,
            "Cannot apply patch at " + rendered + ": " + reason, {}, rendered};
    }

    [[nodiscard]] static PatchError missing_value(const std::string& rendered) {
        return PatchError{Kind::MissingValue, "Patch at " + rendered + " has no value", {}, rendered};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        DraftError,
        PatchError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(DraftError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(PatchError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    /// Check error type
    template<typename T>
    [[nodiscard]] bool is() const {
        return std::holds_alternative<T>(m_error);
    }

    /// Get error as specific type
    template<typename T>
    [[nodiscard]] const T* as() const {
        return std::get_if<T>(&m_error);
    }

    /// Check for a specific draft error kind
    [[nodiscard]] bool is_draft_error(DraftError::Kind kind) const {
        const auto* err = as<DraftError>();
        return err && err->kind == kind;
    }

    /// Check for a specific patch error kind
    [[nodiscard]] bool is_patch_error(PatchError::Kind kind) const {
        const auto* err = as<PatchError>();
        return err && err->kind == kind;
    }

    /// Get underlying variant
    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Add context information
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    /// Get context value
    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it != m_context.end() ? &it->second : nullptr;
    }

    /// All context entries
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(DraftError::Kind kind) {
        switch (kind) {
            case DraftError::Kind::InvalidArgument: return ErrorCode::InvalidArgument;
            case DraftError::Kind::DoubleReturn: return ErrorCode::InvalidState;
            case DraftError::Kind::AlreadyFinalized: return ErrorCode::InvalidState;
            case DraftError::Kind::CyclicReference: return ErrorCode::InvalidArgument;
            case DraftError::Kind::Revoked: return ErrorCode::InvalidState;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(PatchError::Kind kind) {
        switch (kind) {
            case PatchError::Kind::UnknownOp: return ErrorCode::ParseError;
            case PatchError::Kind::InvalidPath: return ErrorCode::NotFound;
            case PatchError::Kind::MissingValue: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Exception
// =============================================================================

/// Exception carrying an Error through user callbacks
///
/// Draft operations run inside caller-supplied recipes, so failures unwind
/// as exceptions; the entry points revoke the scope before rethrowing.
class Exception : public std::exception {
public:
    explicit Exception(Error error)
        : m_error(std::move(error))
        , m_what(m_error.message()) {}

    [[nodiscard]] const char* what() const noexcept override { return m_what.c_str(); }
    [[nodiscard]] const Error& error() const noexcept { return m_error; }
    [[nodiscard]] ErrorCode code() const noexcept { return m_error.code(); }

private:
    Error m_error;
    std::string m_what;
};

/// Throw an Exception for the given error
[[noreturn]] void raise(Error error);

// =============================================================================
// Result<T, E>
// =============================================================================

/// Value or Error, for the try_* entry points and config loading
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_value(std::move(value)) {}
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }
    explicit operator bool() const noexcept { return is_ok(); }

    /// Undefined when is_err()
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Undefined when is_ok()
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Value, or the carried error thrown as an Exception
    [[nodiscard]] T unwrap() && {
        if (!m_value) {
            raise(std::move(m_error));
        }
        return std::move(*m_value);
    }

private:
    std::optional<T> m_value;
    E m_error;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

template<typename T>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with context chain
std::string build_error_chain(const Error& error);

namespace debug {

/// Record error occurrence (for statistics)
void record_error(const Error& error);

/// Get total error count
std::uint64_t total_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace arbor_core
