#pragma once

/// @file error.hpp
/// @brief Error handling types for arbor_core

#include "fwd.hpp"
#include <cstdint>
#include <exception>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

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
    ContractViolation,
    DuplicateKey,
    InternalConsistency,
    BuildFailure,
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
        case ErrorCode::ContractViolation: return "ContractViolation";
        case ErrorCode::DuplicateKey: return "DuplicateKey";
        case ErrorCode::InternalConsistency: return "InternalConsistency";
        case ErrorCode::BuildFailure: return "BuildFailure";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Configuration loading errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,   // Config file missing or unreadable
        ParseFailed,    // Malformed document
        InvalidValue,   // Key present with the wrong type or range
    };

    Kind kind;
    std::string message;
    std::string path;
    std::string key;

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Config file not found: " + path, path, {}};
    }

    [[nodiscard]] static ConfigError parse_failed(const std::string& reason) {
        return ConfigError{Kind::ParseFailed, "Config parse failed: " + reason, {}, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + key + "': " + reason, {}, key};
    }
};

/// Widget tree errors.
///
/// Carries a one-line summary, free-form detail lines (descriptions and hints)
/// and the creator chains of every offending element.
struct TreeError {
    enum class Kind : std::uint8_t {
        ContractViolation,    // API misuse by application code
        DuplicateGlobalKey,   // Same global key active twice
        DuplicateKeys,        // Same key twice in one child list
        InternalConsistency,  // Reconciler invariant broken
        BuildFailure,         // Build or update callback threw
    };

    Kind kind;
    std::string summary;
    std::vector<std::string> details;
    std::vector<std::string> chains;

    [[nodiscard]] static TreeError contract_violation(std::string summary,
                                                      std::vector<std::string> details = {}) {
        return TreeError{Kind::ContractViolation, std::move(summary), std::move(details), {}};
    }

    [[nodiscard]] static TreeError duplicate_global_key(std::string summary,
                                                        std::vector<std::string> details,
                                                        std::vector<std::string> chains) {
        return TreeError{Kind::DuplicateGlobalKey, std::move(summary), std::move(details), std::move(chains)};
    }

    [[nodiscard]] static TreeError duplicate_keys(std::string summary) {
        return TreeError{Kind::DuplicateKeys, std::move(summary), {}, {}};
    }

    [[nodiscard]] static TreeError internal_consistency(std::string summary,
                                                        std::vector<std::string> details = {}) {
        return TreeError{Kind::InternalConsistency, std::move(summary), std::move(details), {}};
    }

    [[nodiscard]] static TreeError build_failure(std::string summary) {
        return TreeError{Kind::BuildFailure, std::move(summary), {}, {}};
    }

    /// Attach the creator chain of an offending element
    TreeError& with_chain(std::string chain) {
        chains.push_back(std::move(chain));
        return *this;
    }

    /// Append a description or hint line
    TreeError& with_detail(std::string line) {
        details.push_back(std::move(line));
        return *this;
    }

    /// Multi-line rendering: summary, details, then chains
    [[nodiscard]] std::string format() const;
};

/// Get tree error kind name
[[nodiscard]] const char* tree_error_kind_name(TreeError::Kind kind);

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ConfigError,
        TreeError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(TreeError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error message
    [[nodiscard]] std::string message() const {
        return std::visit([](const auto& err) -> std::string {
            using T = std::decay_t<decltype(err)>;
            if constexpr (std::is_same_v<T, std::string>) {
                return err;
            } else if constexpr (std::is_same_v<T, TreeError>) {
                return err.summary;
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

    /// All context entries, ordered by key
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::FileNotFound: return ErrorCode::NotFound;
            case ConfigError::Kind::ParseFailed: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(TreeError::Kind kind) {
        switch (kind) {
            case TreeError::Kind::ContractViolation: return ErrorCode::ContractViolation;
            case TreeError::Kind::DuplicateGlobalKey: return ErrorCode::DuplicateKey;
            case TreeError::Kind::DuplicateKeys: return ErrorCode::DuplicateKey;
            case TreeError::Kind::InternalConsistency: return ErrorCode::InternalConsistency;
            case TreeError::Kind::BuildFailure: return ErrorCode::BuildFailure;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// TreeException
// =============================================================================

/// Exception thrown for fatal widget tree failures.
///
/// Contract violations, duplicate keys and internal consistency failures
/// unwind to the nearest build scope boundary as a TreeException.
class TreeException : public std::exception {
public:
    explicit TreeException(TreeError error)
        : m_error(std::move(error)), m_what(m_error.summary) {}

    [[nodiscard]] const char* what() const noexcept override { return m_what.c_str(); }
    [[nodiscard]] const TreeError& error() const noexcept { return m_error; }
    [[nodiscard]] TreeError::Kind kind() const noexcept { return m_error.kind; }
    [[nodiscard]] std::string format() const { return m_error.format(); }

private:
    TreeError m_error;
    std::string m_what;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type (similar to Rust's Result<T, E>)
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_value.has_value(); }

    /// Get value (undefined if error)
    [[nodiscard]] T& value() & { return *m_value; }
    [[nodiscard]] const T& value() const& { return *m_value; }
    [[nodiscard]] T&& value() && { return std::move(*m_value); }

    /// Get error (undefined if ok)
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Get value or default
    [[nodiscard]] T value_or(T default_value) const {
        return m_value.has_value() ? *m_value : std::move(default_value);
    }

    /// Operator bool (true if ok)
    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error");
        }
        return std::move(*m_value);
    }

    /// Map success value
    template<typename F>
    auto map(F&& func) -> Result<decltype(func(std::declval<T>())), E> {
        using U = decltype(func(std::declval<T>()));
        if (m_value.has_value()) {
            return Result<U, E>(func(std::move(*m_value)));
        }
        return Result<U, E>(std::move(m_error));
    }

    /// Chain operations
    template<typename F>
    auto and_then(F&& func) -> decltype(func(std::declval<T>())) {
        if (m_value.has_value()) {
            return func(std::move(*m_value));
        }
        using ResultType = decltype(func(std::declval<T>()));
        return ResultType(std::move(m_error));
    }

    /// Handle error case
    template<typename F>
    auto or_else(F&& func) -> Result<T, E> {
        if (m_value.has_value()) {
            return Result<T, E>(std::move(*m_value));
        }
        return func(m_error);
    }

private:
    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() : m_has_value(true) {}
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    [[nodiscard]] static Result ok() { return Result(); }

    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    explicit operator bool() const noexcept { return m_has_value; }

    void unwrap() const {
        if (!m_has_value) {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    E m_error;
    bool m_has_value;
};

/// Helper for creating Ok result
template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

/// Helper for creating Ok void result
inline Result<void> Ok() {
    return Result<void>();
}

/// Helper for creating Err result
template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
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

/// Get count of recorded tree errors
std::uint64_t tree_error_count();

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace arbor_core
