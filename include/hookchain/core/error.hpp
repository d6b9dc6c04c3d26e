#pragma once

/// @file error.hpp
/// @brief Error handling types for hookchain_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace hookchain_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// General error code for categorizing errors
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    NotFound,
    AlreadyExists,
    InvalidArgument,
    InvalidState,
    IOError,
    ParseError,
    ValidationError,
    DispatchFailed,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::AlreadyExists: return "AlreadyExists";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::InvalidState: return "InvalidState";
        case ErrorCode::IOError: return "IOError";
        case ErrorCode::ParseError: return "ParseError";
        case ErrorCode::ValidationError: return "ValidationError";
        case ErrorCode::DispatchFailed: return "DispatchFailed";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Event catalog, expansion and registration errors
struct EventError {
    enum class Kind : std::uint8_t {
        UnknownEvent,     // Hook name absent from primitive and synthetic tables
        DuplicateEvent,   // Catalog merge collided with an existing entry
        TargetMismatch,   // Target kind differs from the hook's declared kind
        InvalidCallback,  // Callback or condition does not match the argument mode
        InvalidState,     // Chain used in a state that does not allow the operation
        DispatchFailed,   // External dispatcher refused a listen/unlisten
    };

    Kind kind;
    std::string message;
    std::string event_name;
    std::string expected;  // For TargetMismatch
    std::string found;     // For TargetMismatch

    [[nodiscard]] static EventError unknown_event(const std::string& name) {
        return EventError{Kind::UnknownEvent, "Unknown event: " + name, name, {}, {}};
    }

    [[nodiscard]] static EventError duplicate_event(const std::string& name) {
        return EventError{Kind::DuplicateEvent, "Event already in catalog: " + name, name, {}, {}};
    }

    [[nodiscard]] static EventError target_mismatch(const std::string& name,
                                                    const std::string& expected_kind,
                                                    const std::string& found_kind) {
        return EventError{Kind::TargetMismatch,
            "Event '" + name + "' expects a " + expected_kind + " target, got " + found_kind,
            name, expected_kind, found_kind};
    }

    [[nodiscard]] static EventError invalid_callback(const std::string& name, const std::string& reason) {
        return EventError{Kind::InvalidCallback, "Invalid callback for '" + name + "': " + reason, name, {}, {}};
    }

    [[nodiscard]] static EventError invalid_state(const std::string& name, const std::string& reason) {
        return EventError{Kind::InvalidState, name + ": " + reason, name, {}, {}};
    }

    [[nodiscard]] static EventError dispatch_failed(const std::string& name, const std::string& reason) {
        return EventError{Kind::DispatchFailed, "Dispatch failed for '" + name + "': " + reason, name, {}, {}};
    }
};

/// Configuration loading errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        IOError,       // File could not be read
        ParseError,    // Malformed JSON
        InvalidValue,  // Well-formed but unacceptable value
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] static ConfigError io_error(const std::string& path) {
        return ConfigError{Kind::IOError, "Cannot read config file: " + path, {}};
    }

    [[nodiscard]] static ConfigError parse_error(const std::string& reason) {
        return ConfigError{Kind::ParseError, "Config parse error: " + reason, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& value) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + key + "': " + value, key};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        EventError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(EventError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    static ErrorCode to_error_code(EventError::Kind kind) {
        switch (kind) {
            case EventError::Kind::UnknownEvent: return ErrorCode::NotFound;
            case EventError::Kind::DuplicateEvent: return ErrorCode::AlreadyExists;
            case EventError::Kind::TargetMismatch: return ErrorCode::InvalidArgument;
            case EventError::Kind::InvalidCallback: return ErrorCode::InvalidArgument;
            case EventError::Kind::InvalidState: return ErrorCode::InvalidState;
            case EventError::Kind::DispatchFailed: return ErrorCode::DispatchFailed;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::IOError: return ErrorCode::IOError;
            case ConfigError::Kind::ParseError: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
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

/// Carries an Error out of a context that has no return channel, such as a
/// hook callback invoked by the external dispatcher.
class Exception : public std::runtime_error {
public:
    explicit Exception(Error error)
        : std::runtime_error(error.message()), m_error(std::move(error)) {}

    [[nodiscard]] const Error& error() const noexcept { return m_error; }
    [[nodiscard]] ErrorCode code() const noexcept { return m_error.code(); }

private:
    Error m_error;
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

    /// Dereference operator (returns value)
    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    /// Arrow operator
    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw Exception(m_error);
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw Exception(m_error);
        }
        return std::move(*m_value);
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

    /// Success constructor
    Result() : m_has_value(true) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)), m_has_value(false) {}

    /// Static factory for success
    [[nodiscard]] static Result ok() { return Result(); }

    /// Check if result is ok
    [[nodiscard]] bool is_ok() const noexcept { return m_has_value; }

    /// Check if result is error
    [[nodiscard]] bool is_err() const noexcept { return !m_has_value; }

    /// Get error
    [[nodiscard]] E& error() & { return m_error; }
    [[nodiscard]] const E& error() const& { return m_error; }

    /// Operator bool
    explicit operator bool() const noexcept { return m_has_value; }

    /// Unwrap
    void unwrap() const {
        if (!m_has_value) {
            throw Exception(m_error);
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

} // namespace hookchain_core
