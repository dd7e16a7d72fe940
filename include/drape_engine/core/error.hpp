#pragma once

/// @file error.hpp
/// @brief Error handling types for drape_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace drape_core {

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
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Scheduler errors (system registration)
struct SystemError {
    enum class Kind : std::uint8_t {
        DuplicateId,        // A system with this id is already registered
        DuplicateInstance,  // The same system object is already registered
        NullSystem,         // Registration without a system object
    };

    Kind kind;
    std::string message;
    std::string system_id;

    [[nodiscard]] static SystemError duplicate_id(const std::string& id) {
        return SystemError{Kind::DuplicateId, "System already registered: " + id, id};
    }

    [[nodiscard]] static SystemError duplicate_instance(const std::string& existing_id) {
        return SystemError{Kind::DuplicateInstance,
            "System instance already registered as: " + existing_id, existing_id};
    }

    [[nodiscard]] static SystemError null_system() {
        return SystemError{Kind::NullSystem, "Cannot register a null system", {}};
    }
};

/// Rigid body registry errors
struct BodyError {
    enum class Kind : std::uint8_t {
        DuplicateId,   // Body id already present
        InvalidId,     // Body id 0 is reserved for static obstacles
        InvalidShape,  // Non-positive or non-finite half extents
    };

    Kind kind;
    std::string message;
    std::uint32_t body_id = 0;

    [[nodiscard]] static BodyError duplicate_id(std::uint32_t id) {
        return BodyError{Kind::DuplicateId, "Rigid body already exists: " + std::to_string(id), id};
    }

    [[nodiscard]] static BodyError invalid_id() {
        return BodyError{Kind::InvalidId, "Rigid body id 0 is reserved", 0};
    }

    [[nodiscard]] static BodyError invalid_shape(std::uint32_t id) {
        return BodyError{Kind::InvalidShape,
            "Rigid body " + std::to_string(id) + " has degenerate half extents", id};
    }
};

/// Configuration loading errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,  // Config file could not be opened
        Parse,         // Malformed document
        WrongType,     // Field present with the wrong JSON type
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Failed to open config file: " + path, path};
    }

    [[nodiscard]] static ConfigError parse(const std::string& reason) {
        return ConfigError{Kind::Parse, "Config parse error: " + reason, {}};
    }

    [[nodiscard]] static ConfigError wrong_type(const std::string& key, const std::string& expected) {
        return ConfigError{Kind::WrongType,
            "Config field '" + key + "' must be " + expected, key};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        SystemError,
        BodyError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(SystemError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(BodyError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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
    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept {
        return m_context;
    }

private:
    static ErrorCode to_error_code(SystemError::Kind kind) {
        switch (kind) {
            case SystemError::Kind::DuplicateId: return ErrorCode::AlreadyExists;
            case SystemError::Kind::DuplicateInstance: return ErrorCode::AlreadyExists;
            case SystemError::Kind::NullSystem: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(BodyError::Kind kind) {
        switch (kind) {
            case BodyError::Kind::DuplicateId: return ErrorCode::AlreadyExists;
            case BodyError::Kind::InvalidId: return ErrorCode::InvalidArgument;
            case BodyError::Kind::InvalidShape: return ErrorCode::InvalidArgument;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::FileNotFound: return ErrorCode::IOError;
            case ConfigError::Kind::Parse: return ErrorCode::ParseError;
            case ConfigError::Kind::WrongType: return ErrorCode::ValidationError;
            default: return ErrorCode::Unknown;
        }
    }

    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

// =============================================================================
// Result<T, E>
// =============================================================================

/// Result type carrying either a value or an error
/// @tparam T Value type
/// @tparam E Error type (defaults to Error)
template<typename T, typename E>
class [[nodiscard]] Result {
public:
    using value_type = T;
    using error_type = E;

    /// Success constructor
    Result(T value) : m_value(std::move(value)) {}

    /// Error constructor
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_value.has_value(); }
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

    explicit operator bool() const noexcept { return m_value.has_value(); }

    [[nodiscard]] T& operator*() & { return *m_value; }
    [[nodiscard]] const T& operator*() const& { return *m_value; }
    [[nodiscard]] T&& operator*() && { return std::move(*m_value); }

    [[nodiscard]] T* operator->() { return &(*m_value); }
    [[nodiscard]] const T* operator->() const { return &(*m_value); }

    /// Unwrap (throws if error)
    [[nodiscard]] T& unwrap() & {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + error_message());
        }
        return *m_value;
    }

    [[nodiscard]] T&& unwrap() && {
        if (!m_value.has_value()) {
            throw std::runtime_error("Result contains error: " + error_message());
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

private:
    std::string error_message() const {
        if constexpr (std::is_same_v<E, Error>) {
            return m_error.message();
        } else {
            return "unknown";
        }
    }

    std::optional<T> m_value;
    E m_error;
};

/// Partial specialization for void result
template<typename E>
class [[nodiscard]] Result<void, E> {
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

/// Build a full error message with code and context
std::string build_error_chain(const Error& error);

} // namespace drape_core
