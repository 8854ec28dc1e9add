#pragma once

/// @file error.hpp
/// @brief Error handling types for ember_core

#include "fwd.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>

namespace ember_core {

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
    ValidationError,
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
        case ErrorCode::ValidationError: return "ValidationError";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Handle errors
struct HandleError {
    enum class Kind : std::uint8_t {
        Null,         // Handle is null
        Stale,        // Handle generation mismatch (already freed)
        OutOfBounds,  // Handle index out of bounds
    };

    Kind kind;
    std::string message;

    [[nodiscard]] static HandleError null() {
        return HandleError{Kind::Null, "Handle is null"};
    }

    [[nodiscard]] static HandleError stale() {
        return HandleError{Kind::Stale, "Handle is stale (generation mismatch)"};
    }

    [[nodiscard]] static HandleError out_of_bounds() {
        return HandleError{Kind::OutOfBounds, "Handle index out of bounds"};
    }
};

/// Callback delivery errors
struct DeliveryError {
    enum class Kind : std::uint8_t {
        UnknownCallback,  // Target has no callback bound under the name
        EmptyName,        // Callback name is empty
    };

    Kind kind;
    std::string message;
    std::string target;
    std::string callback;

    [[nodiscard]] static DeliveryError unknown_callback(const std::string& target_name, const std::string& name) {
        return DeliveryError{Kind::UnknownCallback,
            "No callback '" + name + "' on " + target_name, target_name, name};
    }

    [[nodiscard]] static DeliveryError empty_name(const std::string& target_name) {
        return DeliveryError{Kind::EmptyName, "Empty callback name for " + target_name, target_name, {}};
    }
};

/// Configuration errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        FileNotFound,   // Config file missing or unreadable
        ParseError,     // Malformed document
        InvalidValue,   // Well-formed document with an unusable value
    };

    Kind kind;
    std::string message;
    std::string key;

    [[nodiscard]] static ConfigError file_not_found(const std::string& path) {
        return ConfigError{Kind::FileNotFound, "Config file not found: " + path, {}};
    }

    [[nodiscard]] static ConfigError parse_error(const std::string& reason) {
        return ConfigError{Kind::ParseError, "Failed to parse config: " + reason, {}};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key_name, const std::string& value) {
        return ConfigError{Kind::InvalidValue,
            "Invalid value for '" + key_name + "': " + value, key_name};
    }
};

// =============================================================================
// Error
// =============================================================================

namespace detail {

[[nodiscard]] inline ErrorCode code_of(const HandleError& err) {
    return err.kind == HandleError::Kind::Stale ? ErrorCode::InvalidState : ErrorCode::InvalidArgument;
}

[[nodiscard]] inline ErrorCode code_of(const DeliveryError& err) {
    return err.kind == DeliveryError::Kind::UnknownCallback ? ErrorCode::NotFound : ErrorCode::InvalidArgument;
}

[[nodiscard]] inline ErrorCode code_of(const ConfigError& err) {
    switch (err.kind) {
        case ConfigError::Kind::FileNotFound: return ErrorCode::IOError;
        case ConfigError::Kind::ParseError: return ErrorCode::ParseError;
        case ConfigError::Kind::InvalidValue: return ErrorCode::ValidationError;
    }
    return ErrorCode::Unknown;
}

} // namespace detail

/// Error value: an ErrorCode, one of the typed kinds (or a plain message)
/// and free-form context entries added along the way
class Error {
public:
    using Variant = std::variant<std::string, HandleError, DeliveryError, ConfigError>;

    Error() : Error(ErrorCode::Unknown, "Unknown error") {}
    Error(const std::string& msg) : Error(ErrorCode::Unknown, msg) {}
    Error(const char* msg) : Error(ErrorCode::Unknown, std::string(msg)) {}
    Error(ErrorCode code, std::string msg) : m_code(code), m_error(std::move(msg)) {}

    Error(HandleError err) : m_code(detail::code_of(err)), m_error(std::move(err)) {}
    Error(DeliveryError err) : m_code(detail::code_of(err)), m_error(std::move(err)) {}
    Error(ConfigError err) : m_code(detail::code_of(err)), m_error(std::move(err)) {}

    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    [[nodiscard]] const std::string& message() const {
        return std::visit([](const auto& err) -> const std::string& {
            if constexpr (std::is_same_v<std::decay_t<decltype(err)>, std::string>) {
                return err;
            } else {
                return err.message;
            }
        }, m_error);
    }

    template<typename T>
    [[nodiscard]] bool is() const { return std::holds_alternative<T>(m_error); }

    /// Typed kind, or nullptr when the error holds another kind
    template<typename T>
    [[nodiscard]] const T* as() const { return std::get_if<T>(&m_error); }

    [[nodiscard]] const Variant& variant() const noexcept { return m_error; }

    /// Attach `key=value`; an existing key is overwritten
    Error& with_context(const std::string& key, const std::string& value) {
        m_context[key] = value;
        return *this;
    }

    [[nodiscard]] const std::string* get_context(const std::string& key) const {
        auto it = m_context.find(key);
        return it == m_context.end() ? nullptr : &it->second;
    }

    [[nodiscard]] const std::map<std::string, std::string>& context() const noexcept { return m_context; }

private:
    ErrorCode m_code;
    Variant m_error;
    std::map<std::string, std::string> m_context;
};

/// `[Code] [Kind] message (details) {key=value}...`
std::string build_error_chain(const Error& error);

// =============================================================================
// Result
// =============================================================================

/// Either a value of type T or an error of type E
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    Result(T value) : m_state(std::in_place_index<0>, std::move(value)) {}
    Result(E error) : m_state(std::in_place_index<1>, std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return m_state.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return m_state.index() == 1; }
    explicit operator bool() const noexcept { return is_ok(); }

    /// Value access; only valid when is_ok()
    [[nodiscard]] T& value() & { return std::get<0>(m_state); }
    [[nodiscard]] const T& value() const& { return std::get<0>(m_state); }
    [[nodiscard]] T&& value() && { return std::get<0>(std::move(m_state)); }

    /// Error access; only valid when is_err()
    [[nodiscard]] E& error() & { return std::get<1>(m_state); }
    [[nodiscard]] const E& error() const& { return std::get<1>(m_state); }

    [[nodiscard]] T value_or(T fallback) const {
        return is_ok() ? std::get<0>(m_state) : std::move(fallback);
    }

    [[nodiscard]] T& operator*() & { return value(); }
    [[nodiscard]] const T& operator*() const& { return value(); }
    [[nodiscard]] T* operator->() { return &value(); }
    [[nodiscard]] const T* operator->() const { return &value(); }

    /// Value, or std::runtime_error describing the error
    [[nodiscard]] T& unwrap() & {
        check();
        return value();
    }

    [[nodiscard]] T&& unwrap() && {
        check();
        return std::move(*this).value();
    }

private:
    void check() const {
        if (is_err()) {
            throw std::runtime_error(describe(error()));
        }
    }

    static std::string describe(const E& error) {
        if constexpr (std::is_same_v<E, Error>) {
            return build_error_chain(error);
        } else {
            return "Result contains error";
        }
    }

    std::variant<T, E> m_state;
};

template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() = default;
    Result(E error) : m_error(std::move(error)) {}

    [[nodiscard]] bool is_ok() const noexcept { return !m_error.has_value(); }
    [[nodiscard]] bool is_err() const noexcept { return m_error.has_value(); }
    explicit operator bool() const noexcept { return is_ok(); }

    [[nodiscard]] E& error() & { return *m_error; }
    [[nodiscard]] const E& error() const& { return *m_error; }

    void unwrap() const {
        if (!is_err()) {
            return;
        }
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error(build_error_chain(*m_error));
        } else {
            throw std::runtime_error("Result contains error");
        }
    }

private:
    std::optional<E> m_error;
};

template<typename T>
Result<T> Ok(T value) {
    return Result<T>(std::move(value));
}

inline Result<void> Ok() {
    return Result<void>();
}

template<typename T = void>
Result<T> Err(Error error) {
    return Result<T>(std::move(error));
}

template<typename T = void>
Result<T> Err(const std::string& message) {
    return Result<T>(Error(message));
}

} // namespace ember_core
