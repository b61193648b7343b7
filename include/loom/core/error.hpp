#pragma once

/// @file error.hpp
/// @brief Error handling types for loom_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace loom_core {

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
    NotSupported,
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
        case ErrorCode::NotSupported: return "NotSupported";
        default: return "Unknown";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// UI graph compilation errors
struct DeriveError {
    enum class Kind : std::uint8_t {
        Parse,                // Annotation payload is not `name: expr, ...`
        UnknownType,          // No usable type name for a field
        Classification,       // Conflicting or misplaced role markers
        InvalidParent,        // `parent` is not a path or names nothing
        MissingParent,        // Non top-level control with no parent (strict mode)
        ParentCycle,          // Parent chain does not terminate
        LayoutParent,         // Layout parent cannot be derived
        UnmatchedLayoutItem,  // Placement never bound to a layout
        UnsupportedLayout,    // Placement targets an unknown layout type
        InvalidPlacement,     // Placement values are not what the layout expects
        UnknownPartial,       // Partial type has no registered declaration
    };

    Kind kind;
    std::string message;
    std::string field;

    [[nodiscard]] static DeriveError parse(const std::string& field, const std::string& reason) {
        return DeriveError{Kind::Parse, "Failed to parse attribute of '" + field + "': " + reason, field};
    }

    [[nodiscard]] static DeriveError unknown_type(const std::string& field) {
        return DeriveError{Kind::UnknownType, "Cannot resolve a type name for '" + field + "'", field};
    }

    [[nodiscard]] static DeriveError classification(const std::string& field, const std::string& reason) {
        return DeriveError{Kind::Classification, "Field '" + field + "': " + reason, field};
    }

    [[nodiscard]] static DeriveError invalid_parent(const std::string& field, const std::string& reason) {
        return DeriveError{Kind::InvalidParent, "Invalid parent for '" + field + "': " + reason, field};
    }

    [[nodiscard]] static DeriveError missing_parent(const std::string& field, const std::string& type) {
        return DeriveError{Kind::MissingParent,
            "Control '" + field + "' of type " + type + " has no parent and is not a top level type", field};
    }

    [[nodiscard]] static DeriveError parent_cycle(const std::string& field) {
        return DeriveError{Kind::ParentCycle, "Parent chain of '" + field + "' does not terminate", field};
    }

    [[nodiscard]] static DeriveError layout_parent(const std::string& field) {
        return DeriveError{Kind::LayoutParent,
            "Layout '" + field + "': auto-detection of layout parent outside of partial is not yet implemented",
            field};
    }

    [[nodiscard]] static DeriveError unmatched_layout_item(const std::string& field) {
        return DeriveError{Kind::UnmatchedLayoutItem,
            "Unmatched layout item \"" + field + "\". Did you forget the `layout` parameter?", field};
    }

    [[nodiscard]] static DeriveError unsupported_layout(const std::string& field, const std::string& type) {
        return DeriveError{Kind::UnsupportedLayout,
            "Layout item '" + field + "' targets unsupported layout type " + type, field};
    }

    [[nodiscard]] static DeriveError invalid_placement(const std::string& field, const std::string& reason) {
        return DeriveError{Kind::InvalidPlacement, "Layout item '" + field + "': " + reason, field};
    }

    [[nodiscard]] static DeriveError unknown_partial(const std::string& field, const std::string& type) {
        return DeriveError{Kind::UnknownPartial,
            "Partial '" + field + "' references unknown declaration " + type, field};
    }
};

/// Layout engine errors
struct LayoutError {
    enum class Kind : std::uint8_t {
        MissingParent,   // Builder has no parent handle
        ChildNotFound,   // Child handle not managed by the layout
        InvalidCell,     // Cell outside the configured grid
        InvalidStyle,    // Style value rejected by the solver
        BackendFailure,  // Windowing collaborator failed
    };

    Kind kind;
    std::string message;
    std::string layout;

    [[nodiscard]] static LayoutError missing_parent(const std::string& layout) {
        return LayoutError{Kind::MissingParent, layout + " does not have a parent", layout};
    }

    [[nodiscard]] static LayoutError child_not_found(const std::string& layout, const std::string& child) {
        return LayoutError{Kind::ChildNotFound, layout + " does not manage control " + child, layout};
    }

    [[nodiscard]] static LayoutError invalid_cell(const std::string& layout, const std::string& reason) {
        return LayoutError{Kind::InvalidCell, layout + ": " + reason, layout};
    }

    [[nodiscard]] static LayoutError invalid_style(const std::string& layout, const std::string& reason) {
        return LayoutError{Kind::InvalidStyle, layout + ": " + reason, layout};
    }

    [[nodiscard]] static LayoutError backend_failure(const std::string& layout, const std::string& reason) {
        return LayoutError{Kind::BackendFailure, layout + ": " + reason, layout};
    }
};

/// Configuration loading errors
struct ConfigError {
    enum class Kind : std::uint8_t {
        ParseFailed,   // Syntax error in the configuration source
        InvalidValue,  // Key present with an unusable value
        IOFailed,      // File could not be read
    };

    Kind kind;
    std::string message;
    std::string path;

    [[nodiscard]] static ConfigError parse_failed(const std::string& path, const std::string& reason) {
        return ConfigError{Kind::ParseFailed, "Failed to parse " + path + ": " + reason, path};
    }

    [[nodiscard]] static ConfigError invalid_value(const std::string& key, const std::string& reason) {
        return ConfigError{Kind::InvalidValue, "Invalid value for '" + key + "': " + reason, {}};
    }

    [[nodiscard]] static ConfigError io_failed(const std::string& path) {
        return ConfigError{Kind::IOFailed, "Cannot read " + path, path};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        DeriveError,
        LayoutError,
        ConfigError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(DeriveError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(LayoutError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
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
    static ErrorCode to_error_code(DeriveError::Kind kind) {
        switch (kind) {
            case DeriveError::Kind::Parse: return ErrorCode::ParseError;
            case DeriveError::Kind::UnknownType: return ErrorCode::NotFound;
            case DeriveError::Kind::Classification: return ErrorCode::ValidationError;
            case DeriveError::Kind::InvalidParent: return ErrorCode::InvalidArgument;
            case DeriveError::Kind::MissingParent: return ErrorCode::ValidationError;
            case DeriveError::Kind::ParentCycle: return ErrorCode::InvalidState;
            case DeriveError::Kind::LayoutParent: return ErrorCode::NotSupported;
            case DeriveError::Kind::UnmatchedLayoutItem: return ErrorCode::ValidationError;
            case DeriveError::Kind::UnsupportedLayout: return ErrorCode::NotSupported;
            case DeriveError::Kind::InvalidPlacement: return ErrorCode::InvalidArgument;
            case DeriveError::Kind::UnknownPartial: return ErrorCode::NotFound;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(LayoutError::Kind kind) {
        switch (kind) {
            case LayoutError::Kind::MissingParent: return ErrorCode::InvalidState;
            case LayoutError::Kind::ChildNotFound: return ErrorCode::NotFound;
            case LayoutError::Kind::InvalidCell: return ErrorCode::InvalidArgument;
            case LayoutError::Kind::InvalidStyle: return ErrorCode::InvalidArgument;
            case LayoutError::Kind::BackendFailure: return ErrorCode::IOError;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ConfigError::Kind kind) {
        switch (kind) {
            case ConfigError::Kind::ParseFailed: return ErrorCode::ParseError;
            case ConfigError::Kind::InvalidValue: return ErrorCode::InvalidArgument;
            case ConfigError::Kind::IOFailed: return ErrorCode::IOError;
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

/// Reset error statistics
void reset_error_stats();

/// Get error statistics as formatted string
std::string error_stats_summary();

} // namespace debug

} // namespace loom_core

/// Propagate the error of a Result-returning expression to the caller.
/// Used by generated construction code.
#define LOOM_TRY(expr)                          \
    do {                                        \
        auto loom_try_result_ = (expr);         \
        if (!loom_try_result_) {                \
            return loom_try_result_.error();    \
        }                                       \
    } while (false)
