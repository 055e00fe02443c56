#pragma once

/// @file error.hpp
/// @brief Error handling types for manifold_core

#include "fwd.hpp"
#include <cstdint>
#include <string>
#include <variant>
#include <optional>
#include <utility>
#include <map>
#include <stdexcept>

namespace manifold_core {

// =============================================================================
// ErrorCode
// =============================================================================

/// Runtime error code. Rendered with its wire name by error_code_name().
enum class ErrorCode : std::uint8_t {
    Unknown = 0,
    ResourceNotFound,
    ModuleMissing,
    ControllerNotFound,
    DuplicateResource,
    ExecutionFailed,
    ControllerInvalid,
    ResourceNotInvokable,
    DependencyCycle,
    Template,
    Expression,
    SchemaValidation,
    ReservedEvent,
    InvalidEvent,
    InvalidManifest,
    IOError,
    InvalidState,
    InvalidArgument,
};

/// Get error code name
[[nodiscard]] inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Unknown: return "ERR_UNKNOWN";
        case ErrorCode::ResourceNotFound: return "ERR_RESOURCE_NOT_FOUND";
        case ErrorCode::ModuleMissing: return "ERR_MODULE_MISSING";
        case ErrorCode::ControllerNotFound: return "ERR_CONTROLLER_NOT_FOUND";
        case ErrorCode::DuplicateResource: return "ERR_DUPLICATE_RESOURCE";
        case ErrorCode::ExecutionFailed: return "ERR_EXECUTION_FAILED";
        case ErrorCode::ControllerInvalid: return "ERR_CONTROLLER_INVALID";
        case ErrorCode::ResourceNotInvokable: return "ERR_RESOURCE_NOT_INVOKABLE";
        case ErrorCode::DependencyCycle: return "ERR_DEPENDENCY_CYCLE";
        case ErrorCode::Template: return "ERR_TEMPLATE";
        case ErrorCode::Expression: return "ERR_EXPRESSION";
        case ErrorCode::SchemaValidation: return "ERR_SCHEMA_VALIDATION";
        case ErrorCode::ReservedEvent: return "ERR_RESERVED_EVENT";
        case ErrorCode::InvalidEvent: return "ERR_INVALID_EVENT";
        case ErrorCode::InvalidManifest: return "ERR_INVALID_MANIFEST";
        case ErrorCode::IOError: return "ERR_IO";
        case ErrorCode::InvalidState: return "ERR_INVALID_STATE";
        case ErrorCode::InvalidArgument: return "ERR_INVALID_ARGUMENT";
        default: return "ERR_UNKNOWN";
    }
}

// =============================================================================
// Error Kinds
// =============================================================================

/// Registry and dispatch errors about a single (Kind, Name) resource
struct ResourceError {
    enum class Kind : std::uint8_t {
        NotFound,       // No resource or instance with this identity
        Duplicate,      // (kind, name) registered twice
        NotInvokable,   // Instance has no invoke()
    };

    Kind kind;
    std::string message;
    std::string resource_kind;
    std::string resource_name;

    [[nodiscard]] static ResourceError not_found(const std::string& kind, const std::string& name) {
        return ResourceError{Kind::NotFound, "Resource not found: " + kind + "." + name, kind, name};
    }

    [[nodiscard]] static ResourceError duplicate(const std::string& kind, const std::string& name) {
        return ResourceError{Kind::Duplicate, "Duplicate resource: " + kind + "." + name, kind, name};
    }

    [[nodiscard]] static ResourceError not_invokable(const std::string& kind, const std::string& name) {
        return ResourceError{Kind::NotInvokable,
            "Resource " + kind + "." + name + " does not have an invoke method", kind, name};
    }
};

/// Template expansion errors. Always name the template and the depth.
struct TemplateError {
    enum class Kind : std::uint8_t {
        MaxExpansionDepthExceeded,
        InvalidForExpression,
        InvalidForTarget,
        InvalidBlueprint,
        TemplateNotFound,
        ExpansionIncomplete,
    };

    Kind kind;
    std::string message;
    std::string template_name;
    int depth = 0;

    [[nodiscard]] static TemplateError max_depth(const std::string& tmpl, int depth, int limit) {
        return TemplateError{Kind::MaxExpansionDepthExceeded,
            "Template expansion exceeded maximum depth of " + std::to_string(limit) +
            ". Possible infinite recursion in template \"" + tmpl + "\"", tmpl, depth};
    }

    [[nodiscard]] static TemplateError invalid_for(const std::string& tmpl, int depth, const std::string& expr) {
        return TemplateError{Kind::InvalidForExpression,
            "Invalid 'for' expression: \"" + expr +
            "\". Expected \"item in collection\" or \"key, value in collection\"", tmpl, depth};
    }

    [[nodiscard]] static TemplateError invalid_target(const std::string& tmpl, int depth,
                                                      const std::string& expr, const std::string& type) {
        return TemplateError{Kind::InvalidForTarget,
            "'for' expression \"" + expr + "\" did not evaluate to an iterable (got " + type + ")",
            tmpl, depth};
    }

    [[nodiscard]] static TemplateError invalid_blueprint(const std::string& tmpl, int depth, const std::string& reason) {
        return TemplateError{Kind::InvalidBlueprint, "Invalid blueprint: " + reason, tmpl, depth};
    }

    [[nodiscard]] static TemplateError not_found(const std::string& tmpl, const std::string& instance) {
        return TemplateError{Kind::TemplateNotFound,
            "Template \"" + tmpl + "\" not found for instance \"" + instance + "\"", tmpl, 0};
    }

    [[nodiscard]] static TemplateError incomplete(const std::string& tmpl, int passes) {
        return TemplateError{Kind::ExpansionIncomplete,
            "Template expansion did not complete after " + std::to_string(passes) +
            " passes; unresolved instance of \"" + tmpl + "\"", tmpl, passes};
    }
};

/// Controller registry errors
struct ControllerError {
    enum class Kind : std::uint8_t {
        NotFound,           // No controller for a kind
        MissingDefinition,  // Controller registered without a definition
        AlreadyRegistered,  // Second controller claiming the same kind
        Invalid,            // Controller lacks a required capability
        LoadFailed,         // Entrypoint could not be resolved
    };

    Kind kind;
    std::string message;
    std::string resource_kind;

    [[nodiscard]] static ControllerError not_found(const std::string& kind) {
        return ControllerError{Kind::NotFound, "No controller registered for kind: " + kind, kind};
    }

    [[nodiscard]] static ControllerError missing_definition(const std::string& kind) {
        return ControllerError{Kind::MissingDefinition,
            "Cannot register controller for kind " + kind + " without definition", kind};
    }

    [[nodiscard]] static ControllerError already_registered(const std::string& kind) {
        return ControllerError{Kind::AlreadyRegistered, "Controller already registered for kind: " + kind, kind};
    }

    [[nodiscard]] static ControllerError invalid(const std::string& kind, const std::string& reason) {
        return ControllerError{Kind::Invalid, "Controller for " + kind + " " + reason, kind};
    }

    [[nodiscard]] static ControllerError load_failed(const std::string& kind, const std::string& reason) {
        return ControllerError{Kind::LoadFailed, "Controller for \"" + kind + "\" failed to load: " + reason, kind};
    }
};

/// Expression evaluation errors
struct ExpressionError {
    std::string message;
    std::string expression;
    std::string resource;  // "Kind.Name" when known

    [[nodiscard]] static ExpressionError failed(const std::string& expr, const std::string& reason,
                                                const std::string& resource = {}) {
        std::string msg = "Expression evaluation failed";
        if (!resource.empty()) {
            msg += " for " + resource;
        }
        msg += ": \"" + expr + "\": " + reason;
        return ExpressionError{std::move(msg), expr, resource};
    }
};

// =============================================================================
// Error
// =============================================================================

/// Main error type (variant of all error kinds)
class Error {
public:
    using Variant = std::variant<
        ResourceError,
        TemplateError,
        ControllerError,
        ExpressionError,
        std::string  // Generic message
    >;

    /// Constructors
    Error() : m_code(ErrorCode::Unknown), m_error("Unknown error") {}
    Error(ResourceError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(TemplateError err) : m_code(ErrorCode::Template), m_error(std::move(err)) {}
    Error(ControllerError err) : m_code(to_error_code(err.kind)), m_error(std::move(err)) {}
    Error(ExpressionError err) : m_code(ErrorCode::Expression), m_error(std::move(err)) {}
    Error(const std::string& msg) : m_code(ErrorCode::Unknown), m_error(msg) {}
    Error(const char* msg) : m_code(ErrorCode::Unknown), m_error(std::string(msg)) {}

    /// Construct with error code and message
    Error(ErrorCode code, const std::string& msg) : m_code(code), m_error(msg) {}
    Error(ErrorCode code, const char* msg) : m_code(code), m_error(std::string(msg)) {}

    /// Re-code a typed error (e.g. a controller NotFound surfaced as ERR_MODULE_MISSING)
    Error(ErrorCode code, ResourceError err) : m_code(code), m_error(std::move(err)) {}
    Error(ErrorCode code, ControllerError err) : m_code(code), m_error(std::move(err)) {}

    /// Get error code
    [[nodiscard]] ErrorCode code() const noexcept { return m_code; }

    /// Get error code wire name
    [[nodiscard]] const char* code_name() const noexcept { return error_code_name(m_code); }

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
    static ErrorCode to_error_code(ResourceError::Kind kind) {
        switch (kind) {
            case ResourceError::Kind::NotFound: return ErrorCode::ResourceNotFound;
            case ResourceError::Kind::Duplicate: return ErrorCode::DuplicateResource;
            case ResourceError::Kind::NotInvokable: return ErrorCode::ResourceNotInvokable;
            default: return ErrorCode::Unknown;
        }
    }

    static ErrorCode to_error_code(ControllerError::Kind kind) {
        switch (kind) {
            case ControllerError::Kind::NotFound: return ErrorCode::ControllerNotFound;
            case ControllerError::Kind::MissingDefinition: return ErrorCode::ControllerInvalid;
            case ControllerError::Kind::AlreadyRegistered: return ErrorCode::ControllerInvalid;
            case ControllerError::Kind::Invalid: return ErrorCode::ControllerInvalid;
            case ControllerError::Kind::LoadFailed: return ErrorCode::ControllerNotFound;
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
Result<T> Err(ErrorCode code, const std::string& message) {
    return Result<T>(Error(code, message));
}

// =============================================================================
// Error Utilities (Implemented in error.cpp)
// =============================================================================

/// Build a full error message with code, detail and context chain
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

} // namespace manifold_core
