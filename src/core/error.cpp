/// @file error.cpp
/// @brief Error handling implementation for manifold_core
///
/// The error system is primarily template-based and header-only.
/// This file provides:
/// - Explicit template instantiations for common Result types
/// - Error formatting utilities
/// - Error statistics for diagnostics

#include <manifold/core/error.hpp>
#include <atomic>
#include <sstream>
#include <vector>

namespace manifold_core {

// =============================================================================
// Error Message Formatting
// =============================================================================

namespace detail {

std::string format_resource_error(const ResourceError& err) {
    std::ostringstream oss;
    oss << "[ResourceError] " << err.message;
    return oss.str();
}

std::string format_template_error(const TemplateError& err) {
    std::ostringstream oss;
    oss << "[TemplateError] " << err.message;

    if (!err.template_name.empty()) {
        oss << " (template: " << err.template_name << ", depth: " << err.depth << ")";
    }

    return oss.str();
}

std::string format_controller_error(const ControllerError& err) {
    std::ostringstream oss;
    oss << "[ControllerError] " << err.message;
    return oss.str();
}

std::string format_expression_error(const ExpressionError& err) {
    std::ostringstream oss;
    oss << "[ExpressionError] " << err.message;
    return oss.str();
}

} // namespace detail

// =============================================================================
// Error Chain Support
// =============================================================================

std::string build_error_chain(const Error& error) {
    std::ostringstream oss;

    oss << "[" << error_code_name(error.code()) << "] ";

    std::visit([&oss](const auto& err) {
        using T = std::decay_t<decltype(err)>;
        if constexpr (std::is_same_v<T, std::string>) {
            oss << err;
        } else if constexpr (std::is_same_v<T, ResourceError>) {
            oss << detail::format_resource_error(err);
        } else if constexpr (std::is_same_v<T, TemplateError>) {
            oss << detail::format_template_error(err);
        } else if constexpr (std::is_same_v<T, ControllerError>) {
            oss << detail::format_controller_error(err);
        } else if constexpr (std::is_same_v<T, ExpressionError>) {
            oss << detail::format_expression_error(err);
        }
    }, error.variant());

    for (const auto& [key, value] : error.context()) {
        oss << "\n  " << key << ": " << value;
    }

    return oss.str();
}

// =============================================================================
// Explicit Template Instantiations
// =============================================================================

template class Result<void, Error>;
template class Result<bool, Error>;
template class Result<int, Error>;
template class Result<std::string, Error>;
template class Result<std::vector<std::string>, Error>;

// =============================================================================
// Error Statistics
// =============================================================================

namespace debug {

struct ErrorStats {
    std::atomic<std::uint64_t> total_errors{0};
    std::atomic<std::uint64_t> resource_errors{0};
    std::atomic<std::uint64_t> template_errors{0};
    std::atomic<std::uint64_t> controller_errors{0};
    std::atomic<std::uint64_t> expression_errors{0};
    std::atomic<std::uint64_t> generic_errors{0};
};

static ErrorStats s_error_stats;

void record_error(const Error& error) {
    s_error_stats.total_errors.fetch_add(1, std::memory_order_relaxed);

    if (error.is<ResourceError>()) {
        s_error_stats.resource_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<TemplateError>()) {
        s_error_stats.template_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ControllerError>()) {
        s_error_stats.controller_errors.fetch_add(1, std::memory_order_relaxed);
    } else if (error.is<ExpressionError>()) {
        s_error_stats.expression_errors.fetch_add(1, std::memory_order_relaxed);
    } else {
        s_error_stats.generic_errors.fetch_add(1, std::memory_order_relaxed);
    }
}

std::uint64_t total_error_count() {
    return s_error_stats.total_errors.load(std::memory_order_relaxed);
}

void reset_error_stats() {
    s_error_stats.total_errors.store(0, std::memory_order_relaxed);
    s_error_stats.resource_errors.store(0, std::memory_order_relaxed);
    s_error_stats.template_errors.store(0, std::memory_order_relaxed);
    s_error_stats.controller_errors.store(0, std::memory_order_relaxed);
    s_error_stats.expression_errors.store(0, std::memory_order_relaxed);
    s_error_stats.generic_errors.store(0, std::memory_order_relaxed);
}

std::string error_stats_summary() {
    std::ostringstream oss;
    oss << "Error Statistics:\n"
        << "  Total: " << s_error_stats.total_errors.load() << "\n"
        << "  Resource: " << s_error_stats.resource_errors.load() << "\n"
        << "  Template: " << s_error_stats.template_errors.load() << "\n"
        << "  Controller: " << s_error_stats.controller_errors.load() << "\n"
        << "  Expression: " << s_error_stats.expression_errors.load() << "\n"
        << "  Generic: " << s_error_stats.generic_errors.load() << "\n";
    return oss.str();
}

} // namespace debug

} // namespace manifold_core
