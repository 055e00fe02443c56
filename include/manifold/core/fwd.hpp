#pragma once

/// @file fwd.hpp
/// @brief Forward declarations for manifold_core

#include <cstdint>

namespace manifold_core {

// =============================================================================
// Error Types
// =============================================================================

enum class ErrorCode : std::uint8_t;
class Error;

template<typename T, typename E = Error>
class Result;

struct ResourceError;
struct TemplateError;
struct ControllerError;
struct ExpressionError;

// =============================================================================
// Resource Types
// =============================================================================

struct ResourceId;

// =============================================================================
// Logging
// =============================================================================

struct LogConfig;
class LogScope;

} // namespace manifold_core
