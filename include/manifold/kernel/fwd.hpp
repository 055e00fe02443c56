/// @file fwd.hpp
/// @brief Forward declarations for manifold_kernel

#pragma once

#include <cstdint>

namespace manifold_kernel {

// =============================================================================
// Kernel Types
// =============================================================================

enum class KernelPhase : std::uint8_t;
struct KernelConfig;
struct KernelStats;
struct KernelPhaseEvent;

// =============================================================================
// Controllers
// =============================================================================

/// Capability set bound to one Kind
struct Controller;

/// Live object created by a controller
class ResourceInstance;

/// Kind declaration carrying schema and entrypoints
struct ResourceDefinition;

class ControllerRegistry;

// =============================================================================
// Entrypoints
// =============================================================================

class EntrypointResolver;
class StaticEntrypointResolver;
class NativeEntrypointResolver;
class DynamicLibrary;
class DynamicLibraryCache;

// =============================================================================
// Contexts
// =============================================================================

class ControllerContext;
class ResourceContext;

// =============================================================================
// Kernel
// =============================================================================

class Kernel;
class KernelBuilder;

} // namespace manifold_kernel
