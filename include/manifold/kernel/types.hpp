/// @file types.hpp
/// @brief Core types for manifold_kernel
///
/// - Kernel phases and phase change events
/// - Kernel configuration (every tunable of a boot)
/// - Kernel statistics

#pragma once

#include "fwd.hpp"

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace manifold_kernel {

// =============================================================================
// Kernel Phase
// =============================================================================

/// Boot state machine; phases only move forward
enum class KernelPhase : std::uint8_t {
    Created,        ///< Nothing loaded
    Loading,        ///< Reading manifests
    Resolving,      ///< Dependency ordering, template expansion, expression resolution
    Registering,    ///< Inserting into the registry
    Discovering,    ///< Multi-pass controller discovery
    Ready,          ///< Every resource created and initialized
    Running,        ///< `run` of every instance
    Idle,           ///< Waiting for holds to drain
    Stopping,       ///< Tearing down
    Stopped,        ///< Fully torn down
    Failed,         ///< Boot aborted
};

/// Convert kernel phase to string
[[nodiscard]] const char* to_string(KernelPhase phase);

/// Kernel phase change event
struct KernelPhaseEvent {
    KernelPhase old_phase;
    KernelPhase new_phase;
    std::chrono::system_clock::time_point timestamp;
};

// =============================================================================
// Kernel Configuration
// =============================================================================

/// Kernel configuration
struct KernelConfig {
    std::string name = "manifold";

    /// Module used for `Self.` kinds, template namespacing and default `metadata.module`
    std::string module_name;

    std::uint32_t max_discovery_passes = 10;
    std::uint32_t max_resolution_passes = 5;
    std::uint32_t max_expansion_depth = 10;
    std::uint32_t max_expansion_passes = 10;

    /// Environment variables visible to expressions under `env`
    std::vector<std::string> env_allowlist{"NODE_ENV", "PORT", "HOST", "PATH", "HOME", "USER", "LANG"};

    /// Roots whose absence is "not yet available" rather than an error
    std::vector<std::string> deferred_roots{"request", "result"};

    /// JSON-lines event log, empty to disable
    std::string event_stream_path;

    /// Builder pattern
    KernelConfig& with_name(const std::string& n) { name = n; return *this; }
    KernelConfig& with_module(const std::string& m) { module_name = m; return *this; }
    KernelConfig& with_discovery_passes(std::uint32_t n) { max_discovery_passes = n; return *this; }
    KernelConfig& with_resolution_passes(std::uint32_t n) { max_resolution_passes = n; return *this; }
    KernelConfig& with_event_stream(const std::string& path) { event_stream_path = path; return *this; }
};

// =============================================================================
// Kernel Statistics
// =============================================================================

/// Kernel statistics
struct KernelStats {
    std::uint64_t total_resources = 0;
    std::uint64_t template_generated = 0;
    std::uint64_t live_instances = 0;
    std::uint64_t controllers = 0;
    std::uint64_t definitions = 0;
    std::uint64_t discovery_passes = 0;
    std::uint64_t events_emitted = 0;
    std::uint64_t executions = 0;
    std::uint64_t execution_failures = 0;
    std::uint64_t reloads = 0;
    std::size_t holds = 0;
    std::chrono::nanoseconds boot_time{0};
};

} // namespace manifold_kernel
