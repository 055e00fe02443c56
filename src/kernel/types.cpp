/// @file types.cpp
/// @brief Core type implementations for manifold_kernel

#include <manifold/kernel/types.hpp>

namespace manifold_kernel {

// =============================================================================
// KernelPhase
// =============================================================================

const char* to_string(KernelPhase phase) {
    switch (phase) {
        case KernelPhase::Created: return "Created";
        case KernelPhase::Loading: return "Loading";
        case KernelPhase::Resolving: return "Resolving";
        case KernelPhase::Registering: return "Registering";
        case KernelPhase::Discovering: return "Discovering";
        case KernelPhase::Ready: return "Ready";
        case KernelPhase::Running: return "Running";
        case KernelPhase::Idle: return "Idle";
        case KernelPhase::Stopping: return "Stopping";
        case KernelPhase::Stopped: return "Stopped";
        case KernelPhase::Failed: return "Failed";
    }
    return "Unknown";
}

} // namespace manifold_kernel
