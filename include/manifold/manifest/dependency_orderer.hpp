#pragma once

/// @file dependency_orderer.hpp
/// @brief Topological ordering of resources by name-defines-kind edges
///
/// A resource D precedes every resource R whose `kind` equals D's `metadata.name`.
/// Among ready resources the lowest original index is always taken next, so the
/// output is stable with respect to input order.

#include <manifold/core/error.hpp>
#include <manifold/core/resource.hpp>

#include <string>
#include <vector>

namespace manifold_manifest {

// =============================================================================
// Dependency Resolution Errors
// =============================================================================

/// Resources left over once no node is ready
struct DependencyCycle {
    std::vector<std::string> members;  ///< "Kind.Name" of every unordered resource

    [[nodiscard]] std::string format() const;
};

// =============================================================================
// DependencyOrderer
// =============================================================================

class DependencyOrderer {
public:
    /// Order `resources`; a cycle is an ERR_DEPENDENCY_CYCLE error, never broken
    [[nodiscard]] static manifold_core::Result<std::vector<manifold_core::Resource>> order(
        std::vector<manifold_core::Resource> resources);

    /// Same ordering, as indices into `resources`
    [[nodiscard]] static manifold_core::Result<std::vector<std::size_t>> order_indices(
        const std::vector<manifold_core::Resource>& resources);
};

} // namespace manifold_manifest
