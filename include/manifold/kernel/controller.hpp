/// @file controller.hpp
/// @brief Controller capability set, resource instances and kind definitions
///
/// A controller is bound to one fully-qualified Kind. Every capability is
/// optional and is checked once, when the controller is registered:
///
/// - `on_register(ctx)` - once before discovery
/// - `compile(resource, ctx)` - may replace the resource before creation
/// - `create(resource, ctx)` - returns a live instance, or null for passive kinds
/// - `execute(name, input, ctx)` - dispatch entry for `Kind.Name` URNs
///
/// Controller code may return an error Result or throw; the kernel converts both.

#pragma once

#include "fwd.hpp"

#include <manifold/core/error.hpp>
#include <manifold/core/resource.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace manifold_kernel {

// =============================================================================
// ResourceInstance
// =============================================================================

/// Live object returned by `Controller::create`
///
/// Every lifecycle hook defaults to a no-op.
class ResourceInstance {
public:
    virtual ~ResourceInstance() = default;

    /// Called right after creation, during discovery
    [[nodiscard]] virtual manifold_core::Result<void> init() { return manifold_core::Ok(); }

    /// Called once after discovery, in creation order
    [[nodiscard]] virtual manifold_core::Result<void> run() { return manifold_core::Ok(); }

    /// Called in reverse creation order
    [[nodiscard]] virtual manifold_core::Result<void> teardown() { return manifold_core::Ok(); }

    /// Whether `invoke` is implemented
    [[nodiscard]] virtual bool is_invokable() const { return false; }

    [[nodiscard]] virtual manifold_core::Result<nlohmann::json> invoke(const nlohmann::json& input);

    /// Custom state for snapshots
    [[nodiscard]] virtual std::optional<nlohmann::json> snapshot() const { return std::nullopt; }
};

using InstancePtr = std::shared_ptr<ResourceInstance>;

// =============================================================================
// Controller
// =============================================================================

struct Controller {
    using RegisterFn = std::function<manifold_core::Result<void>(ControllerContext&)>;
    using CreateFn = std::function<manifold_core::Result<InstancePtr>(const manifold_core::Resource&,
                                                                      ResourceContext&)>;
    using CompileFn = std::function<manifold_core::Result<std::optional<manifold_core::Resource>>(
        const manifold_core::Resource&, ResourceContext&)>;
    using ExecuteFn = std::function<manifold_core::Result<nlohmann::json>(
        const std::string& name, const nlohmann::json& input, ResourceContext&)>;

    RegisterFn on_register;
    CreateFn create;
    CompileFn compile;
    ExecuteFn execute;

    /// Resource schema; must declare `type` for the kind to be created
    nlohmann::json schema;

    [[nodiscard]] bool has_register() const noexcept { return static_cast<bool>(on_register); }
    [[nodiscard]] bool has_create() const noexcept { return static_cast<bool>(create); }
    [[nodiscard]] bool has_compile() const noexcept { return static_cast<bool>(compile); }
    [[nodiscard]] bool has_execute() const noexcept { return static_cast<bool>(execute); }

    /// At least one capability present
    [[nodiscard]] bool is_usable() const noexcept {
        return has_register() || has_create() || has_compile() || has_execute();
    }

    /// Builder pattern
    Controller& with_register(RegisterFn fn) { on_register = std::move(fn); return *this; }
    Controller& with_create(CreateFn fn) { create = std::move(fn); return *this; }
    Controller& with_compile(CompileFn fn) { compile = std::move(fn); return *this; }
    Controller& with_execute(ExecuteFn fn) { execute = std::move(fn); return *this; }
    Controller& with_schema(nlohmann::json s) { schema = std::move(s); return *this; }
};

using ControllerPtr = std::shared_ptr<const Controller>;

// =============================================================================
// ResourceDefinition
// =============================================================================

/// Declaration of a Kind: `{kind: Runtime.Definition, metadata: {name, resourceKind?,
/// module?}, schema, controllers?: [entrypoint...], extends?: ParentKind}`
struct ResourceDefinition {
    std::string kind;                       ///< Fully-qualified kind (`<module>.<resourceKind>`)
    std::string module;
    std::string resource_kind;
    nlohmann::json schema;
    std::vector<std::string> controllers;   ///< Entrypoints, first resolvable wins
    std::string extends;                    ///< Parent kind, empty for none
    std::string source;                     ///< Manifest path, for relative entrypoints

    /// Build from a `Runtime.Definition` resource
    [[nodiscard]] static manifold_core::Result<ResourceDefinition> from_resource(
        const manifold_core::Resource& resource);

    /// Definition for a kind registered in code
    [[nodiscard]] static ResourceDefinition for_kind(const std::string& kind, nlohmann::json schema);
};

} // namespace manifold_kernel
