/// @file controller_registry.hpp
/// @brief Kind -> controller mapping with lazily resolved entrypoints
///
/// Every controller belongs to a ResourceDefinition keyed by its fully-qualified
/// kind. A controller arrives either explicitly (`register_controller`) or on
/// first `resolve`, from the definition's declared entrypoints. A kind that
/// extends another may share its parent's controller through `alias`.

#pragma once

#include "controller.hpp"
#include "entrypoint.hpp"

#include <manifold/core/error.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

namespace manifold_kernel {

class ControllerRegistry {
public:
    /// Starts with a static and a native entrypoint resolver
    ControllerRegistry();

    ControllerRegistry(const ControllerRegistry&) = delete;
    ControllerRegistry& operator=(const ControllerRegistry&) = delete;

    // =========================================================================
    // Definitions
    // =========================================================================

    /// Add or replace the definition of `definition.kind`
    void register_definition(ResourceDefinition definition);

    [[nodiscard]] const ResourceDefinition* definition(const std::string& kind) const;
    [[nodiscard]] bool has_definition(const std::string& kind) const;

    /// Every defined kind, sorted
    [[nodiscard]] std::vector<std::string> kinds() const;

    // =========================================================================
    // Controllers
    // =========================================================================

    /// Bind `controller` to `kind`
    ///
    /// The controller inherits the definition's schema when it declares none.
    ///
    /// @return ERR_CONTROLLER_INVALID without a definition, for an unusable controller,
    ///         or when another controller already claims the kind
    [[nodiscard]] manifold_core::Result<ControllerPtr> register_controller(const std::string& kind,
                                                                          Controller controller);

    /// Convenience: define `kind` with `schema` and bind `controller`
    [[nodiscard]] manifold_core::Result<ControllerPtr> register_builtin(const std::string& kind,
                                                                      nlohmann::json schema,
                                                                      Controller controller);

    /// Share the controller of `parent_kind` with `kind`
    ///
    /// @return ERR_CONTROLLER_NOT_FOUND if the parent has none
    [[nodiscard]] manifold_core::Result<ControllerPtr> alias(const std::string& kind,
                                                            const std::string& parent_kind);

    /// Registered controller, null if none is loaded yet
    [[nodiscard]] ControllerPtr get(const std::string& kind) const;

    /// Registered controller, or one loaded now from the definition's entrypoints
    ///
    /// @return ERR_CONTROLLER_NOT_FOUND when there is nothing to load, a LoadFailed
    ///         error when every entrypoint failed
    [[nodiscard]] manifold_core::Result<ControllerPtr> resolve(const std::string& kind);

    [[nodiscard]] bool has_controller(const std::string& kind) const;

    /// Kinds with a loaded controller, sorted
    [[nodiscard]] std::vector<std::string> controller_kinds() const;

    [[nodiscard]] std::size_t controller_count() const noexcept { return m_controllers.size(); }
    [[nodiscard]] std::size_t definition_count() const noexcept { return m_definitions.size(); }

    // =========================================================================
    // Entrypoints
    // =========================================================================

    /// Resolvers are tried in the order they were added
    void add_resolver(std::unique_ptr<EntrypointResolver> resolver);

    /// Factory table for `static:<name>` entrypoints
    [[nodiscard]] StaticEntrypointResolver& static_entrypoints() noexcept { return *m_static; }

    /// Drop every definition and controller (resolvers are kept)
    void clear();

private:
    manifold_core::Result<ControllerPtr> store(const std::string& kind, Controller controller);
    manifold_core::Result<Controller> load(const ResourceDefinition& definition);

    std::map<std::string, ResourceDefinition> m_definitions;
    std::map<std::string, ControllerPtr> m_controllers;
    std::vector<std::unique_ptr<EntrypointResolver>> m_resolvers;
    StaticEntrypointResolver* m_static = nullptr;
};

} // namespace manifold_kernel
