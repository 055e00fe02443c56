/// @file context.hpp
/// @brief Capability surfaces handed to controller code
///
/// - ControllerContext: given to `Controller::on_register`; events, holds, expressions
/// - ResourceContext: given to `compile`, `create` and `execute`; adds registry access,
///   dispatch and dynamic manifest registration on behalf of one resource
///
/// Both are cheap handles onto a Kernel and must not outlive it.

#pragma once

#include "fwd.hpp"
#include "controller.hpp"

#include <manifold/core/error.hpp>
#include <manifold/core/resource.hpp>
#include <manifold/event/event_bus.hpp>
#include <manifold/event/hold_counter.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace manifold_kernel {

// =============================================================================
// ControllerContext
// =============================================================================

class ControllerContext {
public:
    ControllerContext(Kernel& kernel, std::string kind);
    virtual ~ControllerContext() = default;

    ControllerContext(const ControllerContext&) = default;
    ControllerContext& operator=(const ControllerContext&) = delete;

    /// Kind the context acts for
    [[nodiscard]] const std::string& kind() const noexcept { return m_kind; }

    // =========================================================================
    // Events
    // =========================================================================

    [[nodiscard]] manifold_core::Result<manifold_event::SubscriberId> on(const std::string& pattern,
                                                                       manifold_event::EventHandler handler);
    [[nodiscard]] manifold_core::Result<manifold_event::SubscriberId> once(const std::string& pattern,
                                                                         manifold_event::EventHandler handler);
    bool off(manifold_event::SubscriberId id);

    /// Emit `event`; a name without a '.' is prefixed with the kind
    [[nodiscard]] manifold_core::Result<void> emit(const std::string& event, nlohmann::json payload = nullptr);

    // =========================================================================
    // Process
    // =========================================================================

    /// Keep the process alive until the returned release is called
    [[nodiscard]] manifold_event::HoldRelease acquire_hold(const std::string& reason = {});

    /// Raise the process exit code (the highest request wins)
    void request_exit(int code);

    // =========================================================================
    // Expressions
    // =========================================================================

    /// Evaluate a bare expression
    [[nodiscard]] manifold_core::Result<nlohmann::json> evaluate(const std::string& expression,
                                                               const nlohmann::json& context) const;

    /// Expand every `${{ }}` inside `value`
    [[nodiscard]] manifold_core::Result<nlohmann::json> expand(const nlohmann::json& value,
                                                             const nlohmann::json& context) const;

protected:
    Kernel& m_kernel;
    std::string m_kind;
};

// =============================================================================
// ResourceContext
// =============================================================================

class ResourceContext : public ControllerContext {
public:
    ResourceContext(Kernel& kernel, manifold_core::Resource resource);

    /// Document the context was created for
    [[nodiscard]] const manifold_core::Resource& resource() const noexcept { return m_resource; }
    [[nodiscard]] manifold_core::ResourceId id() const { return manifold_core::resource_id(m_resource); }

    // =========================================================================
    // Validation
    // =========================================================================

    /// Validate `value` against a schema
    ///
    /// A schema without a string `type` is read as a map of required properties
    /// with no others allowed.
    [[nodiscard]] manifold_core::Result<void> validate(const nlohmann::json& value,
                                                      const nlohmann::json& schema) const;

    // =========================================================================
    // Registry
    // =========================================================================

    [[nodiscard]] std::vector<const manifold_core::Resource*> get_resources(const std::string& kind) const;
    [[nodiscard]] const manifold_core::Resource* get_resource(const std::string& kind,
                                                              const std::string& name) const;

    /// Live instance of another resource, null if none
    [[nodiscard]] InstancePtr get_instance(const std::string& kind, const std::string& name) const;

    /// Register a new resource as a child of this one
    ///
    /// Children are torn down before their parent.
    [[nodiscard]] manifold_core::Result<void> register_manifest(manifold_core::Resource resource);

    [[nodiscard]] manifold_core::Result<void> register_definition(ResourceDefinition definition);
    [[nodiscard]] manifold_core::Result<void> register_controller(const std::string& kind, Controller controller);

    // =========================================================================
    // Dispatch
    // =========================================================================

    [[nodiscard]] manifold_core::Result<nlohmann::json> execute(const std::string& urn,
                                                              const nlohmann::json& input = nullptr);
    [[nodiscard]] manifold_core::Result<nlohmann::json> invoke(const std::string& kind, const std::string& name,
                                                             const nlohmann::json& input = nullptr);

    /// Emit `<Kind>.<Name>.<event>` for this resource
    [[nodiscard]] manifold_core::Result<void> emit_resource_event(const std::string& event,
                                                                 nlohmann::json payload = nullptr);

private:
    manifold_core::Resource m_resource;
};

} // namespace manifold_kernel
