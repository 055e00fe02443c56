/// @file kernel.hpp
/// @brief Boot state machine, lifecycle and dispatch
///
/// The kernel is the central orchestrator that manages:
/// - Manifest loading, dependency ordering, template expansion and expression resolution
/// - The resource registry and the controller registry
/// - Multi-pass controller discovery
/// - Run, idle wait on holds, and reverse-order teardown
/// - Dispatch (`execute` / `invoke`) and resource events
/// - Hot reload of one manifest file and point-in-time snapshots

#pragma once

#include "fwd.hpp"
#include "types.hpp"
#include "controller.hpp"
#include "controller_registry.hpp"
#include "context.hpp"

#include <manifold/core/error.hpp>
#include <manifold/core/resource.hpp>
#include <manifold/event/event_bus.hpp>
#include <manifold/event/event_stream.hpp>
#include <manifold/event/hold_counter.hpp>
#include <manifold/expr/evaluator.hpp>
#include <manifold/manifest/loader.hpp>
#include <manifold/manifest/registry.hpp>
#include <manifold/manifest/resolution.hpp>
#include <manifold/manifest/template_engine.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <filesystem>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace manifold_kernel {

// =============================================================================
// Kernel
// =============================================================================

/// One runtime instance. Kernels share no state and may coexist in one process.
class Kernel {
public:
    /// Create kernel with configuration; built-in kinds are registered immediately
    explicit Kernel(KernelConfig config = {});
    ~Kernel();

    // Non-copyable
    Kernel(const Kernel&) = delete;
    Kernel& operator=(const Kernel&) = delete;

    // =========================================================================
    // Loading
    // =========================================================================

    /// Read a manifest file or directory into the boot set
    [[nodiscard]] manifold_core::Result<void> load(const std::filesystem::path& path);

    /// Add already-parsed documents to the boot set
    void load_resources(std::vector<manifold_core::Resource> resources);

    // =========================================================================
    // Lifecycle
    // =========================================================================

    /// Resolve, register and discover the boot set
    ///
    /// All-or-nothing: the first failure moves the kernel to Failed.
    [[nodiscard]] manifold_core::Result<void> boot();

    /// Emit Runtime.Starting, run every instance in creation order, emit Runtime.Started
    [[nodiscard]] manifold_core::Result<void> run();

    /// Resolves once no hold is outstanding, or on shutdown()
    [[nodiscard]] std::shared_future<void> wait_for_idle();

    /// Tear down every instance in reverse creation order
    ///
    /// Emits Runtime.Stopping and Runtime.Stopped `{exitCode}`. Teardown failures are
    /// logged and collected; every instance is still torn down.
    [[nodiscard]] manifold_core::Result<void> stop();

    /// boot, run, wait for idle, and always stop
    ///
    /// @return exit code requested through request_exit (0 by default)
    [[nodiscard]] manifold_core::Result<int> start();

    /// Release every idle waiter regardless of holds
    void shutdown();

    /// Keep the highest requested exit code
    void request_exit(int code);
    [[nodiscard]] int exit_code() const noexcept { return m_exit_code; }

    [[nodiscard]] KernelPhase phase() const noexcept { return m_phase; }

    /// Set callback for phase changes
    void set_on_phase_change(std::function<void(const KernelPhaseEvent&)> callback);

    // =========================================================================
    // Dispatch
    // =========================================================================

    /// Call the kind's `execute` for `Kind.Name`
    ///
    /// @return ERR_RESOURCE_NOT_FOUND, ERR_MODULE_MISSING, or ERR_EXECUTION_FAILED
    ///         carrying the original message
    [[nodiscard]] manifold_core::Result<nlohmann::json> execute(const std::string& urn,
                                                              const nlohmann::json& input = nullptr);

    /// Call `invoke` on a live instance
    [[nodiscard]] manifold_core::Result<nlohmann::json> invoke(const std::string& kind, const std::string& name,
                                                             const nlohmann::json& input = nullptr);

    /// Emit `<Kind>.<Name>.<event>`; Initialized and Teardown are reserved
    [[nodiscard]] manifold_core::Result<void> emit_resource_event(const std::string& kind, const std::string& name,
                                                                 const std::string& event,
                                                                 nlohmann::json payload = nullptr);

    // =========================================================================
    // Dynamic Registration
    // =========================================================================

    /// Expand, resolve and register one document, then queue it for discovery
    ///
    /// After boot the new resources are discovered and run immediately.
    ///
    /// @param parent owner torn down after the new resources, may be null
    [[nodiscard]] manifold_core::Result<void> register_manifest(manifold_core::Resource resource,
                                                               const manifold_core::ResourceId* parent = nullptr);

    /// Add a kind definition (and its `extends` relation)
    [[nodiscard]] manifold_core::Result<void> register_definition(ResourceDefinition definition);

    /// Bind a controller to a defined kind and run its register hook
    [[nodiscard]] manifold_core::Result<void> register_controller(const std::string& kind, Controller controller);

    /// Replace every resource loaded from `path` with the file's current content
    ///
    /// The file is parsed first; on a parse error nothing is torn down.
    [[nodiscard]] manifold_core::Result<void> reload_source(const std::filesystem::path& path);

    /// Manifest files resources were loaded from
    [[nodiscard]] std::vector<std::string> source_files() const;

    // =========================================================================
    // Holds & Events
    // =========================================================================

    [[nodiscard]] manifold_event::HoldRelease acquire_hold(const std::string& reason = {});

    /// Append every event to a JSON-lines file
    [[nodiscard]] manifold_core::Result<void> enable_event_stream(const std::filesystem::path& path);

    [[nodiscard]] manifold_event::EventBus& events() noexcept { return m_events; }
    [[nodiscard]] const manifold_event::HoldCounter& holds() const noexcept { return m_holds; }

    // =========================================================================
    // Introspection
    // =========================================================================

    [[nodiscard]] const manifold_manifest::Registry& registry() const noexcept { return m_registry; }
    [[nodiscard]] ControllerRegistry& controllers() noexcept { return m_controllers; }
    [[nodiscard]] const ControllerRegistry& controllers() const noexcept { return m_controllers; }
    [[nodiscard]] const manifold_expr::Evaluator& evaluator() const noexcept { return m_evaluator; }

    /// Live instance, null if none
    [[nodiscard]] InstancePtr instance(const manifold_core::ResourceId& id) const;

    /// Identities of live instances in creation order
    [[nodiscard]] std::vector<manifold_core::ResourceId> instance_ids() const;

    /// Identities still waiting for a controller
    [[nodiscard]] const std::vector<manifold_core::ResourceId>& pending() const noexcept { return m_queue; }

    /// Point-in-time dump of phase, holds and every resource
    [[nodiscard]] nlohmann::json snapshot() const;
    [[nodiscard]] manifold_core::Result<void> save_snapshot(const std::filesystem::path& path) const;

    [[nodiscard]] const KernelConfig& config() const noexcept { return m_config; }
    [[nodiscard]] KernelStats stats() const;

private:
    struct LiveInstance {
        manifold_core::ResourceId id;
        manifold_core::Resource resource;
        InstancePtr instance;
        bool started = false;
    };

    // Phase transitions
    void set_phase(KernelPhase new_phase);

    // Boot stages
    manifold_core::Result<std::vector<manifold_core::Resource>> prepare(
        std::vector<manifold_core::Resource> resources) const;
    manifold_core::Result<void> register_all(std::vector<manifold_core::Resource> resources);
    manifold_core::Result<void> run_register_hooks();
    manifold_core::Result<void> run_register_hook(const std::string& kind, const ControllerPtr& controller);
    manifold_core::Result<void> discover();
    manifold_core::Result<bool> create_instance(const manifold_core::ResourceId& id);
    manifold_core::Result<void> discover_and_run_new();
    manifold_core::Result<void> run_pending();

    // Controllers
    manifold_core::Result<ControllerPtr> controller_for(const std::string& kind);

    // Teardown
    manifold_core::Result<void> teardown_all();
    void teardown_resource(const manifold_core::ResourceId& id, std::vector<std::string>& failures);
    void collect_descendants(const manifold_core::ResourceId& id,
                             std::vector<manifold_core::ResourceId>& out) const;

    // Lookup
    const LiveInstance* find_instance(const manifold_core::ResourceId& id) const;
    const manifold_core::Resource* find_template(const std::string& kind) const;

    void register_builtins();

private:
    KernelConfig m_config;
    KernelPhase m_phase = KernelPhase::Created;

    manifold_expr::Evaluator m_evaluator;
    manifold_manifest::Loader m_loader;
    manifold_manifest::TemplateEngine m_templates;
    manifold_manifest::ExpressionResolver m_resolver;
    manifold_manifest::Registry m_registry;
    ControllerRegistry m_controllers;

    manifold_event::EventBus m_events;
    manifold_event::HoldCounter m_holds;
    manifold_event::EventStream m_event_stream;

    // Boot set, before registration
    std::vector<manifold_core::Resource> m_loaded;

    // Discovery
    std::vector<manifold_core::ResourceId> m_queue;
    std::map<std::string, std::string> m_creation_errors;
    std::set<const Controller*> m_hooked;
    bool m_hooks_ready = false;
    bool m_discovering = false;

    // Live state
    std::vector<LiveInstance> m_instances;
    std::map<manifold_core::ResourceId, std::vector<manifold_core::ResourceId>> m_children;
    int m_exit_code = 0;

    // Statistics
    std::uint64_t m_discovery_passes = 0;
    std::uint64_t m_executions = 0;
    std::uint64_t m_execution_failures = 0;
    std::uint64_t m_reloads = 0;
    std::chrono::nanoseconds m_boot_time{0};

    // Callbacks
    std::function<void(const KernelPhaseEvent&)> m_on_phase_change;
};

// =============================================================================
// Kernel Builder
// =============================================================================

/// Fluent builder for kernel configuration
class KernelBuilder {
public:
    KernelBuilder() = default;

    /// Set kernel name
    KernelBuilder& name(const std::string& n) { m_config.name = n; return *this; }

    /// Set module used for `Self.` kinds and template aliases
    KernelBuilder& module(const std::string& m) { m_config.module_name = m; return *this; }

    /// Set controller discovery pass limit
    KernelBuilder& discovery_passes(std::uint32_t n) { m_config.max_discovery_passes = n; return *this; }

    /// Set expression resolution pass limit
    KernelBuilder& resolution_passes(std::uint32_t n) { m_config.max_resolution_passes = n; return *this; }

    /// Set template expansion depth limit
    KernelBuilder& expansion_depth(std::uint32_t n) { m_config.max_expansion_depth = n; return *this; }

    /// Set template expansion pass limit
    KernelBuilder& expansion_passes(std::uint32_t n) { m_config.max_expansion_passes = n; return *this; }

    /// Expose an environment variable to expressions
    KernelBuilder& allow_env(const std::string& var) { m_config.env_allowlist.push_back(var); return *this; }

    /// Write every event to a JSON-lines file
    KernelBuilder& event_stream(const std::string& path) { m_config.event_stream_path = path; return *this; }

    /// Register a controller for `kind` once the kernel is built
    KernelBuilder& controller(const std::string& kind, nlohmann::json schema, Controller impl) {
        m_controllers.push_back(Pending{kind, std::move(schema), std::move(impl)});
        return *this;
    }

    /// Build the kernel
    [[nodiscard]] manifold_core::Result<std::unique_ptr<Kernel>> build();

private:
    struct Pending {
        std::string kind;
        nlohmann::json schema;
        Controller controller;
    };

    KernelConfig m_config;
    std::vector<Pending> m_controllers;
};

} // namespace manifold_kernel
