/// @file kernel.cpp
/// @brief Kernel implementation

#include <manifold/kernel/kernel.hpp>
#include <manifold/kernel/builtin.hpp>
#include <manifold/core/log.hpp>
#include <manifold/manifest/dependency_orderer.hpp>
#include <manifold/manifest/schema.hpp>

#include <algorithm>
#include <fstream>
#include <sstream>

namespace manifold_kernel {

using manifold_core::ControllerError;
using manifold_core::Err;
using manifold_core::Error;
using manifold_core::ErrorCode;
using manifold_core::Ok;
using manifold_core::Resource;
using manifold_core::ResourceError;
using manifold_core::ResourceId;
using manifold_core::Result;
using manifold_manifest::SchemaValidator;
using nlohmann::json;

namespace {

manifold_expr::EvalOptions eval_options(const KernelConfig& config) {
    manifold_expr::EvalOptions options;
    options.deferred_roots.insert(config.deferred_roots.begin(), config.deferred_roots.end());
    return options;
}

manifold_manifest::TemplateEngineConfig template_config(const KernelConfig& config) {
    manifold_manifest::TemplateEngineConfig out;
    out.max_depth = static_cast<int>(config.max_expansion_depth);
    out.max_passes = static_cast<int>(config.max_expansion_passes);
    out.module_name = config.module_name;
    return out;
}

manifold_manifest::ResolutionConfig resolution_config(const KernelConfig& config) {
    manifold_manifest::ResolutionConfig out;
    out.max_passes = static_cast<int>(config.max_resolution_passes);
    out.env_allowlist = config.env_allowlist;
    out.module_name = config.module_name;
    return out;
}

/// Run controller code, turning a thrown exception into ERR_EXECUTION_FAILED
template<typename F>
auto guarded(F&& fn) -> decltype(fn()) {
    using R = decltype(fn());
    try {
        return fn();
    } catch (const std::exception& e) {
        return R(Error(ErrorCode::ExecutionFailed, e.what()));
    }
}

json resource_payload(const ResourceId& id) {
    json payload = json::object();
    payload["resource"] = {{"kind", id.kind}, {"name", id.name}};
    return payload;
}

std::string join_lines(const std::vector<std::string>& lines) {
    std::ostringstream oss;
    for (const auto& line : lines) {
        oss << "\n- " << line;
    }
    return oss.str();
}

bool is_live_phase(KernelPhase phase) {
    return phase == KernelPhase::Ready || phase == KernelPhase::Running || phase == KernelPhase::Idle;
}

} // anonymous namespace

// =============================================================================
// Construction
// =============================================================================

Kernel::Kernel(KernelConfig config)
    : m_config(std::move(config))
    , m_evaluator(eval_options(m_config))
    , m_loader(manifold_manifest::LoaderConfig{m_config.module_name})
    , m_templates(m_evaluator, template_config(m_config))
    , m_resolver(m_evaluator, resolution_config(m_config))
    , m_holds(&m_events)
{
    register_builtins();
}

Kernel::~Kernel() {
    // Handlers may reference objects already gone
    m_events.clear();
    if (!m_instances.empty()) {
        auto result = teardown_all();
        if (!result) {
            manifold_core::kernel_logger()->warn("Teardown on destruction: {}", result.error().message());
        }
    }
    m_holds.shutdown();
}

void Kernel::register_builtins() {
    auto result = register_builtin_kinds(m_controllers);
    if (!result) {
        manifold_core::kernel_logger()->error("Failed to register built-in kinds: {}", result.error().message());
    }
}

void Kernel::set_phase(KernelPhase new_phase) {
    if (m_phase == new_phase) {
        return;
    }

    KernelPhaseEvent event{m_phase, new_phase, std::chrono::system_clock::now()};
    m_phase = new_phase;

    manifold_core::kernel_logger()->info("[{}] {} -> {}", m_config.name, to_string(event.old_phase),
                                         to_string(new_phase));
    if (m_on_phase_change) {
        m_on_phase_change(event);
    }
}

void Kernel::set_on_phase_change(std::function<void(const KernelPhaseEvent&)> callback) {
    m_on_phase_change = std::move(callback);
}

// =============================================================================
// Loading
// =============================================================================

Result<void> Kernel::load(const std::filesystem::path& path) {
    if (m_phase == KernelPhase::Created) {
        set_phase(KernelPhase::Loading);
    }
    auto loaded = m_loader.load(path);
    if (!loaded) {
        return Err(loaded.error());
    }
    load_resources(std::move(*loaded));
    return Ok();
}

void Kernel::load_resources(std::vector<Resource> resources) {
    for (auto& resource : resources) {
        m_loaded.push_back(std::move(resource));
    }
}

// =============================================================================
// Boot
// =============================================================================

Result<void> Kernel::boot() {
    if (m_phase != KernelPhase::Created && m_phase != KernelPhase::Loading) {
        return Err(Error(ErrorCode::InvalidState,
            std::string("Kernel cannot boot from phase ") + to_string(m_phase)));
    }

    MANIFOLD_LOG_SCOPE("boot");
    const auto start_time = std::chrono::steady_clock::now();

    auto fail = [this](Error error) -> Result<void> {
        manifold_core::debug::record_error(error);
        manifold_core::kernel_logger()->error("Boot failed: {}", manifold_core::build_error_chain(error));
        // Instances created before the failure do not outlive it
        auto torn_down = teardown_all();
        if (!torn_down) {
            manifold_core::kernel_logger()->warn("Teardown after failed boot: {}", torn_down.error().message());
            error.with_context("teardown", torn_down.error().message());
        }
        set_phase(KernelPhase::Failed);
        return Err(std::move(error));
    };

    if (!m_config.event_stream_path.empty() && !m_event_stream.is_open()) {
        auto stream = enable_event_stream(m_config.event_stream_path);
        if (!stream) {
            return fail(stream.error());
        }
    }

    set_phase(KernelPhase::Resolving);
    auto prepared = prepare(std::move(m_loaded));
    m_loaded.clear();
    if (!prepared) {
        return fail(prepared.error());
    }

    set_phase(KernelPhase::Registering);
    auto registered = register_all(std::move(*prepared));
    if (!registered) {
        return fail(registered.error());
    }

    m_hooks_ready = true;
    auto hooks = run_register_hooks();
    if (!hooks) {
        return fail(hooks.error());
    }

    set_phase(KernelPhase::Discovering);
    auto discovered = discover();
    if (!discovered) {
        return fail(discovered.error());
    }

    m_boot_time = std::chrono::duration_cast<std::chrono::nanoseconds>(
        std::chrono::steady_clock::now() - start_time);
    set_phase(KernelPhase::Ready);

    manifold_core::kernel_logger()->info("Booted {} resource(s), {} instance(s), {} discovery pass(es)",
                                         m_registry.size(), m_instances.size(), m_discovery_passes);
    return Ok();
}

Result<std::vector<Resource>> Kernel::prepare(std::vector<Resource> resources) const {
    auto ordered = manifold_manifest::DependencyOrderer::order(std::move(resources));
    if (!ordered) {
        return ordered;
    }

    auto expanded = m_templates.expand_all(std::move(*ordered),
        [this](const std::string& kind) { return find_template(kind); });
    if (!expanded) {
        return expanded;
    }

    if (m_registry.empty()) {
        return m_resolver.resolve_all(std::move(*expanded));
    }

    // Later registrations may reference anything already registered
    std::vector<const Resource*> visible = m_registry.all();
    for (const auto& resource : *expanded) {
        visible.push_back(&resource);
    }
    const json context = m_resolver.build_context(visible);

    std::vector<Resource> resolved;
    resolved.reserve(expanded->size());
    for (const auto& resource : *expanded) {
        auto result = m_resolver.resolve(resource, context);
        if (!result) {
            return Err<std::vector<Resource>>(result.error());
        }
        resolved.push_back(std::move(*result));
    }
    return Ok(std::move(resolved));
}

Result<void> Kernel::register_all(std::vector<Resource> resources) {
    for (auto& resource : resources) {
        const auto id = manifold_core::resource_id(resource);
        auto registered = m_registry.register_resource(std::move(resource));
        if (!registered) {
            return registered;
        }
        m_queue.push_back(id);
    }
    return Ok();
}

// =============================================================================
// Controller Discovery
// =============================================================================

Result<void> Kernel::run_register_hooks() {
    for (const auto& kind : m_controllers.controller_kinds()) {
        auto hook = run_register_hook(kind, m_controllers.get(kind));
        if (!hook) {
            return hook;
        }
    }
    return Ok();
}

Result<void> Kernel::run_register_hook(const std::string& kind, const ControllerPtr& controller) {
    if (!controller || !controller->has_register() || m_hooked.count(controller.get()) > 0) {
        return Ok();
    }
    m_hooked.insert(controller.get());

    ControllerContext ctx(*this, kind);
    auto result = guarded([&] { return controller->on_register(ctx); });
    if (!result) {
        auto error = result.error();
        error.with_context("kind", kind);
        return Err(std::move(error));
    }
    manifold_core::controller_logger()->debug("Ran register hook of {}", kind);
    return Ok();
}

Result<ControllerPtr> Kernel::controller_for(const std::string& kind) {
    auto resolved = m_controllers.resolve(kind);

    if (!resolved) {
        const auto* detail = resolved.error().as<ControllerError>();
        if (!detail || detail->kind != ControllerError::Kind::NotFound) {
            return resolved;
        }

        // Kind inheritance: borrow the nearest ancestor's controller
        const auto chain = m_registry.resolve_kind_chain(kind);
        for (std::size_t i = 1; i < chain.size(); ++i) {
            if (m_controllers.resolve(chain[i])) {
                resolved = m_controllers.alias(kind, chain[i]);
                break;
            }
        }
        if (!resolved) {
            return resolved;
        }
    }

    if (m_hooks_ready) {
        auto hook = run_register_hook(kind, *resolved);
        if (!hook) {
            return Err<ControllerPtr>(hook.error());
        }
    }
    return resolved;
}

Result<void> Kernel::discover() {
    m_discovering = true;
    std::uint32_t pass = 0;
    std::size_t handled = 0;

    do {
        ++pass;
        ++m_discovery_passes;
        handled = 0;
        std::set<ResourceId> done;

        // Resources registered during this pass are appended and visited in the same pass
        for (std::size_t i = 0; i < m_queue.size(); ++i) {
            const ResourceId id = m_queue[i];
            if (done.count(id) > 0) {
                continue;
            }
            auto created = create_instance(id);
            if (!created) {
                m_discovering = false;
                return Err(created.error());
            }
            if (*created) {
                done.insert(id);
                ++handled;
            }
        }

        m_queue.erase(std::remove_if(m_queue.begin(), m_queue.end(),
            [&done](const ResourceId& id) { return done.count(id) > 0; }), m_queue.end());

        manifold_core::kernel_logger()->debug("Discovery pass {}: {} handled, {} pending",
                                              pass, handled, m_queue.size());
    } while (pass < m_config.max_discovery_passes && handled > 0 && !m_queue.empty());

    m_discovering = false;

    if (!m_queue.empty()) {
        std::vector<std::string> lines;
        lines.reserve(m_queue.size());
        for (const auto& id : m_queue) {
            auto it = m_creation_errors.find(id.to_string());
            lines.push_back(id.to_string() + ": " + (it != m_creation_errors.end() ? it->second : "Unknown error"));
        }
        return Err(Error(ErrorCode::ControllerNotFound, "Unable to process resources:\n" + join_lines(lines)));
    }

    m_creation_errors.clear();
    return Ok();
}

Result<bool> Kernel::create_instance(const ResourceId& id) {
    const Resource* document = m_registry.get(id);
    if (!document || find_instance(id)) {
        return Ok(true);
    }

    const std::string key = id.to_string();
    auto record = [&](const Error& error) -> Result<bool> {
        m_creation_errors[key] = error.message();
        manifold_core::kernel_logger()->debug("{} not created yet: {}", key, error.message());
        return Ok(false);
    };

    auto controller = controller_for(id.kind);
    if (!controller) {
        return record(controller.error());
    }
    const ControllerPtr ctrl = *controller;

    if (!ctrl->has_create()) {
        return record(Error(ControllerError::invalid(id.kind, "does not implement create method")));
    }
    if (!SchemaValidator::has_type(ctrl->schema)) {
        return record(Error(ErrorCode::ControllerInvalid, "No schema defined for " + id.kind + " controller"));
    }

    Resource working = *document;
    SchemaValidator::apply_defaults(working, ctrl->schema);
    auto valid = SchemaValidator::validate(working, ctrl->schema);
    if (!valid) {
        return record(valid.error());
    }

    if (ctrl->has_compile()) {
        ResourceContext ctx(*this, working);
        auto compiled = guarded([&] { return ctrl->compile(working, ctx); });
        if (!compiled) {
            return record(compiled.error());
        }
        if (compiled->has_value()) {
            Resource replacement = std::move(**compiled);
            if (manifold_core::resource_id(replacement) != id) {
                return record(Error(ErrorCode::ControllerInvalid, "compile of " + key + " changed its identity"));
            }
            auto updated = m_registry.update(id, replacement);
            if (!updated) {
                return record(updated.error());
            }
            working = std::move(replacement);
        }
    }

    ResourceContext ctx(*this, working);
    auto created = guarded([&] { return ctrl->create(working, ctx); });
    if (!created) {
        return record(created.error());
    }

    InstancePtr instance = std::move(*created);
    if (!instance) {
        manifold_core::kernel_logger()->trace("{} is passive", key);
        m_creation_errors.erase(key);
        return Ok(true);
    }

    auto initialized = guarded([&] { return instance->init(); });
    if (!initialized) {
        return record(initialized.error());
    }

    m_instances.push_back(LiveInstance{id, std::move(working), instance});
    m_creation_errors.erase(key);
    manifold_core::kernel_logger()->debug("Created {}", key);

    auto emitted = m_events.emit(id.kind + ".Initialized", resource_payload(id));
    if (!emitted) {
        auto error = emitted.error();
        error.with_context("resource", key);
        return Err<bool>(std::move(error));
    }
    return Ok(true);
}

Result<void> Kernel::discover_and_run_new() {
    auto discovered = discover();
    if (!discovered) {
        return discovered;
    }
    if (m_phase == KernelPhase::Running || m_phase == KernelPhase::Idle) {
        return run_pending();
    }
    return Ok();
}

// =============================================================================
// Run / Idle / Stop
// =============================================================================

Result<void> Kernel::run_pending() {
    // Indexed: run() may register further resources
    for (std::size_t i = 0; i < m_instances.size(); ++i) {
        if (m_instances[i].started) {
            continue;
        }
        m_instances[i].started = true;
        const ResourceId id = m_instances[i].id;
        InstancePtr instance = m_instances[i].instance;

        auto result = guarded([&] { return instance->run(); });
        if (!result) {
            auto error = result.error();
            error.with_context("resource", id.to_string());
            return Err(std::move(error));
        }
    }
    return Ok();
}

Result<void> Kernel::run() {
    if (m_phase != KernelPhase::Ready) {
        return Err(Error(ErrorCode::InvalidState,
            std::string("Kernel cannot run from phase ") + to_string(m_phase)));
    }

    auto starting = m_events.emit("Runtime.Starting", json::object());
    if (!starting) {
        set_phase(KernelPhase::Failed);
        return starting;
    }

    set_phase(KernelPhase::Running);
    auto ran = run_pending();
    if (!ran) {
        manifold_core::kernel_logger()->error("Run failed: {}", manifold_core::build_error_chain(ran.error()));
        set_phase(KernelPhase::Failed);
        return ran;
    }

    auto started = m_events.emit("Runtime.Started", json::object());
    if (!started) {
        set_phase(KernelPhase::Failed);
        return started;
    }
    return Ok();
}

std::shared_future<void> Kernel::wait_for_idle() {
    if (m_phase == KernelPhase::Running) {
        set_phase(KernelPhase::Idle);
    }
    return m_holds.wait_for_idle();
}

Result<void> Kernel::stop() {
    if (m_phase == KernelPhase::Stopped) {
        return Ok();
    }

    set_phase(KernelPhase::Stopping);
    std::vector<std::string> failures;

    auto stopping = m_events.emit("Runtime.Stopping", json::object());
    if (!stopping) {
        failures.push_back(stopping.error().message());
    }

    auto torn_down = teardown_all();
    if (!torn_down) {
        failures.push_back(torn_down.error().message());
    }

    json payload = json::object();
    payload["exitCode"] = m_exit_code;
    auto stopped = m_events.emit("Runtime.Stopped", std::move(payload));
    if (!stopped) {
        failures.push_back(stopped.error().message());
    }

    m_holds.shutdown();
    set_phase(KernelPhase::Stopped);

    if (!failures.empty()) {
        return Err(Error(ErrorCode::ExecutionFailed, "Shutdown completed with errors:" + join_lines(failures)));
    }
    return Ok();
}

Result<int> Kernel::start() {
    Result<void> outcome = boot();
    if (outcome) {
        outcome = run();
    }
    if (outcome) {
        wait_for_idle().wait();
    }

    auto stopped = stop();
    if (!outcome) {
        return Err<int>(outcome.error());
    }
    if (!stopped) {
        return Err<int>(stopped.error());
    }
    return Ok(m_exit_code);
}

void Kernel::shutdown() {
    manifold_core::kernel_logger()->info("Shutdown requested");
    m_holds.shutdown();
}

void Kernel::request_exit(int code) {
    m_exit_code = std::max(m_exit_code, code);
}

manifold_event::HoldRelease Kernel::acquire_hold(const std::string& reason) {
    return m_holds.acquire(reason);
}

// =============================================================================
// Teardown
// =============================================================================

Result<void> Kernel::teardown_all() {
    std::vector<std::string> failures;
    const auto ids = instance_ids();
    for (auto it = ids.rbegin(); it != ids.rend(); ++it) {
        if (find_instance(*it)) {
            teardown_resource(*it, failures);
        }
    }
    if (!failures.empty()) {
        return Err(Error(ErrorCode::ExecutionFailed, "Teardown failed:" + join_lines(failures)));
    }
    return Ok();
}

void Kernel::teardown_resource(const ResourceId& id, std::vector<std::string>& failures) {
    auto children_it = m_children.find(id);
    if (children_it != m_children.end()) {
        auto children = std::move(children_it->second);
        m_children.erase(children_it);
        for (auto it = children.rbegin(); it != children.rend(); ++it) {
            teardown_resource(*it, failures);
        }
    }

    const LiveInstance* live = find_instance(id);
    if (!live) {
        return;
    }
    InstancePtr instance = live->instance;
    const std::string key = id.to_string();

    auto result = guarded([&] { return instance->teardown(); });
    if (!result) {
        manifold_core::kernel_logger()->warn("Teardown of {} failed: {}", key, result.error().message());
        failures.push_back(key + ": " + result.error().message());
    }

    auto emitted = m_events.emit(id.kind + ".Teardown", resource_payload(id));
    if (!emitted) {
        manifold_core::kernel_logger()->warn("Teardown event of {} failed: {}", key, emitted.error().message());
        failures.push_back(key + ": " + emitted.error().message());
    }

    m_instances.erase(std::remove_if(m_instances.begin(), m_instances.end(),
        [&id](const LiveInstance& entry) { return entry.id == id; }), m_instances.end());
    manifold_core::kernel_logger()->debug("Tore down {}", key);
}

void Kernel::collect_descendants(const ResourceId& id, std::vector<ResourceId>& out) const {
    auto it = m_children.find(id);
    if (it == m_children.end()) {
        return;
    }
    for (const auto& child : it->second) {
        out.push_back(child);
        collect_descendants(child, out);
    }
}

// =============================================================================
// Dispatch
// =============================================================================

Result<json> Kernel::execute(const std::string& urn, const json& input) {
    auto parsed = ResourceId::parse(urn);
    if (!parsed) {
        return Err<json>(parsed.error());
    }
    const ResourceId id = *parsed;

    const Resource* document = m_registry.get(id);
    if (!document) {
        return Err<json>(Error(ResourceError::not_found(id.kind, id.name)));
    }

    auto controller = controller_for(id.kind);
    if (!controller || !(*controller)->has_execute()) {
        return Err<json>(Error(ErrorCode::ModuleMissing, ControllerError::not_found(id.kind)));
    }
    const ControllerPtr ctrl = *controller;
    ++m_executions;

    const std::string prefix = id.to_string();
    ResourceContext ctx(*this, *document);

    json started_payload = json::object();
    started_payload["urn"] = urn;
    auto started = m_events.emit(prefix + ".ExecutionStarted", std::move(started_payload));

    auto result = started
        ? guarded([&] { return ctrl->execute(id.name, input, ctx); })
        : Err<json>(started.error());

    if (!result) {
        ++m_execution_failures;
        const std::string message = result.error().message();

        json failed_payload = json::object();
        failed_payload["urn"] = urn;
        failed_payload["error"] = message;
        auto failed = m_events.emit(prefix + ".ExecutionFailed", std::move(failed_payload));
        if (!failed) {
            manifold_core::kernel_logger()->warn("ExecutionFailed handler for {} failed: {}",
                                                 urn, failed.error().message());
        }

        Error error(ErrorCode::ExecutionFailed, "Execution failed for " + urn + ": " + message);
        error.with_context("cause", result.error().code_name());
        return Err<json>(std::move(error));
    }

    json completed_payload = json::object();
    completed_payload["urn"] = urn;
    auto completed = m_events.emit(prefix + ".ExecutionCompleted", std::move(completed_payload));
    if (!completed) {
        ++m_execution_failures;
        return Err<json>(Error(ErrorCode::ExecutionFailed,
            "Execution failed for " + urn + ": " + completed.error().message()));
    }
    return result;
}

Result<json> Kernel::invoke(const std::string& kind, const std::string& name, const json& input) {
    const ResourceId id{kind, name};
    const LiveInstance* live = find_instance(id);
    if (!live) {
        return Err<json>(Error(ErrorCode::ResourceNotFound, "Resource not found for invocation: " + id.to_string()));
    }

    InstancePtr instance = live->instance;
    if (!instance->is_invokable()) {
        return Err<json>(Error(ResourceError::not_invokable(kind, name)));
    }

    auto result = guarded([&] { return instance->invoke(input); });
    if (!result) {
        return result;
    }

    json payload = json::object();
    payload["result"] = *result;
    auto emitted = m_events.emit(id.to_string() + ".Invoked", std::move(payload));
    if (!emitted) {
        manifold_core::kernel_logger()->warn("Invoked handler for {} failed: {}",
                                             id.to_string(), emitted.error().message());
    }
    return result;
}

Result<void> Kernel::emit_resource_event(const std::string& kind, const std::string& name,
                                         const std::string& event, json payload) {
    if (event.find('*') != std::string::npos || !manifold_event::EventBus::is_valid_name(event)) {
        return Err(Error(ErrorCode::InvalidEvent, "Invalid event name: \"" + event + "\""));
    }
    const std::string leaf = event.substr(event.rfind('.') + 1);
    if (leaf == "Initialized" || leaf == "Teardown") {
        return Err(Error(ErrorCode::ReservedEvent,
            "Resource events cannot use reserved lifecycle event: " + leaf));
    }
    return m_events.emit(kind + "." + name + "." + event, std::move(payload));
}

// =============================================================================
// Dynamic Registration
// =============================================================================

Result<void> Kernel::register_manifest(Resource resource, const ResourceId* parent) {
    auto shape = manifold_core::validate_resource_shape(resource);
    if (!shape) {
        return Err(shape.error());
    }

    auto& metadata = manifold_core::ensure_metadata(resource);
    if (!metadata.contains("module") && !m_config.module_name.empty()) {
        metadata["module"] = m_config.module_name;
    }
    if (!metadata.contains("generationDepth")) {
        metadata["generationDepth"] = 0;
    }

    const std::string kind = manifold_core::resource_kind(resource);
    const std::string module = manifold_core::resource_module(resource);
    if (kind.rfind("Self.", 0) == 0 && !module.empty()) {
        resource["kind"] = module + "." + kind.substr(5);
    }

    std::vector<Resource> documents;
    documents.push_back(std::move(resource));
    auto prepared = prepare(std::move(documents));
    if (!prepared) {
        return Err(prepared.error());
    }

    for (auto& document : *prepared) {
        const auto id = manifold_core::resource_id(document);
        auto registered = m_registry.register_resource(std::move(document));
        if (!registered) {
            return registered;
        }
        m_queue.push_back(id);
        if (parent) {
            m_children[*parent].push_back(id);
        }
        manifold_core::kernel_logger()->debug("Registered {}{}", id.to_string(),
                                              parent ? " as child of " + parent->to_string() : std::string());
    }

    if (!m_discovering && is_live_phase(m_phase)) {
        return discover_and_run_new();
    }
    return Ok();
}

Result<void> Kernel::register_definition(ResourceDefinition definition) {
    const std::string kind = definition.kind;
    const std::string extends = definition.extends;
    m_controllers.register_definition(std::move(definition));

    if (!extends.empty()) {
        auto inherited = m_registry.set_parent_kind(kind, extends);
        if (!inherited) {
            return inherited;
        }
    }
    manifold_core::controller_logger()->info("Defined kind {}{}", kind,
                                             extends.empty() ? std::string() : " extends " + extends);
    return Ok();
}

Result<void> Kernel::register_controller(const std::string& kind, Controller controller) {
    auto stored = m_controllers.register_controller(kind, std::move(controller));
    if (!stored) {
        return Err(stored.error());
    }
    if (m_hooks_ready) {
        return run_register_hook(kind, *stored);
    }
    return Ok();
}

Result<void> Kernel::reload_source(const std::filesystem::path& path) {
    // Parse before touching anything that is running
    auto loaded = m_loader.load_file(path);
    if (!loaded) {
        return Err(loaded.error());
    }

    std::error_code ec;
    auto absolute = std::filesystem::absolute(path, ec);
    const std::string source = (ec ? path : absolute).lexically_normal().string();

    ++m_reloads;
    manifold_core::kernel_logger()->info("Reloading {}", source);

    std::vector<ResourceId> previous;
    for (const Resource* document : m_registry.get_by_source(source)) {
        previous.push_back(manifold_core::resource_id(*document));
    }

    std::vector<ResourceId> removed = previous;
    for (const auto& id : previous) {
        collect_descendants(id, removed);
    }

    std::vector<std::string> failures;
    for (auto it = previous.rbegin(); it != previous.rend(); ++it) {
        teardown_resource(*it, failures);
    }
    for (const auto& failure : failures) {
        manifold_core::kernel_logger()->warn("Reload of {}: {}", source, failure);
    }

    for (const auto& id : removed) {
        m_registry.unregister(id);
        m_children.erase(id);
        m_creation_errors.erase(id.to_string());
        m_queue.erase(std::remove(m_queue.begin(), m_queue.end(), id), m_queue.end());
    }

    auto prepared = prepare(std::move(*loaded));
    if (!prepared) {
        return Err(prepared.error());
    }
    auto registered = register_all(std::move(*prepared));
    if (!registered) {
        return registered;
    }
    return discover_and_run_new();
}

std::vector<std::string> Kernel::source_files() const {
    std::set<std::string> seen;
    for (const Resource* document : m_registry.all()) {
        auto source = manifold_core::resource_source(*document);
        if (!source.empty()) {
            seen.insert(std::move(source));
        }
    }
    return {seen.begin(), seen.end()};
}

Result<void> Kernel::enable_event_stream(const std::filesystem::path& path) {
    auto opened = m_event_stream.open(path);
    if (!opened) {
        return opened;
    }
    m_event_stream.attach(m_events);
    manifold_core::event_logger()->info("Streaming events to {}", path.string());
    return Ok();
}

// =============================================================================
// Introspection
// =============================================================================

const Kernel::LiveInstance* Kernel::find_instance(const ResourceId& id) const {
    auto it = std::find_if(m_instances.begin(), m_instances.end(),
        [&id](const LiveInstance& entry) { return entry.id == id; });
    return it != m_instances.end() ? &*it : nullptr;
}

const Resource* Kernel::find_template(const std::string& kind) const {
    for (const Resource* candidate : m_registry.get_by_kind(manifold_core::k_template_definition_kind)) {
        for (const auto& alias : m_templates.template_aliases(*candidate)) {
            if (alias == kind) {
                return candidate;
            }
        }
    }
    return nullptr;
}

InstancePtr Kernel::instance(const ResourceId& id) const {
    const LiveInstance* live = find_instance(id);
    return live ? live->instance : nullptr;
}

std::vector<ResourceId> Kernel::instance_ids() const {
    std::vector<ResourceId> ids;
    ids.reserve(m_instances.size());
    for (const auto& entry : m_instances) {
        ids.push_back(entry.id);
    }
    return ids;
}

json Kernel::snapshot() const {
    std::vector<const Resource*> documents = m_registry.all();
    std::stable_sort(documents.begin(), documents.end(), [](const Resource* a, const Resource* b) {
        return manifold_core::resource_generation_depth(*a) < manifold_core::resource_generation_depth(*b);
    });

    json resources = json::array();
    for (const Resource* document : documents) {
        const auto id = manifold_core::resource_id(*document);

        json entry = json::object();
        entry["kind"] = id.kind;
        entry["name"] = id.name;
        entry["metadata"] = document->value("metadata", json::object());

        json data = *document;
        data.erase("kind");
        data.erase("metadata");
        entry["data"] = std::move(data);

        if (const LiveInstance* live = find_instance(id)) {
            try {
                if (auto state = live->instance->snapshot()) {
                    entry["snapshot"] = std::move(*state);
                }
            } catch (const std::exception& e) {
                entry["snapshotError"] = e.what();
            }
        }
        resources.push_back(std::move(entry));
    }

    json out = json::object();
    out["timestamp"] = manifold_event::EventStream::timestamp_now();
    out["phase"] = to_string(m_phase);
    out["holds"] = m_holds.count();
    out["resources"] = std::move(resources);
    return out;
}

Result<void> Kernel::save_snapshot(const std::filesystem::path& path) const {
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
    }

    std::ofstream file(path);
    if (!file) {
        return Err(Error(ErrorCode::IOError, "Failed to write snapshot: " + path.string()));
    }
    file << snapshot().dump(2) << '\n';
    if (!file) {
        return Err(Error(ErrorCode::IOError, "Failed to write snapshot: " + path.string()));
    }
    manifold_core::kernel_logger()->info("Snapshot written to {}", path.string());
    return Ok();
}

KernelStats Kernel::stats() const {
    KernelStats stats;
    stats.total_resources = m_registry.size();
    stats.template_generated = m_registry.get_template_generated().size();
    stats.live_instances = m_instances.size();
    stats.controllers = m_controllers.controller_count();
    stats.definitions = m_controllers.definition_count();
    stats.discovery_passes = m_discovery_passes;
    stats.events_emitted = m_events.emitted_count();
    stats.executions = m_executions;
    stats.execution_failures = m_execution_failures;
    stats.reloads = m_reloads;
    stats.holds = m_holds.count();
    stats.boot_time = m_boot_time;
    return stats;
}

// =============================================================================
// KernelBuilder
// =============================================================================

Result<std::unique_ptr<Kernel>> KernelBuilder::build() {
    auto kernel = std::make_unique<Kernel>(m_config);
    for (auto& pending : m_controllers) {
        auto defined = kernel->register_definition(ResourceDefinition::for_kind(pending.kind, pending.schema));
        if (!defined) {
            return Err<std::unique_ptr<Kernel>>(defined.error());
        }
        auto bound = kernel->register_controller(pending.kind, pending.controller);
        if (!bound) {
            return Err<std::unique_ptr<Kernel>>(bound.error());
        }
    }
    return Ok(std::move(kernel));
}

} // namespace manifold_kernel
