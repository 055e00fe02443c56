/// @file controller_registry.cpp
/// @brief ControllerRegistry implementation

#include <manifold/kernel/controller_registry.hpp>
#include <manifold/core/log.hpp>

namespace manifold_kernel {

using manifold_core::ControllerError;
using manifold_core::Err;
using manifold_core::Error;
using manifold_core::Ok;
using manifold_core::Result;

ControllerRegistry::ControllerRegistry() {
    auto static_resolver = std::make_unique<StaticEntrypointResolver>();
    m_static = static_resolver.get();
    m_resolvers.push_back(std::move(static_resolver));
    m_resolvers.push_back(std::make_unique<NativeEntrypointResolver>());
}

// =============================================================================
// Definitions
// =============================================================================

void ControllerRegistry::register_definition(ResourceDefinition definition) {
    const std::string kind = definition.kind;
    if (m_definitions.count(kind) > 0) {
        manifold_core::controller_logger()->debug("Replacing definition of {}", kind);
    }
    m_definitions[kind] = std::move(definition);
}

const ResourceDefinition* ControllerRegistry::definition(const std::string& kind) const {
    auto it = m_definitions.find(kind);
    return it != m_definitions.end() ? &it->second : nullptr;
}

bool ControllerRegistry::has_definition(const std::string& kind) const {
    return m_definitions.count(kind) > 0;
}

std::vector<std::string> ControllerRegistry::kinds() const {
    std::vector<std::string> result;
    result.reserve(m_definitions.size());
    for (const auto& [kind, _] : m_definitions) {
        result.push_back(kind);
    }
    return result;
}

// =============================================================================
// Controllers
// =============================================================================

Result<ControllerPtr> ControllerRegistry::store(const std::string& kind, Controller controller) {
    const ResourceDefinition* def = definition(kind);
    if (!def) {
        return Err<ControllerPtr>(Error(ControllerError::missing_definition(kind)));
    }
    if (m_controllers.count(kind) > 0) {
        return Err<ControllerPtr>(Error(ControllerError::already_registered(kind)));
    }
    if (!controller.is_usable()) {
        return Err<ControllerPtr>(Error(ControllerError::invalid(kind, "declares no capabilities")));
    }

    // The caller's controller is copied, never modified in place
    if (controller.schema.is_null() && !def->schema.is_null()) {
        controller.schema = def->schema;
    }

    auto ptr = std::make_shared<const Controller>(std::move(controller));
    m_controllers[kind] = ptr;
    manifold_core::controller_logger()->debug("Registered controller for {}", kind);
    return Ok(ControllerPtr(ptr));
}

Result<ControllerPtr> ControllerRegistry::register_controller(const std::string& kind, Controller controller) {
    return store(kind, std::move(controller));
}

Result<ControllerPtr> ControllerRegistry::register_builtin(const std::string& kind, nlohmann::json schema,
                                                          Controller controller) {
    register_definition(ResourceDefinition::for_kind(kind, std::move(schema)));
    return store(kind, std::move(controller));
}

Result<ControllerPtr> ControllerRegistry::alias(const std::string& kind, const std::string& parent_kind) {
    auto parent = resolve(parent_kind);
    if (!parent) {
        return parent;
    }
    if (m_controllers.count(kind) > 0) {
        return Err<ControllerPtr>(Error(ControllerError::already_registered(kind)));
    }

    ControllerPtr shared = *parent;
    const ResourceDefinition* def = definition(kind);
    if (def && !def->schema.is_null() && shared->schema != def->schema) {
        Controller wrapped = *shared;
        wrapped.schema = def->schema;
        shared = std::make_shared<const Controller>(std::move(wrapped));
    }
    m_controllers[kind] = shared;
    manifold_core::controller_logger()->debug("Kind {} uses the controller of {}", kind, parent_kind);
    return Ok(std::move(shared));
}

ControllerPtr ControllerRegistry::get(const std::string& kind) const {
    auto it = m_controllers.find(kind);
    return it != m_controllers.end() ? it->second : nullptr;
}

Result<ControllerPtr> ControllerRegistry::resolve(const std::string& kind) {
    if (auto existing = get(kind)) {
        return Ok(std::move(existing));
    }

    const ResourceDefinition* def = definition(kind);
    if (!def || def->controllers.empty()) {
        return Err<ControllerPtr>(Error(ControllerError::not_found(kind)));
    }

    auto loaded = load(*def);
    if (!loaded) {
        return Err<ControllerPtr>(std::move(loaded.error()));
    }
    return store(kind, std::move(*loaded));
}

Result<Controller> ControllerRegistry::load(const ResourceDefinition& definition) {
    std::string last_error = "no resolver accepts any of the declared entrypoints";
    for (const auto& entrypoint : definition.controllers) {
        for (auto& resolver : m_resolvers) {
            if (!resolver->can_resolve(entrypoint)) {
                continue;
            }
            auto controller = resolver->resolve(entrypoint, definition);
            if (controller) {
                return controller;
            }
            last_error = controller.error().message();
            manifold_core::controller_logger()->debug("Entrypoint {} ({}) failed for {}: {}",
                                                      entrypoint, resolver->name(), definition.kind, last_error);
        }
    }
    return Err<Controller>(Error(ControllerError::load_failed(definition.kind, last_error)));
}

bool ControllerRegistry::has_controller(const std::string& kind) const {
    return m_controllers.count(kind) > 0;
}

std::vector<std::string> ControllerRegistry::controller_kinds() const {
    std::vector<std::string> result;
    result.reserve(m_controllers.size());
    for (const auto& [kind, _] : m_controllers) {
        result.push_back(kind);
    }
    return result;
}

// =============================================================================
// Entrypoints
// =============================================================================

void ControllerRegistry::add_resolver(std::unique_ptr<EntrypointResolver> resolver) {
    if (resolver) {
        m_resolvers.push_back(std::move(resolver));
    }
}

void ControllerRegistry::clear() {
    m_controllers.clear();
    m_definitions.clear();
}

} // namespace manifold_kernel
