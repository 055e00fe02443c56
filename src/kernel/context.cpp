/// @file context.cpp
/// @brief ControllerContext and ResourceContext implementation

#include <manifold/kernel/context.hpp>
#include <manifold/kernel/kernel.hpp>
#include <manifold/expr/interpolate.hpp>
#include <manifold/manifest/schema.hpp>

namespace manifold_kernel {

using manifold_core::Resource;
using manifold_core::Result;
using nlohmann::json;

// =============================================================================
// ControllerContext
// =============================================================================

ControllerContext::ControllerContext(Kernel& kernel, std::string kind)
    : m_kernel(kernel)
    , m_kind(std::move(kind)) {}

Result<manifold_event::SubscriberId> ControllerContext::on(const std::string& pattern,
                                                           manifold_event::EventHandler handler) {
    return m_kernel.events().on(pattern, std::move(handler));
}

Result<manifold_event::SubscriberId> ControllerContext::once(const std::string& pattern,
                                                             manifold_event::EventHandler handler) {
    return m_kernel.events().once(pattern, std::move(handler));
}

bool ControllerContext::off(manifold_event::SubscriberId id) {
    return m_kernel.events().off(id);
}

Result<void> ControllerContext::emit(const std::string& event, json payload) {
    const std::string name = event.find('.') == std::string::npos ? m_kind + "." + event : event;
    return m_kernel.events().emit(name, std::move(payload));
}

manifold_event::HoldRelease ControllerContext::acquire_hold(const std::string& reason) {
    return m_kernel.acquire_hold(reason.empty() ? m_kind : reason);
}

void ControllerContext::request_exit(int code) {
    m_kernel.request_exit(code);
}

Result<json> ControllerContext::evaluate(const std::string& expression, const json& context) const {
    return m_kernel.evaluator().evaluate(expression, context).to_result(expression);
}

Result<json> ControllerContext::expand(const json& value, const json& context) const {
    return manifold_expr::expand_value(value, context, m_kernel.evaluator()).to_result(value.dump());
}

// =============================================================================
// ResourceContext
// =============================================================================

ResourceContext::ResourceContext(Kernel& kernel, Resource resource)
    : ControllerContext(kernel, manifold_core::resource_kind(resource))
    , m_resource(std::move(resource)) {}

Result<void> ResourceContext::validate(const json& value, const json& schema) const {
    if (schema.is_object() && schema.contains("type") && schema["type"].is_string()) {
        return manifold_manifest::SchemaValidator::validate(value, schema);
    }

    json required = json::array();
    if (schema.is_object()) {
        for (auto it = schema.begin(); it != schema.end(); ++it) {
            required.push_back(it.key());
        }
    }
    json wrapped = json::object();
    wrapped["type"] = "object";
    wrapped["properties"] = schema.is_object() ? schema : json::object();
    wrapped["required"] = std::move(required);
    wrapped["additionalProperties"] = false;
    return manifold_manifest::SchemaValidator::validate(value, wrapped);
}

std::vector<const Resource*> ResourceContext::get_resources(const std::string& kind) const {
    return m_kernel.registry().get_by_kind(kind);
}

const Resource* ResourceContext::get_resource(const std::string& kind, const std::string& name) const {
    return m_kernel.registry().get(kind, name);
}

InstancePtr ResourceContext::get_instance(const std::string& kind, const std::string& name) const {
    return m_kernel.instance(manifold_core::ResourceId{kind, name});
}

Result<void> ResourceContext::register_manifest(Resource resource) {
    const auto parent = id();
    return m_kernel.register_manifest(std::move(resource), &parent);
}

Result<void> ResourceContext::register_definition(ResourceDefinition definition) {
    return m_kernel.register_definition(std::move(definition));
}

Result<void> ResourceContext::register_controller(const std::string& kind, Controller controller) {
    return m_kernel.register_controller(kind, std::move(controller));
}

Result<json> ResourceContext::execute(const std::string& urn, const json& input) {
    return m_kernel.execute(urn, input);
}

Result<json> ResourceContext::invoke(const std::string& kind, const std::string& name, const json& input) {
    return m_kernel.invoke(kind, name, input);
}

Result<void> ResourceContext::emit_resource_event(const std::string& event, json payload) {
    const auto self = id();
    return m_kernel.emit_resource_event(self.kind, self.name, event, std::move(payload));
}

} // namespace manifold_kernel
