/// @file controller.cpp
/// @brief ResourceInstance defaults and ResourceDefinition construction

#include <manifold/kernel/controller.hpp>

namespace manifold_kernel {

using manifold_core::Err;
using manifold_core::Error;
using manifold_core::ErrorCode;
using manifold_core::Ok;
using manifold_core::Resource;
using manifold_core::Result;

// =============================================================================
// ResourceInstance
// =============================================================================

Result<nlohmann::json> ResourceInstance::invoke(const nlohmann::json& /*input*/) {
    return Err<nlohmann::json>(Error(ErrorCode::ResourceNotInvokable, "Resource does not have an invoke method"));
}

// =============================================================================
// ResourceDefinition
// =============================================================================

Result<ResourceDefinition> ResourceDefinition::from_resource(const Resource& resource) {
    auto shape = manifold_core::validate_resource_shape(resource);
    if (!shape) {
        return Err<ResourceDefinition>(std::move(shape.error()));
    }

    const auto& metadata = resource["metadata"];
    const std::string name = shape->name;

    ResourceDefinition def;
    def.module = manifold_core::resource_module(resource);
    def.source = manifold_core::resource_source(resource);

    auto rk = metadata.find("resourceKind");
    if (rk != metadata.end()) {
        if (!rk->is_string() || rk->get<std::string>().empty()) {
            return Err<ResourceDefinition>(Error(ErrorCode::InvalidManifest,
                "Invalid ResourceDefinition \"" + name + "\": metadata.resourceKind must be a non-empty string"));
        }
        def.resource_kind = rk->get<std::string>();
    } else {
        def.resource_kind = name;
    }

    if (!def.module.empty() && def.resource_kind.find('.') == std::string::npos) {
        def.kind = def.module + "." + def.resource_kind;
    } else {
        def.kind = def.resource_kind;
    }

    auto schema = resource.find("schema");
    if (schema != resource.end()) {
        if (!schema->is_object()) {
            return Err<ResourceDefinition>(Error(ErrorCode::InvalidManifest,
                "Invalid ResourceDefinition \"" + name + "\": schema must be an object"));
        }
        def.schema = *schema;
    }

    auto controllers = resource.find("controllers");
    if (controllers != resource.end()) {
        if (!controllers->is_array()) {
            return Err<ResourceDefinition>(Error(ErrorCode::InvalidManifest,
                "Invalid ResourceDefinition \"" + name + "\": controllers must be a list"));
        }
        for (const auto& entry : *controllers) {
            if (entry.is_string()) {
                def.controllers.push_back(entry.get<std::string>());
            } else if (entry.is_object() && entry.contains("entry") && entry["entry"].is_string()) {
                def.controllers.push_back(entry["entry"].get<std::string>());
            } else {
                return Err<ResourceDefinition>(Error(ErrorCode::InvalidManifest,
                    "Invalid ResourceDefinition \"" + name + "\": controller entries must be strings"));
            }
        }
    }

    auto extends = resource.find("extends");
    if (extends != resource.end() && !extends->is_null()) {
        if (!extends->is_string()) {
            return Err<ResourceDefinition>(Error(ErrorCode::InvalidManifest,
                "Invalid ResourceDefinition \"" + name + "\": extends must be a kind name"));
        }
        def.extends = extends->get<std::string>();
    }

    return Ok(std::move(def));
}

ResourceDefinition ResourceDefinition::for_kind(const std::string& kind, nlohmann::json schema) {
    ResourceDefinition def;
    def.kind = kind;
    auto dot = kind.rfind('.');
    if (dot != std::string::npos) {
        def.module = kind.substr(0, dot);
        def.resource_kind = kind.substr(dot + 1);
    } else {
        def.resource_kind = kind;
    }
    def.schema = std::move(schema);
    return def;
}

} // namespace manifold_kernel
