/// @file resource.cpp
/// @brief Resource document accessors

#include <manifold/core/resource.hpp>

namespace manifold_core {

namespace {

std::string metadata_string(const Resource& resource, const char* key) {
    if (!resource.is_object()) {
        return {};
    }
    auto meta = resource.find("metadata");
    if (meta == resource.end() || !meta->is_object()) {
        return {};
    }
    auto it = meta->find(key);
    if (it == meta->end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

} // anonymous namespace

Result<ResourceId> ResourceId::parse(std::string_view urn) {
    auto dot = urn.rfind('.');
    if (dot == std::string_view::npos || dot == 0 || dot + 1 == urn.size()) {
        return Err<ResourceId>(Error(ErrorCode::InvalidArgument,
            "Invalid resource identifier \"" + std::string(urn) + "\", expected Kind.Name"));
    }
    return Ok(ResourceId{std::string(urn.substr(0, dot)), std::string(urn.substr(dot + 1))});
}

std::string resource_kind(const Resource& resource) {
    if (!resource.is_object()) {
        return {};
    }
    auto it = resource.find("kind");
    if (it == resource.end() || !it->is_string()) {
        return {};
    }
    return it->get<std::string>();
}

std::string resource_name(const Resource& resource) {
    return metadata_string(resource, "name");
}

std::string resource_module(const Resource& resource) {
    return metadata_string(resource, "module");
}

std::string resource_uri(const Resource& resource) {
    return metadata_string(resource, "uri");
}

std::string resource_source(const Resource& resource) {
    return metadata_string(resource, "source");
}

int resource_generation_depth(const Resource& resource) {
    if (!resource.is_object()) {
        return 0;
    }
    auto meta = resource.find("metadata");
    if (meta == resource.end() || !meta->is_object()) {
        return 0;
    }
    auto it = meta->find("generationDepth");
    if (it == meta->end() || !it->is_number_integer()) {
        return 0;
    }
    return it->get<int>();
}

ResourceId resource_id(const Resource& resource) {
    return ResourceId{resource_kind(resource), resource_name(resource)};
}

Result<ResourceId> validate_resource_shape(const Resource& resource) {
    if (!resource.is_object()) {
        return Err<ResourceId>(Error(ErrorCode::InvalidManifest,
            std::string("Resource must be an object, got ") + json_type_name(resource)));
    }
    auto id = resource_id(resource);
    if (id.kind.empty()) {
        return Err<ResourceId>(Error(ErrorCode::InvalidManifest,
            "Resource is missing a string 'kind': " + resource.dump()));
    }
    if (id.name.empty()) {
        return Err<ResourceId>(Error(ErrorCode::InvalidManifest,
            "Resource of kind " + id.kind + " is missing a string 'metadata.name'"));
    }
    return Ok(std::move(id));
}

Resource& ensure_metadata(Resource& resource) {
    auto& meta = resource["metadata"];
    if (!meta.is_object()) {
        meta = nlohmann::json::object();
    }
    return meta;
}

bool is_template_definition(const Resource& resource) {
    return resource_kind(resource) == k_template_definition_kind;
}

const char* json_type_name(const nlohmann::json& value) {
    switch (value.type()) {
        case nlohmann::json::value_t::null: return "null";
        case nlohmann::json::value_t::boolean: return "bool";
        case nlohmann::json::value_t::number_integer:
        case nlohmann::json::value_t::number_unsigned: return "int";
        case nlohmann::json::value_t::number_float: return "double";
        case nlohmann::json::value_t::string: return "string";
        case nlohmann::json::value_t::array: return "list";
        case nlohmann::json::value_t::object: return "map";
        default: return "unknown";
    }
}

} // namespace manifold_core
