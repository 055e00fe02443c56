#pragma once

/// @file resource.hpp
/// @brief Resource documents and identities

#include "error.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <string>
#include <string_view>

namespace manifold_core {

/// A resource document: `{ kind, metadata: { name, module, ... }, ... }`.
/// Object keys are kept in nlohmann's default (sorted) order.
using Resource = nlohmann::json;

// =============================================================================
// ResourceId
// =============================================================================

/// Identity of a resource within one boot
struct ResourceId {
    std::string kind;
    std::string name;

    ResourceId() = default;
    ResourceId(std::string k, std::string n) : kind(std::move(k)), name(std::move(n)) {}

    /// "Kind.Name"
    [[nodiscard]] std::string to_string() const { return kind + "." + name; }

    /// Split "Kind.Name" on the last '.'; kind may itself contain dots
    [[nodiscard]] static Result<ResourceId> parse(std::string_view urn);

    bool operator==(const ResourceId& other) const {
        return kind == other.kind && name == other.name;
    }
    bool operator!=(const ResourceId& other) const { return !(*this == other); }
    bool operator<(const ResourceId& other) const {
        return kind < other.kind || (kind == other.kind && name < other.name);
    }
};

struct ResourceIdHash {
    std::size_t operator()(const ResourceId& id) const noexcept {
        std::size_t h = std::hash<std::string>{}(id.kind);
        return h ^ (std::hash<std::string>{}(id.name) + 0x9e3779b9 + (h << 6) + (h >> 2));
    }
};

// =============================================================================
// Document Accessors
// =============================================================================

/// Well-known kind names
inline constexpr const char* k_template_definition_kind = "TemplateDefinition";

/// `kind` field, or empty if missing / not a string
[[nodiscard]] std::string resource_kind(const Resource& resource);

/// `metadata.name` field, or empty if missing / not a string
[[nodiscard]] std::string resource_name(const Resource& resource);

/// `metadata.module` field, or empty
[[nodiscard]] std::string resource_module(const Resource& resource);

/// `metadata.uri` field, or empty
[[nodiscard]] std::string resource_uri(const Resource& resource);

/// `metadata.source` field, or empty
[[nodiscard]] std::string resource_source(const Resource& resource);

/// `metadata.generationDepth`, 0 when absent
[[nodiscard]] int resource_generation_depth(const Resource& resource);

/// Identity of a document (fields may be empty)
[[nodiscard]] ResourceId resource_id(const Resource& resource);

/// Require an object with non-empty string `kind` and `metadata.name`
[[nodiscard]] Result<ResourceId> validate_resource_shape(const Resource& resource);

/// Mutable access to `metadata`, created as an object if absent
Resource& ensure_metadata(Resource& resource);

/// Whether `kind` is TemplateDefinition
[[nodiscard]] bool is_template_definition(const Resource& resource);

/// Short JSON type name ("null", "bool", "int", "double", "string", "list", "map")
[[nodiscard]] const char* json_type_name(const nlohmann::json& value);

} // namespace manifold_core
