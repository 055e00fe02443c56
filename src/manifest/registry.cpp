/// @file registry.cpp
/// @brief Registry implementation

#include <manifold/manifest/registry.hpp>
#include <manifold/manifest/resource_uri.hpp>
#include <manifold/core/log.hpp>

#include <algorithm>

namespace manifold_manifest {

using manifold_core::Error;
using manifold_core::ErrorCode;
using manifold_core::Resource;
using manifold_core::ResourceId;

namespace {

void erase_id(std::vector<ResourceId>& ids, const ResourceId& id) {
    ids.erase(std::remove(ids.begin(), ids.end(), id), ids.end());
}

} // anonymous namespace

// =============================================================================
// Registration
// =============================================================================

std::string Registry::source_of(const Resource& resource) {
    auto uri = manifold_core::resource_uri(resource);
    if (!uri.empty()) {
        auto parsed = ResourceUri::parse(uri);
        if (parsed && parsed->is_file_source()) {
            return parsed->path();
        }
    }
    return manifold_core::resource_source(resource);
}

manifold_core::Result<void> Registry::register_resource(Resource resource) {
    auto shape = manifold_core::validate_resource_shape(resource);
    if (!shape) {
        return manifold_core::Err(shape.error());
    }
    ResourceId id = std::move(shape).value();

    auto& kind_map = m_resources[id.kind];
    if (kind_map.count(id.name) > 0) {
        return manifold_core::Err(Error(manifold_core::ResourceError::duplicate(id.kind, id.name)));
    }

    Entry entry;
    entry.uri = manifold_core::resource_uri(resource);
    entry.source = source_of(resource);
    entry.depth = manifold_core::resource_generation_depth(resource);
    entry.document = std::move(resource);

    if (!entry.uri.empty()) {
        m_uri_index[entry.uri] = id;
    }
    if (!entry.source.empty()) {
        m_source_index[entry.source].push_back(id);
    }
    m_depth_index[entry.depth].push_back(id);

    kind_map.emplace(id.name, std::move(entry));
    m_order.push_back(id);

    manifold_core::manifest_logger()->trace("Registered {}", id.to_string());
    return manifold_core::Ok();
}

manifold_core::Result<void> Registry::update(const ResourceId& id, Resource resource) {
    auto kind_it = m_resources.find(id.kind);
    if (kind_it == m_resources.end() || kind_it->second.count(id.name) == 0) {
        return manifold_core::Err(Error(manifold_core::ResourceError::not_found(id.kind, id.name)));
    }

    if (manifold_core::resource_id(resource) != id) {
        return manifold_core::Err(Error(ErrorCode::InvalidArgument,
            "Cannot change the identity of " + id.to_string() + " on update"));
    }

    auto& entry = kind_it->second.at(id.name);
    entry.document = std::move(resource);
    return manifold_core::Ok();
}

bool Registry::unregister(const ResourceId& id) {
    auto kind_it = m_resources.find(id.kind);
    if (kind_it == m_resources.end()) {
        return false;
    }
    auto it = kind_it->second.find(id.name);
    if (it == kind_it->second.end()) {
        return false;
    }

    const Entry& entry = it->second;
    if (!entry.uri.empty()) {
        auto uri_it = m_uri_index.find(entry.uri);
        if (uri_it != m_uri_index.end() && uri_it->second == id) {
            m_uri_index.erase(uri_it);
        }
    }
    if (!entry.source.empty()) {
        auto src_it = m_source_index.find(entry.source);
        if (src_it != m_source_index.end()) {
            erase_id(src_it->second, id);
            if (src_it->second.empty()) m_source_index.erase(src_it);
        }
    }
    auto depth_it = m_depth_index.find(entry.depth);
    if (depth_it != m_depth_index.end()) {
        erase_id(depth_it->second, id);
        if (depth_it->second.empty()) m_depth_index.erase(depth_it);
    }

    kind_it->second.erase(it);
    if (kind_it->second.empty()) {
        m_resources.erase(kind_it);
    }
    erase_id(m_order, id);

    manifold_core::manifest_logger()->trace("Unregistered {}", id.to_string());
    return true;
}

void Registry::clear() {
    m_resources.clear();
    m_order.clear();
    m_uri_index.clear();
    m_source_index.clear();
    m_depth_index.clear();
    m_kind_inheritance.clear();
}

// =============================================================================
// Queries
// =============================================================================

const Resource* Registry::get(const std::string& kind, const std::string& name) const {
    auto kind_it = m_resources.find(kind);
    if (kind_it == m_resources.end()) {
        return nullptr;
    }
    auto it = kind_it->second.find(name);
    return it != kind_it->second.end() ? &it->second.document : nullptr;
}

std::vector<const Resource*> Registry::get_by_kind(const std::string& kind) const {
    std::vector<const Resource*> out;
    for (const auto& id : m_order) {
        if (id.kind == kind) {
            out.push_back(get(id));
        }
    }
    return out;
}

const Resource* Registry::get_by_uri(const std::string& uri) const {
    auto it = m_uri_index.find(uri);
    return it != m_uri_index.end() ? get(it->second) : nullptr;
}

std::vector<const Resource*> Registry::get_by_source(const std::string& path) const {
    std::vector<const Resource*> out;
    auto it = m_source_index.find(path);
    if (it != m_source_index.end()) {
        for (const auto& id : it->second) {
            out.push_back(get(id));
        }
    }
    return out;
}

std::vector<const Resource*> Registry::get_by_generation_depth(int depth) const {
    std::vector<const Resource*> out;
    auto it = m_depth_index.find(depth);
    if (it != m_depth_index.end()) {
        for (const auto& id : it->second) {
            out.push_back(get(id));
        }
    }
    return out;
}

std::vector<const Resource*> Registry::get_template_generated() const {
    std::vector<const Resource*> out;
    for (const auto& [depth, ids] : m_depth_index) {
        if (depth <= 0) continue;
        for (const auto& id : ids) {
            out.push_back(get(id));
        }
    }
    return out;
}

std::vector<const Resource*> Registry::all() const {
    std::vector<const Resource*> out;
    out.reserve(m_order.size());
    for (const auto& id : m_order) {
        out.push_back(get(id));
    }
    return out;
}

std::set<int> Registry::generation_depths() const {
    std::set<int> out;
    for (const auto& [depth, ids] : m_depth_index) {
        out.insert(depth);
    }
    return out;
}

// =============================================================================
// Kind Inheritance
// =============================================================================

manifold_core::Result<void> Registry::set_parent_kind(const std::string& kind, const std::string& parent_kind) {
    for (const auto& ancestor : resolve_kind_chain(parent_kind)) {
        if (ancestor == kind) {
            return manifold_core::Err(Error(ErrorCode::InvalidArgument,
                "Kind " + kind + " cannot extend " + parent_kind + ": inheritance loop"));
        }
    }
    m_kind_inheritance[kind] = parent_kind;
    return manifold_core::Ok();
}

std::optional<std::string> Registry::parent_kind(const std::string& kind) const {
    auto it = m_kind_inheritance.find(kind);
    if (it == m_kind_inheritance.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::string> Registry::resolve_kind_chain(const std::string& kind) const {
    std::vector<std::string> chain{kind};
    std::string current = kind;
    auto it = m_kind_inheritance.find(current);
    while (it != m_kind_inheritance.end()) {
        current = it->second;
        chain.push_back(current);
        it = m_kind_inheritance.find(current);
    }
    return chain;
}

} // namespace manifold_manifest
