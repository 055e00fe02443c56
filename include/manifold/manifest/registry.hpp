#pragma once

/// @file registry.hpp
/// @brief Resource registry indexed by (Kind, Name)
///
/// The Registry owns every resource document of a boot:
///
/// 1. Primary index Kind -> Name -> document; (kind, name) is unique
/// 2. Registration order, used for stable discovery order
/// 3. Introspection indices by URI, source file and generation depth
/// 4. Kind inheritance (`extends`) declared by resource definitions
///
/// Secondary indices never affect correctness; they back snapshots and reload.

#include <manifold/core/error.hpp>
#include <manifold/core/resource.hpp>

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace manifold_manifest {

/// Registry of resource documents
///
/// Pointers returned by lookups stay valid until the resource is unregistered.
class Registry {
public:
    // =========================================================================
    // Construction
    // =========================================================================

    Registry() = default;

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;
    Registry(Registry&&) = default;
    Registry& operator=(Registry&&) = default;

    // =========================================================================
    // Registration
    // =========================================================================

    /// Register a resource
    ///
    /// @return ERR_INVALID_MANIFEST for a missing kind/name, ERR_DUPLICATE_RESOURCE
    ///         if (kind, name) is already present (the first registration is kept)
    [[nodiscard]] manifold_core::Result<void> register_resource(manifold_core::Resource resource);

    /// Replace the document of an existing resource (identity must not change)
    [[nodiscard]] manifold_core::Result<void> update(const manifold_core::ResourceId& id,
                                                    manifold_core::Resource resource);

    /// Remove a resource from every index
    ///
    /// @return true if it was registered
    bool unregister(const manifold_core::ResourceId& id);

    /// Remove everything, including kind inheritance
    void clear();

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] const manifold_core::Resource* get(const std::string& kind, const std::string& name) const;
    [[nodiscard]] const manifold_core::Resource* get(const manifold_core::ResourceId& id) const {
        return get(id.kind, id.name);
    }

    [[nodiscard]] bool contains(const manifold_core::ResourceId& id) const { return get(id) != nullptr; }

    /// All resources of one kind, in registration order
    [[nodiscard]] std::vector<const manifold_core::Resource*> get_by_kind(const std::string& kind) const;

    [[nodiscard]] const manifold_core::Resource* get_by_uri(const std::string& uri) const;

    /// Resources whose file URI points at `path`, in registration order
    [[nodiscard]] std::vector<const manifold_core::Resource*> get_by_source(const std::string& path) const;

    [[nodiscard]] std::vector<const manifold_core::Resource*> get_by_generation_depth(int depth) const;

    /// Resources with generation depth > 0
    [[nodiscard]] std::vector<const manifold_core::Resource*> get_template_generated() const;

    /// Resources with generation depth 0
    [[nodiscard]] std::vector<const manifold_core::Resource*> get_directly_loaded() const {
        return get_by_generation_depth(0);
    }

    /// Every resource, in registration order
    [[nodiscard]] std::vector<const manifold_core::Resource*> all() const;

    /// Every identity, in registration order
    [[nodiscard]] const std::vector<manifold_core::ResourceId>& ids() const noexcept { return m_order; }

    /// Distinct generation depths present
    [[nodiscard]] std::set<int> generation_depths() const;

    [[nodiscard]] std::size_t size() const noexcept { return m_order.size(); }
    [[nodiscard]] bool empty() const noexcept { return m_order.empty(); }

    // =========================================================================
    // Kind Inheritance
    // =========================================================================

    /// Record that `kind` extends `parent_kind`
    ///
    /// @return ERR_INVALID_ARGUMENT if this would create an inheritance loop
    [[nodiscard]] manifold_core::Result<void> set_parent_kind(const std::string& kind,
                                                             const std::string& parent_kind);

    [[nodiscard]] std::optional<std::string> parent_kind(const std::string& kind) const;

    /// `kind` followed by each ancestor, nearest first
    [[nodiscard]] std::vector<std::string> resolve_kind_chain(const std::string& kind) const;

private:
    struct Entry {
        manifold_core::Resource document;
        std::string uri;
        std::string source;
        int depth = 0;
    };

    static std::string source_of(const manifold_core::Resource& resource);

    std::map<std::string, std::map<std::string, Entry>> m_resources;
    std::vector<manifold_core::ResourceId> m_order;
    std::map<std::string, manifold_core::ResourceId> m_uri_index;
    std::map<std::string, std::vector<manifold_core::ResourceId>> m_source_index;
    std::map<int, std::vector<manifold_core::ResourceId>> m_depth_index;
    std::map<std::string, std::string> m_kind_inheritance;
};

} // namespace manifold_manifest
