#pragma once

/// @file resource_uri.hpp
/// @brief Provenance URIs for resources
///
/// Formats:
/// - `file://localhost/abs/path.json#Kind.Name` for resources loaded from a file
/// - `template://Template#Kind.Name` for a first-level expansion without a parent URI
/// - `<parent>/Kind.Name` for every further expansion level

#include <manifold/core/error.hpp>
#include <manifold/core/resource.hpp>

#include <string>
#include <vector>

namespace manifold_manifest {

class ResourceUri {
public:
    enum class Scheme : std::uint8_t {
        File,
        Template,
    };

    ResourceUri() = default;

    [[nodiscard]] static ResourceUri from_file(const std::string& path, const std::string& kind,
                                               const std::string& name);
    [[nodiscard]] static ResourceUri from_template(const std::string& template_name, const std::string& kind,
                                                   const std::string& name);
    [[nodiscard]] static manifold_core::Result<ResourceUri> parse(const std::string& text);

    /// Append one lineage segment
    [[nodiscard]] ResourceUri with_child(const std::string& kind, const std::string& name) const;

    [[nodiscard]] Scheme scheme() const noexcept { return m_scheme; }
    [[nodiscard]] bool is_file_source() const noexcept { return m_scheme == Scheme::File; }

    /// File path for file URIs, template name for template URIs
    [[nodiscard]] const std::string& path() const noexcept { return m_path; }

    /// Lineage from the root resource to this one
    [[nodiscard]] const std::vector<manifold_core::ResourceId>& lineage() const noexcept { return m_lineage; }

    /// Identity of the resource this URI names
    [[nodiscard]] manifold_core::ResourceId leaf() const;

    [[nodiscard]] std::size_t depth() const noexcept { return m_lineage.empty() ? 0 : m_lineage.size() - 1; }

    [[nodiscard]] std::string to_string() const;

private:
    Scheme m_scheme = Scheme::File;
    std::string m_path;
    std::vector<manifold_core::ResourceId> m_lineage;
};

} // namespace manifold_manifest
