#pragma once

/// @file loader.hpp
/// @brief JSON manifest loading
///
/// A manifest file holds one resource object, a list of them, or an object
/// with a `resources` list. Every loaded resource is stamped with:
/// - `metadata.source` - absolute path of the file
/// - `metadata.uri` - `file://localhost<path>#Kind.Name`
/// - `metadata.generationDepth` - 0
/// - `metadata.module` - the configured module unless already set

#include <manifold/core/error.hpp>
#include <manifold/core/resource.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace manifold_manifest {

struct LoaderConfig {
    std::string module_name;    ///< Replaces `Self.` and qualifies local template kinds
};

class Loader {
public:
    explicit Loader(LoaderConfig config = {});

    /// Load one manifest file
    [[nodiscard]] manifold_core::Result<std::vector<manifold_core::Resource>> load_file(
        const std::filesystem::path& path) const;

    /// Load every `*.json` file of a directory, sorted by file name
    [[nodiscard]] manifold_core::Result<std::vector<manifold_core::Resource>> load_directory(
        const std::filesystem::path& dir) const;

    /// File or directory
    [[nodiscard]] manifold_core::Result<std::vector<manifold_core::Resource>> load(
        const std::filesystem::path& path) const;

    /// Parse manifest text as if read from `source`
    [[nodiscard]] manifold_core::Result<std::vector<manifold_core::Resource>> parse(
        const std::string& text, const std::filesystem::path& source) const;

    /// Expand `${VAR}` references from the environment
    ///
    /// @return ERR_INVALID_ARGUMENT naming the first unset variable
    [[nodiscard]] static manifold_core::Result<std::string> expand_env_path(const std::string& path);

    /// `relative` against the directory `base` unless already absolute
    [[nodiscard]] static std::filesystem::path resolve_path(const std::filesystem::path& base,
                                                            const std::string& relative);

    [[nodiscard]] const LoaderConfig& config() const noexcept { return m_config; }

private:
    void normalize_kind(manifold_core::Resource& resource, const std::vector<std::string>& template_names) const;

    LoaderConfig m_config;
};

} // namespace manifold_manifest
