#pragma once

/// @file resolution.hpp
/// @brief Registry-wide `${{ }}` resolution
///
/// After template expansion every resource is exposed to expressions under its
/// Kind split on '.', e.g. `Http.Server.api.port`, plus an allow-listed `env`.
/// Resolution repeats until a pass changes nothing. Expressions rooted at a
/// deferred namespace (`request`, `result`) stay verbatim.

#include <manifold/core/error.hpp>
#include <manifold/core/resource.hpp>
#include <manifold/expr/evaluator.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace manifold_manifest {

struct ResolutionConfig {
    int max_passes = 5;
    std::vector<std::string> env_allowlist{"NODE_ENV", "PORT", "HOST", "PATH", "HOME", "USER", "LANG"};
    std::string module_name;   ///< Exposed under `Namespace.<module>` when set
};

class ExpressionResolver {
public:
    ExpressionResolver(const manifold_expr::Evaluator& evaluator, ResolutionConfig config = {});

    /// Evaluation context over `resources`
    [[nodiscard]] nlohmann::json build_context(const std::vector<const manifold_core::Resource*>& resources) const;

    /// Resolve every resource to a fixed point
    ///
    /// @return ERR_EXPRESSION naming the resource on the first fatal expression, or when
    ///         expressions still change after `max_passes`
    [[nodiscard]] manifold_core::Result<std::vector<manifold_core::Resource>> resolve_all(
        std::vector<manifold_core::Resource> resources) const;

    /// Resolve one resource against a prebuilt context
    ///
    /// `kind`, `metadata.name` and the `resources`/`schema` of a TemplateDefinition are left alone.
    [[nodiscard]] manifold_core::Result<manifold_core::Resource> resolve(const manifold_core::Resource& resource,
                                                                       const nlohmann::json& context,
                                                                       bool* changed = nullptr) const;

    [[nodiscard]] const ResolutionConfig& config() const noexcept { return m_config; }

private:
    manifold_core::Result<nlohmann::json> resolve_value(const nlohmann::json& value, const nlohmann::json& context,
                                                        const manifold_core::ResourceId& id, bool& changed) const;

    const manifold_expr::Evaluator& m_evaluator;
    ResolutionConfig m_config;
};

} // namespace manifold_manifest
