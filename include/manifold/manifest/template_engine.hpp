#pragma once

/// @file template_engine.hpp
/// @brief TemplateDefinition instantiation
///
/// A TemplateDefinition carries a parameter `schema` and an ordered list of
/// resource blueprints. Any resource whose kind names a template (directly, or
/// as `<Module>.<Template>`) is an instance of it: its non-`kind`/`metadata`
/// fields are the parameters.
///
/// Blueprint expansion order:
/// 1. `if` - falsy contributes nothing
/// 2. `for` - "x in expr" or "k, v in expr"; a list of clauses nests outer to inner
/// 3. field interpolation; `resources`/`schema` of a nested TemplateDefinition stay literal
///
/// Instances produced by an expansion are expanded again on the next pass.

#include <manifold/core/error.hpp>
#include <manifold/core/resource.hpp>
#include <manifold/expr/evaluator.hpp>

#include <nlohmann/json.hpp>

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace manifold_manifest {

// =============================================================================
// Configuration
// =============================================================================

struct TemplateEngineConfig {
    int max_depth = 10;         ///< Instantiation at depth >= max_depth fails
    int max_passes = 10;        ///< Worklist passes before giving up
    std::string module_name;    ///< Extra `<module>.<Template>` alias for every template
};

// =============================================================================
// ForClause
// =============================================================================

/// Parsed `for` directive
struct ForClause {
    std::string first;          ///< Item (list) or key (map); index in the two-variable list form
    std::string second;         ///< Element or value in the two-variable form, empty otherwise
    std::string collection;     ///< Collection expression

    [[nodiscard]] bool has_second() const noexcept { return !second.empty(); }
};

/// Looks up templates that are not part of the resource list being expanded
using TemplateLookup = std::function<const manifold_core::Resource*(const std::string& kind)>;

// =============================================================================
// TemplateEngine
// =============================================================================

class TemplateEngine {
public:
    explicit TemplateEngine(const manifold_expr::Evaluator& evaluator, TemplateEngineConfig config = {});

    /// Expand one instance of `template_def`
    ///
    /// @param parameters instance fields other than kind/metadata
    /// @param instance_name name of the instance (diagnostics)
    /// @param depth generation depth of the instance
    /// @param parent_uri URI of the instance, empty for none
    /// @param module module inherited by produced resources without one
    [[nodiscard]] manifold_core::Result<std::vector<manifold_core::Resource>> instantiate(
        const manifold_core::Resource& template_def,
        const nlohmann::json& parameters,
        const std::string& instance_name,
        int depth,
        const std::string& parent_uri = {},
        const std::string& module = {}) const;

    /// Expand every template instance in `resources` until none remain
    ///
    /// Non-instances are returned first in input order, followed by generated resources.
    /// TemplateDefinitions are kept in the output.
    [[nodiscard]] manifold_core::Result<std::vector<manifold_core::Resource>> expand_all(
        std::vector<manifold_core::Resource> resources,
        const TemplateLookup& external = {}) const;

    /// Parse "x in expr" / "k, v in expr"
    [[nodiscard]] static manifold_core::Result<ForClause> parse_for(const std::string& text);

    /// `default` of every property in a parameter schema
    [[nodiscard]] static nlohmann::json schema_defaults(const nlohmann::json& schema);

    /// Kinds under which `template_def` can be instantiated
    [[nodiscard]] std::vector<std::string> template_aliases(const manifold_core::Resource& template_def) const;

    [[nodiscard]] const TemplateEngineConfig& config() const noexcept { return m_config; }

private:
    struct Frame {
        std::string template_name;
        int depth = 0;
        std::string parent_uri;
        std::string module;
    };

    manifold_core::Result<void> expand_blueprint(const nlohmann::json& blueprint, const nlohmann::json& context,
                                                 const Frame& frame, std::vector<manifold_core::Resource>& out) const;

    manifold_core::Result<void> expand_for(const nlohmann::json& blueprint, const std::vector<std::string>& clauses,
                                           std::size_t index, const nlohmann::json& context, const Frame& frame,
                                           const std::function<manifold_core::Result<void>(
                                               const nlohmann::json&)>& emit) const;

    manifold_core::Result<manifold_core::Resource> expand_single(const nlohmann::json& blueprint,
                                                                 const nlohmann::json& context,
                                                                 const Frame& frame) const;

    manifold_core::Result<nlohmann::json> expand_field(const nlohmann::json& value, const nlohmann::json& context,
                                                       const Frame& frame) const;

    manifold_core::Result<void> expand_property_item(const nlohmann::json& item, const nlohmann::json& context,
                                                     const Frame& frame, nlohmann::json& out) const;

    manifold_core::Result<nlohmann::json> evaluate_directive(const nlohmann::json& directive,
                                                             const nlohmann::json& context,
                                                             const Frame& frame) const;

    manifold_core::Error template_error(manifold_core::TemplateError err, const std::string& instance = {}) const;

    const manifold_expr::Evaluator& m_evaluator;
    TemplateEngineConfig m_config;
};

} // namespace manifold_manifest
