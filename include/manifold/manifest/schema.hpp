#pragma once

/// @file schema.hpp
/// @brief Structural validation of resources against controller schemas
///
/// Supports the JSON-Schema keywords controllers actually declare:
/// `type` (string or list), `properties`, `required`, `additionalProperties`
/// (bool or schema), `items`, `enum`, `minimum`, `maximum`, `minItems`, `default`.

#include <manifold/core/error.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace manifold_manifest {

class SchemaValidator {
public:
    /// Validate `value`, collecting every violation
    ///
    /// @return ERR_SCHEMA_VALIDATION listing each violation as "<path>: <problem>"
    [[nodiscard]] static manifold_core::Result<void> validate(const nlohmann::json& value,
                                                             const nlohmann::json& schema);

    /// Violations only, empty when valid
    [[nodiscard]] static std::vector<std::string> violations(const nlohmann::json& value,
                                                            const nlohmann::json& schema);

    /// Fill absent object properties from their `default`, recursively
    static void apply_defaults(nlohmann::json& value, const nlohmann::json& schema);

    /// Whether `schema` declares a `type`
    [[nodiscard]] static bool has_type(const nlohmann::json& schema);

private:
    static void check(const nlohmann::json& value, const nlohmann::json& schema,
                      const std::string& path, std::vector<std::string>& errors);

    static bool matches_type(const nlohmann::json& value, const std::string& type);
};

} // namespace manifold_manifest
