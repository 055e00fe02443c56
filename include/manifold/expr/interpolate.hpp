#pragma once

/// @file interpolate.hpp
/// @brief `${{ expr }}` string interpolation

#include "evaluator.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace manifold_expr {

/// One `${{ ... }}` occurrence in a string
struct Interpolation {
    std::size_t begin = 0;      ///< Offset of '$'
    std::size_t length = 0;     ///< Length of the whole `${{ ... }}` text
    std::string expression;     ///< Trimmed inner expression
};

/// All interpolations in `text`, left to right
[[nodiscard]] std::vector<Interpolation> find_interpolations(const std::string& text);

/// Whether `text` contains at least one interpolation
[[nodiscard]] bool has_interpolation(const std::string& text);

/// Inner expression when `text` is exactly one interpolation with no surrounding text
[[nodiscard]] std::optional<std::string> exact_interpolation(const std::string& text);

/// @brief Expand one string
///
/// Exactly one interpolation yields the typed value (or Deferred). A string mixing text
/// and interpolations yields a string; deferred parts are kept verbatim so they can be
/// resolved later.
[[nodiscard]] EvalOutcome expand_string(const std::string& text, const nlohmann::json& context,
                                        const Evaluator& evaluator);

/// @brief Expand every string inside `value`, descending lists and maps
///
/// Never returns Deferred: deferred strings are left untouched.
[[nodiscard]] EvalOutcome expand_value(const nlohmann::json& value, const nlohmann::json& context,
                                       const Evaluator& evaluator);

/// Whether any string inside `value` still carries an interpolation
[[nodiscard]] bool contains_interpolation(const nlohmann::json& value);

} // namespace manifold_expr
