#pragma once

/// @file evaluator.hpp
/// @brief Expression evaluation over JSON contexts
///
/// The evaluator implements a CEL-style subset:
/// - literals, list and map literals, identifiers, member and index access
/// - `! -`, `+ - * / %`, comparisons, `in`, `&& ||`, `?:`
/// - functions `size has string int double type`
/// - methods `size startsWith endsWith contains lowerAscii upperAscii`
/// - macros `map filter exists all`
///
/// Evaluation never throws. An identifier that is missing from the context is
/// reported as Deferred when its root is one of EvalOptions::deferred_roots.

#include "ast.hpp"

#include <manifold/core/error.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>

namespace manifold_expr {

// =============================================================================
// EvalOutcome
// =============================================================================

/// Expression produced a value
struct Resolved {
    nlohmann::json value;
};

/// Expression references a root that is only bound later (e.g. `request`)
struct Deferred {
    std::string identifier;
};

/// Syntax or evaluation error
struct EvalFailure {
    std::string message;
};

/// Typed evaluation result
class EvalOutcome {
public:
    using Variant = std::variant<Resolved, Deferred, EvalFailure>;

    EvalOutcome(Resolved r) : m_outcome(std::move(r)) {}
    EvalOutcome(Deferred d) : m_outcome(std::move(d)) {}
    EvalOutcome(EvalFailure f) : m_outcome(std::move(f)) {}

    [[nodiscard]] static EvalOutcome resolved(nlohmann::json value) { return Resolved{std::move(value)}; }
    [[nodiscard]] static EvalOutcome deferred(std::string identifier) { return Deferred{std::move(identifier)}; }
    [[nodiscard]] static EvalOutcome failure(std::string message) { return EvalFailure{std::move(message)}; }

    [[nodiscard]] bool is_resolved() const noexcept { return std::holds_alternative<Resolved>(m_outcome); }
    [[nodiscard]] bool is_deferred() const noexcept { return std::holds_alternative<Deferred>(m_outcome); }
    [[nodiscard]] bool is_error() const noexcept { return std::holds_alternative<EvalFailure>(m_outcome); }

    /// Value (Resolved only)
    [[nodiscard]] const nlohmann::json& value() const { return std::get<Resolved>(m_outcome).value; }
    [[nodiscard]] nlohmann::json take_value() { return std::move(std::get<Resolved>(m_outcome).value); }

    /// Deferred root identifier (Deferred only)
    [[nodiscard]] const std::string& identifier() const { return std::get<Deferred>(m_outcome).identifier; }

    /// Error message (EvalFailure only)
    [[nodiscard]] const std::string& message() const { return std::get<EvalFailure>(m_outcome).message; }

    [[nodiscard]] const Variant& variant() const noexcept { return m_outcome; }

    /// Convert to a Result; Deferred becomes an ERR_EXPRESSION naming the identifier
    [[nodiscard]] manifold_core::Result<nlohmann::json> to_result(const std::string& expression,
                                                                 const std::string& resource = {}) const;

private:
    Variant m_outcome;
};

// =============================================================================
// Evaluator
// =============================================================================

/// Evaluation options
struct EvalOptions {
    /// Roots whose absence means "not yet available" rather than an error
    std::set<std::string> deferred_roots;
};

/// @brief Parses and evaluates expressions, caching parsed trees
class Evaluator {
public:
    explicit Evaluator(EvalOptions options = {});

    /// @brief Evaluate `expression` against `context` (a JSON object of root bindings)
    [[nodiscard]] EvalOutcome evaluate(std::string_view expression, const nlohmann::json& context) const;

    /// @brief Parse only, reporting syntax errors
    [[nodiscard]] manifold_core::Result<void> check_syntax(std::string_view expression) const;

    [[nodiscard]] const EvalOptions& options() const noexcept { return m_options; }

    [[nodiscard]] std::size_t cache_size() const;
    void clear_cache();

private:
    /// nullptr on syntax error (error message written to `error`)
    std::shared_ptr<const Expression> parse(std::string_view expression, std::string& error) const;

    EvalOptions m_options;
    mutable std::mutex m_cache_mutex;
    mutable std::unordered_map<std::string, std::shared_ptr<const Expression>> m_cache;
};

/// @brief One-shot evaluation without caching
[[nodiscard]] EvalOutcome evaluate(std::string_view expression, const nlohmann::json& context,
                                   const EvalOptions& options = {});

// =============================================================================
// Value Helpers
// =============================================================================

/// false, null, 0 and "" are falsy; everything else (including [] and {}) is truthy
[[nodiscard]] bool is_truthy(const nlohmann::json& value);

/// Text form used when a value is spliced into a string: strings verbatim,
/// null as "", integral doubles without a fraction, lists and maps as compact JSON
[[nodiscard]] std::string stringify(const nlohmann::json& value);

} // namespace manifold_expr
