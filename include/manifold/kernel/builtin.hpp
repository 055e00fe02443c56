/// @file builtin.hpp
/// @brief Kinds every kernel understands without any manifest
///
/// - `Runtime.Definition` declares a kind: schema, controller entrypoints, `extends`
/// - `Runtime.Module` loads further manifests (`imports`, `definitions`, `resources`)
///   relative to its own file and registers them as its children
/// - `TemplateDefinition` is passive; templates are expanded before discovery

#pragma once

#include "controller_registry.hpp"

#include <manifold/core/error.hpp>

namespace manifold_kernel {

inline constexpr const char* k_definition_kind = "Runtime.Definition";
inline constexpr const char* k_module_kind = "Runtime.Module";

[[nodiscard]] Controller definition_controller();
[[nodiscard]] Controller module_controller();
[[nodiscard]] Controller template_controller();

/// Define and bind the three built-in kinds
[[nodiscard]] manifold_core::Result<void> register_builtin_kinds(ControllerRegistry& registry);

} // namespace manifold_kernel
