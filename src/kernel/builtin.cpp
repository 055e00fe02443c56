/// @file builtin.cpp
/// @brief Runtime.Definition, Runtime.Module and TemplateDefinition controllers

#include <manifold/kernel/builtin.hpp>
#include <manifold/kernel/context.hpp>
#include <manifold/core/log.hpp>
#include <manifold/manifest/loader.hpp>
#include <manifold/manifest/resource_uri.hpp>

#include <filesystem>
#include <vector>

namespace manifold_kernel {

using manifold_core::Err;
using manifold_core::Error;
using manifold_core::ErrorCode;
using manifold_core::Ok;
using manifold_core::Resource;
using manifold_core::Result;
using nlohmann::json;

namespace {

// =============================================================================
// Runtime.Definition
// =============================================================================

class DefinitionInstance : public ResourceInstance {
public:
    DefinitionInstance(ResourceDefinition definition, ResourceContext ctx)
        : m_definition(std::move(definition))
        , m_ctx(std::move(ctx)) {}

    Result<void> init() override {
        return m_ctx.register_definition(m_definition);
    }

    std::optional<json> snapshot() const override {
        json out = json::object();
        out["kind"] = m_definition.kind;
        out["controllers"] = m_definition.controllers;
        if (!m_definition.extends.empty()) {
            out["extends"] = m_definition.extends;
        }
        return out;
    }

private:
    ResourceDefinition m_definition;
    ResourceContext m_ctx;
};

// =============================================================================
// Runtime.Module
// =============================================================================

std::filesystem::path module_base_dir(const Resource& resource) {
    auto source = manifold_core::resource_source(resource);
    if (source.empty()) {
        auto uri = manifold_manifest::ResourceUri::parse(manifold_core::resource_uri(resource));
        if (uri && uri->is_file_source()) {
            source = uri->path();
        }
    }
    if (source.empty()) {
        std::error_code ec;
        auto cwd = std::filesystem::current_path(ec);
        return ec ? std::filesystem::path(".") : cwd;
    }
    return std::filesystem::path(source).parent_path();
}

Result<std::string> entry_path(const json& entry, const std::string& field, const std::string& module) {
    if (entry.is_string()) {
        return manifold_manifest::Loader::expand_env_path(entry.get<std::string>());
    }
    if (entry.is_object() && entry.contains("path") && entry["path"].is_string()) {
        return manifold_manifest::Loader::expand_env_path(entry["path"].get<std::string>());
    }
    return Err<std::string>(Error(ErrorCode::InvalidManifest,
        "Module " + module + ": entries of '" + field + "' must be a path or {path}"));
}

Result<void> load_section(const Resource& resource, const std::string& field,
                          const manifold_manifest::Loader& loader, const std::filesystem::path& base,
                          std::vector<Resource>& out) {
    auto it = resource.find(field);
    if (it == resource.end() || it->is_null()) {
        return Ok();
    }

    const std::string module = manifold_core::resource_name(resource);
    json entries = it->is_array() ? *it : json::array({*it});

    for (const auto& entry : entries) {
        auto relative = entry_path(entry, field, module);
        if (!relative) {
            return Err(relative.error());
        }
        auto path = manifold_manifest::Loader::resolve_path(base, *relative);
        auto loaded = loader.load(path);
        if (!loaded) {
            auto error = loaded.error();
            error.with_context("module", module);
            return Err(std::move(error));
        }
        manifold_core::kernel_logger()->debug("Module {} loaded {} resource(s) from {}",
                                              module, loaded->size(), path.string());
        for (auto& doc : *loaded) {
            out.push_back(std::move(doc));
        }
    }
    return Ok();
}

/// Loads every section before registering anything, so a failed create leaves
/// nothing behind for the next discovery pass to trip over
Result<void> import_module(const Resource& resource, ResourceContext& ctx) {
    manifold_manifest::Loader loader(manifold_manifest::LoaderConfig{manifold_core::resource_name(resource)});
    const auto base = module_base_dir(resource);

    std::vector<Resource> documents;
    for (const char* field : {"imports", "definitions", "resources"}) {
        auto loaded = load_section(resource, field, loader, base, documents);
        if (!loaded) {
            return loaded;
        }
    }

    for (const auto& doc : documents) {
        const auto id = manifold_core::resource_id(doc);
        if (ctx.get_resource(id.kind, id.name) != nullptr) {
            return Err(Error(manifold_core::ResourceError::duplicate(id.kind, id.name)));
        }
    }

    for (auto& doc : documents) {
        auto registered = ctx.register_manifest(std::move(doc));
        if (!registered) {
            return registered;
        }
    }
    return Ok();
}

json module_schema() {
    json list_of_paths = {{"type", "array"}};
    return {
        {"type", "object"},
        {"additionalProperties", true},
        {"properties", {
            {"imports", list_of_paths},
            {"definitions", list_of_paths},
            {"resources", list_of_paths},
        }},
    };
}

} // anonymous namespace

// =============================================================================
// Controllers
// =============================================================================

Controller definition_controller() {
    Controller controller;
    controller.with_create([](const Resource& resource, ResourceContext& ctx) -> Result<InstancePtr> {
        auto definition = ResourceDefinition::from_resource(resource);
        if (!definition) {
            return Err<InstancePtr>(definition.error());
        }
        return Ok<InstancePtr>(std::make_shared<DefinitionInstance>(std::move(*definition), ctx));
    });
    return controller;
}

Controller module_controller() {
    Controller controller;
    controller.with_create([](const Resource& resource, ResourceContext& ctx) -> Result<InstancePtr> {
        auto imported = import_module(resource, ctx);
        if (!imported) {
            return Err<InstancePtr>(imported.error());
        }
        return Ok<InstancePtr>(nullptr);
    });
    return controller;
}

Controller template_controller() {
    Controller controller;
    controller.with_create([](const Resource&, ResourceContext&) -> Result<InstancePtr> {
        return Ok<InstancePtr>(nullptr);
    });
    return controller;
}

Result<void> register_builtin_kinds(ControllerRegistry& registry) {
    auto definition = registry.register_builtin(k_definition_kind, json{{"type", "object"}}, definition_controller());
    if (!definition) {
        return Err(definition.error());
    }
    auto module = registry.register_builtin(k_module_kind, module_schema(), module_controller());
    if (!module) {
        return Err(module.error());
    }
    auto templates = registry.register_builtin(manifold_core::k_template_definition_kind,
                                               json{{"type", "object"}}, template_controller());
    if (!templates) {
        return Err(templates.error());
    }
    return Ok();
}

} // namespace manifold_kernel
