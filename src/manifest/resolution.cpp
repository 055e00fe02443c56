/// @file resolution.cpp
/// @brief Registry-wide expression resolution

#include <manifold/manifest/resolution.hpp>
#include <manifold/expr/interpolate.hpp>
#include <manifold/core/log.hpp>

#include <cstdlib>
#include <sstream>

namespace manifold_manifest {

using manifold_core::Err;
using manifold_core::Error;
using manifold_core::ErrorCode;
using manifold_core::ExpressionError;
using manifold_core::Ok;
using manifold_core::Resource;
using manifold_core::ResourceId;
using manifold_core::Result;
using nlohmann::json;

namespace {

std::vector<std::string> split_kind(const std::string& kind) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= kind.size()) {
        auto dot = kind.find('.', start);
        auto part = kind.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
        if (!part.empty()) {
            parts.push_back(std::move(part));
        }
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return parts;
}

std::string available_roots(const json& context) {
    std::ostringstream oss;
    std::size_t count = 0;
    for (auto it = context.begin(); it != context.end(); ++it) {
        if (count == 20) {
            oss << ", ...";
            break;
        }
        if (count > 0) oss << ", ";
        oss << it.key();
        ++count;
    }
    return oss.str();
}

} // anonymous namespace

ExpressionResolver::ExpressionResolver(const manifold_expr::Evaluator& evaluator, ResolutionConfig config)
    : m_evaluator(evaluator)
    , m_config(std::move(config)) {}

json ExpressionResolver::build_context(const std::vector<const Resource*>& resources) const {
    json context = json::object();

    json env = json::object();
    for (const auto& key : m_config.env_allowlist) {
        if (const char* value = std::getenv(key.c_str())) {
            env[key] = value;
        }
    }
    context["env"] = std::move(env);

    if (!m_config.module_name.empty()) {
        context["Namespace"][m_config.module_name] = json{{"name", m_config.module_name}};
    }

    for (const Resource* resource : resources) {
        auto parts = split_kind(manifold_core::resource_kind(*resource));
        if (parts.empty()) continue;

        json* cursor = &context;
        for (const auto& part : parts) {
            json& next = (*cursor)[part];
            if (!next.is_object()) {
                next = json::object();
            }
            cursor = &next;
        }
        (*cursor)[manifold_core::resource_name(*resource)] = *resource;
    }

    return context;
}

Result<json> ExpressionResolver::resolve_value(const json& value, const json& context,
                                               const ResourceId& id, bool& changed) const {
    if (value.is_string()) {
        const auto& text = value.get_ref<const std::string&>();
        if (text.find("${{") == std::string::npos) {
            return Ok(value);
        }

        auto outcome = manifold_expr::expand_string(text, context, m_evaluator);
        if (outcome.is_deferred()) {
            return Ok(value);
        }
        if (outcome.is_error()) {
            auto error = Error(ExpressionError::failed(text, outcome.message(), id.to_string()));
            error.with_context("available", available_roots(context));
            return Err<json>(std::move(error));
        }
        json resolved = outcome.take_value();
        if (resolved != value) {
            changed = true;
        }
        return Ok(std::move(resolved));
    }

    if (value.is_array()) {
        json out = json::array();
        for (const auto& entry : value) {
            auto resolved = resolve_value(entry, context, id, changed);
            if (!resolved) {
                return resolved;
            }
            out.push_back(std::move(resolved).value());
        }
        return Ok(std::move(out));
    }

    if (value.is_object()) {
        json out = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            auto resolved = resolve_value(it.value(), context, id, changed);
            if (!resolved) {
                return resolved;
            }
            out[it.key()] = std::move(resolved).value();
        }
        return Ok(std::move(out));
    }

    return Ok(value);
}

Result<Resource> ExpressionResolver::resolve(const Resource& resource, const json& context, bool* changed) const {
    auto id = manifold_core::resource_id(resource);
    const bool is_template = manifold_core::is_template_definition(resource);

    if (!is_template && !manifold_expr::contains_interpolation(resource)) {
        if (changed) {
            *changed = false;
        }
        return Ok(resource);
    }

    bool any = false;
    Resource out = json::object();

    for (auto it = resource.begin(); it != resource.end(); ++it) {
        const auto& key = it.key();
        if (key == "kind" || (is_template && (key == "resources" || key == "schema"))) {
            out[key] = it.value();
            continue;
        }

        if (key == "metadata" && it->is_object()) {
            json meta = json::object();
            for (auto m = it->begin(); m != it->end(); ++m) {
                if (m.key() == "name") {
                    meta[m.key()] = m.value();
                    continue;
                }
                auto resolved = resolve_value(m.value(), context, id, any);
                if (!resolved) {
                    return Err<Resource>(std::move(resolved.error()));
                }
                meta[m.key()] = std::move(resolved).value();
            }
            out[key] = std::move(meta);
            continue;
        }

        auto resolved = resolve_value(it.value(), context, id, any);
        if (!resolved) {
            return Err<Resource>(std::move(resolved.error()));
        }
        out[key] = std::move(resolved).value();
    }

    if (changed) {
        *changed = any;
    }
    return Ok(std::move(out));
}

Result<std::vector<Resource>> ExpressionResolver::resolve_all(std::vector<Resource> resources) const {
    auto logger = manifold_core::manifest_logger();

    auto run_pass = [&](bool apply) -> Result<std::vector<std::string>> {
        std::vector<const Resource*> view;
        view.reserve(resources.size());
        for (const auto& r : resources) {
            view.push_back(&r);
        }
        json context = build_context(view);

        std::vector<std::string> updated;
        std::vector<Resource> next;
        next.reserve(resources.size());

        for (const auto& resource : resources) {
            bool changed = false;
            auto resolved = resolve(resource, context, &changed);
            if (!resolved) {
                return Err<std::vector<std::string>>(std::move(resolved.error()));
            }
            if (changed) {
                updated.push_back(manifold_core::resource_id(resource).to_string());
            }
            next.push_back(std::move(resolved).value());
        }

        if (apply) {
            resources = std::move(next);
        }
        return Ok(std::move(updated));
    };

    bool converged = false;
    for (int pass = 0; pass < m_config.max_passes; ++pass) {
        auto updated = run_pass(true);
        if (!updated) {
            logger->error("Expression resolution failed: {}", updated.error().message());
            return Err<std::vector<Resource>>(std::move(updated.error()));
        }
        logger->debug("Resolution pass {} updated {} resource(s)", pass + 1, updated->size());
        if (updated->empty()) {
            converged = true;
            break;
        }
    }

    if (!converged) {
        // The last pass still changed something: one more dry run tells whether the limit is the cause
        auto pending = run_pass(false);
        if (!pending) {
            return Err<std::vector<Resource>>(std::move(pending.error()));
        }
        if (!pending->empty()) {
            auto error = Error(ErrorCode::Expression,
                "Expression resolution did not reach a fixed point within max_resolution_passes = " +
                std::to_string(m_config.max_passes) + "; still changing: " + pending->front());
            error.with_context("unresolved", std::to_string(pending->size()));
            return Err<std::vector<Resource>>(std::move(error));
        }
    }

    return Ok(std::move(resources));
}

} // namespace manifold_manifest
