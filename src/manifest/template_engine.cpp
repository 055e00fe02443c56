/// @file template_engine.cpp
/// @brief TemplateDefinition instantiation and the expansion worklist

#include <manifold/manifest/template_engine.hpp>
#include <manifold/manifest/resource_uri.hpp>
#include <manifold/expr/interpolate.hpp>
#include <manifold/core/log.hpp>

#include <deque>
#include <map>
#include <regex>

namespace manifold_manifest {

using manifold_core::Err;
using manifold_core::Error;
using manifold_core::ErrorCode;
using manifold_core::ExpressionError;
using manifold_core::Ok;
using manifold_core::Resource;
using manifold_core::Result;
using manifold_core::TemplateError;
using nlohmann::json;

namespace {

/// Copy of `blueprint` without the control-flow keys
json strip_directives(const json& blueprint) {
    json out = blueprint;
    out.erase("for");
    out.erase("if");
    return out;
}

/// `for` as a list of clauses; an empty list means no loop
Result<std::vector<std::string>> for_clauses(const json& directive) {
    std::vector<std::string> clauses;
    if (directive.is_string()) {
        clauses.push_back(directive.get<std::string>());
    } else if (directive.is_array()) {
        for (const auto& clause : directive) {
            if (!clause.is_string()) {
                return Err<std::vector<std::string>>(Error(ErrorCode::Template,
                    "'for' clauses must be strings, got " + std::string(manifold_core::json_type_name(clause))));
            }
            clauses.push_back(clause.get<std::string>());
        }
    } else if (!directive.is_null()) {
        return Err<std::vector<std::string>>(Error(ErrorCode::Template,
            "'for' must be a string or a list of strings, got " +
            std::string(manifold_core::json_type_name(directive))));
    }
    return Ok(std::move(clauses));
}

json instance_parameters(const Resource& instance) {
    json params = json::object();
    for (auto it = instance.begin(); it != instance.end(); ++it) {
        if (it.key() == "kind" || it.key() == "metadata") continue;
        params[it.key()] = it.value();
    }
    return params;
}

} // anonymous namespace

TemplateEngine::TemplateEngine(const manifold_expr::Evaluator& evaluator, TemplateEngineConfig config)
    : m_evaluator(evaluator)
    , m_config(std::move(config)) {}

// =============================================================================
// Static helpers
// =============================================================================

Result<ForClause> TemplateEngine::parse_for(const std::string& text) {
    static const std::regex k_for_pattern(R"(^\s*(\w+)(?:\s*,\s*(\w+))?\s+in\s+(.+)$)");

    std::smatch match;
    if (!std::regex_match(text, match, k_for_pattern)) {
        return Err<ForClause>(Error(ErrorCode::Template, "Invalid 'for' expression: \"" + text + "\""));
    }

    ForClause clause;
    clause.first = match[1].str();
    clause.second = match[2].matched ? match[2].str() : std::string();
    clause.collection = match[3].str();

    auto last = clause.collection.find_last_not_of(" \t\r\n");
    clause.collection.erase(last == std::string::npos ? 0 : last + 1);
    return Ok(std::move(clause));
}

json TemplateEngine::schema_defaults(const json& schema) {
    json defaults = json::object();
    if (!schema.is_object()) {
        return defaults;
    }
    auto props = schema.find("properties");
    if (props == schema.end() || !props->is_object()) {
        return defaults;
    }
    for (auto it = props->begin(); it != props->end(); ++it) {
        if (it->is_object() && it->contains("default")) {
            defaults[it.key()] = it->at("default");
        }
    }
    return defaults;
}

std::vector<std::string> TemplateEngine::template_aliases(const Resource& template_def) const {
    std::vector<std::string> aliases;
    auto name = manifold_core::resource_name(template_def);
    if (name.empty()) {
        return aliases;
    }
    aliases.push_back(name);

    auto module = manifold_core::resource_module(template_def);
    if (!module.empty()) {
        aliases.push_back(module + "." + name);
    }
    if (!m_config.module_name.empty() && m_config.module_name != module) {
        aliases.push_back(m_config.module_name + "." + name);
    }
    return aliases;
}

Error TemplateEngine::template_error(TemplateError err, const std::string& instance) const {
    Error error(std::move(err));
    if (!instance.empty()) {
        error.with_context("instance", instance);
    }
    return error;
}

// =============================================================================
// Instantiation
// =============================================================================

Result<std::vector<Resource>> TemplateEngine::instantiate(
    const Resource& template_def,
    const json& parameters,
    const std::string& instance_name,
    int depth,
    const std::string& parent_uri,
    const std::string& module) const {

    auto template_name = manifold_core::resource_name(template_def);

    if (depth >= m_config.max_depth) {
        return Err<std::vector<Resource>>(
            template_error(TemplateError::max_depth(template_name, depth, m_config.max_depth), instance_name));
    }

    auto blueprints = template_def.find("resources");
    if (blueprints == template_def.end() || !blueprints->is_array()) {
        return Err<std::vector<Resource>>(template_error(
            TemplateError::invalid_blueprint(template_name, depth, "TemplateDefinition has no 'resources' list"),
            instance_name));
    }

    json schema = template_def.value("schema", json::object());

    // Defaults first, then the instance's own values, then self-interpolation
    json context = schema_defaults(schema);
    if (parameters.is_object()) {
        for (auto it = parameters.begin(); it != parameters.end(); ++it) {
            context[it.key()] = it.value();
        }
    }

    auto expanded_params = manifold_expr::expand_value(context, context, m_evaluator);
    if (expanded_params.is_error()) {
        auto error = Error(ExpressionError::failed("parameters", expanded_params.message(), instance_name));
        error.with_context("template", template_name);
        return Err<std::vector<Resource>>(std::move(error));
    }
    context = expanded_params.take_value();

    if (schema.is_object()) {
        auto required = schema.find("required");
        if (required != schema.end() && required->is_array()) {
            for (const auto& key : *required) {
                if (key.is_string() && !context.contains(key.get<std::string>())) {
                    return Err<std::vector<Resource>>(template_error(
                        TemplateError::invalid_blueprint(template_name, depth,
                            "missing required parameter '" + key.get<std::string>() + "'"),
                        instance_name));
                }
            }
        }
    }

    Frame frame{template_name, depth, parent_uri, module};
    std::vector<Resource> produced;

    for (const auto& blueprint : *blueprints) {
        if (!blueprint.is_object()) {
            return Err<std::vector<Resource>>(template_error(
                TemplateError::invalid_blueprint(template_name, depth,
                    std::string("blueprint must be a map, got ") + manifold_core::json_type_name(blueprint)),
                instance_name));
        }
        auto result = expand_blueprint(blueprint, context, frame, produced);
        if (!result) {
            auto error = std::move(result.error());
            if (!instance_name.empty() && !error.get_context("instance")) {
                error.with_context("instance", instance_name);
            }
            return Err<std::vector<Resource>>(std::move(error));
        }
    }

    manifold_core::template_logger()->debug("Template {} instance {} produced {} resource(s) at depth {}",
                                            template_name, instance_name, produced.size(), depth + 1);
    return Ok(std::move(produced));
}

Result<void> TemplateEngine::expand_blueprint(const json& blueprint, const json& context,
                                              const Frame& frame, std::vector<Resource>& out) const {
    auto cond = blueprint.find("if");
    if (cond != blueprint.end() && !cond->is_null()) {
        auto value = evaluate_directive(*cond, context, frame);
        if (!value) {
            return Err(std::move(value.error()));
        }
        if (!manifold_expr::is_truthy(*value)) {
            return Ok();
        }
    }

    auto loop = blueprint.find("for");
    if (loop != blueprint.end()) {
        auto clauses = for_clauses(*loop);
        if (!clauses) {
            return Err(template_error(
                TemplateError::invalid_for(frame.template_name, frame.depth, loop->dump())));
        }
        if (!clauses->empty()) {
            json body = strip_directives(blueprint);
            return expand_for(body, *clauses, 0, context, frame, [&](const json& bound) -> Result<void> {
                auto resource = expand_single(body, bound, frame);
                if (!resource) {
                    return Err(std::move(resource.error()));
                }
                out.push_back(std::move(resource).value());
                return Ok();
            });
        }
    }

    auto resource = expand_single(strip_directives(blueprint), context, frame);
    if (!resource) {
        return Err(std::move(resource.error()));
    }
    out.push_back(std::move(resource).value());
    return Ok();
}

Result<void> TemplateEngine::expand_for(const json& blueprint, const std::vector<std::string>& clauses,
                                        std::size_t index, const json& context, const Frame& frame,
                                        const std::function<Result<void>(const json&)>& emit) const {
    if (index == clauses.size()) {
        return emit(context);
    }

    auto clause = parse_for(clauses[index]);
    if (!clause) {
        return Err(template_error(TemplateError::invalid_for(frame.template_name, frame.depth, clauses[index])));
    }

    auto collection = evaluate_directive(json(clause->collection), context, frame);
    if (!collection) {
        return Err(std::move(collection.error()));
    }

    if (collection->is_null()) {
        return Ok();
    }

    if (collection->is_array()) {
        for (std::size_t i = 0; i < collection->size(); ++i) {
            json bound = context;
            if (clause->has_second()) {
                bound[clause->first] = i;
                bound[clause->second] = (*collection)[i];
            } else {
                bound[clause->first] = (*collection)[i];
            }
            auto result = expand_for(blueprint, clauses, index + 1, bound, frame, emit);
            if (!result) {
                return result;
            }
        }
        return Ok();
    }

    if (collection->is_object()) {
        for (auto it = collection->begin(); it != collection->end(); ++it) {
            json bound = context;
            bound[clause->first] = it.key();
            if (clause->has_second()) {
                bound[clause->second] = it.value();
            }
            auto result = expand_for(blueprint, clauses, index + 1, bound, frame, emit);
            if (!result) {
                return result;
            }
        }
        return Ok();
    }

    return Err(template_error(TemplateError::invalid_target(frame.template_name, frame.depth, clause->collection,
                                                            manifold_core::json_type_name(*collection))));
}

Result<json> TemplateEngine::evaluate_directive(const json& directive, const json& context,
                                                const Frame& frame) const {
    if (!directive.is_string()) {
        return Ok(directive);
    }

    auto text = directive.get<std::string>();
    auto inner = manifold_expr::exact_interpolation(text);
    const std::string expression = inner ? *inner : text;

    auto outcome = m_evaluator.evaluate(expression, context);
    if (outcome.is_resolved()) {
        return Ok(outcome.take_value());
    }

    std::string reason = outcome.is_deferred()
        ? "'" + outcome.identifier() + "' is not available during template expansion"
        : outcome.message();
    auto error = Error(ExpressionError::failed(expression, reason));
    error.with_context("template", frame.template_name);
    error.with_context("depth", std::to_string(frame.depth));
    return Err<json>(std::move(error));
}

Result<Resource> TemplateEngine::expand_single(const json& blueprint, const json& context,
                                               const Frame& frame) const {
    json body = blueprint;
    auto wrapped = blueprint.find("resource");
    if (wrapped != blueprint.end() && wrapped->is_object()) {
        body = *wrapped;
    }

    // Resolve kind first: a nested TemplateDefinition keeps its body literal
    auto kind_it = body.find("kind");
    if (kind_it == body.end() || !kind_it->is_string()) {
        return Err<Resource>(template_error(
            TemplateError::invalid_blueprint(frame.template_name, frame.depth, "blueprint is missing 'kind'")));
    }
    auto kind_value = expand_field(*kind_it, context, frame);
    if (!kind_value) {
        return Err<Resource>(std::move(kind_value.error()));
    }
    if (!kind_value->is_string() || kind_value->get<std::string>().empty()) {
        return Err<Resource>(template_error(TemplateError::invalid_blueprint(frame.template_name, frame.depth,
            "'kind' must expand to a non-empty string")));
    }
    const std::string kind = kind_value->get<std::string>();

    Resource resource = json::object();
    resource["kind"] = kind;

    const bool nested_template = kind == manifold_core::k_template_definition_kind;
    for (auto it = body.begin(); it != body.end(); ++it) {
        if (it.key() == "kind") continue;
        if (nested_template && (it.key() == "resources" || it.key() == "schema")) {
            resource[it.key()] = it.value();
            continue;
        }
        auto value = expand_field(it.value(), context, frame);
        if (!value) {
            return Err<Resource>(std::move(value.error()));
        }
        resource[it.key()] = std::move(value).value();
    }

    auto name = manifold_core::resource_name(resource);
    if (name.empty()) {
        return Err<Resource>(template_error(TemplateError::invalid_blueprint(frame.template_name, frame.depth,
            "blueprint of kind " + kind + " is missing 'metadata.name'")));
    }

    auto& meta = manifold_core::ensure_metadata(resource);

    std::string uri;
    if (!frame.parent_uri.empty()) {
        auto parent = ResourceUri::parse(frame.parent_uri);
        if (parent) {
            uri = parent->with_child(kind, name).to_string();
        } else {
            manifold_core::template_logger()->warn("Ignoring malformed parent URI {}: {}",
                                                   frame.parent_uri, parent.error().message());
        }
    }
    if (uri.empty()) {
        uri = ResourceUri::from_template(frame.template_name, kind, name).to_string();
    }
    meta["uri"] = uri;
    meta["generationDepth"] = frame.depth + 1;
    if (!frame.module.empty() && !meta.contains("module")) {
        meta["module"] = frame.module;
    }

    return Ok(std::move(resource));
}

Result<json> TemplateEngine::expand_field(const json& value, const json& context, const Frame& frame) const {
    if (value.is_string()) {
        auto outcome = manifold_expr::expand_string(value.get<std::string>(), context, m_evaluator);
        if (outcome.is_resolved()) {
            return Ok(outcome.take_value());
        }
        if (outcome.is_deferred()) {
            return Ok(value);
        }
        auto error = Error(ExpressionError::failed(value.get<std::string>(), outcome.message()));
        error.with_context("template", frame.template_name);
        error.with_context("depth", std::to_string(frame.depth));
        return Err<json>(std::move(error));
    }

    if (value.is_array()) {
        json out = json::array();
        for (const auto& item : value) {
            if (item.is_object() && (item.contains("for") || item.contains("if"))) {
                auto result = expand_property_item(item, context, frame, out);
                if (!result) {
                    return Err<json>(std::move(result.error()));
                }
                continue;
            }
            auto expanded = expand_field(item, context, frame);
            if (!expanded) {
                return expanded;
            }
            out.push_back(std::move(expanded).value());
        }
        return Ok(std::move(out));
    }

    if (value.is_object()) {
        json out = json::object();
        for (auto it = value.begin(); it != value.end(); ++it) {
            auto expanded = expand_field(it.value(), context, frame);
            if (!expanded) {
                return expanded;
            }
            out[it.key()] = std::move(expanded).value();
        }
        return Ok(std::move(out));
    }

    return Ok(value);
}

Result<void> TemplateEngine::expand_property_item(const json& item, const json& context,
                                                  const Frame& frame, json& out) const {
    auto cond = item.find("if");
    if (cond != item.end() && !cond->is_null()) {
        auto value = evaluate_directive(*cond, context, frame);
        if (!value) {
            return Err(std::move(value.error()));
        }
        if (!manifold_expr::is_truthy(*value)) {
            return Ok();
        }
    }

    json body = strip_directives(item);
    // A lone `resource` wrapper carries the element itself
    if (body.size() == 1 && body.contains("resource")) {
        body = json(body["resource"]);
    }

    auto push = [&](const json& bound) -> Result<void> {
        auto expanded = expand_field(body, bound, frame);
        if (!expanded) {
            return Err(std::move(expanded.error()));
        }
        out.push_back(std::move(expanded).value());
        return Ok();
    };

    auto loop = item.find("for");
    if (loop != item.end()) {
        auto clauses = for_clauses(*loop);
        if (!clauses) {
            return Err(template_error(
                TemplateError::invalid_for(frame.template_name, frame.depth, loop->dump())));
        }
        if (!clauses->empty()) {
            return expand_for(body, *clauses, 0, context, frame, push);
        }
    }
    return push(context);
}

// =============================================================================
// Worklist
// =============================================================================

Result<std::vector<Resource>> TemplateEngine::expand_all(std::vector<Resource> resources,
                                                         const TemplateLookup& external) const {
    // Template storage must not move while the index points into it
    std::deque<Resource> templates;
    std::map<std::string, const Resource*> index;

    auto add_template = [&](const Resource& def) {
        templates.push_back(def);
        for (const auto& alias : template_aliases(templates.back())) {
            index[alias] = &templates.back();
        }
    };

    auto find_template = [&](const std::string& kind) -> const Resource* {
        auto it = index.find(kind);
        if (it != index.end()) {
            return it->second;
        }
        if (external) {
            return external(kind);
        }
        return nullptr;
    };

    for (const auto& resource : resources) {
        if (manifold_core::is_template_definition(resource)) {
            add_template(resource);
        }
    }

    std::vector<Resource> output;
    std::vector<Resource> pending;
    for (auto& resource : resources) {
        if (find_template(manifold_core::resource_kind(resource))) {
            pending.push_back(std::move(resource));
        } else {
            output.push_back(std::move(resource));
        }
    }

    if (pending.empty()) {
        return Ok(std::move(output));
    }

    for (int pass = 0; pass < m_config.max_passes && !pending.empty(); ++pass) {
        std::vector<Resource> next;

        for (const auto& instance : pending) {
            auto kind = manifold_core::resource_kind(instance);
            auto name = manifold_core::resource_name(instance);
            const Resource* def = find_template(kind);
            if (!def) {
                return Err<std::vector<Resource>>(Error(TemplateError::not_found(kind, name)));
            }

            auto produced = instantiate(*def, instance_parameters(instance), name,
                                        manifold_core::resource_generation_depth(instance),
                                        manifold_core::resource_uri(instance),
                                        manifold_core::resource_module(instance));
            if (!produced) {
                manifold_core::template_logger()->error("Failed to expand {}.{}: {}", kind, name,
                                                        produced.error().message());
                return Err<std::vector<Resource>>(std::move(produced.error()));
            }

            // Definitions first so instances later in the same batch can see them
            for (const auto& resource : *produced) {
                if (manifold_core::is_template_definition(resource)) {
                    add_template(resource);
                }
            }
            for (auto& resource : *produced) {
                if (find_template(manifold_core::resource_kind(resource))) {
                    next.push_back(std::move(resource));
                } else {
                    output.push_back(std::move(resource));
                }
            }
        }

        pending = std::move(next);
        manifold_core::template_logger()->trace("Template pass {} complete, {} instance(s) pending",
                                                pass + 1, pending.size());
    }

    if (!pending.empty()) {
        const auto& stuck = pending.front();
        auto kind = manifold_core::resource_kind(stuck);
        auto depth = manifold_core::resource_generation_depth(stuck);
        if (depth >= m_config.max_depth) {
            return Err<std::vector<Resource>>(template_error(
                TemplateError::max_depth(kind, depth, m_config.max_depth), manifold_core::resource_name(stuck)));
        }
        return Err<std::vector<Resource>>(template_error(
            TemplateError::incomplete(kind, m_config.max_passes), manifold_core::resource_name(stuck)));
    }

    return Ok(std::move(output));
}

} // namespace manifold_manifest
