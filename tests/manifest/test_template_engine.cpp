/// @file test_template_engine.cpp
/// @brief Tests for TemplateEngine

#include <catch2/catch_test_macros.hpp>
#include <manifold/manifest/template_engine.hpp>

#include <algorithm>

using namespace manifold_manifest;
using manifold_core::ErrorCode;
using manifold_core::Resource;
using manifold_core::TemplateError;
using nlohmann::json;

namespace {

Resource parse(const char* text) {
    return json::parse(text);
}

const Resource* find(const std::vector<Resource>& resources, const std::string& kind, const std::string& name) {
    auto it = std::find_if(resources.begin(), resources.end(), [&](const Resource& r) {
        return manifold_core::resource_kind(r) == kind && manifold_core::resource_name(r) == name;
    });
    return it != resources.end() ? &*it : nullptr;
}

std::size_t count_kind(const std::vector<Resource>& resources, const std::string& kind) {
    return static_cast<std::size_t>(std::count_if(resources.begin(), resources.end(), [&](const Resource& r) {
        return manifold_core::resource_kind(r) == kind;
    }));
}

TemplateError::Kind template_kind(const manifold_core::Error& error) {
    REQUIRE(error.is<TemplateError>());
    return error.as<TemplateError>()->kind;
}

} // anonymous namespace

TEST_CASE("TemplateEngine: parse_for", "[manifest][template]") {
    auto single = TemplateEngine::parse_for("zone in zones");
    REQUIRE(single);
    REQUIRE(single->first == "zone");
    REQUIRE_FALSE(single->has_second());
    REQUIRE(single->collection == "zones");

    auto pair = TemplateEngine::parse_for("key, value in cfg.labels ");
    REQUIRE(pair);
    REQUIRE(pair->first == "key");
    REQUIRE(pair->second == "value");
    REQUIRE(pair->collection == "cfg.labels");

    REQUIRE_FALSE(TemplateEngine::parse_for("zones"));
    REQUIRE_FALSE(TemplateEngine::parse_for("a b in c"));
}

TEST_CASE("TemplateEngine: schema_defaults", "[manifest][template]") {
    json schema = {{"properties", {{"replicas", {{"default", 2}}}, {"name", {{"type", "string"}}}}}};
    REQUIRE(TemplateEngine::schema_defaults(schema) == json{{"replicas", 2}});
    REQUIRE(TemplateEngine::schema_defaults(nullptr) == json::object());
}

TEST_CASE("TemplateEngine: for over a list produces one resource per item", "[manifest][template]") {
    manifold_expr::Evaluator evaluator;
    TemplateEngine engine(evaluator);

    auto def = parse(R"({
        "kind": "TemplateDefinition",
        "metadata": {"name": "Pool"},
        "resources": [{
            "for": "zone in zones",
            "kind": "Server",
            "metadata": {"name": "${{ prefix }}-${{ zone }}"},
            "zone": "${{ zone }}"
        }]
    })");

    auto produced = engine.instantiate(def, {{"prefix", "api"}, {"zones", {"a", "b", "c"}}}, "pool", 0);
    REQUIRE(produced);
    REQUIRE(produced->size() == 3);
    REQUIRE(find(*produced, "Server", "api-b") != nullptr);

    const auto& first = (*produced)[0];
    REQUIRE(first["zone"] == "a");
    REQUIRE_FALSE(first.contains("for"));
    REQUIRE(first["metadata"]["generationDepth"] == 1);
    REQUIRE(first["metadata"]["uri"] == "template://Pool#Server.api-a");
}

TEST_CASE("TemplateEngine: nested for clauses produce the cross product", "[manifest][template]") {
    manifold_expr::Evaluator evaluator;
    TemplateEngine engine(evaluator);

    auto def = parse(R"({
        "kind": "TemplateDefinition",
        "metadata": {"name": "Grid"},
        "resources": [{
            "for": ["region in regions", "tier in tiers"],
            "kind": "Cell",
            "metadata": {"name": "${{ region }}-${{ tier }}"}
        }]
    })");

    auto produced = engine.instantiate(def, {{"regions", {"eu", "us"}}, {"tiers", {"web", "db", "cache"}}}, "g", 0);
    REQUIRE(produced);
    REQUIRE(produced->size() == 6);
    REQUIRE(manifold_core::resource_name((*produced)[0]) == "eu-web");
    REQUIRE(manifold_core::resource_name((*produced)[5]) == "us-cache");
}

TEST_CASE("TemplateEngine: two-variable for over lists and maps", "[manifest][template]") {
    manifold_expr::Evaluator evaluator;
    TemplateEngine engine(evaluator);

    auto def = parse(R"({
        "kind": "TemplateDefinition",
        "metadata": {"name": "Labels"},
        "resources": [
            {"for": "i, item in items", "kind": "Indexed", "metadata": {"name": "n${{ i }}"}, "value": "${{ item }}"},
            {"for": "k, v in labels", "kind": "Label", "metadata": {"name": "${{ k }}"}, "value": "${{ v }}"}
        ]
    })");

    auto produced = engine.instantiate(def, {{"items", {"x", "y"}}, {"labels", {{"team", "core"}}}}, "l", 0);
    REQUIRE(produced);
    REQUIRE(produced->size() == 3);

    auto second = find(*produced, "Indexed", "n1");
    REQUIRE(second != nullptr);
    REQUIRE((*second)["value"] == "y");

    auto label = find(*produced, "Label", "team");
    REQUIRE(label != nullptr);
    REQUIRE((*label)["value"] == "core");
}

TEST_CASE("TemplateEngine: if conditions", "[manifest][template]") {
    manifold_expr::Evaluator evaluator;
    TemplateEngine engine(evaluator);

    auto def = parse(R"({
        "kind": "TemplateDefinition",
        "metadata": {"name": "App"},
        "resources": [
            {"kind": "Server", "metadata": {"name": "main"}},
            {"if": "debug", "kind": "Debugger", "metadata": {"name": "dbg"}},
            {"if": "${{ replicas > 1 }}", "kind": "Balancer", "metadata": {"name": "lb"}}
        ]
    })");

    auto plain = engine.instantiate(def, {{"debug", false}, {"replicas", 1}}, "app", 0);
    REQUIRE(plain);
    REQUIRE(plain->size() == 1);

    auto full = engine.instantiate(def, {{"debug", true}, {"replicas", 3}}, "app", 0);
    REQUIRE(full);
    REQUIRE(full->size() == 3);
}

TEST_CASE("TemplateEngine: exact interpolation keeps types", "[manifest][template]") {
    manifold_expr::Evaluator evaluator;
    TemplateEngine engine(evaluator);

    auto def = parse(R"({
        "kind": "TemplateDefinition",
        "metadata": {"name": "Svc"},
        "schema": {"properties": {"port": {"default": 8080}}},
        "resources": [{
            "kind": "Server",
            "metadata": {"name": "svc"},
            "port": "${{ port }}",
            "label": "port-${{ port }}",
            "next": "${{ port + 1 }}"
        }]
    })");

    auto produced = engine.instantiate(def, json::object(), "svc", 0);
    REQUIRE(produced);
    const auto& server = (*produced)[0];
    REQUIRE(server["port"].is_number_integer());
    REQUIRE(server["port"] == 8080);
    REQUIRE(server["label"] == "port-8080");
    REQUIRE(server["next"] == 8081);
}

TEST_CASE("TemplateEngine: schema default drives a for clause", "[manifest][template]") {
    manifold_expr::Evaluator evaluator;
    TemplateEngine engine(evaluator);

    auto def = parse(R"({
        "kind": "TemplateDefinition",
        "metadata": {"name": "Region"},
        "schema": {"properties": {"regions": {"type": "array", "default": ["a", "b"]}}},
        "resources": [{"for": "r in regions", "kind": "X", "metadata": {"name": "${{ r }}"}}]
    })");

    auto produced = engine.instantiate(def, json::object(), "region", 0);
    REQUIRE(produced);
    REQUIRE(produced->size() == 2);
    REQUIRE(find(*produced, "X", "a") != nullptr);
    REQUIRE(find(*produced, "X", "b") != nullptr);
}

TEST_CASE("TemplateEngine: property-level for and if", "[manifest][template]") {
    manifold_expr::Evaluator evaluator;
    TemplateEngine engine(evaluator);

    auto def = parse(R"({
        "kind": "TemplateDefinition",
        "metadata": {"name": "Router"},
        "resources": [{
            "kind": "Server",
            "metadata": {"name": "r"},
            "routes": [
                "/static",
                {"for": "p in paths", "resource": "/api/${{ p }}"},
                {"if": "admin", "path": "/admin"}
            ]
        }]
    })");

    auto produced = engine.instantiate(def, {{"paths", {"users", "orders"}}, {"admin", false}}, "r", 0);
    REQUIRE(produced);
    REQUIRE((*produced)[0]["routes"] == json::array({"/static", "/api/users", "/api/orders"}));
}

TEST_CASE("TemplateEngine: deferred references survive expansion", "[manifest][template]") {
    manifold_expr::Evaluator evaluator(manifold_expr::EvalOptions{{"request"}});
    TemplateEngine engine(evaluator);

    auto def = parse(R"({
        "kind": "TemplateDefinition",
        "metadata": {"name": "Echo"},
        "resources": [{"kind": "Route", "metadata": {"name": "echo"}, "reply": "${{ request.body }}"}]
    })");

    auto produced = engine.instantiate(def, json::object(), "e", 0);
    REQUIRE(produced);
    REQUIRE((*produced)[0]["reply"] == "${{ request.body }}");
}

TEST_CASE("TemplateEngine: null collection yields nothing", "[manifest][template]") {
    manifold_expr::Evaluator evaluator;
    TemplateEngine engine(evaluator);

    auto def = parse(R"({
        "kind": "TemplateDefinition",
        "metadata": {"name": "Maybe"},
        "resources": [{"for": "x in items", "kind": "Item", "metadata": {"name": "${{ x }}"}}]
    })");

    auto produced = engine.instantiate(def, {{"items", nullptr}}, "m", 0);
    REQUIRE(produced);
    REQUIRE(produced->empty());
}

TEST_CASE("TemplateEngine: blueprint errors", "[manifest][template]") {
    manifold_expr::Evaluator evaluator;
    TemplateEngine engine(evaluator);

    SECTION("for over a scalar") {
        auto def = parse(R"({
            "kind": "TemplateDefinition", "metadata": {"name": "T"},
            "resources": [{"for": "x in count", "kind": "Item", "metadata": {"name": "${{ x }}"}}]
        })");
        auto produced = engine.instantiate(def, {{"count", 3}}, "t", 0);
        REQUIRE_FALSE(produced);
        REQUIRE(template_kind(produced.error()) == TemplateError::Kind::InvalidForTarget);
    }

    SECTION("malformed for") {
        auto def = parse(R"({
            "kind": "TemplateDefinition", "metadata": {"name": "T"},
            "resources": [{"for": "items", "kind": "Item", "metadata": {"name": "a"}}]
        })");
        auto produced = engine.instantiate(def, {{"items", {1}}}, "t", 0);
        REQUIRE_FALSE(produced);
        REQUIRE(template_kind(produced.error()) == TemplateError::Kind::InvalidForExpression);
    }

    SECTION("missing kind") {
        auto def = parse(R"({
            "kind": "TemplateDefinition", "metadata": {"name": "T"},
            "resources": [{"metadata": {"name": "a"}}]
        })");
        auto produced = engine.instantiate(def, json::object(), "t", 0);
        REQUIRE_FALSE(produced);
        REQUIRE(template_kind(produced.error()) == TemplateError::Kind::InvalidBlueprint);
    }

    SECTION("missing name") {
        auto def = parse(R"({
            "kind": "TemplateDefinition", "metadata": {"name": "T"},
            "resources": [{"kind": "Item"}]
        })");
        auto produced = engine.instantiate(def, json::object(), "t", 0);
        REQUIRE_FALSE(produced);
        REQUIRE(produced.error().message().find("metadata.name") != std::string::npos);
    }

    SECTION("missing required parameter") {
        auto def = parse(R"({
            "kind": "TemplateDefinition", "metadata": {"name": "T"},
            "schema": {"required": ["region"]},
            "resources": [{"kind": "Item", "metadata": {"name": "a"}}]
        })");
        auto produced = engine.instantiate(def, json::object(), "t", 0);
        REQUIRE_FALSE(produced);
        REQUIRE(template_kind(produced.error()) == TemplateError::Kind::InvalidBlueprint);
        REQUIRE(produced.error().message().find("region") != std::string::npos);
    }

    SECTION("undeclared reference") {
        auto def = parse(R"({
            "kind": "TemplateDefinition", "metadata": {"name": "T"},
            "resources": [{"kind": "Item", "metadata": {"name": "a"}, "v": "${{ nope }}"}]
        })");
        auto produced = engine.instantiate(def, json::object(), "t", 0);
        REQUIRE_FALSE(produced);
        REQUIRE(produced.error().code() == ErrorCode::Expression);
        REQUIRE(produced.error().get_context("template") != nullptr);
    }
}

TEST_CASE("TemplateEngine: depth limit", "[manifest][template]") {
    manifold_expr::Evaluator evaluator;
    TemplateEngine engine(evaluator);

    auto def = parse(R"({
        "kind": "TemplateDefinition", "metadata": {"name": "T"},
        "resources": [{"kind": "Item", "metadata": {"name": "a"}}]
    })");

    auto deepest = engine.instantiate(def, json::object(), "t", 9);
    REQUIRE(deepest);
    REQUIRE((*deepest)[0]["metadata"]["generationDepth"] == 10);

    auto too_deep = engine.instantiate(def, json::object(), "t", 10);
    REQUIRE_FALSE(too_deep);
    REQUIRE(template_kind(too_deep.error()) == TemplateError::Kind::MaxExpansionDepthExceeded);
    REQUIRE(too_deep.error().message().find("\"T\"") != std::string::npos);
}

TEST_CASE("TemplateEngine: expand_all recursion stops at the depth limit", "[manifest][template]") {
    manifold_expr::Evaluator evaluator;
    TemplateEngine engine(evaluator);

    auto nest = parse(R"({
        "kind": "TemplateDefinition", "metadata": {"name": "Nest"},
        "resources": [
            {"if": "level < limit", "kind": "Nest", "metadata": {"name": "n${{ level + 1 }}"},
             "level": "${{ level + 1 }}", "limit": "${{ limit }}"},
            {"if": "level >= limit", "kind": "Leaf", "metadata": {"name": "leaf"}}
        ]
    })");

    auto root = [](int limit) {
        return Resource{{"kind", "Nest"}, {"metadata", {{"name", "n0"}, {"generationDepth", 0}}},
                        {"level", 0}, {"limit", limit}};
    };

    SECTION("nine levels fit") {
        auto expanded = engine.expand_all(std::vector<Resource>{nest, root(9)});
        REQUIRE(expanded);
        auto leaf = find(*expanded, "Leaf", "leaf");
        REQUIRE(leaf != nullptr);
        REQUIRE((*leaf)["metadata"]["generationDepth"] == 10);
    }

    SECTION("ten levels exceed the limit") {
        auto expanded = engine.expand_all(std::vector<Resource>{nest, root(10)});
        REQUIRE_FALSE(expanded);
        REQUIRE(template_kind(expanded.error()) == TemplateError::Kind::MaxExpansionDepthExceeded);
    }
}

TEST_CASE("TemplateEngine: expand_all with nested templates", "[manifest][template]") {
    manifold_expr::Evaluator evaluator;
    TemplateEngine engine(evaluator);

    std::vector<Resource> input = {
        parse(R"({
            "kind": "TemplateDefinition", "metadata": {"name": "Region"},
            "schema": {"required": ["region"], "properties": {"replicas": {"default": 2}}},
            "resources": [
                {"kind": "Zone", "for": "z in zones", "metadata": {"name": "${{ region }}-${{ z }}"},
                 "zone": "${{ region }}-${{ z }}", "replicas": "${{ replicas }}"}
            ]
        })"),
        parse(R"({
            "kind": "TemplateDefinition", "metadata": {"name": "Zone"},
            "resources": [
                {"kind": "Server", "for": "i in [1, 2]", "metadata": {"name": "${{ zone }}-s${{ i }}"},
                 "replicas": "${{ replicas }}"}
            ]
        })"),
        parse(R"({
            "kind": "Region",
            "metadata": {"name": "eu", "uri": "file://localhost/m.json#Region.eu", "generationDepth": 0},
            "region": "eu",
            "zones": ["a", "b"]
        })"),
        parse(R"({"kind": "Plain", "metadata": {"name": "p"}})"),
    };

    auto expanded = engine.expand_all(input);
    REQUIRE(expanded);

    // Both definitions, the plain resource and four servers; instances are consumed
    REQUIRE(count_kind(*expanded, "TemplateDefinition") == 2);
    REQUIRE(count_kind(*expanded, "Plain") == 1);
    REQUIRE(count_kind(*expanded, "Region") == 0);
    REQUIRE(count_kind(*expanded, "Zone") == 0);
    REQUIRE(count_kind(*expanded, "Server") == 4);

    auto server = find(*expanded, "Server", "eu-b-s2");
    REQUIRE(server != nullptr);
    REQUIRE((*server)["replicas"] == 2);
    REQUIRE((*server)["metadata"]["generationDepth"] == 2);
    REQUIRE((*server)["metadata"]["uri"] == "file://localhost/m.json#Region.eu/Zone.eu-b/Server.eu-b-s2");
}

TEST_CASE("TemplateEngine: nested TemplateDefinition bodies stay literal", "[manifest][template]") {
    manifold_expr::Evaluator evaluator;
    TemplateEngine engine(evaluator);

    auto def = parse(R"({
        "kind": "TemplateDefinition", "metadata": {"name": "Factory"},
        "resources": [{
            "kind": "TemplateDefinition",
            "metadata": {"name": "${{ product }}"},
            "resources": [{"kind": "Item", "metadata": {"name": "${{ sku }}"}}]
        }]
    })");

    auto produced = engine.instantiate(def, {{"product", "Widget"}}, "f", 0);
    REQUIRE(produced);
    REQUIRE(manifold_core::resource_name((*produced)[0]) == "Widget");
    REQUIRE((*produced)[0]["resources"][0]["metadata"]["name"] == "${{ sku }}");
}

TEST_CASE("TemplateEngine: external lookup and aliases", "[manifest][template]") {
    manifold_expr::Evaluator evaluator;
    TemplateEngine engine(evaluator, TemplateEngineConfig{10, 10, "Demo"});

    auto def = parse(R"({
        "kind": "TemplateDefinition", "metadata": {"name": "Pair", "module": "Lib"},
        "resources": [{"kind": "Item", "metadata": {"name": "${{ prefix }}-x"}}]
    })");
    REQUIRE(engine.template_aliases(def) == std::vector<std::string>{"Pair", "Lib.Pair", "Demo.Pair"});

    std::vector<Resource> input = {
        parse(R"({"kind": "Lib.Pair", "metadata": {"name": "p", "module": "App"}, "prefix": "p"})"),
    };
    auto expanded = engine.expand_all(input, [&](const std::string& kind) -> const Resource* {
        return kind == "Lib.Pair" ? &def : nullptr;
    });
    REQUIRE(expanded);
    REQUIRE(expanded->size() == 1);
    REQUIRE(manifold_core::resource_name((*expanded)[0]) == "p-x");
    REQUIRE((*expanded)[0]["metadata"]["module"] == "App");
}
