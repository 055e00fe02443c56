/// @file test_resolution.cpp
/// @brief Tests for ExpressionResolver

#include <catch2/catch_test_macros.hpp>
#include <manifold/manifest/resolution.hpp>

#include <cstdlib>

using namespace manifold_manifest;
using manifold_core::ErrorCode;
using manifold_core::Resource;
using nlohmann::json;

namespace {

const Resource& by_name(const std::vector<Resource>& resources, const std::string& name) {
    for (const auto& r : resources) {
        if (manifold_core::resource_name(r) == name) {
            return r;
        }
    }
    FAIL("no resource named " << name);
    return resources.front();
}

} // anonymous namespace

TEST_CASE("ExpressionResolver: context exposes resources by kind path", "[manifest][resolution]") {
    manifold_expr::Evaluator evaluator;
    ExpressionResolver resolver(evaluator, ResolutionConfig{5, {}, "Demo"});

    Resource server = {{"kind", "Demo.Http.Server"}, {"metadata", {{"name", "api"}}}, {"port", 8080}};
    auto context = resolver.build_context({&server});

    REQUIRE(context["Demo"]["Http"]["Server"]["api"]["port"] == 8080);
    REQUIRE(context["Namespace"]["Demo"]["name"] == "Demo");
    REQUIRE(context["env"].is_object());
}

TEST_CASE("ExpressionResolver: cross-resource references", "[manifest][resolution]") {
    manifold_expr::Evaluator evaluator;
    ExpressionResolver resolver(evaluator);

    std::vector<Resource> resources = {
        {{"kind", "Demo.Client"}, {"metadata", {{"name", "c"}}},
         {"url", "http://localhost:${{ Demo.Server.api.port }}/"},
         {"port", "${{ Demo.Server.api.port }}"}},
        {{"kind", "Demo.Server"}, {"metadata", {{"name", "api"}}}, {"port", 8080}},
    };

    auto resolved = resolver.resolve_all(resources);
    REQUIRE(resolved);

    const auto& client = by_name(*resolved, "c");
    REQUIRE(client["url"] == "http://localhost:8080/");
    REQUIRE(client["port"].is_number_integer());
    REQUIRE(client["port"] == 8080);
}

TEST_CASE("ExpressionResolver: chained references converge", "[manifest][resolution]") {
    manifold_expr::Evaluator evaluator;

    std::vector<Resource> resources = {
        {{"kind", "A"}, {"metadata", {{"name", "a"}}}, {"v", "${{ B.b.v }}"}},
        {{"kind", "B"}, {"metadata", {{"name", "b"}}}, {"v", "${{ C.c.v }}"}},
        {{"kind", "C"}, {"metadata", {{"name", "c"}}}, {"v", 1}},
    };

    SECTION("within the pass limit") {
        ExpressionResolver resolver(evaluator);
        auto resolved = resolver.resolve_all(resources);
        REQUIRE(resolved);
        REQUIRE(by_name(*resolved, "a")["v"] == 1);
        REQUIRE(by_name(*resolved, "b")["v"] == 1);
    }

    SECTION("beyond the pass limit") {
        ExpressionResolver resolver(evaluator, ResolutionConfig{1});
        auto resolved = resolver.resolve_all(resources);
        REQUIRE_FALSE(resolved);
        REQUIRE(resolved.error().code() == ErrorCode::Expression);
        REQUIRE(resolved.error().message().find("max_resolution_passes = 1") != std::string::npos);
    }
}

TEST_CASE("ExpressionResolver: deferred namespaces stay verbatim", "[manifest][resolution]") {
    manifold_expr::Evaluator evaluator(manifold_expr::EvalOptions{{"request", "result"}});
    ExpressionResolver resolver(evaluator);

    std::vector<Resource> resources = {
        {{"kind", "Demo.Route"}, {"metadata", {{"name", "echo"}}},
         {"reply", "${{ request.body }}"},
         {"status", "ok ${{ result.code }}"}},
    };

    auto resolved = resolver.resolve_all(resources);
    REQUIRE(resolved);
    REQUIRE((*resolved)[0]["reply"] == "${{ request.body }}");
    REQUIRE((*resolved)[0]["status"] == "ok ${{ result.code }}");
}

TEST_CASE("ExpressionResolver: undeclared references fail with context", "[manifest][resolution]") {
    manifold_expr::Evaluator evaluator;
    ExpressionResolver resolver(evaluator);

    std::vector<Resource> resources = {
        {{"kind", "Demo.Client"}, {"metadata", {{"name", "c"}}}, {"target", "${{ Missing.thing.port }}"}},
    };

    auto resolved = resolver.resolve_all(resources);
    REQUIRE_FALSE(resolved);
    REQUIRE(resolved.error().code() == ErrorCode::Expression);
    REQUIRE(resolved.error().message().find("Demo.Client.c") != std::string::npos);
    auto* available = resolved.error().get_context("available");
    REQUIRE(available != nullptr);
    REQUIRE(available->find("Demo") != std::string::npos);
}

TEST_CASE("ExpressionResolver: allow-listed environment", "[manifest][resolution]") {
    ::setenv("PORT", "9090", 1);
    ::setenv("MANIFOLD_SECRET", "hidden", 1);

    manifold_expr::Evaluator evaluator;
    ExpressionResolver resolver(evaluator);

    std::vector<Resource> resources = {
        {{"kind", "Demo.Server"}, {"metadata", {{"name", "api"}}}, {"port", "${{ int(env.PORT) }}"}},
    };
    auto resolved = resolver.resolve_all(resources);
    REQUIRE(resolved);
    REQUIRE((*resolved)[0]["port"] == 9090);

    Resource dummy = {{"kind", "X"}, {"metadata", {{"name", "x"}}}};
    auto context = resolver.build_context({&dummy});
    REQUIRE_FALSE(context["env"].contains("MANIFOLD_SECRET"));
}

TEST_CASE("ExpressionResolver: protected fields are left alone", "[manifest][resolution]") {
    manifold_expr::Evaluator evaluator;
    ExpressionResolver resolver(evaluator);

    Resource tmpl = {
        {"kind", "TemplateDefinition"},
        {"metadata", {{"name", "T"}, {"description", "${{ 'd' + 'e' }}"}}},
        {"resources", json::array({{{"kind", "X"}, {"metadata", {{"name", "${{ n }}"}}}}})},
    };

    bool changed = false;
    auto resolved = resolver.resolve(tmpl, json::object(), &changed);
    REQUIRE(resolved);
    REQUIRE(changed);
    REQUIRE((*resolved)["resources"][0]["metadata"]["name"] == "${{ n }}");
    REQUIRE((*resolved)["metadata"]["description"] == "de");
}

TEST_CASE("ExpressionResolver: plain resources come back unchanged", "[manifest][resolution]") {
    manifold_expr::Evaluator evaluator;
    ExpressionResolver resolver(evaluator);

    Resource plain = {
        {"kind", "Demo.Server"},
        {"metadata", {{"name", "api"}}},
        {"port", 8080},
        {"routes", json::array({"/", "/health"})},
    };

    bool changed = true;
    auto resolved = resolver.resolve(plain, json::object(), &changed);
    REQUIRE(resolved);
    REQUIRE_FALSE(changed);
    REQUIRE(*resolved == plain);
}
