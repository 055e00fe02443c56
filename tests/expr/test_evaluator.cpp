/// @file test_evaluator.cpp
/// @brief Tests for the expression evaluator

#include <catch2/catch_test_macros.hpp>
#include <manifold/expr/evaluator.hpp>

#include <cstdint>
#include <limits>

using namespace manifold_expr;
using nlohmann::json;

namespace {

json eval_ok(const Evaluator& evaluator, const std::string& expr, const json& ctx = json::object()) {
    auto outcome = evaluator.evaluate(expr, ctx);
    REQUIRE(outcome.is_resolved());
    return outcome.value();
}

} // anonymous namespace

TEST_CASE("Evaluator: literals", "[expr][evaluator]") {
    Evaluator evaluator;

    REQUIRE(eval_ok(evaluator, "42") == 42);
    REQUIRE(eval_ok(evaluator, "1.5") == 1.5);
    REQUIRE(eval_ok(evaluator, "'hi'") == "hi");
    REQUIRE(eval_ok(evaluator, "\"hi\"") == "hi");
    REQUIRE(eval_ok(evaluator, "true") == true);
    REQUIRE(eval_ok(evaluator, "null").is_null());
    REQUIRE(eval_ok(evaluator, "[1, 2, 3]") == json::array({1, 2, 3}));
}

TEST_CASE("Evaluator: arithmetic keeps integer types", "[expr][evaluator]") {
    Evaluator evaluator;

    auto sum = eval_ok(evaluator, "port + 1", {{"port", 8080}});
    REQUIRE(sum.is_number_integer());
    REQUIRE(sum == 8081);

    REQUIRE(eval_ok(evaluator, "7 / 2") == 3);
    REQUIRE(eval_ok(evaluator, "7 % 4") == 3);
    REQUIRE(eval_ok(evaluator, "-3 * 2") == -6);
    REQUIRE(eval_ok(evaluator, "'a' + 'b'") == "ab");
    REQUIRE(eval_ok(evaluator, "[1] + [2]") == json::array({1, 2}));
}

TEST_CASE("Evaluator: comparison and logic", "[expr][evaluator]") {
    Evaluator evaluator;
    json ctx = {{"n", 3}, {"env", "prod"}};

    REQUIRE(eval_ok(evaluator, "n < 4", ctx) == true);
    REQUIRE(eval_ok(evaluator, "n >= 4", ctx) == false);
    REQUIRE(eval_ok(evaluator, "env == 'prod' && n > 1", ctx) == true);
    REQUIRE(eval_ok(evaluator, "env != 'prod' || n == 3", ctx) == true);
    REQUIRE(eval_ok(evaluator, "!(n == 3)", ctx) == false);
    REQUIRE(eval_ok(evaluator, "n > 2 ? 'big' : 'small'", ctx) == "big");
}

TEST_CASE("Evaluator: short-circuit skips the failing side", "[expr][evaluator]") {
    Evaluator evaluator;
    REQUIRE(eval_ok(evaluator, "false && missing") == false);
    REQUIRE(eval_ok(evaluator, "true || missing") == true);
}

TEST_CASE("Evaluator: member and index access", "[expr][evaluator]") {
    Evaluator evaluator;
    json ctx = {{"server", {{"ports", {80, 443}}, {"host", "localhost"}}}};

    REQUIRE(eval_ok(evaluator, "server.host", ctx) == "localhost");
    REQUIRE(eval_ok(evaluator, "server.ports[1]", ctx) == 443);
    REQUIRE(eval_ok(evaluator, "server['host']", ctx) == "localhost");
    REQUIRE(eval_ok(evaluator, "443 in server.ports", ctx) == true);
    REQUIRE(eval_ok(evaluator, "'host' in server", ctx) == true);
}

TEST_CASE("Evaluator: functions and methods", "[expr][evaluator]") {
    Evaluator evaluator;
    json ctx = {{"items", {1, 2, 3}}, {"name", "Api"}, {"cfg", {{"a", 1}}}};

    REQUIRE(eval_ok(evaluator, "size(items)", ctx) == 3);
    REQUIRE(eval_ok(evaluator, "items.size()", ctx) == 3);
    REQUIRE(eval_ok(evaluator, "string(42)") == "42");
    REQUIRE(eval_ok(evaluator, "int('17')") == 17);
    REQUIRE(eval_ok(evaluator, "type(items)", ctx) == "list");
    REQUIRE(eval_ok(evaluator, "has(cfg.a)", ctx) == true);
    REQUIRE(eval_ok(evaluator, "has(cfg.b)", ctx) == false);
    REQUIRE(eval_ok(evaluator, "name.lowerAscii()", ctx) == "api");
    REQUIRE(eval_ok(evaluator, "name.startsWith('A')", ctx) == true);
}

TEST_CASE("Evaluator: macros", "[expr][evaluator]") {
    Evaluator evaluator;
    json ctx = {{"items", {1, 2, 3, 4}}};

    REQUIRE(eval_ok(evaluator, "items.map(x, x * 10)", ctx) == json::array({10, 20, 30, 40}));
    REQUIRE(eval_ok(evaluator, "items.filter(x, x % 2 == 0)", ctx) == json::array({2, 4}));
    REQUIRE(eval_ok(evaluator, "items.exists(x, x > 3)", ctx) == true);
    REQUIRE(eval_ok(evaluator, "items.all(x, x > 3)", ctx) == false);
}

TEST_CASE("Evaluator: undeclared identifier is an error", "[expr][evaluator]") {
    Evaluator evaluator;
    auto outcome = evaluator.evaluate("missing + 1", json::object());
    REQUIRE(outcome.is_error());
    REQUIRE(outcome.message().find("missing") != std::string::npos);
}

TEST_CASE("Evaluator: deferred roots are not errors", "[expr][evaluator]") {
    Evaluator evaluator(EvalOptions{{"request", "result"}});

    auto outcome = evaluator.evaluate("request.body.id", json::object());
    REQUIRE(outcome.is_deferred());
    REQUIRE(outcome.identifier() == "request");

    // Bound roots resolve normally
    auto bound = evaluator.evaluate("request.id", {{"request", {{"id", 5}}}});
    REQUIRE(bound.is_resolved());
    REQUIRE(bound.value() == 5);
}

TEST_CASE("Evaluator: syntax errors", "[expr][evaluator]") {
    Evaluator evaluator;

    auto outcome = evaluator.evaluate("1 +", json::object());
    REQUIRE(outcome.is_error());
    REQUIRE(outcome.message().find("syntax error") != std::string::npos);

    REQUIRE_FALSE(evaluator.check_syntax("a = 1"));
    REQUIRE(evaluator.check_syntax("a == 1"));
}

TEST_CASE("Evaluator: division by zero", "[expr][evaluator]") {
    Evaluator evaluator;
    REQUIRE(evaluator.evaluate("1 / 0", json::object()).is_error());
}

TEST_CASE("Evaluator: integer overflow is an error", "[expr][evaluator]") {
    Evaluator evaluator;
    const json ctx = {
        {"low", std::numeric_limits<std::int64_t>::min()},
        {"high", std::numeric_limits<std::int64_t>::max()},
    };

    for (const char* expr : {"low / -1", "low % -1", "-low", "high * 2", "high + 1", "low - 1"}) {
        auto outcome = evaluator.evaluate(expr, ctx);
        REQUIRE(outcome.is_error());
        REQUIRE(outcome.message() == "integer overflow");
    }

    REQUIRE(eval_ok(evaluator, "high - 1", ctx) == std::numeric_limits<std::int64_t>::max() - 1);
    REQUIRE(eval_ok(evaluator, "low / 1", ctx) == std::numeric_limits<std::int64_t>::min());
    REQUIRE(eval_ok(evaluator, "low % 2", ctx) == 0);
}

TEST_CASE("Evaluator: parsed expressions are cached", "[expr][evaluator]") {
    Evaluator evaluator;
    (void)evaluator.evaluate("a + 1", {{"a", 1}});
    (void)evaluator.evaluate("a + 1", {{"a", 2}});
    REQUIRE(evaluator.cache_size() == 1);

    evaluator.clear_cache();
    REQUIRE(evaluator.cache_size() == 0);
}

TEST_CASE("EvalOutcome: to_result", "[expr][evaluator]") {
    Evaluator evaluator(EvalOptions{{"request"}});

    auto ok = evaluator.evaluate("2 * 3", json::object()).to_result("2 * 3");
    REQUIRE(ok);
    REQUIRE(*ok == 6);

    auto deferred = evaluator.evaluate("request.x", json::object()).to_result("request.x", "Demo.Route.r");
    REQUIRE_FALSE(deferred);
    REQUIRE(deferred.error().code() == manifold_core::ErrorCode::Expression);
    REQUIRE(deferred.error().message().find("Demo.Route.r") != std::string::npos);
}

TEST_CASE("is_truthy and stringify", "[expr][evaluator]") {
    REQUIRE_FALSE(is_truthy(json()));
    REQUIRE_FALSE(is_truthy(json(0)));
    REQUIRE_FALSE(is_truthy(json("")));
    REQUIRE(is_truthy(json("x")));
    REQUIRE(is_truthy(json::array()));

    REQUIRE(stringify(json()) == "");
    REQUIRE(stringify(json(8080)) == "8080");
    REQUIRE(stringify(json(2.0)) == "2");
    REQUIRE(stringify(json(true)) == "true");
    REQUIRE(stringify(json::array({1, 2})) == "[1,2]");
}
