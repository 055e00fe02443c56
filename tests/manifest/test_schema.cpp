/// @file test_schema.cpp
/// @brief Tests for SchemaValidator

#include <catch2/catch_test_macros.hpp>
#include <manifold/manifest/schema.hpp>

using namespace manifold_manifest;
using manifold_core::ErrorCode;
using nlohmann::json;

namespace {

json server_schema() {
    return json::parse(R"({
        "type": "object",
        "required": ["port"],
        "properties": {
            "port": {"type": "integer", "minimum": 1, "maximum": 65535},
            "host": {"type": "string", "default": "0.0.0.0"},
            "mode": {"enum": ["http", "https"]},
            "tls": {
                "type": "object",
                "properties": {"enabled": {"type": "boolean", "default": false}}
            },
            "routes": {"type": "array", "minItems": 1, "items": {"type": "string"}}
        }
    })");
}

} // anonymous namespace

TEST_CASE("SchemaValidator: valid documents", "[manifest][schema]") {
    json doc = {{"port", 8080}, {"mode", "http"}, {"routes", {"/", "/health"}}};
    REQUIRE(SchemaValidator::validate(doc, server_schema()));
    REQUIRE(SchemaValidator::violations(doc, server_schema()).empty());
}

TEST_CASE("SchemaValidator: type mismatch", "[manifest][schema]") {
    json doc = {{"port", "8080"}};
    auto result = SchemaValidator::validate(doc, server_schema());
    REQUIRE_FALSE(result);
    REQUIRE(result.error().code() == ErrorCode::SchemaValidation);
    REQUIRE(result.error().message().find("Invalid value passed") != std::string::npos);
    REQUIRE(result.error().message().find("port") != std::string::npos);
}

TEST_CASE("SchemaValidator: collects every violation", "[manifest][schema]") {
    json doc = {{"port", 0}, {"mode", "ftp"}, {"routes", json::array()}};
    auto errors = SchemaValidator::violations(doc, server_schema());
    REQUIRE(errors.size() == 3);
}

TEST_CASE("SchemaValidator: required and additional properties", "[manifest][schema]") {
    SECTION("missing required") {
        auto errors = SchemaValidator::violations(json::object(), server_schema());
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].find("missing required property 'port'") != std::string::npos);
    }

    SECTION("additionalProperties false") {
        json schema = {{"type", "object"}, {"properties", {{"a", {{"type", "integer"}}}}},
                       {"additionalProperties", false}};
        REQUIRE(SchemaValidator::validate({{"a", 1}}, schema));
        REQUIRE_FALSE(SchemaValidator::validate({{"a", 1}, {"b", 2}}, schema));
    }

    SECTION("additionalProperties schema") {
        json schema = {{"type", "object"}, {"additionalProperties", {{"type", "string"}}}};
        REQUIRE(SchemaValidator::validate({{"x", "y"}}, schema));
        REQUIRE_FALSE(SchemaValidator::validate({{"x", 1}}, schema));
    }
}

TEST_CASE("SchemaValidator: type lists and integers", "[manifest][schema]") {
    json schema = {{"type", {"string", "null"}}};
    REQUIRE(SchemaValidator::validate("x", schema));
    REQUIRE(SchemaValidator::validate(nullptr, schema));
    REQUIRE_FALSE(SchemaValidator::validate(3, schema));

    json integer = {{"type", "integer"}};
    REQUIRE(SchemaValidator::validate(2.0, integer));
    REQUIRE_FALSE(SchemaValidator::validate(2.5, integer));
}

TEST_CASE("SchemaValidator: item paths", "[manifest][schema]") {
    json doc = {{"port", 80}, {"routes", {"/", 7}}};
    auto errors = SchemaValidator::violations(doc, server_schema());
    REQUIRE(errors.size() == 1);
    REQUIRE(errors[0].find("routes[1]") != std::string::npos);
}

TEST_CASE("SchemaValidator: apply_defaults", "[manifest][schema]") {
    json doc = {{"port", 80}, {"tls", json::object()}};
    SchemaValidator::apply_defaults(doc, server_schema());

    REQUIRE(doc["host"] == "0.0.0.0");
    REQUIRE(doc["tls"]["enabled"] == false);
    REQUIRE_FALSE(doc.contains("mode"));

    // Present values are never overwritten
    json explicit_host = {{"host", "127.0.0.1"}};
    SchemaValidator::apply_defaults(explicit_host, server_schema());
    REQUIRE(explicit_host["host"] == "127.0.0.1");
}

TEST_CASE("SchemaValidator: has_type", "[manifest][schema]") {
    REQUIRE(SchemaValidator::has_type({{"type", "object"}}));
    REQUIRE(SchemaValidator::has_type({{"type", {"string", "null"}}}));
    REQUIRE_FALSE(SchemaValidator::has_type(json::object()));
    REQUIRE_FALSE(SchemaValidator::has_type(nullptr));
}
