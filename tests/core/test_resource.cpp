/// @file test_resource.cpp
/// @brief Tests for resource document accessors and ResourceId

#include <catch2/catch_test_macros.hpp>
#include <manifold/core/resource.hpp>

using namespace manifold_core;
using nlohmann::json;

TEST_CASE("ResourceId: parse splits on the last dot", "[core][resource]") {
    auto id = ResourceId::parse("Demo.Http.Server.api");
    REQUIRE(id);
    REQUIRE(id->kind == "Demo.Http.Server");
    REQUIRE(id->name == "api");
    REQUIRE(id->to_string() == "Demo.Http.Server.api");
}

TEST_CASE("ResourceId: parse rejects malformed identifiers", "[core][resource]") {
    REQUIRE_FALSE(ResourceId::parse("nodot"));
    REQUIRE_FALSE(ResourceId::parse(".name"));
    REQUIRE_FALSE(ResourceId::parse("Kind."));
    REQUIRE(ResourceId::parse("nodot").error().code() == ErrorCode::InvalidArgument);
}

TEST_CASE("ResourceId: ordering and equality", "[core][resource]") {
    ResourceId a{"A", "x"};
    ResourceId b{"A", "y"};
    ResourceId c{"B", "a"};

    REQUIRE(a < b);
    REQUIRE(b < c);
    REQUIRE(a == ResourceId{"A", "x"});
    REQUIRE(a != b);
}

TEST_CASE("Resource accessors", "[core][resource]") {
    Resource doc = {
        {"kind", "Demo.Server"},
        {"metadata", {
            {"name", "api"},
            {"module", "Demo"},
            {"uri", "file://localhost/tmp/m.json#Demo.Server.api"},
            {"source", "/tmp/m.json"},
            {"generationDepth", 2},
        }},
        {"port", 8080},
    };

    REQUIRE(resource_kind(doc) == "Demo.Server");
    REQUIRE(resource_name(doc) == "api");
    REQUIRE(resource_module(doc) == "Demo");
    REQUIRE(resource_source(doc) == "/tmp/m.json");
    REQUIRE(resource_generation_depth(doc) == 2);
    REQUIRE(resource_id(doc) == ResourceId{"Demo.Server", "api"});
    REQUIRE_FALSE(is_template_definition(doc));
}

TEST_CASE("Resource accessors tolerate missing fields", "[core][resource]") {
    Resource doc = {{"kind", 3}};
    REQUIRE(resource_kind(doc).empty());
    REQUIRE(resource_name(doc).empty());
    REQUIRE(resource_generation_depth(doc) == 0);
    REQUIRE(resource_kind(json::array()).empty());
}

TEST_CASE("validate_resource_shape", "[core][resource]") {
    SECTION("valid document") {
        auto id = validate_resource_shape({{"kind", "X"}, {"metadata", {{"name", "a"}}}});
        REQUIRE(id);
        REQUIRE(id->to_string() == "X.a");
    }

    SECTION("missing kind") {
        auto id = validate_resource_shape({{"metadata", {{"name", "a"}}}});
        REQUIRE_FALSE(id);
        REQUIRE(id.error().code() == ErrorCode::InvalidManifest);
    }

    SECTION("missing name") {
        auto id = validate_resource_shape({{"kind", "X"}, {"metadata", json::object()}});
        REQUIRE_FALSE(id);
        REQUIRE(id.error().message().find("metadata.name") != std::string::npos);
    }

    SECTION("not an object") {
        REQUIRE_FALSE(validate_resource_shape(json::array()));
    }
}

TEST_CASE("ensure_metadata creates the metadata map", "[core][resource]") {
    Resource doc = {{"kind", "X"}};
    auto& meta = ensure_metadata(doc);
    meta["name"] = "a";
    REQUIRE(resource_name(doc) == "a");
}

TEST_CASE("json_type_name", "[core][resource]") {
    REQUIRE(std::string(json_type_name(json())) == "null");
    REQUIRE(std::string(json_type_name(json(1))) == "int");
    REQUIRE(std::string(json_type_name(json(1.5))) == "double");
    REQUIRE(std::string(json_type_name(json("s"))) == "string");
    REQUIRE(std::string(json_type_name(json::array())) == "list");
    REQUIRE(std::string(json_type_name(json::object())) == "map");
}
