/// @file test_dependency_orderer.cpp
/// @brief Tests for DependencyOrderer

#include <catch2/catch_test_macros.hpp>
#include <manifold/manifest/dependency_orderer.hpp>

using namespace manifold_manifest;
using manifold_core::ErrorCode;
using manifold_core::Resource;

namespace {

Resource make(const std::string& kind, const std::string& name) {
    return {{"kind", kind}, {"metadata", {{"name", name}}}};
}

std::vector<std::string> ids(const std::vector<Resource>& resources) {
    std::vector<std::string> out;
    for (const auto& r : resources) {
        out.push_back(manifold_core::resource_id(r).to_string());
    }
    return out;
}

} // anonymous namespace

TEST_CASE("DependencyOrderer: definitions precede their instances", "[manifest][orderer]") {
    std::vector<Resource> input = {
        make("Demo.Server", "api"),
        make("Runtime.Definition", "Demo.Server"),
    };

    auto ordered = DependencyOrderer::order(input);
    REQUIRE(ordered);
    REQUIRE(ids(*ordered) == std::vector<std::string>{"Runtime.Definition.Demo.Server", "Demo.Server.api"});
}

TEST_CASE("DependencyOrderer: independent resources keep input order", "[manifest][orderer]") {
    std::vector<Resource> input = {
        make("A", "one"),
        make("B", "two"),
        make("C", "three"),
    };

    auto ordered = DependencyOrderer::order_indices(input);
    REQUIRE(ordered);
    REQUIRE(*ordered == std::vector<std::size_t>{0, 1, 2});
}

TEST_CASE("DependencyOrderer: chains and ties", "[manifest][orderer]") {
    // Region template is defined by TemplateDefinition, Region instance depends on it,
    // unrelated resources keep their relative position.
    std::vector<Resource> input = {
        make("Other", "x"),
        make("Region", "eu"),
        make("TemplateDefinition", "Region"),
        make("Other", "y"),
    };

    auto ordered = DependencyOrderer::order(input);
    REQUIRE(ordered);
    REQUIRE(ids(*ordered) == std::vector<std::string>{
        "Other.x", "TemplateDefinition.Region", "Region.eu", "Other.y"});
}

TEST_CASE("DependencyOrderer: a resource never depends on itself", "[manifest][orderer]") {
    std::vector<Resource> input = {make("Self", "Self")};
    auto ordered = DependencyOrderer::order(input);
    REQUIRE(ordered);
    REQUIRE(ordered->size() == 1);
}

TEST_CASE("DependencyOrderer: cycles are reported", "[manifest][orderer]") {
    std::vector<Resource> input = {
        make("B", "A"),
        make("A", "B"),
        make("Free", "z"),
    };

    auto ordered = DependencyOrderer::order(input);
    REQUIRE_FALSE(ordered);
    REQUIRE(ordered.error().code() == ErrorCode::DependencyCycle);
    REQUIRE(ordered.error().message().find("B.A") != std::string::npos);
    REQUIRE(ordered.error().message().find("A.B") != std::string::npos);
    REQUIRE(ordered.error().message().find("Free.z") == std::string::npos);
}

TEST_CASE("DependencyOrderer: empty input", "[manifest][orderer]") {
    auto ordered = DependencyOrderer::order({});
    REQUIRE(ordered);
    REQUIRE(ordered->empty());
}
