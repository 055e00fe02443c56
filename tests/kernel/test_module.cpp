/// @file test_module.cpp
/// @brief Tests for Runtime.Module imports

#include <catch2/catch_test_macros.hpp>
#include <manifold/kernel/kernel.hpp>

#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace manifold_kernel;
using manifold_core::Ok;
using manifold_core::Resource;
using manifold_core::ResourceId;
using manifold_core::Result;
using nlohmann::json;

namespace fs = std::filesystem;

namespace {

class TempDir {
public:
    explicit TempDir(const std::string& name)
        : m_path(fs::temp_directory_path() / name) {
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    fs::path write(const std::string& file, const std::string& text) const {
        const fs::path target = m_path / file;
        std::ofstream(target) << text;
        return target;
    }

private:
    fs::path m_path;
};

class Named : public ResourceInstance {
public:
    Named(std::string name, std::vector<std::string>& log)
        : m_name(std::move(name))
        , m_log(log) {}

    Result<void> init() override {
        m_log.push_back(m_name);
        return Ok();
    }

private:
    std::string m_name;
    std::vector<std::string>& m_log;
};

std::unique_ptr<Kernel> make_kernel(std::vector<std::string>& log) {
    auto built = KernelBuilder()
        .controller("Demo.Thing", {{"type", "object"}}, Controller().with_create(
            [&log](const Resource& resource, ResourceContext&) -> Result<InstancePtr> {
                return Ok<InstancePtr>(std::make_shared<Named>(manifold_core::resource_name(resource), log));
            }))
        .build();
    REQUIRE(built);
    return std::move(*built);
}

} // anonymous namespace

TEST_CASE("Module: sections are imported relative to the module file", "[kernel][module]") {
    TempDir dir("manifold_test_module");
    dir.write("a.json", R"({"kind": "Demo.Thing", "metadata": {"name": "one"}})");
    dir.write("b.json", R"([{"kind": "Demo.Thing", "metadata": {"name": "two"}}])");
    const auto manifest = dir.write("app.json", R"({
        "kind": "Runtime.Module",
        "metadata": {"name": "App"},
        "imports": ["a.json"],
        "resources": [{"path": "b.json"}]
    })");

    std::vector<std::string> log;
    auto kernel = make_kernel(log);
    REQUIRE(kernel->load(manifest));
    REQUIRE(kernel->boot());

    REQUIRE(log == std::vector<std::string>{"one", "two"});
    REQUIRE(kernel->registry().get("Demo.Thing", "one") != nullptr);
    REQUIRE(kernel->registry().get("Demo.Thing", "two") != nullptr);
    REQUIRE(kernel->instance(ResourceId{"Runtime.Module", "App"}) == nullptr);
}

TEST_CASE("Module: a failing section imports nothing", "[kernel][module]") {
    TempDir dir("manifold_test_module_missing");
    dir.write("a.json", R"({"kind": "Demo.Thing", "metadata": {"name": "one"}})");
    // The sibling is created in the first pass, so discovery retries the module in a second one
    const auto manifest = dir.write("app.json", R"([
        {
            "kind": "Runtime.Module",
            "metadata": {"name": "App"},
            "imports": ["a.json"],
            "definitions": ["missing.json"]
        },
        {"kind": "Demo.Thing", "metadata": {"name": "sibling"}}
    ])");

    std::vector<std::string> log;
    auto kernel = make_kernel(log);
    REQUIRE(kernel->load(manifest));

    auto booted = kernel->boot();
    REQUIRE_FALSE(booted);
    REQUIRE(kernel->stats().discovery_passes == 2);

    const auto& message = booted.error().message();
    REQUIRE(message.find("- Runtime.Module.App: Failed to open manifest: ") != std::string::npos);
    REQUIRE(message.find("missing.json") != std::string::npos);
    REQUIRE(message.find("Duplicate resource") == std::string::npos);

    REQUIRE(kernel->registry().get("Demo.Thing", "one") == nullptr);
    REQUIRE(log == std::vector<std::string>{"sibling"});
}
