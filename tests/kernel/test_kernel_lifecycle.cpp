/// @file test_kernel_lifecycle.cpp
/// @brief Tests for Kernel run, holds, teardown, exit codes and snapshots

#include <catch2/catch_test_macros.hpp>
#include <manifold/kernel/kernel.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using namespace manifold_kernel;
using manifold_core::Err;
using manifold_core::Error;
using manifold_core::ErrorCode;
using manifold_core::Ok;
using manifold_core::Resource;
using manifold_core::ResourceId;
using manifold_core::Result;
using nlohmann::json;

namespace {

struct Hooks {
    std::function<Result<void>(ResourceContext&)> init;
    std::function<Result<void>(ResourceContext&)> run;
    std::function<Result<void>()> teardown;
    std::function<std::optional<json>()> snapshot;
};

class ScriptedInstance : public ResourceInstance {
public:
    ScriptedInstance(std::string name, ResourceContext ctx, Hooks hooks, std::vector<std::string>& log)
        : m_name(std::move(name))
        , m_ctx(std::move(ctx))
        , m_hooks(std::move(hooks))
        , m_log(log) {}

    Result<void> init() override {
        m_log.push_back("init:" + m_name);
        return m_hooks.init ? m_hooks.init(m_ctx) : Ok();
    }

    Result<void> run() override {
        m_log.push_back("run:" + m_name);
        return m_hooks.run ? m_hooks.run(m_ctx) : Ok();
    }

    Result<void> teardown() override {
        m_log.push_back("teardown:" + m_name);
        return m_hooks.teardown ? m_hooks.teardown() : Ok();
    }

    std::optional<json> snapshot() const override {
        return m_hooks.snapshot ? m_hooks.snapshot() : std::nullopt;
    }

private:
    std::string m_name;
    ResourceContext m_ctx;
    Hooks m_hooks;
    std::vector<std::string>& m_log;
};

Controller scripted(std::vector<std::string>& log, std::map<std::string, Hooks> hooks = {}) {
    return Controller().with_create(
        [&log, hooks](const Resource& resource, ResourceContext& ctx) -> Result<InstancePtr> {
            const auto name = manifold_core::resource_name(resource);
            auto it = hooks.find(name);
            return Ok<InstancePtr>(std::make_shared<ScriptedInstance>(
                name, ctx, it != hooks.end() ? it->second : Hooks{}, log));
        });
}

Resource doc(const std::string& kind, const std::string& name, json fields = json::object()) {
    Resource resource = std::move(fields);
    resource["kind"] = kind;
    resource["metadata"] = {{"name", name}};
    return resource;
}

const json k_object = {{"type", "object"}};

std::unique_ptr<Kernel> make_kernel(std::vector<std::string>& log, std::map<std::string, Hooks> hooks = {}) {
    auto built = KernelBuilder().controller("Demo.Server", k_object, scripted(log, std::move(hooks))).build();
    REQUIRE(built);
    return std::move(*built);
}

bool is_ready(const std::shared_future<void>& future) {
    return future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
}

} // anonymous namespace

TEST_CASE("Kernel: run and teardown follow creation order", "[kernel][lifecycle]") {
    std::vector<std::string> log;
    auto kernel = make_kernel(log);

    std::vector<std::string> events;
    REQUIRE(kernel->events().on("Runtime.*", [&](const manifold_event::Event& e) -> Result<void> {
        events.push_back(e.name);
        return Ok();
    }));
    REQUIRE(kernel->events().on("*.*.Initialized", [&](const manifold_event::Event& e) -> Result<void> {
        events.push_back(e.name + ":" + e.payload["resource"]["name"].get<std::string>());
        return Ok();
    }));
    REQUIRE(kernel->events().on("*.*.Teardown", [&](const manifold_event::Event& e) -> Result<void> {
        events.push_back(e.name + ":" + e.payload["resource"]["name"].get<std::string>());
        return Ok();
    }));

    kernel->load_resources({doc("Demo.Server", "a"), doc("Demo.Server", "b"), doc("Demo.Server", "c")});
    REQUIRE(kernel->boot());
    REQUIRE(kernel->run());
    kernel->wait_for_idle().wait();
    REQUIRE(kernel->stop());

    REQUIRE(log == std::vector<std::string>{
        "init:a", "init:b", "init:c",
        "run:a", "run:b", "run:c",
        "teardown:c", "teardown:b", "teardown:a",
    });

    REQUIRE(events == std::vector<std::string>{
        "Demo.Server.Initialized:a", "Demo.Server.Initialized:b", "Demo.Server.Initialized:c",
        "Runtime.Starting", "Runtime.Started", "Runtime.Stopping",
        "Demo.Server.Teardown:c", "Demo.Server.Teardown:b", "Demo.Server.Teardown:a",
        "Runtime.Stopped",
    });
    REQUIRE(kernel->instance_ids().empty());
}

TEST_CASE("Kernel: holds keep the kernel from going idle", "[kernel][lifecycle][hold]") {
    std::vector<std::string> log;
    auto release = std::make_shared<manifold_event::HoldRelease>();

    Hooks server;
    server.run = [release](ResourceContext& ctx) -> Result<void> {
        *release = ctx.acquire_hold("listening");
        return Ok();
    };
    auto kernel = make_kernel(log, {{"api", server}});

    kernel->load_resources({doc("Demo.Server", "api")});
    REQUIRE(kernel->boot());
    REQUIRE(kernel->run());

    REQUIRE(kernel->holds().count() == 1);
    REQUIRE(kernel->holds().reasons() == std::vector<std::string>{"listening"});
    REQUIRE(kernel->snapshot()["holds"] == 1);

    auto idle = kernel->wait_for_idle();
    REQUIRE(kernel->phase() == KernelPhase::Idle);
    REQUIRE_FALSE(is_ready(idle));

    (*release)();
    REQUIRE(is_ready(idle));
    REQUIRE(kernel->stats().holds == 0);
    REQUIRE(kernel->stop());
}

TEST_CASE("Kernel: stop resolves outstanding holds", "[kernel][lifecycle][hold]") {
    Kernel kernel;
    REQUIRE(kernel.boot());
    REQUIRE(kernel.run());

    auto hold = kernel.acquire_hold("forever");
    auto idle = kernel.wait_for_idle();
    REQUIRE_FALSE(is_ready(idle));

    REQUIRE(kernel.stop());
    REQUIRE(is_ready(idle));
    REQUIRE(kernel.phase() == KernelPhase::Stopped);

    // A second stop is a no-op
    REQUIRE(kernel.stop());
}

TEST_CASE("Kernel: a hold may be released after the kernel is gone", "[kernel][lifecycle][hold]") {
    manifold_event::HoldRelease release;
    {
        Kernel kernel;
        REQUIRE(kernel.boot());
        release = kernel.acquire_hold("late");
    }
    release();
    REQUIRE(release.released());
}

TEST_CASE("Kernel: children are torn down before their parent", "[kernel][lifecycle]") {
    std::vector<std::string> log;

    Hooks parent;
    parent.init = [](ResourceContext& ctx) -> Result<void> {
        return ctx.register_manifest(doc("Demo.Server", "child"));
    };
    auto kernel = make_kernel(log, {{"parent", parent}});

    kernel->load_resources({doc("Demo.Server", "parent"), doc("Demo.Server", "sibling")});
    REQUIRE(kernel->boot());

    REQUIRE(kernel->instance_ids() == std::vector<ResourceId>{
        {"Demo.Server", "parent"}, {"Demo.Server", "sibling"}, {"Demo.Server", "child"}});

    REQUIRE(kernel->run());
    REQUIRE(kernel->stop());

    std::vector<std::string> teardowns;
    for (const auto& entry : log) {
        if (entry.rfind("teardown:", 0) == 0) {
            teardowns.push_back(entry);
        }
    }
    REQUIRE(teardowns == std::vector<std::string>{"teardown:child", "teardown:sibling", "teardown:parent"});
}

TEST_CASE("Kernel: resources registered while running start immediately", "[kernel][lifecycle]") {
    std::vector<std::string> log;
    auto kernel = make_kernel(log);

    REQUIRE(kernel->boot());

    SECTION("before run the new instance waits") {
        REQUIRE(kernel->register_manifest(doc("Demo.Server", "early")));
        REQUIRE(log == std::vector<std::string>{"init:early"});

        REQUIRE(kernel->run());
        REQUIRE(log == std::vector<std::string>{"init:early", "run:early"});
    }

    SECTION("after run the new instance is run") {
        REQUIRE(kernel->run());
        REQUIRE(kernel->register_manifest(doc("Demo.Server", "late")));
        REQUIRE(log == std::vector<std::string>{"init:late", "run:late"});
    }

    SECTION("invalid documents are rejected") {
        auto bad = kernel->register_manifest(json{{"kind", "Demo.Server"}});
        REQUIRE_FALSE(bad);
        REQUIRE(bad.error().code() == ErrorCode::InvalidManifest);
    }

    REQUIRE(kernel->stop());
}

TEST_CASE("Kernel: exit code is the highest requested", "[kernel][lifecycle]") {
    std::vector<std::string> log;

    Hooks first;
    first.run = [](ResourceContext& ctx) -> Result<void> {
        ctx.request_exit(3);
        return Ok();
    };
    Hooks second;
    second.run = [](ResourceContext& ctx) -> Result<void> {
        ctx.request_exit(1);
        return Ok();
    };
    auto kernel = make_kernel(log, {{"a", first}, {"b", second}});

    json stopped;
    REQUIRE(kernel->events().on("Runtime.Stopped", [&](const manifold_event::Event& e) -> Result<void> {
        stopped = e.payload;
        return Ok();
    }));

    kernel->load_resources({doc("Demo.Server", "a"), doc("Demo.Server", "b")});
    auto code = kernel->start();
    REQUIRE(code);
    REQUIRE(*code == 3);
    REQUIRE(kernel->exit_code() == 3);
    REQUIRE(stopped["exitCode"] == 3);
    REQUIRE(kernel->phase() == KernelPhase::Stopped);
}

TEST_CASE("Kernel: start reports boot failures after stopping", "[kernel][lifecycle]") {
    Kernel kernel;
    kernel.load_resources({doc("Demo.Unknown", "x")});

    auto code = kernel.start();
    REQUIRE_FALSE(code);
    REQUIRE(code.error().code() == ErrorCode::ControllerNotFound);
    REQUIRE(kernel.phase() == KernelPhase::Stopped);
}

TEST_CASE("Kernel: run failures mark the kernel failed", "[kernel][lifecycle]") {
    std::vector<std::string> log;

    Hooks broken;
    broken.run = [](ResourceContext&) -> Result<void> {
        return Err(Error("port in use"));
    };
    auto kernel = make_kernel(log, {{"api", broken}});

    kernel->load_resources({doc("Demo.Server", "api")});
    REQUIRE(kernel->boot());

    auto ran = kernel->run();
    REQUIRE_FALSE(ran);
    REQUIRE(ran.error().message() == "port in use");
    REQUIRE(ran.error().get_context("resource") != nullptr);
    REQUIRE(*ran.error().get_context("resource") == "Demo.Server.api");
    REQUIRE(kernel->phase() == KernelPhase::Failed);
}

TEST_CASE("Kernel: teardown failures are aggregated", "[kernel][lifecycle]") {
    std::vector<std::string> log;

    Hooks returns_error;
    returns_error.teardown = []() -> Result<void> { return Err(Error("disk busy")); };
    Hooks throws;
    throws.teardown = []() -> Result<void> { throw std::runtime_error("socket gone"); };
    auto kernel = make_kernel(log, {{"a", returns_error}, {"c", throws}});

    kernel->load_resources({doc("Demo.Server", "a"), doc("Demo.Server", "b"), doc("Demo.Server", "c")});
    REQUIRE(kernel->boot());
    REQUIRE(kernel->run());

    auto stopped = kernel->stop();
    REQUIRE_FALSE(stopped);
    REQUIRE(stopped.error().code() == ErrorCode::ExecutionFailed);

    const auto& message = stopped.error().message();
    REQUIRE(message.find("Shutdown completed with errors:") != std::string::npos);
    REQUIRE(message.find("Demo.Server.a: disk busy") != std::string::npos);
    REQUIRE(message.find("socket gone") != std::string::npos);

    // Every instance was still torn down
    REQUIRE(kernel->instance_ids().empty());
    REQUIRE(kernel->phase() == KernelPhase::Stopped);
}

TEST_CASE("Kernel: snapshot describes every resource", "[kernel][lifecycle][snapshot]") {
    std::vector<std::string> log;

    Hooks stateful;
    stateful.snapshot = []() -> std::optional<json> { return json{{"connections", 4}}; };
    Hooks broken;
    broken.snapshot = []() -> std::optional<json> { throw std::runtime_error("state unavailable"); };
    auto kernel = make_kernel(log, {{"api", stateful}, {"worker", broken}});

    kernel->load_resources({
        doc("Demo.Server", "api", {{"port", 8080}}),
        doc("Demo.Server", "worker"),
        doc("Demo.Server", "idle"),
    });
    REQUIRE(kernel->boot());

    auto snap = kernel->snapshot();
    REQUIRE(snap["phase"] == "Ready");
    REQUIRE(snap["holds"] == 0);
    REQUIRE(snap["timestamp"].is_string());
    REQUIRE(snap["resources"].size() == 3);

    auto find = [&snap](const std::string& name) {
        for (const auto& entry : snap["resources"]) {
            if (entry["name"] == name) {
                return entry;
            }
        }
        FAIL("no snapshot entry for " << name);
        return json();
    };

    auto api = find("api");
    REQUIRE(api["kind"] == "Demo.Server");
    REQUIRE(api["data"] == json{{"port", 8080}});
    REQUIRE(api["metadata"]["name"] == "api");
    REQUIRE(api["snapshot"]["connections"] == 4);

    auto worker = find("worker");
    REQUIRE(worker["snapshotError"] == "state unavailable");
    REQUIRE_FALSE(worker.contains("snapshot"));

    auto idle = find("idle");
    REQUIRE_FALSE(idle.contains("snapshot"));
    REQUIRE_FALSE(idle.contains("snapshotError"));
}

TEST_CASE("Kernel: save_snapshot writes JSON", "[kernel][lifecycle][snapshot]") {
    namespace fs = std::filesystem;
    const fs::path dir = fs::temp_directory_path() / "manifold_test_snapshot";
    fs::remove_all(dir);

    std::vector<std::string> log;
    auto kernel = make_kernel(log);
    kernel->load_resources({doc("Demo.Server", "api")});
    REQUIRE(kernel->boot());

    SECTION("into a new directory") {
        const fs::path path = dir / "nested" / "snapshot.json";
        REQUIRE(kernel->save_snapshot(path));

        std::ifstream in(path);
        json saved = json::parse(in);
        REQUIRE(saved["phase"] == "Ready");
        REQUIRE(saved["resources"][0]["name"] == "api");
    }

    SECTION("into an unwritable location") {
        fs::create_directories(dir);
        std::ofstream(dir / "blocker") << "file";

        auto saved = kernel->save_snapshot(dir / "blocker" / "snapshot.json");
        REQUIRE_FALSE(saved);
        REQUIRE(saved.error().code() == ErrorCode::IOError);
    }

    fs::remove_all(dir);
}

TEST_CASE("Kernel: stats count the lifecycle", "[kernel][lifecycle]") {
    std::vector<std::string> log;
    auto kernel = make_kernel(log);
    kernel->load_resources({doc("Demo.Server", "a"), doc("Demo.Server", "b")});
    REQUIRE(kernel->boot());

    auto stats = kernel->stats();
    REQUIRE(stats.total_resources == 2);
    REQUIRE(stats.live_instances == 2);
    REQUIRE(stats.template_generated == 0);
    REQUIRE(stats.discovery_passes == 1);
    REQUIRE(stats.events_emitted == 2);
    REQUIRE(stats.controllers >= 4);
    REQUIRE(stats.definitions >= 4);
}
