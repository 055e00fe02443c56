/// @file test_hold_counter.cpp
/// @brief Tests for HoldCounter

#include <catch2/catch_test_macros.hpp>
#include <manifold/event/hold_counter.hpp>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace manifold_event;
using manifold_core::Ok;
using manifold_core::Result;

namespace {

bool is_ready(const std::shared_future<void>& future) {
    return future.wait_for(std::chrono::milliseconds(0)) == std::future_status::ready;
}

} // anonymous namespace

TEST_CASE("HoldCounter: idle without holds", "[event][hold]") {
    HoldCounter holds;
    REQUIRE(holds.count() == 0);
    REQUIRE(is_ready(holds.wait_for_idle()));
    REQUIRE(holds.pending_waiters() == 0);
}

TEST_CASE("HoldCounter: waiters resolve when the last hold is released", "[event][hold]") {
    HoldCounter holds;

    auto first = holds.acquire("server");
    auto second = holds.acquire("timer");
    REQUIRE(holds.count() == 2);
    REQUIRE(holds.reasons() == std::vector<std::string>{"server", "timer"});

    auto idle = holds.wait_for_idle();
    REQUIRE_FALSE(is_ready(idle));
    REQUIRE(holds.pending_waiters() == 1);

    first();
    REQUIRE(holds.count() == 1);
    REQUIRE_FALSE(is_ready(idle));

    second();
    REQUIRE(holds.count() == 0);
    REQUIRE(is_ready(idle));
    REQUIRE(holds.pending_waiters() == 0);
}

TEST_CASE("HoldCounter: release is idempotent", "[event][hold]") {
    HoldCounter holds;

    auto a = holds.acquire("a");
    auto b = holds.acquire("b");
    auto copy = a;

    a();
    a();
    copy();
    REQUIRE(a.released());
    REQUIRE(copy.released());
    REQUIRE(holds.count() == 1);
    REQUIRE(holds.reasons() == std::vector<std::string>{"b"});

    b();
    REQUIRE(holds.count() == 0);
}

TEST_CASE("HoldCounter: transitions emit Blocked and Unblocked once", "[event][hold]") {
    EventBus bus;
    std::vector<std::string> events;
    REQUIRE(bus.on("Runtime.*", [&](const Event& e) -> Result<void> {
        events.push_back(e.name);
        return Ok();
    }));

    HoldCounter holds(&bus);
    auto a = holds.acquire("a");
    auto b = holds.acquire("b");
    a();
    b();

    REQUIRE(events == std::vector<std::string>{"Runtime.Blocked", "Runtime.Unblocked"});

    // A second cycle emits again
    auto c = holds.acquire("c");
    c();
    REQUIRE(events.size() == 4);
}

TEST_CASE("HoldCounter: shutdown resolves pending waiters", "[event][hold]") {
    HoldCounter holds;
    auto hold = holds.acquire("forever");

    auto idle = holds.wait_for_idle();
    REQUIRE_FALSE(is_ready(idle));

    holds.shutdown();
    REQUIRE(is_ready(idle));
    REQUIRE(holds.count() == 1);

    // Later waiters do not block either
    REQUIRE(is_ready(holds.wait_for_idle()));
}

TEST_CASE("HoldCounter: release from another thread", "[event][hold]") {
    HoldCounter holds;
    auto hold = holds.acquire("worker");
    auto idle = holds.wait_for_idle();

    std::thread worker([hold] { hold(); });
    idle.wait();
    worker.join();

    REQUIRE(holds.count() == 0);
}

TEST_CASE("HoldRelease: default constructed does nothing", "[event][hold]") {
    HoldRelease release;
    REQUIRE(release.released());
    REQUIRE(release.reason().empty());
    release();
}

TEST_CASE("HoldRelease: outliving the counter is harmless", "[event][hold]") {
    HoldRelease hold;
    std::shared_future<void> idle;
    int unblocked = 0;

    EventBus bus;
    REQUIRE(bus.on("Runtime.Unblocked", [&](const Event&) -> Result<void> {
        ++unblocked;
        return Ok();
    }));

    {
        HoldCounter holds(&bus);
        hold = holds.acquire("late");
        idle = holds.wait_for_idle();
        REQUIRE_FALSE(is_ready(idle));
    }

    // Waiters of a destroyed counter are resolved rather than abandoned
    REQUIRE(is_ready(idle));

    hold();
    REQUIRE(hold.released());
    REQUIRE(hold.reason() == "late");
    REQUIRE(unblocked == 0);
}
