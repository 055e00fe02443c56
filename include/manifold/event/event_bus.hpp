#pragma once

/// @file event_bus.hpp
/// @brief In-process publish/subscribe for lifecycle and resource events
///
/// Subscription patterns are dot-separated identifiers (`Runtime.Started`,
/// `Http.Server.*.Listening`) where `*` stands for any single segment. Emitted
/// names carry resource names verbatim, so only `*` and empty segments are
/// refused there. Handlers of one event run without a defined order;
/// `emit` returns only after all of them have run and fails if any failed.

#include <manifold/core/error.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace manifold_event {

// =============================================================================
// SubscriberId
// =============================================================================

/// Unique identifier for a subscription
struct SubscriberId {
    std::uint64_t id = 0;

    constexpr SubscriberId() = default;
    constexpr explicit SubscriberId(std::uint64_t value) : id(value) {}

    [[nodiscard]] constexpr bool is_valid() const noexcept { return id != 0; }

    constexpr auto operator<=>(const SubscriberId&) const noexcept = default;
    constexpr bool operator==(const SubscriberId&) const noexcept = default;
};

// =============================================================================
// Event
// =============================================================================

struct Event {
    std::string name;
    nlohmann::json payload;
};

/// Handler returning an error (or throwing) fails the emission
using EventHandler = std::function<manifold_core::Result<void>(const Event&)>;

/// Sees every successfully validated emission before handlers run
using EmitObserver = std::function<void(const Event&)>;

// =============================================================================
// EventBus
// =============================================================================

class EventBus {
public:
    EventBus() = default;

    EventBus(const EventBus&) = delete;
    EventBus& operator=(const EventBus&) = delete;

    // =========================================================================
    // Subscribing
    // =========================================================================

    /// Subscribe to `pattern`
    ///
    /// @return ERR_INVALID_EVENT for a malformed pattern
    [[nodiscard]] manifold_core::Result<SubscriberId> on(const std::string& pattern, EventHandler handler);

    /// Subscribe for a single delivery
    [[nodiscard]] manifold_core::Result<SubscriberId> once(const std::string& pattern, EventHandler handler);

    /// Remove a subscription
    ///
    /// @return true if it existed
    bool off(SubscriberId id);

    /// Remove every subscription
    void clear();

    // =========================================================================
    // Publishing
    // =========================================================================

    /// Deliver `name` to every matching handler
    ///
    /// Every handler runs even if an earlier one failed; failures are joined into one
    /// ERR_EXECUTION_FAILED naming the event.
    [[nodiscard]] manifold_core::Result<void> emit(const std::string& name,
                                                   nlohmann::json payload = nullptr);

    void set_observer(EmitObserver observer);

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] bool has_handlers(const std::string& name) const;
    [[nodiscard]] std::size_t handler_count() const;
    [[nodiscard]] std::uint64_t emitted_count() const;

    /// `Name(.Name)*`; a segment is `*` or an identifier that may also contain `-`
    [[nodiscard]] static bool is_valid_name(const std::string& name);

    /// Non-empty dotted name with no empty segment and no `*`
    [[nodiscard]] static bool is_emittable_name(const std::string& name);

    /// Segment-wise match of `name` against `pattern`
    [[nodiscard]] static bool matches(const std::string& pattern, const std::string& name);

private:
    struct Subscription {
        std::string pattern;
        EventHandler handler;
        bool once = false;
    };

    manifold_core::Result<SubscriberId> subscribe(const std::string& pattern, EventHandler handler, bool once);

    mutable std::mutex m_mutex;
    std::unordered_map<std::uint64_t, Subscription> m_subscriptions;
    std::uint64_t m_next_id = 1;
    std::uint64_t m_emitted = 0;
    EmitObserver m_observer;
};

} // namespace manifold_event
