#pragma once

/// @file hold_counter.hpp
/// @brief Keepalive reference count deferring process exit
///
/// The 0 -> 1 transition emits `Runtime.Blocked`, N -> 0 emits `Runtime.Unblocked`
/// and resolves every pending idle waiter exactly once.

#include "event_bus.hpp"

#include <atomic>
#include <future>
#include <memory>
#include <string>
#include <vector>

namespace manifold_event {

/// Counter state shared with outstanding release handles
struct HoldState;

// =============================================================================
// HoldRelease
// =============================================================================

/// Releases one hold; calling it again (or through a copy) does nothing
///
/// A release after the issuing HoldCounter is destroyed is a no-op.
class HoldRelease {
public:
    HoldRelease() = default;

    void operator()() const;

    [[nodiscard]] bool released() const noexcept;
    [[nodiscard]] const std::string& reason() const;

private:
    friend class HoldCounter;

    struct State {
        std::atomic<bool> released{false};
        std::weak_ptr<HoldState> owner;
        std::string reason;
    };

    explicit HoldRelease(std::shared_ptr<State> state) : m_state(std::move(state)) {}

    std::shared_ptr<State> m_state;
};

// =============================================================================
// HoldCounter
// =============================================================================

class HoldCounter {
public:
    /// @param bus receives Blocked/Unblocked, may be null
    explicit HoldCounter(EventBus* bus = nullptr);

    ~HoldCounter();

    HoldCounter(const HoldCounter&) = delete;
    HoldCounter& operator=(const HoldCounter&) = delete;

    /// Take one hold
    [[nodiscard]] HoldRelease acquire(const std::string& reason = {});

    /// Ready immediately when no hold is outstanding
    [[nodiscard]] std::shared_future<void> wait_for_idle();

    /// Resolve every pending waiter regardless of the count
    void shutdown();

    [[nodiscard]] std::size_t count() const;
    [[nodiscard]] std::size_t pending_waiters() const;

    /// Reasons of the outstanding holds
    [[nodiscard]] std::vector<std::string> reasons() const;

private:
    std::shared_ptr<HoldState> m_state;
};

} // namespace manifold_event
