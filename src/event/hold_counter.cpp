/// @file hold_counter.cpp
/// @brief HoldCounter implementation

#include <manifold/event/hold_counter.hpp>
#include <manifold/core/log.hpp>

#include <algorithm>
#include <mutex>

namespace manifold_event {

struct HoldState {
    /// Cleared when the counter goes away
    EventBus* bus = nullptr;
    mutable std::mutex mutex;
    std::size_t count = 0;
    std::vector<std::string> reasons;
    std::vector<std::promise<void>> waiters;
    bool shutdown = false;
    bool closed = false;

    void resolve_waiters_locked() {
        for (auto& waiter : waiters) {
            waiter.set_value();
        }
        waiters.clear();
    }
};

namespace {

void emit_transition(EventBus* bus, const char* name, nlohmann::json payload) {
    if (!bus) {
        return;
    }
    auto result = bus->emit(name, std::move(payload));
    if (!result) {
        manifold_core::event_logger()->warn("{} handler failed: {}", name, result.error().message());
    }
}

void release_hold(HoldState& state, const std::string& reason) {
    std::size_t count = 0;
    EventBus* bus = nullptr;
    {
        std::lock_guard<std::mutex> lock(state.mutex);
        if (state.closed || state.count == 0) {
            return;
        }
        count = --state.count;
        auto it = std::find(state.reasons.begin(), state.reasons.end(), reason);
        if (it != state.reasons.end()) {
            state.reasons.erase(it);
        }
        if (count == 0) {
            state.resolve_waiters_locked();
        }
        bus = state.bus;
    }

    manifold_core::event_logger()->debug("Hold released ({}), count {}", reason, count);
    if (count == 0) {
        emit_transition(bus, "Runtime.Unblocked", {{"count", count}});
    }
}

} // anonymous namespace

// =============================================================================
// HoldRelease
// =============================================================================

void HoldRelease::operator()() const {
    if (!m_state) {
        return;
    }
    if (m_state->released.exchange(true)) {
        return;
    }
    if (auto owner = m_state->owner.lock()) {
        release_hold(*owner, m_state->reason);
    }
}

bool HoldRelease::released() const noexcept {
    return !m_state || m_state->released.load();
}

const std::string& HoldRelease::reason() const {
    static const std::string k_empty;
    return m_state ? m_state->reason : k_empty;
}

// =============================================================================
// HoldCounter
// =============================================================================

HoldCounter::HoldCounter(EventBus* bus)
    : m_state(std::make_shared<HoldState>()) {
    m_state->bus = bus;
}

HoldCounter::~HoldCounter() {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    m_state->closed = true;
    m_state->bus = nullptr;
    m_state->resolve_waiters_locked();
}

HoldRelease HoldCounter::acquire(const std::string& reason) {
    std::size_t count = 0;
    {
        std::lock_guard<std::mutex> lock(m_state->mutex);
        count = ++m_state->count;
        m_state->reasons.push_back(reason);
    }

    manifold_core::event_logger()->debug("Hold acquired ({}), count {}", reason, count);
    if (count == 1) {
        emit_transition(m_state->bus, "Runtime.Blocked", {{"reason", reason}, {"count", count}});
    }

    auto state = std::make_shared<HoldRelease::State>();
    state->owner = m_state;
    state->reason = reason;
    return HoldRelease(std::move(state));
}

std::shared_future<void> HoldCounter::wait_for_idle() {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    std::promise<void> promise;
    std::shared_future<void> future = promise.get_future().share();
    if (m_state->count == 0 || m_state->shutdown) {
        promise.set_value();
    } else {
        m_state->waiters.push_back(std::move(promise));
    }
    return future;
}

void HoldCounter::shutdown() {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    m_state->shutdown = true;
    m_state->resolve_waiters_locked();
}

std::size_t HoldCounter::count() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->count;
}

std::size_t HoldCounter::pending_waiters() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->waiters.size();
}

std::vector<std::string> HoldCounter::reasons() const {
    std::lock_guard<std::mutex> lock(m_state->mutex);
    return m_state->reasons;
}

} // namespace manifold_event
