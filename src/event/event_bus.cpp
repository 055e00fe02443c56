/// @file event_bus.cpp
/// @brief EventBus implementation

#include <manifold/event/event_bus.hpp>
#include <manifold/core/log.hpp>

#include <regex>
#include <sstream>

namespace manifold_event {

using manifold_core::Err;
using manifold_core::Error;
using manifold_core::ErrorCode;
using manifold_core::Ok;
using manifold_core::Result;

namespace {

std::vector<std::string> split_segments(const std::string& name) {
    std::vector<std::string> segments;
    std::size_t start = 0;
    while (true) {
        auto dot = name.find('.', start);
        segments.push_back(name.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return segments;
}

} // anonymous namespace

bool EventBus::is_valid_name(const std::string& name) {
    static const std::regex k_name_pattern(
        R"(^(\*|[A-Za-z_][A-Za-z0-9_-]*)(\.(\*|[A-Za-z_][A-Za-z0-9_-]*))*$)");
    return std::regex_match(name, k_name_pattern);
}

bool EventBus::is_emittable_name(const std::string& name) {
    if (name.empty() || name.find('*') != std::string::npos) {
        return false;
    }
    for (const auto& segment : split_segments(name)) {
        if (segment.empty()) {
            return false;
        }
    }
    return true;
}

bool EventBus::matches(const std::string& pattern, const std::string& name) {
    if (pattern == name) {
        return true;
    }
    if (pattern.find('*') == std::string::npos) {
        return false;
    }

    auto expected = split_segments(pattern);
    auto actual = split_segments(name);
    if (expected.size() != actual.size()) {
        return false;
    }
    for (std::size_t i = 0; i < expected.size(); ++i) {
        if (expected[i] != "*" && expected[i] != actual[i]) {
            return false;
        }
    }
    return true;
}

Result<SubscriberId> EventBus::subscribe(const std::string& pattern, EventHandler handler, bool once) {
    if (!is_valid_name(pattern)) {
        return Err<SubscriberId>(Error(ErrorCode::InvalidEvent, "Invalid event name: \"" + pattern + "\""));
    }
    if (!handler) {
        return Err<SubscriberId>(Error(ErrorCode::InvalidArgument, "Empty handler for event " + pattern));
    }

    std::lock_guard<std::mutex> lock(m_mutex);
    SubscriberId id(m_next_id++);
    m_subscriptions.emplace(id.id, Subscription{pattern, std::move(handler), once});
    return Ok(id);
}

Result<SubscriberId> EventBus::on(const std::string& pattern, EventHandler handler) {
    return subscribe(pattern, std::move(handler), false);
}

Result<SubscriberId> EventBus::once(const std::string& pattern, EventHandler handler) {
    return subscribe(pattern, std::move(handler), true);
}

bool EventBus::off(SubscriberId id) {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscriptions.erase(id.id) > 0;
}

void EventBus::clear() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_subscriptions.clear();
}

void EventBus::set_observer(EmitObserver observer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_observer = std::move(observer);
}

Result<void> EventBus::emit(const std::string& name, nlohmann::json payload) {
    if (!is_emittable_name(name)) {
        return Err(Error(ErrorCode::InvalidEvent, "Invalid event name: \"" + name + "\""));
    }

    Event event{name, std::move(payload)};

    // Handlers run outside the lock so they may subscribe or emit themselves
    std::vector<EventHandler> handlers;
    EmitObserver observer;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_emitted;
        observer = m_observer;
        for (auto it = m_subscriptions.begin(); it != m_subscriptions.end();) {
            if (matches(it->second.pattern, name)) {
                handlers.push_back(it->second.handler);
                if (it->second.once) {
                    it = m_subscriptions.erase(it);
                    continue;
                }
            }
            ++it;
        }
    }

    if (observer) {
        observer(event);
    }

    manifold_core::event_logger()->trace("emit {} -> {} handler(s)", name, handlers.size());

    std::vector<std::string> failures;
    for (const auto& handler : handlers) {
        try {
            auto result = handler(event);
            if (!result) {
                failures.push_back(result.error().message());
            }
        } catch (const std::exception& e) {
            failures.push_back(e.what());
        }
    }

    if (failures.empty()) {
        return Ok();
    }

    std::ostringstream oss;
    oss << failures.size() << " handler(s) failed for event " << name << ": ";
    for (std::size_t i = 0; i < failures.size(); ++i) {
        if (i > 0) oss << "; ";
        oss << failures[i];
    }
    manifold_core::event_logger()->warn("{}", oss.str());
    return Err(Error(ErrorCode::ExecutionFailed, oss.str()));
}

bool EventBus::has_handlers(const std::string& name) const {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (const auto& [id, sub] : m_subscriptions) {
        if (matches(sub.pattern, name)) {
            return true;
        }
    }
    return false;
}

std::size_t EventBus::handler_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_subscriptions.size();
}

std::uint64_t EventBus::emitted_count() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_emitted;
}

} // namespace manifold_event
