/// @file event_stream.cpp
/// @brief EventStream implementation

#include <manifold/event/event_stream.hpp>
#include <manifold/core/log.hpp>

#include <chrono>
#include <cstdio>
#include <ctime>

namespace manifold_event {

EventStream::~EventStream() {
    close();
}

manifold_core::Result<void> EventStream::open(const std::filesystem::path& path) {
    std::lock_guard<std::mutex> lock(m_mutex);

    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return manifold_core::Err(manifold_core::Error(manifold_core::ErrorCode::IOError,
                "Failed to create directory for event stream " + path.string() + ": " + ec.message()));
        }
    }

    m_file.open(path, std::ios::out | std::ios::app);
    if (!m_file) {
        return manifold_core::Err(manifold_core::Error(manifold_core::ErrorCode::IOError,
            "Failed to open event stream " + path.string()));
    }
    m_path = path;
    manifold_core::event_logger()->info("Streaming events to {}", path.string());
    return manifold_core::Ok();
}

void EventStream::close() {
    std::lock_guard<std::mutex> lock(m_mutex);
    if (m_file.is_open()) {
        m_file.flush();
        m_file.close();
    }
}

bool EventStream::is_open() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_file.is_open();
}

std::string EventStream::timestamp_now() {
    auto now = std::chrono::system_clock::now();
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
    std::time_t seconds = std::chrono::system_clock::to_time_t(now);

    std::tm utc{};
#ifdef _WIN32
    gmtime_s(&utc, &seconds);
#else
    gmtime_r(&seconds, &utc);
#endif

    char buffer[32];
    std::strftime(buffer, sizeof(buffer), "%Y-%m-%dT%H:%M:%S", &utc);

    char result[40];
    std::snprintf(result, sizeof(result), "%s.%03dZ", buffer, static_cast<int>(millis));
    return result;
}

void EventStream::write(const Event& event) {
    nlohmann::json line = {
        {"timestamp", timestamp_now()},
        {"event", event.name},
        {"payload", event.payload},
    };

    std::lock_guard<std::mutex> lock(m_mutex);
    if (!m_file.is_open()) {
        return;
    }
    m_file << line.dump() << '\n';
    m_file.flush();
}

void EventStream::attach(EventBus& bus) {
    bus.set_observer([this](const Event& event) { write(event); });
}

} // namespace manifold_event
