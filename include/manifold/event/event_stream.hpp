#pragma once

/// @file event_stream.hpp
/// @brief JSON-lines log of every emitted event

#include "event_bus.hpp"

#include <manifold/core/error.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>

namespace manifold_event {

/// Appends `{"timestamp", "event", "payload"}` per event
class EventStream {
public:
    EventStream() = default;
    ~EventStream();

    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;

    /// Open `path` for appending, creating parent directories
    [[nodiscard]] manifold_core::Result<void> open(const std::filesystem::path& path);

    void close();

    [[nodiscard]] bool is_open() const;

    void write(const Event& event);

    /// Route every emission of `bus` into this stream
    void attach(EventBus& bus);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

    /// UTC time as `YYYY-MM-DDTHH:MM:SS.mmmZ`
    [[nodiscard]] static std::string timestamp_now();

private:
    mutable std::mutex m_mutex;
    std::ofstream m_file;
    std::filesystem::path m_path;
};

} // namespace manifold_event
