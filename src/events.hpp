#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ircbooks {

enum class EventKind
{
    Connecting,
    Registered,
    Searching,
    ResultCount,
    Downloading,
    Succeeded,
    Failed,
};

/**
 * @brief Structured progress notification for an outer push channel
 */
struct ProgressEvent
{
    EventKind kind;
    std::string session;
    std::string detail;
    std::optional<std::size_t> count;
    std::optional<std::uint64_t> bytes;
    std::optional<std::uint64_t> total;
    std::optional<std::string> reason;
};

using EventSink = std::function<void(const ProgressEvent&)>;

auto event_name(EventKind) -> std::string;
auto to_json(const ProgressEvent&) -> nlohmann::json;

inline auto emit(const EventSink& sink, ProgressEvent event) -> void
{
    if (sink) {
        sink(event);
    }
}

}  // namespace ircbooks
