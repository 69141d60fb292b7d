#include "events.hpp"

#include <string>

#include <magic_enum.hpp>
#include <nlohmann/json.hpp>


namespace ircbooks {

auto event_name(EventKind kind) -> std::string
{
    switch (kind) {
        case EventKind::Connecting: return "connecting";
        case EventKind::Registered: return "registered";
        case EventKind::Searching: return "searching";
        case EventKind::ResultCount: return "result_count";
        case EventKind::Downloading: return "downloading";
        case EventKind::Succeeded: return "succeeded";
        case EventKind::Failed: return "failed";
    }

    return std::string(magic_enum::enum_name(kind));
}

auto to_json(const ProgressEvent& event) -> nlohmann::json
{
    nlohmann::json json{
      {"event", event_name(event.kind)},
      {"session", event.session},
    };

    if (not event.detail.empty()) {
        json["detail"] = event.detail;
    }

    if (event.count) {
        json["count"] = *event.count;
    }

    if (event.bytes) {
        json["bytes"] = *event.bytes;
    }

    if (event.total) {
        json["total"] = *event.total;
    }

    if (event.reason) {
        json["reason"] = *event.reason;
    }

    return json;
}

}  // namespace ircbooks
