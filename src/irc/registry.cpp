#include "irc/registry.hpp"

#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

namespace ircbooks::irc {

SessionRegistry::SessionRegistry(ConnectionManager& connections, EventSink events) :
  _connections(connections),
  _events(std::move(events))
{
}

SessionRegistry::~SessionRegistry() { close_all(); }

auto SessionRegistry::acquire(std::stop_token stop)
  -> tl::expected<SessionId, ConnectionError>
{
    std::vector<std::shared_ptr<Session>> stale;
    std::optional<SessionId> reused;
    SessionId id;

    {
        std::lock_guard lock(_mutex);

        for (auto it = _sessions.begin(); it != _sessions.end();) {
            if (_connections.is_healthy(*it->second)) {
                reused = it->first;
                break;
            }

            stale.push_back(std::move(it->second));
            it = _sessions.erase(it);
        }

        if (not reused) {
            id = fmt::format("irc-{}", _next_id++);
        }
    }

    for (auto& session : stale) {
        spdlog::info("[{}] Session is not healthy, reconnecting", session->id());
        session->close("Reconnecting");
    }

    if (reused) {
        spdlog::debug("Reuse session {}", *reused);
        return *reused;
    }

    auto session = _connections.connect(id, stop, _events);
    if (not session) {
        return tl::make_unexpected(session.error());
    }

    {
        std::lock_guard lock(_mutex);
        _sessions.emplace(id, std::move(*session));
    }

    return id;
}

auto SessionRegistry::get(const SessionId& id) const -> std::shared_ptr<Session>
{
    std::lock_guard lock(_mutex);

    auto it = _sessions.find(id);
    if (it == _sessions.end()) {
        return nullptr;
    }

    return it->second;
}

auto SessionRegistry::close(const SessionId& id) -> void
{
    std::shared_ptr<Session> session;

    {
        std::lock_guard lock(_mutex);

        auto it = _sessions.find(id);
        if (it == _sessions.end()) {
            spdlog::debug("Session {} already closed", id);
            return;
        }

        session = std::move(it->second);
        _sessions.erase(it);
    }

    session->close();
}

auto SessionRegistry::close_all() -> void
{
    std::map<SessionId, std::shared_ptr<Session>> sessions;

    {
        std::lock_guard lock(_mutex);
        sessions.swap(_sessions);
    }

    for (auto& [id, session] : sessions) {
        session->close();
    }
}

auto SessionRegistry::size() const -> std::size_t
{
    std::lock_guard lock(_mutex);
    return _sessions.size();
}

}  // namespace ircbooks::irc
