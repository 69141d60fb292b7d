#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <stop_token>
#include <vector>

#include <tl/expected.hpp>

#include "errors.hpp"
#include "events.hpp"
#include "irc/connection.hpp"
#include "irc/session.hpp"

namespace ircbooks::irc {

/**
 * @brief Owns every live session.
 *
 * The map mutex is held for map operations only; connecting, QUIT and
 * socket teardown always happen outside of it.
 */
class SessionRegistry
{
 public:
    explicit SessionRegistry(ConnectionManager& connections, EventSink events = {});
    ~SessionRegistry();

    SessionRegistry(const SessionRegistry&) = delete;
    SessionRegistry& operator=(const SessionRegistry&) = delete;

    /**
     * @brief Reuse a healthy session or connect a new one
     */
    auto acquire(std::stop_token stop = {})
      -> tl::expected<SessionId, ConnectionError>;

    /**
     * @return nullptr if there is no such session
     */
    auto get(const SessionId& id) const -> std::shared_ptr<Session>;

    /**
     * @brief QUIT and tear down; unknown or already closed ids are ignored
     */
    auto close(const SessionId& id) -> void;
    auto close_all() -> void;

    auto size() const -> std::size_t;
    auto connections() -> ConnectionManager& { return _connections; }

 private:
    ConnectionManager& _connections;
    EventSink _events;

    mutable std::mutex _mutex;
    std::map<SessionId, std::shared_ptr<Session>> _sessions;
    std::uint64_t _next_id = 1;
};

}  // namespace ircbooks::irc
