#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include <stop_token>
#include <string>

#include <tl/expected.hpp>

#include "config.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "irc/session.hpp"

namespace ircbooks::irc {

/**
 * @brief Opens sessions: transport with retry/backoff, NICK/USER
 * registration with nickname collision handling, channel JOIN.
 */
class ConnectionManager
{
 public:
    explicit ConnectionManager(Config config);

    /**
     * @brief Connect, register and join the configured channel.
     *
     * The socket connect is retried with exponential backoff up to
     * max_connect_attempts per transport. Registration failures are
     * terminal.
     */
    auto connect(
      SessionId id, std::stop_token stop = {}, const EventSink& events = {}
    ) -> tl::expected<std::shared_ptr<Session>, ConnectionError>;

    /**
     * @brief Socket open and inbound activity within stale_after
     */
    auto is_healthy(const Session& session) const -> bool;

    auto config() const -> const Config& { return _config; }

    /// Nickname to try after `attempt` collisions (1-based)
    auto next_nickname(std::size_t attempt) const -> std::string;

 private:
    struct Transport
    {
        std::uint16_t port;
        bool tls;
    };

    auto _open_transport(const SessionId& id, std::stop_token stop)
      -> tl::expected<std::shared_ptr<Session>, ConnectionError>;

    auto _open_with_retry(
      const SessionId& id, Transport transport, std::stop_token stop
    ) -> tl::expected<std::shared_ptr<Session>, ConnectionError>;

    auto _register(Session& session, std::stop_token stop)
      -> tl::expected<void, ConnectionError>;

    auto _join(Session& session, std::stop_token stop) -> void;

    const Config _config;
};

}  // namespace ircbooks::irc
