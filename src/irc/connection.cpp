#include "irc/connection.hpp"

#include <chrono>
#include <cstddef>
#include <memory>
#include <stop_token>
#include <string>
#include <vector>

#include <asio/error.hpp>
#include <fmt/core.h>
#include <magic_enum.hpp>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include "misc/cancel.hpp"
#include "proto/serialize.hpp"
#include "proto/types.hpp"
#include "proto/utils.hpp"

namespace ircbooks::irc {

namespace {

using Clock = std::chrono::steady_clock;

auto to_connection_error(const asio::error_code& ec) -> ConnectionError
{
    if (ec == asio::error::operation_aborted) {
        return {ConnectionErrorCode::CANCELLED, "connect cancelled"};
    }

    if (ec == asio::error::timed_out) {
        return {ConnectionErrorCode::TIMEOUT, ec.message()};
    }

    return {ConnectionErrorCode::REFUSED, ec.message()};
}

auto is_nick_rejected(const proto::Message& msg) -> bool
{
    using namespace proto::numeric;

    return msg.is(NICKNAME_IN_USE) or msg.is(ERRONEUS_NICKNAME) or
           msg.is(NICK_COLLISION) or msg.is(UNAVAILABLE_RESOURCE);
}

}  // namespace

ConnectionManager::ConnectionManager(Config config) :
  _config(std::move(config))
{
}

auto ConnectionManager::connect(
  SessionId id, std::stop_token stop, const EventSink& events
) -> tl::expected<std::shared_ptr<Session>, ConnectionError>
{
    emit(
      events,
      ProgressEvent{
        .kind = EventKind::Connecting,
        .session = id,
        .detail = fmt::format("{}:{}", _config.server, _config.port),
      }
    );

    auto session = _open_transport(id, stop);
    if (not session) {
        spdlog::error("[{}] Connection failed: {}", id, session.error().message());
        return session;
    }

    (*session)->start();

    if (auto registered = _register(**session, stop); not registered) {
        spdlog::error(
          "[{}] Registration failed: {}", id, registered.error().message()
        );
        (*session)->close("Registration failed");
        return tl::make_unexpected(registered.error());
    }

    _join(**session, stop);

    if (stop.stop_requested()) {
        (*session)->close();
        return tl::make_unexpected(
          ConnectionError{ConnectionErrorCode::CANCELLED, "connect cancelled"}
        );
    }

    (*session)->set_state(SessionState::Registered);

    spdlog::info(
      "[{}] Registered on {} as {}", id, _config.server, (*session)->nickname()
    );

    emit(
      events,
      ProgressEvent{
        .kind = EventKind::Registered,
        .session = id,
        .detail = (*session)->nickname(),
      }
    );

    return session;
}

auto ConnectionManager::is_healthy(const Session& session) const -> bool
{
    if (not session.is_open()) {
        return false;
    }

    return Clock::now() - session.last_activity() < _config.stale_after;
}

auto ConnectionManager::next_nickname(std::size_t attempt) const
  -> std::string
{
    const auto& suffixes = _config.nick_suffixes;

    if (attempt > 0 and attempt <= suffixes.size()) {
        return _config.nickname + suffixes[attempt - 1];
    }

    return fmt::format("{}{}", _config.nickname, attempt);
}

auto ConnectionManager::_open_transport(
  const SessionId& id, std::stop_token stop
) -> tl::expected<std::shared_ptr<Session>, ConnectionError>
{
    std::vector<Transport> transports{{_config.port, _config.tls}};

    if (_config.tls and _config.plain_fallback) {
        transports.push_back({_config.plain_port, false});
    }

    tl::expected<std::shared_ptr<Session>, ConnectionError> result;

    for (const auto& transport : transports) {
        result = _open_with_retry(id, transport, stop);

        if (result or result.error().code == ConnectionErrorCode::CANCELLED) {
            return result;
        }

        if (transport.tls and _config.plain_fallback) {
            spdlog::warn(
              "[{}] TLS connection failed ({}), falling back to plain text",
              id, result.error().message()
            );
        }
    }

    return result;
}

auto ConnectionManager::_open_with_retry(
  const SessionId& id, Transport transport, std::stop_token stop
) -> tl::expected<std::shared_ptr<Session>, ConnectionError>
{
    ConnectionError last_error{ConnectionErrorCode::REFUSED, "no attempt made"};

    for (std::size_t attempt = 1; attempt <= _config.max_connect_attempts;
         attempt++) {
        spdlog::info(
          "[{}] Connecting to {}:{} (tls: {}, attempt {}/{})", id,
          _config.server, transport.port, transport.tls, attempt,
          _config.max_connect_attempts
        );

        auto session = std::make_shared<Session>(id, _config);
        auto opened =
          session->open(_config.server, transport.port, transport.tls, stop);

        if (opened) {
            return session;
        }

        last_error = to_connection_error(opened.error());

        if (last_error.code == ConnectionErrorCode::CANCELLED) {
            return tl::make_unexpected(last_error);
        }

        spdlog::warn(
          "[{}] Connect attempt {} failed: {}", id, attempt, last_error.message()
        );

        if (attempt == _config.max_connect_attempts) {
            break;
        }

        const auto delay = _config.backoff_base * (1 << (attempt - 1));

        if (not utils::sleep_for(delay, stop)) {
            return tl::make_unexpected(
              ConnectionError{ConnectionErrorCode::CANCELLED, "connect cancelled"}
            );
        }
    }

    last_error.detail = fmt::format(
      "{} after {} attempts", last_error.detail, _config.max_connect_attempts
    );

    return tl::make_unexpected(last_error);
}

auto ConnectionManager::_register(Session& session, std::stop_token stop)
  -> tl::expected<void, ConnectionError>
{
    session.set_state(SessionState::Registering);

    auto nickname = _config.nickname;
    session.set_nickname(nickname);

    auto sent = session.send(proto::pack_nick(nickname)).and_then([&] {
        return session.send(proto::pack_user(nickname, _config.realname));
    });

    if (not sent) {
        return tl::make_unexpected(to_connection_error(sent.error()));
    }

    const auto deadline = Clock::now() + _config.registration_timeout;
    std::size_t retries = 0;

    while (true) {
        auto msg = session.next_message(deadline, stop);

        if (not msg) {
            if (stop.stop_requested()) {
                return tl::make_unexpected(ConnectionError{
                  ConnectionErrorCode::CANCELLED, "registration cancelled"
                });
            }

            if (session.inbox_closed()) {
                return tl::make_unexpected(ConnectionError{
                  ConnectionErrorCode::REGISTRATION_FAILED,
                  "connection closed during registration"
                });
            }

            return tl::make_unexpected(ConnectionError{
              ConnectionErrorCode::TIMEOUT, "no welcome from server"
            });
        }

        if (msg->is(proto::numeric::WELCOME) or
            msg->is(proto::numeric::MY_INFO)) {
            if (not msg->params.empty()) {
                session.set_nickname(msg->params.front());
            }
            return {};
        }

        if (is_nick_rejected(*msg)) {
            if (retries >= _config.max_nick_retries) {
                return tl::make_unexpected(ConnectionError{
                  ConnectionErrorCode::REGISTRATION_FAILED,
                  fmt::format(
                    "nickname rejected {} times, last: {}", retries + 1,
                    nickname
                  )
                });
            }

            retries++;
            const auto rejected = nickname;
            nickname = next_nickname(retries);
            session.set_nickname(nickname);

            spdlog::warn(
              "[{}] Nickname {} rejected ({}), trying {}", session.id(),
              rejected, msg->command, nickname
            );

            if (auto resent = session.send(proto::pack_nick(nickname));
                not resent) {
                return tl::make_unexpected(to_connection_error(resent.error()));
            }

            continue;
        }

        if (msg->is("ERROR")) {
            return tl::make_unexpected(ConnectionError{
              ConnectionErrorCode::REGISTRATION_FAILED,
              std::string(msg->trailing())
            });
        }
    }
}

auto ConnectionManager::_join(Session& session, std::stop_token stop) -> void
{
    const auto& channel = _config.channel;

    if (auto sent = session.send(proto::pack_join(channel)); not sent) {
        spdlog::warn(
          "[{}] Can not send JOIN {}: {}", session.id(), channel,
          sent.error().message()
        );
        return;
    }

    const auto deadline = Clock::now() + _config.join_timeout;

    while (auto msg = session.next_message(deadline, stop)) {
        const bool own_join =
          msg->is("JOIN") and
          proto::utils::iequals(msg->nick(), session.nickname()) and
          proto::utils::iequals(msg->trailing(), channel);

        const bool end_of_names =
          msg->is(proto::numeric::END_OF_NAMES) and msg->params.size() >= 2 and
          proto::utils::iequals(msg->params[1], channel);

        if (own_join or end_of_names) {
            spdlog::debug("[{}] Joined {}", session.id(), channel);
            return;
        }
    }

    spdlog::warn("[{}] JOIN {} not confirmed in time", session.id(), channel);
}

}  // namespace ircbooks::irc
