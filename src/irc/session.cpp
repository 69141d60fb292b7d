#include "irc/session.hpp"

#include <chrono>
#include <future>
#include <istream>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>

#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/post.hpp>
#include <asio/read_until.hpp>
#include <asio/ssl.hpp>
#include <asio/write.hpp>
#include <fmt/core.h>
#include <magic_enum.hpp>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include "misc/logging.hpp"
#include "proto/deserialize.hpp"
#include "proto/serialize.hpp"
#include "proto/utils.hpp"

namespace ircbooks::irc {

constexpr const std::size_t MAX_READ_BUFFER = 64 * 1024;
constexpr const auto WRITE_TIMEOUT = std::chrono::seconds(10);

Session::Session(SessionId id, const Config& config) :
  _id(std::move(id)),
  _config(config),
  _ssl_context(asio::ssl::context::tls_client),
  _read_buffer(MAX_READ_BUFFER),
  _timer(_io),
  _keepalive_timer(_io),
  _last_activity(Clock::now().time_since_epoch().count()),
  _nickname(config.nickname),
  _inbox(config.inbox_capacity),
  _limiter(config.command_interval),
  _logger(utils::internal_logger())
{
}

Session::~Session() { close(); }

auto Session::open(
  const std::string& host, uint16_t port, bool tls, std::stop_token stop
) -> tl::expected<void, asio::error_code>
{
    using asio::ip::tcp;

    _host = host;
    _port = port;
    _tls = tls;

    set_state(SessionState::Connecting);

    if (_tls) {
        asio::error_code ignored;
        _ssl_context.set_default_verify_paths(ignored);

        if (_config.tls_verify) {
            _ssl_context.set_verify_mode(asio::ssl::verify_peer);
            _ssl_context.set_verify_callback(
              asio::ssl::host_name_verification(host)
            );
        }
        else {
            _ssl_context.set_verify_mode(asio::ssl::verify_none);
        }
    }

    _stream = std::make_unique<asio::ssl::stream<tcp::socket>>(
      _io, _ssl_context
    );

    tcp::resolver resolver(_io);
    asio::error_code ec;
    const auto endpoints = resolver.resolve(host, std::to_string(port), ec);

    if (ec) {
        spdlog::warn("[{}] Can not resolve {}: {}", _id, host, ec.message());
        return tl::make_unexpected(ec);
    }

    _logger->debug("[{}] Connect to {}:{} (tls: {})", _id, host, port, tls);

    _op_error = asio::error::operation_aborted;
    asio::async_connect(
      _stream->next_layer(), endpoints,
      [this](asio::error_code ec, const tcp::endpoint&) {
          _timer.cancel();
          _op_error = ec;
      }
    );

    if (auto run = _run_for(_config.connect_timeout, stop); not run) {
        return run;
    }

    if (_op_error) {
        return tl::make_unexpected(_op_error);
    }

    if (not _tls) {
        return {};
    }

    if (not SSL_set_tlsext_host_name(_stream->native_handle(), host.c_str())) {
        return tl::make_unexpected(
          asio::error_code(asio::error::invalid_argument)
        );
    }

    _op_error = asio::error::operation_aborted;
    _stream->async_handshake(
      asio::ssl::stream_base::client, [this](asio::error_code ec) {
          _timer.cancel();
          _op_error = ec;
      }
    );

    if (auto run = _run_for(_config.connect_timeout, stop); not run) {
        return run;
    }

    if (_op_error) {
        spdlog::warn("[{}] TLS handshake failed: {}", _id, _op_error.message());
        return tl::make_unexpected(_op_error);
    }

    return {};
}

auto Session::start() -> void
{
    _open = true;
    _touch();

    _work.emplace(asio::make_work_guard(_io));

    _start_read();
    _arm_keepalive();

    _io.restart();
    _worker = std::jthread([this] {
        _io.run();
        _logger->debug("[{}] Worker stopped", _id);
    });
}

auto Session::close(std::string_view reason) -> void
{
    if (_closed.exchange(true)) {
        return;
    }

    set_state(SessionState::Closing);
    _stop.request_stop();

    if (_open) {
        auto done = send_raw(proto::pack_quit(reason));
        if (done.wait_for(_config.quit_timeout) != std::future_status::ready) {
            spdlog::debug("[{}] QUIT not flushed in time", _id);
        }
    }

    if (_worker.joinable()) {
        asio::post(_io, [this] { _shutdown(); });
        _worker.join();
    }
    else {
        _shutdown();
    }

    _inbox.close();
    set_state(SessionState::Closed);

    spdlog::info("[{}] Session closed", _id);
}

auto Session::send_raw(std::string line) -> std::future<asio::error_code>
{
    auto done = std::make_shared<std::promise<asio::error_code>>();
    auto future = done->get_future();

    if (not _open) {
        done->set_value(asio::error::not_connected);
        return future;
    }

    asio::post(_io, [this, line = std::move(line), done]() mutable {
        _enqueue(std::move(line), std::move(done));
    });

    return future;
}

auto Session::send(std::string line) -> tl::expected<void, asio::error_code>
{
    auto done = send_raw(std::move(line));

    if (done.wait_for(WRITE_TIMEOUT) != std::future_status::ready) {
        return tl::make_unexpected(asio::error::timed_out);
    }

    try {
        if (auto ec = done.get()) {
            return tl::make_unexpected(ec);
        }
    } catch (const std::future_error&) {
        // Worker went away before the line was written
        return tl::make_unexpected(asio::error::not_connected);
    }

    return {};
}

auto Session::send_command(std::string line, std::stop_token stop)
  -> tl::expected<void, asio::error_code>
{
    if (not _open) {
        return tl::make_unexpected(asio::error::not_connected);
    }

    if (not _limiter.acquire(stop)) {
        return tl::make_unexpected(asio::error::operation_aborted);
    }

    return send(std::move(line));
}

auto Session::next_message(Clock::time_point deadline, std::stop_token stop)
  -> std::optional<proto::Message>
{
    return _inbox.pop_until(deadline, stop);
}

auto Session::last_activity() const -> Clock::time_point
{
    return Clock::time_point(Clock::duration(_last_activity.load()));
}

auto Session::nickname() const -> std::string
{
    std::lock_guard lock(_mutex);
    return _nickname;
}

auto Session::set_nickname(std::string nickname) -> void
{
    std::lock_guard lock(_mutex);
    _nickname = std::move(nickname);
}

auto Session::state() const -> SessionState
{
    std::lock_guard lock(_mutex);
    return _state;
}

auto Session::set_state(SessionState state) -> void
{
    std::lock_guard lock(_mutex);

    if (_state != state) {
        spdlog::debug(
          "[{}] {} -> {}", _id, magic_enum::enum_name(_state),
          magic_enum::enum_name(state)
        );
    }

    _state = state;
}

auto Session::_run_for(std::chrono::milliseconds timeout, std::stop_token stop)
  -> tl::expected<void, asio::error_code>
{
    _timed_out = false;
    _cancelled = false;

    _timer.expires_after(timeout);
    _timer.async_wait([this](asio::error_code ec) {
        if (not ec) {
            _timed_out = true;
            _stream->next_layer().cancel();
        }
    });

    std::stop_callback on_stop(stop, [this] {
        asio::post(_io, [this] {
            _cancelled = true;
            _timer.cancel();
            _stream->next_layer().cancel();
        });
    });

    _io.restart();
    _io.run();

    if (_cancelled or stop.stop_requested()) {
        return tl::make_unexpected(asio::error::operation_aborted);
    }

    if (_timed_out) {
        return tl::make_unexpected(asio::error::timed_out);
    }

    return {};
}

auto Session::_start_read() -> void
{
    _with_stream([this](auto& stream) {
        asio::async_read_until(
          stream, _read_buffer, '\n',
          [this](asio::error_code ec, std::size_t bytes) { _on_read(ec, bytes); }
        );
    });
}

auto Session::_on_read(asio::error_code ec, std::size_t bytes) -> void
{
    if (ec) {
        _on_disconnect(ec);
        return;
    }

    std::string line(bytes, '\0');
    std::istream input(&_read_buffer);
    input.read(line.data(), std::streamsize(bytes));

    _handle_line(line);

    if (_open) {
        _start_read();
    }
}

auto Session::_handle_line(std::string_view line) -> void
{
    _touch();

    _logger->debug("[{}] >> {}", _id, proto::utils::trim(line));

    auto msg = proto::unpack_message(line);
    if (not msg) {
        spdlog::debug(
          "[{}] Unparsable line ({}): {}", _id, magic_enum::enum_name(msg.error()),
          proto::utils::trim(line)
        );
        return;
    }

    if (msg->is("PING")) {
        _enqueue(proto::pack_pong(msg->trailing()), nullptr);
        return;
    }

    if (msg->is("PONG")) {
        return;
    }

    if (msg->is("PRIVMSG")) {
        _handle_ctcp(*msg);
    }

    if (msg->is("NICK") and not msg->params.empty() and
        proto::utils::iequals(msg->nick(), nickname())) {
        set_nickname(msg->params.front());
    }

    if (_inbox.push(std::move(*msg))) {
        spdlog::warn("[{}] Inbox full, oldest message dropped", _id);
    }
}

auto Session::_handle_ctcp(const proto::Message& msg) -> void
{
    const auto ctcp = proto::unpack_ctcp(msg.trailing());
    if (not ctcp) {
        return;
    }

    const auto sender = msg.nick();

    if (ctcp->command == "VERSION") {
        _enqueue(
          proto::pack_notice(
            sender, proto::pack_ctcp("VERSION", _config.version_reply)
          ),
          nullptr
        );
        spdlog::info(
          "[{}] Answered CTCP VERSION from {}: {}", _id, sender,
          _config.version_reply
        );
    }
    else if (ctcp->command == "PING") {
        _enqueue(
          proto::pack_notice(sender, proto::pack_ctcp("PING", ctcp->argument)),
          nullptr
        );
    }
}

auto Session::_enqueue(
  std::string line, std::shared_ptr<std::promise<asio::error_code>> done
) -> void
{
    if (not _open) {
        if (done) {
            done->set_value(asio::error::not_connected);
        }
        return;
    }

    _write_queue.push_back(PendingWrite{std::move(line), std::move(done)});

    if (_write_queue.size() == 1) {
        _write_next();
    }
}

auto Session::_write_next() -> void
{
    auto& pending = _write_queue.front();

    _logger->debug("[{}] << {}", _id, proto::utils::trim(pending.line));

    _with_stream([this, &pending](auto& stream) {
        asio::async_write(
          stream, asio::buffer(pending.line),
          [this](asio::error_code ec, std::size_t) {
              if (_write_queue.empty()) {
                  return;
              }

              auto done = std::move(_write_queue.front().done);
              _write_queue.pop_front();

              if (done) {
                  done->set_value(ec);
              }

              if (ec) {
                  _on_disconnect(ec);
                  return;
              }

              if (not _write_queue.empty()) {
                  _write_next();
              }
          }
        );
    });
}

auto Session::_arm_keepalive() -> void
{
    _keepalive_timer.expires_after(_config.keepalive_interval);
    _keepalive_timer.async_wait([this](asio::error_code ec) {
        if (ec or not _open) {
            return;
        }

        if (Clock::now() - last_activity() >= _config.keepalive_interval) {
            _enqueue(proto::pack_ping(fmt::format("keepalive-{}", _id)), nullptr);
        }

        _arm_keepalive();
    });
}

auto Session::_on_disconnect(asio::error_code ec) -> void
{
    if (not _open.exchange(false)) {
        return;
    }

    if (ec == asio::error::operation_aborted) {
        spdlog::debug("[{}] Connection closed locally", _id);
    }
    else {
        spdlog::warn("[{}] Connection lost: {}", _id, ec.message());
    }

    if (not _closed) {
        set_state(SessionState::Disconnected);
    }

    _shutdown();
}

auto Session::_shutdown() -> void
{
    _open = false;

    while (not _write_queue.empty()) {
        if (auto& done = _write_queue.front().done) {
            done->set_value(asio::error::not_connected);
        }
        _write_queue.pop_front();
    }

    _timer.cancel();
    _keepalive_timer.cancel();

    if (_stream) {
        asio::error_code ignored;
        _stream->next_layer().shutdown(
          asio::ip::tcp::socket::shutdown_both, ignored
        );
        _stream->next_layer().close(ignored);
    }

    _work.reset();
    _inbox.close();
}

auto Session::_touch() -> void
{
    _last_activity = Clock::now().time_since_epoch().count();
}

}  // namespace ircbooks::irc
