#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

#include <asio/error_code.hpp>
#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/ssl.hpp>
#include <asio/steady_timer.hpp>
#include <asio/streambuf.hpp>
#include <spdlog/logger.h>
#include <tl/expected.hpp>

#include "config.hpp"
#include "irc/rate_limiter.hpp"
#include "misc/bounded_queue.hpp"
#include "proto/types.hpp"

namespace ircbooks::irc {

using SessionId = std::string;

enum class SessionState
{
    Disconnected,
    Connecting,
    Registering,
    Registered,
    Closing,
    Closed,
};

/**
 * @brief One IRC connection.
 *
 * A dedicated worker thread runs the session io_context: it reads lines,
 * answers PING and CTCP VERSION/PING on its own and pushes every other
 * parsed message to a bounded inbox. Callers never touch the socket, they
 * post lines to the write queue and poll the inbox.
 */
class Session
{
 public:
    using Clock = std::chrono::steady_clock;
    using Inbox = utils::BoundedQueue<proto::Message>;

    Session(SessionId id, const Config& config);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Resolve, connect and (optionally) complete the TLS handshake.
     * Runs on the calling thread, before start().
     */
    auto open(
      const std::string& host, uint16_t port, bool tls, std::stop_token stop
    ) -> tl::expected<void, asio::error_code>;

    /**
     * @brief Spawn the worker thread: read loop and keepalive
     */
    auto start() -> void;

    /**
     * @brief Best-effort QUIT bounded by the quit timeout, then tear down.
     * Safe to call more than once.
     */
    auto close(std::string_view reason = "Goodbye") -> void;

    /**
     * @brief Queue a protocol line; not rate limited
     */
    auto send_raw(std::string line) -> std::future<asio::error_code>;

    /**
     * @brief Queue a protocol line and wait until it is written; not rate
     * limited
     */
    auto send(std::string line) -> tl::expected<void, asio::error_code>;

    /**
     * @brief Same as send() after rate limiter clearance. Every bot command
     * goes through here.
     */
    auto send_command(std::string line, std::stop_token stop = {})
      -> tl::expected<void, asio::error_code>;

    auto next_message(Clock::time_point deadline, std::stop_token stop = {})
      -> std::optional<proto::Message>;
    auto clear_inbox() -> void { _inbox.clear(); }
    auto inbox_closed() const -> bool { return _inbox.closed(); }

    /**
     * @brief Serializes whole operations (search, download) on this session
     */
    auto lock_operation() -> std::unique_lock<std::mutex>
    {
        return std::unique_lock(_operation_mutex);
    }

    auto id() const -> const SessionId& { return _id; }
    auto host() const -> const std::string& { return _host; }
    auto port() const -> uint16_t { return _port; }
    auto tls() const -> bool { return _tls; }

    auto is_open() const -> bool { return _open; }
    auto last_activity() const -> Clock::time_point;

    auto nickname() const -> std::string;
    auto set_nickname(std::string nickname) -> void;

    auto state() const -> SessionState;
    auto set_state(SessionState state) -> void;

    auto rate_limiter() -> RateLimiter& { return _limiter; }

    /// Requested when the session closes; transfers of the session follow it
    auto stop_token() const -> std::stop_token { return _stop.get_token(); }

 private:
    struct PendingWrite
    {
        std::string line;
        std::shared_ptr<std::promise<asio::error_code>> done;
    };

    template<typename Fn>
    auto _with_stream(Fn&& fn) -> void
    {
        if (_tls) {
            fn(*_stream);
        }
        else {
            fn(_stream->next_layer());
        }
    }

    auto _run_for(std::chrono::milliseconds timeout, std::stop_token stop)
      -> tl::expected<void, asio::error_code>;

    auto _start_read() -> void;
    auto _on_read(asio::error_code ec, std::size_t bytes) -> void;
    auto _handle_line(std::string_view line) -> void;
    auto _handle_ctcp(const proto::Message& msg) -> void;

    auto _enqueue(std::string line, std::shared_ptr<std::promise<asio::error_code>>)
      -> void;
    auto _write_next() -> void;

    auto _arm_keepalive() -> void;
    auto _on_disconnect(asio::error_code ec) -> void;
    auto _shutdown() -> void;
    auto _touch() -> void;

    const SessionId _id;
    const Config _config;

    std::string _host;
    uint16_t _port = 0;
    bool _tls = false;

    asio::io_context _io;
    asio::ssl::context _ssl_context;
    std::unique_ptr<asio::ssl::stream<asio::ip::tcp::socket>> _stream;
    asio::streambuf _read_buffer;
    asio::steady_timer _timer;
    asio::steady_timer _keepalive_timer;
    std::optional<asio::executor_work_guard<asio::io_context::executor_type>>
      _work;

    std::deque<PendingWrite> _write_queue;
    asio::error_code _op_error;
    bool _timed_out = false;
    bool _cancelled = false;

    std::atomic<bool> _open = false;
    std::atomic<bool> _closed = false;
    std::atomic<Clock::rep> _last_activity;

    mutable std::mutex _mutex;
    std::string _nickname;
    SessionState _state = SessionState::Disconnected;

    std::mutex _operation_mutex;
    Inbox _inbox;
    RateLimiter _limiter;
    std::stop_source _stop;

    std::shared_ptr<spdlog::logger> _logger;

    std::jthread _worker;
};

}  // namespace ircbooks::irc
