#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <span>
#include <stop_token>
#include <string>
#include <system_error>

#include <asio/connect.hpp>
#include <asio/error.hpp>
#include <asio/error_code.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/address.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/post.hpp>
#include <asio/steady_timer.hpp>
#include <asio/write.hpp>
#include <fmt/core.h>
#include <spdlog/logger.h>
#include <tl/expected.hpp>

#include "misc/logging.hpp"

namespace net::tcp {

/**
 * @brief Blocking-style TCP stream over asio with per-operation deadlines.
 *
 * Each call arms a timer, starts one async operation and runs the
 * io_context until either completes. A stop request cancels the pending
 * operation from any thread.
 */
class TcpTransfer
{
 public:
    inline TcpTransfer(
      std::chrono::milliseconds read_timeout,
      std::chrono::milliseconds write_timeout = std::chrono::seconds(2)
    ) :
      _socket(_io),
      _read_timeout(read_timeout),
      _write_timeout(write_timeout),
      _timer(_io),
      _logger(utils::internal_logger())
    {
    }

    inline ~TcpTransfer() { close(); }

    TcpTransfer(const TcpTransfer&) = delete;
    TcpTransfer& operator=(const TcpTransfer&) = delete;

    inline auto do_connect(
      const std::string& ip,
      uint16_t port,
      std::chrono::milliseconds timeout,
      std::stop_token stop = {}
    ) -> tl::expected<void, asio::error_code>
    {
        asio::error_code ec;
        const auto address = asio::ip::make_address(ip, ec);
        if (ec) {
            return tl::make_unexpected(ec);
        }

        const asio::ip::tcp::endpoint endpoint(address, port);

        _logger->debug("Connect to {}:{}", ip, port);

        _error = asio::error::operation_aborted;
        _socket.async_connect(endpoint, [this](asio::error_code ec) {
            _timer.cancel();
            _error = ec;
        });

        return _run(timeout, stop).and_then([this]() {
            return _result();
        });
    }

    /**
     * @brief Read whatever is available, at most buffer.size() bytes.
     *
     * Fails with asio::error::timed_out if the peer sends nothing for the
     * read timeout and with asio::error::eof once the peer closed.
     */
    inline auto do_read_some(std::span<uint8_t> buffer, std::stop_token stop)
      -> tl::expected<std::size_t, asio::error_code>
    {
        if (not _socket.is_open()) {
            return tl::make_unexpected(asio::error::not_connected);
        }

        _error = asio::error::operation_aborted;
        _transferred = 0;

        _socket.async_read_some(
          asio::buffer(buffer.data(), buffer.size()),
          [this](asio::error_code ec, std::size_t bytes_read) {
              _on_complete(ec, bytes_read);
          }
        );

        return _run(_read_timeout, stop).and_then([this]() {
            return _result().map([this]() { return _transferred; });
        });
    }

    inline auto do_write(std::span<const uint8_t> data, std::stop_token stop)
      -> tl::expected<void, asio::error_code>
    {
        if (not _socket.is_open()) {
            return tl::make_unexpected(asio::error::not_connected);
        }

        _error = asio::error::operation_aborted;

        asio::async_write(
          _socket, asio::buffer(data.data(), data.size()),
          [this](asio::error_code ec, std::size_t bytes_written) {
              _on_complete(ec, bytes_written);
          }
        );

        return _run(_write_timeout, stop).and_then([this]() {
            return _result();
        });
    }

    inline auto close() -> void
    {
        if (_socket.is_open()) {
            asio::error_code ignored;
            _socket.shutdown(asio::ip::tcp::socket::shutdown_both, ignored);
            _socket.close(ignored);
        }
    }

    inline auto is_open() const -> bool { return _socket.is_open(); }

 private:
    inline auto _run(std::chrono::milliseconds timeout, std::stop_token stop)
      -> tl::expected<void, asio::error_code>
    {
        _timed_out = false;
        _cancelled = false;

        _timer.expires_after(timeout);
        _timer.async_wait([this](asio::error_code ec) { _on_timeout(ec); });

        std::stop_callback on_stop(stop, [this] {
            asio::post(_io, [this] {
                _cancelled = true;
                _timer.cancel();
                _socket.cancel();
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

    inline auto _result() const -> tl::expected<void, asio::error_code>
    {
        if (_error) {
            return tl::make_unexpected(_error);
        }

        return {};
    }

    inline auto _on_complete(asio::error_code error, std::size_t bytes)
      -> void
    {
        _timer.cancel();
        _error = error;
        _transferred = bytes;

        if (_error and _error != asio::error::eof) {
            _logger->debug("Socket operation failed: {}", _error.message());
        }
    }

    inline auto _on_timeout(asio::error_code ec) -> void
    {
        if (ec == asio::error::operation_aborted) {  // timer canceled
            return;
        }

        if (not ec) {
            _logger->debug("Socket timeout expired.");
            _timed_out = true;
            _socket.cancel();
        }
    }

    asio::io_context _io;
    asio::ip::tcp::socket _socket;

    std::chrono::milliseconds _read_timeout;
    std::chrono::milliseconds _write_timeout;
    asio::steady_timer _timer;

    asio::error_code _error = asio::error::operation_aborted;
    std::size_t _transferred = 0;
    bool _timed_out = false;
    bool _cancelled = false;

    std::shared_ptr<spdlog::logger> _logger;
};

}  // namespace net::tcp
