#pragma once

#include <algorithm>
#include <atomic>
#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <istream>
#include <iterator>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <thread>
#include <utility>
#include <vector>

#include <asio.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <zlib.h>

#include "config.hpp"
#include "events.hpp"
#include "proto/deserialize.hpp"
#include "proto/types.hpp"

namespace ircbooks::testing {

using asio::ip::tcp;
using namespace std::chrono_literals;
namespace fs = std::filesystem;

/// 127.0.0.1 in the decimal form DCC offers use
constexpr std::string_view LOCALHOST_U32 = "2130706433";

/**
 * @brief Engine configuration against loopback fakes, with short timeouts
 */
inline auto test_config(std::uint16_t port = 6667) -> Config
{
    Config config;

    config.server = "127.0.0.1";
    config.port = port;
    config.tls = false;
    config.channel = "#ebooks";
    config.nickname = "bookworm";

    config.command_interval = 100ms;
    config.connect_timeout = 1'000ms;
    config.registration_timeout = 2'000ms;
    config.join_timeout = 500ms;
    config.response_window = 400ms;
    config.offer_timeout = 1'000ms;
    config.stall_timeout = 300ms;
    config.quit_timeout = 200ms;
    config.max_connect_attempts = 1;
    config.backoff_base = 10ms;

    return config;
}

/**
 * @brief Fresh, empty directory under the system temp dir
 */
inline auto scratch_dir(std::string_view name) -> fs::path
{
    const auto dir = fs::temp_directory_path() / "ircbooks-tests" / name;

    fs::remove_all(dir);
    fs::create_directories(dir);

    return dir;
}

/**
 * @brief Records every event; safe to feed from transfer threads
 */
class EventLog
{
 public:
    auto sink() -> EventSink
    {
        return [this](const ProgressEvent& event) {
            std::lock_guard lock(_mutex);
            _events.push_back(event);
        };
    }

    auto count(EventKind kind) const -> std::size_t
    {
        std::lock_guard lock(_mutex);
        return std::ranges::count(_events, kind, &ProgressEvent::kind);
    }

    auto last(EventKind kind) const -> std::optional<ProgressEvent>
    {
        std::lock_guard lock(_mutex);

        for (auto it = _events.rbegin(); it != _events.rend(); ++it) {
            if (it->kind == kind) {
                return *it;
            }
        }

        return std::nullopt;
    }

 private:
    mutable std::mutex _mutex;
    std::vector<ProgressEvent> _events;
};


/**
 * @brief Scripted IRC server on 127.0.0.1.
 *
 * Registration, JOIN, PING and QUIT are handled like a real server; the
 * script adds replies for everything else. The latest connection is the
 * one replies and send() go to.
 */
class FakeIrcServer
{
 public:
    using Clock = std::chrono::steady_clock;
    using Script =
      std::function<std::vector<std::string>(FakeIrcServer&, const proto::Message&)>;

    struct Received
    {
        Clock::time_point at;
        proto::Message msg;
    };

    explicit FakeIrcServer(Script script = {}) :
      _acceptor(_io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
      _port(_acceptor.local_endpoint().port()),
      _script(std::move(script))
    {
        _accept();
        _thread = std::jthread([this] { _io.run(); });
    }

    ~FakeIrcServer() { _io.stop(); }

    auto port() const -> std::uint16_t { return _port; }

    /// Nicknames answered with 433
    auto take_nickname(std::string nickname) -> void
    {
        std::lock_guard lock(_mutex);
        _taken.insert(std::move(nickname));
    }

    auto nickname() const -> std::string
    {
        std::lock_guard lock(_mutex);
        return _nick;
    }

    auto connections() const -> std::size_t
    {
        std::lock_guard lock(_mutex);
        return _connections;
    }

    /// Push a line to the connected client
    auto send(std::string line) -> void
    {
        asio::post(_io, [this, line = std::move(line)] { _write(line); });
    }

    auto received(std::string_view command) const -> std::vector<Received>
    {
        std::lock_guard lock(_mutex);

        std::vector<Received> found;
        for (const auto& item : _received) {
            if (item.msg.is(command)) {
                found.push_back(item);
            }
        }

        return found;
    }

    auto wait_for(std::string_view command, std::chrono::milliseconds timeout)
      -> std::optional<proto::Message>
    {
        const auto deadline = Clock::now() + timeout;

        while (Clock::now() < deadline) {
            if (auto found = received(command); not found.empty()) {
                return found.back().msg;
            }
            std::this_thread::sleep_for(10ms);
        }

        return std::nullopt;
    }

 private:
    struct Client
    {
        explicit Client(tcp::socket s) : socket(std::move(s)) {}

        tcp::socket socket;
        asio::streambuf buffer;
    };

    auto _accept() -> void
    {
        _acceptor.async_accept([this](asio::error_code ec, tcp::socket socket) {
            if (ec) {
                return;
            }

            auto client = std::make_shared<Client>(std::move(socket));

            {
                std::lock_guard lock(_mutex);
                _connections++;
                _nick.clear();
                _user = false;
                _welcomed = false;
            }

            _client = client;
            _read(client);
            _accept();
        });
    }

    auto _read(std::shared_ptr<Client> client) -> void
    {
        asio::async_read_until(
          client->socket, client->buffer, "\r\n",
          [this, client](asio::error_code ec, std::size_t) {
              if (ec) {
                  return;
              }

              std::istream stream(&client->buffer);
              std::string line;
              std::getline(stream, line);

              if (not line.empty() and line.back() == '\r') {
                  line.pop_back();
              }

              _on_line(line);

              if (client->socket.is_open()) {
                  _read(client);
              }
          }
        );
    }

    auto _on_line(const std::string& line) -> void
    {
        auto msg = proto::unpack_message(line);
        if (not msg) {
            return;
        }

        {
            std::lock_guard lock(_mutex);
            _received.push_back({Clock::now(), *msg});
        }

        if (msg->is("NICK") and not msg->params.empty()) {
            const auto& wanted = msg->params.front();

            std::unique_lock lock(_mutex);
            if (_taken.contains(wanted)) {
                lock.unlock();
                _write(fmt::format(
                  ":fake.server 433 * {} :Nickname is already in use", wanted
                ));
                return;
            }
            _nick = wanted;
            lock.unlock();

            _welcome();
        }
        else if (msg->is("USER")) {
            {
                std::lock_guard lock(_mutex);
                _user = true;
            }
            _welcome();
        }
        else if (msg->is("JOIN") and not msg->params.empty()) {
            const auto nick = nickname();
            _write(fmt::format(":{}!user@fake JOIN {}", nick, msg->params[0]));
            _write(fmt::format(
              ":fake.server 366 {} {} :End of /NAMES list.", nick, msg->params[0]
            ));
        }
        else if (msg->is("PING")) {
            _write(fmt::format(":fake.server PONG fake.server :{}", msg->trailing()));
        }
        else if (msg->is("QUIT")) {
            if (_client) {
                asio::error_code ignored;
                _client->socket.close(ignored);
            }
            return;
        }

        if (_script) {
            for (const auto& reply : _script(*this, *msg)) {
                _write(reply);
            }
        }
    }

    auto _welcome() -> void
    {
        std::string nick;

        {
            std::lock_guard lock(_mutex);
            if (_welcomed or not _user or _nick.empty()) {
                return;
            }
            _welcomed = true;
            nick = _nick;
        }

        _write(fmt::format(":fake.server 001 {} :Welcome to the fake network", nick));
        _write(fmt::format(":fake.server 004 {} fake.server fake-1.0 io o", nick));
    }

    auto _write(const std::string& line) -> void
    {
        if (not _client or not _client->socket.is_open()) {
            return;
        }

        asio::error_code ec;
        asio::write(_client->socket, asio::buffer(line + "\r\n"), ec);

        if (ec) {
            spdlog::debug("Fake server write failed: {}", ec.message());
        }
    }

    asio::io_context _io;
    tcp::acceptor _acceptor;
    const std::uint16_t _port;
    Script _script;

    std::shared_ptr<Client> _client;

    mutable std::mutex _mutex;
    std::vector<Received> _received;
    std::set<std::string> _taken;
    std::string _nick;
    bool _user = false;
    bool _welcomed = false;
    std::size_t _connections = 0;

    std::jthread _thread;
};


/**
 * @brief One-shot DCC sender on 127.0.0.1
 */
class FakeDccPeer
{
 public:
    enum class Mode
    {
        SendAll,
        SendPart,  // half of the payload, then EOF
        Stall,     // half of the payload, then silence
    };

    explicit FakeDccPeer(std::string payload, Mode mode = Mode::SendAll) :
      _acceptor(_io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0)),
      _port(_acceptor.local_endpoint().port()),
      _payload(std::move(payload)),
      _mode(mode)
    {
        _acceptor.async_accept([this](asio::error_code ec, tcp::socket socket) {
            if (ec) {
                return;
            }

            _socket.emplace(std::move(socket));
            _accepted = true;
            _serve();
        });

        _thread = std::jthread([this] { _io.run(); });
    }

    ~FakeDccPeer() { _io.stop(); }

    auto port() const -> std::uint16_t { return _port; }
    auto size() const -> std::size_t { return _payload.size(); }
    auto accepted() const -> bool { return _accepted; }

    /// CTCP payload of a PRIVMSG offering the payload as `filename`
    auto offer(std::string_view filename) const -> std::string
    {
        const bool quote = filename.find(' ') != std::string_view::npos;

        return fmt::format(
          "\x01" "DCC SEND {1}{0}{1} {2} {3} {4}\x01", filename, quote ? "\"" : "",
          LOCALHOST_U32, _port, _payload.size()
        );
    }

 private:
    auto _serve() -> void
    {
        const auto length =
          _mode == Mode::SendAll ? _payload.size() : _payload.size() / 2;

        asio::error_code ec;
        asio::write(*_socket, asio::buffer(_payload.data(), length), ec);

        if (ec) {
            spdlog::debug("Fake peer write failed: {}", ec.message());
            return;
        }

        if (_mode != Mode::Stall) {
            _socket->shutdown(tcp::socket::shutdown_send, ec);
        }
    }

    asio::io_context _io;
    tcp::acceptor _acceptor;
    const std::uint16_t _port;
    const std::string _payload;
    const Mode _mode;

    std::optional<tcp::socket> _socket;
    std::atomic_bool _accepted = false;

    std::jthread _thread;
};


inline auto put_u16(std::string& out, std::uint16_t value) -> void
{
    out.push_back(char(value & 0xFF));
    out.push_back(char((value >> 8) & 0xFF));
}

inline auto put_u32(std::string& out, std::uint32_t value) -> void
{
    put_u16(out, std::uint16_t(value & 0xFFFF));
    put_u16(out, std::uint16_t(value >> 16));
}

inline auto deflate_raw(std::string_view data) -> std::string
{
    z_stream zs{};

    const auto init = deflateInit2(
      &zs, Z_DEFAULT_COMPRESSION, Z_DEFLATED, -MAX_WBITS, 8, Z_DEFAULT_STRATEGY
    );
    assert(init == Z_OK);

    std::string out(deflateBound(&zs, uLong(data.size())), '\0');

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    zs.avail_in = uInt(data.size());
    zs.next_out = reinterpret_cast<Bytef*>(out.data());
    zs.avail_out = uInt(out.size());

    const auto status = deflate(&zs, Z_FINISH);
    assert(status == Z_STREAM_END);

    out.resize(zs.total_out);
    deflateEnd(&zs);

    return out;
}

struct ZipMember
{
    std::string name;
    std::string data;
    bool deflate = true;
};

/**
 * @brief Minimal PKZIP writer: stored or deflated members, no extras
 */
inline auto make_zip(const std::vector<ZipMember>& members) -> std::string
{
    std::string archive;
    std::string directory;

    for (const auto& member : members) {
        const auto crc = std::uint32_t(crc32(
          crc32(0L, Z_NULL, 0), reinterpret_cast<const Bytef*>(member.data.data()),
          uInt(member.data.size())
        ));
        const auto body = member.deflate ? deflate_raw(member.data) : member.data;
        const std::uint16_t method = member.deflate ? 8 : 0;
        const auto offset = std::uint32_t(archive.size());

        put_u32(archive, 0x04034b50);
        put_u16(archive, 20);
        put_u16(archive, 0);
        put_u16(archive, method);
        put_u16(archive, 0);
        put_u16(archive, 0x21);
        put_u32(archive, crc);
        put_u32(archive, std::uint32_t(body.size()));
        put_u32(archive, std::uint32_t(member.data.size()));
        put_u16(archive, std::uint16_t(member.name.size()));
        put_u16(archive, 0);
        archive += member.name;
        archive += body;

        put_u32(directory, 0x02014b50);
        put_u16(directory, 20);
        put_u16(directory, 20);
        put_u16(directory, 0);
        put_u16(directory, method);
        put_u16(directory, 0);
        put_u16(directory, 0x21);
        put_u32(directory, crc);
        put_u32(directory, std::uint32_t(body.size()));
        put_u32(directory, std::uint32_t(member.data.size()));
        put_u16(directory, std::uint16_t(member.name.size()));
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u16(directory, 0);
        put_u32(directory, 0);
        put_u32(directory, offset);
        directory += member.name;
    }

    const auto directory_offset = std::uint32_t(archive.size());
    archive += directory;

    put_u32(archive, 0x06054b50);
    put_u16(archive, 0);
    put_u16(archive, 0);
    put_u16(archive, std::uint16_t(members.size()));
    put_u16(archive, std::uint16_t(members.size()));
    put_u32(archive, std::uint32_t(directory.size()));
    put_u32(archive, directory_offset);
    put_u16(archive, 0);

    return archive;
}

inline auto write_file(const fs::path& path, std::string_view data) -> void
{
    std::ofstream file(path, std::ios::out | std::ios::binary | std::ios::trunc);
    file.write(data.data(), std::streamsize(data.size()));
    assert(file);
}

inline auto read_file(const fs::path& path) -> std::string
{
    std::ifstream file(path, std::ios::in | std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(file), {});
}

}  // namespace ircbooks::testing
