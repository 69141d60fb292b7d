#include <algorithm>
#include <cassert>
#include <chrono>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <spdlog/spdlog.h>

#include "errors.hpp"
#include "events.hpp"
#include "irc/connection.hpp"
#include "irc/rate_limiter.hpp"
#include "irc/registry.hpp"
#include "irc/session.hpp"
#include "tests/fakes.hpp"

using namespace ircbooks;
using namespace ircbooks::testing;

void test_rate_limiter_spacing();
void test_rate_limiter_cancel();
void test_register_and_join();
void test_nickname_collision();
void test_nickname_exhausted();
void test_connection_refused();
void test_session_housekeeping();
void test_registry_close_twice();
void test_registry_replaces_stale();

void test_sessions()
{
    test_rate_limiter_spacing();
    test_rate_limiter_cancel();
    test_register_and_join();
    test_nickname_collision();
    test_nickname_exhausted();
    test_connection_refused();
    test_session_housekeeping();
    test_registry_close_twice();
    test_registry_replaces_stale();
}

void test_rate_limiter_spacing()
{
    using Clock = irc::RateLimiter::Clock;

    irc::RateLimiter limiter(100ms);
    assert(not limiter.last_command());

    assert(limiter.acquire());
    const auto first = *limiter.last_command();
    assert(limiter.acquire());
    const auto second = *limiter.last_command();
    assert(second - first >= limiter.interval());

    std::mutex mutex;
    std::vector<Clock::time_point> stamps;

    {
        std::vector<std::jthread> callers;
        for (int i = 0; i < 4; i++) {
            callers.emplace_back([&] {
                const bool cleared = limiter.acquire();
                assert(cleared);

                std::lock_guard lock(mutex);
                stamps.push_back(*limiter.last_command());
            });
        }
    }

    assert(stamps.size() == 4);
    std::ranges::sort(stamps);

    assert(stamps.front() - second >= limiter.interval());
    for (std::size_t i = 1; i < stamps.size(); i++) {
        assert(stamps[i] - stamps[i - 1] >= limiter.interval());
    }
}

void test_rate_limiter_cancel()
{
    irc::RateLimiter limiter(300ms);
    assert(limiter.acquire());

    std::stop_source stop;
    bool cleared = true;

    std::jthread waiting([&] { cleared = limiter.acquire(stop.get_token()); });
    std::this_thread::sleep_for(50ms);
    stop.request_stop();
    waiting.join();

    assert(not cleared);

    // The abandoned slot does not block the queue
    const auto before = std::chrono::steady_clock::now();
    assert(limiter.acquire());
    assert(std::chrono::steady_clock::now() - before < 1s);
}

void test_register_and_join()
{
    FakeIrcServer server;
    auto config = test_config(server.port());

    irc::ConnectionManager connections(config);
    EventLog events;

    auto session = connections.connect("irc-test", {}, events.sink());
    assert(session);

    auto& s = **session;
    assert(s.state() == irc::SessionState::Registered);
    assert(s.nickname() == "bookworm");
    assert(connections.is_healthy(s));

    const auto user = server.received("USER");
    assert(user.size() == 1);
    assert(user[0].msg.params.size() == 4);
    assert(user[0].msg.params[0] == "bookworm");
    assert(user[0].msg.params[1] == "0");
    assert(user[0].msg.params[2] == "*");
    assert(user[0].msg.trailing() == config.realname);

    const auto join = server.received("JOIN");
    assert(join.size() == 1 and join[0].msg.params[0] == "#ebooks");

    assert(events.count(EventKind::Connecting) == 1);
    assert(events.count(EventKind::Registered) == 1);
    assert(events.last(EventKind::Registered)->detail == "bookworm");

    s.close();
    assert(server.wait_for("QUIT", 1s));
    assert(s.state() == irc::SessionState::Closed);
    assert(not connections.is_healthy(s));
}

void test_nickname_collision()
{
    FakeIrcServer server;
    server.take_nickname("bookworm");

    auto config = test_config(server.port());
    config.nick_suffixes = {"_", "__"};

    irc::ConnectionManager connections(config);
    auto session = connections.connect("irc-nick");
    assert(session);
    assert((*session)->nickname() == "bookworm_");

    const auto nicks = server.received("NICK");
    assert(nicks.size() == 2);
    assert(nicks[0].msg.params[0] == "bookworm");
    assert(nicks[1].msg.params[0] == "bookworm_");

    assert(server.received("USER").size() == 1);

    (*session)->close();
}

void test_nickname_exhausted()
{
    FakeIrcServer server;
    for (const auto* nick : {"bookworm", "bookworm_", "bookworm2", "bookworm3"}) {
        server.take_nickname(nick);
    }

    auto config = test_config(server.port());
    config.nick_suffixes = {"_"};
    config.max_nick_retries = 3;

    irc::ConnectionManager connections(config);
    assert(connections.next_nickname(1) == "bookworm_");
    assert(connections.next_nickname(2) == "bookworm2");

    auto session = connections.connect("irc-taken");
    assert(not session);
    assert(session.error().code == ConnectionErrorCode::REGISTRATION_FAILED);
    assert(server.received("NICK").size() == 4);
}

void test_connection_refused()
{
    std::uint16_t closed_port = 0;
    {
        asio::io_context io;
        tcp::acceptor probe(io, tcp::endpoint(asio::ip::make_address("127.0.0.1"), 0));
        closed_port = probe.local_endpoint().port();
    }

    auto config = test_config(closed_port);
    config.max_connect_attempts = 2;

    irc::ConnectionManager connections(config);

    const auto started = std::chrono::steady_clock::now();
    auto session = connections.connect("irc-refused");

    assert(not session);
    assert(session.error().code == ConnectionErrorCode::REFUSED);
    assert(session.error().reason() == "refused");
    assert(std::chrono::steady_clock::now() - started >= config.backoff_base);

    std::stop_source stop;
    stop.request_stop();

    auto cancelled = connections.connect("irc-cancelled", stop.get_token());
    assert(not cancelled);
    assert(cancelled.error().code == ConnectionErrorCode::CANCELLED);
}

void test_session_housekeeping()
{
    FakeIrcServer server;
    auto config = test_config(server.port());
    config.keepalive_interval = 200ms;

    irc::ConnectionManager connections(config);
    auto session = connections.connect("irc-housekeeping");
    assert(session);

    auto& s = **session;

    server.send(":tester!t@fake PRIVMSG bookworm :\x01VERSION\x01");

    auto version = server.wait_for("NOTICE", 1s);
    assert(version);
    assert(version->params[0] == "tester");
    assert(version->trailing() == "\x01VERSION ircbooks 1.0\x01");

    server.send("PING :token-42");

    auto pong = server.wait_for("PONG", 1s);
    assert(pong and pong->trailing() == "token-42");

    // Nothing happens for a while: the client pings on its own
    auto keepalive = server.wait_for("PING", 1s);
    assert(keepalive and keepalive->trailing() == "keepalive-irc-housekeeping");

    server.send(":Search!bot@fake PRIVMSG bookworm :hello there");

    const auto deadline = std::chrono::steady_clock::now() + 1s;
    std::optional<proto::Message> hello;
    while (auto msg = s.next_message(deadline)) {
        // CTCP requests are answered and still delivered
        if (msg->is("PRIVMSG") and msg->params[0] == "bookworm" and
            msg->nick() == "Search") {
            hello = msg;
            break;
        }
    }
    assert(hello and hello->trailing() == "hello there");

    // Not a bot command: no rate limiter slot was taken
    assert(not s.rate_limiter().last_command());

    assert(s.send_command("PRIVMSG #ebooks :@search a"));
    assert(s.send_command("PRIVMSG #ebooks :@search b"));
    assert(server.wait_for("PRIVMSG", 1s));

    s.close();
    s.close();

    auto after = s.send("PRIVMSG #ebooks :late");
    assert(not after);
    assert(not s.next_message(std::chrono::steady_clock::now() + 50ms));
    assert(s.inbox_closed());
}

void test_registry_close_twice()
{
    FakeIrcServer server;
    auto config = test_config(server.port());

    irc::ConnectionManager connections(config);
    EventLog events;
    irc::SessionRegistry registry(connections, events.sink());

    auto id = registry.acquire();
    assert(id and *id == "irc-1");

    auto again = registry.acquire();
    assert(again and *again == *id);
    assert(server.connections() == 1);
    assert(registry.size() == 1);

    auto session = registry.get(*id);
    assert(session and session->is_open());

    registry.close(*id);
    registry.close(*id);
    registry.close("irc-unknown");

    assert(registry.size() == 0);
    assert(not registry.get(*id));
    assert(not session->is_open());
    assert(session->state() == irc::SessionState::Closed);

    assert(server.wait_for("QUIT", 1s));
    assert(server.received("QUIT").size() == 1);

    auto fresh = registry.acquire();
    assert(fresh and *fresh == "irc-2");
    assert(server.connections() == 2);

    registry.close_all();
    registry.close_all();
    assert(registry.size() == 0);
}

void test_registry_replaces_stale()
{
    FakeIrcServer server;
    auto config = test_config(server.port());
    config.stale_after = 200ms;

    irc::ConnectionManager connections(config);
    irc::SessionRegistry registry(connections);

    auto first = registry.acquire();
    assert(first);
    auto old = registry.get(*first);

    std::this_thread::sleep_for(400ms);
    assert(not connections.is_healthy(*old));

    auto second = registry.acquire();
    assert(second and *second != *first);
    assert(not old->is_open());
    assert(registry.size() == 1);
    assert(server.connections() == 2);
}
