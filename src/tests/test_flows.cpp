#include <cassert>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <spdlog/spdlog.h>

#include "dcc/download.hpp"
#include "dcc/transfer.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "irc/connection.hpp"
#include "irc/registry.hpp"
#include "search/coordinator.hpp"
#include "search/parser.hpp"
#include "search/types.hpp"
#include "tests/fakes.hpp"

using namespace ircbooks;
using namespace ircbooks::testing;

namespace {

const std::string BOT = ":SearchBot!bot@fake";

auto starts_with(const proto::Message& msg, std::string_view prefix) -> bool
{
    return msg.is("PRIVMSG") and msg.trailing().starts_with(prefix);
}

/// Engine pieces wired against one fake server
struct Stack
{
    explicit Stack(Config config_) :
      config(std::move(config_)),
      connections(config),
      registry(connections, events.sink()),
      engine(config),
      searcher(registry, engine, events.sink()),
      downloader(registry, engine, events.sink())
    {
    }

    Config config;
    EventLog events;
    irc::ConnectionManager connections;
    irc::SessionRegistry registry;
    dcc::DccTransferEngine engine;
    search::SearchCoordinator searcher;
    dcc::DownloadCoordinator downloader;
};

auto jane_doe(std::optional<std::string> title = std::nullopt) -> search::SearchQuery
{
    return {
      .scope = title ? search::SearchScope::Title : search::SearchScope::Author,
      .author = "Jane Doe",
      .title = std::move(title),
      .epub_only = true,
    };
}

}  // namespace

void test_search_timeout();
void test_search_no_matches();
void test_search_unknown_session();
void test_search_listing_by_dcc();
void test_search_groups_by_scope();
void test_download_falls_back();
void test_download_without_candidates();
void test_download_offer_timeout();

void test_flows()
{
    test_search_timeout();
    test_search_no_matches();
    test_search_unknown_session();
    test_search_listing_by_dcc();
    test_search_groups_by_scope();
    test_download_falls_back();
    test_download_without_candidates();
    test_download_offer_timeout();
}

void test_search_timeout()
{
    FakeIrcServer server;
    Stack stack(test_config(server.port()));

    auto id = stack.registry.acquire();
    assert(id);

    const auto started = std::chrono::steady_clock::now();
    auto found = stack.searcher.search(*id, jane_doe());

    assert(not found);
    assert(found.error().code == SearchErrorCode::TIMEOUT);
    assert(std::chrono::steady_clock::now() - started >= stack.config.response_window);

    auto sent = server.received("PRIVMSG");
    assert(sent.size() == 1);
    assert(sent[0].msg.params[0] == "#ebooks");
    assert(sent[0].msg.trailing() == "@search Jane Doe");

    assert(stack.events.count(EventKind::Searching) == 1);
    assert(stack.events.last(EventKind::Failed)->reason == "timeout");

    stack.registry.close_all();
}

void test_search_no_matches()
{
    FakeIrcServer server([](FakeIrcServer&, const proto::Message& msg) {
        std::vector<std::string> replies;
        if (starts_with(msg, "@search")) {
            replies.push_back(
              BOT + " NOTICE bookworm :Sorry, your search for \"Jane Doe\" "
                    "returned no matches."
            );
        }
        return replies;
    });

    Stack stack(test_config(server.port()));
    auto id = stack.registry.acquire();
    assert(id);

    const auto started = std::chrono::steady_clock::now();
    auto found = stack.searcher.search(*id, jane_doe());

    assert(not found);
    assert(found.error().code == SearchErrorCode::NO_RESULTS);
    // Answered before the window ran out
    assert(std::chrono::steady_clock::now() - started < stack.config.response_window);

    stack.registry.close_all();
}

void test_search_unknown_session()
{
    auto config = test_config();
    irc::ConnectionManager connections(config);
    irc::SessionRegistry registry(connections);
    dcc::DccTransferEngine engine(config);
    search::SearchCoordinator searcher(registry, engine);

    auto found = searcher.search("irc-42", jane_doe());
    assert(not found);
    assert(found.error().code == SearchErrorCode::NOT_CONNECTED);
}

void test_search_listing_by_dcc()
{
    const std::string listing =
      "Search results from SearchBot v3.10\r\n"
      "Searched 4 bots for \"jane doe\"\r\n"
      "\r\n"
      "!Oatmeal Jane Doe - Example Book.epub ::INFO:: 500KB\r\n"
      "!Pondering Jane Doe - Example Book.mobi ::INFO:: 480KB\r\n"
      "!Dragon Jane Doe - Another Book.epub\r\n";

    FakeDccPeer peer(
      make_zip({{.name = "SearchBot_results_for_jane_doe.txt", .data = listing}})
    );

    FakeIrcServer server([&peer](FakeIrcServer&, const proto::Message& msg) {
        std::vector<std::string> replies;
        if (starts_with(msg, "@search")) {
            replies.push_back(BOT + " NOTICE bookworm :Your search is being processed");
            replies.push_back(
              BOT + " PRIVMSG bookworm :" +
              peer.offer("SearchBot_results_for_jane_doe.txt.zip")
            );
        }
        return replies;
    });

    auto config = test_config(server.port());
    config.response_window = 3000ms;
    config.download_dir = scratch_dir("listing");

    Stack stack(config);
    auto id = stack.registry.acquire();
    assert(id);

    const auto started = std::chrono::steady_clock::now();
    auto found = stack.searcher.search(*id, jane_doe());

    assert(found);
    // The listing closes the window early
    assert(std::chrono::steady_clock::now() - started < config.response_window);
    assert(peer.accepted());

    assert(found->size() == 2);
    assert((*found)[0].server == "Oatmeal");
    assert((*found)[0].size == 500 * 1024);
    assert((*found)[1].server == "Dragon");
    assert(not (*found)[1].size);

    assert(stack.events.last(EventKind::ResultCount)->count == 2);

    // Listing files are consumed
    for (const auto& entry : fs::recursive_directory_iterator(config.download_dir)) {
        assert(not entry.is_regular_file());
    }

    stack.registry.close_all();
}

void test_search_groups_by_scope()
{
    FakeIrcServer server([](FakeIrcServer&, const proto::Message& msg) {
        std::vector<std::string> replies;

        if (starts_with(msg, "@search")) {
            for (const auto* line : {
                   "!A Jane Doe - Example Book.epub ::INFO:: 1.1MB",
                   "!B Jane Doe - Example Book (retail).epub ::INFO:: 1.0MB",
                   "!a Jane Doe - The Example Book v2.epub ::INFO:: 1.2MB",
                   "!C Jane Doe - Another Book.epub ::INFO:: 900KB",
                   "!C Jane Doe - Example Book.epub ::INFO:: 878.9KB",
                 }) {
                replies.push_back(BOT + " PRIVMSG bookworm :" + line);
            }
        }

        return replies;
    });

    Stack stack(test_config(server.port()));
    auto id = stack.registry.acquire();
    assert(id);

    // One entry per book
    auto books = stack.searcher.search(*id, jane_doe());
    assert(books);
    assert(books->size() == 2);
    assert((*books)[0].server == "A" and (*books)[0].title == "Example Book");
    assert((*books)[1].server == "C" and (*books)[1].title == "Another Book");

    // One entry per server, "a" and "A" being the same bot
    auto sources = stack.searcher.search(*id, jane_doe("Example Book"));
    assert(sources);
    assert(sources->size() == 3);
    assert((*sources)[0].server == "A");
    assert((*sources)[1].server == "B");
    assert((*sources)[2].server == "C");
    assert((*sources)[2].filename == "Jane Doe - Example Book.epub");

    stack.registry.close_all();
}

void test_download_falls_back()
{
    const std::string name_a = "Jane Doe - Example Book.epub";
    const std::string name_c = "Jane Doe - Example Book (retail).epub";

    FakeDccPeer peer_a(std::string(1'200'000, 'a'), FakeDccPeer::Mode::Stall);
    FakeDccPeer peer_c(std::string(900'000, 'c'));

    FakeIrcServer server([&](FakeIrcServer&, const proto::Message& msg) {
        std::vector<std::string> replies;

        if (starts_with(msg, "@search")) {
            replies.push_back(
              BOT + " PRIVMSG bookworm :!A Jane Doe - Example Book.epub ::INFO:: 1.1MB"
            );
            replies.push_back(
              BOT + " PRIVMSG bookworm :!B Jane Doe - Example Book.mobi ::INFO:: 1.0MB"
            );
            replies.push_back(
              BOT + " PRIVMSG bookworm :!C Jane Doe - Example Book.epub ::INFO:: 878.9KB"
            );
        }
        else if (starts_with(msg, "!A ")) {
            replies.push_back(":A!a@fake PRIVMSG bookworm :" + peer_a.offer(name_a));
        }
        else if (starts_with(msg, "!C ")) {
            replies.push_back(":C!c@fake PRIVMSG bookworm :" + peer_c.offer(name_c));
        }

        return replies;
    });

    const auto dir = scratch_dir("fallback");
    auto config = test_config(server.port());
    config.download_dir = dir;

    Stack stack(config);
    auto id = stack.registry.acquire();
    assert(id);

    auto candidates = stack.searcher.search(*id, jane_doe("Example Book"));
    assert(candidates);
    assert(candidates->size() == 2);
    assert((*candidates)[0].server == "A");
    assert((*candidates)[1].server == "C");
    assert((*candidates)[0].trigger == "!A Jane Doe - Example Book.epub");

    auto file = stack.downloader.download_with_fallback(*id, *candidates, dir);

    assert(file);
    assert(file->path == dir / name_c);
    assert(file->size == 900'000);
    assert(read_file(file->path) == std::string(900'000, 'c'));
    assert(not fs::exists(dir / name_a));
    assert(peer_a.accepted() and peer_c.accepted());

    assert(stack.events.count(EventKind::Succeeded) == 1);
    assert(stack.events.count(EventKind::Failed) == 0);
    assert(stack.events.last(EventKind::Downloading)->bytes == 900'000);

    // Search command and both triggers, spaced by the limiter
    auto sent = server.received("PRIVMSG");
    assert(sent.size() == 3);
    assert(sent[1].msg.trailing() == "!A Jane Doe - Example Book.epub");
    assert(sent[2].msg.trailing() == "!C Jane Doe - Example Book.epub");

    const auto tolerance = 20ms;
    for (std::size_t i = 1; i < sent.size(); i++) {
        assert(sent[i].at - sent[i - 1].at >= config.command_interval - tolerance);
    }

    stack.registry.close_all();
}

void test_download_without_candidates()
{
    FakeIrcServer server;
    Stack stack(test_config(server.port()));

    auto id = stack.registry.acquire();
    assert(id);

    auto file = stack.downloader.download_with_fallback(*id, {}, scratch_dir("none"));
    assert(not file);
    assert(file.error().code == TransferErrorCode::NO_CANDIDATES);
    assert(server.received("PRIVMSG").empty());

    auto lost = stack.downloader.download_with_fallback("irc-42", {}, scratch_dir("none"));
    assert(not lost);

    stack.registry.close_all();
}

void test_download_offer_timeout()
{
    FakeIrcServer server;
    auto config = test_config(server.port());
    config.offer_timeout = 300ms;

    Stack stack(config);
    auto id = stack.registry.acquire();
    assert(id);

    const auto& parser = stack.searcher.parser();
    std::vector<search::Candidate> candidates;
    for (const auto* line : {
           "!Quiet Jane Doe - Example Book.epub ::INFO:: 1MB",
           "!Silent Jane Doe - Example Book.epub ::INFO:: 2MB",
         }) {
        auto candidate = parser.parse(line);
        assert(candidate);
        candidates.push_back(*candidate);
    }

    const auto started = std::chrono::steady_clock::now();
    auto file =
      stack.downloader.download_with_fallback(*id, candidates, scratch_dir("quiet"));

    assert(not file);
    assert(file.error().code == TransferErrorCode::TIMEOUT);
    assert(file.error().attempts == 2);
    assert(file.error().detail.starts_with("all 2 candidates failed"));
    assert(std::chrono::steady_clock::now() - started >= 2 * config.offer_timeout);

    assert(server.received("PRIVMSG").size() == 2);
    assert(stack.events.count(EventKind::Failed) == 1);
    assert(stack.events.count(EventKind::Succeeded) == 0);

    stack.registry.close_all();
}
