#include <cassert>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "dcc/offer.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "misc/parse_host_port.hpp"
#include "proto/deserialize.hpp"
#include "proto/serialize.hpp"
#include "proto/types.hpp"
#include "proto/utils.hpp"
#include "search/parser.hpp"
#include "search/types.hpp"

using namespace ircbooks;
using namespace std::string_view_literals;

void test_pack_u32();
void test_unpack_message();
void test_pack_lines();
void test_ctcp();
void test_strip_formatting();
void test_parse_result_line();
void test_parse_sizes();
void test_filter_and_priority();
void test_trigger_round_trip();
void test_titles();
void test_dcc_offer();
void test_config();
void test_events();
void test_parse_host_port();

// tests/*.cpp
void test_transfers();
void test_sessions();
void test_flows();

void tests()
{
    test_pack_u32();
    test_unpack_message();
    test_pack_lines();
    test_ctcp();
    test_strip_formatting();
    test_parse_result_line();
    test_parse_sizes();
    test_filter_and_priority();
    test_trigger_round_trip();
    test_titles();
    test_dcc_offer();
    test_config();
    test_events();
    test_parse_host_port();

    test_transfers();
    test_sessions();
    test_flows();

    spdlog::info("All tests passed");
}

void test_pack_u32()
{
    uint32_t a = 2130706433;
    auto packed = proto::utils::pack_u32(a);
    assert(packed[0] == 127 and packed[3] == 1);

    auto unpacked = proto::utils::unpack_u32(packed);
    assert(unpacked == a);

    assert(proto::utils::ipv4_from_u32(a) == "127.0.0.1");
}

void test_unpack_message()
{
    using namespace proto;

    auto msg = unpack_message(":Search!bot@host PRIVMSG #ebooks :hello  world\r\n");
    assert(msg);
    assert(msg->prefix == "Search!bot@host");
    assert(msg->nick() == "Search");
    assert(msg->is("privmsg"));
    assert(msg->params.size() == 2);
    assert(msg->params[0] == "#ebooks");
    assert(msg->trailing() == "hello  world");

    auto ping = unpack_message("PING :irc.example.net");
    assert(ping);
    assert(ping->prefix.empty());
    assert(ping->command == "PING");
    assert(ping->trailing() == "irc.example.net");

    auto numeric = unpack_message(":srv 433 * bookworm :Nickname is already in use");
    assert(numeric);
    assert(numeric->is(numeric::NICKNAME_IN_USE));
    assert(numeric->params[1] == "bookworm");

    auto bare = unpack_message("QUIT");
    assert(bare and bare->params.empty() and bare->trailing().empty());

    assert(unpack_message("\r\n").error() == Error::EMPTY_LINE);
    assert(unpack_message(": PRIVMSG x").error() == Error::MALFORMED_PREFIX);
    assert(unpack_message(":prefix").error() == Error::MALFORMED_PREFIX);
}

void test_pack_lines()
{
    using namespace proto;

    assert(pack_nick("bookworm") == "NICK bookworm\r\n");
    assert(pack_user("bookworm", "ircbooks") == "USER bookworm 0 * :ircbooks\r\n");
    assert(pack_join("#ebooks") == "JOIN #ebooks\r\n");
    assert(pack_privmsg("#ebooks", "@search jane doe") == "PRIVMSG #ebooks :@search jane doe\r\n");
    assert(pack_pong("abc") == "PONG :abc\r\n");
    assert(pack_quit("Goodbye") == "QUIT :Goodbye\r\n");

    // Embedded line breaks can not smuggle a second command
    assert(pack_privmsg("#ebooks", "a\r\nQUIT") == "PRIVMSG #ebooks :aQUIT\r\n");
}

void test_ctcp()
{
    using namespace proto;

    assert(pack_ctcp("VERSION", "") == "\x01VERSION\x01");
    assert(pack_ctcp("VERSION", "ircbooks 1.0") == "\x01VERSION ircbooks 1.0\x01");

    auto version = unpack_ctcp("\x01version\x01");
    assert(version and version->command == "VERSION" and version->argument.empty());

    auto ping = unpack_ctcp("\x01PING 12345\x01");
    assert(ping and ping->command == "PING" and ping->argument == "12345");

    assert(not unpack_ctcp("plain text"));
    assert(not unpack_ctcp("\x01\x01"));
}

void test_strip_formatting()
{
    using proto::strip_formatting;

    assert(strip_formatting("\x02" "bold\x02 text") == "bold text");
    assert(strip_formatting("\x03" "04,01red\x03 plain") == "red plain");
    assert(strip_formatting("\x03" "4green") == "green");
    assert(strip_formatting("\x1F" "under\x0F\x16\x1D") == "under");

    // A comma without background colour digits is text
    assert(strip_formatting("\x03" "12,x") == ",x");
}

void test_parse_result_line()
{
    search::SearchResultParser parser(Config{});

    auto plain = parser.parse(
      "!Bsk Jane Doe - Example Book (retail).epub ::INFO:: 1.1MB"
    );
    assert(plain);
    assert(plain->server == "Bsk");
    assert(plain->filename == "Jane Doe - Example Book (retail).epub");
    assert(plain->format == "epub");
    assert(plain->priority == 1);
    assert(plain->author == "Jane Doe");
    assert(plain->title == "Example Book");
    assert(plain->size == 1'153'434);
    assert(plain->trigger == "!Bsk Jane Doe - Example Book (retail).epub");

    auto hashed = parser.parse(
      ":Search!b@h NOTICE bookworm :\x02!Dumbledore\x02 %A1B2C3% "
      "Jane_Doe - Other Book.epub.zip ::INFO:: 332.7KB ::HASH:: abcd"
    );
    assert(hashed);
    assert(hashed->server == "Dumbledore");
    assert(hashed->filename == "Jane_Doe - Other Book.epub.zip");
    assert(hashed->format == "epub");
    assert(hashed->title == "Other Book");
    assert(hashed->trigger == "!Dumbledore %A1B2C3% Jane_Doe - Other Book.epub.zip");

    auto sizeless = parser.parse("!Oatmeal Jane Doe - Example Book.mobi");
    assert(sizeless and not sizeless->size and sizeless->format == "mobi");
    assert(sizeless->priority == 2);

    assert(not parser.parse("Welcome to #ebooks, type @search to begin"));
    assert(not parser.parse("!Oatmeal"));
    assert(not parser.parse("!Oatmeal no extension here ::INFO:: 1MB"));
    assert(not parser.parse(""));

    // Oversized sizes are channel noise too: the line survives, the size does not
    const auto huge_digits = fmt::format(
      "!x Jane Doe - Example Book.epub ::INFO:: {}", std::string(400, '9')
    );
    auto huge = parser.parse(huge_digits);
    assert(huge and huge->filename == "Jane Doe - Example Book.epub");
    assert(not huge->size);

    auto huge_unit = parser.parse(
      "!x Jane Doe - Example Book.epub ::INFO:: 99999999999999999999TB"
    );
    assert(huge_unit and not huge_unit->size);
}

void test_parse_sizes()
{
    using search::parse_size;

    assert(parse_size("784") == 784);
    assert(parse_size("1KB") == 1024);
    assert(parse_size("1.5 kb") == 1536);
    assert(parse_size("2GB") == 2ull * 1024 * 1024 * 1024);
    assert(parse_size("1.2 MB") == 1'258'291);
    assert(parse_size("3MiB") == 3 * 1024 * 1024);
    assert(not parse_size("big"));
    assert(not parse_size(""));

    assert(parse_size("1023TB") == 1023ull * 1024 * 1024 * 1024 * 1024);
    assert(not parse_size(std::string(400, '9')));
    assert(not parse_size("99999999999999999999TB"));
    assert(not parse_size("18446744073709551616"));
}

void test_filter_and_priority()
{
    search::SearchResultParser parser("epub", {"mobi", "pdf"});

    assert(parser.priority_of("EPUB") == 1);
    assert(parser.priority_of("mobi") == 2);
    assert(parser.priority_of("pdf") == 3);
    assert(parser.priority_of("djvu") == 4);

    auto candidates = parser.parse_lines({
      "!A Jane Doe - Example Book.pdf",
      "!B Jane Doe - Example Book.epub",
      "not a result",
      "!C Jane Doe - Example Book.mobi",
      "!D Jane Doe - Example Book.epub",
    });
    assert(candidates.size() == 4);

    auto ranked = parser.prioritize(candidates);
    assert(ranked[0].server == "B");
    assert(ranked[1].server == "D");  // ties keep arrival order
    assert(ranked[2].server == "C");
    assert(ranked[3].server == "A");

    auto epubs = parser.filter(candidates, true);
    assert(epubs.size() == 2);
    assert(epubs[0].server == "B" and epubs[1].server == "D");

    auto everything = parser.filter(candidates, false);
    assert(everything.size() == candidates.size());

    auto no_epub = parser.filter(
      parser.parse_lines({"!A Some - Book.pdf", "!C Some - Book.mobi"}), true
    );
    assert(no_epub.empty());

    assert(parser.filter({}, true).empty());

    auto titles = search::distinct_titles(parser.parse_lines({
      "!B Jane Doe - Example Book.epub",
      "!D Jane Doe - The Example Book [retail].epub",
      "!A Jane Doe - Other Book.epub",
    }));
    assert(titles.size() == 2);
    assert(titles[0].server == "B" and titles[1].server == "A");

    auto servers = search::distinct_servers(parser.parse_lines({
      "!Bsk Jane Doe - Example Book.epub",
      "!bsk Jane Doe - Example Book (v2).epub",
      "!Oat Jane Doe - Example Book.epub",
    }));
    assert(servers.size() == 2);
    assert(servers[0].server == "Bsk" and servers[1].server == "Oat");
}

void test_trigger_round_trip()
{
    search::SearchResultParser parser(Config{});

    const std::vector<std::string_view> triggers = {
      "!Bsk Jane Doe - Example Book.epub",
      "!pondering42 %F00D% J. R. Author - The [Series 01] Title v2.0.epub",
      "!Xyz Author_Name-Title.With.Dots.rar",
    };

    for (const auto trigger : triggers) {
        const auto line = fmt::format("{}  ::INFO:: 12KB ::HASH:: ffff", trigger);
        auto candidate = parser.parse(line);

        assert(candidate);
        assert(candidate->trigger == trigger);
    }
}

void test_titles()
{
    using search::normalize_title;
    using search::titles_match;

    assert(normalize_title("The Example Book (retail) [EN] v2") == "example book");
    assert(normalize_title("A") == "a");

    assert(titles_match("Example Book", "example book"));
    assert(titles_match("The Example Book: Special Edition", "Example Book"));
    assert(titles_match("Example Great Book", "Example Book Great"));
    assert(not titles_match("Completely Different", "Example Book"));
    assert(not titles_match("", "Example Book"));
}

void test_dcc_offer()
{
    using dcc::unpack_dcc_send;

    assert(dcc::is_dcc_send("\x01" "dcc send file.epub 1 2 3\x01"));
    assert(not dcc::is_dcc_send("DCC CHAT chat 1 2"));

    auto offer = unpack_dcc_send("\x01" "DCC SEND book.epub 2130706433 5000 1048576\x01", "Bsk");
    assert(offer);
    assert(offer->sender == "Bsk");
    assert(offer->filename == "book.epub");
    assert(offer->ip == "127.0.0.1");
    assert(offer->port == 5000);
    assert(offer->size == 1048576);

    auto quoted = unpack_dcc_send(R"(DCC SEND "Jane Doe - Example Book.epub" 10.0.0.2 5001 42)");
    assert(quoted);
    assert(quoted->filename == "Jane Doe - Example Book.epub");
    assert(quoted->ip == "10.0.0.2");

    auto traversal = unpack_dcc_send("DCC SEND ../../etc/passwd 2130706433 5000 10");
    assert(traversal and traversal->filename == "passwd");

    auto msg = proto::unpack_message(
      ":Bsk!bot@host PRIVMSG bookworm :\x01" "DCC SEND a.epub 2130706433 5000 10\x01"
    );
    assert(msg);
    auto from_msg = unpack_dcc_send(*msg);
    assert(from_msg and from_msg->sender == "Bsk");

    auto passive = unpack_dcc_send("DCC SEND a.epub 2130706433 0 10");
    assert(not passive);
    assert(passive.error().code == TransferErrorCode::MALFORMED_OFFER);

    auto empty = unpack_dcc_send("DCC SEND a.epub 2130706433 5000 0");
    assert(not empty and empty.error().reason() == "malformed_offer");

    assert(not unpack_dcc_send("DCC SEND a.epub 2130706433 70000 10"));
    assert(not unpack_dcc_send("DCC SEND a.epub 1.2.3.999 5000 10"));
    assert(not unpack_dcc_send("DCC SEND .. 2130706433 5000 10"));
    assert(not unpack_dcc_send("DCC SEND a.epub"));

    assert(dcc::flatten_filename(R"(dir\sub\book.epub)") == "book.epub");
    assert(dcc::flatten_filename("..").empty());
}

void test_config()
{
    auto config = Config::from_json(nlohmann::json::parse(R"({
        "server": "irc.example.net",
        "port": 6667,
        "tls": false,
        "channel": "#books",
        "nick_suffixes": ["_", "__"],
        "command_interval_ms": 2500,
        "fallback_formats": ["mobi"]
    })"));

    assert(config);
    assert(config->server == "irc.example.net");
    assert(config->port == 6667);
    assert(not config->tls);
    assert(config->channel == "#books");
    assert(config->nick_suffixes.size() == 2);
    assert(config->command_interval.count() == 2500);
    assert(config->fallback_formats == std::vector<std::string>{"mobi"});
    assert(config->target_extension == "epub");

    assert(not Config::from_json(nlohmann::json::parse(R"({"port": "six"})")));
    assert(not Config::from_json(nlohmann::json::parse(R"({"port": 0})")));
    assert(not Config::from_json(nlohmann::json::parse(R"({"port": 70000})")));
    assert(not Config::from_json(nlohmann::json::parse(R"({"port": -1})")));
    assert(not Config::from_json(nlohmann::json::parse(R"({"plain_port": 70000})")));

    auto wide = Config::from_json(nlohmann::json::parse(R"({"port": 65535})"));
    assert(wide and wide->port == 65535);
    assert(not Config::from_json(nlohmann::json::parse(R"({"channel": ""})")));
    assert(not Config::from_json(nlohmann::json::parse("[1, 2]")));

    Config defaults;
    assert(defaults.validate());
    assert(defaults.temp_dir_for("out") == std::filesystem::path("out") / ".partial");

    defaults.temp_dir = "/tmp/partial";
    assert(defaults.temp_dir_for("out") == std::filesystem::path("/tmp/partial"));

    auto dumped = Config::from_json(defaults.to_json());
    assert(dumped and dumped->temp_dir == defaults.temp_dir);
}

void test_events()
{
    auto failed = to_json(ProgressEvent{
      .kind = EventKind::Failed,
      .session = "irc-1",
      .detail = "all 2 candidates failed",
      .reason = "stalled",
    });

    assert(failed["event"] == "failed");
    assert(failed["session"] == "irc-1");
    assert(failed["reason"] == "stalled");
    assert(not failed.contains("bytes"));

    auto progress = to_json(ProgressEvent{
      .kind = EventKind::Downloading, .bytes = 10, .total = 20
    });
    assert(progress["event"] == "downloading");
    assert(progress["bytes"] == 10 and progress["total"] == 20);

    assert(event_name(EventKind::ResultCount) == "result_count");

    auto error = make_transfer_error(TransferErrorCode::NO_MATCHING_CONTENT, "cover only", 2);
    assert(error.reason() == "no_matching_content");
    assert(error.message() == "no_matching_content: cover only");
    assert(error.attempts == 2);

    // Not yet filled in: first code, no detail, no attempts
    TransferError blank;
    assert(blank.code == TransferErrorCode::TIMEOUT);
    assert(blank.detail.empty() and blank.attempts == 0);

    SearchError search_blank;
    assert(search_blank.reason() == "timeout");
}

void test_parse_host_port()
{
    auto [host, port] = utils::parse_host_port("irc.irchighway.net:6697");
    assert(host == "irc.irchighway.net");
    assert(port == 6697);

    bool thrown = false;
    try {
        utils::parse_host_port("irc.irchighway.net");
    } catch (const std::runtime_error&) {
        thrown = true;
    }
    assert(thrown);
}
