#include <cstdint>
#include <cstdio>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>
#include <indicators/progress_bar.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include "config.hpp"
#include "dcc/download.hpp"
#include "dcc/offer.hpp"
#include "dcc/transfer.hpp"
#include "events.hpp"
#include "irc/connection.hpp"
#include "irc/registry.hpp"
#include "misc/logging.hpp"
#include "misc/parse_host_port.hpp"
#include "search/coordinator.hpp"
#include "search/parser.hpp"
#include "search/types.hpp"

using Json = nlohmann::json;
namespace fs = std::filesystem;

using namespace ircbooks;

#ifdef IRCBOOKS_ENABLE_TESTS
void tests();
#endif


#define EXPECTED(assertion, msg_c_str, args...)                                \
    do {                                                                       \
        if (not bool(assertion)) {                                             \
            spdlog::error(msg_c_str, args);                                    \
            return ExitCode::Fail;                                             \
        }                                                                      \
    } while (0)


enum ExitCode
{
    Success = EXIT_SUCCESS,
    Fail = EXIT_FAILURE,
};

struct Options
{
    std::optional<fs::path> config_file;
    std::optional<fs::path> output_dir;
    std::optional<std::string> server;
    std::optional<std::size_t> max_results;
    bool epub_only = false;
    bool events = false;
    bool verbose = false;

    std::vector<std::string> positional;
};

auto parse_options(int argc, char* argv[], int first) -> Options;
auto load_config(const Options& options) -> tl::expected<Config, std::string>;

auto search_command(const Options& options) -> ExitCode;
auto download_command(const Options& options) -> ExitCode;
auto parse_command(const Options& options) -> ExitCode;
auto offer_command(const Options& options) -> ExitCode;


int main(int argc, char* argv[])
{
    spdlog::set_default_logger(spdlog::stderr_color_mt("ircbooks"));
    auto internal_logger = utils::internal_logger();

#ifdef NDEBUG
    spdlog::set_level(spdlog::level::info);
    internal_logger->set_level(spdlog::level::off);
#else
    spdlog::set_level(spdlog::level::debug);
    internal_logger->set_level(spdlog::level::off);
#endif

    if (argc < 2) {
        // clang-format off
        spdlog::error("Usage:");
        spdlog::error("  {} search [-c <config.json>] [--server <host>:<port>] [--epub-only] [--max N] [--events] <author> [<title>]", argv[0]);
        spdlog::error("  {} download [-c <config.json>] [--server <host>:<port>] [-o <dir>] [--events] <author> <title>", argv[0]);
        spdlog::error("  {} parse [-c <config.json>] <listing_file>", argv[0]);
        spdlog::error("  {} offer <dcc_send_line>", argv[0]);
        spdlog::error("  {} test", argv[0]);
        spdlog::error("  -v enables wire-level logging");
        // clang-format on
        return ExitCode::Fail;
    }

    std::string command = argv[1];

    try {
        if (command == "test") {
#ifdef IRCBOOKS_ENABLE_TESTS
            tests();
            return ExitCode::Success;
#else
            spdlog::error("Built without tests (IRCBOOKS_ENABLE_TESTS)");
            return ExitCode::Fail;
#endif
        }

        auto options = parse_options(argc, argv, 2);

        if (options.verbose) {
            spdlog::set_level(spdlog::level::debug);
            internal_logger->set_level(spdlog::level::trace);
        }

        if (command == "search") {
            EXPECTED(
              options.positional.size() == 1 or options.positional.size() == 2,
              "Usage: {} search [options] <author> [<title>]", argv[0]
            );
            return search_command(options);
        }

        if (command == "download") {
            EXPECTED(
              options.positional.size() == 2,
              "Usage: {} download [options] <author> <title>", argv[0]
            );
            return download_command(options);
        }

        if (command == "parse") {
            EXPECTED(
              options.positional.size() == 1,
              "Usage: {} parse [-c <config.json>] <listing_file>", argv[0]
            );
            return parse_command(options);
        }

        if (command == "offer") {
            EXPECTED(
              options.positional.size() == 1, "Usage: {} offer <dcc_send_line>",
              argv[0]
            );
            return offer_command(options);
        }
    } catch (const std::runtime_error& e) {
        spdlog::error("{}", e.what());
        return ExitCode::Fail;
    }

    spdlog::error(R"(Unknown command: "{0}")", command);
    return ExitCode::Fail;
}


auto parse_options(int argc, char* argv[], int first) -> Options
{
    Options options;

    auto value_of = [&](int& i) -> std::string {
        if (i + 1 >= argc) {
            throw std::runtime_error(fmt::format("Missing value for {}", argv[i]));
        }
        return argv[++i];
    };

    for (int i = first; i < argc; ++i) {
        const std::string arg = argv[i];

        if (arg == "-c" or arg == "--config") {
            options.config_file = value_of(i);
        }
        else if (arg == "-o" or arg == "--output") {
            options.output_dir = value_of(i);
        }
        else if (arg == "--server") {
            options.server = value_of(i);
        }
        else if (arg == "--max") {
            const auto value = value_of(i);
            try {
                options.max_results = std::stoull(value);
            } catch (const std::logic_error&) {
                throw std::runtime_error(fmt::format("Not a number: {}", value));
            }
        }
        else if (arg == "--epub-only") {
            options.epub_only = true;
        }
        else if (arg == "--events") {
            options.events = true;
        }
        else if (arg == "-v" or arg == "--verbose") {
            options.verbose = true;
        }
        else if (arg.size() > 1 and arg.starts_with('-')) {
            throw std::runtime_error(fmt::format("Unknown option: {}", arg));
        }
        else {
            options.positional.push_back(arg);
        }
    }

    return options;
}

/**
 * @brief Defaults, then the JSON file, then environment, then flags
 */
auto load_config(const Options& options) -> tl::expected<Config, std::string>
{
    auto config = options.config_file ? Config::from_file(*options.config_file)
                                      : tl::expected<Config, std::string>(Config{});

    if (not config) {
        return config;
    }

    if (auto env = config->apply_env(); not env) {
        return tl::make_unexpected(env.error());
    }

    if (options.server) {
        auto [host, port] = utils::parse_host_port(*options.server);
        config->server = host;
        config->port = port;
    }

    if (options.output_dir) {
        config->download_dir = *options.output_dir;
    }

    if (auto valid = config->validate(); not valid) {
        return tl::make_unexpected(valid.error());
    }

    return config;
}

auto event_printer(bool enabled) -> EventSink
{
    if (not enabled) {
        return {};
    }

    auto mutex = std::make_shared<std::mutex>();

    return [mutex](const ProgressEvent& event) {
        std::lock_guard lock(*mutex);
        fmt::println("{}", to_json(event).dump());
        std::fflush(stdout);
    };
}

auto progress_bar() -> std::shared_ptr<indicators::ProgressBar>
{
    using namespace indicators;

    return std::make_shared<ProgressBar>(
      option::BarWidth{50}, option::Start{"["}, option::Fill{"■"},
      option::Lead{"■"}, option::Remainder{"-"}, option::End{" ]"},
      option::PostfixText{"..."}, option::ForegroundColor{Color::grey},
      option::FontStyles{std::vector<FontStyle>{FontStyle::bold}},
      option::ShowElapsedTime{true}, option::Stream{std::cerr}
    );
}

auto set_progress(
  indicators::ProgressBar& bar, std::uint64_t current, std::uint64_t max
) -> void
{
    if (max == 0 or bar.is_completed()) {
        return;
    }

    const auto msg = fmt::format("{}/{}", current, max);
    bar.set_option(indicators::option::PostfixText{msg});

    const auto progress = std::size_t((double(current) / double(max)) * 100.0);
    bar.set_progress(progress);
}


auto search_command(const Options& options) -> ExitCode
{
    auto config = load_config(options);
    EXPECTED(config, "Bad configuration: {}", config.error());

    const auto events = event_printer(options.events);

    irc::ConnectionManager connections(*config);
    irc::SessionRegistry registry(connections, events);
    dcc::DccTransferEngine engine(*config);
    search::SearchCoordinator searcher(registry, engine, events);

    auto id = registry.acquire();
    EXPECTED(id, "Can not connect to {}: {}", config->server, id.error().message());

    search::SearchQuery query{
      .scope = options.positional.size() == 2 ? search::SearchScope::Title
                                              : search::SearchScope::Author,
      .author = options.positional[0],
      .title = options.positional.size() == 2
                 ? std::optional(options.positional[1])
                 : std::nullopt,
      .epub_only = options.epub_only,
      .max_results = options.max_results.value_or(50),
    };

    auto found = searcher.search(*id, query);
    registry.close(*id);

    EXPECTED(found, "Search failed: {}", found.error().message());

    if (not options.events) {
        fmt::println("{}", Json(*found).dump(2));
    }

    return ExitCode::Success;
}

auto download_command(const Options& options) -> ExitCode
{
    auto config = load_config(options);
    EXPECTED(config, "Bad configuration: {}", config.error());

    const auto events = event_printer(options.events);

    auto bar = options.events ? nullptr : progress_bar();
    auto on_progress = [bar](std::uint64_t received, std::uint64_t total) {
        if (bar) {
            set_progress(*bar, received, total);
        }
    };

    irc::ConnectionManager connections(*config);
    irc::SessionRegistry registry(connections, events);
    dcc::DccTransferEngine engine(*config);
    search::SearchCoordinator searcher(registry, engine, events);
    dcc::DownloadCoordinator downloader(registry, engine, events, on_progress);

    auto id = registry.acquire();
    EXPECTED(id, "Can not connect to {}: {}", config->server, id.error().message());

    search::SearchQuery query{
      .scope = search::SearchScope::Title,
      .author = options.positional[0],
      .title = options.positional[1],
      .epub_only = true,
      .max_results = options.max_results.value_or(50),
    };

    auto candidates = searcher.search(*id, query);
    if (not candidates) {
        registry.close(*id);
        spdlog::error("Search failed: {}", candidates.error().message());
        return ExitCode::Fail;
    }

    auto file =
      downloader.download_with_fallback(*id, *candidates, config->download_dir);
    registry.close(*id);

    if (bar and not bar->is_completed()) {
        bar->mark_as_completed();
    }

    EXPECTED(file, "Download failed: {}", file.error().message());

    if (not options.events) {
        fmt::println("{}", Json(*file).dump(2));
    }

    return ExitCode::Success;
}

auto parse_command(const Options& options) -> ExitCode
{
    auto config = load_config(options);
    EXPECTED(config, "Bad configuration: {}", config.error());

    const fs::path listing = options.positional[0];
    EXPECTED(fs::exists(listing), "File not found: \"{}\"", listing.string());

    std::ifstream file(listing);
    EXPECTED(file, "Can't read file {}", listing.string());

    std::vector<std::string> lines;
    for (std::string line; std::getline(file, line);) {
        if (not line.empty() and line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }

    search::SearchResultParser parser(*config);
    auto candidates = parser.prioritize(parser.parse_lines(lines));

    spdlog::info("{} candidates in {} lines", candidates.size(), lines.size());

    fmt::println("{}", Json(candidates).dump(2));

    return ExitCode::Success;
}

auto offer_command(const Options& options) -> ExitCode
{
    auto offer = dcc::unpack_dcc_send(options.positional[0]);
    EXPECTED(offer, "Not an offer: {}", offer.error().message());

    fmt::println(
      "{}", Json{
              {"filename", offer->filename},
              {"ip", offer->ip},
              {"port", offer->port},
              {"size", offer->size},
            }
              .dump(2)
    );

    return ExitCode::Success;
}
