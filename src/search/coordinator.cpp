#include "search/coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

#include <asio/error.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include "proto/serialize.hpp"
#include "proto/utils.hpp"

namespace ircbooks::search {

namespace fs = std::filesystem;

namespace {

constexpr std::string_view NO_MATCHES_NOTICE = "returned no matches";
constexpr std::string_view LISTING_EXTENSION = "txt";

auto read_text_lines(const fs::path& path) -> std::vector<std::string>
{
    std::vector<std::string> lines;
    std::ifstream file(path);

    for (std::string line; std::getline(file, line);) {
        if (not line.empty() and line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(std::move(line));
    }

    return lines;
}

}  // namespace

SearchCoordinator::SearchCoordinator(
  irc::SessionRegistry& registry, dcc::DccTransferEngine& engine, EventSink events
) :
  _registry(registry),
  _engine(engine),
  _events(std::move(events)),
  _config(engine.config()),
  _parser(_config)
{
}

auto SearchCoordinator::search(
  const irc::SessionId& id, const SearchQuery& query, std::stop_token stop
) -> tl::expected<std::vector<Candidate>, SearchError>
{
    auto session = _registry.get(id);
    if (not session or not session->is_open()) {
        return _fail(
          id, {SearchErrorCode::NOT_CONNECTED, fmt::format("no open session {}", id)}
        );
    }

    auto lock = session->lock_operation();
    session->clear_inbox();

    const auto text = query.text();

    emit(
      _events,
      ProgressEvent{.kind = EventKind::Searching, .session = id, .detail = text}
    );

    spdlog::info("[{}] Searching \"{}\" in {}", id, text, _config.channel);

    auto sent = session->send_command(
      proto::pack_privmsg(
        _config.channel, fmt::format("{} {}", _config.search_prefix, text)
      ),
      stop
    );

    if (not sent) {
        if (sent.error() == asio::error::operation_aborted) {
            return _fail(id, {SearchErrorCode::CANCELLED, "search cancelled"});
        }

        return _fail(id, {SearchErrorCode::NOT_CONNECTED, sent.error().message()});
    }

    auto raw = _collect(*session, stop);
    if (not raw) {
        return _fail(id, raw.error());
    }

    auto candidates = _parser.filter(std::move(*raw), query.epub_only);

    if (query.scope == SearchScope::Title and query.title) {
        std::erase_if(candidates, [&](const Candidate& candidate) {
            return not titles_match(candidate.title, *query.title);
        });
    }

    candidates = _parser.prioritize(std::move(candidates));

    // Author scope lists each book once, title scope asks each server once
    candidates = query.scope == SearchScope::Author
                   ? distinct_titles(std::move(candidates))
                   : distinct_servers(std::move(candidates));

    if (query.max_results > 0 and candidates.size() > query.max_results) {
        candidates.resize(query.max_results);
    }

    if (candidates.empty()) {
        return _fail(
          id, {SearchErrorCode::NO_RESULTS, "no candidate passed the filters"}
        );
    }

    spdlog::info("[{}] {} candidates for \"{}\"", id, candidates.size(), text);

    emit(
      _events,
      ProgressEvent{
        .kind = EventKind::ResultCount,
        .session = id,
        .detail = text,
        .count = candidates.size(),
      }
    );

    return candidates;
}

auto SearchCoordinator::_collect(irc::Session& session, std::stop_token stop)
  -> tl::expected<std::vector<Candidate>, SearchError>
{
    const auto deadline =
      std::chrono::steady_clock::now() + _config.response_window;

    std::vector<Candidate> raw;

    while (auto msg = session.next_message(deadline, stop)) {
        if (not msg->is("PRIVMSG") and not msg->is("NOTICE")) {
            continue;
        }

        const auto text = msg->trailing();

        if (dcc::is_dcc_send(text)) {
            auto offer = dcc::unpack_dcc_send(*msg);

            if (not offer) {
                spdlog::debug("[{}] {}", session.id(), offer.error().message());
                continue;
            }

            if (not proto::utils::icontains(offer->filename, _config.results_marker)) {
                spdlog::debug(
                  "[{}] Ignoring unexpected offer {} from {}", session.id(),
                  offer->filename, offer->sender
                );
                continue;
            }

            auto listed = _receive_listing(session, *offer, stop);
            std::ranges::move(listed, std::back_inserter(raw));
            break;
        }

        if (proto::utils::icontains(text, NO_MATCHES_NOTICE)) {
            spdlog::info("[{}] {}: {}", session.id(), msg->nick(), text);
            return tl::make_unexpected(
              SearchError{SearchErrorCode::NO_RESULTS, std::string(text)}
            );
        }

        if (auto candidate = _parser.parse(text)) {
            raw.push_back(std::move(*candidate));
        }
    }

    if (stop.stop_requested()) {
        return tl::make_unexpected(
          SearchError{SearchErrorCode::CANCELLED, "search cancelled"}
        );
    }

    if (raw.empty()) {
        if (session.inbox_closed()) {
            return tl::make_unexpected(SearchError{
              SearchErrorCode::NOT_CONNECTED, "connection lost during search"
            });
        }

        return tl::make_unexpected(SearchError{
          SearchErrorCode::TIMEOUT,
          fmt::format("no results within {} ms", _config.response_window.count())
        });
    }

    spdlog::debug("[{}] {} raw candidates", session.id(), raw.size());

    return raw;
}

auto SearchCoordinator::_receive_listing(
  irc::Session& session, const dcc::DccOffer& offer, std::stop_token stop
) -> std::vector<Candidate>
{
    const auto destination =
      _config.temp_dir_for(_config.download_dir) / "listings";

    dcc::TransferWorker worker(_engine, offer, destination, session.stop_token());
    worker.start(std::string(LISTING_EXTENSION));

    std::stop_callback on_stop(stop, [&worker] { worker.cancel(); });

    auto listing = worker.wait();
    if (not listing) {
        spdlog::warn(
          "[{}] Result listing {} not received: {}", session.id(),
          offer.filename, listing.error().message()
        );
        return {};
    }

    auto files = listing->extracted_members;
    if (files.empty()) {
        files.push_back(listing->path);
    }

    std::vector<Candidate> candidates;

    for (const auto& file : files) {
        auto parsed = _parser.parse_lines(read_text_lines(file));
        std::ranges::move(parsed, std::back_inserter(candidates));

        std::error_code ec;
        if (fs::remove(file, ec); ec) {
            spdlog::debug("Can not remove {}: {}", file.string(), ec.message());
        }
    }

    spdlog::info(
      "[{}] Listing {}: {} candidates", session.id(), offer.filename,
      candidates.size()
    );

    return candidates;
}

auto SearchCoordinator::_fail(const irc::SessionId& id, SearchError error)
  -> tl::unexpected<SearchError>
{
    spdlog::warn("[{}] Search failed: {}", id, error.message());

    emit(
      _events,
      ProgressEvent{
        .kind = EventKind::Failed,
        .session = id,
        .detail = error.detail,
        .reason = error.reason(),
      }
    );

    return tl::make_unexpected(std::move(error));
}

}  // namespace ircbooks::search
