#pragma once

#include <stop_token>
#include <vector>

#include <tl/expected.hpp>

#include "config.hpp"
#include "dcc/offer.hpp"
#include "dcc/transfer.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "irc/registry.hpp"
#include "search/parser.hpp"
#include "search/types.hpp"

namespace ircbooks::search {

/**
 * @brief Sends one search command and gathers candidates for the response
 * window.
 *
 * Results arrive either as channel/notice lines or as a DCC'd
 * "<bot>_results_for_<query>.txt.zip" listing; the latter closes the window
 * as soon as it is parsed.
 */
class SearchCoordinator
{
 public:
    SearchCoordinator(
      irc::SessionRegistry& registry,
      dcc::DccTransferEngine& engine,
      EventSink events = {}
    );

    auto search(
      const irc::SessionId& id, const SearchQuery& query, std::stop_token stop = {}
    ) -> tl::expected<std::vector<Candidate>, SearchError>;

    auto parser() const -> const SearchResultParser& { return _parser; }

 private:
    auto _collect(irc::Session& session, std::stop_token stop)
      -> tl::expected<std::vector<Candidate>, SearchError>;

    auto _receive_listing(
      irc::Session& session, const dcc::DccOffer& offer, std::stop_token stop
    ) -> std::vector<Candidate>;

    auto _fail(const irc::SessionId& id, SearchError error)
      -> tl::unexpected<SearchError>;

    irc::SessionRegistry& _registry;
    dcc::DccTransferEngine& _engine;
    EventSink _events;

    const Config& _config;
    SearchResultParser _parser;
};

}  // namespace ircbooks::search
