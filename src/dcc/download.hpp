#pragma once

#include <filesystem>
#include <stop_token>
#include <vector>

#include <tl/expected.hpp>

#include "config.hpp"
#include "dcc/offer.hpp"
#include "dcc/transfer.hpp"
#include "errors.hpp"
#include "events.hpp"
#include "irc/registry.hpp"
#include "search/types.hpp"

namespace ircbooks::dcc {

/**
 * @brief Walks a candidate list in order until one file arrives.
 *
 * Per candidate: rate limited trigger, bounded wait for the DCC offer,
 * transfer on a TransferWorker. Any single failure moves on to the next
 * candidate; only an exhausted list (or cancellation, or a lost session)
 * is reported, carrying the last reason.
 *
 * Events and progress callbacks are invoked from transfer threads.
 */
class DownloadCoordinator
{
 public:
    DownloadCoordinator(
      irc::SessionRegistry& registry,
      DccTransferEngine& engine,
      EventSink events = {},
      DccTransferEngine::ProgressCb progress = {}
    );

    auto download_with_fallback(
      const irc::SessionId& id,
      const std::vector<search::Candidate>& candidates,
      const std::filesystem::path& destination,
      std::stop_token stop = {}
    ) -> tl::expected<LocalFile, TransferError>;

 private:
    auto _attempt(
      irc::Session& session,
      const search::Candidate& candidate,
      const std::filesystem::path& destination,
      std::stop_token stop
    ) -> tl::expected<LocalFile, TransferError>;

    auto _await_offer(
      irc::Session& session, const search::Candidate& candidate, std::stop_token stop
    ) -> tl::expected<DccOffer, TransferError>;

    auto _fail(const irc::SessionId& id, TransferError error)
      -> tl::unexpected<TransferError>;

    irc::SessionRegistry& _registry;
    DccTransferEngine& _engine;
    EventSink _events;
    DccTransferEngine::ProgressCb _progress;

    const Config& _config;
};

}  // namespace ircbooks::dcc
