#include "dcc/download.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stop_token>
#include <string>
#include <vector>

#include <asio/error.hpp>
#include <fmt/core.h>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include "proto/serialize.hpp"
#include "proto/utils.hpp"

namespace ircbooks::dcc {

namespace fs = std::filesystem;

namespace {

constexpr std::uint64_t PROGRESS_EVENT_STEPS = 100;

auto is_terminal(TransferErrorCode code) -> bool
{
    return code == TransferErrorCode::CANCELLED or
           code == TransferErrorCode::NOT_CONNECTED;
}

}  // namespace

DownloadCoordinator::DownloadCoordinator(
  irc::SessionRegistry& registry,
  DccTransferEngine& engine,
  EventSink events,
  DccTransferEngine::ProgressCb progress
) :
  _registry(registry),
  _engine(engine),
  _events(std::move(events)),
  _progress(std::move(progress)),
  _config(engine.config())
{
}

auto DownloadCoordinator::download_with_fallback(
  const irc::SessionId& id,
  const std::vector<search::Candidate>& candidates,
  const fs::path& destination,
  std::stop_token stop
) -> tl::expected<LocalFile, TransferError>
{
    if (candidates.empty()) {
        return _fail(
          id, make_transfer_error(TransferErrorCode::NO_CANDIDATES, "nothing to download")
        );
    }

    auto session = _registry.get(id);
    if (not session or not session->is_open()) {
        return _fail(
          id,
          make_transfer_error(
            TransferErrorCode::NOT_CONNECTED, fmt::format("no open session {}", id)
          )
        );
    }

    auto lock = session->lock_operation();

    TransferError last;
    std::size_t attempts = 0;

    for (const auto& candidate : candidates) {
        attempts++;

        spdlog::info(
          "[{}] Candidate {}/{}: {} from {}", id, attempts, candidates.size(),
          candidate.filename, candidate.server
        );

        auto file = _attempt(*session, candidate, destination, stop);

        if (file) {
            spdlog::info("[{}] Downloaded {}", id, file->path.string());

            emit(
              _events,
              ProgressEvent{
                .kind = EventKind::Succeeded,
                .session = id,
                .detail = file->path.string(),
                .bytes = file->size,
                .total = file->size,
              }
            );

            return file;
        }

        last = file.error();

        if (is_terminal(last.code)) {
            return _fail(
              id,
              make_transfer_error(
                last.code,
                fmt::format("stopped after {} candidates: {}", attempts, last.message()),
                attempts
              )
            );
        }

        spdlog::warn(
          "[{}] Candidate {} failed: {}", id, candidate.trigger, last.message()
        );
    }

    return _fail(
      id,
      make_transfer_error(
        last.code,
        fmt::format(
          "all {} candidates failed; last error: {}", attempts, last.message()
        ),
        attempts
      )
    );
}

auto DownloadCoordinator::_attempt(
  irc::Session& session,
  const search::Candidate& candidate,
  const fs::path& destination,
  std::stop_token stop
) -> tl::expected<LocalFile, TransferError>
{
    session.clear_inbox();

    auto sent = session.send_command(
      proto::pack_privmsg(_config.channel, candidate.trigger), stop
    );

    if (not sent) {
        return tl::make_unexpected(make_transfer_error(
          sent.error() == asio::error::operation_aborted
            ? TransferErrorCode::CANCELLED
            : TransferErrorCode::NOT_CONNECTED,
          sent.error().message()
        ));
    }

    auto offer = _await_offer(session, candidate, stop);
    if (not offer) {
        return tl::make_unexpected(offer.error());
    }

    if (candidate.size and *candidate.size != offer->size) {
        spdlog::debug(
          "[{}] Listed size {} differs from offered {}", session.id(),
          *candidate.size, offer->size
        );
    }

    const auto session_id = session.id();
    std::uint64_t next_report = 0;

    auto on_progress = [&, session_id](std::uint64_t received, std::uint64_t total) {
        if (_progress) {
            _progress(received, total);
        }

        if (received < next_report and received != total) {
            return;
        }

        next_report = received + std::max<std::uint64_t>(total / PROGRESS_EVENT_STEPS, 1);

        emit(
          _events,
          ProgressEvent{
            .kind = EventKind::Downloading,
            .session = session_id,
            .detail = offer->filename,
            .bytes = received,
            .total = total,
          }
        );
    };

    on_progress(0, offer->size);

    TransferWorker worker(
      _engine, *offer, destination, session.stop_token(), on_progress
    );
    worker.start();

    std::stop_callback on_stop(stop, [&worker] { worker.cancel(); });

    return worker.wait();
}

auto DownloadCoordinator::_await_offer(
  irc::Session& session, const search::Candidate& candidate, std::stop_token stop
) -> tl::expected<DccOffer, TransferError>
{
    const auto deadline = std::chrono::steady_clock::now() + _config.offer_timeout;

    while (auto msg = session.next_message(deadline, stop)) {
        if (not msg->is("PRIVMSG") and not msg->is("NOTICE")) {
            continue;
        }

        if (not is_dcc_send(msg->trailing())) {
            continue;
        }

        if (_config.match_offer_sender and
            not proto::utils::iequals(msg->nick(), candidate.server)) {
            spdlog::debug(
              "[{}] Ignoring offer from {} while waiting for {}", session.id(),
              msg->nick(), candidate.server
            );
            continue;
        }

        auto offer = unpack_dcc_send(*msg);
        if (not offer) {
            return offer;
        }

        if (proto::utils::icontains(offer->filename, _config.results_marker)) {
            spdlog::debug(
              "[{}] Ignoring late result listing {}", session.id(), offer->filename
            );
            continue;
        }

        return offer;
    }

    if (stop.stop_requested()) {
        return tl::make_unexpected(
          make_transfer_error(TransferErrorCode::CANCELLED, "download cancelled")
        );
    }

    if (session.inbox_closed()) {
        return tl::make_unexpected(make_transfer_error(
          TransferErrorCode::NOT_CONNECTED, "connection lost while waiting for offer"
        ));
    }

    return tl::make_unexpected(make_transfer_error(
      TransferErrorCode::TIMEOUT,
      fmt::format(
        "no offer from {} within {} ms", candidate.server,
        _config.offer_timeout.count()
      )
    ));
}

auto DownloadCoordinator::_fail(const irc::SessionId& id, TransferError error)
  -> tl::unexpected<TransferError>
{
    spdlog::error("[{}] Download failed: {}", id, error.message());

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

}  // namespace ircbooks::dcc
