#include "dcc/transfer.hpp"

#include <algorithm>
#include <cstdint>
#include <exception>
#include <filesystem>
#include <fstream>
#include <optional>
#include <span>
#include <stdexcept>
#include <stop_token>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <asio/error.hpp>
#include <fmt/core.h>
#include <magic_enum.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

#include "archive/zip.hpp"
#include "misc/cancel.hpp"
#include "misc/logging.hpp"
#include "misc/tcp_transfer.hpp"
#include "proto/utils.hpp"

namespace ircbooks::dcc {

namespace fs = std::filesystem;

namespace {

auto remove_quietly(const fs::path& path) -> void
{
    std::error_code ec;
    if (fs::remove(path, ec); ec) {
        spdlog::warn("Can not remove {}: {}", path.string(), ec.message());
    }
}

/// rename(), or copy + remove across file systems
auto move_file(const fs::path& from, const fs::path& to) -> std::error_code
{
    std::error_code ec;
    fs::rename(from, to, ec);

    if (ec) {
        ec.clear();
        fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
        if (not ec) {
            remove_quietly(from);
        }
    }

    return ec;
}

}  // namespace

TransferState::TransferState(DccOffer offer, fs::path temp_path) :
  _offer(std::move(offer)),
  _temp_path(std::move(temp_path))
{
}

auto TransferState::is_final() const -> bool
{
    return _phase == TransferPhase::Succeeded or _phase == TransferPhase::Failed;
}

auto TransferState::advance(TransferPhase next) -> bool
{
    if (is_final()) {
        return false;
    }

    if (next != TransferPhase::Failed) {
        if (next <= _phase) {
            return false;
        }

        if ((next == TransferPhase::Succeeded or next == TransferPhase::Extracting) and
            _phase < TransferPhase::Verifying) {
            return false;
        }
    }

    spdlog::debug(
      "{}: {} -> {}", _offer.filename, magic_enum::enum_name(_phase),
      magic_enum::enum_name(next)
    );

    _phase = next;
    return true;
}

auto TransferState::fail(TransferErrorCode code, std::string detail)
  -> TransferError
{
    auto error = make_transfer_error(code, std::move(detail));

    if (advance(TransferPhase::Failed)) {
        _failure = error;
    }

    return error;
}

auto to_json(nlohmann::json& json, const LocalFile& file) -> void
{
    json = nlohmann::json{
      {"path", file.path.string()},
      {"size", file.size},
      {"extracted_members",
       file.extracted_members |
         ranges::views::transform([](const fs::path& p) { return p.string(); }) |
         ranges::to<std::vector<std::string>>()},
    };
}

DccTransferEngine::DccTransferEngine(Config config) : _config(std::move(config))
{
}

auto DccTransferEngine::receive(
  const DccOffer& offer,
  const fs::path& destination,
  std::stop_token stop,
  ProgressCb progress,
  std::optional<std::string> wanted_extension
) -> tl::expected<LocalFile, TransferError>
{
    const auto temp_dir = _config.temp_dir_for(destination);

    std::error_code ec;
    fs::create_directories(destination, ec);
    if (not ec) {
        fs::create_directories(temp_dir, ec);
    }

    if (ec) {
        return tl::make_unexpected(make_transfer_error(
          TransferErrorCode::IO_FAILURE,
          fmt::format("can not create {}: {}", temp_dir.string(), ec.message())
        ));
    }

    TransferState state(offer, temp_dir / fmt::format("{}.part", offer.filename));

    spdlog::info(
      "Receiving {} ({} bytes) from {} at {}:{}", offer.filename, offer.size,
      offer.sender.empty() ? "unknown" : offer.sender, offer.ip, offer.port
    );

    auto result =
      _stream_to_file(state, stop, progress).and_then([&] {
          return _finish(
            state, destination, wanted_extension.value_or(_config.target_extension)
          );
      });

    if (not result) {
        remove_quietly(state.temp_path());

        spdlog::warn(
          "Transfer of {} failed after {}/{} bytes: {}", offer.filename,
          state.received(), offer.size, result.error().message()
        );
    }

    return result;
}

auto DccTransferEngine::_stream_to_file(
  TransferState& state, std::stop_token stop, ProgressCb& progress
) -> tl::expected<void, TransferError>
{
    const auto& offer = state.offer();

    auto map_socket_error = [&](const asio::error_code& ec, std::string_view what) {
        if (ec == asio::error::operation_aborted) {
            return state.fail(TransferErrorCode::CANCELLED, "transfer cancelled");
        }

        if (ec == asio::error::timed_out) {
            return state.fail(
              TransferErrorCode::STALLED,
              fmt::format(
                "no data for {} ms at {}/{} bytes", _config.stall_timeout.count(),
                state.received(), offer.size
              )
            );
        }

        return state.fail(
          TransferErrorCode::IO_FAILURE, fmt::format("{}: {}", what, ec.message())
        );
    };

    net::tcp::TcpTransfer peer(_config.stall_timeout);

    if (auto connected =
          peer.do_connect(offer.ip, offer.port, _config.connect_timeout, stop);
        not connected) {
        return tl::make_unexpected(
          map_socket_error(connected.error(), "can not reach peer")
        );
    }

    std::ofstream file(state.temp_path(), std::ios::out | std::ios::binary | std::ios::trunc);
    if (not file) {
        return tl::make_unexpected(state.fail(
          TransferErrorCode::IO_FAILURE,
          fmt::format("can not open {}", state.temp_path().string())
        ));
    }

    state.advance(TransferPhase::Transferring);

    std::vector<uint8_t> buffer(_config.dcc_buffer_size);

    while (state.received() < offer.size) {
        const auto wanted =
          std::min<std::uint64_t>(buffer.size(), offer.size - state.received());

        auto read = peer.do_read_some(std::span(buffer.data(), wanted), stop);

        if (not read) {
            if (read.error() == asio::error::eof or
                read.error() == asio::error::connection_reset) {
                break;  // short transfer, decided by verification
            }
            return tl::make_unexpected(map_socket_error(read.error(), "read failed"));
        }

        file.write(reinterpret_cast<const char*>(buffer.data()), std::streamsize(*read));
        if (not file) {
            return tl::make_unexpected(state.fail(
              TransferErrorCode::IO_FAILURE,
              fmt::format("can not write {}", state.temp_path().string())
            ));
        }

        state.add_received(*read);

        if (_config.dcc_send_acks) {
            const auto ack = proto::utils::pack_u32(uint32_t(state.received()));
            if (auto sent = peer.do_write(ack, stop); not sent) {
                utils::internal_logger()->debug(
                  "DCC ack not sent: {}", sent.error().message()
                );
            }
        }

        if (progress) {
            progress(state.received(), offer.size);
        }
    }

    peer.close();
    file.close();

    state.advance(TransferPhase::Verifying);

    if (not file) {
        return tl::make_unexpected(state.fail(
          TransferErrorCode::IO_FAILURE,
          fmt::format("can not flush {}", state.temp_path().string())
        ));
    }

    if (state.received() != offer.size) {
        return tl::make_unexpected(state.fail(
          TransferErrorCode::INCOMPLETE,
          fmt::format("received {} of {} bytes", state.received(), offer.size)
        ));
    }

    std::error_code ec;
    const auto on_disk = fs::file_size(state.temp_path(), ec);

    if (ec or on_disk != offer.size) {
        return tl::make_unexpected(state.fail(
          TransferErrorCode::INCOMPLETE,
          fmt::format("{} bytes on disk, {} offered", on_disk, offer.size)
        ));
    }

    return {};
}

auto DccTransferEngine::_finish(
  TransferState& state, const fs::path& destination, const std::string& wanted_extension
) -> tl::expected<LocalFile, TransferError>
{
    const auto& offer = state.offer();
    const auto target = destination / offer.filename;

    if (auto ec = move_file(state.temp_path(), target)) {
        return tl::make_unexpected(state.fail(
          TransferErrorCode::IO_FAILURE,
          fmt::format("can not move file to {}: {}", target.string(), ec.message())
        ));
    }

    const bool wants_archive = proto::utils::iequals(wanted_extension, "zip");

    if (wants_archive or not archive::is_zip(target)) {
        state.advance(TransferPhase::Succeeded);
        spdlog::info("Saved {} ({} bytes)", target.string(), offer.size);

        return LocalFile{.path = target, .extracted_members = {}, .size = offer.size};
    }

    state.advance(TransferPhase::Extracting);

    auto members = archive::extract_matching(target, destination, wanted_extension);
    remove_quietly(target);

    if (not members) {
        return tl::make_unexpected(state.fail(
          members.error() == archive::Error::ENCRYPTED
            ? TransferErrorCode::NO_MATCHING_CONTENT
            : TransferErrorCode::IO_FAILURE,
          fmt::format(
            "can not unpack {}: {}", offer.filename,
            reason_name(members.error())
          )
        ));
    }

    if (members->empty()) {
        return tl::make_unexpected(state.fail(
          TransferErrorCode::NO_MATCHING_CONTENT,
          fmt::format("no .{} member in {}", wanted_extension, offer.filename)
        ));
    }

    std::uint64_t size = 0;
    for (const auto& member : *members) {
        std::error_code ec;
        size += fs::file_size(member, ec);
    }

    state.advance(TransferPhase::Succeeded);

    return LocalFile{
      .path = members->front(),
      .extracted_members = std::move(*members),
      .size = size,
    };
}

TransferWorker::TransferWorker(
  DccTransferEngine& engine,
  DccOffer offer,
  fs::path destination,
  std::stop_token linked_stop,
  DccTransferEngine::ProgressCb progress
) :
  _engine(engine),
  _offer(std::move(offer)),
  _destination(std::move(destination)),
  _linked_stop(std::move(linked_stop)),
  _progress(std::move(progress))
{
}

TransferWorker::~TransferWorker()
{
    if (_thread.joinable()) {
        _thread.request_stop();
        _thread.join();
    }
}

auto TransferWorker::start(std::optional<std::string> wanted_extension) -> void
{
    if (_thread.joinable()) {
        throw std::runtime_error("Last started transfer must be awaited.");
    }

    _result.reset();

    _thread = std::jthread([this, wanted_extension](std::stop_token own_stop) {
        utils::LinkedStop stop(own_stop, _linked_stop);

        try {
            _result = _engine.receive(
              _offer, _destination, stop.token(), _progress, wanted_extension
            );
        } catch (const std::exception& e) {
            _result = tl::make_unexpected(
              make_transfer_error(TransferErrorCode::IO_FAILURE, e.what())
            );
        }
    });
}

auto TransferWorker::cancel() -> void { _thread.request_stop(); }

auto TransferWorker::wait() -> tl::expected<LocalFile, TransferError>
{
    if (not _thread.joinable()) {
        throw std::runtime_error("Transfer was not started.");
    }

    _thread.join();

    return _result.value_or(tl::make_unexpected(make_transfer_error(
      TransferErrorCode::IO_FAILURE, "transfer finished without result"
    )));
}

}  // namespace ircbooks::dcc
