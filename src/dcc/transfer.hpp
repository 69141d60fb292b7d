#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include "config.hpp"
#include "dcc/offer.hpp"
#include "errors.hpp"

namespace ircbooks::dcc {

enum class TransferPhase
{
    Pending,
    Transferring,
    Verifying,
    Extracting,
    Succeeded,
    Failed,
};

/**
 * @brief Bookkeeping of one download attempt. Phases only move forward;
 * Succeeded and Failed are final.
 */
class TransferState
{
 public:
    TransferState(DccOffer offer, std::filesystem::path temp_path);

    /**
     * @return false (and no change) for a backward move, a move out of a
     * final phase or Succeeded before Verifying
     */
    auto advance(TransferPhase next) -> bool;

    auto fail(TransferErrorCode code, std::string detail) -> TransferError;

    auto add_received(std::uint64_t bytes) -> void { _received += bytes; }

    auto phase() const -> TransferPhase { return _phase; }
    auto is_final() const -> bool;
    auto received() const -> std::uint64_t { return _received; }
    auto expected_size() const -> std::uint64_t { return _offer.size; }
    auto offer() const -> const DccOffer& { return _offer; }
    auto temp_path() const -> const std::filesystem::path& { return _temp_path; }
    auto failure() const -> const std::optional<TransferError>& { return _failure; }

 private:
    DccOffer _offer;
    std::filesystem::path _temp_path;
    TransferPhase _phase = TransferPhase::Pending;
    std::uint64_t _received = 0;
    std::optional<TransferError> _failure;
};

struct LocalFile
{
    std::filesystem::path path;
    std::vector<std::filesystem::path> extracted_members;
    std::uint64_t size = 0;
};

auto to_json(nlohmann::json& json, const LocalFile& file) -> void;

/**
 * @brief Receives one DCC SEND offer into a destination directory.
 *
 * Bytes stream into "<temp>/<file>.part"; only a transfer of exactly the
 * offered size is moved into place. ZIP payloads are unpacked keeping the
 * members of the wanted extension only. Partial files never survive a
 * failed or cancelled attempt.
 */
class DccTransferEngine
{
 public:
    using ProgressCb = std::function<void(
      std::uint64_t /* received */, std::uint64_t /* total */
    )>;

    explicit DccTransferEngine(Config config);

    auto receive(
      const DccOffer& offer,
      const std::filesystem::path& destination,
      std::stop_token stop = {},
      ProgressCb progress = {},
      std::optional<std::string> wanted_extension = std::nullopt
    ) -> tl::expected<LocalFile, TransferError>;

    auto config() const -> const Config& { return _config; }

 private:
    auto _stream_to_file(TransferState& state, std::stop_token stop, ProgressCb& progress)
      -> tl::expected<void, TransferError>;

    auto _finish(
      TransferState& state,
      const std::filesystem::path& destination,
      const std::string& wanted_extension
    ) -> tl::expected<LocalFile, TransferError>;

    const Config _config;
};

/**
 * @brief Runs one DccTransferEngine::receive on its own thread. The
 * transfer stops when either the worker or the linked token is stopped.
 */
class TransferWorker
{
 public:
    TransferWorker(
      DccTransferEngine& engine,
      DccOffer offer,
      std::filesystem::path destination,
      std::stop_token linked_stop = {},
      DccTransferEngine::ProgressCb progress = {}
    );
    ~TransferWorker();

    TransferWorker(const TransferWorker&) = delete;
    TransferWorker& operator=(const TransferWorker&) = delete;

    auto start(std::optional<std::string> wanted_extension = std::nullopt) -> void;
    auto cancel() -> void;
    auto wait() -> tl::expected<LocalFile, TransferError>;

    auto started() const -> bool { return _thread.joinable(); }

 private:
    DccTransferEngine& _engine;
    DccOffer _offer;
    std::filesystem::path _destination;
    std::stop_token _linked_stop;
    DccTransferEngine::ProgressCb _progress;

    std::optional<tl::expected<LocalFile, TransferError>> _result;
    std::jthread _thread;
};

}  // namespace ircbooks::dcc
