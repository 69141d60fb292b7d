#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "errors.hpp"
#include "proto/types.hpp"

namespace ircbooks::dcc {

/**
 * @brief Decoded "DCC SEND <file> <ip> <port> <size>" request
 */
struct DccOffer
{
    std::string sender;
    std::string filename;
    std::string ip;
    std::uint16_t port = 0;
    std::uint64_t size = 0;
};

auto is_dcc_send(std::string_view text) -> bool;

/**
 * @brief Decode an offer from CTCP text, with or without \x01 framing.
 *
 * The IP may be the classic decimal u32 or dotted IPv4. Passive offers
 * (port 0), empty files and unusable names are MALFORMED_OFFER.
 */
auto unpack_dcc_send(std::string_view text, std::string sender = {})
  -> tl::expected<DccOffer, TransferError>;

auto unpack_dcc_send(const proto::Message& msg)
  -> tl::expected<DccOffer, TransferError>;

/// Last path component; empty for "." and ".."
auto flatten_filename(std::string_view name) -> std::string;

}  // namespace ircbooks::dcc
