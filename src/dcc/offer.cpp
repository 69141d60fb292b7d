#include "dcc/offer.hpp"

#include <charconv>
#include <cstdint>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <system_error>

#include <asio/ip/address_v4.hpp>
#include <fmt/core.h>
#include <tl/expected.hpp>

#include "proto/utils.hpp"

namespace ircbooks::dcc {

namespace {

const std::regex DCC_SEND_REGEX(
  R"(DCC SEND\s+"?(.+?)"?\s+(\d+(?:\.\d+){0,3})\s+(\d+)\s+(\d+)\s*$)",
  std::regex::icase
);

template<typename T>
auto parse_number(std::string_view text) -> std::optional<T>
{
    T value{};
    const auto [end, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);

    if (ec != std::errc{} or end != text.data() + text.size()) {
        return std::nullopt;
    }

    return value;
}

auto malformed(std::string detail) -> tl::unexpected<TransferError>
{
    return tl::make_unexpected(
      make_transfer_error(TransferErrorCode::MALFORMED_OFFER, std::move(detail))
    );
}

auto parse_ip(const std::string& text) -> std::optional<std::string>
{
    if (text.find('.') != std::string::npos) {
        asio::error_code ec;
        const auto address = asio::ip::make_address_v4(text, ec);
        if (ec or address.is_unspecified()) {
            return std::nullopt;
        }
        return address.to_string();
    }

    const auto value = parse_number<std::uint64_t>(text);
    if (not value or *value == 0 or *value > 0xFFFFFFFF) {
        return std::nullopt;
    }

    return proto::utils::ipv4_from_u32(uint32_t(*value));
}

}  // namespace

auto is_dcc_send(std::string_view text) -> bool
{
    return proto::utils::icontains(text, "DCC SEND");
}

auto unpack_dcc_send(std::string_view text, std::string sender)
  -> tl::expected<DccOffer, TransferError>
{
    std::string body{text};
    std::erase(body, proto::CTCP_DELIMITER);

    std::smatch match;
    if (not std::regex_search(body, match, DCC_SEND_REGEX)) {
        return malformed(fmt::format("not a DCC SEND offer: {}", body));
    }

    const auto filename = flatten_filename(match[1].str());
    if (filename.empty()) {
        return malformed(fmt::format("unusable file name: {}", match[1].str()));
    }

    const auto ip = parse_ip(match[2].str());
    if (not ip) {
        return malformed(fmt::format("bad peer address: {}", match[2].str()));
    }

    const auto port = parse_number<std::uint32_t>(match[3].str());
    if (not port or *port == 0 or *port > 65535) {
        return malformed(fmt::format(
          "unusable port {} (passive DCC is not supported)", match[3].str()
        ));
    }

    const auto size = parse_number<std::uint64_t>(match[4].str());
    if (not size or *size == 0) {
        return malformed(fmt::format("bad file size: {}", match[4].str()));
    }

    return DccOffer{
      .sender = std::move(sender),
      .filename = filename,
      .ip = *ip,
      .port = std::uint16_t(*port),
      .size = *size,
    };
}

auto unpack_dcc_send(const proto::Message& msg)
  -> tl::expected<DccOffer, TransferError>
{
    return unpack_dcc_send(msg.trailing(), msg.nick());
}

auto flatten_filename(std::string_view name) -> std::string
{
    const auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        name = name.substr(slash + 1);
    }

    name = proto::utils::trim(name);

    if (name == "." or name == "..") {
        return {};
    }

    return std::string(name);
}

}  // namespace ircbooks::dcc
