#pragma once

#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "proto/types.hpp"

namespace ircbooks::proto {

auto unpack_message(std::string_view line) -> tl::expected<Message, Error>;

/**
 * @brief Extract a CTCP request/reply embedded in a PRIVMSG/NOTICE text
 */
auto unpack_ctcp(std::string_view text) -> std::optional<CtcpMessage>;

/**
 * @brief Remove mIRC formatting (bold, colours, reset, reverse, italic,
 * underline)
 */
auto strip_formatting(std::string_view text) -> std::string;

}  // namespace ircbooks::proto
