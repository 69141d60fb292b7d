#pragma once

#include <string>
#include <string_view>

#include "proto/types.hpp"

namespace ircbooks::proto {

auto pack_nick(std::string_view nickname) -> std::string;
auto pack_user(std::string_view username, std::string_view realname)
  -> std::string;
auto pack_join(std::string_view channel) -> std::string;
auto pack_privmsg(std::string_view target, std::string_view text)
  -> std::string;
auto pack_notice(std::string_view target, std::string_view text)
  -> std::string;
auto pack_ping(std::string_view token) -> std::string;
auto pack_pong(std::string_view token) -> std::string;
auto pack_quit(std::string_view reason) -> std::string;

auto pack_ctcp(std::string_view command, std::string_view argument)
  -> std::string;

namespace internal {

/**
 * @brief Terminate with CRLF, dropping embedded line breaks and
 * truncating to the protocol line limit
 */
auto pack_line(std::string_view line) -> std::string;

}  // namespace internal

}  // namespace ircbooks::proto
