#include "proto/serialize.hpp"

#include <string>
#include <string_view>

#include <fmt/core.h>

#include "proto/types.hpp"

namespace ircbooks::proto {

using namespace internal;

auto pack_nick(std::string_view nickname) -> std::string
{
    return pack_line(fmt::format("NICK {}", nickname));
}

auto pack_user(std::string_view username, std::string_view realname)
  -> std::string
{
    return pack_line(fmt::format("USER {} 0 * :{}", username, realname));
}

auto pack_join(std::string_view channel) -> std::string
{
    return pack_line(fmt::format("JOIN {}", channel));
}

auto pack_privmsg(std::string_view target, std::string_view text)
  -> std::string
{
    return pack_line(fmt::format("PRIVMSG {} :{}", target, text));
}

auto pack_notice(std::string_view target, std::string_view text)
  -> std::string
{
    return pack_line(fmt::format("NOTICE {} :{}", target, text));
}

auto pack_ping(std::string_view token) -> std::string
{
    return pack_line(fmt::format("PING :{}", token));
}

auto pack_pong(std::string_view token) -> std::string
{
    return pack_line(fmt::format("PONG :{}", token));
}

auto pack_quit(std::string_view reason) -> std::string
{
    return pack_line(fmt::format("QUIT :{}", reason));
}

auto pack_ctcp(std::string_view command, std::string_view argument)
  -> std::string
{
    if (argument.empty()) {
        return fmt::format("{0}{1}{0}", CTCP_DELIMITER, command);
    }

    return fmt::format("{0}{1} {2}{0}", CTCP_DELIMITER, command, argument);
}

}  // namespace ircbooks::proto


namespace ircbooks::proto::internal {

auto pack_line(std::string_view line) -> std::string
{
    std::string packed;
    packed.reserve(line.size() + 2);

    for (char c : line) {
        if (c != '\r' and c != '\n') {
            packed.push_back(c);
        }
    }

    if (packed.size() > MAX_LINE_LENGTH - 2) {
        packed.resize(MAX_LINE_LENGTH - 2);
    }

    packed += "\r\n";
    return packed;
}

}  // namespace ircbooks::proto::internal
