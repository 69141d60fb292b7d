#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace ircbooks::proto {

constexpr const std::size_t MAX_LINE_LENGTH = 512;
constexpr const char CTCP_DELIMITER = '\x01';

namespace numeric {

constexpr std::string_view WELCOME = "001";
constexpr std::string_view MY_INFO = "004";
constexpr std::string_view END_OF_NAMES = "366";
constexpr std::string_view ERRONEUS_NICKNAME = "432";
constexpr std::string_view NICKNAME_IN_USE = "433";
constexpr std::string_view NICK_COLLISION = "436";
constexpr std::string_view UNAVAILABLE_RESOURCE = "437";

}  // namespace numeric

enum class Error
{
    EMPTY_LINE,
    MISSING_COMMAND,
    MALFORMED_PREFIX,
};

/**
 * @brief One IRC protocol line: [:prefix] COMMAND params [:trailing]
 *
 * The trailing parameter, when present, is the last element of params.
 */
struct Message
{
    std::string prefix;
    std::string command;
    std::vector<std::string> params;

    /// Nickname part of the prefix (before '!')
    auto nick() const -> std::string;

    /// Last parameter or empty string
    auto trailing() const -> std::string_view;

    auto is(std::string_view cmd) const -> bool;
};

struct CtcpMessage
{
    std::string command;
    std::string argument;
};

}  // namespace ircbooks::proto
