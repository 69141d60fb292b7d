#include "proto/deserialize.hpp"

#include <cctype>
#include <optional>
#include <string>
#include <string_view>

#include <tl/expected.hpp>

#include "proto/types.hpp"
#include "proto/utils.hpp"

namespace ircbooks::proto {

auto Message::nick() const -> std::string
{
    const auto bang = prefix.find('!');
    return prefix.substr(0, bang);
}

auto Message::trailing() const -> std::string_view
{
    if (params.empty()) {
        return {};
    }

    return params.back();
}

auto Message::is(std::string_view cmd) const -> bool
{
    return utils::iequals(command, cmd);
}

auto unpack_message(std::string_view line) -> tl::expected<Message, Error>
{
    while (not line.empty() and (line.back() == '\r' or line.back() == '\n')) {
        line.remove_suffix(1);
    }

    if (utils::trim(line).empty()) {
        return tl::make_unexpected(Error::EMPTY_LINE);
    }

    Message msg;

    if (line.front() == ':') {
        const auto space = line.find(' ');
        if (space == std::string_view::npos or space == 1) {
            return tl::make_unexpected(Error::MALFORMED_PREFIX);
        }

        msg.prefix = std::string(line.substr(1, space - 1));
        line.remove_prefix(space + 1);
    }

    while (not line.empty() and line.front() == ' ') {
        line.remove_prefix(1);
    }

    const auto command_end = line.find(' ');
    msg.command = std::string(line.substr(0, command_end));

    if (msg.command.empty()) {
        return tl::make_unexpected(Error::MISSING_COMMAND);
    }

    if (command_end == std::string_view::npos) {
        return msg;
    }

    line.remove_prefix(command_end + 1);

    while (not line.empty()) {
        if (line.front() == ' ') {
            line.remove_prefix(1);
            continue;
        }

        if (line.front() == ':') {
            msg.params.emplace_back(line.substr(1));
            break;
        }

        const auto param_end = line.find(' ');
        msg.params.emplace_back(line.substr(0, param_end));

        if (param_end == std::string_view::npos) {
            break;
        }

        line.remove_prefix(param_end + 1);
    }

    return msg;
}

auto unpack_ctcp(std::string_view text) -> std::optional<CtcpMessage>
{
    if (text.size() < 2 or text.front() != CTCP_DELIMITER) {
        return std::nullopt;
    }

    text.remove_prefix(1);
    if (const auto end = text.find(CTCP_DELIMITER);
        end != std::string_view::npos) {
        text = text.substr(0, end);
    }

    if (text.empty()) {
        return std::nullopt;
    }

    const auto space = text.find(' ');

    CtcpMessage ctcp;
    ctcp.command = utils::to_upper(text.substr(0, space));

    if (space != std::string_view::npos) {
        ctcp.argument = std::string(text.substr(space + 1));
    }

    return ctcp;
}

auto strip_formatting(std::string_view text) -> std::string
{
    constexpr char BOLD = '\x02';
    constexpr char COLOR = '\x03';
    constexpr char RESET = '\x0F';
    constexpr char REVERSE = '\x16';
    constexpr char ITALIC = '\x1D';
    constexpr char UNDERLINE = '\x1F';

    std::string result;
    result.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); i++) {
        const char c = text[i];

        if (c == BOLD or c == RESET or c == REVERSE or c == ITALIC or
            c == UNDERLINE) {
            continue;
        }

        if (c == COLOR) {
            // \x03[fg[,bg]] with up to two digits each
            auto skip_digits = [&](std::size_t pos) {
                std::size_t n = 0;
                while (n < 2 and pos + n < text.size() and
                       std::isdigit(static_cast<unsigned char>(text[pos + n]))) {
                    n++;
                }
                return n;
            };

            auto fg = skip_digits(i + 1);
            i += fg;

            if (fg > 0 and i + 1 < text.size() and text[i + 1] == ',') {
                auto bg = skip_digits(i + 2);
                if (bg > 0) {
                    i += 1 + bg;
                }
            }
            continue;
        }

        result.push_back(c);
    }

    return result;
}

}  // namespace ircbooks::proto
