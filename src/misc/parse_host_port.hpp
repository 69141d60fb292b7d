#pragma once

#include <cstdint>
#include <regex>
#include <stdexcept>
#include <string>
#include <tuple>

#include <fmt/core.h>

namespace utils {

/**
 * @brief Split "<host>:<port>" where host is a name or dotted IPv4
 */
inline auto parse_host_port(std::string host_port_str)
  -> std::tuple<std::string, uint16_t>
{
    std::regex host_port_regex(  //
      R"(([A-Za-z0-9.\-]+):(\d{1,5}))"
    );
    std::smatch match;

    if (not std::regex_match(host_port_str, match, host_port_regex)) {
        throw std::runtime_error(fmt::format(
          "Server address must be in format \"<host>:<port>\". Found: {0}",
          host_port_str
        ));
    }

    auto host = match[1].str();
    auto port = std::stoul(match[2].str());

    if (port == 0 or port > 65535) {
        throw std::runtime_error(
          fmt::format("Port out of range in \"{0}\"", host_port_str)
        );
    }

    return {host, uint16_t(port)};
}

}  // namespace utils
