#pragma once

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

#include <fmt/core.h>

namespace ircbooks::proto::utils {

/// Network byte order, as used by DCC acknowledgements
inline auto pack_u32(uint32_t value) -> std::array<uint8_t, 4>
{
    return {
      uint8_t((value >> 24) & 0xFF),  // Most significant byte
      uint8_t((value >> 16) & 0xFF),
      uint8_t((value >> 8) & 0xFF),
      uint8_t(value & 0xFF),  // Least significant byte
    };
}

inline auto unpack_u32(std::span<const uint8_t> msg) -> uint32_t
{
    return (uint32_t)msg[0] << 24 | ((uint32_t)msg[1] << 16) |
           ((uint32_t)msg[2] << 8) | ((uint32_t)msg[3]);
}

/// DCC encodes IPv4 addresses as a single decimal u32
inline auto ipv4_from_u32(uint32_t value) -> std::string
{
    const auto bytes = pack_u32(value);
    return fmt::format("{}.{}.{}.{}", bytes[0], bytes[1], bytes[2], bytes[3]);
}

inline auto trim(std::string_view text) -> std::string_view
{
    constexpr std::string_view SPACES = " \t\r\n";

    const auto begin = text.find_first_not_of(SPACES);
    if (begin == std::string_view::npos) {
        return {};
    }

    const auto end = text.find_last_not_of(SPACES);
    return text.substr(begin, end - begin + 1);
}

inline auto to_lower(std::string_view text) -> std::string
{
    std::string result{text};
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return char(std::tolower(c));
    });
    return result;
}

inline auto to_upper(std::string_view text) -> std::string
{
    std::string result{text};
    std::ranges::transform(result, result.begin(), [](unsigned char c) {
        return char(std::toupper(c));
    });
    return result;
}

inline auto iequals(std::string_view a, std::string_view b) -> bool
{
    return std::ranges::equal(a, b, [](unsigned char l, unsigned char r) {
        return std::tolower(l) == std::tolower(r);
    });
}

inline auto icontains(std::string_view haystack, std::string_view needle)
  -> bool
{
    return to_lower(haystack).find(to_lower(needle)) != std::string::npos;
}

}  // namespace ircbooks::proto::utils
