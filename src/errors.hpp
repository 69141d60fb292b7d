#pragma once

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <string>
#include <string_view>
#include <utility>

#include <fmt/core.h>
#include <magic_enum.hpp>

namespace ircbooks {

enum class ConnectionErrorCode
{
    REFUSED,
    TIMEOUT,
    REGISTRATION_FAILED,
    CANCELLED,
};

enum class SearchErrorCode
{
    TIMEOUT,
    NO_RESULTS,
    NOT_CONNECTED,
    CANCELLED,
};

enum class TransferErrorCode
{
    TIMEOUT,
    MALFORMED_OFFER,
    STALLED,
    INCOMPLETE,
    NO_MATCHING_CONTENT,
    IO_FAILURE,
    NOT_CONNECTED,
    NO_CANDIDATES,
    CANCELLED,
};

/**
 * @brief Lower-case enum name, the form used in events ("malformed_offer")
 */
template<typename Code>
inline auto reason_name(Code code) -> std::string
{
    std::string name{magic_enum::enum_name(code)};

    std::ranges::transform(name, name.begin(), [](unsigned char c) {
        return char(std::tolower(c));
    });

    return name;
}

template<typename Code>
struct Error
{
    Code code{};
    std::string detail;

    inline auto reason() const -> std::string { return reason_name(code); }

    inline auto message() const -> std::string
    {
        if (detail.empty()) {
            return reason();
        }

        return fmt::format("{}: {}", reason(), detail);
    }
};

using ConnectionError = Error<ConnectionErrorCode>;
using SearchError = Error<SearchErrorCode>;

struct TransferError : Error<TransferErrorCode>
{
    /// Number of candidates tried before giving up (fallback only)
    std::size_t attempts = 0;
};

inline auto make_transfer_error(
  TransferErrorCode code, std::string detail, std::size_t attempts = 0
) -> TransferError
{
    TransferError error;
    error.code = code;
    error.detail = std::move(detail);
    error.attempts = attempts;
    return error;
}

}  // namespace ircbooks
