#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace ircbooks {

using Json = nlohmann::json;
using Milliseconds = std::chrono::milliseconds;

/**
 * @brief Every tunable of the engine. Network business rules (channel,
 * bot prefix) live here, not in code.
 */
struct Config
{
    // Network
    std::string server = "irc.irchighway.net";
    std::uint16_t port = 6697;
    bool tls = true;
    bool tls_verify = false;
    bool plain_fallback = false;
    std::uint16_t plain_port = 6667;
    std::string channel = "#ebooks";

    // Identity
    std::string nickname = "bookworm";
    std::vector<std::string> nick_suffixes;
    std::size_t max_nick_retries = 3;
    std::string realname = "ircbooks";
    std::string version_reply = "ircbooks 1.0";

    // Bot
    std::string search_prefix = "@search";
    std::string results_marker = "_results_for";

    // Timing
    Milliseconds command_interval{10'000};
    Milliseconds connect_timeout{30'000};
    Milliseconds registration_timeout{60'000};
    Milliseconds join_timeout{10'000};
    Milliseconds response_window{20'000};
    Milliseconds offer_timeout{60'000};
    Milliseconds stall_timeout{30'000};
    Milliseconds quit_timeout{2'000};
    Milliseconds keepalive_interval{120'000};
    Milliseconds stale_after{300'000};
    std::size_t max_connect_attempts = 3;
    Milliseconds backoff_base{5'000};

    // Files
    std::string target_extension = "epub";
    std::vector<std::string> fallback_formats = {
      "mobi", "azw3", "pdf", "txt", "rtf", "html", "htm",
      "doc",  "lit",  "cbr", "cdr", "jpg", "rar",  "zip",
    };
    std::filesystem::path download_dir = "downloads";
    std::filesystem::path temp_dir;  // empty: <destination>/.partial

    // Engine
    std::size_t inbox_capacity = 1024;
    std::size_t dcc_buffer_size = 64 * 1024;
    bool dcc_send_acks = false;
    bool match_offer_sender = true;

    static auto from_json(const Json&) -> tl::expected<Config, std::string>;
    static auto from_file(std::filesystem::path)
      -> tl::expected<Config, std::string>;

    /**
     * @brief Override fields from IRC_SERVER, IRC_PORT, IRC_CHANNEL,
     * IRC_NICKNAME, IRC_TIMEOUT and DOWNLOAD_DIR
     */
    auto apply_env() -> tl::expected<void, std::string>;
    auto validate() const -> tl::expected<void, std::string>;

    auto to_json() const -> Json;

    auto temp_dir_for(const std::filesystem::path& destination) const
      -> std::filesystem::path;
};

}  // namespace ircbooks
