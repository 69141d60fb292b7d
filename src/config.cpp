#include "config.hpp"

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <tl/expected.hpp>

namespace ircbooks {

namespace {

template<typename T>
auto read_field(const Json& json, const char* key, T& field) -> void
{
    if (json.contains(key)) {
        field = json.at(key).get<T>();
    }
}

auto read_port(const Json& json, const char* key, std::uint16_t& field)
  -> tl::expected<void, std::string>
{
    if (not json.contains(key)) {
        return {};
    }

    // Wide read: get<uint16_t> would wrap 70000 silently
    const auto value = json.at(key).get<std::int64_t>();
    if (value < 1 or value > 65535) {
        return tl::make_unexpected(
          fmt::format("{} must be in range 1..65535, got {}", key, value)
        );
    }

    field = std::uint16_t(value);
    return {};
}

auto read_duration(const Json& json, std::string_view key, Milliseconds& field)
  -> void
{
    const auto name = fmt::format("{}_ms", key);

    if (json.contains(name)) {
        field = Milliseconds(json.at(name).get<std::int64_t>());
    }
}

auto read_path(const Json& json, const char* key, std::filesystem::path& field)
  -> void
{
    if (json.contains(key)) {
        field = json.at(key).get<std::string>();
    }
}

auto env(const char* name) -> std::optional<std::string>
{
    const char* value = std::getenv(name);
    if (value == nullptr or *value == '\0') {
        return std::nullopt;
    }

    return std::string(value);
}

auto parse_port(const std::string& text) -> std::optional<std::uint16_t>
{
    try {
        const auto value = std::stoul(text);
        if (value == 0 or value > 65535) {
            return std::nullopt;
        }
        return std::uint16_t(value);
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

}  // namespace

auto Config::from_json(const Json& json) -> tl::expected<Config, std::string>
{
    if (not json.is_object()) {
        return tl::make_unexpected("Configuration root must be an object");
    }

    Config config;

    try {
        read_field(json, "server", config.server);
        if (auto port = read_port(json, "port", config.port); not port) {
            return tl::make_unexpected(port.error());
        }
        read_field(json, "tls", config.tls);
        read_field(json, "tls_verify", config.tls_verify);
        read_field(json, "plain_fallback", config.plain_fallback);
        if (auto port = read_port(json, "plain_port", config.plain_port); not port) {
            return tl::make_unexpected(port.error());
        }
        read_field(json, "channel", config.channel);

        read_field(json, "nickname", config.nickname);
        read_field(json, "nick_suffixes", config.nick_suffixes);
        read_field(json, "max_nick_retries", config.max_nick_retries);
        read_field(json, "realname", config.realname);
        read_field(json, "version_reply", config.version_reply);

        read_field(json, "search_prefix", config.search_prefix);
        read_field(json, "results_marker", config.results_marker);

        read_duration(json, "command_interval", config.command_interval);
        read_duration(json, "connect_timeout", config.connect_timeout);
        read_duration(
          json, "registration_timeout", config.registration_timeout
        );
        read_duration(json, "join_timeout", config.join_timeout);
        read_duration(json, "response_window", config.response_window);
        read_duration(json, "offer_timeout", config.offer_timeout);
        read_duration(json, "stall_timeout", config.stall_timeout);
        read_duration(json, "quit_timeout", config.quit_timeout);
        read_duration(json, "keepalive_interval", config.keepalive_interval);
        read_duration(json, "stale_after", config.stale_after);
        read_field(json, "max_connect_attempts", config.max_connect_attempts);
        read_duration(json, "backoff_base", config.backoff_base);

        read_field(json, "target_extension", config.target_extension);
        read_field(json, "fallback_formats", config.fallback_formats);
        read_path(json, "download_dir", config.download_dir);
        read_path(json, "temp_dir", config.temp_dir);

        read_field(json, "inbox_capacity", config.inbox_capacity);
        read_field(json, "dcc_buffer_size", config.dcc_buffer_size);
        read_field(json, "dcc_send_acks", config.dcc_send_acks);
        read_field(json, "match_offer_sender", config.match_offer_sender);
    } catch (const Json::exception& e) {
        return tl::make_unexpected(
          fmt::format("Bad configuration value: {}", e.what())
        );
    }

    if (auto valid = config.validate(); not valid) {
        return tl::make_unexpected(valid.error());
    }

    return config;
}

auto Config::from_file(std::filesystem::path file_path)
  -> tl::expected<Config, std::string>
{
    if (not std::filesystem::exists(file_path)) {
        return tl::make_unexpected(
          fmt::format("Config file not found: \"{}\"", file_path.string())
        );
    }

    std::ifstream config_file(file_path);
    const auto json = Json::parse(config_file, nullptr, false);

    if (json.is_discarded()) {
        return tl::make_unexpected(
          fmt::format("Config file is not valid JSON: {}", file_path.string())
        );
    }

    spdlog::debug("Loaded configuration from {}", file_path.string());

    return from_json(json);
}

auto Config::apply_env() -> tl::expected<void, std::string>
{
    if (auto value = env("IRC_SERVER")) {
        server = *value;
    }

    if (auto value = env("IRC_PORT")) {
        auto parsed = parse_port(*value);
        if (not parsed) {
            return tl::make_unexpected(
              fmt::format("IRC_PORT must be a port number, got \"{}\"", *value)
            );
        }
        port = *parsed;
    }

    if (auto value = env("IRC_CHANNEL")) {
        channel = *value;
    }

    if (auto value = env("IRC_NICKNAME")) {
        nickname = *value;
    }

    if (auto value = env("IRC_TIMEOUT")) {
        try {
            offer_timeout = std::chrono::seconds(std::stoul(*value));
        } catch (const std::exception&) {
            return tl::make_unexpected(fmt::format(
              "IRC_TIMEOUT must be a number of seconds, got \"{}\"", *value
            ));
        }
    }

    if (auto value = env("DOWNLOAD_DIR")) {
        download_dir = *value;
    }

    return validate();
}

auto Config::validate() const -> tl::expected<void, std::string>
{
    if (server.empty()) {
        return tl::make_unexpected("server must not be empty");
    }

    if (port == 0 or (plain_fallback and plain_port == 0)) {
        return tl::make_unexpected("port must be in range 1..65535");
    }

    if (nickname.empty()) {
        return tl::make_unexpected("nickname must not be empty");
    }

    if (channel.empty()) {
        return tl::make_unexpected("channel must not be empty");
    }

    if (max_connect_attempts == 0) {
        return tl::make_unexpected("max_connect_attempts must be positive");
    }

    if (target_extension.empty()) {
        return tl::make_unexpected("target_extension must not be empty");
    }

    if (dcc_buffer_size == 0) {
        return tl::make_unexpected("dcc_buffer_size must be positive");
    }

    return {};
}

auto Config::to_json() const -> Json
{
    return Json{
      {"server", server},
      {"port", port},
      {"tls", tls},
      {"tls_verify", tls_verify},
      {"plain_fallback", plain_fallback},
      {"plain_port", plain_port},
      {"channel", channel},
      {"nickname", nickname},
      {"nick_suffixes", nick_suffixes},
      {"max_nick_retries", max_nick_retries},
      {"realname", realname},
      {"version_reply", version_reply},
      {"search_prefix", search_prefix},
      {"results_marker", results_marker},
      {"command_interval_ms", command_interval.count()},
      {"connect_timeout_ms", connect_timeout.count()},
      {"registration_timeout_ms", registration_timeout.count()},
      {"join_timeout_ms", join_timeout.count()},
      {"response_window_ms", response_window.count()},
      {"offer_timeout_ms", offer_timeout.count()},
      {"stall_timeout_ms", stall_timeout.count()},
      {"quit_timeout_ms", quit_timeout.count()},
      {"keepalive_interval_ms", keepalive_interval.count()},
      {"stale_after_ms", stale_after.count()},
      {"max_connect_attempts", max_connect_attempts},
      {"backoff_base_ms", backoff_base.count()},
      {"target_extension", target_extension},
      {"fallback_formats", fallback_formats},
      {"download_dir", download_dir.string()},
      {"temp_dir", temp_dir.string()},
      {"inbox_capacity", inbox_capacity},
      {"dcc_buffer_size", dcc_buffer_size},
      {"dcc_send_acks", dcc_send_acks},
      {"match_offer_sender", match_offer_sender},
    };
}

auto Config::temp_dir_for(const std::filesystem::path& destination) const
  -> std::filesystem::path
{
    if (not temp_dir.empty()) {
        return temp_dir;
    }

    return destination / ".partial";
}

}  // namespace ircbooks
