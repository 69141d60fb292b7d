#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

namespace ircbooks::search {

/// File types search bots are known to offer
constexpr std::array<std::string_view, 15> KNOWN_FORMATS = {
  "epub", "mobi", "azw3", "html", "rtf", "pdf", "cdr", "lit",
  "cbr",  "doc",  "htm",  "jpg",  "txt", "rar", "zip",
};

constexpr std::array<std::string_view, 2> ARCHIVE_FORMATS = {"rar", "zip"};

enum class SearchScope
{
    Author,
    Title,
};

struct SearchQuery
{
    SearchScope scope = SearchScope::Author;
    std::string author;
    std::optional<std::string> title;
    bool epub_only = false;
    std::size_t max_results = 50;

    /// Text sent after the bot prefix
    inline auto text() const -> std::string
    {
        if (title and not title->empty()) {
            return fmt::format("{} {}", author, *title);
        }

        return author;
    }
};

/**
 * @brief One offered file. Built by the parser, never mutated afterwards.
 */
struct Candidate
{
    std::string server;
    std::string filename;
    std::optional<std::uint64_t> size;
    std::string format;

    /// Exact text to send back to the bot to request this file
    std::string trigger;

    /// Lower is preferred
    int priority = 0;

    std::string author;
    std::string title;
    std::string raw_line;
};

inline auto to_json(nlohmann::json& json, const Candidate& candidate) -> void
{
    json = nlohmann::json{
      {"server", candidate.server},
      {"filename", candidate.filename},
      {"format", candidate.format},
      {"trigger", candidate.trigger},
      {"priority", candidate.priority},
      {"author", candidate.author},
      {"title", candidate.title},
    };

    if (candidate.size) {
        json["size"] = *candidate.size;
    }
    else {
        json["size"] = nullptr;
    }
}

}  // namespace ircbooks::search
