#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config.hpp"
#include "search/types.hpp"

namespace ircbooks::search {

/**
 * @brief Turns bot response lines into candidates.
 *
 * Recognized grammar:
 *
 *   !<server> [%hash%] <filename>[ ::INFO:: <size>][ ::<KEY>:: <value>...]
 *
 * Anything else is channel noise and yields nullopt. Raw protocol lines
 * (":nick!user@host PRIVMSG #chan :text") are accepted as well, the
 * message text is parsed.
 */
class SearchResultParser
{
 public:
    SearchResultParser(
      std::string target_extension, std::vector<std::string> fallback_formats
    );
    explicit SearchResultParser(const Config& config);

    auto parse(std::string_view line) const -> std::optional<Candidate>;
    auto parse_lines(const std::vector<std::string>& lines) const
      -> std::vector<Candidate>;

    /**
     * @brief Hard filter: with target_only every candidate of another
     * format is dropped. Input order is kept.
     */
    auto filter(std::vector<Candidate> candidates, bool target_only) const
      -> std::vector<Candidate>;

    /// Stable sort by priority, arrival order breaks ties
    auto prioritize(std::vector<Candidate> candidates) const
      -> std::vector<Candidate>;

    auto priority_of(std::string_view format) const -> int;

    /**
     * @brief Lower-case extension; "x.epub.zip" yields "epub"
     */
    auto format_of(std::string_view filename) const -> std::string;

    auto target() const -> const std::string& { return _target; }

 private:
    std::string _target;
    std::vector<std::string> _fallback;
};

/**
 * @brief "784", "332.7KB", "1.2 MB", "2GB" (1024-based)
 */
auto parse_size(std::string_view text) -> std::optional<std::uint64_t>;

/**
 * @brief Lower case, no leading article, no bracketed tags or version
 * markers, single spaces
 */
auto normalize_title(std::string_view title) -> std::string;

/// First candidate of every normalized title, order kept
auto distinct_titles(std::vector<Candidate> candidates) -> std::vector<Candidate>;

/// First candidate of every server (case-insensitive), order kept
auto distinct_servers(std::vector<Candidate> candidates) -> std::vector<Candidate>;

/**
 * @brief Equality, containment or word overlap (Jaccard) of normalized
 * titles
 */
auto titles_match(
  std::string_view offered, std::string_view wanted, double threshold = 0.7
) -> bool;

}  // namespace ircbooks::search
