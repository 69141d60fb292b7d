#include "search/parser.hpp"

#include <algorithm>
#include <charconv>
#include <cctype>
#include <cmath>
#include <cstdint>
#include <iterator>
#include <optional>
#include <regex>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include <range/v3/range/conversion.hpp>
#include <range/v3/view/filter.hpp>
#include <range/v3/view/transform.hpp>
#include <spdlog/spdlog.h>

#include "proto/deserialize.hpp"
#include "proto/utils.hpp"

namespace ircbooks::search {

namespace {

using proto::utils::iequals;
using proto::utils::to_lower;
using proto::utils::trim;

const std::regex MARKER_REGEX(R"(\s*::([A-Za-z]+)::\s*)");
const std::regex SIZE_REGEX(
  R"(([0-9]+(?:\.[0-9]+)?)\s*([kmgt]?)(?:i?b)?)", std::regex::icase
);
const std::regex TAGS_REGEX(R"(\([^)]*\)|\[[^\]]*\])");
const std::regex VERSION_REGEX(R"(\bv[0-9]+(\.[0-9]+)*\b)");
const std::regex SPACES_REGEX(R"(\s+)");

constexpr std::size_t MAX_EXTENSION_LENGTH = 5;

auto is_known(std::string_view ext) -> bool
{
    return std::ranges::find(KNOWN_FORMATS, ext) != KNOWN_FORMATS.end();
}

auto is_archive(std::string_view ext) -> bool
{
    return std::ranges::find(ARCHIVE_FORMATS, ext) != ARCHIVE_FORMATS.end();
}

auto extension_of(std::string_view name) -> std::string
{
    const auto dot = name.rfind('.');
    if (dot == std::string_view::npos or dot + 1 == name.size()) {
        return {};
    }

    const auto ext = name.substr(dot + 1);
    if (ext.size() > MAX_EXTENSION_LENGTH) {
        return {};
    }

    const bool alnum = std::ranges::all_of(ext, [](unsigned char c) {
        return std::isalnum(c);
    });

    return alnum ? to_lower(ext) : std::string{};
}

auto collapse_spaces(const std::string& text) -> std::string
{
    return std::string(trim(std::regex_replace(text, SPACES_REGEX, " ")));
}

/// "Author - Title (retail)" -> {"Author", "Title"}
auto split_author_title(std::string_view stem)
  -> std::pair<std::string, std::string>
{
    std::string author;
    std::string title{stem};

    if (const auto sep = stem.find(" - "); sep != std::string_view::npos) {
        author = std::string(trim(stem.substr(0, sep)));
        title = std::string(stem.substr(sep + 3));
    }

    std::ranges::replace(title, '_', ' ');
    title = std::regex_replace(title, TAGS_REGEX, " ");

    return {author, collapse_spaces(title)};
}

}  // namespace

SearchResultParser::SearchResultParser(
  std::string target_extension, std::vector<std::string> fallback_formats
) :
  _target(to_lower(target_extension)),
  _fallback(
    fallback_formats |
    ranges::views::transform([](const std::string& f) { return to_lower(f); }) |
    ranges::to<std::vector<std::string>>()
  )
{
}

SearchResultParser::SearchResultParser(const Config& config) :
  SearchResultParser(config.target_extension, config.fallback_formats)
{
}

auto SearchResultParser::parse(std::string_view line) const
  -> std::optional<Candidate>
{
    std::string text;

    if (not line.empty() and line.front() == ':') {
        auto msg = proto::unpack_message(line);
        if (not msg) {
            return std::nullopt;
        }
        text = proto::strip_formatting(msg->trailing());
    }
    else {
        text = proto::strip_formatting(line);
    }

    const std::string body{trim(text)};

    if (body.empty() or body.front() != '!') {
        return std::nullopt;
    }

    std::optional<std::size_t> main_end;
    std::optional<std::uint64_t> size;

    const std::sregex_iterator end;
    for (std::sregex_iterator it(body.begin(), body.end(), MARKER_REGEX);
         it != end; ++it) {
        const auto next = std::next(it);

        if (not main_end) {
            main_end = std::size_t(it->position(0));
        }

        const auto value_begin = std::size_t(it->position(0) + it->length(0));
        const auto value_end =
          next == end ? body.size() : std::size_t(next->position(0));

        const auto key = (*it)[1].str();
        const auto value =
          trim(std::string_view(body).substr(value_begin, value_end - value_begin));

        if (iequals(key, "INFO")) {
            size = parse_size(value);
        }
    }

    const auto trigger =
      trim(std::string_view(body).substr(0, main_end.value_or(body.size())));
    const auto space = trigger.find(' ');

    if (space == std::string_view::npos or space == 1) {
        spdlog::debug("Ignoring result line without file: {}", body);
        return std::nullopt;
    }

    auto filename = trim(trigger.substr(space + 1));

    // Optional "%hash%" token before the file name
    if (not filename.empty() and filename.front() == '%') {
        if (const auto close = filename.find('%', 1);
            close != std::string_view::npos) {
            filename = trim(filename.substr(close + 1));
        }
    }

    const auto format = format_of(filename);

    if (filename.empty() or format.empty()) {
        spdlog::debug("Ignoring result line without file extension: {}", body);
        return std::nullopt;
    }

    auto stem = filename.substr(0, filename.rfind('.'));
    if (extension_of(filename) != format) {
        stem = stem.substr(0, stem.rfind('.'));
    }

    auto [author, title] = split_author_title(stem);

    return Candidate{
      .server = std::string(trigger.substr(1, space - 1)),
      .filename = std::string(filename),
      .size = size,
      .format = format,
      .trigger = std::string(trigger),
      .priority = priority_of(format),
      .author = std::move(author),
      .title = std::move(title),
      .raw_line = std::string(line),
    };
}

auto SearchResultParser::parse_lines(const std::vector<std::string>& lines) const
  -> std::vector<Candidate>
{
    std::vector<Candidate> candidates;

    for (const auto& line : lines) {
        if (auto candidate = parse(line)) {
            candidates.push_back(std::move(*candidate));
        }
    }

    return candidates;
}

auto SearchResultParser::filter(
  std::vector<Candidate> candidates, bool target_only
) const -> std::vector<Candidate>
{
    if (not target_only) {
        return candidates;
    }

    return candidates |
           ranges::views::filter([this](const Candidate& candidate) {
               return candidate.format == _target;
           }) |
           ranges::to<std::vector<Candidate>>();
}

auto SearchResultParser::prioritize(std::vector<Candidate> candidates) const
  -> std::vector<Candidate>
{
    std::ranges::stable_sort(candidates, {}, &Candidate::priority);
    return candidates;
}

auto SearchResultParser::priority_of(std::string_view format) const -> int
{
    if (iequals(format, _target)) {
        return 1;
    }

    const auto lower = to_lower(format);
    const auto it = std::ranges::find(_fallback, lower);

    return int(std::distance(_fallback.begin(), it)) + 2;
}

auto SearchResultParser::format_of(std::string_view filename) const
  -> std::string
{
    const auto ext = extension_of(filename);

    if (not is_archive(ext)) {
        return ext;
    }

    const auto inner = extension_of(filename.substr(0, filename.rfind('.')));

    if (is_known(inner) and not is_archive(inner)) {
        return inner;
    }

    return ext;
}

auto parse_size(std::string_view text) -> std::optional<std::uint64_t>
{
    const std::string value{trim(text)};
    std::smatch match;

    if (not std::regex_match(value, match, SIZE_REGEX)) {
        return std::nullopt;
    }

    const auto number = match[1].str();
    double bytes = 0.0;

    const auto [end, ec] =
      std::from_chars(number.data(), number.data() + number.size(), bytes);
    if (ec != std::errc() or end != number.data() + number.size()) {
        return std::nullopt;
    }

    const auto unit = to_lower(match[2].str());

    switch (unit.empty() ? '\0' : unit.front()) {
        case 't': bytes *= 1024.0; [[fallthrough]];
        case 'g': bytes *= 1024.0; [[fallthrough]];
        case 'm': bytes *= 1024.0; [[fallthrough]];
        case 'k': bytes *= 1024.0; break;
        default: break;
    }

    bytes = std::round(bytes);

    // 2^64 is exactly representable, every double below it fits
    if (not std::isfinite(bytes) or bytes >= 18446744073709551616.0) {
        return std::nullopt;
    }

    return std::uint64_t(bytes);
}

auto normalize_title(std::string_view title) -> std::string
{
    auto text = to_lower(title);
    text = std::regex_replace(text, TAGS_REGEX, " ");
    text = std::regex_replace(text, VERSION_REGEX, " ");

    std::ranges::replace_if(
      text, [](unsigned char c) { return not std::isalnum(c); }, ' '
    );

    std::istringstream words_stream(text);
    std::vector<std::string> words{
      std::istream_iterator<std::string>(words_stream),
      std::istream_iterator<std::string>()
    };

    if (words.size() > 1 and
        (words.front() == "the" or words.front() == "a" or
         words.front() == "an")) {
        words.erase(words.begin());
    }

    std::string result;
    for (const auto& word : words) {
        if (not result.empty()) {
            result.push_back(' ');
        }
        result += word;
    }

    return result;
}

namespace {

template<typename KeyFn>
auto distinct_by(std::vector<Candidate> candidates, KeyFn key_of)
  -> std::vector<Candidate>
{
    std::set<std::string> seen;
    std::vector<Candidate> kept;

    for (auto& candidate : candidates) {
        if (seen.insert(key_of(candidate)).second) {
            kept.push_back(std::move(candidate));
        }
        else {
            spdlog::debug("Duplicate candidate dropped: {}", candidate.raw_line);
        }
    }

    return kept;
}

}  // namespace

auto distinct_titles(std::vector<Candidate> candidates) -> std::vector<Candidate>
{
    return distinct_by(std::move(candidates), [](const Candidate& candidate) {
        auto key = normalize_title(candidate.title);
        return key.empty() ? to_lower(candidate.filename) : key;
    });
}

auto distinct_servers(std::vector<Candidate> candidates) -> std::vector<Candidate>
{
    return distinct_by(std::move(candidates), [](const Candidate& candidate) {
        return to_lower(candidate.server);
    });
}

auto titles_match(std::string_view offered, std::string_view wanted, double threshold)
  -> bool
{
    const auto a = normalize_title(offered);
    const auto b = normalize_title(wanted);

    if (a.empty() or b.empty()) {
        return false;
    }

    if (a == b or a.find(b) != std::string::npos or
        b.find(a) != std::string::npos) {
        return true;
    }

    auto words = [](const std::string& text) {
        std::istringstream stream(text);
        return std::set<std::string>{
          std::istream_iterator<std::string>(stream),
          std::istream_iterator<std::string>()
        };
    };

    const auto wa = words(a);
    const auto wb = words(b);

    std::vector<std::string> common;
    std::ranges::set_intersection(wa, wb, std::back_inserter(common));

    const auto union_size = wa.size() + wb.size() - common.size();

    return double(common.size()) / double(union_size) >= threshold;
}

}  // namespace ircbooks::search
