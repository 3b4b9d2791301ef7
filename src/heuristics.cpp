#include <notetext-cpp/fallback.hpp>

#include "encoding/utf8.hpp"
#include "text/char_class.hpp"

#include <algorithm>
#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace notetext_cpp {

namespace {

auto ratio(std::size_t part, std::size_t whole) -> double {
    return whole == 0 ? 0.0 : static_cast<double>(part) / static_cast<double>(whole);
}

auto count_mojibake(std::u32string_view s, std::u32string_view set) -> std::size_t {
    return static_cast<std::size_t>(std::ranges::count_if(s, [&](char32_t c) {
        return set.find(c) != std::u32string_view::npos;
    }));
}

// 8-4-4-4-12 hex digits starting at s[i].
auto uuid_at(std::u32string_view s, std::size_t i) -> bool {
    static constexpr std::size_t groups[] = {8, 4, 4, 4, 12};
    for (std::size_t g = 0; g < 5; ++g) {
        if (g > 0) {
            if (i >= s.size() || s[i] != U'-') return false;
            ++i;
        }
        for (std::size_t k = 0; k < groups[g]; ++k, ++i) {
            if (i >= s.size() || !text::is_hex_digit(s[i])) return false;
        }
    }
    return true;
}

auto contains_uuid(std::u32string_view s) -> bool {
    if (s.size() < 36) return false;
    for (std::size_t i = 0; i + 36 <= s.size(); ++i) {
        if (uuid_at(s, i)) return true;
    }
    return false;
}

auto has_space(std::u32string_view s) -> bool {
    return std::ranges::any_of(s, text::is_space);
}

// "$!x", "*\"2": a lone short token that is at least half punctuation.
auto is_marker_token(std::u32string_view token, const HeuristicConfig& config) -> bool {
    if (token.empty() || token.size() > config.marker_token_max_length) return false;
    if (has_space(token)) return false;
    auto punct = static_cast<std::size_t>(std::ranges::count_if(token, text::is_punctuation));
    return punct * 2 >= token.size();
}

// "com.apple.notes.foo": a lone dotted token whose first segment is lowercase.
auto is_namespaced_identifier(std::u32string_view token, const HeuristicConfig& config) -> bool {
    if (token.empty() || has_space(token)) return false;

    auto segments = std::size_t{0};
    auto segment_start = std::size_t{0};
    for (std::size_t i = 0; i <= token.size(); ++i) {
        if (i < token.size() && token[i] != U'.') {
            auto c = token[i];
            if (!text::is_ascii_alnum(c) && c != U'_' && c != U'-') return false;
            if (segments == 0 && !(c >= U'a' && c <= U'z')) return false;
            continue;
        }
        if (i == segment_start) return false;  // empty segment
        ++segments;
        segment_start = i + 1;
    }
    return segments >= config.namespace_min_segments;
}

}  // anonymous namespace

auto is_noise(std::string_view candidate, const HeuristicConfig& config) -> bool {
    auto chars = encoding::decode_utf8(candidate);
    if (chars.empty()) return true;

    auto total = chars.size();
    auto alnum_or_space = std::size_t{0};
    auto punct = std::size_t{0};
    auto hex_like = std::size_t{0};
    auto significant = std::size_t{0};
    for (auto c : chars) {
        if (text::is_alnum(c) || text::is_space(c)) ++alnum_or_space;
        if (text::is_punctuation(c)) ++punct;
        if (text::is_space(c)) continue;
        ++significant;
        if (text::is_hex_digit(c) || c == U'-') ++hex_like;
    }

    if (ratio(alnum_or_space, total) < config.min_alnum_ratio) return true;

    // Hex dumps and bare UUIDs pass the alphanumeric test but are not prose.
    if (significant > 0 && hex_like == significant) return true;

    for (const auto& needle : config.junk_substrings) {
        if (!needle.empty() && candidate.find(needle) != std::string_view::npos) return true;
    }

    auto mojibake = encoding::decode_utf8(config.mojibake_chars);
    if (ratio(count_mojibake(chars, mojibake), total) > config.max_mojibake_ratio) return true;

    if (total < config.short_length && ratio(punct, total) > config.max_short_punct_ratio) {
        return true;
    }
    return false;
}

auto is_trailing_junk_line(std::string_view line, const HeuristicConfig& config) -> bool {
    auto chars = encoding::decode_utf8(line);
    auto trimmed = text::trim(chars);
    if (trimmed.empty()) return false;

    auto mojibake = encoding::decode_utf8(config.mojibake_chars);
    if (config.mojibake_line_threshold > 0 &&
        count_mojibake(trimmed, mojibake) >= config.mojibake_line_threshold) {
        return true;
    }
    if (is_marker_token(trimmed, config)) return true;
    if (contains_uuid(trimmed)) return true;
    return is_namespaced_identifier(trimmed, config);
}

auto trim_trailing_junk(std::string_view text, const HeuristicConfig& config) -> std::string {
    auto lines = std::vector<std::string_view>{};
    auto start = std::size_t{0};
    while (true) {
        auto nl = text.find('\n', start);
        if (nl == std::string_view::npos) {
            lines.push_back(text.substr(start));
            break;
        }
        lines.push_back(text.substr(start, nl - start));
        start = nl + 1;
    }

    auto is_blank = [](std::string_view s) {
        return std::ranges::all_of(s, [](char c) {
            return c == ' ' || c == '\t' || c == '\r';
        });
    };

    // Scan from the end for the first junk line.
    auto cut = lines.size();
    for (auto i = lines.size(); i > 0; --i) {
        if (is_trailing_junk_line(lines[i - 1], config)) {
            cut = i - 1;
            break;
        }
    }
    if (cut == lines.size()) return std::string{text};

    // Junk is contiguous to the end; absorb junk and blanks just before it.
    while (cut > 0 && (is_blank(lines[cut - 1]) || is_trailing_junk_line(lines[cut - 1], config))) {
        --cut;
    }

    auto result = std::string{};
    for (std::size_t i = 0; i < cut; ++i) {
        if (i > 0) result.push_back('\n');
        result.append(lines[i]);
    }
    return result;
}

}  // namespace notetext_cpp
