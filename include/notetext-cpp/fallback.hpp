/// @file fallback.hpp
/// @brief Best-effort text recovery from records that fail structured decoding.

#pragma once

#include <cstddef>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace notetext_cpp {

/// Tunable thresholds for the fallback extractor and its noise filters.
///
/// The defaults were tuned against real note stores. They are tolerances,
/// not contracts: hosts may load their own values (see json.hpp).
struct HeuristicConfig {
    /// Shortest run of printable characters kept as a candidate.
    std::size_t min_run_length = 3;
    /// Candidates longer than this are "meaningful" and preferred.
    std::size_t meaningful_length = 10;

    /// Below this share of alphanumeric-or-space characters a string is noise.
    double min_alnum_ratio = 0.5;
    /// Above this share of mis-decoded characters a string is noise.
    double max_mojibake_ratio = 0.3;
    /// Strings shorter than this are noise when punctuation-heavy.
    std::size_t short_length = 15;
    /// Punctuation share above which a short string is noise.
    double max_short_punct_ratio = 0.5;

    /// A trailing line with at least this many mis-decoded characters is junk.
    std::size_t mojibake_line_threshold = 2;
    /// Longest single token treated as a protocol marker.
    std::size_t marker_token_max_length = 4;
    /// Dotted segments needed before a token looks like a namespaced identifier.
    std::size_t namespace_min_segments = 3;

    /// Characters produced by Latin-1 decoding of protobuf framing bytes (UTF-8).
    std::string mojibake_chars = "\u00C2\u00C3\u00D0\u00D2\u00D3\u00D5\u00DA\u00D8\u00D9\u00A2\u00A4";

    /// Internal schema and identifier substrings that never occur in prose.
    std::vector<std::string> junk_substrings = {
        "com.apple.",
        "inlinetextattachment",
        "public.",
        "NSKeyedArchiver",
        "NSAttributedString",
        "NSParagraphStyle",
        "$class",
        "$objects",
        "bplist",
        "ICTTMergeableString",
        "TTParagraphStyle",
    };

    auto operator==(const HeuristicConfig&) const -> bool = default;
};

/// True when a candidate string looks like metadata rather than prose.
auto is_noise(std::string_view candidate, const HeuristicConfig& config = {}) -> bool;

/// True when a line looks like trailing record junk: a cluster of
/// mis-decoded characters, a short protocol marker, a UUID or a
/// namespaced identifier.
auto is_trailing_junk_line(std::string_view line, const HeuristicConfig& config = {}) -> bool;

/// Drop trailing junk. Lines are scanned from the end; the first junk line
/// met marks the cut, which extends backward over adjacent junk or blank
/// lines. Everything from the cut to the end is removed.
auto trim_trailing_junk(std::string_view text, const HeuristicConfig& config = {}) -> std::string;

/// Runs of at least config.min_run_length printable characters, as UTF-8.
///
/// Well-formed UTF-8 sequences decode to their code point; any other byte
/// is read as Latin-1. Newline, carriage return and tab are printable.
auto extract_printable_runs(std::span<const std::byte> data, const HeuristicConfig& config = {})
    -> std::vector<std::string>;

/// Best-effort text from bytes that could not be decoded structurally.
/// Never throws for any input; may return an empty string.
auto extract_fallback_text(std::span<const std::byte> data, const HeuristicConfig& config = {})
    -> std::string;

}  // namespace notetext_cpp
