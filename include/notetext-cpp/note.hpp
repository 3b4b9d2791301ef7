/// @file note.hpp
/// @brief One-call note reconstruction: decompress, decode, resolve, fall back.

#pragma once

#include <notetext-cpp/error.hpp>
#include <notetext-cpp/fallback.hpp>
#include <notetext-cpp/types.hpp>

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace notetext_cpp {

/// Which route produced a DecodedNote's text.
enum class DecodePath : std::uint8_t {
    structured,  ///< Protobuf decode plus attachment resolution.
    fallback,    ///< Heuristic scan of the raw bytes; no attachment positions.
    snippet,     ///< Fallback recovered too little; the store's snippet was used.
};

/// Convert a DecodePath to its string representation.
constexpr auto to_string_view(DecodePath path) noexcept -> std::string_view {
    switch (path) {
        case DecodePath::structured: return "structured";
        case DecodePath::fallback:   return "fallback";
        case DecodePath::snippet:    return "snippet";
    }
    return "unknown";
}

/// Knobs for decode_note().
struct DecodeOptions {
    HeuristicConfig heuristics{};
    /// Upper bound on the inflated size of a gzip record.
    std::size_t max_decompressed_size = std::size_t{64} * 1024 * 1024;
    /// Fallback text shorter than this (in bytes) is replaced by the snippet.
    std::size_t min_fallback_length = 10;
};

/// A note record plus the plain-text snippet the store keeps beside it.
struct NoteInput {
    std::span<const std::byte> data;
    std::string_view snippet;  ///< Empty when the store has none.
};

/// The reconstructed note.
///
/// On the structured path `attachments` and `positions` describe every
/// placeholder left in `text`. On the fallback and snippet paths they are
/// empty and `error` says why structured decoding was abandoned.
struct DecodedNote {
    std::string text;
    std::vector<PlacedAttachment> attachments;     ///< File markers, by offset.
    std::map<std::string, std::size_t> positions;  ///< identifier -> code point offset.
    std::vector<StyledRun> runs;                   ///< Decoded runs (structured path only).
    DecodePath path = DecodePath::structured;
    std::optional<Error> error;                    ///< Reason for leaving the structured path.
    std::vector<Error> warnings;                   ///< Non-fatal issues on the structured path.
};

/// Reconstruct one note. Never throws for malformed data: decompression and
/// schema failures switch to the fallback extractor and are reported in
/// DecodedNote::error.
auto decode_note(std::span<const std::byte> data, const AttachmentLookup& lookup,
                 const DecodeOptions& options = {}) -> DecodedNote;

/// As above; a fallback result that recovers too little is replaced by
/// input.snippet when one is present.
auto decode_note(const NoteInput& input, const AttachmentLookup& lookup,
                 const DecodeOptions& options = {}) -> DecodedNote;

}  // namespace notetext_cpp
