/// @file resolver.hpp
/// @brief Attachment resolution: inline substitution and file marker placement.

#pragma once

#include <notetext-cpp/error.hpp>
#include <notetext-cpp/types.hpp>

#include <cstddef>
#include <map>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace notetext_cpp {

/// A placeholder found inside a run that carries an attachment reference.
struct MarkerCandidate {
    std::size_t offset;     ///< Code point offset of the placeholder in the raw text.
    AttachmentRef ref;
    std::size_t run_index;  ///< Index of the run the placeholder was found in.

    auto operator==(const MarkerCandidate&) const -> bool = default;
};

/// The placeholder was replaced by literal text from the lookup.
struct InlineResolved {
    AttachmentRef ref;
    AttachmentKind kind;
    std::size_t offset;    ///< Start of the literal text in the final text.
    std::string text;      ///< The literal that replaced the placeholder.

    auto operator==(const InlineResolved&) const -> bool = default;
};

/// The placeholder stays in the final text at `offset`.
///
/// `degraded` is set for inline-classified references (hashtag, mention)
/// whose lookup produced nothing.
struct FileMarker {
    AttachmentRef ref;
    AttachmentKind kind;
    std::size_t offset;
    bool degraded = false;

    auto operator==(const FileMarker&) const -> bool = default;
};

/// Outcome of resolving one marker.
using Resolution = std::variant<InlineResolved, FileMarker>;

/// Final text plus where the remaining file placeholders sit in it.
///
/// Every offset refers to the returned `text` (code points, with the
/// matching UTF-8 byte offset in PlacedAttachment::byte_offset).
struct ResolvedContent {
    std::string text;                              ///< Final UTF-8 text.
    std::vector<PlacedAttachment> attachments;     ///< File markers, by offset.
    std::map<std::string, std::size_t> positions;  ///< identifier -> code point offset.
    std::vector<Resolution> resolutions;           ///< One per marker, by offset.
    std::vector<Error> warnings;                   ///< Lookup failures, invalid UTF-8.
};

/// First pass: walk the runs with a cursor built from the run lengths and
/// record the first placeholder inside each run that carries a reference.
/// Runs past the end of text are clamped; they cannot produce candidates.
auto collect_markers(std::u32string_view text, std::span<const StyledRun> runs)
    -> std::vector<MarkerCandidate>;

/// Second pass: sort candidates by offset and apply them left to right with
/// a cumulative shift. Inline literals are spliced in place of their
/// placeholder; references the lookup cannot resolve keep their placeholder
/// and are reported at their shifted offset.
auto apply_markers(std::u32string text, std::vector<MarkerCandidate> candidates,
                   const AttachmentLookup& lookup) -> ResolvedContent;

/// Both passes over UTF-8 note text. Invalid UTF-8 is replaced by U+FFFD
/// before offsets are computed and reported as a warning.
auto resolve_attachments(std::string_view text, std::span<const StyledRun> runs,
                         const AttachmentLookup& lookup) -> ResolvedContent;

}  // namespace notetext_cpp
