/// @file types.hpp
/// @brief Core note types: AttachmentRef, StyledRun, NoteBody, PlacedAttachment.

#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace notetext_cpp {

/// U+FFFC OBJECT REPLACEMENT CHARACTER, the in-text stand-in for an attachment.
inline constexpr char32_t placeholder_char = U'\uFFFC';

/// UTF-8 encoding of placeholder_char.
inline constexpr std::string_view placeholder_utf8 = "\xEF\xBF\xBC";

/// Reference from a styled run to an attachment object.
///
/// The identifier is the attachment's UUID in the note store; the type is
/// its uniform type identifier (e.g. "public.jpeg" or
/// "com.apple.notes.inlinetextattachment.hashtag").
struct AttachmentRef {
    std::string identifier;  ///< Opaque identifier, typically a UUID.
    std::string type_uti;    ///< Dotted type classifier.

    auto operator==(const AttachmentRef&) const -> bool = default;
};

/// Checklist state of a paragraph.
struct Checklist {
    std::vector<std::byte> uuid;  ///< Raw 16-byte item identifier.
    bool done = false;

    auto operator==(const Checklist&) const -> bool = default;
};

/// Paragraph-level styling attached to a run.
struct ParagraphStyle {
    std::optional<std::int32_t> style_type;     ///< Title, heading, body, list kinds...
    std::optional<std::int32_t> alignment;
    std::optional<std::int32_t> indent_amount;
    std::optional<Checklist> checklist;

    auto operator==(const ParagraphStyle&) const -> bool = default;
};

/// A contiguous span of note text with uniform attributes.
///
/// Runs are ordered and contiguous: the sum of run lengths equals the
/// length of the text they describe, counted in code points.
struct StyledRun {
    std::size_t length = 0;                       ///< Span length in code points.
    std::optional<ParagraphStyle> paragraph_style;
    std::optional<std::int32_t> font_weight;
    std::optional<bool> underlined;
    std::optional<bool> strikethrough;
    std::optional<std::int32_t> superscript;
    std::optional<std::string> link;
    std::optional<AttachmentRef> attachment;      ///< Set when the run anchors an attachment.

    auto operator==(const StyledRun&) const -> bool = default;
};

/// The structurally decoded content of one note record.
struct NoteBody {
    std::optional<std::int32_t> version;  ///< Document format version, if recorded.
    std::string text;                     ///< Raw note text (UTF-8) with placeholders.
    std::vector<StyledRun> runs;          ///< Ordered attribute runs over text.

    auto operator==(const NoteBody&) const -> bool = default;
};

/// How an attachment reference is resolved.
enum class AttachmentKind : std::uint8_t {
    hashtag,  ///< Inline tag, replaced by its literal text.
    mention,  ///< Inline mention, replaced by its literal text.
    file,     ///< Out-of-line attachment, left as a positioned placeholder.
};

/// Convert an AttachmentKind to its string representation.
constexpr auto to_string_view(AttachmentKind kind) noexcept -> std::string_view {
    switch (kind) {
        case AttachmentKind::hashtag: return "hashtag";
        case AttachmentKind::mention: return "mention";
        case AttachmentKind::file:    return "file";
    }
    return "unknown";
}

/// Classify a type identifier. The single place where classifier strings
/// are matched: anything naming "hashtag" or "mention" is inline.
auto classify_attachment(std::string_view type_uti) -> AttachmentKind;

/// True for kinds whose placeholder is replaced by literal text.
constexpr auto is_inline(AttachmentKind kind) noexcept -> bool {
    return kind == AttachmentKind::hashtag || kind == AttachmentKind::mention;
}

/// Resolves an attachment reference to literal replacement text.
///
/// Called with (identifier, type_uti). Returning std::nullopt keeps the
/// placeholder in the text as a file marker. Exceptions derived from
/// std::exception are caught and treated as std::nullopt.
using AttachmentLookup =
    std::function<std::optional<std::string>(std::string_view identifier,
                                             std::string_view type_uti)>;

/// A file attachment whose placeholder remains in the final text.
struct PlacedAttachment {
    AttachmentRef ref;
    AttachmentKind kind = AttachmentKind::file;
    std::size_t offset = 0;       ///< Code point index of the placeholder.
    std::size_t byte_offset = 0;  ///< Byte index of the placeholder in the UTF-8 text.

    auto operator==(const PlacedAttachment&) const -> bool = default;
};

}  // namespace notetext_cpp
