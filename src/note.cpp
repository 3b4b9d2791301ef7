#include <notetext-cpp/note.hpp>
#include <notetext-cpp/decoder.hpp>
#include <notetext-cpp/resolver.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace notetext_cpp {

namespace {

auto fallback_note(std::span<const std::byte> data, Error reason, const DecodeOptions& options)
    -> DecodedNote {
    spdlog::warn("structured decode failed ({}: {}); using fallback extraction",
                 to_string_view(reason.kind), reason.message);
    auto note = DecodedNote{};
    note.text = extract_fallback_text(data, options.heuristics);
    note.path = DecodePath::fallback;
    note.error = std::move(reason);
    return note;
}

}  // anonymous namespace

auto decode_note(std::span<const std::byte> data, const AttachmentLookup& lookup,
                 const DecodeOptions& options) -> DecodedNote {
    auto payload = decompress_note_data(data, options.max_decompressed_size);
    if (!payload) {
        return fallback_note(data,
            Error{ErrorKind::decompression_error, "gzip stream is corrupt or too large"},
            options);
    }

    auto decoder = NoteStoreDecoder{*payload};
    auto body = decoder.decode();
    if (!body) {
        auto reason = decoder.error().value_or(
            Error{ErrorKind::schema_error, "note record did not decode"});
        return fallback_note(*payload, std::move(reason), options);
    }

    auto resolved = resolve_attachments(body->text, body->runs, lookup);

    auto note = DecodedNote{};
    note.text = std::move(resolved.text);
    note.attachments = std::move(resolved.attachments);
    note.positions = std::move(resolved.positions);
    note.runs = std::move(body->runs);
    note.path = DecodePath::structured;
    note.warnings = std::move(resolved.warnings);
    return note;
}

auto decode_note(const NoteInput& input, const AttachmentLookup& lookup,
                 const DecodeOptions& options) -> DecodedNote {
    auto note = decode_note(input.data, lookup, options);
    if (note.path == DecodePath::fallback && !input.snippet.empty() &&
        note.text.size() < options.min_fallback_length) {
        spdlog::debug("fallback recovered {} bytes; using snippet", note.text.size());
        note.text = std::string{input.snippet};
        note.path = DecodePath::snippet;
    }
    return note;
}

}  // namespace notetext_cpp
