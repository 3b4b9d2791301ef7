#pragma once

// Builds note store records from a NoteBody through the generated
// notestore classes. The library only decodes; this is used to build test
// inputs, fuzz seeds and benchmark corpora.
// Internal header, not installed.

#include <notetext-cpp/types.hpp>
#include "gzip.hpp"

#include "notestore.pb.h"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include <zlib.h>

namespace notetext_cpp::storage {

inline auto to_proto(const StyledRun& run) -> notestore::AttributeRun {
    auto proto = notestore::AttributeRun{};
    proto.set_length(static_cast<std::int32_t>(run.length));

    if (run.paragraph_style) {
        const auto& ps = *run.paragraph_style;
        auto* style = proto.mutable_paragraph_style();
        if (ps.style_type) style->set_style_type(*ps.style_type);
        if (ps.alignment) style->set_alignment(*ps.alignment);
        if (ps.indent_amount) style->set_indent_amount(*ps.indent_amount);
        if (ps.checklist) {
            auto* check = style->mutable_checklist();
            check->set_uuid(std::string{reinterpret_cast<const char*>(ps.checklist->uuid.data()),
                                        ps.checklist->uuid.size()});
            check->set_done(ps.checklist->done ? 1 : 0);
        }
    }
    if (run.font_weight) proto.set_font_weight(*run.font_weight);
    if (run.underlined) proto.set_underlined(*run.underlined ? 1 : 0);
    if (run.strikethrough) proto.set_strikethrough(*run.strikethrough ? 1 : 0);
    if (run.superscript) proto.set_superscript(*run.superscript);
    if (run.link) proto.set_link(*run.link);
    if (run.attachment) {
        auto* info = proto.mutable_attachment_info();
        info->set_attachment_identifier(run.attachment->identifier);
        info->set_type_uti(run.attachment->type_uti);
    }
    return proto;
}

inline auto to_proto(const NoteBody& body) -> notestore::NoteStoreProto {
    auto proto = notestore::NoteStoreProto{};
    auto* document = proto.mutable_document();
    if (body.version) document->set_version(*body.version);
    auto* note = document->mutable_note();
    note->set_note_text(body.text);
    for (const auto& run : body.runs) *note->add_attribute_run() = to_proto(run);
    return proto;
}

// Partial serialization, so tests can build records that lack required fields.
inline auto serialize(const google::protobuf::MessageLite& message) -> std::vector<std::byte> {
    auto wire = message.SerializePartialAsString();
    auto bytes = std::vector<std::byte>(wire.size());
    for (std::size_t i = 0; i < wire.size(); ++i) bytes[i] = static_cast<std::byte>(wire[i]);
    return bytes;
}

// Wrap `input` in a single gzip member the way the store writes note data.
inline auto gzip_compress(std::span<const std::byte> input)
    -> std::optional<std::vector<std::byte>> {
    auto stream = z_stream{};
    if (::deflateInit2(&stream, Z_BEST_COMPRESSION, Z_DEFLATED, gzip_window_bits, 9,
                       Z_DEFAULT_STRATEGY) != Z_OK) {
        return std::nullopt;
    }

    // deflateBound covers the gzip header and trailer, so one call finishes.
    auto output = std::vector<std::byte>(::deflateBound(&stream, static_cast<uLong>(input.size())));
    stream.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data()));
    stream.avail_in = static_cast<uInt>(input.size());
    stream.next_out = reinterpret_cast<Bytef*>(output.data());
    stream.avail_out = static_cast<uInt>(output.size());

    auto status = ::deflate(&stream, Z_FINISH);
    auto written = stream.total_out;
    ::deflateEnd(&stream);
    if (status != Z_STREAM_END) return std::nullopt;

    output.resize(written);
    return output;
}

// Plain (legacy, uncompressed) NoteStoreProto bytes.
inline auto encode_note_store(const NoteBody& body) -> std::vector<std::byte> {
    return serialize(to_proto(body));
}

// The gzip-wrapped form stored by current note records.
inline auto encode_note_record(const NoteBody& body) -> std::optional<std::vector<std::byte>> {
    return gzip_compress(encode_note_store(body));
}

}  // namespace notetext_cpp::storage
