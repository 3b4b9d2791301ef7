#include <notetext-cpp/decoder.hpp>

#include "storage/gzip.hpp"

#include "notestore.pb.h"

#include <google/protobuf/descriptor.h>
#include <google/protobuf/message.h>
#include <google/protobuf/unknown_field_set.h>
#include <spdlog/spdlog.h>

#include <climits>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace notetext_cpp {

using google::protobuf::FieldDescriptor;
using google::protobuf::Message;
using google::protobuf::UnknownField;

namespace {

auto wire_type_name(UnknownField::Type type) -> std::string_view {
    switch (type) {
        case UnknownField::TYPE_VARINT:           return "varint";
        case UnknownField::TYPE_FIXED32:          return "i32";
        case UnknownField::TYPE_FIXED64:          return "i64";
        case UnknownField::TYPE_LENGTH_DELIMITED: return "len";
        case UnknownField::TYPE_GROUP:            return "group";
    }
    return "unknown";
}

// The schema only declares varint and length-delimited fields.
auto declared_wire_type_name(const FieldDescriptor& field) -> std::string_view {
    switch (field.type()) {
        case FieldDescriptor::TYPE_STRING:
        case FieldDescriptor::TYPE_BYTES:
        case FieldDescriptor::TYPE_MESSAGE:
            return "len";
        default:
            return "varint";
    }
}

// libprotobuf keeps a declared field sent with another wire type, and any
// group, in the unknown field set. Both are schema violations here; other
// unknown fields are skipped.
auto find_wire_violation(const Message& message) -> std::optional<std::string> {
    const auto* descriptor = message.GetDescriptor();
    const auto* reflection = message.GetReflection();
    const auto message_name = std::string{descriptor->name()};

    const auto& unknown = reflection->GetUnknownFields(message);
    for (int i = 0; i < unknown.field_count(); ++i) {
        const auto& field = unknown.field(i);
        if (field.type() == UnknownField::TYPE_GROUP) {
            return message_name + ": cannot skip field " + std::to_string(field.number()) +
                   " (group)";
        }
        if (const auto* declared = descriptor->FindFieldByNumber(field.number())) {
            return message_name + "." + std::string{declared->name()} + ": expected " +
                   std::string{declared_wire_type_name(*declared)} + ", got " +
                   std::string{wire_type_name(field.type())};
        }
    }

    auto fields = std::vector<const FieldDescriptor*>{};
    reflection->ListFields(message, &fields);
    for (const auto* field : fields) {
        if (field->cpp_type() != FieldDescriptor::CPPTYPE_MESSAGE) continue;
        if (field->is_repeated()) {
            for (int i = 0; i < reflection->FieldSize(message, field); ++i) {
                auto violation = find_wire_violation(reflection->GetRepeatedMessage(message, field, i));
                if (violation) return violation;
            }
        } else if (auto violation = find_wire_violation(reflection->GetMessage(message, field))) {
            return violation;
        }
    }
    return std::nullopt;
}

auto to_checklist(const notestore::Checklist& proto) -> Checklist {
    const auto& uuid = proto.uuid();
    auto bytes = std::vector<std::byte>(uuid.size());
    for (std::size_t i = 0; i < uuid.size(); ++i) bytes[i] = static_cast<std::byte>(uuid[i]);
    return Checklist{.uuid = std::move(bytes), .done = proto.done() != 0};
}

auto to_paragraph_style(const notestore::ParagraphStyle& proto) -> ParagraphStyle {
    auto style = ParagraphStyle{};
    if (proto.has_style_type()) style.style_type = proto.style_type();
    if (proto.has_alignment()) style.alignment = proto.alignment();
    if (proto.has_indent_amount()) style.indent_amount = proto.indent_amount();
    if (proto.has_checklist()) style.checklist = to_checklist(proto.checklist());
    return style;
}

// Callers have rejected negative lengths.
auto to_styled_run(const notestore::AttributeRun& proto) -> StyledRun {
    auto run = StyledRun{};
    run.length = static_cast<std::size_t>(proto.length());
    if (proto.has_paragraph_style()) run.paragraph_style = to_paragraph_style(proto.paragraph_style());
    if (proto.has_font_weight()) run.font_weight = proto.font_weight();
    if (proto.has_underlined()) run.underlined = proto.underlined() != 0;
    if (proto.has_strikethrough()) run.strikethrough = proto.strikethrough() != 0;
    if (proto.has_superscript()) run.superscript = proto.superscript();
    if (proto.has_link()) run.link = proto.link();

    // Without an identifier there is nothing to resolve or place.
    if (proto.has_attachment_info() && proto.attachment_info().has_attachment_identifier()) {
        const auto& info = proto.attachment_info();
        run.attachment = AttachmentRef{
            .identifier = info.attachment_identifier(),
            .type_uti = info.type_uti(),
        };
    }
    return run;
}

}  // anonymous namespace

auto decompress_note_data(std::span<const std::byte> data, std::size_t max_output_size)
    -> std::optional<std::vector<std::byte>> {
    return storage::decompress_payload(data, max_output_size);
}

void NoteStoreDecoder::fail(std::string message) {
    error_ = Error{ErrorKind::schema_error, std::move(message)};
}

auto NoteStoreDecoder::decode() -> std::optional<NoteBody> {
    error_.reset();

    if (payload_.size() > static_cast<std::size_t>(INT_MAX)) {
        fail("NoteStoreProto: payload too large (" + std::to_string(payload_.size()) + " bytes)");
        return std::nullopt;
    }

    // Partial parse: missing required fields are reported below by name.
    auto proto = notestore::NoteStoreProto{};
    if (!proto.ParsePartialFromArray(payload_.data(), static_cast<int>(payload_.size()))) {
        fail("NoteStoreProto: malformed wire data");
        return std::nullopt;
    }
    if (auto violation = find_wire_violation(proto)) {
        fail(std::move(*violation));
        return std::nullopt;
    }
    if (!proto.IsInitialized()) {
        fail("NoteStoreProto is missing required fields: " + proto.InitializationErrorString());
        return std::nullopt;
    }

    const auto& document = proto.document();
    const auto& note = document.note();

    auto body = NoteBody{};
    if (document.has_version()) body.version = document.version();
    body.text = note.note_text();
    body.runs.reserve(static_cast<std::size_t>(note.attribute_run_size()));
    for (int i = 0; i < note.attribute_run_size(); ++i) {
        const auto& run = note.attribute_run(i);
        if (run.length() < 0) {
            fail("Note.attribute_run[" + std::to_string(i) +
                 "]: AttributeRun.length out of range: " + std::to_string(run.length()));
            return std::nullopt;
        }
        body.runs.push_back(to_styled_run(run));
    }

    spdlog::debug("decoded note record: {} bytes of text, {} runs",
                  body.text.size(), body.runs.size());
    return body;
}

auto decode_note_store(std::span<const std::byte> payload) -> std::optional<NoteBody> {
    return NoteStoreDecoder{payload}.decode();
}

}  // namespace notetext_cpp
