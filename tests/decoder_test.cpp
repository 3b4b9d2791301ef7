#include <notetext-cpp/decoder.hpp>

#include "../src/storage/note_encoder.hpp"

#include "notestore.pb.h"

#include <gtest/gtest.h>
#include <google/protobuf/unknown_field_set.h>

#include <string>
#include <vector>

using namespace notetext_cpp;
namespace pb = notetext_cpp::notestore;

namespace {

// Wrap a Note message in Document and NoteStoreProto.
auto wrap_note(const pb::Note& note) -> std::vector<std::byte> {
    auto root = pb::NoteStoreProto{};
    *root.mutable_document()->mutable_note() = note;
    return storage::serialize(root);
}

auto note_with_run(const pb::AttributeRun& run, const std::string& text = "abc")
    -> std::vector<std::byte> {
    auto note = pb::Note{};
    note.set_note_text(text);
    *note.add_attribute_run() = run;
    return wrap_note(note);
}

void expect_schema_error(std::span<const std::byte> payload, std::string_view message) {
    auto decoder = NoteStoreDecoder{payload};
    EXPECT_FALSE(decoder.decode().has_value());
    ASSERT_TRUE(decoder.error().has_value());
    EXPECT_EQ(decoder.error()->kind, ErrorKind::schema_error);
    EXPECT_NE(decoder.error()->message.find(message), std::string::npos)
        << decoder.error()->message;
}

auto sample_body() -> NoteBody {
    auto title = StyledRun{};
    title.length = 9;
    title.paragraph_style = ParagraphStyle{.style_type = 0};
    title.font_weight = 1;

    auto item = StyledRun{};
    item.length = 5;
    item.paragraph_style = ParagraphStyle{
        .style_type = 103,
        .indent_amount = 1,
        .checklist = Checklist{.uuid = std::vector<std::byte>(16, std::byte{0xAB}), .done = true},
    };
    item.underlined = true;

    auto tag = StyledRun{};
    tag.length = 1;
    tag.attachment = AttachmentRef{
        .identifier = "2F1D8E4A-0C55-4B0B-9E1E-5A7C3D2B1F00",
        .type_uti = "com.apple.notes.inlinetextattachment.hashtag",
    };

    auto link = StyledRun{};
    link.length = 4;
    link.link = "https://example.org";
    link.strikethrough = false;
    link.superscript = -1;

    return NoteBody{
        .version = 1,
        .text = "Shopping\nmilk \xEF\xBF\xBC" "link",
        .runs = {title, item, tag, link},
    };
}

}  // namespace

// -- Successful decoding ------------------------------------------------------

TEST(NoteStoreDecoder, decodes_text_and_runs) {
    auto body = sample_body();
    auto payload = storage::encode_note_store(body);

    auto decoder = NoteStoreDecoder{payload};
    auto decoded = decoder.decode();
    ASSERT_TRUE(decoded.has_value()) << decoder.error()->message;
    EXPECT_FALSE(decoder.error().has_value());
    EXPECT_EQ(*decoded, body);
}

TEST(NoteStoreDecoder, decodes_gzip_record_after_decompression) {
    auto body = sample_body();
    auto record = storage::encode_note_record(body);
    ASSERT_TRUE(record.has_value());

    auto payload = decompress_note_data(*record);
    ASSERT_TRUE(payload.has_value());
    auto decoded = decode_note_store(*payload);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->text, body.text);
    EXPECT_EQ(decoded->runs.size(), 4u);
}

TEST(NoteStoreDecoder, note_without_runs) {
    auto payload = storage::encode_note_store(NoteBody{.text = "plain"});
    auto decoded = decode_note_store(payload);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->text, "plain");
    EXPECT_TRUE(decoded->runs.empty());
    EXPECT_FALSE(decoded->version.has_value());
}

TEST(NoteStoreDecoder, empty_note_text_is_valid) {
    auto payload = storage::encode_note_store(NoteBody{.text = ""});
    auto decoded = decode_note_store(payload);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->text.empty());
}

TEST(NoteStoreDecoder, skips_unknown_fields_at_every_level) {
    auto run = pb::AttributeRun{};
    run.set_length(3);
    run.mutable_unknown_fields()->AddFixed32(3, 0xDEADBEEF);        // font
    run.mutable_unknown_fields()->AddLengthDelimited(10, "colour");
    run.mutable_unknown_fields()->AddFixed64(13, 42);

    auto root = pb::NoteStoreProto{};
    auto* document = root.mutable_document();
    auto* note = document->mutable_note();
    note->mutable_unknown_fields()->AddVarint(1, 99);
    note->set_note_text("abc");
    *note->add_attribute_run() = run;
    document->mutable_unknown_fields()->AddVarint(7, 1);
    root.mutable_unknown_fields()->AddLengthDelimited(1, "header");

    auto decoded = decode_note_store(storage::serialize(root));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->text, "abc");
    ASSERT_EQ(decoded->runs.size(), 1u);
    EXPECT_EQ(decoded->runs[0].length, 3u);
}

TEST(NoteStoreDecoder, attachment_without_identifier_yields_no_reference) {
    auto run = pb::AttributeRun{};
    run.set_length(3);
    run.mutable_attachment_info()->set_type_uti("public.jpeg");

    auto decoded = decode_note_store(note_with_run(run));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_FALSE(decoded->runs[0].attachment.has_value());
}

TEST(NoteStoreDecoder, attachment_without_type_keeps_identifier) {
    auto run = pb::AttributeRun{};
    run.set_length(3);
    run.mutable_attachment_info()->set_attachment_identifier("ID-1");

    auto decoded = decode_note_store(note_with_run(run));
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(decoded->runs[0].attachment.has_value());
    EXPECT_EQ(decoded->runs[0].attachment->identifier, "ID-1");
    EXPECT_TRUE(decoded->runs[0].attachment->type_uti.empty());
}

TEST(NoteStoreDecoder, decoder_is_reusable) {
    auto payload = storage::encode_note_store(sample_body());
    auto decoder = NoteStoreDecoder{payload};
    auto first = decoder.decode();
    auto second = decoder.decode();
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first, second);
}

// -- Missing required fields --------------------------------------------------

TEST(NoteStoreDecoder, empty_payload_is_missing_document) {
    expect_schema_error(std::vector<std::byte>{}, "missing required fields: document");
}

TEST(NoteStoreDecoder, missing_note_fails) {
    auto root = pb::NoteStoreProto{};
    root.mutable_document()->set_version(1);

    expect_schema_error(storage::serialize(root), "document.note");
}

TEST(NoteStoreDecoder, missing_note_text_fails) {
    auto note = pb::Note{};
    note.add_attribute_run()->set_length(1);

    expect_schema_error(wrap_note(note), "document.note.note_text");
}

TEST(NoteStoreDecoder, run_without_length_fails) {
    auto run = pb::AttributeRun{};
    run.set_font_weight(1);

    expect_schema_error(note_with_run(run), "document.note.attribute_run[0].length");
}

TEST(NoteStoreDecoder, negative_run_length_fails) {
    auto run = pb::AttributeRun{};
    run.set_length(-4);

    expect_schema_error(note_with_run(run), "AttributeRun.length out of range: -4");
}

TEST(NoteStoreDecoder, checklist_without_done_fails) {
    auto run = pb::AttributeRun{};
    run.set_length(3);
    run.mutable_paragraph_style()->mutable_checklist()->set_uuid("0123456789abcdef");

    expect_schema_error(note_with_run(run), "paragraph_style.checklist.done");
}

TEST(NoteStoreDecoder, checklist_without_uuid_fails) {
    auto run = pb::AttributeRun{};
    run.set_length(3);
    run.mutable_paragraph_style()->mutable_checklist()->set_done(1);

    expect_schema_error(note_with_run(run), "paragraph_style.checklist.uuid");
}

// -- Wire-format violations ---------------------------------------------------

TEST(NoteStoreDecoder, truncated_payload_fails) {
    auto payload = storage::encode_note_store(sample_body());
    payload.resize(payload.size() - 3);
    expect_schema_error(payload, "malformed wire data");
}

TEST(NoteStoreDecoder, wrong_wire_type_fails) {
    auto note = pb::Note{};
    note.mutable_unknown_fields()->AddVarint(2, 5);

    expect_schema_error(wrap_note(note), "Note.note_text: expected len, got varint");
}

TEST(NoteStoreDecoder, wrong_wire_type_on_optional_field_fails) {
    auto run = pb::AttributeRun{};
    run.set_length(3);
    run.mutable_unknown_fields()->AddLengthDelimited(5, "bold");

    expect_schema_error(note_with_run(run), "AttributeRun.font_weight: expected varint, got len");
}

TEST(NoteStoreDecoder, group_field_fails) {
    auto note = pb::Note{};
    note.set_note_text("abc");
    note.mutable_unknown_fields()->AddGroup(9);

    expect_schema_error(wrap_note(note), "Note: cannot skip field 9 (group)");
}

TEST(NoteStoreDecoder, garbage_bytes_fail_without_throwing) {
    auto garbage = std::vector<std::byte>{std::byte{0xFF}, std::byte{0xFF}, std::byte{0x07}};
    expect_schema_error(garbage, "malformed wire data");
}

// -- decompress_note_data -----------------------------------------------------

TEST(DecompressNoteData, plain_payload_is_returned_unchanged) {
    auto payload = storage::encode_note_store(NoteBody{.text = "legacy"});
    auto result = decompress_note_data(payload);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(*result, payload);
}

TEST(DecompressNoteData, corrupt_gzip_is_an_error) {
    auto record = storage::encode_note_record(NoteBody{.text = "soon corrupt"});
    ASSERT_TRUE(record.has_value());
    record->resize(12);
    EXPECT_FALSE(decompress_note_data(*record).has_value());
}
