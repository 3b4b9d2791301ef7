// json_test.cpp: nlohmann/json interoperability

#include <notetext-cpp/json.hpp>

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace nt = notetext_cpp;
using json = nlohmann::json;

// =============================================================================
// Note types
// =============================================================================

TEST(JsonAdl, attachment_ref_round_trip) {
    auto ref = nt::AttachmentRef{.identifier = "ABC", .type_uti = "public.jpeg"};
    json j = ref;
    EXPECT_EQ(j["identifier"], "ABC");
    EXPECT_EQ(j["type_uti"], "public.jpeg");
    EXPECT_EQ(j.get<nt::AttachmentRef>(), ref);
}

TEST(JsonAdl, attachment_ref_type_is_optional) {
    auto ref = json{{"identifier", "X"}}.get<nt::AttachmentRef>();
    EXPECT_EQ(ref.identifier, "X");
    EXPECT_TRUE(ref.type_uti.empty());
}

TEST(JsonAdl, placed_attachment_carries_kind_and_offsets) {
    auto placed = nt::PlacedAttachment{
        .ref = {.identifier = "F", .type_uti = "com.adobe.pdf"},
        .kind = nt::AttachmentKind::file,
        .offset = 4,
        .byte_offset = 9,
    };
    json j = placed;
    EXPECT_EQ(j["kind"], "file");
    EXPECT_EQ(j["offset"], 4);
    EXPECT_EQ(j["byte_offset"], 9);
}

TEST(JsonAdl, styled_run_omits_absent_attributes) {
    auto run = nt::StyledRun{};
    run.length = 3;
    run.link = "https://example.org";
    json j = run;
    EXPECT_EQ(j["length"], 3);
    EXPECT_EQ(j["link"], "https://example.org");
    EXPECT_FALSE(j.contains("font_weight"));
    EXPECT_FALSE(j.contains("attachment"));
}

TEST(JsonAdl, checklist_uuid_as_hex) {
    auto style = nt::ParagraphStyle{};
    style.checklist = nt::Checklist{
        .uuid = {std::byte{0x00}, std::byte{0xAB}, std::byte{0x7F}},
        .done = true,
    };
    json j = style;
    EXPECT_EQ(j["checklist"]["uuid"], "00ab7f");
    EXPECT_EQ(j["checklist"]["done"], true);
}

TEST(JsonAdl, decoded_note_includes_error_only_when_set) {
    auto note = nt::DecodedNote{};
    note.text = "hello";
    note.path = nt::DecodePath::structured;
    json ok = note;
    EXPECT_EQ(ok["text"], "hello");
    EXPECT_EQ(ok["path"], "structured");
    EXPECT_FALSE(ok.contains("error"));
    EXPECT_FALSE(ok.contains("warnings"));
    EXPECT_TRUE(ok["positions"].is_object());

    note.path = nt::DecodePath::fallback;
    note.error = nt::Error{nt::ErrorKind::schema_error, "Document.note is missing"};
    json failed = note;
    EXPECT_EQ(failed["path"], "fallback");
    EXPECT_EQ(failed["error"]["kind"], "schema_error");
    EXPECT_EQ(failed["error"]["message"], "Document.note is missing");
}

// =============================================================================
// HeuristicConfig
// =============================================================================

TEST(HeuristicConfigJson, round_trip_preserves_every_field) {
    auto config = nt::HeuristicConfig{};
    config.min_run_length = 4;
    config.min_alnum_ratio = 0.6;
    config.junk_substrings = {"alpha", "beta"};
    config.mojibake_chars = "\xC3\x83";

    json j = config;
    EXPECT_EQ(j.get<nt::HeuristicConfig>(), config);
}

TEST(HeuristicConfigJson, missing_keys_keep_defaults) {
    auto config = json{{"meaningful_length", 20}}.get<nt::HeuristicConfig>();
    auto expected = nt::HeuristicConfig{};
    expected.meaningful_length = 20;
    EXPECT_EQ(config, expected);
}

TEST(HeuristicConfigJson, wrong_type_is_config_error) {
    try {
        (void)json{{"min_run_length", "three"}}.get<nt::HeuristicConfig>();
        FAIL() << "expected std::runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string{e.what()}.find("config_error"), std::string::npos);
        EXPECT_NE(std::string{e.what()}.find("min_run_length"), std::string::npos);
    }
}

TEST(HeuristicConfigJson, ratio_out_of_range_throws) {
    EXPECT_THROW(((void)json{{"max_mojibake_ratio", 1.5}}.get<nt::HeuristicConfig>()),
                 std::runtime_error);
    EXPECT_THROW(((void)json{{"min_alnum_ratio", -0.1}}.get<nt::HeuristicConfig>()),
                 std::runtime_error);
}

TEST(HeuristicConfigJson, zero_run_length_throws) {
    EXPECT_THROW(((void)json{{"min_run_length", 0}}.get<nt::HeuristicConfig>()),
                 std::runtime_error);
}

TEST(HeuristicConfigJson, non_object_throws) {
    EXPECT_THROW((void)json::array({1, 2}).get<nt::HeuristicConfig>(), std::runtime_error);
}

// =============================================================================
// load_heuristic_config
// =============================================================================

class LoadHeuristicConfig : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               ("notetext_json_test_" + std::to_string(::testing::UnitTest::GetInstance()
                                                            ->random_seed()));
        std::filesystem::create_directories(dir_);
    }
    void TearDown() override { std::filesystem::remove_all(dir_); }

    auto write(const std::string& name, const std::string& contents) -> std::filesystem::path {
        auto path = dir_ / name;
        auto out = std::ofstream{path};
        out << contents;
        return path;
    }

    std::filesystem::path dir_;
};

TEST_F(LoadHeuristicConfig, reads_file) {
    auto path = write("config.json", R"({"short_length": 20, "junk_substrings": ["x-internal"]})");
    auto config = nt::load_heuristic_config(path);
    EXPECT_EQ(config.short_length, 20u);
    EXPECT_EQ(config.junk_substrings, (std::vector<std::string>{"x-internal"}));
}

TEST_F(LoadHeuristicConfig, missing_file_throws) {
    EXPECT_THROW((void)nt::load_heuristic_config(dir_ / "absent.json"), std::runtime_error);
}

TEST_F(LoadHeuristicConfig, malformed_json_throws) {
    auto path = write("broken.json", "{ not json");
    EXPECT_THROW((void)nt::load_heuristic_config(path), std::runtime_error);
}
