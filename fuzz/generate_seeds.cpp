// Helper to generate valid seed corpus files for fuzz testing.
// Build and run once: ./generate_seeds
// Not a fuzz target itself, just a corpus generator.

#include "src/storage/note_encoder.hpp"

#include <cstddef>
#include <filesystem>
#include <fstream>
#include <string>
#include <vector>

namespace nt = notetext_cpp;

static void write_seed(const std::string& path, const std::vector<std::byte>& data) {
    auto ofs = std::ofstream{path, std::ios::binary};
    ofs.write(reinterpret_cast<const char*>(data.data()),
              static_cast<std::streamsize>(data.size()));
}

static auto plain_run(std::size_t length) -> nt::StyledRun {
    auto run = nt::StyledRun{};
    run.length = length;
    return run;
}

static auto attachment_run(std::string id, std::string type) -> nt::StyledRun {
    auto run = plain_run(1);
    run.attachment = nt::AttachmentRef{.identifier = std::move(id), .type_uti = std::move(type)};
    return run;
}

int main() {
    namespace fs = std::filesystem;
    const auto dir = std::string{"fuzz/corpus"};
    fs::create_directories(dir);

    // Seed 1: empty note
    {
        auto body = nt::NoteBody{.text = ""};
        write_seed(dir + "/seed_empty.bin", *nt::storage::encode_note_record(body));
    }

    // Seed 2: plain text, one run, legacy (no gzip envelope)
    {
        auto body = nt::NoteBody{.text = "Groceries\nmilk, eggs", .runs = {plain_run(20)}};
        write_seed(dir + "/seed_legacy_plain.bin", nt::storage::encode_note_store(body));
    }

    // Seed 3: hashtag and image markers
    {
        auto body = nt::NoteBody{
            .version = 1,
            .text = "Trip \xEF\xBF\xBC photos \xEF\xBF\xBC",
            .runs = {plain_run(5),
                     attachment_run("8E1C0C0A-1D0B-4C62-9B5E-1E2F3A4B5C6D",
                                    "com.apple.notes.inlinetextattachment.hashtag"),
                     plain_run(8),
                     attachment_run("C7A1B2D3-0000-4E5F-8A9B-112233445566", "public.jpeg")},
        };
        write_seed(dir + "/seed_markers.bin", *nt::storage::encode_note_record(body));
    }

    // Seed 4: checklist paragraphs with styling
    {
        auto item = plain_run(5);
        item.paragraph_style = nt::ParagraphStyle{
            .style_type = 103,
            .checklist = nt::Checklist{.uuid = std::vector<std::byte>(16, std::byte{0x42}),
                                       .done = false},
        };
        item.font_weight = 1;
        item.link = "https://example.org";
        auto body = nt::NoteBody{.text = "todo\n", .runs = {item}};
        write_seed(dir + "/seed_checklist.bin", *nt::storage::encode_note_record(body));
    }

    // Seed 5: runs longer than the text
    {
        auto body = nt::NoteBody{
            .text = "\xEF\xBF\xBC",
            .runs = {attachment_run("X", "com.apple.notes.inlinetextattachment.mention"),
                     plain_run(1000)},
        };
        write_seed(dir + "/seed_overlong_runs.bin", *nt::storage::encode_note_record(body));
    }

    return 0;
}
