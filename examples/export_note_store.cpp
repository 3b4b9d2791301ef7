// export_note_store: dump every note of a NoteStore.sqlite as JSON lines
//
// Demonstrates:
//   - Opening the store read-only (default location or a given path)
//   - Batch decoding all notes with decode_notes() on the shared executor
//   - Resolving hashtags and mentions through NoteStore::lookup()
//   - Attaching the store's title, folder and timestamps to each note
//
// Build: cmake --build build -DNOTETEXT_BUILD_EXAMPLES=ON
// Run:   ./build/examples/export_note_store [NoteStore.sqlite]

#include <notetext-cpp/json.hpp>
#include <notetext-cpp/notetext.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <filesystem>
#include <vector>

namespace nt = notetext_cpp;
using json = nlohmann::json;

int main(int argc, char** argv) {
    auto path = argc > 1 ? std::filesystem::path{argv[1]} : nt::NoteStore::default_path();

    try {
        auto store = nt::NoteStore{path};
        auto rows = store.notes();
        spdlog::info("{}: {} notes", path.string(), rows.size());

        auto inputs = std::vector<nt::NoteInput>{};
        inputs.reserve(rows.size());
        for (const auto& row : rows) inputs.push_back(row.input());

        auto decoded = nt::decode_notes(inputs, store.lookup());

        auto fallbacks = std::size_t{0};
        for (std::size_t i = 0; i < rows.size(); ++i) {
            const auto& row = rows[i];
            json line = decoded[i];
            line["id"] = row.id;
            line["title"] = row.title;
            if (row.folder) line["folder"] = *row.folder;
            if (row.created) line["created"] = *row.created;
            if (row.modified) line["modified"] = *row.modified;
            line.erase("runs");
            std::printf("%s\n", line.dump().c_str());

            if (decoded[i].path != nt::DecodePath::structured) ++fallbacks;
        }
        if (fallbacks > 0) {
            spdlog::warn("{} of {} notes were not decoded structurally", fallbacks, rows.size());
        }
    } catch (const nt::StoreError& e) {
        spdlog::error("{}", e.what());
        return 1;
    }
    return 0;
}
