// decode_record: decode one raw note record and print it as JSON
//
// Demonstrates:
//   - Reading a ZICNOTEDATA.ZDATA blob saved to disk
//   - decode_note() with a lookup that leaves every attachment as a marker
//   - Loading fallback heuristics from a JSON file
//   - Serializing the result with nlohmann/json
//
// Build: cmake --build build -DNOTETEXT_BUILD_EXAMPLES=ON
// Run:   ./build/examples/decode_record note.bin [heuristics.json]

#include <notetext-cpp/json.hpp>
#include <notetext-cpp/notetext.hpp>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdio>
#include <exception>
#include <fstream>
#include <iterator>
#include <optional>
#include <string>
#include <vector>

namespace nt = notetext_cpp;
using json = nlohmann::json;

static auto read_file(const char* path) -> std::optional<std::vector<std::byte>> {
    auto in = std::ifstream{path, std::ios::binary};
    if (!in) return std::nullopt;
    auto chars = std::vector<char>{std::istreambuf_iterator<char>{in},
                                   std::istreambuf_iterator<char>{}};
    auto bytes = std::vector<std::byte>(chars.size());
    for (std::size_t i = 0; i < chars.size(); ++i) bytes[i] = static_cast<std::byte>(chars[i]);
    return bytes;
}

int main(int argc, char** argv) {
    if (argc < 2) {
        std::fprintf(stderr, "usage: %s <record> [heuristics.json]\n", argv[0]);
        return 2;
    }

    auto record = read_file(argv[1]);
    if (!record) {
        spdlog::error("cannot read {}", argv[1]);
        return 1;
    }

    auto options = nt::DecodeOptions{};
    if (argc > 2) {
        try {
            options.heuristics = nt::load_heuristic_config(argv[2]);
        } catch (const std::exception& e) {
            spdlog::error("{}", e.what());
            return 1;
        }
    }

    // No store to consult: hashtags and mentions stay as degraded markers.
    auto lookup = nt::AttachmentLookup{
        [](std::string_view, std::string_view) -> std::optional<std::string> {
            return std::nullopt;
        }};

    auto note = nt::decode_note(*record, lookup, options);
    if (note.error) {
        spdlog::info("{} path: {}", nt::to_string_view(note.path), note.error->message);
    }

    json out = note;
    std::printf("%s\n", out.dump(2).c_str());
    return 0;
}
