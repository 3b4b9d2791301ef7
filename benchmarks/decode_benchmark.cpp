// notetext-cpp benchmarks: throughput of the decode pipeline stages.

#include <notetext-cpp/notetext.hpp>

#include "src/storage/note_encoder.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <optional>
#include <random>
#include <string>
#include <vector>

using namespace notetext_cpp;

// A note of `paragraphs` lines, every fourth line ending in an attachment
// (alternating hashtag and image).
static auto make_body(std::size_t paragraphs) -> NoteBody {
    auto body = NoteBody{.version = 1};
    for (std::size_t i = 0; i < paragraphs; ++i) {
        auto line = "Paragraph " + std::to_string(i) + " of the benchmark note body ";
        auto run = StyledRun{};
        run.length = line.size();
        body.text += line;
        body.runs.push_back(run);

        if (i % 4 == 3) {
            body.text += placeholder_utf8;
            auto marker = StyledRun{};
            marker.length = 1;
            marker.attachment = AttachmentRef{
                .identifier = "ID-" + std::to_string(i),
                .type_uti = (i % 8 == 3) ? "com.apple.notes.inlinetextattachment.hashtag"
                                         : "public.jpeg",
            };
            body.runs.push_back(marker);
        }
        body.text += "\n";
        auto newline = StyledRun{};
        newline.length = 1;
        body.runs.push_back(newline);
    }
    return body;
}

static auto hashtag_lookup(std::string_view id, std::string_view type)
    -> std::optional<std::string> {
    if (!is_inline(classify_attachment(type))) return std::nullopt;
    return "#" + std::string{id};
}

// =============================================================================
// Stages
// =============================================================================

static void bm_decompress(benchmark::State& state) {
    auto record = *storage::encode_note_record(make_body(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto payload = decompress_note_data(record);
        benchmark::DoNotOptimize(payload);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * record.size()));
}
BENCHMARK(bm_decompress)->Range(8, 4096);

static void bm_structured_decode(benchmark::State& state) {
    auto payload = storage::encode_note_store(make_body(static_cast<std::size_t>(state.range(0))));
    for (auto _ : state) {
        auto body = decode_note_store(payload);
        benchmark::DoNotOptimize(body);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * payload.size()));
}
BENCHMARK(bm_structured_decode)->Range(8, 4096);

static void bm_resolve_attachments(benchmark::State& state) {
    auto body = make_body(static_cast<std::size_t>(state.range(0)));
    auto lookup = AttachmentLookup{hashtag_lookup};
    for (auto _ : state) {
        auto resolved = resolve_attachments(body.text, body.runs, lookup);
        benchmark::DoNotOptimize(resolved);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * body.runs.size()));
}
BENCHMARK(bm_resolve_attachments)->Range(8, 4096);

static void bm_fallback_extract(benchmark::State& state) {
    // Prose interleaved with random framing bytes.
    auto rng = std::mt19937{7};
    auto byte = std::uniform_int_distribution<int>{0, 31};
    auto blob = std::vector<std::byte>{};
    for (std::int64_t i = 0; i < state.range(0); ++i) {
        for (auto c : std::string{"Recovered sentence number "} + std::to_string(i)) {
            blob.push_back(static_cast<std::byte>(c));
        }
        for (int k = 0; k < 6; ++k) blob.push_back(static_cast<std::byte>(byte(rng)));
    }
    for (auto _ : state) {
        auto text = extract_fallback_text(blob);
        benchmark::DoNotOptimize(text);
    }
    state.SetBytesProcessed(static_cast<std::int64_t>(state.iterations() * blob.size()));
}
BENCHMARK(bm_fallback_extract)->Range(8, 4096);

// =============================================================================
// Whole notes
// =============================================================================

static auto make_corpus(std::size_t notes) -> std::vector<std::vector<std::byte>> {
    auto corpus = std::vector<std::vector<std::byte>>{};
    for (std::size_t i = 0; i < notes; ++i) {
        corpus.push_back(*storage::encode_note_record(make_body(32 + i % 64)));
    }
    return corpus;
}

static void bm_decode_notes_sequential(benchmark::State& state) {
    auto corpus = make_corpus(static_cast<std::size_t>(state.range(0)));
    auto lookup = AttachmentLookup{hashtag_lookup};
    for (auto _ : state) {
        for (const auto& record : corpus) {
            auto note = decode_note(record, lookup);
            benchmark::DoNotOptimize(note);
        }
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * corpus.size()));
}
BENCHMARK(bm_decode_notes_sequential)->Range(16, 1024);

static void bm_decode_notes_batch(benchmark::State& state) {
    auto corpus = make_corpus(static_cast<std::size_t>(state.range(0)));
    auto inputs = std::vector<NoteInput>{};
    for (const auto& record : corpus) inputs.push_back(NoteInput{.data = record});
    auto lookup = AttachmentLookup{hashtag_lookup};
    for (auto _ : state) {
        auto notes = decode_notes(inputs, lookup);
        benchmark::DoNotOptimize(notes);
    }
    state.SetItemsProcessed(static_cast<std::int64_t>(state.iterations() * corpus.size()));
}
BENCHMARK(bm_decode_notes_batch)->Range(16, 1024)->UseRealTime();
