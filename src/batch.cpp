#include <notetext-cpp/batch.hpp>

#include "executor.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>

namespace notetext_cpp {

auto decode_notes(std::span<const NoteInput> inputs, const AttachmentLookup& lookup,
                  const DecodeOptions& options) -> std::vector<DecodedNote> {
    auto results = std::vector<DecodedNote>(inputs.size());

    if (inputs.size() < 2) {
        for (std::size_t i = 0; i < inputs.size(); ++i) {
            results[i] = decode_note(inputs[i], lookup, options);
        }
        return results;
    }

    auto taskflow = tf::Taskflow{};
    taskflow.for_each_index(std::size_t{0}, inputs.size(), std::size_t{1},
        [&](std::size_t i) {
            results[i] = decode_note(inputs[i], lookup, options);
        });
    detail::global_executor().run(taskflow).get();

    auto fallbacks = std::size_t{0};
    for (const auto& note : results) {
        if (note.path != DecodePath::structured) ++fallbacks;
    }
    spdlog::debug("decoded {} notes ({} via fallback)", results.size(), fallbacks);
    return results;
}

}  // namespace notetext_cpp
