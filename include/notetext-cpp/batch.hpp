/// @file batch.hpp
/// @brief Parallel decoding of independent notes.

#pragma once

#include <notetext-cpp/note.hpp>

#include <span>
#include <vector>

namespace notetext_cpp {

/// Decode every input on the shared executor.
///
/// Results are in input order. Each note's failure stays in its own
/// DecodedNote; one bad record never affects the others. `lookup` is
/// called from several threads at once and must be safe for that.
auto decode_notes(std::span<const NoteInput> inputs, const AttachmentLookup& lookup,
                  const DecodeOptions& options = {}) -> std::vector<DecodedNote>;

}  // namespace notetext_cpp
