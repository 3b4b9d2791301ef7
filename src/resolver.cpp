#include <notetext-cpp/resolver.hpp>

#include "encoding/utf8.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstddef>
#include <exception>
#include <optional>
#include <utility>

namespace notetext_cpp {

auto classify_attachment(std::string_view type_uti) -> AttachmentKind {
    if (type_uti.find("hashtag") != std::string_view::npos) return AttachmentKind::hashtag;
    if (type_uti.find("mention") != std::string_view::npos) return AttachmentKind::mention;
    return AttachmentKind::file;
}

namespace {

// Lookup failures degrade the reference to a file marker.
auto call_lookup(const AttachmentLookup& lookup, const AttachmentRef& ref,
                 std::vector<Error>& warnings) -> std::optional<std::string> {
    if (!lookup) return std::nullopt;
    try {
        return lookup(ref.identifier, ref.type_uti);
    } catch (const std::exception& e) {
        spdlog::warn("attachment lookup failed for {} ({}): {}", ref.identifier, ref.type_uti,
                     e.what());
        warnings.emplace_back(ErrorKind::lookup_failure, ref.identifier + ": " + e.what());
        return std::nullopt;
    } catch (...) {
        spdlog::warn("attachment lookup failed for {} ({}): non-standard exception",
                     ref.identifier, ref.type_uti);
        warnings.emplace_back(ErrorKind::lookup_failure,
                              ref.identifier + ": non-standard exception");
        return std::nullopt;
    }
}

}  // anonymous namespace

auto collect_markers(std::u32string_view text, std::span<const StyledRun> runs)
    -> std::vector<MarkerCandidate> {
    auto candidates = std::vector<MarkerCandidate>{};
    auto pos = std::size_t{0};

    for (std::size_t i = 0; i < runs.size(); ++i) {
        const auto& run = runs[i];
        if (run.attachment && pos < text.size()) {
            auto segment = text.substr(pos, run.length);
            auto found = segment.find(placeholder_char);
            if (found != std::u32string_view::npos) {
                candidates.push_back(MarkerCandidate{
                    .offset = pos + found,
                    .ref = *run.attachment,
                    .run_index = i,
                });
            } else {
                spdlog::debug("run {} references {} but has no placeholder", i,
                              run.attachment->identifier);
            }
        }
        // The cursor is the sum of prior lengths, whatever the run carried.
        pos += run.length;
    }
    return candidates;
}

auto apply_markers(std::u32string text, std::vector<MarkerCandidate> candidates,
                   const AttachmentLookup& lookup) -> ResolvedContent {
    auto result = ResolvedContent{};

    std::ranges::stable_sort(candidates, {}, &MarkerCandidate::offset);

    auto shift = std::ptrdiff_t{0};
    for (auto& candidate : candidates) {
        auto adjusted = static_cast<std::size_t>(static_cast<std::ptrdiff_t>(candidate.offset) + shift);
        auto kind = classify_attachment(candidate.ref.type_uti);

        if (auto literal = call_lookup(lookup, candidate.ref, result.warnings)) {
            auto replacement = encoding::decode_utf8(*literal);
            text.replace(adjusted, 1, replacement);
            shift += static_cast<std::ptrdiff_t>(replacement.size()) - 1;
            spdlog::debug("inlined {} at {} ({} chars)", candidate.ref.identifier, adjusted,
                          replacement.size());
            result.resolutions.emplace_back(InlineResolved{
                .ref = std::move(candidate.ref),
                .kind = kind,
                .offset = adjusted,
                .text = std::move(*literal),
            });
        } else {
            result.positions[candidate.ref.identifier] = adjusted;
            result.attachments.push_back(PlacedAttachment{
                .ref = candidate.ref,
                .kind = kind,
                .offset = adjusted,
                .byte_offset = 0,
            });
            result.resolutions.emplace_back(FileMarker{
                .ref = std::move(candidate.ref),
                .kind = kind,
                .offset = adjusted,
                .degraded = is_inline(kind),
            });
        }
    }

    // Byte offsets only make sense once every splice is done.
    auto cp = std::size_t{0};
    auto byte = std::size_t{0};
    for (auto& placed : result.attachments) {
        for (; cp < placed.offset; ++cp) byte += encoding::utf8_length(text[cp]);
        placed.byte_offset = byte;
    }

    result.text = encoding::encode_utf8(text);
    return result;
}

auto resolve_attachments(std::string_view text, std::span<const StyledRun> runs,
                         const AttachmentLookup& lookup) -> ResolvedContent {
    auto had_errors = false;
    auto chars = encoding::decode_utf8(text, &had_errors);

    auto candidates = collect_markers(chars, runs);
    auto result = apply_markers(std::move(chars), std::move(candidates), lookup);

    if (had_errors) {
        spdlog::warn("note text is not valid UTF-8; invalid bytes replaced");
        result.warnings.emplace(result.warnings.begin(), ErrorKind::invalid_utf8,
                                "note text contains invalid UTF-8");
    }
    return result;
}

}  // namespace notetext_cpp
