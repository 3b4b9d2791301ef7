// Fuzz target for decode_note(): the whole pipeline, gzip envelope
// included. Every attachment is resolved to a fixed literal so that
// inline splicing runs on fuzzer-chosen offsets.

#include <notetext-cpp/note.hpp>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    static const auto lookup = notetext_cpp::AttachmentLookup{
        [](std::string_view, std::string_view type) -> std::optional<std::string> {
            if (type.size() % 2 == 0) return std::string{"#tag"};
            return std::nullopt;
        }};

    auto options = notetext_cpp::DecodeOptions{};
    options.max_decompressed_size = 1 << 20;
    auto note = notetext_cpp::decode_note(span, lookup, options);

    // Every reported position must index a placeholder in the final text.
    for (const auto& placed : note.attachments) {
        if (note.text.compare(placed.byte_offset, notetext_cpp::placeholder_utf8.size(),
                              notetext_cpp::placeholder_utf8) != 0) {
            __builtin_trap();
        }
    }
    return 0;
}
