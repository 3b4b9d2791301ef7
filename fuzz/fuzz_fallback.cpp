// Fuzz target for the fallback extractor and its noise filters.

#include <notetext-cpp/fallback.hpp>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const auto span = std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(data), size);

    auto text = notetext_cpp::extract_fallback_text(span);
    (void)text;

    const auto line = std::string_view{reinterpret_cast<const char*>(data), size};
    (void)notetext_cpp::is_noise(line);
    (void)notetext_cpp::trim_trailing_junk(line);
    return 0;
}
