#pragma once

// UTF-8 <-> UTF-32 conversion.
// Note text is processed as code points so that run lengths and marker
// offsets count characters, not bytes.
// Internal header, not installed.

#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace notetext_cpp::encoding {

inline constexpr char32_t replacement_char = 0xFFFD;

struct CodePoint {
    char32_t value;
    std::size_t bytes_read;
};

// Decode one well-formed UTF-8 sequence at the start of input.
// Rejects overlong forms, surrogates and values above U+10FFFF.
inline auto decode_code_point(std::span<const std::byte> input) -> std::optional<CodePoint> {
    if (input.empty()) return std::nullopt;

    auto lead = static_cast<std::uint8_t>(input[0]);
    if (lead < 0x80) return CodePoint{static_cast<char32_t>(lead), 1};

    auto length = std::size_t{0};
    auto cp = char32_t{0};
    auto min = char32_t{0};
    if ((lead & 0xE0) == 0xC0) {
        length = 2; cp = lead & 0x1F; min = 0x80;
    } else if ((lead & 0xF0) == 0xE0) {
        length = 3; cp = lead & 0x0F; min = 0x800;
    } else if ((lead & 0xF8) == 0xF0) {
        length = 4; cp = lead & 0x07; min = 0x10000;
    } else {
        return std::nullopt;
    }
    if (input.size() < length) return std::nullopt;

    for (std::size_t i = 1; i < length; ++i) {
        auto cont = static_cast<std::uint8_t>(input[i]);
        if ((cont & 0xC0) != 0x80) return std::nullopt;
        cp = (cp << 6) | (cont & 0x3F);
    }

    if (cp < min || cp > 0x10FFFF) return std::nullopt;
    if (cp >= 0xD800 && cp <= 0xDFFF) return std::nullopt;
    return CodePoint{cp, length};
}

// Decode UTF-8, substituting U+FFFD for each byte that does not start a
// well-formed sequence. Sets *had_errors when a substitution happened.
inline auto decode_utf8(std::string_view text, bool* had_errors = nullptr) -> std::u32string {
    auto bytes = std::span<const std::byte>{
        reinterpret_cast<const std::byte*>(text.data()), text.size()};
    auto result = std::u32string{};
    result.reserve(text.size());

    auto pos = std::size_t{0};
    while (pos < bytes.size()) {
        if (auto cp = decode_code_point(bytes.subspan(pos))) {
            result.push_back(cp->value);
            pos += cp->bytes_read;
        } else {
            result.push_back(replacement_char);
            if (had_errors) *had_errors = true;
            ++pos;
        }
    }
    return result;
}

// Bytes needed to encode cp as UTF-8.
inline auto utf8_length(char32_t cp) -> std::size_t {
    if (cp < 0x80) return 1;
    if (cp < 0x800) return 2;
    if (cp < 0x10000) return 3;
    return 4;
}

inline void append_utf8(char32_t cp, std::string& out) {
    if (cp < 0x80) {
        out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

inline auto encode_utf8(std::u32string_view text) -> std::string {
    auto result = std::string{};
    result.reserve(text.size());
    for (auto cp : text) append_utf8(cp, result);
    return result;
}

}  // namespace notetext_cpp::encoding
