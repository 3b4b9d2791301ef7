#pragma once

// Code point classes used by the fallback heuristics.
// Coarse: everything outside ASCII and Latin-1 that is not a
// known punctuation block counts as a letter.
// Internal header, not installed.

#include <cstddef>
#include <string_view>

namespace notetext_cpp::text {

constexpr auto is_ascii_alnum(char32_t c) -> bool {
    return (c >= U'0' && c <= U'9') || (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z');
}

constexpr auto is_space(char32_t c) -> bool {
    return c == U' ' || c == U'\n' || c == U'\r' || c == U'\t' || c == 0xA0;
}

constexpr auto is_hex_digit(char32_t c) -> bool {
    return (c >= U'0' && c <= U'9') || (c >= U'a' && c <= U'f') || (c >= U'A' && c <= U'F');
}

constexpr auto is_punctuation(char32_t c) -> bool {
    if (c < 0x80) {
        return (c >= 0x21 && c <= 0x2F) || (c >= 0x3A && c <= 0x40) ||
               (c >= 0x5B && c <= 0x60) || (c >= 0x7B && c <= 0x7E);
    }
    return (c >= 0xA1 && c <= 0xBF) || c == 0xD7 || c == 0xF7 ||
           (c >= 0x2000 && c <= 0x206F) || (c >= 0x3000 && c <= 0x303F) ||
           (c >= 0xFFF0 && c <= 0xFFFF);
}

constexpr auto is_alnum(char32_t c) -> bool {
    if (c < 0x80) return is_ascii_alnum(c);
    if (c < 0xC0) return false;
    return !is_punctuation(c);
}

// C0/C1 controls and DEL are not printable; tab, newline and CR are.
constexpr auto is_printable(char32_t c) -> bool {
    if (c == U'\n' || c == U'\r' || c == U'\t') return true;
    if (c < 0x20) return false;
    if (c >= 0x7F && c <= 0x9F) return false;
    return true;
}

constexpr auto trim(std::u32string_view s) -> std::u32string_view {
    auto begin = std::size_t{0};
    auto end = s.size();
    while (begin < end && is_space(s[begin])) ++begin;
    while (end > begin && is_space(s[end - 1])) --end;
    return s.substr(begin, end - begin);
}

}  // namespace notetext_cpp::text
