#include <notetext-cpp/fallback.hpp>

#include "encoding/utf8.hpp"
#include "text/char_class.hpp"

#include <spdlog/spdlog.h>

#include <cstddef>
#include <string>
#include <vector>

namespace notetext_cpp {

auto extract_printable_runs(std::span<const std::byte> data, const HeuristicConfig& config)
    -> std::vector<std::string> {
    auto runs = std::vector<std::string>{};
    auto current = std::u32string{};

    auto flush = [&] {
        auto trimmed = text::trim(current);
        if (trimmed.size() >= config.min_run_length) {
            runs.push_back(encoding::encode_utf8(trimmed));
        }
        current.clear();
    };

    auto pos = std::size_t{0};
    while (pos < data.size()) {
        auto c = static_cast<char32_t>(static_cast<unsigned char>(data[pos]));
        auto width = std::size_t{1};
        if (c >= 0x80) {
            if (auto cp = encoding::decode_code_point(data.subspan(pos))) {
                c = cp->value;
                width = cp->bytes_read;
            }
            // Otherwise the byte stands for its Latin-1 character.
        }
        pos += width;

        if (text::is_printable(c)) {
            current.push_back(c);
        } else {
            flush();
        }
    }
    flush();
    return runs;
}

auto extract_fallback_text(std::span<const std::byte> data, const HeuristicConfig& config)
    -> std::string {
    auto candidates = extract_printable_runs(data, config);

    auto kept = std::vector<std::string>{};
    for (auto& candidate : candidates) {
        if (!is_noise(candidate, config)) kept.push_back(std::move(candidate));
    }

    auto meaningful = std::vector<std::string>{};
    for (const auto& s : kept) {
        if (encoding::decode_utf8(s).size() > config.meaningful_length) meaningful.push_back(s);
    }
    const auto& chosen = meaningful.empty() ? kept : meaningful;

    auto joined = std::string{};
    for (std::size_t i = 0; i < chosen.size(); ++i) {
        if (i > 0) joined.append("\n\n");
        joined.append(chosen[i]);
    }

    auto trimmed = trim_trailing_junk(joined, config);
    auto result = encoding::encode_utf8(text::trim(encoding::decode_utf8(trimmed)));

    spdlog::debug("fallback extraction: {} candidates, {} kept, {} bytes of text",
                  candidates.size(), chosen.size(), result.size());
    return result;
}

}  // namespace notetext_cpp
