#include <notetext-cpp/json.hpp>

#include <cstddef>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace notetext_cpp {

namespace {

auto bytes_to_hex(const std::byte* data, std::size_t len) -> std::string {
    static constexpr char hex_chars[] = "0123456789abcdef";
    auto result = std::string{};
    result.reserve(len * 2);
    for (std::size_t i = 0; i < len; ++i) {
        auto b = static_cast<unsigned char>(data[i]);
        result.push_back(hex_chars[b >> 4]);
        result.push_back(hex_chars[b & 0x0F]);
    }
    return result;
}

auto config_error(std::string_view what) -> std::runtime_error {
    return std::runtime_error{std::string{to_string_view(ErrorKind::config_error)} + ": " +
                              std::string{what}};
}

// Read j[key] into out when present.
template <typename T>
void read_key(const nlohmann::json& j, const char* key, T& out) {
    auto it = j.find(key);
    if (it == j.end()) return;
    try {
        out = it->template get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw config_error(std::string{key} + ": " + e.what());
    }
}

void check_ratio(const char* key, double value) {
    if (value < 0.0 || value > 1.0) {
        throw config_error(std::string{key} + " must be within [0, 1]");
    }
}

}  // anonymous namespace

// -- Attachments --------------------------------------------------------------

void to_json(nlohmann::json& j, const AttachmentRef& ref) {
    j = nlohmann::json{{"identifier", ref.identifier}, {"type_uti", ref.type_uti}};
}

void from_json(const nlohmann::json& j, AttachmentRef& ref) {
    ref.identifier = j.at("identifier").get<std::string>();
    ref.type_uti = j.value("type_uti", std::string{});
}

void to_json(nlohmann::json& j, const PlacedAttachment& placed) {
    j = nlohmann::json{
        {"identifier", placed.ref.identifier},
        {"type_uti", placed.ref.type_uti},
        {"kind", std::string{to_string_view(placed.kind)}},
        {"offset", placed.offset},
        {"byte_offset", placed.byte_offset},
    };
}

// -- Runs ---------------------------------------------------------------------

void to_json(nlohmann::json& j, const Checklist& c) {
    j = nlohmann::json{{"uuid", bytes_to_hex(c.uuid.data(), c.uuid.size())}, {"done", c.done}};
}

void to_json(nlohmann::json& j, const ParagraphStyle& ps) {
    j = nlohmann::json::object();
    if (ps.style_type) j["style_type"] = *ps.style_type;
    if (ps.alignment) j["alignment"] = *ps.alignment;
    if (ps.indent_amount) j["indent_amount"] = *ps.indent_amount;
    if (ps.checklist) j["checklist"] = *ps.checklist;
}

void to_json(nlohmann::json& j, const StyledRun& run) {
    j = nlohmann::json{{"length", run.length}};
    if (run.paragraph_style) j["paragraph_style"] = *run.paragraph_style;
    if (run.font_weight) j["font_weight"] = *run.font_weight;
    if (run.underlined) j["underlined"] = *run.underlined;
    if (run.strikethrough) j["strikethrough"] = *run.strikethrough;
    if (run.superscript) j["superscript"] = *run.superscript;
    if (run.link) j["link"] = *run.link;
    if (run.attachment) j["attachment"] = *run.attachment;
}

// -- Results ------------------------------------------------------------------

void to_json(nlohmann::json& j, const Error& e) {
    j = nlohmann::json{{"kind", std::string{to_string_view(e.kind)}}, {"message", e.message}};
}

void to_json(nlohmann::json& j, const DecodedNote& note) {
    j = nlohmann::json{
        {"text", note.text},
        {"path", std::string{to_string_view(note.path)}},
        {"attachments", note.attachments},
        {"positions", note.positions},
        {"runs", note.runs},
    };
    if (note.error) j["error"] = *note.error;
    if (!note.warnings.empty()) j["warnings"] = note.warnings;
}

// -- Configuration ------------------------------------------------------------

void to_json(nlohmann::json& j, const HeuristicConfig& config) {
    j = nlohmann::json{
        {"min_run_length", config.min_run_length},
        {"meaningful_length", config.meaningful_length},
        {"min_alnum_ratio", config.min_alnum_ratio},
        {"max_mojibake_ratio", config.max_mojibake_ratio},
        {"short_length", config.short_length},
        {"max_short_punct_ratio", config.max_short_punct_ratio},
        {"mojibake_line_threshold", config.mojibake_line_threshold},
        {"marker_token_max_length", config.marker_token_max_length},
        {"namespace_min_segments", config.namespace_min_segments},
        {"mojibake_chars", config.mojibake_chars},
        {"junk_substrings", config.junk_substrings},
    };
}

void from_json(const nlohmann::json& j, HeuristicConfig& config) {
    if (!j.is_object()) throw config_error("heuristic config must be a JSON object");

    read_key(j, "min_run_length", config.min_run_length);
    read_key(j, "meaningful_length", config.meaningful_length);
    read_key(j, "min_alnum_ratio", config.min_alnum_ratio);
    read_key(j, "max_mojibake_ratio", config.max_mojibake_ratio);
    read_key(j, "short_length", config.short_length);
    read_key(j, "max_short_punct_ratio", config.max_short_punct_ratio);
    read_key(j, "mojibake_line_threshold", config.mojibake_line_threshold);
    read_key(j, "marker_token_max_length", config.marker_token_max_length);
    read_key(j, "namespace_min_segments", config.namespace_min_segments);
    read_key(j, "mojibake_chars", config.mojibake_chars);
    read_key(j, "junk_substrings", config.junk_substrings);

    check_ratio("min_alnum_ratio", config.min_alnum_ratio);
    check_ratio("max_mojibake_ratio", config.max_mojibake_ratio);
    check_ratio("max_short_punct_ratio", config.max_short_punct_ratio);
    if (config.min_run_length == 0) throw config_error("min_run_length must be positive");
}

auto load_heuristic_config(const std::filesystem::path& path) -> HeuristicConfig {
    auto in = std::ifstream{path};
    if (!in) throw config_error("cannot open " + path.string());

    auto j = nlohmann::json::parse(in, nullptr, false);
    if (j.is_discarded()) throw config_error("invalid JSON in " + path.string());

    return j.get<HeuristicConfig>();
}

}  // namespace notetext_cpp
