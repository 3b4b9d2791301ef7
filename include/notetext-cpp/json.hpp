/// @file json.hpp
/// @brief nlohmann/json interoperability for notetext-cpp.
///
/// Provides ADL serialization (to_json/from_json) for the note types and
/// loading of HeuristicConfig from JSON files.

#pragma once

#include <notetext-cpp/error.hpp>
#include <notetext-cpp/fallback.hpp>
#include <notetext-cpp/note.hpp>
#include <notetext-cpp/types.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>

namespace notetext_cpp {

// =============================================================================
// ADL serialization: to_json / from_json
// =============================================================================

// -- Attachments --------------------------------------------------------------

void to_json(nlohmann::json& j, const AttachmentRef& ref);
void from_json(const nlohmann::json& j, AttachmentRef& ref);

void to_json(nlohmann::json& j, const PlacedAttachment& placed);

// -- Runs ---------------------------------------------------------------------

void to_json(nlohmann::json& j, const Checklist& c);
void to_json(nlohmann::json& j, const ParagraphStyle& ps);
void to_json(nlohmann::json& j, const StyledRun& run);

// -- Results ------------------------------------------------------------------

void to_json(nlohmann::json& j, const Error& e);
void to_json(nlohmann::json& j, const DecodedNote& note);

// -- Configuration ------------------------------------------------------------

/// Keys mirror the HeuristicConfig member names.
void to_json(nlohmann::json& j, const HeuristicConfig& config);

/// Keys absent from j keep their default. A present key of the wrong type
/// or an out-of-range ratio throws std::runtime_error.
void from_json(const nlohmann::json& j, HeuristicConfig& config);

/// Read a HeuristicConfig from a JSON file.
/// @throws std::runtime_error if the file cannot be read or parsed.
auto load_heuristic_config(const std::filesystem::path& path) -> HeuristicConfig;

}  // namespace notetext_cpp
