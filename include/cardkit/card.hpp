#pragma once

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cardkit {

// ============================================================================
// Card documents
// ============================================================================

using CardDocument = nlohmann::json;

enum class CardSpec {
    V2,
    V3,
};

constexpr const char* SPEC_V2_TAG = "chara_card_v2";
constexpr const char* SPEC_V3_TAG = "chara_card_v3";

// "v2" / "v3"
const char* card_spec_name(CardSpec spec);
std::optional<CardSpec> parse_card_spec(const std::string& name);

// Classify a decoded JSON value. Order:
//   1. spec == "chara_card_v3"                         -> v3
//   2. spec == "chara_card_v2"                         -> v2
//   3. spec_version == "2.0" (string or number)        -> v2
//   4. wrapped {spec, data:{name}}: spec mentions v3/3 -> v3, v2/2 -> v2, else v3
//   5. top-level name + description|personality|scenario -> v2 (legacy)
std::optional<CardSpec> detect_spec(const CardDocument& doc);

// data.name for wrapped cards, name for legacy ones, else "Untitled"
std::string card_name(const CardDocument& doc);

// ============================================================================
// Import normalization
// ============================================================================

struct NormalizeResult {
    CardDocument card;
    std::vector<std::string> warnings;
};

// Bring an imported card to its canonical wrapped form:
//   - fix non-standard spec tags, default spec_version
//   - wrap legacy v2 cards in {spec, spec_version, data}
//   - drop a null character_book
//   - fill lorebook entry defaults and normalize position values
//   - for v2, move v3-only lorebook entry fields into extensions
// The input is not modified.
NormalizeResult normalize_card(const CardDocument& doc, CardSpec spec);

} // namespace cardkit
