#include "cardkit/card.hpp"

#include <algorithm>
#include <cctype>

namespace cardkit {

namespace {

std::string compact(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

constexpr int DEFAULT_INSERTION_ORDER = 100;

// Lorebook entry fields that only exist in v3
const char* const V3_ENTRY_FIELDS[] = {
    "probability", "depth", "use_regex", "scan_frequency", "role",
    "group", "automation_id", "selective_logic", "selectiveLogic",
};

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

void normalize_position(nlohmann::json& entry) {
    auto it = entry.find("position");
    if (it == entry.end()) return;

    if (it->is_number()) {
        *it = it->get<double>() == 0.0 ? "before_char" : "after_char";
    } else if (it->is_string()) {
        std::string pos = to_lower(it->get<std::string>());
        if (pos.find("before") != std::string::npos || pos == "0") {
            *it = "before_char";
        } else {
            *it = "after_char";
        }
    } else if (it->is_null()) {
        entry.erase(it);
    }
}

size_t normalize_lorebook(nlohmann::json& holder, CardSpec spec) {
    auto book_it = holder.find("character_book");
    if (book_it == holder.end() || !book_it->is_object()) return 0;

    auto entries_it = book_it->find("entries");
    if (entries_it == book_it->end() || !entries_it->is_array()) return 0;

    size_t touched = 0;
    for (auto& entry : *entries_it) {
        if (!entry.is_object()) continue;
        bool changed = false;

        if (!entry.contains("keys") || !entry["keys"].is_array()) {
            entry["keys"] = nlohmann::json::array();
            changed = true;
        }
        if (!entry.contains("content") || !entry["content"].is_string()) {
            entry["content"] = "";
            changed = true;
        }
        if (!entry.contains("enabled") || !entry["enabled"].is_boolean()) {
            entry["enabled"] = true;
            changed = true;
        }
        if (!entry.contains("insertion_order") || !entry["insertion_order"].is_number()) {
            entry["insertion_order"] = DEFAULT_INSERTION_ORDER;
            changed = true;
        }
        if (!entry.contains("extensions") || !entry["extensions"].is_object()) {
            entry["extensions"] = nlohmann::json::object();
            changed = true;
        }

        normalize_position(entry);

        if (spec == CardSpec::V2) {
            auto& extensions = entry["extensions"];
            for (const char* field : V3_ENTRY_FIELDS) {
                auto it = entry.find(field);
                if (it == entry.end()) continue;
                extensions[field] = *it;
                entry.erase(it);
                changed = true;
            }
        }

        if (changed) ++touched;
    }
    return touched;
}

void drop_null_character_book(nlohmann::json& holder) {
    auto it = holder.find("character_book");
    if (it != holder.end() && it->is_null()) {
        holder.erase(it);
    }
}

} // namespace

NormalizeResult normalize_card(const CardDocument& doc, CardSpec spec) {
    NormalizeResult result;
    result.card = doc;
    auto& card = result.card;

    if (!card.is_object()) {
        result.warnings.push_back("card document is not a JSON object");
        return result;
    }

    auto spec_it = card.find("spec");
    if (spec_it != card.end()) {
        const char* want = spec == CardSpec::V3 ? SPEC_V3_TAG : SPEC_V2_TAG;
        if (!spec_it->is_string() || spec_it->get<std::string>() != want) {
            result.warnings.push_back("spec tag " + compact(*spec_it) + " normalized to " + want);
            *spec_it = want;

            auto version_it = card.find("spec_version");
            if (spec == CardSpec::V2) {
                if (version_it == card.end() || version_it->is_null() ||
                    (version_it->is_string() && version_it->get<std::string>().empty())) {
                    card["spec_version"] = "2.0";
                }
            } else {
                std::string version;
                if (version_it != card.end()) {
                    version = version_it->is_string() ? version_it->get<std::string>() : compact(*version_it);
                }
                if (version.empty() || version[0] != '3') {
                    card["spec_version"] = "3.0";
                }
            }
        }
    }

    auto data_it = card.find("data");
    if (data_it != card.end() && data_it->is_object()) {
        drop_null_character_book(*data_it);
        size_t touched = normalize_lorebook(*data_it, spec);
        if (touched > 0) {
            result.warnings.push_back("normalized " + std::to_string(touched) + " lorebook entries");
        }
        return result;
    }

    drop_null_character_book(card);
    size_t touched = normalize_lorebook(card, spec);
    if (touched > 0) {
        result.warnings.push_back("normalized " + std::to_string(touched) + " lorebook entries");
    }

    // Legacy v2 (fields at the top level) is stored wrapped
    if (spec == CardSpec::V2 && card.contains("name") && card["name"].is_string()) {
        CardDocument wrapped = {
            {"spec", SPEC_V2_TAG},
            {"spec_version", "2.0"},
            {"data", std::move(card)},
        };
        result.card = std::move(wrapped);
        result.warnings.push_back("legacy v2 card wrapped in chara_card_v2 envelope");
    }

    return result;
}

} // namespace cardkit
