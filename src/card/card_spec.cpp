#include "cardkit/card.hpp"

namespace cardkit {

namespace {

bool has_string(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    return it != j.end() && it->is_string();
}

// JavaScript-style truthiness for the fields the heuristics look at
bool is_truthy(const nlohmann::json& j) {
    if (j.is_null()) return false;
    if (j.is_boolean()) return j.get<bool>();
    if (j.is_number()) return j.get<double>() != 0.0;
    if (j.is_string()) return !j.get_ref<const std::string&>().empty();
    return true;
}

bool spec_version_is_v2(const nlohmann::json& doc) {
    auto it = doc.find("spec_version");
    if (it == doc.end()) return false;
    if (it->is_string()) return it->get_ref<const std::string&>() == "2.0";
    if (it->is_number()) return it->get<double>() == 2.0;
    return false;
}

} // namespace

const char* card_spec_name(CardSpec spec) {
    return spec == CardSpec::V3 ? "v3" : "v2";
}

std::optional<CardSpec> parse_card_spec(const std::string& name) {
    if (name == "v3" || name == SPEC_V3_TAG) return CardSpec::V3;
    if (name == "v2" || name == SPEC_V2_TAG) return CardSpec::V2;
    return std::nullopt;
}

std::optional<CardSpec> detect_spec(const CardDocument& doc) {
    if (!doc.is_object()) return std::nullopt;

    if (has_string(doc, "spec")) {
        const auto& spec = doc["spec"].get_ref<const std::string&>();
        // spec_version is not consulted for v3; the tag is authoritative
        if (spec == SPEC_V3_TAG) return CardSpec::V3;
        if (spec == SPEC_V2_TAG) return CardSpec::V2;
    }

    if (spec_version_is_v2(doc)) return CardSpec::V2;

    // Wrapped card with a non-standard spec tag
    auto spec_it = doc.find("spec");
    auto data_it = doc.find("data");
    if (spec_it != doc.end() && is_truthy(*spec_it) &&
        data_it != doc.end() && data_it->is_object()) {
        auto name_it = data_it->find("name");
        if (name_it != data_it->end() && name_it->is_string() &&
            !name_it->get_ref<const std::string&>().empty()) {
            if (spec_it->is_string()) {
                const auto& spec = spec_it->get_ref<const std::string&>();
                if (spec.find("v3") != std::string::npos || spec.find('3') != std::string::npos) {
                    return CardSpec::V3;
                }
                if (spec.find("v2") != std::string::npos || spec.find('2') != std::string::npos) {
                    return CardSpec::V2;
                }
            }
            return CardSpec::V3;
        }
    }

    // Legacy v2: fields at the top level
    auto name_it = doc.find("name");
    if (name_it != doc.end() && name_it->is_string() &&
        !name_it->get_ref<const std::string&>().empty()) {
        if (doc.contains("description") || doc.contains("personality") || doc.contains("scenario")) {
            return CardSpec::V2;
        }
    }

    return std::nullopt;
}

std::string card_name(const CardDocument& doc) {
    if (!doc.is_object()) return "Untitled";

    auto data_it = doc.find("data");
    if (data_it != doc.end() && data_it->is_object() && has_string(*data_it, "name")) {
        const auto& name = (*data_it)["name"].get_ref<const std::string&>();
        if (!name.empty()) return name;
    }
    if (has_string(doc, "name")) {
        const auto& name = doc["name"].get_ref<const std::string&>();
        if (!name.empty()) return name;
    }
    return "Untitled";
}

} // namespace cardkit
