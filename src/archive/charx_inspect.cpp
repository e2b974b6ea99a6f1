#include "cardkit/charx.hpp"
#include "cardkit/uri.hpp"
#include "cardkit/zip.hpp"

#include <spdlog/spdlog.h>

namespace cardkit {

CharxInspectResult inspect_charx(const std::vector<uint8_t>& archive) {
    CharxInspectResult result;

    auto zip = read_zip(archive);
    if (!zip.ok) {
        result.error = "invalid archive: " + zip.error;
        return result;
    }

    for (const auto& entry : zip.entries) {
        result.entries.push_back(entry.path);
        if (entry.path.rfind("assets/", 0) == 0) {
            result.asset_paths.push_back(entry.path);
        }
    }

    const ZipReadEntry* card_entry = zip.find(CHARX_CARD_ENTRY);
    if (!card_entry) {
        result.error = "archive has no card.json";
        return result;
    }

    std::string text(card_entry->data.begin(), card_entry->data.end());
    result.card = nlohmann::json::parse(text, nullptr, false);
    if (result.card.is_discarded() || !result.card.is_object()) {
        result.card = nullptr;
        result.error = "card.json is not a JSON object";
        return result;
    }
    result.spec = detect_spec(result.card);

    const auto& card = result.card;
    if (card.contains("data") && card["data"].is_object() &&
        card["data"].contains("assets") && card["data"]["assets"].is_array()) {
        for (const auto& descriptor : card["data"]["assets"]) {
            if (!descriptor.is_object() || !descriptor.contains("uri") || !descriptor["uri"].is_string()) {
                continue;
            }
            auto parsed = parse_uri(descriptor["uri"].get<std::string>());
            if (parsed.scheme != UriScheme::Embeded) continue;
            if (!parsed.path || !zip.find(*parsed.path)) {
                spdlog::warn("charx: {} is referenced but not in the archive", parsed.original_uri);
                result.missing_assets.push_back(parsed.original_uri);
            }
        }
    }

    result.complete = result.missing_assets.empty();
    result.ok = true;
    return result;
}

} // namespace cardkit
