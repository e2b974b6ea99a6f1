#include "cardkit/charx.hpp"
#include "cardkit/encoding.hpp"
#include "cardkit/uri.hpp"
#include "cardkit/zip.hpp"

#include <set>

#include <spdlog/spdlog.h>

namespace cardkit {

namespace {

// First record matching a descriptor by (type, name)
const ResolvedAsset* find_asset(const std::vector<ResolvedAsset>& assets,
                                const std::string& type, const std::string& name) {
    for (const auto& asset : assets) {
        if (asset.type == type && asset.name == name) return &asset;
    }
    return nullptr;
}

bool keeps_original_uri(const std::string& uri) {
    switch (parse_uri(uri).scheme) {
        case UriScheme::Http:
        case UriScheme::Https:
        case UriScheme::CcDefault:
            return true;
        default:
            return false;
    }
}

void rewrite_descriptors(CardDocument& card, const std::vector<ResolvedAsset>& assets,
                         const std::set<const ResolvedAsset*>& bundled) {
    if (!card.is_object() || !card.contains("data") || !card["data"].is_object()) return;
    auto& data = card["data"];
    if (!data.contains("assets") || !data["assets"].is_array()) return;

    for (auto& descriptor : data["assets"]) {
        if (!descriptor.is_object()) continue;
        if (!descriptor.contains("type") || !descriptor["type"].is_string()) continue;
        if (!descriptor.contains("name") || !descriptor["name"].is_string()) continue;

        if (descriptor.contains("uri") && descriptor["uri"].is_string() &&
            keeps_original_uri(descriptor["uri"].get<std::string>())) {
            continue;
        }

        const ResolvedAsset* asset = find_asset(assets, descriptor["type"].get<std::string>(),
                                                descriptor["name"].get<std::string>());
        if (!asset || bundled.count(asset) == 0) continue;

        descriptor["uri"] = "embeded://" + charx_asset_path(*asset);
    }
}

} // namespace

std::string mime_subtype(const std::string& mimetype) {
    auto slash = mimetype.find('/');
    if (slash == std::string::npos || slash + 1 == mimetype.size()) return "bin";
    std::string subtype = mimetype.substr(slash + 1);
    auto params = subtype.find(';');
    if (params != std::string::npos) subtype.erase(params);
    return subtype.empty() ? "bin" : subtype;
}

std::string charx_asset_path(const ResolvedAsset& asset) {
    std::string ext = asset.ext.empty() ? "bin" : asset.ext;
    return "assets/" + asset.type + "/" + mime_subtype(asset.mimetype) + "/" +
           std::to_string(asset.order) + "." + ext;
}

std::string charx_file_name(const CardDocument& card) {
    std::string safe;
    for (char ch : card_name(card)) {
        auto c = static_cast<unsigned char>(ch);
        if (c < 0x20 || c == 0x7F || ch == '/' || ch == '\\' || ch == ':') {
            safe.push_back('_');
        } else {
            safe.push_back(ch);
        }
    }

    size_t start = safe.find_first_not_of(". ");
    size_t end = safe.find_last_not_of(". ");
    safe = start == std::string::npos ? "" : safe.substr(start, end - start + 1);
    if (safe.empty()) {
        safe = "Untitled";
    }
    return safe + ".charx";
}

CharxBuildResult build_charx(const CardDocument& card,
                             const std::vector<ResolvedAsset>& assets,
                             const CharxBuildOptions& options) {
    CharxBuildResult result;

    if (!card.is_object()) {
        result.error = "card document must be a JSON object";
        return result;
    }

    spdlog::debug("charx: building '{}' with {} asset(s)", card_name(card), assets.size());

    // Decide what gets bundled before touching the card so the rewritten
    // URIs only ever point at entries that exist
    std::vector<ZipEntry> entries;
    std::set<const ResolvedAsset*> bundled;
    std::set<std::string> used_paths;
    used_paths.insert(CHARX_CARD_ENTRY);

    auto skip = [&result](const ResolvedAsset& asset, std::string reason) {
        spdlog::warn("charx: skipping {} '{}' ({}): {}", asset.type, asset.name,
                     asset.storage_url, reason);
        result.skipped.push_back({asset.type, asset.name, asset.storage_url, std::move(reason)});
    };

    for (const auto& asset : assets) {
        if (!is_local_storage_reference(asset.storage_url)) {
            skip(asset, "not a local storage reference");
            continue;
        }
        if (!asset.data) {
            skip(asset, "file not found in storage");
            continue;
        }

        std::string path = charx_asset_path(asset);
        std::string problem = validate_archive_path(path);
        if (!problem.empty()) {
            skip(asset, "invalid archive path '" + path + "': " + problem);
            continue;
        }
        if (!used_paths.insert(path).second) {
            skip(asset, "archive path already used: " + path);
            continue;
        }

        bundled.insert(&asset);
        entries.push_back({path, *asset.data});
        result.asset_bytes += asset.data->size();
        spdlog::debug("charx: added {} ({} bytes)", path, asset.data->size());
    }

    CardDocument transformed = card;
    rewrite_descriptors(transformed, assets, bundled);

    std::string card_json = transformed.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
    entries.insert(entries.begin(), ZipEntry{CHARX_CARD_ENTRY,
                                             std::vector<uint8_t>(card_json.begin(), card_json.end())});

    ZipWriteOptions zip_options;
    zip_options.compression_level = options.compression_level;
    auto zip = create_zip(entries, zip_options);
    if (!zip.ok) {
        result.error = "failed to write archive: " + zip.error;
        spdlog::error("charx: {}", result.error);
        return result;
    }

    result.archive_data = std::move(zip.archive_data);
    result.asset_count = bundled.size();
    result.total_size = result.archive_data.size();

    auto hash = compute_sha256(result.archive_data);
    if (!hash.ok) {
        result.error = "failed to hash archive: " + hash.error;
        result.archive_data.clear();
        return result;
    }
    result.archive_sha256 = hash.hex_digest;

    spdlog::debug("charx: build complete, {} bytes, {}/{} asset(s) bundled",
                  result.total_size, result.asset_count, assets.size());
    result.ok = true;
    return result;
}

std::vector<std::string> validate_charx_build(const CardDocument& card,
                                              const std::vector<ResolvedAsset>& assets) {
    std::vector<std::string> problems;

    bool is_v3 = card.is_object() && card.contains("spec") && card["spec"].is_string() &&
                 card["spec"].get<std::string>() == SPEC_V3_TAG;
    if (!is_v3) {
        problems.push_back("Card must be CCv3 format for CHARX export");
    }

    if (assets.empty()) {
        problems.push_back("CHARX files should contain at least one asset");
    }

    size_t main_icons = 0;
    for (const auto& asset : assets) {
        if (asset.type == "icon" && asset.is_main) ++main_icons;
    }
    if (main_icons == 0) {
        problems.push_back("CHARX files should have a main icon asset");
    } else if (main_icons > 1) {
        problems.push_back("CHARX files should have exactly one main icon asset (found " +
                           std::to_string(main_icons) + ")");
    }

    return problems;
}

} // namespace cardkit
