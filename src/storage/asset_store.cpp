#include "cardkit/asset_store.hpp"
#include "cardkit/path_utils.hpp"
#include "cardkit/platform.hpp"
#include "cardkit/uri.hpp"

#include <algorithm>
#include <cctype>

#include <spdlog/spdlog.h>

namespace cardkit {

namespace {

constexpr const char* STORAGE_PREFIX = "/storage/";

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

std::string get_string_or(const nlohmann::json& j, const char* key, const std::string& fallback) {
    auto it = j.find(key);
    if (it != j.end() && it->is_string()) {
        return it->get<std::string>();
    }
    return fallback;
}

// Lowercase extension of the last path segment of a storage reference
std::string storage_extension(const std::string& storage_url) {
    auto slash = storage_url.find_last_of('/');
    std::string segment = slash == std::string::npos ? storage_url : storage_url.substr(slash + 1);
    auto dot = segment.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == segment.size()) return "";
    std::string ext = segment.substr(dot + 1);
    std::transform(ext.begin(), ext.end(), ext.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return ext;
}

} // namespace

bool is_local_storage_reference(const std::string& storage_url) {
    if (starts_with(storage_url, STORAGE_PREFIX)) {
        return storage_url.size() > std::string(STORAGE_PREFIX).size();
    }
    return parse_uri(storage_url).scheme == UriScheme::Internal;
}

AssetListParseResult parse_asset_list(const nlohmann::json& list) {
    AssetListParseResult result;

    if (!list.is_array()) {
        result.error = "asset list must be a JSON array";
        return result;
    }

    for (size_t i = 0; i < list.size(); ++i) {
        const auto& item = list[i];
        std::string where = "asset[" + std::to_string(i) + "]";
        if (!item.is_object()) {
            result.warnings.push_back(where + ": not an object, skipped");
            continue;
        }

        ResolvedAsset asset;
        asset.type = get_string_or(item, "type", "other");
        asset.name = get_string_or(item, "name", "");
        asset.storage_url = get_string_or(item, "url", "");
        asset.ext = get_string_or(item, "ext", "");

        if (asset.storage_url.empty()) {
            result.warnings.push_back(where + ": missing url, skipped");
            continue;
        }
        if (asset.ext.empty()) {
            asset.ext = is_local_storage_reference(asset.storage_url)
                            ? storage_extension(asset.storage_url)
                            : extension_from_uri(asset.storage_url);
        }
        asset.mimetype = get_string_or(item, "mimetype", mime_type_from_extension(asset.ext));

        if (item.contains("order")) {
            if (item["order"].is_number_integer()) {
                asset.order = item["order"].get<int>();
            } else {
                result.warnings.push_back(where + ": order is not an integer, using 0");
            }
        }

        for (const char* key : {"is_main", "isMain"}) {
            if (item.contains(key) && item[key].is_boolean()) {
                asset.is_main = item[key].get<bool>();
            }
        }

        result.assets.push_back(std::move(asset));
    }

    result.ok = true;
    return result;
}

DirectoryAssetStore::DirectoryAssetStore(std::string root) : root_(std::move(root)) {}

std::optional<std::string> DirectoryAssetStore::file_path_for(const std::string& storage_url) const {
    std::string rel;
    if (starts_with(storage_url, STORAGE_PREFIX)) {
        rel = storage_url.substr(std::string(STORAGE_PREFIX).size());
    } else if (parse_uri(storage_url).scheme == UriScheme::Internal) {
        rel = storage_url;
    } else {
        return std::nullopt;
    }

    auto normalized = normalize_under_root(root_, rel);
    if (!normalized.ok) {
        spdlog::warn("asset store: refusing '{}' ({})", storage_url,
                     path_error_name(normalized.error));
        return std::nullopt;
    }
    return normalized.path;
}

std::optional<std::vector<uint8_t>> DirectoryAssetStore::read(const std::string& storage_url) const {
    auto path = file_path_for(storage_url);
    if (!path) {
        return std::nullopt;
    }

    auto file = read_binary_file(*path);
    if (!file.ok) {
        spdlog::debug("asset store: {}", file.error);
        return std::nullopt;
    }
    return std::move(file.data);
}

size_t resolve_assets(std::vector<ResolvedAsset>& assets, const AssetStore& store) {
    size_t resolved = 0;
    for (auto& asset : assets) {
        if (asset.data || !is_local_storage_reference(asset.storage_url)) {
            continue;
        }
        asset.data = store.read(asset.storage_url);
        if (asset.data) {
            ++resolved;
        } else {
            spdlog::debug("asset store: no file for {} '{}' ({})", asset.type, asset.name,
                          asset.storage_url);
        }
    }
    return resolved;
}

} // namespace cardkit
