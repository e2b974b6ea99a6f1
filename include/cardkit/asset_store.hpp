#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace cardkit {

// ============================================================================
// Resolved Assets
// ============================================================================

// A card asset record joined with its backing file
struct ResolvedAsset {
    std::string type;           // icon, background, emotion, user_icon, other, ...
    std::string name;
    std::string ext;
    int order = 0;              // position among siblings of the same type
    bool is_main = false;
    std::string mimetype;
    std::string storage_url;    // "/storage/<file>", bare id, or a remote/ccdefault URI
    std::optional<std::vector<uint8_t>> data;
};

// "/storage/<file>" or a bare internal identifier
bool is_local_storage_reference(const std::string& storage_url);

struct AssetListParseResult {
    bool ok = false;
    std::string error;
    std::vector<ResolvedAsset> assets;
    std::vector<std::string> warnings;
};

// Parse a JSON array of asset records:
//   [{"type", "name", "ext", "order", "is_main"|"isMain", "mimetype", "url"}]
// Missing mimetypes are derived from the extension.
AssetListParseResult parse_asset_list(const nlohmann::json& list);

// ============================================================================
// Asset Storage
// ============================================================================

class AssetStore {
public:
    virtual ~AssetStore() = default;

    // Bytes behind a local storage reference, nullopt when unavailable
    virtual std::optional<std::vector<uint8_t>> read(const std::string& storage_url) const = 0;
};

// Serves "/storage/<rel>" and bare ids from files under a root directory
class DirectoryAssetStore : public AssetStore {
public:
    explicit DirectoryAssetStore(std::string root);

    std::optional<std::vector<uint8_t>> read(const std::string& storage_url) const override;

    // Absolute file path for a reference, nullopt when it would escape root
    std::optional<std::string> file_path_for(const std::string& storage_url) const;

    const std::string& root() const { return root_; }

private:
    std::string root_;
};

// Fill ResolvedAsset::data for every local reference the store can serve.
// Returns the number of assets resolved.
size_t resolve_assets(std::vector<ResolvedAsset>& assets, const AssetStore& store);

} // namespace cardkit
