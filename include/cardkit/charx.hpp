#pragma once

#include "cardkit/asset_store.hpp"
#include "cardkit/card.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cardkit {

// ============================================================================
// CHARX Archives
// ============================================================================
//
// Layout:
//   card.json                                   pretty-printed card document
//   assets/{type}/{subtype}/{order}.{ext}       one file per bundled asset
// where subtype is the mimetype's subtype segment ("image/png" -> "png").

constexpr const char* CHARX_CARD_ENTRY = "card.json";

// "png" for "image/png"; "bin" when the mimetype has no subtype
std::string mime_subtype(const std::string& mimetype);

// Archive path for an asset, also the target of its embeded:// URI
std::string charx_asset_path(const ResolvedAsset& asset);

// "<card name>.charx" as a single file name in the current directory.
// Separators, ':' and control bytes become '_', leading and trailing dots
// and spaces are dropped, and an empty result falls back to "Untitled".
std::string charx_file_name(const CardDocument& card);

struct SkippedAsset {
    std::string type;
    std::string name;
    std::string storage_url;
    std::string reason;
};

struct CharxBuildOptions {
    int compression_level = 6;
};

struct CharxBuildResult {
    bool ok = false;
    std::string error;
    std::vector<uint8_t> archive_data;
    size_t asset_count = 0;             // Assets bundled
    size_t total_size = 0;              // Archive size in bytes
    size_t asset_bytes = 0;             // Uncompressed bytes of bundled assets
    std::vector<SkippedAsset> skipped;
    std::string archive_sha256;
};

// Package a card and its assets. Assets that cannot be bundled are recorded
// in `skipped`; they never fail the build. Descriptors in data.assets whose
// asset is bundled get their uri rewritten to embeded://; remote and
// ccdefault: URIs are kept. The input card is not modified.
CharxBuildResult build_charx(const CardDocument& card,
                             const std::vector<ResolvedAsset>& assets,
                             const CharxBuildOptions& options = {});

// Advisory pre-export checks; an empty list means no problems
std::vector<std::string> validate_charx_build(const CardDocument& card,
                                              const std::vector<ResolvedAsset>& assets);

// ============================================================================
// Inspection
// ============================================================================

struct CharxInspectResult {
    bool ok = false;
    std::string error;
    CardDocument card;
    std::optional<CardSpec> spec;
    std::vector<std::string> entries;           // Every archive path
    std::vector<std::string> asset_paths;       // Entries under assets/
    std::vector<std::string> missing_assets;    // embeded:// URIs with no entry
    bool complete = false;
};

CharxInspectResult inspect_charx(const std::vector<uint8_t>& archive);

} // namespace cardkit
