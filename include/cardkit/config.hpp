#pragma once

#include "cardkit/png.hpp"
#include "cardkit/uri.hpp"

#include <optional>
#include <string>
#include <vector>

#include <spdlog/common.h>

namespace cardkit {

// ============================================================================
// Configuration
// ============================================================================
//
// {
//   "storage_path": "/var/lib/cards/storage",
//   "limits": { "max_png_size_mb": 4, "warn_png_size_mb": 2 },
//   "uri": { "allow_http": false, "allow_file": false },
//   "log_level": "warn"
// }

struct Config {
    std::string storage_path = ".";
    PngSizeLimits limits;
    UriSafetyOptions uri;
    spdlog::level::level_enum log_level = spdlog::level::warn;

    // Where the config came from ("" for built-in defaults)
    std::string source_path;
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    Config config;
    std::vector<std::string> warnings;
};

// Parse a config document. Unknown keys and values of the wrong type are
// reported as warnings and leave the defaults in place.
ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path = "");

// Apply CARDKIT_STORAGE_PATH, CARDKIT_MAX_PNG_SIZE_MB, CARDKIT_WARN_PNG_SIZE_MB
// and CARDKIT_LOG_LEVEL on top of `config`.
void apply_env_overrides(Config& config, std::vector<std::string>& warnings);

// Resolution order: explicit path, then CARDKIT_CONFIG, then built-in
// defaults. Environment overrides are applied last.
ConfigParseResult load_config(const std::optional<std::string>& explicit_path = std::nullopt);

// "trace", "debug", "info", "warn"/"warning", "error", "critical", "off"
std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name);

} // namespace cardkit
