#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cardkit {

// ============================================================================
// Asset URI schemes
// ============================================================================
//
// "embeded://" is spelled the way the CHARX ecosystem spells it.

enum class UriScheme {
    Embeded,    // embeded://<archive path>
    CcDefault,  // ccdefault:  consumer's built-in default asset
    Https,
    Http,
    Data,       // data:[mediatype][;base64],<data>
    File,       // file://<path>
    Internal,   // bare storage identifier [A-Za-z0-9_-]+
    Unknown,
};

const char* uri_scheme_name(UriScheme scheme);

struct ParsedUri {
    UriScheme scheme = UriScheme::Unknown;
    std::string original_uri;
    std::optional<std::string> path;        // embeded, file, internal
    std::optional<std::string> url;         // http, https
    std::optional<std::string> data;        // data
    std::optional<std::string> mime_type;   // data (defaults to text/plain)
    std::optional<std::string> encoding;    // data ("base64" when flagged)
};

// Total: unrecognized input classifies as Unknown
ParsedUri parse_uri(const std::string& uri);

struct UriSafetyOptions {
    bool allow_http = false;
    bool allow_file = false;
};

// embeded, ccdefault, internal, data and https are always safe; http and file
// need opt-in; unknown never is.
bool is_uri_safe(const std::string& uri, const UriSafetyOptions& options = {});

// ============================================================================
// Conversions
// ============================================================================

// "embeded://assets/{icon|background|emotion|user_icon|other}/{image|audio|video|other}/{index}.{ext}"
std::string internal_to_embed(const std::string& asset_id, const std::string& type,
                              const std::string& ext, int index);

// Last path segment of an embeded:// URI (or of a bare path)
std::string embed_to_internal(const std::string& embed_uri);

// "{base_url}/assets/{asset_id}"
std::string asset_id_to_url(const std::string& asset_id, const std::string& base_url = "");

// "image", "audio", "video" or "other"
std::string media_kind_for_extension(const std::string& ext);

// Lowercase extension taken from the path or URL, else from a data URI's
// mimetype ("bin" when unmapped), else "unknown"
std::string extension_from_uri(const std::string& uri);

// "application/octet-stream" when unmapped
std::string mime_type_from_extension(const std::string& ext);

// Payload bytes of a data: URI (base64 or percent-encoded)
std::optional<std::vector<uint8_t>> decode_data_uri(const ParsedUri& parsed);

} // namespace cardkit
