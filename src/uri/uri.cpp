#include "cardkit/uri.hpp"
#include "cardkit/encoding.hpp"

#include <algorithm>
#include <cctype>

namespace cardkit {

namespace {

constexpr const char* EMBED_PREFIX = "embeded://";

std::string trim(const std::string& in) {
    size_t start = 0;
    while (start < in.size() && std::isspace(static_cast<unsigned char>(in[start]))) ++start;
    size_t end = in.size();
    while (end > start && std::isspace(static_cast<unsigned char>(in[end - 1]))) --end;
    return in.substr(start, end - start);
}

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.rfind(prefix, 0) == 0;
}

bool is_internal_id(const std::string& s) {
    if (s.empty()) return false;
    return std::all_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '_' || c == '-';
    });
}

// data:[<mediatype>][;base64],<data>
void parse_data_uri(const std::string& uri, ParsedUri& out) {
    std::string body = uri.substr(5);
    auto comma = body.find(',');
    if (comma == std::string::npos) return;

    std::string header = body.substr(0, comma);
    std::string payload = body.substr(comma + 1);
    if (payload.find_first_of("\r\n") != std::string::npos) return;

    auto semi = header.find(';');
    std::string media = header.substr(0, semi);
    std::string params = semi == std::string::npos ? "" : header.substr(semi);
    if (!params.empty() && params != ";base64") return;

    out.mime_type = media.empty() ? "text/plain" : media;
    if (!params.empty()) out.encoding = "base64";
    out.data = payload;
}

struct ExtensionMime {
    const char* ext;
    const char* mime;
};

// First entry for a mimetype is its preferred extension
const ExtensionMime EXTENSION_MIME_TABLE[] = {
    {"png", "image/png"},
    {"jpg", "image/jpeg"},
    {"jpeg", "image/jpeg"},
    {"webp", "image/webp"},
    {"gif", "image/gif"},
    {"avif", "image/avif"},
    {"svg", "image/svg+xml"},
    {"bmp", "image/bmp"},
    {"mp3", "audio/mpeg"},
    {"wav", "audio/wav"},
    {"ogg", "audio/ogg"},
    {"mp4", "video/mp4"},
    {"webm", "video/webm"},
};

const char* const IMAGE_EXTENSIONS[] = {"png", "jpg", "jpeg", "webp", "gif", "avif", "bmp", "svg"};
const char* const AUDIO_EXTENSIONS[] = {"mp3", "wav", "ogg", "flac", "m4a", "aac"};
const char* const VIDEO_EXTENSIONS[] = {"mp4", "webm", "avi", "mov", "mkv"};

template <size_t N>
bool in_list(const char* const (&list)[N], const std::string& value) {
    return std::find(std::begin(list), std::end(list), value) != std::end(list);
}

std::string extension_from_mime(const std::string& mime) {
    for (const auto& entry : EXTENSION_MIME_TABLE) {
        if (mime == entry.mime) return entry.ext;
    }
    return "bin";
}

// Extension of the last path segment, lowercase; empty when there is none
std::string last_segment_extension(const std::string& path) {
    auto slash = path.find_last_of('/');
    std::string segment = slash == std::string::npos ? path : path.substr(slash + 1);
    auto dot = segment.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == segment.size()) return "";
    return to_lower(segment.substr(dot + 1));
}

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

const char* uri_scheme_name(UriScheme scheme) {
    switch (scheme) {
        case UriScheme::Embeded: return "embeded";
        case UriScheme::CcDefault: return "ccdefault";
        case UriScheme::Https: return "https";
        case UriScheme::Http: return "http";
        case UriScheme::Data: return "data";
        case UriScheme::File: return "file";
        case UriScheme::Internal: return "internal";
        case UriScheme::Unknown: return "unknown";
    }
    return "unknown";
}

ParsedUri parse_uri(const std::string& uri) {
    ParsedUri parsed;
    parsed.original_uri = uri;
    std::string trimmed = trim(uri);

    if (starts_with(trimmed, "ccdefault:")) {
        parsed.scheme = UriScheme::CcDefault;
    } else if (starts_with(trimmed, EMBED_PREFIX)) {
        parsed.scheme = UriScheme::Embeded;
        parsed.path = trimmed.substr(std::string(EMBED_PREFIX).size());
    } else if (starts_with(trimmed, "https://")) {
        parsed.scheme = UriScheme::Https;
        parsed.url = trimmed;
    } else if (starts_with(trimmed, "http://")) {
        parsed.scheme = UriScheme::Http;
        parsed.url = trimmed;
    } else if (starts_with(trimmed, "data:")) {
        parsed.scheme = UriScheme::Data;
        parse_data_uri(trimmed, parsed);
    } else if (starts_with(trimmed, "file://")) {
        parsed.scheme = UriScheme::File;
        parsed.path = trimmed.substr(7);
    } else if (is_internal_id(trimmed)) {
        parsed.scheme = UriScheme::Internal;
        parsed.path = trimmed;
    }

    return parsed;
}

bool is_uri_safe(const std::string& uri, const UriSafetyOptions& options) {
    switch (parse_uri(uri).scheme) {
        case UriScheme::Embeded:
        case UriScheme::CcDefault:
        case UriScheme::Internal:
        case UriScheme::Data:
        case UriScheme::Https:
            return true;
        case UriScheme::Http:
            return options.allow_http;
        case UriScheme::File:
            return options.allow_file;
        case UriScheme::Unknown:
            return false;
    }
    return false;
}

std::string media_kind_for_extension(const std::string& ext) {
    std::string lower = to_lower(ext);
    if (in_list(IMAGE_EXTENSIONS, lower)) return "image";
    if (in_list(AUDIO_EXTENSIONS, lower)) return "audio";
    if (in_list(VIDEO_EXTENSIONS, lower)) return "video";
    return "other";
}

std::string internal_to_embed(const std::string& /*asset_id*/, const std::string& type,
                              const std::string& ext, int index) {
    std::string subdir = "other";
    if (type == "icon" || type == "background" || type == "emotion" || type == "user_icon") {
        subdir = type;
    }
    return std::string(EMBED_PREFIX) + "assets/" + subdir + "/" + media_kind_for_extension(ext) +
           "/" + std::to_string(index) + "." + ext;
}

std::string embed_to_internal(const std::string& embed_uri) {
    std::string path = starts_with(embed_uri, EMBED_PREFIX)
                           ? embed_uri.substr(std::string(EMBED_PREFIX).size())
                           : embed_uri;
    auto slash = path.find_last_of('/');
    std::string last = slash == std::string::npos ? path : path.substr(slash + 1);
    return last.empty() ? path : last;
}

std::string asset_id_to_url(const std::string& asset_id, const std::string& base_url) {
    return base_url + "/assets/" + asset_id;
}

std::string extension_from_uri(const std::string& uri) {
    ParsedUri parsed = parse_uri(uri);

    if (parsed.path) {
        std::string ext = last_segment_extension(*parsed.path);
        if (!ext.empty()) return ext;
    }

    if (parsed.url) {
        std::string without_query = parsed.url->substr(0, parsed.url->find_first_of("?#"));
        auto scheme_end = without_query.find("://");
        auto path_start = without_query.find('/', scheme_end == std::string::npos ? 0 : scheme_end + 3);
        if (path_start != std::string::npos) {
            std::string ext = last_segment_extension(without_query.substr(path_start));
            if (!ext.empty()) return ext;
        }
    }

    if (parsed.mime_type) {
        return extension_from_mime(*parsed.mime_type);
    }

    return "unknown";
}

std::string mime_type_from_extension(const std::string& ext) {
    std::string lower = to_lower(ext);
    for (const auto& entry : EXTENSION_MIME_TABLE) {
        if (lower == entry.ext) return entry.mime;
    }
    return "application/octet-stream";
}

std::optional<std::vector<uint8_t>> decode_data_uri(const ParsedUri& parsed) {
    if (parsed.scheme != UriScheme::Data || !parsed.data) {
        return std::nullopt;
    }

    if (parsed.encoding && *parsed.encoding == "base64") {
        return base64_decode(*parsed.data);
    }

    const std::string& in = *parsed.data;
    std::vector<uint8_t> out;
    out.reserve(in.size());
    for (size_t i = 0; i < in.size(); ++i) {
        if (in[i] == '%') {
            if (i + 2 >= in.size()) return std::nullopt;
            int hi = hex_value(in[i + 1]);
            int lo = hex_value(in[i + 2]);
            if (hi < 0 || lo < 0) return std::nullopt;
            out.push_back(static_cast<uint8_t>((hi << 4) | lo));
            i += 2;
        } else {
            out.push_back(static_cast<uint8_t>(in[i]));
        }
    }
    return out;
}

} // namespace cardkit
