#include "cardkit/config.hpp"
#include "cardkit/platform.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <initializer_list>

#include <nlohmann/json.hpp>

namespace cardkit {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

// Positive size in megabytes from text, nullopt when unparseable
std::optional<double> parse_megabytes(const std::string& text) {
    std::string value = trim(text);
    if (value.empty()) return std::nullopt;
    char* end = nullptr;
    double mb = std::strtod(value.c_str(), &end);
    if (end != value.c_str() + value.size() || !(mb > 0)) return std::nullopt;
    return mb;
}

void read_megabytes(const nlohmann::json& section, const char* key, double& target,
                    const std::string& where, std::vector<std::string>& warnings) {
    if (!section.contains(key)) return;
    const auto& value = section[key];
    if (value.is_number() && value.get<double>() > 0) {
        target = value.get<double>();
    } else {
        warnings.push_back("invalid_configuration:" + where + "." + key);
    }
}

void read_bool(const nlohmann::json& section, const char* key, bool& target,
               const std::string& where, std::vector<std::string>& warnings) {
    if (!section.contains(key)) return;
    const auto& value = section[key];
    if (value.is_boolean()) {
        target = value.get<bool>();
    } else {
        warnings.push_back("invalid_configuration:" + where + "." + key);
    }
}

void warn_unknown_keys(const nlohmann::json& section, std::initializer_list<const char*> known,
                       const std::string& prefix, std::vector<std::string>& warnings) {
    for (auto it = section.begin(); it != section.end(); ++it) {
        bool found = std::any_of(known.begin(), known.end(),
                                 [&](const char* k) { return it.key() == k; });
        if (!found) {
            warnings.push_back("unknown_key:" + prefix + it.key());
        }
    }
}

} // namespace

std::optional<spdlog::level::level_enum> parse_log_level(const std::string& name) {
    std::string lower = to_lower(trim(name));
    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        warn_unknown_keys(j, {"$schema", "storage_path", "limits", "uri", "log_level"}, "",
                          result.warnings);

        if (j.contains("storage_path")) {
            if (j["storage_path"].is_string() && !j["storage_path"].get<std::string>().empty()) {
                result.config.storage_path = j["storage_path"].get<std::string>();
            } else {
                result.warnings.push_back("invalid_configuration:storage_path");
            }
        }

        // "limits" section
        if (j.contains("limits")) {
            const auto& limits = j["limits"];
            if (limits.is_object()) {
                warn_unknown_keys(limits, {"max_png_size_mb", "warn_png_size_mb"}, "limits.",
                                  result.warnings);
                read_megabytes(limits, "max_png_size_mb", result.config.limits.max_mb, "limits",
                               result.warnings);
                read_megabytes(limits, "warn_png_size_mb", result.config.limits.warn_mb, "limits",
                               result.warnings);
            } else {
                result.warnings.push_back("invalid_configuration:limits");
            }
        }

        // "uri" section
        if (j.contains("uri")) {
            const auto& uri = j["uri"];
            if (uri.is_object()) {
                warn_unknown_keys(uri, {"allow_http", "allow_file"}, "uri.", result.warnings);
                read_bool(uri, "allow_http", result.config.uri.allow_http, "uri", result.warnings);
                read_bool(uri, "allow_file", result.config.uri.allow_file, "uri", result.warnings);
            } else {
                result.warnings.push_back("invalid_configuration:uri");
            }
        }

        if (j.contains("log_level")) {
            std::optional<spdlog::level::level_enum> level;
            if (j["log_level"].is_string()) {
                level = parse_log_level(j["log_level"].get<std::string>());
            }
            if (level) {
                result.config.log_level = *level;
            } else {
                result.warnings.push_back("invalid_configuration:log_level");
            }
        }

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

void apply_env_overrides(Config& config, std::vector<std::string>& warnings) {
    if (auto path = get_env("CARDKIT_STORAGE_PATH")) {
        if (!path->empty()) {
            config.storage_path = *path;
        }
    }

    if (auto max_mb = get_env("CARDKIT_MAX_PNG_SIZE_MB")) {
        if (auto mb = parse_megabytes(*max_mb)) {
            config.limits.max_mb = *mb;
        } else {
            warnings.push_back("invalid_configuration:CARDKIT_MAX_PNG_SIZE_MB");
        }
    }

    if (auto warn_mb = get_env("CARDKIT_WARN_PNG_SIZE_MB")) {
        if (auto mb = parse_megabytes(*warn_mb)) {
            config.limits.warn_mb = *mb;
        } else {
            warnings.push_back("invalid_configuration:CARDKIT_WARN_PNG_SIZE_MB");
        }
    }

    if (auto level_name = get_env("CARDKIT_LOG_LEVEL")) {
        if (auto level = parse_log_level(*level_name)) {
            config.log_level = *level;
        } else {
            warnings.push_back("invalid_configuration:CARDKIT_LOG_LEVEL");
        }
    }
}

ConfigParseResult load_config(const std::optional<std::string>& explicit_path) {
    std::optional<std::string> path = explicit_path;
    if (!path) {
        auto env_path = get_env("CARDKIT_CONFIG");
        if (env_path && !env_path->empty()) {
            path = env_path;
        }
    }

    ConfigParseResult result;
    if (path) {
        auto file = read_binary_file(*path);
        if (!file.ok) {
            result.error = "failed to read config: " + file.error;
            return result;
        }
        result = parse_config(std::string(file.data.begin(), file.data.end()), *path);
        if (!result.ok) {
            result.error = *path + ": " + result.error;
            return result;
        }
    } else {
        result.ok = true;
    }

    apply_env_overrides(result.config, result.warnings);
    return result;
}

} // namespace cardkit
