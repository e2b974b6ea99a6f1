/**
 * cardkit CLI - Common utilities and types
 */

#pragma once

#include <cardkit/cardkit.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace cardkit::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

/**
 * Output utilities.
 */

// Pretty-printed; strings that are not valid UTF-8 (chunk types, paths and
// card text from untrusted files) get U+FFFD instead of throwing.
inline std::string dump_json(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << dump_json(j) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << dump_json(output) << std::endl;
    } else {
        std::cout << dump_json(j) << std::endl;
    }
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

/**
 * Logging goes to stderr so --json output stays parseable.
 * Priority: -v / -q flags > config log_level.
 */
inline void init_logging(const GlobalOptions& opts, const Config& config) {
    auto logger = spdlog::get("cardkit");
    if (!logger) {
        logger = spdlog::stderr_color_mt("cardkit");
    }
    spdlog::set_default_logger(logger);

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(config.log_level);
    }
}

/**
 * Load configuration and set up logging and warnings for a command.
 * Returns nullopt (after reporting the error) when the config is unusable.
 */
inline std::optional<Config> prepare_command(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);

    std::optional<std::string> explicit_path;
    if (!opts.config.empty()) {
        explicit_path = opts.config;
    }

    auto loaded = load_config(explicit_path);
    if (!loaded.ok) {
        init_logging(opts, Config{});
        print_error(loaded.error, opts.json);
        return std::nullopt;
    }

    init_logging(opts, loaded.config);
    for (const auto& w : loaded.warnings) {
        print_warning("config: " + w);
    }
    return loaded.config;
}

/**
 * Read a JSON document from a file.
 */
struct JsonFileResult {
    bool ok = false;
    std::string error;
    nlohmann::json value;
};

inline JsonFileResult read_json_file(const std::string& path) {
    JsonFileResult result;
    auto file = read_binary_file(path);
    if (!file.ok) {
        result.error = file.error;
        return result;
    }
    result.value = nlohmann::json::parse(file.data.begin(), file.data.end(), nullptr, false);
    if (result.value.is_discarded()) {
        result.error = "invalid JSON: " + path;
        return result;
    }
    result.ok = true;
    return result;
}

inline bool has_png_signature(const std::vector<uint8_t>& data) {
    return data.size() >= PNG_SIGNATURE_SIZE &&
           std::equal(PNG_SIGNATURE.begin(), PNG_SIGNATURE.end(), data.begin());
}

inline bool has_zip_signature(const std::vector<uint8_t>& data) {
    return data.size() >= 4 && data[0] == 'P' && data[1] == 'K' && data[2] == 0x03 && data[3] == 0x04;
}

} // namespace cardkit::cli
