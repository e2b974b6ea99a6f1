/**
 * cardkit CLI - uri command
 *
 * Classify asset URIs and report whether they are safe to dereference.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cardkit::cli::commands {

namespace {

struct UriOptions {
    std::vector<std::string> uris;
    bool allow_http = false;
    bool allow_file = false;
};

nlohmann::json describe(const std::string& uri, const UriSafetyOptions& safety) {
    auto parsed = parse_uri(uri);
    nlohmann::json j;
    j["uri"] = uri;
    j["scheme"] = uri_scheme_name(parsed.scheme);
    if (parsed.path) j["path"] = *parsed.path;
    if (parsed.url) j["url"] = *parsed.url;
    if (parsed.mime_type) j["mime_type"] = *parsed.mime_type;
    if (parsed.encoding) j["encoding"] = *parsed.encoding;
    if (parsed.data) {
        auto bytes = decode_data_uri(parsed);
        if (bytes) {
            j["data_bytes"] = bytes->size();
        } else {
            j["data_bytes"] = nullptr;
        }
    }
    j["safe"] = is_uri_safe(uri, safety);
    std::string ext = extension_from_uri(uri);
    j["extension"] = ext;
    j["mimetype"] = mime_type_from_extension(ext);
    return j;
}

int cmd_uri(const GlobalOptions& opts, const UriOptions& uri_opts) {
    auto config = prepare_command(opts);
    if (!config) return 1;

    UriSafetyOptions safety = config->uri;
    safety.allow_http = safety.allow_http || uri_opts.allow_http;
    safety.allow_file = safety.allow_file || uri_opts.allow_file;

    nlohmann::json results = nlohmann::json::array();
    bool all_safe = true;
    for (const auto& uri : uri_opts.uris) {
        auto j = describe(uri, safety);
        all_safe = all_safe && j["safe"].get<bool>();
        results.push_back(std::move(j));
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["all_safe"] = all_safe;
        j["uris"] = results;
        output_json(j);
    } else {
        for (const auto& r : results) {
            std::cout << r["uri"].get<std::string>() << std::endl;
            std::cout << "  scheme: " << r["scheme"].get<std::string>()
                      << (r["safe"].get<bool>() ? " (safe)" : " (unsafe)") << std::endl;
            for (const char* key : {"path", "url", "mime_type", "encoding"}) {
                if (r.contains(key)) {
                    std::cout << "  " << key << ": " << r[key].get<std::string>() << std::endl;
                }
            }
            std::cout << "  extension: " << r["extension"].get<std::string>() << " ("
                      << r["mimetype"].get<std::string>() << ")" << std::endl;
        }
    }
    return all_safe ? 0 : 2;
}

} // anonymous namespace

void setup_uri(CLI::App* app, GlobalOptions& opts) {
    static UriOptions uri_opts;

    app->add_option("uris", uri_opts.uris, "URIs to classify")->required();
    app->add_flag("--allow-http", uri_opts.allow_http, "Treat http:// as safe");
    app->add_flag("--allow-file", uri_opts.allow_file, "Treat file:// as safe");

    app->callback([&opts]() {
        std::exit(cmd_uri(opts, uri_opts));
    });
}

} // namespace cardkit::cli::commands
