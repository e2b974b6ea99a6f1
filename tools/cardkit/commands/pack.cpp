/**
 * cardkit CLI - pack command
 *
 * Build a .charx archive from a card and its asset records.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cardkit::cli::commands {

namespace {

struct PackOptions {
    std::string card;
    std::string assets;
    std::string output;
    std::string storage;      // overrides config storage_path
    int compression = 6;
};

int cmd_pack(const GlobalOptions& opts, const PackOptions& pack_opts) {
    auto config = prepare_command(opts);
    if (!config) return 1;

    auto card = read_json_file(pack_opts.card);
    if (!card.ok) {
        print_error(card.error, opts.json);
        return 1;
    }
    if (!card.value.is_object()) {
        print_error("card must be a JSON object: " + pack_opts.card, opts.json);
        return 1;
    }

    std::vector<ResolvedAsset> assets;
    if (!pack_opts.assets.empty()) {
        auto list = read_json_file(pack_opts.assets);
        if (!list.ok) {
            print_error(list.error, opts.json);
            return 1;
        }
        auto parsed = parse_asset_list(list.value);
        if (!parsed.ok) {
            print_error(pack_opts.assets + ": " + parsed.error, opts.json);
            return 1;
        }
        for (const auto& w : parsed.warnings) {
            print_warning(pack_opts.assets + ": " + w);
        }
        assets = std::move(parsed.assets);
    }

    std::string storage_root = pack_opts.storage.empty() ? config->storage_path : pack_opts.storage;
    DirectoryAssetStore store(storage_root);
    size_t resolved = resolve_assets(assets, store);
    spdlog::debug("pack: resolved {}/{} asset file(s) under {}", resolved, assets.size(), storage_root);

    for (const auto& problem : validate_charx_build(card.value, assets)) {
        print_warning(problem);
    }

    CharxBuildOptions build_opts;
    build_opts.compression_level = pack_opts.compression;
    auto built = build_charx(card.value, assets, build_opts);
    if (!built.ok) {
        print_error(built.error, opts.json);
        return 1;
    }
    for (const auto& s : built.skipped) {
        print_warning("skipped " + s.type + " '" + s.name + "': " + s.reason);
    }

    std::string output_path = pack_opts.output;
    if (output_path.empty()) {
        output_path = charx_file_name(card.value);
    }

    auto written = atomic_write_file(output_path, built.archive_data);
    if (!written.ok) {
        print_error("failed to write " + output_path + ": " + written.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["output"] = output_path;
        j["asset_count"] = built.asset_count;
        j["asset_total"] = assets.size();
        j["total_size"] = built.total_size;
        j["asset_bytes"] = built.asset_bytes;
        j["sha256"] = built.archive_sha256;
        nlohmann::json skipped = nlohmann::json::array();
        for (const auto& s : built.skipped) {
            skipped.push_back({{"type", s.type}, {"name", s.name}, {"url", s.storage_url},
                               {"reason", s.reason}});
        }
        j["skipped"] = skipped;
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << "Created " << output_path << std::endl;
        std::cout << "  Assets: " << built.asset_count << "/" << assets.size() << std::endl;
        std::cout << "  Size: " << built.total_size << " bytes" << std::endl;
        std::cout << "  SHA-256: " << built.archive_sha256 << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_pack(CLI::App* app, GlobalOptions& opts) {
    static PackOptions pack_opts;

    app->add_option("card", pack_opts.card, "Card JSON file")->required();
    app->add_option("--assets", pack_opts.assets, "JSON array of asset records");
    app->add_option("-o,--output", pack_opts.output, "Output .charx path (default: <card name>.charx)");
    app->add_option("--storage", pack_opts.storage, "Asset storage directory (default: config storage_path)");
    app->add_option("--compression", pack_opts.compression, "zlib level, 0 stores")
        ->check(CLI::Range(0, 9));

    app->callback([&opts]() {
        std::exit(cmd_pack(opts, pack_opts));
    });
}

} // namespace cardkit::cli::commands
