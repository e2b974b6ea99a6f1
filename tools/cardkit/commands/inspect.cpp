/**
 * cardkit CLI - inspect command
 *
 * Describe a PNG card or a .charx archive.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cardkit::cli::commands {

namespace {

struct InspectOptions {
    std::string input;
};

int inspect_png(const GlobalOptions& opts, const std::vector<uint8_t>& data) {
    auto chunks = read_chunks(data);
    if (!chunks.ok) {
        print_error(std::string(container_error_name(chunks.error)) + ": " + chunks.message, opts.json);
        return 1;
    }
    if (!chunks.saw_iend) {
        print_warning("PNG has no IEND chunk");
    }

    auto text = read_text_chunks(data);
    auto extracted = extract_card(data);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["format"] = "png";
        j["size"] = data.size();
        nlohmann::json list = nlohmann::json::array();
        for (const auto& c : chunks.chunks) {
            list.push_back({{"type", c.type}, {"length", c.length}, {"offset", c.offset}});
        }
        j["chunks"] = list;
        nlohmann::json keys = nlohmann::json::array();
        for (const auto& entry : text.text) {
            keys.push_back(entry.first);
        }
        j["text_keywords"] = keys;
        if (extracted.card) {
            j["card"] = {{"spec", card_spec_name(extracted.card->spec)},
                         {"name", card_name(extracted.card->data)},
                         {"key", extracted.card->key},
                         {"decoder", extracted.card->decoder}};
        } else {
            j["card"] = nullptr;
        }
        output_json(j);
        return 0;
    }

    std::cout << "PNG, " << data.size() << " bytes, " << chunks.chunks.size() << " chunk(s)" << std::endl;
    for (const auto& c : chunks.chunks) {
        std::cout << "  " << c.type << "  " << c.length << " bytes @ " << c.offset << std::endl;
    }
    if (extracted.card) {
        std::cout << "Card: " << card_name(extracted.card->data) << " ("
                  << card_spec_name(extracted.card->spec) << ", key " << extracted.card->key
                  << ", " << extracted.card->decoder << ")" << std::endl;
    } else {
        std::cout << "Card: none" << std::endl;
    }
    return 0;
}

int inspect_archive(const GlobalOptions& opts, const std::vector<uint8_t>& data) {
    auto inspected = inspect_charx(data);
    if (!inspected.ok) {
        print_error(inspected.error, opts.json);
        return 1;
    }
    for (const auto& uri : inspected.missing_assets) {
        print_warning("missing asset: " + uri);
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["format"] = "charx";
        j["size"] = data.size();
        j["name"] = card_name(inspected.card);
        if (inspected.spec) {
            j["spec"] = card_spec_name(*inspected.spec);
        } else {
            j["spec"] = nullptr;
        }
        j["entries"] = inspected.entries;
        j["assets"] = inspected.asset_paths;
        j["missing_assets"] = inspected.missing_assets;
        j["complete"] = inspected.complete;
        output_json(j);
        return 0;
    }

    std::cout << "CHARX, " << data.size() << " bytes" << std::endl;
    std::cout << "Card: " << card_name(inspected.card) << " ("
              << (inspected.spec ? card_spec_name(*inspected.spec) : "unknown spec") << ")" << std::endl;
    for (const auto& path : inspected.entries) {
        std::cout << "  " << path << std::endl;
    }
    std::cout << (inspected.complete ? "Complete" : "Incomplete: missing assets") << std::endl;
    return 0;
}

int cmd_inspect(const GlobalOptions& opts, const InspectOptions& inspect_opts) {
    auto config = prepare_command(opts);
    if (!config) return 1;

    auto file = read_binary_file(inspect_opts.input);
    if (!file.ok) {
        print_error(file.error, opts.json);
        return 1;
    }

    if (has_png_signature(file.data)) {
        return inspect_png(opts, file.data);
    }
    if (has_zip_signature(file.data)) {
        return inspect_archive(opts, file.data);
    }

    print_error("unrecognized file format: " + inspect_opts.input, opts.json);
    return 1;
}

} // anonymous namespace

void setup_inspect(CLI::App* app, GlobalOptions& opts) {
    static InspectOptions inspect_opts;

    app->add_option("file", inspect_opts.input, "PNG or .charx file")->required();

    app->callback([&opts]() {
        std::exit(cmd_inspect(opts, inspect_opts));
    });
}

} // namespace cardkit::cli::commands
