/**
 * cardkit CLI - extract command
 *
 * Read the card JSON embedded in a PNG's tEXt chunks.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cardkit::cli::commands {

namespace {

struct ExtractOptions {
    std::string input;
    std::string output;
    bool raw = false;
};

int cmd_extract(const GlobalOptions& opts, const ExtractOptions& extract_opts) {
    auto config = prepare_command(opts);
    if (!config) return 1;

    auto file = read_binary_file(extract_opts.input);
    if (!file.ok) {
        print_error(file.error, opts.json);
        return 1;
    }

    auto size_check = validate_png_size(file.data.size(), config->limits);
    for (const auto& w : size_check.warnings) {
        print_warning(w);
    }
    if (!size_check.valid) {
        print_error("PNG rejected by size limit", opts.json);
        return 1;
    }

    auto extracted = extract_card(file.data);
    if (!extracted.ok) {
        print_error(std::string(container_error_name(extracted.error)) + ": " + extracted.message,
                    opts.json);
        return 1;
    }
    if (!extracted.card) {
        print_error("no card data found in " + extract_opts.input, opts.json);
        return 1;
    }

    CardDocument card = extracted.card->data;
    if (!extract_opts.raw) {
        auto normalized = normalize_card(card, extracted.card->spec);
        for (const auto& w : normalized.warnings) {
            spdlog::info("normalize: {}", w);
        }
        card = std::move(normalized.card);
    }

    if (!extract_opts.output.empty()) {
        auto written = atomic_write_file(extract_opts.output, dump_json(card) + "\n");
        if (!written.ok) {
            print_error("failed to write " + extract_opts.output + ": " + written.error, opts.json);
            return 1;
        }
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["spec"] = card_spec_name(extracted.card->spec);
        j["name"] = card_name(card);
        j["key"] = extracted.card->key;
        j["decoder"] = extracted.card->decoder;
        if (extract_opts.output.empty()) {
            j["card"] = card;
        } else {
            j["output"] = extract_opts.output;
        }
        output_json(j);
    } else if (extract_opts.output.empty()) {
        std::cout << dump_json(card) << std::endl;
    } else if (!opts.quiet) {
        std::cout << "Extracted " << card_spec_name(extracted.card->spec) << " card '"
                  << card_name(card) << "' to " << extract_opts.output << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_extract(CLI::App* app, GlobalOptions& opts) {
    static ExtractOptions extract_opts;

    app->add_option("png", extract_opts.input, "PNG file")->required();
    app->add_option("-o,--output", extract_opts.output, "Write card JSON to this file");
    app->add_flag("--raw", extract_opts.raw, "Skip import normalization");

    app->callback([&opts]() {
        std::exit(cmd_extract(opts, extract_opts));
    });
}

} // namespace cardkit::cli::commands
