/**
 * cardkit CLI - embed command
 *
 * Write a card into a PNG as a tEXt chunk.
 */

#include "../common.hpp"
#include <CLI/CLI.hpp>

namespace cardkit::cli::commands {

namespace {

struct EmbedOptions {
    std::string png;
    std::string card;
    std::string output;
    std::string spec;     // v2 | v3, detected when empty
};

int cmd_embed(const GlobalOptions& opts, const EmbedOptions& embed_opts) {
    auto config = prepare_command(opts);
    if (!config) return 1;

    auto png = read_binary_file(embed_opts.png);
    if (!png.ok) {
        print_error(png.error, opts.json);
        return 1;
    }

    auto card = read_json_file(embed_opts.card);
    if (!card.ok) {
        print_error(card.error, opts.json);
        return 1;
    }

    std::optional<CardSpec> spec;
    if (!embed_opts.spec.empty()) {
        spec = parse_card_spec(embed_opts.spec);
        if (!spec) {
            print_error("unknown spec '" + embed_opts.spec + "' (expected v2 or v3)", opts.json);
            return 1;
        }
    } else {
        spec = detect_spec(card.value);
        if (!spec) {
            print_error("cannot determine card spec of " + embed_opts.card + " (use --spec)",
                        opts.json);
            return 1;
        }
    }

    auto embedded = embed_card(png.data, card.value, *spec);
    if (!embedded.ok) {
        print_error(std::string(container_error_name(embedded.error)) + ": " + embedded.message,
                    opts.json);
        return 1;
    }

    auto size_check = validate_png_size(embedded.png.size(), config->limits);
    for (const auto& w : size_check.warnings) {
        print_warning(w);
    }
    if (!size_check.valid) {
        print_error("output PNG exceeds the size limit", opts.json);
        return 1;
    }

    auto written = atomic_write_file(embed_opts.output, embedded.png);
    if (!written.ok) {
        print_error("failed to write " + embed_opts.output + ": " + written.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["spec"] = card_spec_name(*spec);
        j["keyword"] = card_keyword(*spec);
        j["name"] = card_name(card.value);
        j["output"] = embed_opts.output;
        j["size"] = embedded.png.size();
        output_json(j);
    } else if (!opts.quiet) {
        std::cout << "Embedded '" << card_name(card.value) << "' as " << card_keyword(*spec)
                  << " into " << embed_opts.output << " (" << embedded.png.size() << " bytes)"
                  << std::endl;
    }
    return 0;
}

} // anonymous namespace

void setup_embed(CLI::App* app, GlobalOptions& opts) {
    static EmbedOptions embed_opts;

    app->add_option("png", embed_opts.png, "Base PNG image")->required();
    app->add_option("card", embed_opts.card, "Card JSON file")->required();
    app->add_option("-o,--output", embed_opts.output, "Output PNG path")->required();
    app->add_option("--spec", embed_opts.spec, "Card spec (v2 or v3), detected by default");

    app->callback([&opts]() {
        std::exit(cmd_embed(opts, embed_opts));
    });
}

} // namespace cardkit::cli::commands
