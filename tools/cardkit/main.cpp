/**
 * cardkit CLI - Entry Point
 *
 * Character card container tool: PNG card import/export and CHARX packaging.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace cardkit::cli::commands {
    void setup_extract(CLI::App* app, GlobalOptions& opts);
    void setup_embed(CLI::App* app, GlobalOptions& opts);
    void setup_pack(CLI::App* app, GlobalOptions& opts);
    void setup_inspect(CLI::App* app, GlobalOptions& opts);
    void setup_uri(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace cardkit::cli;

    CLI::App app{"cardkit - character card container tool"};
    app.set_version_flag("-V,--version", CARDKIT_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Config file (default: $CARDKIT_CONFIG)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Commands
    auto* extract_cmd = app.add_subcommand("extract", "Read the card embedded in a PNG");
    commands::setup_extract(extract_cmd, opts);

    auto* embed_cmd = app.add_subcommand("embed", "Write a card into a PNG");
    commands::setup_embed(embed_cmd, opts);

    auto* pack_cmd = app.add_subcommand("pack", "Build a .charx archive");
    commands::setup_pack(pack_cmd, opts);

    auto* inspect_cmd = app.add_subcommand("inspect", "Describe a PNG card or .charx archive");
    commands::setup_inspect(inspect_cmd, opts);

    auto* uri_cmd = app.add_subcommand("uri", "Classify asset URIs");
    commands::setup_uri(uri_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
