/**
 * cleanpath CLI - Entry Point
 *
 * Lexical URL path normalizer.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

namespace cleanpath::cli::commands {
    void setup_clean(CLI::App* app, GlobalOptions& opts);
    void setup_check(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace cleanpath::cli;

    CLI::App app{"cleanpath - canonical URL path normalizer"};
    app.set_version_flag("-V,--version", CLEANPATH_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Configuration file (JSON)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    auto* clean_cmd = app.add_subcommand("clean", "Print the canonical form of each path");
    commands::setup_clean(clean_cmd, opts);

    auto* check_cmd = app.add_subcommand("check", "Fail if any path is not canonical");
    commands::setup_check(check_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
