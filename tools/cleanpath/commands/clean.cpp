/**
 * cleanpath CLI - clean command
 *
 * Print the canonical form of each path.
 */

#include "../run.hpp"
#include <CLI/CLI.hpp>

namespace cleanpath::cli::commands {

namespace {

struct CleanOptions {
    std::vector<std::string> paths;
    bool only_changed = false;
};

int cmd_clean(const GlobalOptions& opts, const CleanOptions& clean_opts) {
    auto config = prepare_command(opts);
    if (!config) {
        return 1;
    }

    auto inputs = collect_inputs(clean_opts.paths, *config);
    return run_clean(*config, inputs, clean_opts.only_changed, std::cout);
}

} // anonymous namespace

void setup_clean(CLI::App* app, GlobalOptions& opts) {
    static CleanOptions clean_opts;

    app->add_option("paths", clean_opts.paths, "Paths to clean (default: one per stdin line)");
    app->add_flag("--only-changed", clean_opts.only_changed, "Print only paths whose form changed");

    app->callback([&opts]() {
        std::exit(cmd_clean(opts, clean_opts));
    });
}

} // namespace cleanpath::cli::commands
