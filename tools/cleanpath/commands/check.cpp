/**
 * cleanpath CLI - check command
 *
 * Exit non-zero if any path is not already canonical.
 */

#include "../run.hpp"
#include <CLI/CLI.hpp>

namespace cleanpath::cli::commands {

namespace {

struct CheckOptions {
    std::vector<std::string> paths;
};

int cmd_check(const GlobalOptions& opts, const CheckOptions& check_opts) {
    auto config = prepare_command(opts);
    if (!config) {
        return 1;
    }

    auto inputs = collect_inputs(check_opts.paths, *config);
    return run_check(*config, inputs, opts.quiet, std::cout);
}

} // anonymous namespace

void setup_check(CLI::App* app, GlobalOptions& opts) {
    static CheckOptions check_opts;

    app->add_option("paths", check_opts.paths, "Paths to check (default: one per stdin line)");

    app->callback([&opts]() {
        std::exit(cmd_check(opts, check_opts));
    });
}

} // namespace cleanpath::cli::commands
