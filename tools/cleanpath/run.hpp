/**
 * cleanpath CLI - command bodies
 *
 * Everything a subcommand does after option parsing, writing to a caller
 * supplied stream.
 */

#pragma once

#include "common.hpp"

#include <ostream>
#include <string>
#include <vector>

namespace cleanpath::cli {

// Reports to print: all of them, or only those whose path changed.
std::vector<PathReport> select_reports(const std::vector<PathReport>& reports,
                                       bool only_changed);

// Reports for the inputs that are not already canonical.
std::vector<PathReport> find_unclean(const std::vector<std::string>& inputs);

// Normalize inputs and print them. only_changed is combined with the
// config's own flag. Always returns 0.
int run_clean(const Config& config, const std::vector<std::string>& inputs,
              bool only_changed, std::ostream& out);

// Print non-canonical inputs with their canonical form. Returns 1 if any
// input is not canonical, 0 otherwise.
int run_check(const Config& config, const std::vector<std::string>& inputs,
              bool quiet, std::ostream& out);

} // namespace cleanpath::cli
