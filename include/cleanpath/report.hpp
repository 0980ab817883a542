#pragma once

#include "cleanpath/export.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace cleanpath {

// ============================================================================
// Path Reports
// ============================================================================

// Outcome of normalizing one input.
struct PathReport {
    std::string input;
    std::string output;
    bool changed = false;   // output differs from input
    bool borrowed = false;  // clean_path() returned a view into the input
};

CLEANPATH_API PathReport make_report(std::string_view input);

CLEANPATH_API std::vector<PathReport> make_reports(const std::vector<std::string>& inputs);

// {"input", "output", "changed", "borrowed"}
CLEANPATH_API nlohmann::json report_to_json(const PathReport& report);

// {"ok": true, "count": N, "changed": M, "paths": [...]}
CLEANPATH_API nlohmann::json reports_to_json(const std::vector<PathReport>& reports);

// Number of reports whose path changed.
CLEANPATH_API std::size_t count_changed(const std::vector<PathReport>& reports);

} // namespace cleanpath
