#include "cleanpath/report.hpp"
#include "cleanpath/clean_path.hpp"

#include <algorithm>

namespace cleanpath {

PathReport make_report(std::string_view input) {
    PathReport report;
    report.input = std::string(input);

    auto cleaned = clean_path(input);
    // the root returned for empty input is not a view into the input
    report.borrowed = cleaned.is_borrowed() && !input.empty();
    report.changed = cleaned.view() != input;
    report.output = std::move(cleaned).str();
    return report;
}

std::vector<PathReport> make_reports(const std::vector<std::string>& inputs) {
    std::vector<PathReport> reports;
    reports.reserve(inputs.size());
    for (const auto& input : inputs) {
        reports.push_back(make_report(input));
    }
    return reports;
}

nlohmann::json report_to_json(const PathReport& report) {
    nlohmann::json j;
    j["input"] = report.input;
    j["output"] = report.output;
    j["changed"] = report.changed;
    j["borrowed"] = report.borrowed;
    return j;
}

std::size_t count_changed(const std::vector<PathReport>& reports) {
    return static_cast<std::size_t>(
        std::count_if(reports.begin(), reports.end(),
                      [](const PathReport& r) { return r.changed; }));
}

nlohmann::json reports_to_json(const std::vector<PathReport>& reports) {
    nlohmann::json paths = nlohmann::json::array();
    for (const auto& r : reports) {
        paths.push_back(report_to_json(r));
    }

    nlohmann::json j;
    j["ok"] = true;
    j["count"] = reports.size();
    j["changed"] = count_changed(reports);
    j["paths"] = std::move(paths);
    return j;
}

} // namespace cleanpath
