#include "run.hpp"

namespace cleanpath::cli {

std::vector<PathReport> select_reports(const std::vector<PathReport>& reports,
                                       bool only_changed) {
    if (!only_changed) {
        return reports;
    }

    std::vector<PathReport> selected;
    for (const auto& r : reports) {
        if (r.changed) selected.push_back(r);
    }
    return selected;
}

std::vector<PathReport> find_unclean(const std::vector<std::string>& inputs) {
    std::vector<PathReport> unclean;
    for (const auto& input : inputs) {
        if (is_clean(input)) {
            spdlog::trace("clean: {}", input);
            continue;
        }
        unclean.push_back(make_report(input));
    }
    return unclean;
}

int run_clean(const Config& config, const std::vector<std::string>& inputs,
              bool only_changed, std::ostream& out) {
    auto reports = make_reports(inputs);
    spdlog::debug("Cleaned {} path(s), {} changed", reports.size(), count_changed(reports));

    auto selected = select_reports(reports, only_changed || config.only_changed);

    if (config.output == OutputFormat::Json) {
        auto j = reports_to_json(selected);
        // "count" is always the number of inputs, "paths" may be filtered
        j["count"] = reports.size();
        j["changed"] = count_changed(reports);
        output_json(std::move(j), out);
        return 0;
    }

    for (const auto& r : selected) {
        spdlog::trace("{} -> {}", r.input, r.output);
        out << r.output << "\n";
    }
    out.flush();
    return 0;
}

int run_check(const Config& config, const std::vector<std::string>& inputs,
              bool quiet, std::ostream& out) {
    auto unclean = find_unclean(inputs);

    if (config.output == OutputFormat::Json) {
        nlohmann::json j;
        j["ok"] = unclean.empty();
        j["count"] = inputs.size();
        j["unclean"] = nlohmann::json::array();
        for (const auto& r : unclean) {
            j["unclean"].push_back(report_to_json(r));
        }
        output_json(std::move(j), out);
    } else if (!quiet) {
        for (const auto& r : unclean) {
            out << r.input << " -> " << r.output << "\n";
        }
        out.flush();
    }

    if (!unclean.empty()) {
        spdlog::info("{} of {} path(s) not canonical", unclean.size(), inputs.size());
        return 1;
    }
    return 0;
}

} // namespace cleanpath::cli
