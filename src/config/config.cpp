#include "cleanpath/config.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <sstream>

#include <nlohmann/json.hpp>

namespace cleanpath {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Reads an optional boolean; a value of the wrong type is reported and
// leaves the default in place.
void read_bool(const nlohmann::json& j, const std::string& key, bool& out,
               std::vector<std::string>& warnings) {
    if (!j.contains(key)) {
        return;
    }
    if (j[key].is_boolean()) {
        out = j[key].get<bool>();
    } else {
        warnings.push_back("invalid_configuration:invalid_" + key);
    }
}

const char* const kKnownKeys[] = {
    "$schema",
    "log_level",
    "output",
    "skip_empty_lines",
    "only_changed",
};

bool is_known_key(const std::string& key) {
    return std::find(std::begin(kKnownKeys), std::end(kKnownKeys), key) != std::end(kKnownKeys);
}

} // namespace

Config get_default_config() {
    return Config{};
}

std::optional<LogLevel> parse_log_level(const std::string& s) {
    std::string lower = to_lower(trim(s));
    if (lower == "trace") return LogLevel::Trace;
    if (lower == "debug") return LogLevel::Debug;
    if (lower == "info") return LogLevel::Info;
    if (lower == "warn" || lower == "warning") return LogLevel::Warn;
    if (lower == "error") return LogLevel::Error;
    if (lower == "off") return LogLevel::Off;
    return std::nullopt;
}

const char* log_level_to_string(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return "trace";
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        case LogLevel::Off: return "off";
    }
    return "warn";
}

std::optional<OutputFormat> parse_output_format(const std::string& s) {
    std::string lower = to_lower(trim(s));
    if (lower == "text") return OutputFormat::Text;
    if (lower == "json") return OutputFormat::Json;
    return std::nullopt;
}

const char* output_format_to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::Text: return "text";
        case OutputFormat::Json: return "json";
    }
    return "text";
}

ConfigParseResult parse_config(const std::string& json_str, const std::string& source_path) {
    ConfigParseResult result;
    result.config.source_path = source_path;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "JSON must be an object";
            return result;
        }

        // $schema is optional, but must match when given
        if (j.contains("$schema")) {
            auto schema = get_string(j, "$schema");
            if (!schema || trim(*schema) != kConfigSchema) {
                result.error = std::string("$schema mismatch: expected ") + kConfigSchema;
                return result;
            }
        }

        if (auto level = get_string(j, "log_level")) {
            if (auto parsed = parse_log_level(*level)) {
                result.config.log_level = *parsed;
            } else {
                result.warnings.push_back("invalid_configuration:invalid_log_level");
            }
        } else if (j.contains("log_level")) {
            result.warnings.push_back("invalid_configuration:invalid_log_level");
        }

        if (auto output = get_string(j, "output")) {
            if (auto parsed = parse_output_format(*output)) {
                result.config.output = *parsed;
            } else {
                result.warnings.push_back("invalid_configuration:invalid_output");
            }
        } else if (j.contains("output")) {
            result.warnings.push_back("invalid_configuration:invalid_output");
        }

        read_bool(j, "skip_empty_lines", result.config.skip_empty_lines, result.warnings);
        read_bool(j, "only_changed", result.config.only_changed, result.warnings);

        for (const auto& item : j.items()) {
            if (!is_known_key(item.key())) {
                result.warnings.push_back("invalid_configuration:unknown_key:" + item.key());
            }
        }

        result.ok = true;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON parse error: ") + e.what();
    }

    return result;
}

ConfigParseResult load_config(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        ConfigParseResult result;
        result.config.source_path = path;
        result.error = "cannot open config file: " + path;
        return result;
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_config(ss.str(), path);
}

} // namespace cleanpath
