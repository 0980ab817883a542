#pragma once

#include "cleanpath/export.hpp"

#include <optional>
#include <string>
#include <vector>

namespace cleanpath {

// ============================================================================
// Tool Configuration
// ============================================================================

inline constexpr const char* kConfigSchema = "cleanpath.config.v1";

enum class LogLevel {
    Trace,
    Debug,
    Info,
    Warn,
    Error,
    Off,
};

enum class OutputFormat {
    Text,
    Json,
};

struct Config {
    LogLevel log_level = LogLevel::Warn;
    OutputFormat output = OutputFormat::Text;
    bool skip_empty_lines = true;  // stdin mode only
    bool only_changed = false;     // "clean" prints changed paths only

    // Source path for diagnostics, empty for built-in defaults
    std::string source_path;
};

CLEANPATH_API Config get_default_config();

CLEANPATH_API std::optional<LogLevel> parse_log_level(const std::string& s);
CLEANPATH_API const char* log_level_to_string(LogLevel level);

CLEANPATH_API std::optional<OutputFormat> parse_output_format(const std::string& s);
CLEANPATH_API const char* output_format_to_string(OutputFormat format);

// ============================================================================
// Config Parsing Result
// ============================================================================

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    Config config;
    std::vector<std::string> warnings;  // "invalid_configuration:<reason>"
};

// Parse a configuration from a JSON string
CLEANPATH_API ConfigParseResult parse_config(const std::string& json_str,
                                             const std::string& source_path = "");

// Read and parse a configuration file
CLEANPATH_API ConfigParseResult load_config(const std::string& path);

} // namespace cleanpath
