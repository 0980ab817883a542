/**
 * cleanpath CLI - Common utilities and types
 */

#pragma once

#include <cleanpath/clean_path.hpp>
#include <cleanpath/config.hpp>
#include <cleanpath/report.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <cstdlib>
#include <iostream>
#include <istream>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace cleanpath::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Resolve the configuration file.
 * Priority: --config flag > CLEANPATH_CONFIG env > none (built-in defaults)
 */
inline std::optional<std::string> resolve_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return override_path;
    }

    const char* env_path = std::getenv("CLEANPATH_CONFIG");
    if (env_path != nullptr && *env_path != '\0') {
        return std::string(env_path);
    }

    return std::nullopt;
}

/**
 * Warnings are logged immediately in text mode and attached to the JSON
 * document in JSON mode.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else {
            spdlog::warn("{}", msg);
        }
    }
};

inline WarningCollector& get_warning_collector() {
    static thread_local WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode) {
    auto& collector = get_warning_collector();
    collector.warnings.clear();
    collector.json_mode = json_mode;
}

// Paths are opaque bytes; invalid UTF-8 is replaced rather than thrown on.
inline std::string dump_json(const nlohmann::json& j) {
    return j.dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
}

inline void output_json(nlohmann::json j, std::ostream& out = std::cout) {
    const auto& warnings = get_warning_collector().warnings;
    if (!warnings.empty() && !j.contains("warnings")) {
        j["warnings"] = warnings;
    }
    out << dump_json(j) << std::endl;
}

inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        output_json(std::move(j));
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

/**
 * Logging goes to stderr so stdout only carries results.
 */
inline void init_logging() {
    static bool initialized = false;
    if (!initialized) {
        auto logger = spdlog::stderr_color_mt("cleanpath");
        logger->set_pattern("%^%l%$: %v");
        spdlog::set_default_logger(logger);
        initialized = true;
    }
}

inline spdlog::level::level_enum to_spdlog_level(LogLevel level) {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info: return spdlog::level::info;
        case LogLevel::Warn: return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Off: return spdlog::level::off;
    }
    return spdlog::level::warn;
}

inline void apply_log_level(const Config& config, const GlobalOptions& opts) {
    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::err);
    } else {
        spdlog::set_level(to_spdlog_level(config.log_level));
    }
}

/**
 * Load the effective configuration and set up logging and warnings.
 * Returns nullopt (after reporting the error) if a named config file
 * cannot be used.
 */
inline std::optional<Config> prepare_command(const GlobalOptions& opts) {
    init_logging();

    Config config = get_default_config();
    std::vector<std::string> config_warnings;

    if (auto path = resolve_config_path(opts.config)) {
        auto result = load_config(*path);
        if (!result.ok) {
            init_warning_collector(opts.json);
            print_error(result.error, opts.json);
            return std::nullopt;
        }
        config = result.config;
        config_warnings = std::move(result.warnings);
    }

    if (opts.json) {
        config.output = OutputFormat::Json;
    }

    apply_log_level(config, opts);
    init_warning_collector(config.output == OutputFormat::Json);
    for (const auto& w : config_warnings) {
        get_warning_collector().add(w);
    }

    if (config.source_path.empty()) {
        spdlog::debug("Using built-in configuration");
    } else {
        spdlog::debug("Loaded configuration from {}", config.source_path);
    }
    return config;
}

/**
 * Gather the paths to process: command-line arguments, or one per line of
 * in when none were given.
 */
inline std::vector<std::string> collect_inputs(const std::vector<std::string>& args,
                                               const Config& config,
                                               std::istream& in = std::cin) {
    if (!args.empty()) {
        return args;
    }

    spdlog::debug("Reading paths from input stream");
    std::vector<std::string> inputs;
    std::string line;
    while (std::getline(in, line)) {
        if (line.empty() && config.skip_empty_lines) {
            continue;
        }
        inputs.push_back(line);
    }
    return inputs;
}

} // namespace cleanpath::cli
