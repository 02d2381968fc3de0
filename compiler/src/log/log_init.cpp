//! # Log Initialization
//!
//! Produces a LogConfig from command-line arguments and the SPARK_LOG
//! environment variable.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace spark::log {

/// Applies a SPARK_LOG value: a filter spec if it names modules, a level otherwise.
static void apply_env_value(LogConfig& config, const std::string& value) {
    if (value.empty())
        return;

    if (value.find('=') != std::string::npos || value.find(',') != std::string::npos) {
        config.filter_spec = value;
    } else {
        config.level = parse_level(value);
    }
}

LogConfig config_from_env() {
    LogConfig config;
    config.level = LogLevel::Warn;

    if (const char* env_log = std::getenv("SPARK_LOG")) {
        apply_env_value(config, env_log);
    }
    return config;
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    config.level = LogLevel::Warn; // Default: only warnings and above

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = arg.substr(13);
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = arg.substr(11);
        } else if (arg.starts_with("--log-format=")) {
            std::string fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (arg == "--verbose") {
            if (v_count == 0)
                v_count = 1;
        } else if (arg.size() >= 2 && arg[0] == '-' && arg[1] == 'v') {
            // -v, -vv, -vvv
            if (arg.find_first_not_of('v', 1) == std::string::npos) {
                v_count = std::max(v_count, static_cast<int>(arg.size() - 1));
            }
        }
    }

    // -v = Info, -vv = Debug, -vvv = Trace (only without an explicit --log-level)
    if (!has_cli_level && v_count > 0) {
        config.level = v_count >= 3 ? LogLevel::Trace
                       : v_count == 2 ? LogLevel::Debug
                                      : LogLevel::Info;
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        if (const char* env_log = std::getenv("SPARK_LOG")) {
            apply_env_value(config, env_log);
        }
    }

    return config;
}

} // namespace spark::log
