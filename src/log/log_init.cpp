//! # Log Initialization from CLI
//!
//! Turns logging-related command-line arguments and the BORROWCK_LOG
//! environment variable into a LogConfig.

#include "borrowck/log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace borrowck::log {

auto parse_log_options(int argc, const char* const argv[]) -> LogConfig {
    LogConfig config;

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
            v_count = std::max(v_count, 1);
        } else if (arg.size() >= 2 && arg[0] == '-' && arg[1] == 'v') {
            // -v, -vv, -vvv
            if (arg.find_first_not_of('v', 1) == std::string::npos) {
                v_count = std::max(v_count, static_cast<int>(arg.size() - 1));
            }
        }
    }

    if (!has_cli_level && v_count > 0) {
        config.level = v_count >= 3   ? LogLevel::Trace
                       : v_count == 2 ? LogLevel::Debug
                                      : LogLevel::Info;
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("BORROWCK_LOG");
        std::string env_str = env_log ? env_log : "";
        if (!env_str.empty()) {
            // A spec with '=' or ',' is a module filter, anything else a level.
            if (env_str.find('=') != std::string::npos ||
                env_str.find(',') != std::string::npos) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

} // namespace borrowck::log
