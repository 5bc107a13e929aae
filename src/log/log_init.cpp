//! # Log Initialization from CLI
//!
//! Turns logging-related command-line arguments and the PRISM_LOG
//! environment variable into a LogConfig.

#include "prism/log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace prism::log {

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    config.level = LogLevel::Warn;

    bool has_cli_level = false;
    bool has_cli_filter = false;
    int v_count = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (arg.starts_with("--log-level=")) {
            config.level = parse_level(arg.substr(12));
            has_cli_level = true;
        } else if (arg.starts_with("--log-filter=")) {
            config.filter_spec = std::string(arg.substr(13));
            has_cli_filter = true;
        } else if (arg.starts_with("--log-file=")) {
            config.log_file = std::string(arg.substr(11));
        } else if (arg.starts_with("--log-format=")) {
            auto fmt = arg.substr(13);
            config.format = (fmt == "json" || fmt == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (arg == "--verbose") {
            if (v_count == 0)
                v_count = 1;
        } else if (arg.size() >= 2 && arg[0] == '-' && arg[1] == 'v') {
            // -v, -vv, -vvv
            if (arg.find_first_not_of('v', 1) == std::string_view::npos) {
                v_count = std::max(v_count, static_cast<int>(arg.size() - 1));
            }
        }
    }

    if (!has_cli_level && v_count > 0) {
        if (v_count >= 3) {
            config.level = LogLevel::Trace;
        } else if (v_count == 2) {
            config.level = LogLevel::Debug;
        } else {
            config.level = LogLevel::Info;
        }
        has_cli_level = true;
    }

    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("PRISM_LOG");
        std::string env_str = env_log ? env_log : "";
        if (!env_str.empty()) {
            // "deser=trace,*=warn" and "deser,ser" are filter specs, anything else a level.
            if (env_str.find('=') != std::string::npos || env_str.find(',') != std::string::npos) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

} // namespace prism::log
