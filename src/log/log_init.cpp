//! # Log Initialization from CLI
//!
//! Parses logging-related command-line arguments and the JCODEC_LOG
//! environment variable to produce a LogConfig.

#include "log/log.hpp"

#include <cstdlib>
#include <string>

namespace jcodec::log {

namespace {

/// Returns the number of `v` characters if `arg` is `-v`, `-vv`, `-vvv`, ...
int verbosity_flag(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return 0;
    }
    for (size_t j = 1; j < arg.size(); ++j) {
        if (arg[j] != 'v') {
            return 0;
        }
    }
    return static_cast<int>(arg.size() - 1);
}

} // namespace

bool is_log_option(std::string_view arg) {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") ||
           arg.starts_with("--log-pattern=") || arg == "-q" || arg == "--quiet" ||
           arg == "--verbose" || verbosity_flag(arg) > 0;
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
        } else if (arg.starts_with("--log-pattern=")) {
            config.pattern = arg.substr(14);
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            has_cli_level = true;
        } else if (arg == "--verbose") {
            if (v_count == 0)
                v_count = 1;
        } else if (int count = verbosity_flag(arg); count > v_count) {
            v_count = count;
        }
    }

    // Map -v/-vv/-vvv to levels (only if no explicit --log-level)
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

    // JCODEC_LOG environment variable as fallback
    if (!has_cli_level && !has_cli_filter) {
        const char* env_log = std::getenv("JCODEC_LOG");
        std::string env_str = env_log ? env_log : "";
        if (!env_str.empty()) {
            // A filter spec has '=' or lists several modules; otherwise it's a level
            if (env_str.find('=') != std::string::npos || env_str.find(',') != std::string::npos) {
                config.filter_spec = env_str;
            } else {
                config.level = parse_level(env_str);
            }
        }
    }

    return config;
}

} // namespace jcodec::log
