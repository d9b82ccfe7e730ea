//! # Log Initialization from CLI
//!
//! Parses logging-related command-line arguments and the REQTREE_LOG
//! environment variable to produce a LogConfig.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <string>

namespace reqtree::log {

namespace {

// Index = number of 'v's, capped at 3
constexpr LogLevel VERBOSITY_LEVELS[] = {LogLevel::Warn, LogLevel::Info, LogLevel::Debug,
                                         LogLevel::Trace};

std::string read_env_log() {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    std::string value;
    if (_dupenv_s(&buf, &len, "REQTREE_LOG") == 0 && buf) {
        value = buf;
        free(buf);
    }
    return value;
#else
    const char* value = std::getenv("REQTREE_LOG");
    return value ? value : "";
#endif
}

bool is_verbosity_flag(std::string_view arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg[1] == '-') {
        return false;
    }
    for (size_t j = 1; j < arg.size(); ++j) {
        if (arg[j] != 'v') {
            return false;
        }
    }
    return true;
}

} // namespace

bool is_log_option(std::string_view arg) {
    return arg.starts_with("--log-level=") || arg.starts_with("--log-filter=") ||
           arg.starts_with("--log-file=") || arg.starts_with("--log-format=") || arg == "-q" ||
           arg == "--quiet" || arg == "--verbose" || is_verbosity_flag(arg);
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    config.level = LogLevel::Warn;

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
        } else if (is_verbosity_flag(arg)) {
            // -v = Info, -vv = Debug, -vvv = Trace
            int count = static_cast<int>(arg.size() - 1);
            if (count > v_count) {
                v_count = count;
            }
        }
    }

    if (!has_cli_level && v_count > 0) {
        config.level = VERBOSITY_LEVELS[std::min(v_count, 3)];
        has_cli_level = true;
    }
    if (has_cli_level || has_cli_filter) {
        return config;
    }

    // "graph=debug" or "graph,loader" is a filter spec, anything else a level
    std::string env = read_env_log();
    if (env.find_first_of("=,") != std::string::npos) {
        config.filter_spec = env;
    } else if (!env.empty()) {
        config.level = parse_level(env);
    }

    return config;
}

} // namespace reqtree::log
