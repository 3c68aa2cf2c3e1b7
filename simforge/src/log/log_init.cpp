//! # Log Options
//!
//! Turns logging flags and the SIMFORGE_LOG environment variable into a
//! LogConfig. Unrelated arguments are left for the command dispatcher.

#include "log/log.hpp"

#include <algorithm>
#include <cstdlib>
#include <optional>
#include <string>

namespace simforge::log {

namespace {

/// Value of `--name=value`, if `arg` has that form.
std::optional<std::string> flag_value(const std::string& arg, std::string_view name) {
    if (arg.size() > name.size() && arg.compare(0, name.size(), name) == 0 &&
        arg[name.size()] == '=') {
        return arg.substr(name.size() + 1);
    }
    return std::nullopt;
}

/// Number of v's in "-v", "-vv", ...; zero for anything else.
int verbosity(const std::string& arg) {
    if (arg.size() < 2 || arg[0] != '-' || arg.find_first_not_of('v', 1) != std::string::npos)
        return 0;
    return static_cast<int>(arg.size() - 1);
}

LogLevel verbosity_level(int count) {
    if (count >= 3)
        return LogLevel::Trace;
    return count == 2 ? LogLevel::Debug : LogLevel::Info;
}

} // namespace

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    std::optional<LogLevel> level;
    int verbose = 0;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (auto level_arg = flag_value(arg, "--log-level")) {
            level = parse_level(*level_arg);
        } else if (auto filter_arg = flag_value(arg, "--log-filter")) {
            config.filter_spec = *filter_arg;
        } else if (auto file_arg = flag_value(arg, "--log-file")) {
            config.log_file = *file_arg;
        } else if (auto format_arg = flag_value(arg, "--log-format")) {
            config.format = (*format_arg == "json" || *format_arg == "JSON") ? LogFormat::JSON
                                                                             : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            level = LogLevel::Error;
        } else if (arg == "--verbose") {
            verbose = std::max(verbose, 1);
        } else {
            verbose = std::max(verbose, verbosity(arg));
        }
    }

    if (!level && verbose > 0) {
        level = verbosity_level(verbose);
    }

    if (level) {
        config.level = *level;
    } else if (config.filter_spec.empty()) {
        const char* env = std::getenv("SIMFORGE_LOG");
        std::string value = env ? env : "";
        if (value.find_first_of("=,") != std::string::npos) {
            config.filter_spec = value;
        } else if (!value.empty()) {
            config.level = parse_level(value);
        }
    }

    return config;
}

} // namespace simforge::log
