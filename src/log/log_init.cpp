//! # Logging Options
//!
//! Turns `smlc`'s logging flags and the SML_LOG environment variable into
//! a LogConfig.

#include "log/log.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>

namespace sml::log {

namespace {

constexpr std::string_view LEVEL_OPT = "--log-level=";
constexpr std::string_view FILTER_OPT = "--log-filter=";
constexpr std::string_view FILE_OPT = "--log-file=";
constexpr std::string_view FORMAT_OPT = "--log-format=";

/// Number of v's in "-v", "-vv", ...; zero for anything else.
auto verbosity(std::string_view arg) -> int {
    if (arg == "--verbose") {
        return 1;
    }
    if (arg.size() < 2 || arg[0] != '-' || arg.find_first_not_of('v', 1) != std::string_view::npos) {
        return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

auto verbosity_level(int count) -> LogLevel {
    constexpr std::array<LogLevel, 3> levels = {LogLevel::Info, LogLevel::Debug, LogLevel::Trace};
    return levels[static_cast<size_t>(std::min(count, 3) - 1)];
}

void apply_environment(LogConfig& config) {
    const char* value = std::getenv("SML_LOG");
    if (value == nullptr || *value == '\0') {
        return;
    }
    std::string_view env(value);
    if (env.find_first_of("=,") != std::string_view::npos) {
        config.filter_spec = env;
    } else {
        config.level = parse_level(env);
    }
}

} // namespace

auto is_log_option(std::string_view arg) -> bool {
    for (auto prefix : {LEVEL_OPT, FILTER_OPT, FILE_OPT, FORMAT_OPT}) {
        if (arg.starts_with(prefix)) {
            return true;
        }
    }
    return arg == "-q" || arg == "--quiet" || verbosity(arg) > 0;
}

auto parse_log_options(int argc, char* argv[]) -> LogConfig {
    LogConfig config{.level = LogLevel::Warn};
    bool explicit_level = false;
    bool explicit_filter = false;
    int verbose = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.starts_with(LEVEL_OPT)) {
            config.level = parse_level(arg.substr(LEVEL_OPT.size()));
            explicit_level = true;
        } else if (arg.starts_with(FILTER_OPT)) {
            config.filter_spec = arg.substr(FILTER_OPT.size());
            explicit_filter = true;
        } else if (arg.starts_with(FILE_OPT)) {
            config.log_file = arg.substr(FILE_OPT.size());
        } else if (arg.starts_with(FORMAT_OPT)) {
            auto name = arg.substr(FORMAT_OPT.size());
            config.format = name == "json" || name == "JSON" ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            config.level = LogLevel::Error;
            explicit_level = true;
        } else {
            verbose = std::max(verbose, verbosity(arg));
        }
    }

    // --log-level and -q beat -v
    if (!explicit_level && verbose > 0) {
        config.level = verbosity_level(verbose);
        explicit_level = true;
    }
    if (!explicit_level && !explicit_filter) {
        apply_environment(config);
    }
    return config;
}

} // namespace sml::log
