//! # Logging Options
//!
//! Reads the logging flags out of argv. Commands skip the same flags through
//! `is_log_option()`, so a flag may appear before or after the command name.

#include "log/log.hpp"

#include <algorithm>
#include <array>
#include <cstdlib>
#include <optional>
#include <utility>

namespace sigdoc::log {

namespace {

constexpr std::string_view LEVEL_PREFIX = "--log-level=";
constexpr std::string_view FILTER_PREFIX = "--log-filter=";
constexpr std::string_view FILE_PREFIX = "--log-file=";
constexpr std::string_view FORMAT_PREFIX = "--log-format=";

constexpr std::array<std::string_view, 4> VALUE_PREFIXES = {LEVEL_PREFIX, FILTER_PREFIX,
                                                            FILE_PREFIX, FORMAT_PREFIX};

/// The text after `prefix`, if `arg` starts with it.
auto option_value(std::string_view arg, std::string_view prefix) -> std::optional<std::string_view> {
    if (!arg.starts_with(prefix)) {
        return std::nullopt;
    }
    return arg.substr(prefix.size());
}

/// Number of `v`s in `-v`, `-vv`, `-vvv`..., or 0.
auto verbosity(std::string_view arg) -> int {
    if (arg == "--verbose") {
        return 1;
    }
    if (arg.size() < 2 || arg[0] != '-' || arg.find_first_not_of('v', 1) != std::string_view::npos) {
        return 0;
    }
    return static_cast<int>(arg.size() - 1);
}

auto level_for_verbosity(int count) -> LogLevel {
    if (count >= 3) {
        return LogLevel::Trace;
    }
    return count == 2 ? LogLevel::Debug : LogLevel::Info;
}

auto read_env(const char* name) -> std::string {
#ifdef _WIN32
    char* buffer = nullptr;
    size_t length = 0;
    std::string value;
    if (_dupenv_s(&buffer, &length, name) == 0 && buffer != nullptr) {
        value = buffer;
        free(buffer);
    }
    return value;
#else
    const char* value = std::getenv(name);
    return value != nullptr ? std::string(value) : std::string();
#endif
}

} // namespace

bool is_log_option(std::string_view arg) {
    for (auto prefix : VALUE_PREFIXES) {
        if (arg.starts_with(prefix)) {
            return true;
        }
    }
    return arg == "-q" || arg == "--quiet" || verbosity(arg) > 0;
}

LogConfig parse_log_options(int argc, char* argv[]) {
    LogConfig config;
    std::optional<LogLevel> explicit_level;
    int verbose = 0;

    for (int i = 1; i < argc; ++i) {
        std::string_view arg = argv[i];

        if (auto value = option_value(arg, LEVEL_PREFIX)) {
            explicit_level = parse_level(*value);
        } else if (auto value = option_value(arg, FILTER_PREFIX)) {
            config.filter_spec = std::string(*value);
        } else if (auto value = option_value(arg, FILE_PREFIX)) {
            config.log_file = std::string(*value);
        } else if (auto value = option_value(arg, FORMAT_PREFIX)) {
            config.format = (*value == "json" || *value == "JSON") ? LogFormat::JSON : LogFormat::Text;
        } else if (arg == "-q" || arg == "--quiet") {
            explicit_level = LogLevel::Error;
        } else {
            verbose = std::max(verbose, verbosity(arg));
        }
    }

    if (explicit_level) {
        config.level = *explicit_level;
    } else if (verbose > 0) {
        config.level = level_for_verbosity(verbose);
    } else if (config.filter_spec.empty()) {
        // SIGDOC_LOG=debug or SIGDOC_LOG=docstring=trace,*=warn
        auto env = read_env("SIGDOC_LOG");
        if (env.find_first_of("=,") != std::string::npos) {
            config.filter_spec = std::move(env);
        } else if (!env.empty()) {
            config.level = parse_level(env);
        }
    }

    return config;
}

} // namespace sigdoc::log
