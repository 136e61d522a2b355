//! # Logger Implementation

#include "log/log.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#ifndef _WIN32
#include <unistd.h>
#endif

namespace sigdoc::log {

namespace {

struct LevelEntry {
    LogLevel level;
    const char* name;
    const char* color;
};

constexpr std::array<LevelEntry, 7> LEVELS = {{
    {LogLevel::Trace, "TRACE", "\033[90m"},
    {LogLevel::Debug, "DEBUG", "\033[36m"},
    {LogLevel::Info, "INFO", "\033[32m"},
    {LogLevel::Warn, "WARN", "\033[33m"},
    {LogLevel::Error, "ERROR", "\033[31m"},
    {LogLevel::Fatal, "FATAL", "\033[1;31m"},
    {LogLevel::Off, "OFF", ""},
}};

constexpr const char* COLOR_RESET = "\033[0m";

auto entry_for(LogLevel level) -> const LevelEntry& {
    return LEVELS[static_cast<size_t>(level)];
}

auto equals_ignore_case(std::string_view a, std::string_view b) -> bool {
    if (a.size() != b.size()) {
        return false;
    }
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::toupper(static_cast<unsigned char>(a[i])) !=
            std::toupper(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

/// stderr is a terminal that understands ANSI escapes and NO_COLOR is unset.
auto stderr_supports_color() -> bool {
#ifdef _WIN32
    return false;
#else
    if (std::getenv("NO_COLOR") != nullptr || isatty(fileno(stderr)) == 0) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
#endif
}

auto wall_clock_time() -> std::string {
    auto now = std::chrono::system_clock::now();
    auto seconds = std::chrono::system_clock::to_time_t(now);
    auto millis =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() %
        1000;

    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif

    std::ostringstream oss;
    oss << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis;
    return oss.str();
}

void write_json_string(std::ostream& out, std::string_view text) {
    out << '"';
    for (char c : text) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            out << c;
        }
    }
    out << '"';
}

/// Text line with the level name optionally wrapped in its color.
auto render_text(const LogRecord& record, bool colored) -> std::string {
    const auto& entry = entry_for(record.level);
    std::ostringstream oss;
    oss << wall_clock_time() << ' ';
    if (colored) {
        oss << entry.color;
    }
    oss << std::left << std::setw(5) << entry.name;
    if (colored) {
        oss << COLOR_RESET;
    }
    oss << " [" << record.module << "] " << record.message;
    return oss.str();
}

} // namespace

const char* level_name(LogLevel level) {
    return entry_for(level).name;
}

LogLevel parse_level(std::string_view name) {
    for (const auto& entry : LEVELS) {
        if (equals_ignore_case(name, entry.name)) {
            return entry.level;
        }
    }
    return LogLevel::Info;
}

int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string format_text(const LogRecord& record) {
    return render_text(record, false);
}

std::string format_json(const LogRecord& record) {
    std::ostringstream oss;
    oss << "{\"ts\":" << record.timestamp_ms << ",\"level\":";
    write_json_string(oss, level_name(record.level));
    oss << ",\"module\":";
    write_json_string(oss, record.module);
    oss << ",\"msg\":";
    write_json_string(oss, record.message);
    oss << '}';
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors, LogFormat format)
    : out_(std::cerr), format_(format), colors_(use_colors && stderr_supports_color()) {}

ConsoleSink::ConsoleSink(std::ostream& out, LogFormat format)
    : out_(out), format_(format), colors_(false) {}

void ConsoleSink::write(const LogRecord& record) {
    out_ << (format_ == LogFormat::JSON ? format_json(record) : render_text(record, colors_))
         << '\n';
}

void ConsoleSink::flush() {
    out_.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? std::ios::app : std::ios::trunc) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << (format_ == LogFormat::JSON ? format_json(record) : format_text(record)) << '\n';
    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    modules_.clear();

    while (!spec.empty()) {
        auto comma = spec.find(',');
        auto item = spec.substr(0, comma);
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);

        if (item.empty()) {
            continue;
        }
        auto eq = item.find('=');
        auto name = item.substr(0, eq);
        auto level =
            eq == std::string_view::npos ? LogLevel::Trace : parse_level(item.substr(eq + 1));
        if (name == "*") {
            default_level_ = level;
        } else {
            modules_.insert_or_assign(std::string(name), level);
        }
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = modules_.find(module);
    return level >= (it != modules_.end() ? it->second : default_level_);
}

LogLevel LogFilter::min_level() const {
    LogLevel lowest = default_level_;
    for (const auto& [name, level] : modules_) {
        if (level < lowest) {
            lowest = level;
        }
    }
    return lowest;
}

// ============================================================================
// Logger
// ============================================================================

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);
    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
    }
    logger.gate_ = logger.filter_.min_level();

    logger.sinks_.clear();
    if (config.console) {
        logger.sinks_.push_back(std::make_unique<ConsoleSink>(config.colors, config.format));
    }
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        if (file->is_open()) {
            file->set_format(config.format);
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file '" << config.log_file << "'\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= gate_ && filter_.should_log(level, module);
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record{level, module, message, file, line, epoch_ms()};

    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_ = LogFilter{};
    filter_.set_default_level(level);
    gate_ = level;
}

LogLevel Logger::level() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return gate_;
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace sigdoc::log
