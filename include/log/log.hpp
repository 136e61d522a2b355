//! # sigdoc Logging
//!
//! Diagnostics for the library and the `sigdoc` command. Library code never
//! writes to stdout; everything it has to say about fallbacks and rejected
//! input goes through this logger, tagged with the component that said it:
//!
//! | Module       | Emitted by                                   |
//! |--------------|----------------------------------------------|
//! | `annotation` | normalizer fallback to pattern cleanup       |
//! | `docstring`  | style attempts and manual extraction         |
//! | `cli`        | command dispatch and option warnings         |
//!
//! Until `Logger::init()` runs the logger has no sinks, so embedding the
//! library produces no output.
//!
//! ```cpp
//! SIGDOC_LOG_DEBUG("annotation", "parse failed at " << err.offset);
//! ```

#ifndef SIGDOC_LOG_HPP
#define SIGDOC_LOG_HPP

#include <cstdint>
#include <fstream>
#include <functional>
#include <iosfwd>
#include <map>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace sigdoc::log {

/// Severity, lowest first. `Off` only appears as a threshold.
enum class LogLevel : int { Trace, Debug, Info, Warn, Error, Fatal, Off };

/// Upper-case name of a level ("TRACE" .. "OFF").
const char* level_name(LogLevel level);

/// Parses a level name in any case. Unknown names give `LogLevel::Info`.
LogLevel parse_level(std::string_view name);

/// One message on its way to the sinks.
struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Milliseconds since the Unix epoch.
};

enum class LogFormat { Text, JSON };

/// `HH:MM:SS.mmm LEVEL [module] message`, without newline or colors.
std::string format_text(const LogRecord& record);

/// `{"ts":..,"level":..,"module":..,"msg":..}` on one line.
std::string format_json(const LogRecord& record);

/// Milliseconds since the Unix epoch.
int64_t epoch_ms();

// ============================================================================
// Sinks
// ============================================================================

/// Destination for records. Sinks are only called with the logger lock held.
class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to a stream, stderr unless told otherwise. Level names are colored
/// when `use_colors` is set and stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors, LogFormat format = LogFormat::Text);
    ConsoleSink(std::ostream& out, LogFormat format);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    std::ostream& out_;
    LogFormat format_;
    bool colors_;
};

/// Writes to a file, flushing after every Error or Fatal record.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }
    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

// ============================================================================
// Filtering
// ============================================================================

/// Per-module thresholds, written as `docstring=debug,cli=off,*=warn`.
///
/// A bare module name means `module=trace`; `*` sets the threshold for
/// every module not listed.
class LogFilter {
public:
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }
    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest threshold that any module can pass.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::map<std::string, LogLevel, std::less<>> modules_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Empty means no per-module overrides.
    std::string log_file;    ///< Empty means no file sink.
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. All members are safe to call from any thread.
class Logger {
public:
    /// Replaces the sinks and thresholds according to `config`.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Checked by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    /// Sets the threshold for every module and drops per-module overrides.
    void set_level(LogLevel level);
    LogLevel level() const;

    void flush();

private:
    Logger() = default;

    LogLevel gate_ = LogLevel::Warn; ///< Nothing below this reaches the filter.
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command-line options
// ============================================================================

/// Builds a config from `--log-level=`, `--log-filter=`, `--log-file=`,
/// `--log-format=`, `-v`/`-vv`/`-vvv`/`--verbose` and `-q`/`--quiet`.
/// When none of the level or filter options is given, `SIGDOC_LOG` is read
/// instead; it holds either a level name or a filter string.
LogConfig parse_log_options(int argc, char* argv[]);

/// True for any argument that `parse_log_options()` consumes.
bool is_log_option(std::string_view arg);

// ============================================================================
// Macros
// ============================================================================

// Levels below this are compiled out (0 = Trace .. 6 = Off).
#ifndef SIGDOC_MIN_LOG_LEVEL
#define SIGDOC_MIN_LOG_LEVEL 0
#endif

#define SIGDOC_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= SIGDOC_MIN_LOG_LEVEL) {                                     \
            auto& sigdoc_logger_ = ::sigdoc::log::Logger::instance();                              \
            if (sigdoc_logger_.should_log(level, module_str)) {                                    \
                std::ostringstream sigdoc_msg_;                                                    \
                sigdoc_msg_ << msg;                                                                \
                sigdoc_logger_.log(level, module_str, sigdoc_msg_.str(), __FILE__, __LINE__);      \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define SIGDOC_LOG_TRACE(module, msg) SIGDOC_LOG_IMPL(::sigdoc::log::LogLevel::Trace, module, msg)
#define SIGDOC_LOG_DEBUG(module, msg) SIGDOC_LOG_IMPL(::sigdoc::log::LogLevel::Debug, module, msg)
#define SIGDOC_LOG_INFO(module, msg) SIGDOC_LOG_IMPL(::sigdoc::log::LogLevel::Info, module, msg)
#define SIGDOC_LOG_WARN(module, msg) SIGDOC_LOG_IMPL(::sigdoc::log::LogLevel::Warn, module, msg)
#define SIGDOC_LOG_ERROR(module, msg) SIGDOC_LOG_IMPL(::sigdoc::log::LogLevel::Error, module, msg)
#define SIGDOC_LOG_FATAL(module, msg) SIGDOC_LOG_IMPL(::sigdoc::log::LogLevel::Fatal, module, msg)

} // namespace sigdoc::log

#endif // SIGDOC_LOG_HPP
