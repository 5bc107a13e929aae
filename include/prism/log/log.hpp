//! # prism Logging
//!
//! Structured, module-tagged logging used by the codec and the tools:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Per-module filtering ("deser=trace,*=warn")
//! - Console, file and null sinks, text or JSON-lines records
//! - Compile-time level elision via PRISM_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! PRISM_LOG_DEBUG("deser", "resolved variant " << name << " by tag");
//! PRISM_LOG_WARN("app", "line " << n << " skipped");
//! ```
//!
//! Module tags in use: `tokenizer`, `deser`, `ser`, `app`.

#ifndef PRISM_LOG_HPP
#define PRISM_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace prism::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Per-token and per-field tracing
    Debug = 1, ///< Document-level progress
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Recoverable oddities in the input
    Error = 4, ///< Failed operations
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name for a log level (e.g., "TRACE").
inline const char* level_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TRACE";
    case LogLevel::Debug:
        return "DEBUG";
    case LogLevel::Info:
        return "INFO";
    case LogLevel::Warn:
        return "WARN";
    case LogLevel::Error:
        return "ERROR";
    case LogLevel::Fatal:
        return "FATAL";
    case LogLevel::Off:
        return "OFF";
    }
    return "???";
}

/// Parses a log level name (lower or upper case).
/// Returns LogLevel::Info if the string is not recognized.
LogLevel parse_level(std::string_view s);

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "deser")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log records.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

/// Renders a record as a single line, newline included.
///
/// JSON records look like
/// `{"ts":1700000000000,"level":"WARN","module":"deser","msg":"..."}`.
std::string format_record(const LogRecord& record, LogFormat format);

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr, colored when stderr is a color-capable terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends records to a file. Flushes on Error and Fatal.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

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

/// Discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses specs like "deser=trace,tokenizer=off,*=warn". A bare module
/// name enables Trace for that module.
class LogFilter {
public:
    LogFilter() = default;

    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module, or the default.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger Configuration
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Info;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Starts with a single console sink at Warn. `Logger::init()` replaces the
/// sinks and levels.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Time Helpers
// ============================================================================

/// Current local time as "HH:MM:SS.mmm".
std::string get_timestamp();

/// Milliseconds since epoch.
int64_t epoch_ms();

// ============================================================================
// CLI Parsing
// ============================================================================

/// Parses logging options from argv.
///
/// Recognizes --log-level=, --log-filter=, --log-file=, --log-format=,
/// -v/-vv/-vvv and -q. Falls back to the PRISM_LOG environment variable
/// when neither a level nor a filter was given.
LogConfig parse_log_options(int argc, char* argv[]);

// ============================================================================
// Logging Macros
// ============================================================================

// 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef PRISM_MIN_LOG_LEVEL
#define PRISM_MIN_LOG_LEVEL 0
#endif

#define PRISM_LOG_IMPL(level, module_str, msg)                                                     \
    do {                                                                                           \
        if (static_cast<int>(level) >= PRISM_MIN_LOG_LEVEL) {                                      \
            auto& logger_ = ::prism::log::Logger::instance();                                      \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define PRISM_LOG_TRACE(module, msg) PRISM_LOG_IMPL(::prism::log::LogLevel::Trace, module, msg)
#define PRISM_LOG_DEBUG(module, msg) PRISM_LOG_IMPL(::prism::log::LogLevel::Debug, module, msg)
#define PRISM_LOG_INFO(module, msg) PRISM_LOG_IMPL(::prism::log::LogLevel::Info, module, msg)
#define PRISM_LOG_WARN(module, msg) PRISM_LOG_IMPL(::prism::log::LogLevel::Warn, module, msg)
#define PRISM_LOG_ERROR(module, msg) PRISM_LOG_IMPL(::prism::log::LogLevel::Error, module, msg)
#define PRISM_LOG_FATAL(module, msg) PRISM_LOG_IMPL(::prism::log::LogLevel::Fatal, module, msg)

} // namespace prism::log

#endif // PRISM_LOG_HPP
