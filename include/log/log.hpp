//! # jcodec Logging
//!
//! A structured logging library for jcodec with:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Multiple output sinks (Console, File, Null, Multi)
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via JCODEC_MIN_LOG_LEVEL
//! - ANSI colored console output with terminal detection
//!
//! The library itself only logs at Debug and Trace, under the modules
//! `"json"`, `"cursor"` and `"derive"`. The command-line tool logs under
//! `"cli"`.
//!
//! ## Usage
//!
//! ```cpp
//! JCODEC_LOG_INFO("cli", "Formatting " << path);
//! JCODEC_LOG_DEBUG("derive", "Built product codec with " << n << " fields");
//! JCODEC_LOG_TRACE("cursor", "delete at " << cursor.to_string() << " is a no-op");
//! ```

#ifndef JCODEC_LOG_HPP
#define JCODEC_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace jcodec::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
/// Setting a minimum level filters out all messages below that threshold.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the string name for a log level (e.g., "TRACE", "DEBUG").
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

/// Returns the short-form name for a log level (2 chars: TR, DB, IN, WN, ER, FA).
inline const char* level_short_name(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "TR";
    case LogLevel::Debug:
        return "DB";
    case LogLevel::Info:
        return "IN";
    case LogLevel::Warn:
        return "WN";
    case LogLevel::Error:
        return "ER";
    case LogLevel::Fatal:
        return "FA";
    case LogLevel::Off:
        return "--";
    }
    return "??";
}

/// Parses a log level from a string (lower or upper case).
/// Returns LogLevel::Info if the string is not recognized.
inline LogLevel parse_level(std::string_view s) {
    if (s == "trace" || s == "TRACE")
        return LogLevel::Trace;
    if (s == "debug" || s == "DEBUG")
        return LogLevel::Debug;
    if (s == "info" || s == "INFO")
        return LogLevel::Info;
    if (s == "warn" || s == "WARN")
        return LogLevel::Warn;
    if (s == "error" || s == "ERROR")
        return LogLevel::Error;
    if (s == "fatal" || s == "FATAL")
        return LogLevel::Fatal;
    if (s == "off" || s == "OFF")
        return LogLevel::Off;
    return LogLevel::Info;
}

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;          ///< Severity level
    std::string_view module; ///< Module tag (e.g., "json", "cli")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

// ============================================================================
// Log Formatter
// ============================================================================

/// Format template engine for text log lines.
///
/// Supports tokens: {time}, {time_ms}, {level}, {level_short}, {module},
/// {message}, {file}, {line}, {thread}. Unknown tokens are copied through.
///
/// Default format: "{time} {level_short} [{module}] {message}"
class LogFormatter {
public:
    /// Create a formatter with the given template string.
    explicit LogFormatter(
        std::string_view format_template = "{time} {level_short} [{module}] {message}");

    /// Format a log record according to the template.
    std::string format(const LogRecord& record) const;

    /// Set a new format template.
    void set_template(std::string_view format_template);

    /// Get the current format template.
    const std::string& get_template() const {
        return template_;
    }

private:
    std::string template_;
};

/// Renders a record as one JSON object (no trailing newline):
/// `{"ts":...,"level":"INFO","module":"cli","msg":"...","file":"...","line":N}`.
///
/// The object is produced with the library's own JSON encoder.
std::string format_json_record(const LogRecord& record);

// ============================================================================
// Output Format
// ============================================================================

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< Machine-parseable JSON (one object per line)
};

// ============================================================================
// Log Sinks
// ============================================================================

/// Abstract base class for log output destinations.
class LogSink {
public:
    virtual ~LogSink() = default;

    /// Write a log record to the sink.
    virtual void write(const LogRecord& record) = 0;

    /// Flush any buffered output.
    virtual void flush() = 0;
};

/// Console sink that writes to stderr with optional ANSI colors.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(bool use_colors = true);

    void write(const LogRecord& record) override;
    void flush() override;

    void set_color_enabled(bool enabled) {
        colors_enabled_ = enabled;
    }
    void set_format(LogFormat format) {
        format_ = format;
    }
    void set_pattern(std::string_view pattern) {
        formatter_.set_template(pattern);
    }

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
    LogFormatter formatter_;

    const char* level_color(LogLevel level) const;
};

/// File sink that writes log messages to a file.
/// Auto-flushes on Error and Fatal messages.
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
    void set_pattern(std::string_view pattern) {
        formatter_.set_template(pattern);
    }

private:
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
    LogFormatter formatter_{"{time} {level} [{module}] {message}"};
};

/// Null sink that discards all messages (for testing/benchmarking).
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Multi-sink that fans out log records to multiple child sinks.
class MultiSink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override;

    /// Add a child sink.
    void add(std::unique_ptr<LogSink> sink);

    /// Returns the number of child sinks.
    size_t size() const {
        return sinks_.size();
    }

private:
    std::vector<std::unique_ptr<LogSink>> sinks_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "json=trace,derive=debug,*=warn" and
/// provides fast `should_log(level, module)` checks.
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Format: "module1=level,module2=level,*=default_level"
    /// Module names without "=level" use the default level.
    void parse(std::string_view spec);

    /// Check if a message at the given level from the given module should be logged.
    bool should_log(LogLevel level, std::string_view module) const;

    /// Set the default level for modules not explicitly listed.
    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    /// Get the default level.
    LogLevel default_level() const {
        return default_level_;
    }

    /// Get the minimum configured level across all modules and the default.
    LogLevel min_level() const {
        LogLevel min = default_level_;
        for (const auto& [_, level] : module_levels_) {
            if (level < min)
                min = level;
        }
        return min;
    }

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
    std::string pattern;                ///< Text line template (empty = sink default)
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Manages sinks, filtering, and dispatches log records.
/// Auto-initializes with a console sink at Info if `Logger::init()` was
/// never called.
class Logger {
public:
    /// Initialize the global logger with the given configuration.
    /// Replaces any sinks installed before.
    static void init(const LogConfig& config);

    /// Get the global logger instance.
    static Logger& instance();

    /// Check if a message at the given level/module should be logged.
    /// This is the fast-path check used by macros before constructing the message.
    bool should_log(LogLevel level, std::string_view module) const;

    /// Log a pre-formatted record to all sinks.
    void log(const LogRecord& record);

    /// Log a message at the given level from the given module.
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    /// Add a sink to the logger.
    void add_sink(std::unique_ptr<LogSink> sink);

    /// Remove all sinks.
    void clear_sinks();

    /// Set the global minimum log level.
    void set_level(LogLevel level);

    /// Get the current global log level.
    LogLevel level() const {
        return level_;
    }

    /// Set the module filter from a filter specification string.
    void set_filter(std::string_view spec);

    /// Flush all sinks.
    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Info;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Timestamp Helper
// ============================================================================

/// Returns the given time formatted as "HH:MM:SS.mmm" in local time.
inline std::string format_timestamp(int64_t epoch_millis) {
    auto now_c = static_cast<std::time_t>(epoch_millis / 1000);
    auto millis = epoch_millis % 1000;

    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &now_c);
#else
    localtime_r(&now_c, &tm_buf);
#endif

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis;
    return oss.str();
}

/// Returns milliseconds since epoch (for LogRecord timestamps).
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// CLI Parsing
// ============================================================================

/// Parse logging-related CLI options from argv.
/// Extracts: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, -q
/// Also checks the JCODEC_LOG environment variable as fallback.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true if `arg` is one of the options `parse_log_options` consumes.
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Define JCODEC_MIN_LOG_LEVEL before including this header to elide
// log calls below that level at compile time.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef JCODEC_MIN_LOG_LEVEL
#define JCODEC_MIN_LOG_LEVEL 0
#endif

/// Internal macro, do not use directly.
#define JCODEC_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= JCODEC_MIN_LOG_LEVEL) {                                     \
            auto& logger_ = ::jcodec::log::Logger::instance();                                     \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Log a trace-level message.
/// Usage: JCODEC_LOG_TRACE("module", "message " << value);
#define JCODEC_LOG_TRACE(module, msg) JCODEC_LOG_IMPL(::jcodec::log::LogLevel::Trace, module, msg)

/// Log a debug-level message.
#define JCODEC_LOG_DEBUG(module, msg) JCODEC_LOG_IMPL(::jcodec::log::LogLevel::Debug, module, msg)

/// Log an info-level message.
#define JCODEC_LOG_INFO(module, msg) JCODEC_LOG_IMPL(::jcodec::log::LogLevel::Info, module, msg)

/// Log a warning-level message.
#define JCODEC_LOG_WARN(module, msg) JCODEC_LOG_IMPL(::jcodec::log::LogLevel::Warn, module, msg)

/// Log an error-level message.
#define JCODEC_LOG_ERROR(module, msg) JCODEC_LOG_IMPL(::jcodec::log::LogLevel::Error, module, msg)

/// Log a fatal-level message.
#define JCODEC_LOG_FATAL(module, msg) JCODEC_LOG_IMPL(::jcodec::log::LogLevel::Fatal, module, msg)

} // namespace jcodec::log

#endif // JCODEC_LOG_HPP
