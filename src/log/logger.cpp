//! # Logger Implementation
//!
//! Implements the Logger singleton, the sinks, LogFormatter and LogFilter.
//! Text lines go through `LogFormatter`; JSON lines are built as a
//! `JsonValue` and written with the library's compact encoder.

#include "log/log.hpp"

#include "json/json_builder.hpp"

#include <cstdlib>
#include <thread>

#ifdef _WIN32
#include <io.h>
#define JCODEC_ISATTY(fd) _isatty(fd)
#define JCODEC_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define JCODEC_ISATTY(fd) isatty(fd)
#define JCODEC_FILENO(f) fileno(f)
#endif

namespace jcodec::log {

// ============================================================================
// Terminal Color Detection
// ============================================================================

static bool detect_terminal_colors() {
    if (!JCODEC_ISATTY(JCODEC_FILENO(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    if (!term)
        return false;

    return std::string(term) != "dumb";
}

// ============================================================================
// JSON Records
// ============================================================================

std::string format_json_record(const LogRecord& record) {
    auto value = json::JsonBuilder()
                     .object()
                     .field("ts", record.timestamp_ms)
                     .field("level", level_name(record.level))
                     .field("module", std::string(record.module))
                     .field("msg", record.message)
                     .field("file", record.file ? record.file : "")
                     .field("line", record.line)
                     .end()
                     .build();
    return value.to_string();
}

// ============================================================================
// ConsoleSink
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors)
    : colors_enabled_(use_colors && detect_terminal_colors()) {}

const char* ConsoleSink::level_color(LogLevel level) const {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m"; // Dark gray
    case LogLevel::Debug:
        return "\033[36m"; // Cyan
    case LogLevel::Info:
        return "\033[32m"; // Green
    case LogLevel::Warn:
        return "\033[33m"; // Yellow
    case LogLevel::Error:
        return "\033[31m"; // Red
    case LogLevel::Fatal:
        return "\033[1;31m"; // Bold red
    case LogLevel::Off:
        return "";
    }
    return "";
}

void ConsoleSink::write(const LogRecord& record) {
    std::string line;
    if (format_ == LogFormat::JSON) {
        line = format_json_record(record);
    } else if (colors_enabled_) {
        line = level_color(record.level) + formatter_.format(record) + "\033[0m";
    } else {
        line = formatter_.format(record);
    }
    line += '\n';
    std::cerr << line;
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

// ============================================================================
// FileSink
// ============================================================================

FileSink::FileSink(const std::string& path, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
        file_.close();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    if (format_ == LogFormat::JSON) {
        file_ << format_json_record(record) << "\n";
    } else {
        file_ << formatter_.format(record) << "\n";
    }

    // Auto-flush on Error and Fatal
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
// MultiSink
// ============================================================================

void MultiSink::write(const LogRecord& record) {
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void MultiSink::flush() {
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

void MultiSink::add(std::unique_ptr<LogSink> sink) {
    sinks_.push_back(std::move(sink));
}

// ============================================================================
// LogFormatter
// ============================================================================

LogFormatter::LogFormatter(std::string_view format_template) : template_(format_template) {}

void LogFormatter::set_template(std::string_view format_template) {
    template_ = std::string(format_template);
}

std::string LogFormatter::format(const LogRecord& record) const {
    std::string result;
    result.reserve(template_.size() + record.message.size() + 64);

    size_t i = 0;
    while (i < template_.size()) {
        size_t close = template_[i] == '{' ? template_.find('}', i + 1) : std::string::npos;
        if (close == std::string::npos) {
            result += template_[i];
            ++i;
            continue;
        }

        auto token = std::string_view(template_).substr(i + 1, close - i - 1);
        if (token == "time") {
            result += format_timestamp(record.timestamp_ms);
        } else if (token == "time_ms") {
            result += std::to_string(record.timestamp_ms);
        } else if (token == "level") {
            result += level_name(record.level);
        } else if (token == "level_short") {
            result += level_short_name(record.level);
        } else if (token == "module") {
            result += record.module;
        } else if (token == "message") {
            result += record.message;
        } else if (token == "file") {
            result += record.file ? record.file : "";
        } else if (token == "line") {
            result += std::to_string(record.line);
        } else if (token == "thread") {
            std::ostringstream oss;
            oss << std::this_thread::get_id();
            result += oss.str();
        } else {
            // Unknown token, keep as-is
            result += '{';
            result += token;
            result += '}';
        }
        i = close + 1;
    }

    return result;
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    // Parse comma-separated "module=level" pairs
    size_t pos = 0;
    while (pos < spec.size()) {
        size_t comma = spec.find(',', pos);
        if (comma == std::string_view::npos) {
            comma = spec.size();
        }

        auto token = spec.substr(pos, comma - pos);
        size_t eq = token.find('=');

        if (eq != std::string_view::npos) {
            auto mod = token.substr(0, eq);
            auto lvl = token.substr(eq + 1);
            if (mod == "*") {
                default_level_ = parse_level(lvl);
            } else {
                module_levels_[std::string(mod)] = parse_level(lvl);
            }
        } else if (!token.empty()) {
            // Bare module name without level: show everything from that module
            module_levels_[std::string(token)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    if (it != module_levels_.end()) {
        return level >= it->second;
    }
    return level >= default_level_;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.level_ = config.level;
    logger.filter_ = LogFilter();

    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
        // A filter without "*=level" falls back to the configured level
        if (config.level < logger.filter_.default_level()) {
            logger.filter_.set_default_level(config.level);
        }
        // The fast path must not reject what per-module overrides accept
        logger.level_ = logger.filter_.min_level();
    } else {
        logger.filter_.set_default_level(config.level);
    }

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        if (!config.pattern.empty()) {
            console->set_pattern(config.pattern);
        }
        logger.sinks_.push_back(std::move(console));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (!config.pattern.empty()) {
            file->set_pattern(config.pattern);
        }
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    // Fast path: level check without lock
    if (level < level_)
        return false;

    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = message;
    record.file = file;
    record.line = line;
    record.timestamp_ms = epoch_ms();

    log(record);
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
    level_ = level;
    filter_.set_default_level(level);
}

void Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.parse(spec);
    if (filter_.min_level() < level_) {
        level_ = filter_.min_level();
    }
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace jcodec::log
