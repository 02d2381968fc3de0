//! # Spark Logging
//!
//! A structured logging library for the Spark back-end with:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-component filtering
//! - Multiple output sinks (Console, File, Memory, Null)
//! - Thread-safe output with mutex protection
//! - Compile-time level elision via SPARK_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! SPARK_LOG_DEBUG("lower", "Lowering function " << name);
//! SPARK_LOG_TRACE("codegen", "Emitting block bb" << id.raw());
//! SPARK_LOG_FATAL("ir", "Stale handle " << raw);
//! ```
//!
//! Module tags used by the back-end: `ir`, `lower`, `codegen`, `backend`.

#ifndef SPARK_LOG_HPP
#define SPARK_LOG_HPP

#include <chrono>
#include <cstdint>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace spark::log {

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
    Fatal = 5, ///< Broken invariants (followed by an InternalError)
    Off = 6    ///< Disables all logging
};

/// Returns the short string name for a log level (e.g., "TRACE", "DEBUG").
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
    std::string_view module; ///< Module tag (e.g., "lower", "codegen")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< Machine-parseable JSON (one object per line)
};

/// Renders `record` as a single text line (without color codes).
std::string format_text(const LogRecord& record);

/// Renders `record` as a single JSON object line.
std::string format_json(const LogRecord& record);

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

private:
    bool colors_enabled_;
    LogFormat format_ = LogFormat::Text;
};

/// Appends records to a file given by `--log-file`.
/// Error and Fatal records are flushed immediately.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

    const std::string& path() const {
        return path_;
    }

    void set_format(LogFormat format) {
        format_ = format;
    }

private:
    std::string path_;
    std::ofstream file_;
    LogFormat format_ = LogFormat::Text;
};

/// Sink that keeps every record in memory. Used by tests to observe what the
/// back-end logged.
class MemorySink : public LogSink {
public:
    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    void write(const LogRecord& record) override;
    void flush() override {}

    /// Returns a copy of the captured entries.
    std::vector<Entry> entries() const;

    /// Returns true if any captured entry has the given level and module.
    bool contains(LogLevel level, std::string_view module) const;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

/// Null sink that discards all messages.
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
/// Parses filter strings like "lower=trace,codegen=debug,*=warn" and
/// provides fast `should_log(level, module)` checks.
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Format: "module1=level,module2=level,*=default_level"
    /// Module names without "=level" are set to Trace.
    void parse(std::string_view spec);

    /// Check if a message at the given level from the given module should be logged.
    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Minimum configured level across all modules and the default.
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
    bool console = true;                ///< Enable console (stderr) output
    bool colors = true;                 ///< Enable ANSI colors on console
};

// ============================================================================
// Logger Singleton
// ============================================================================

/// Thread-safe global logger.
///
/// Manages sinks, filtering, and dispatches log records. Until `init()` is
/// called the logger has no sinks and every record is dropped.
class Logger {
public:
    /// Initialize the global logger with the given configuration.
    static void init(const LogConfig& config);

    /// Get the global logger instance.
    static Logger& instance();

    /// Fast-path check used by the macros before constructing the message.
    bool should_log(LogLevel level, std::string_view module) const;

    /// Log a pre-formatted record to all sinks.
    void log(const LogRecord& record);

    /// Log a message at the given level from the given module.
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink.
    void clear_sinks();

    /// Set the global minimum log level.
    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    /// Set the module filter from a filter specification string.
    void set_filter(std::string_view spec);

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

/// Returns current time formatted as "HH:MM:SS.mmm".
inline std::string get_timestamp() {
    auto now = std::chrono::system_clock::now();
    auto now_c = std::chrono::system_clock::to_time_t(now);
    auto now_ms =
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;

    std::tm tm_buf;
    localtime_r(&now_c, &tm_buf);

    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << now_ms.count();
    return oss.str();
}

/// Returns milliseconds since epoch (for LogRecord timestamps).
inline int64_t epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Configuration Sources
// ============================================================================

/// Parse logging-related CLI options from argv, for a driver embedding spark.
/// Extracts: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, -q.
/// Falls back to the SPARK_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// Builds a LogConfig from the SPARK_LOG environment variable alone.
/// SPARK_LOG holds either a level name ("debug") or a filter spec
/// ("lower=trace,*=warn"). Default level is Warn.
LogConfig config_from_env();

// ============================================================================
// Logging Macros
// ============================================================================

// Compile-time minimum log level gate.
// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef SPARK_MIN_LOG_LEVEL
#define SPARK_MIN_LOG_LEVEL 0
#endif

/// Internal macro, do not use directly.
#define SPARK_LOG_IMPL(level, module_str, msg)                                                     \
    do {                                                                                           \
        if (static_cast<int>(level) >= SPARK_MIN_LOG_LEVEL) {                                      \
            auto& logger_ = ::spark::log::Logger::instance();                                      \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Log a trace-level message.
/// Usage: SPARK_LOG_TRACE("module", "message " << value);
#define SPARK_LOG_TRACE(module, msg) SPARK_LOG_IMPL(::spark::log::LogLevel::Trace, module, msg)

/// Log a debug-level message.
#define SPARK_LOG_DEBUG(module, msg) SPARK_LOG_IMPL(::spark::log::LogLevel::Debug, module, msg)

/// Log an info-level message.
#define SPARK_LOG_INFO(module, msg) SPARK_LOG_IMPL(::spark::log::LogLevel::Info, module, msg)

/// Log a warning-level message.
#define SPARK_LOG_WARN(module, msg) SPARK_LOG_IMPL(::spark::log::LogLevel::Warn, module, msg)

/// Log an error-level message.
#define SPARK_LOG_ERROR(module, msg) SPARK_LOG_IMPL(::spark::log::LogLevel::Error, module, msg)

/// Log a fatal-level message.
#define SPARK_LOG_FATAL(module, msg) SPARK_LOG_IMPL(::spark::log::LogLevel::Fatal, module, msg)

} // namespace spark::log

#endif // SPARK_LOG_HPP
