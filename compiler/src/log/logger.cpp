//! # Logger Implementation
//!
//! The Logger singleton, the sinks, and LogFilter.

#include "log/log.hpp"

#include <algorithm>
#include <cstdio>
#include <cstdlib>

#include <unistd.h>

namespace spark::log {

// ============================================================================
// Record Formatting
// ============================================================================

static bool stderr_has_colors() {
    if (!isatty(fileno(stderr)))
        return false;

    const char* term = std::getenv("TERM");
    return term && std::string_view(term) != "dumb";
}

static const char* level_color(LogLevel level) {
    switch (level) {
    case LogLevel::Trace:
        return "\033[90m";
    case LogLevel::Debug:
        return "\033[36m";
    case LogLevel::Info:
        return "\033[32m";
    case LogLevel::Warn:
        return "\033[33m";
    case LogLevel::Error:
        return "\033[31m";
    case LogLevel::Fatal:
        return "\033[1;31m";
    case LogLevel::Off:
        break;
    }
    return "";
}

/// Writes "HH:MM:SS.mmm LEVEL [module] message\n"; `color` wraps the level name.
static void write_text(std::ostream& out, const LogRecord& record, const char* color) {
    out << get_timestamp() << " ";
    if (color) {
        out << color;
    }
    out << std::left << std::setw(5) << level_name(record.level);
    if (color) {
        out << "\033[0m";
    }
    out << " [" << record.module << "] " << record.message << "\n";
}

static void write_json_escaped(std::ostream& out, std::string_view text) {
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
}

std::string format_text(const LogRecord& record) {
    std::ostringstream oss;
    write_text(oss, record, nullptr);
    return oss.str();
}

std::string format_json(const LogRecord& record) {
    std::ostringstream oss;
    oss << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
        << "\",\"module\":\"" << record.module << "\",\"msg\":\"";
    write_json_escaped(oss, record.message);
    oss << "\"}\n";
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(bool use_colors) : colors_enabled_(use_colors && stderr_has_colors()) {}

void ConsoleSink::write(const LogRecord& record) {
    // Single write per record.
    std::ostringstream oss;
    if (format_ == LogFormat::JSON) {
        oss << format_json(record);
    } else {
        write_text(oss, record, colors_enabled_ ? level_color(record.level) : nullptr);
    }
    std::cerr << oss.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, bool append)
    : path_(path), file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out) {}

FileSink::~FileSink() {
    flush();
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    if (format_ == LogFormat::JSON) {
        file_ << format_json(record);
    } else {
        write_text(file_, record, nullptr);
    }

    if (record.level >= LogLevel::Error) {
        file_.flush();
    }
}

void FileSink::flush() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void MemorySink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back({record.level, std::string(record.module), record.message});
}

std::vector<MemorySink::Entry> MemorySink::entries() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

bool MemorySink::contains(LogLevel level, std::string_view module) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(entries_.begin(), entries_.end(), [&](const Entry& entry) {
        return entry.level == level && entry.module == module;
    });
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.clear();
}

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
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

    while (!spec.empty()) {
        size_t comma = spec.find(',');
        auto token = spec.substr(0, comma);
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);

        if (token.empty()) {
            continue;
        }

        size_t eq = token.find('=');
        if (eq == std::string_view::npos) {
            module_levels_[std::string(token)] = LogLevel::Trace;
            continue;
        }

        auto module = token.substr(0, eq);
        LogLevel level = parse_level(token.substr(eq + 1));
        if (module == "*") {
            default_level_ = level;
        } else {
            module_levels_[std::string(module)] = level;
        }
    }
}

bool LogFilter::should_log(LogLevel level, std::string_view module) const {
    auto it = module_levels_.find(std::string(module));
    return level >= (it != module_levels_.end() ? it->second : default_level_);
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() = default;

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::unique_lock<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();

    // "*=level" in the filter overrides the configured level.
    logger.filter_.set_default_level(config.level);
    logger.filter_.parse(config.filter_spec);

    // The fast path in should_log() must not reject what a module override accepts.
    logger.level_ = logger.filter_.min_level();

    if (config.console) {
        auto console = std::make_unique<ConsoleSink>(config.colors);
        console->set_format(config.format);
        logger.sinks_.push_back(std::move(console));
    }

    std::string unopened;
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        file->set_format(config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            unopened = config.log_file;
        }
    }

    lock.unlock();
    if (!unopened.empty()) {
        SPARK_LOG_WARN("log", "Could not open log file " << unopened);
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    return level >= level_ && filter_.should_log(level, module);
}

void Logger::log(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    log(LogRecord{level, module, message, file, line, epoch_ms()});
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
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace spark::log
