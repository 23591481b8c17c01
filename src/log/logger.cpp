//! # Logger Implementation
//!
//! Implements the Logger singleton, the sinks, and LogFilter.

#include "borrowck/log/log.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>

namespace borrowck::log {

auto level_name(LogLevel level) -> const char* {
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

auto parse_level(std::string_view s) -> LogLevel {
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

auto epoch_ms() -> int64_t {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

// ============================================================================
// Formatting
// ============================================================================

/// "HH:MM:SS.mmm" for the record's timestamp.
static auto format_timestamp(int64_t ts_ms) -> std::string {
    auto secs = static_cast<std::time_t>(ts_ms / 1000);
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &secs);
#else
    localtime_r(&secs, &tm_buf);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << (ts_ms % 1000);
    return oss.str();
}

static void append_json_escaped(std::ostringstream& oss, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            oss << "\\\"";
            break;
        case '\\':
            oss << "\\\\";
            break;
        case '\n':
            oss << "\\n";
            break;
        case '\r':
            oss << "\\r";
            break;
        case '\t':
            oss << "\\t";
            break;
        default:
            oss << c;
        }
    }
}

auto format_text(const LogRecord& record) -> std::string {
    std::ostringstream oss;
    oss << format_timestamp(record.timestamp_ms) << " " << std::left << std::setw(5)
        << level_name(record.level) << " [" << record.module << "] " << record.message;
    return oss.str();
}

auto format_json(const LogRecord& record) -> std::string {
    std::ostringstream oss;
    oss << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
        << "\",\"module\":\"";
    append_json_escaped(oss, record.module);
    oss << "\",\"msg\":\"";
    append_json_escaped(oss, record.message);
    oss << "\"}";
    return oss.str();
}

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::write(const LogRecord& record) {
    auto line = format_ == LogFormat::JSON ? format_json(record) : format_text(record);
    std::cerr << line << "\n";
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, LogFormat format, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out), format_(format) {}

FileSink::~FileSink() {
    if (file_.is_open()) {
        file_.flush();
    }
}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    file_ << (format_ == LogFormat::JSON ? format_json(record) : format_text(record)) << "\n";

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
    records_.push_back(record);
}

auto MemorySink::records() const -> std::vector<LogRecord> {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

auto MemorySink::contains(std::string_view needle) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : records_) {
        if (record.message.find(needle) != std::string::npos) {
            return true;
        }
    }
    return false;
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();

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
            module_levels_[std::string(token)] = LogLevel::Trace;
        }

        pos = comma + 1;
    }
}

auto LogFilter::should_log(LogLevel level, std::string_view module) const -> bool {
    auto it = module_levels_.find(std::string(module));
    LogLevel threshold = it != module_levels_.end() ? it->second : default_level_;
    return threshold != LogLevel::Off && level >= threshold;
}

auto LogFilter::min_level() const -> LogLevel {
    LogLevel min = default_level_;
    for (const auto& [_, level] : module_levels_) {
        if (level < min)
            min = level;
    }
    return min;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() {
    filter_.set_default_level(level_);
    sinks_.push_back(std::make_unique<ConsoleSink>());
}

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.sinks_.clear();
    logger.level_ = config.level;
    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);
    if (!config.filter_spec.empty()) {
        logger.filter_.parse(config.filter_spec);
    }

    if (config.console) {
        logger.sinks_.push_back(std::make_unique<ConsoleSink>(config.format));
    }
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file, config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        }
    }
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (level < filter_.min_level()) {
        return false;
    }
    return filter_.should_log(level, module);
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record{
        .level = level,
        .module = std::string(module),
        .message = message,
        .file = file,
        .line = line,
        .timestamp_ms = epoch_ms(),
    };

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
    level_ = level;
    filter_.set_default_level(level);
}

auto Logger::level() const -> LogLevel {
    std::lock_guard<std::mutex> lock(mutex_);
    return level_;
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

} // namespace borrowck::log
