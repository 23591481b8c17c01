//! # Logging
//!
//! A structured logging library for the verifier with:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module-tagged messages for per-phase filtering
//! - Pluggable output sinks (Console, File, Memory, Null)
//! - Mutex-protected dispatch so parallel verification can log safely
//! - Compile-time level elision via BORROWCK_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! BORROWCK_LOG_DEBUG("verify", "phase " << phase_name(phase) << ": " << n << " errors");
//! BORROWCK_LOG_TRACE("moves", "entering unit " << unit.qualified_name());
//! ```

#ifndef BORROWCK_LOG_HPP
#define BORROWCK_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace borrowck::log {

// ============================================================================
// Log Levels
// ============================================================================

/// Log severity levels in ascending order.
enum class LogLevel : int {
    Trace = 0, ///< Fine-grained internal tracing
    Debug = 1, ///< Debugging information
    Info = 2,  ///< General informational messages
    Warn = 3,  ///< Potential issues
    Error = 4, ///< Recoverable errors
    Fatal = 5, ///< Unrecoverable errors
    Off = 6    ///< Disables all logging
};

/// Returns the upper-case name for a log level (e.g., "TRACE").
[[nodiscard]] auto level_name(LogLevel level) -> const char*;

/// Parses a log level name (either case). Unknown names map to `Info`.
[[nodiscard]] auto parse_level(std::string_view s) -> LogLevel;

// ============================================================================
// Log Record
// ============================================================================

/// A single log message with metadata.
struct LogRecord {
    LogLevel level;       ///< Severity level
    std::string module;   ///< Module tag (e.g., "verify", "moves")
    std::string message;  ///< Formatted message text
    const char* file;     ///< Source file (__FILE__)
    int line;             ///< Source line (__LINE__)
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text
    JSON  ///< One JSON object per line
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

/// Console sink that writes to stderr.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(LogFormat format = LogFormat::Text) : format_(format) {}

    void write(const LogRecord& record) override;
    void flush() override;

private:
    LogFormat format_;
};

/// File sink. Flushes eagerly on Error and Fatal records.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, LogFormat format = LogFormat::Text,
                      bool append = true);
    ~FileSink() override;

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

private:
    std::ofstream file_;
    LogFormat format_;
};

/// Sink that discards everything.
class NullSink : public LogSink {
public:
    void write(const LogRecord& /*record*/) override {}
    void flush() override {}
};

/// Sink that keeps records in memory, used by tests to inspect logging.
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override {}

    /// Returns a copy of all records written so far.
    [[nodiscard]] auto records() const -> std::vector<LogRecord>;

    /// Returns true if any record's message contains `needle`.
    [[nodiscard]] auto contains(std::string_view needle) const -> bool;

private:
    mutable std::mutex mutex_;
    std::vector<LogRecord> records_;
};

/// Renders a record as a single text line (without trailing newline).
[[nodiscard]] auto format_text(const LogRecord& record) -> std::string;

/// Renders a record as a single JSON object (without trailing newline).
[[nodiscard]] auto format_json(const LogRecord& record) -> std::string;

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses specs like `"moves=trace,borrows=debug,*=warn"`. A bare module name
/// without `=level` enables that module at Trace.
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string, replacing any previous one.
    void parse(std::string_view spec);

    /// Check if a message at `level` from `module` passes the filter.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_level_;
    }

    /// Lowest level any module (or the default) accepts.
    [[nodiscard]] auto min_level() const -> LogLevel;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// Configuration for logger initialization.
struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
    LogFormat format = LogFormat::Text; ///< Output format
    std::string filter_spec;            ///< Module filter string
    std::string log_file;               ///< Path to log file (empty = no file)
    bool console = true;                ///< Enable console (stderr) output
};

/// Thread-safe global logger.
///
/// Auto-initializes with a console sink at Warn if `init()` was never called.
class Logger {
public:
    /// Replace the global logger configuration and sinks.
    static void init(const LogConfig& config);

    /// Get the global logger instance.
    static auto instance() -> Logger&;

    /// Fast-path check used by the macros before the message is built.
    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    /// Log a message at the given level from the given module.
    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    /// Add a sink.
    void add_sink(std::unique_ptr<LogSink> sink);

    /// Remove every sink.
    void clear_sinks();

    void set_level(LogLevel level);

    [[nodiscard]] auto level() const -> LogLevel;

    /// Set the module filter from a filter specification string.
    void set_filter(std::string_view spec);

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Milliseconds since epoch.
[[nodiscard]] auto epoch_ms() -> int64_t;

/// Parse logging options from argv. Entry point for drivers that embed the
/// verifier; the library itself never reads argv.
///
/// Understands `--log-level=`, `--log-filter=`, `--log-file=`,
/// `--log-format=json|text`, `-q`, `-v`/`-vv`/`-vvv`. When neither a level nor
/// a filter was given, the `BORROWCK_LOG` environment variable is consulted.
[[nodiscard]] auto parse_log_options(int argc, const char* const argv[]) -> LogConfig;

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef BORROWCK_MIN_LOG_LEVEL
#define BORROWCK_MIN_LOG_LEVEL 0
#endif

#define BORROWCK_LOG_IMPL(level, module_str, msg)                                                  \
    do {                                                                                           \
        if (static_cast<int>(level) >= BORROWCK_MIN_LOG_LEVEL) {                                   \
            auto& logger_ = ::borrowck::log::Logger::instance();                                   \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define BORROWCK_LOG_TRACE(module, msg) BORROWCK_LOG_IMPL(::borrowck::log::LogLevel::Trace, module, msg)
#define BORROWCK_LOG_DEBUG(module, msg) BORROWCK_LOG_IMPL(::borrowck::log::LogLevel::Debug, module, msg)
#define BORROWCK_LOG_INFO(module, msg) BORROWCK_LOG_IMPL(::borrowck::log::LogLevel::Info, module, msg)
#define BORROWCK_LOG_WARN(module, msg) BORROWCK_LOG_IMPL(::borrowck::log::LogLevel::Warn, module, msg)
#define BORROWCK_LOG_ERROR(module, msg) BORROWCK_LOG_IMPL(::borrowck::log::LogLevel::Error, module, msg)
#define BORROWCK_LOG_FATAL(module, msg) BORROWCK_LOG_IMPL(::borrowck::log::LogLevel::Fatal, module, msg)

} // namespace borrowck::log

#endif // BORROWCK_LOG_HPP
