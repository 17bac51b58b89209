//! # Kite Logging
//!
//! Structured, module-tagged logging for the interpreter pipeline:
//! - 6 log levels (Trace, Debug, Info, Warn, Error, Fatal)
//! - Module tags for per-stage filtering (`lexer`, `parser`, `interp`, `runtime`, `repl`)
//! - Stream sinks for stderr, log files and caller-owned streams
//! - Thread-safe dispatch with mutex protection
//! - Compile-time level elision via KITE_MIN_LOG_LEVEL
//!
//! ## Usage
//!
//! ```cpp
//! KITE_LOG_DEBUG("lexer", "Produced " << tokens.size() << " tokens");
//! KITE_LOG_WARN("repl", "Could not open history file " << path);
//! ```

#ifndef KITE_LOG_LOG_HPP
#define KITE_LOG_LOG_HPP

#include <cstdint>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace kite::log {

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

/// Returns the upper-case name for a log level (e.g., "TRACE", "DEBUG").
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
    std::string_view module; ///< Module tag (e.g., "parser", "interp")
    std::string message;     ///< Formatted message text
    const char* file;        ///< Source file (__FILE__)
    int line;                ///< Source line (__LINE__)
    int64_t timestamp_ms;    ///< Milliseconds since epoch
};

/// Output format for log messages.
enum class LogFormat {
    Text, ///< Human-readable text with optional ANSI colors
    JSON  ///< One JSON object per line
};

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

/// Sink that writes one formatted line per record to a stream.
///
/// Error and Fatal records are flushed immediately.
class StreamSink : public LogSink {
public:
    /// Writes to a caller-owned stream, which must outlive the sink.
    explicit StreamSink(std::ostream& out, LogFormat format = LogFormat::Text,
                        bool colors = false);

    /// Writes to stderr. Colors are used only when stderr is a terminal.
    static auto console(LogFormat format, bool colors) -> std::unique_ptr<StreamSink>;

    /// Appends to the file at `path`. Returns null if it cannot be opened.
    static auto open_file(const std::string& path, LogFormat format)
        -> std::unique_ptr<StreamSink>;

    void write(const LogRecord& record) override;
    void flush() override;

private:
    StreamSink(std::unique_ptr<std::ostream> owned, LogFormat format);

    std::unique_ptr<std::ostream> owned_;
    std::ostream& out_;
    LogFormat format_;
    bool colors_;
};

// ============================================================================
// Log Filter
// ============================================================================

/// Module-based log level filter.
///
/// Parses filter strings like "parser=trace,interp=debug,*=warn".
class LogFilter {
public:
    LogFilter() = default;

    /// Parse a filter specification string.
    /// Module names without "=level" are enabled at Trace.
    void parse(std::string_view spec);

    bool should_log(LogLevel level, std::string_view module) const;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

    LogLevel default_level() const {
        return default_level_;
    }

    /// Lowest level configured for any module or the default.
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

struct LogConfig {
    LogLevel level = LogLevel::Warn;    ///< Global minimum log level
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
/// Auto-initializes with a Warn-level console sink on first use.
class Logger {
public:
    /// Replace sinks, level and filter with the given configuration.
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Fast-path check used by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(const LogRecord& record);

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Removes every sink. Records are dropped until a sink is added again.
    void clear_sinks();

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
// CLI Parsing
// ============================================================================

/// Parse logging-related options from argv.
/// Extracts: --log-level, --log-filter, --log-file, --log-format, -v/-vv/-vvv, -q
/// Falls back to the KITE_LOG environment variable.
LogConfig parse_log_options(int argc, char* argv[]);

/// Returns true if `arg` is one of the options consumed by parse_log_options().
bool is_log_option(std::string_view arg);

// ============================================================================
// Logging Macros
// ============================================================================

// Values: 0=Trace, 1=Debug, 2=Info, 3=Warn, 4=Error, 5=Fatal, 6=Off
#ifndef KITE_MIN_LOG_LEVEL
#define KITE_MIN_LOG_LEVEL 0
#endif

/// Internal macro, use the level-specific macros below.
#define KITE_LOG_IMPL(level, module_str, msg)                                                      \
    do {                                                                                           \
        if (static_cast<int>(level) >= KITE_MIN_LOG_LEVEL) {                                       \
            auto& logger_ = ::kite::log::Logger::instance();                                       \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define KITE_LOG_TRACE(module, msg) KITE_LOG_IMPL(::kite::log::LogLevel::Trace, module, msg)
#define KITE_LOG_DEBUG(module, msg) KITE_LOG_IMPL(::kite::log::LogLevel::Debug, module, msg)
#define KITE_LOG_INFO(module, msg) KITE_LOG_IMPL(::kite::log::LogLevel::Info, module, msg)
#define KITE_LOG_WARN(module, msg) KITE_LOG_IMPL(::kite::log::LogLevel::Warn, module, msg)
#define KITE_LOG_ERROR(module, msg) KITE_LOG_IMPL(::kite::log::LogLevel::Error, module, msg)
#define KITE_LOG_FATAL(module, msg) KITE_LOG_IMPL(::kite::log::LogLevel::Fatal, module, msg)

} // namespace kite::log

#endif // KITE_LOG_LOG_HPP
