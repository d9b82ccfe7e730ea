//! # reqtree Logging
//!
//! Module-tagged logging for reqtree. Records go to stderr and, with
//! `--log-file`, to a file, as text or one JSON object per line.
//!
//! stdout is reserved for query output so that it stays byte-exact.
//!
//! ## Modules
//!
//! | Tag       | Emitted by                          |
//! |-----------|-------------------------------------|
//! | `catalog` | ResourceCatalog insertions          |
//! | `loader`  | catalog file loading and warnings   |
//! | `graph`   | traversal start, steps and failures |
//! | `cli`     | command dispatch                    |
//!
//! ## Usage
//!
//! ```cpp
//! REQTREE_LOG_INFO("loader", "Loaded " << count << " resources from " << path);
//! REQTREE_LOG_DEBUG("graph", "install order for " << root);
//! ```

#ifndef REQTREE_LOG_HPP
#define REQTREE_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <ostream>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace reqtree::log {

// ============================================================================
// Levels and Records
// ============================================================================

enum class LogLevel : int {
    Trace = 0, ///< Per-step traversal tracing
    Debug = 1, ///< Query start, completion and failure context
    Info = 2,  ///< Catalog loading
    Warn = 3,  ///< Dangling references, skipped keys and sections
    Error = 4,
    Fatal = 5,
    Off = 6
};

/// Upper-case level name ("WARN").
const char* level_name(LogLevel level);

/// Parses "trace" ... "off" in either case. Unknown names give Info.
LogLevel parse_level(std::string_view name);

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    const char* file;
    int line;
    int64_t timestamp_ms; ///< Milliseconds since epoch
};

enum class LogFormat { Text, JSON };

/// "HH:MM:SS.mmm LEVEL [module] message", local time of the record.
void write_text_record(std::ostream& out, const LogRecord& record);

/// {"ts":...,"level":"...","module":"...","msg":"..."} on one line.
void write_json_record(std::ostream& out, const LogRecord& record);

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;
    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr. Text records are colored by level when `use_colors` is
/// set and stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    ConsoleSink(LogFormat format, bool use_colors);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    LogFormat format_;
    bool colors_;
};

/// Appends to (or truncates) a file. Error and Fatal records are flushed
/// immediately.
class FileSink : public LogSink {
public:
    FileSink(const std::string& path, LogFormat format, bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    bool is_open() const {
        return file_.is_open();
    }

private:
    std::ofstream file_;
    LogFormat format_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module levels parsed from specs like "graph=trace,loader,*=warn".
/// A bare module name enables Trace for it; "*" sets the default.
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

    /// Lowest level any module can log at.
    LogLevel min_level() const;

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Empty = every module at `level`
    std::string log_file;    ///< Empty = no file sink
    bool console = true;
    bool colors = true;
};

/// Process-wide logger. Starts with a Warn-level console sink; init()
/// replaces its sinks and filter.
class Logger {
public:
    static void init(const LogConfig& config);

    static Logger& instance();

    /// Checked by the macros before the message is built.
    bool should_log(LogLevel level, std::string_view module) const;

    void log(LogLevel level, std::string_view module, const std::string& message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    void set_level(LogLevel level);

    LogLevel level() const {
        return level_;
    }

    void flush();

private:
    Logger();

    LogLevel level_ = LogLevel::Warn;
    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command Line
// ============================================================================

/// Reads --log-level=, --log-filter=, --log-file=, --log-format=,
/// -v/-vv/-vvv, --verbose and -q/--quiet from argv. Without a level or
/// filter on the command line, REQTREE_LOG supplies one.
LogConfig parse_log_options(int argc, char* argv[]);

/// True if parse_log_options() consumes `arg`.
bool is_log_option(std::string_view arg);

// ============================================================================
// Macros
// ============================================================================

// Levels below this are compiled out: 0=Trace ... 6=Off
#ifndef REQTREE_MIN_LOG_LEVEL
#define REQTREE_MIN_LOG_LEVEL 0
#endif

#define REQTREE_LOG_IMPL(level, module_str, msg)                                                   \
    do {                                                                                           \
        if (static_cast<int>(level) >= REQTREE_MIN_LOG_LEVEL) {                                    \
            auto& logger_ = ::reqtree::log::Logger::instance();                                    \
            if (logger_.should_log(level, module_str)) {                                           \
                std::ostringstream oss_;                                                           \
                oss_ << msg;                                                                       \
                logger_.log(level, module_str, oss_.str(), __FILE__, __LINE__);                    \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define REQTREE_LOG_TRACE(module, msg) REQTREE_LOG_IMPL(::reqtree::log::LogLevel::Trace, module, msg)
#define REQTREE_LOG_DEBUG(module, msg) REQTREE_LOG_IMPL(::reqtree::log::LogLevel::Debug, module, msg)
#define REQTREE_LOG_INFO(module, msg) REQTREE_LOG_IMPL(::reqtree::log::LogLevel::Info, module, msg)
#define REQTREE_LOG_WARN(module, msg) REQTREE_LOG_IMPL(::reqtree::log::LogLevel::Warn, module, msg)
#define REQTREE_LOG_ERROR(module, msg) REQTREE_LOG_IMPL(::reqtree::log::LogLevel::Error, module, msg)
#define REQTREE_LOG_FATAL(module, msg) REQTREE_LOG_IMPL(::reqtree::log::LogLevel::Fatal, module, msg)

} // namespace reqtree::log

#endif // REQTREE_LOG_HPP
