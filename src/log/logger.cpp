//! # Logger Implementation
//!
//! Record formatting, the console and file sinks, LogFilter, and the
//! Logger singleton.

#include "log/log.hpp"

#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define REQTREE_ISATTY(fd) _isatty(fd)
#define REQTREE_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define REQTREE_ISATTY(fd) isatty(fd)
#define REQTREE_FILENO(f) fileno(f)
#endif

namespace reqtree::log {

// ============================================================================
// Levels
// ============================================================================

namespace {

struct LevelInfo {
    const char* name;
    const char* lower;
    const char* color;
};

// Indexed by LogLevel
constexpr LevelInfo LEVELS[] = {
    {"TRACE", "trace", "\033[90m"}, {"DEBUG", "debug", "\033[36m"},
    {"INFO", "info", "\033[32m"},   {"WARN", "warn", "\033[33m"},
    {"ERROR", "error", "\033[31m"}, {"FATAL", "fatal", "\033[1;31m"},
    {"OFF", "off", ""},
};

const LevelInfo& info(LogLevel level) {
    return LEVELS[static_cast<int>(level)];
}

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

void write_clock(std::ostream& out, int64_t timestamp_ms) {
    std::time_t seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm tm_buf;
#ifdef _WIN32
    localtime_s(&tm_buf, &seconds);
#else
    localtime_r(&seconds, &tm_buf);
#endif
    out << std::put_time(&tm_buf, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << timestamp_ms % 1000 << std::setfill(' ');
}

bool stderr_is_color_terminal() {
    if (!REQTREE_ISATTY(REQTREE_FILENO(stderr)))
        return false;
#ifdef _WIN32
    return true;
#else
    const char* term = std::getenv("TERM");
    return term && std::string_view(term) != "dumb";
#endif
}

} // namespace

const char* level_name(LogLevel level) {
    return info(level).name;
}

LogLevel parse_level(std::string_view name) {
    for (int i = 0; i <= static_cast<int>(LogLevel::Off); ++i) {
        if (name == LEVELS[i].name || name == LEVELS[i].lower)
            return static_cast<LogLevel>(i);
    }
    return LogLevel::Info;
}

// ============================================================================
// Record Formatting
// ============================================================================

void write_text_record(std::ostream& out, const LogRecord& record) {
    write_clock(out, record.timestamp_ms);
    out << ' ' << std::left << std::setw(5) << level_name(record.level) << " [" << record.module
        << "] " << record.message << '\n';
}

void write_json_record(std::ostream& out, const LogRecord& record) {
    out << "{\"ts\":" << record.timestamp_ms << ",\"level\":\"" << level_name(record.level)
        << "\",\"module\":\"" << record.module << "\",\"msg\":\"";

    for (char c : record.message) {
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

    out << "\"}\n";
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(LogFormat format, bool use_colors)
    : format_(format), colors_(use_colors && stderr_is_color_terminal()) {}

void ConsoleSink::write(const LogRecord& record) {
    // One write per record keeps lines from interleaving with other stderr output
    std::ostringstream oss;
    if (format_ == LogFormat::JSON) {
        write_json_record(oss, record);
    } else if (colors_) {
        write_clock(oss, record.timestamp_ms);
        oss << ' ' << info(record.level).color << std::left << std::setw(5)
            << level_name(record.level) << "\033[0m [" << record.module << "] " << record.message
            << '\n';
    } else {
        write_text_record(oss, record);
    }
    std::cerr << oss.str();
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, LogFormat format, bool append)
    : file_(path, append ? (std::ios::out | std::ios::app) : std::ios::out), format_(format) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open())
        return;

    if (format_ == LogFormat::JSON) {
        write_json_record(file_, record);
    } else {
        write_text_record(file_, record);
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
            auto module = token.substr(0, eq);
            LogLevel level = parse_level(token.substr(eq + 1));
            if (module == "*") {
                default_level_ = level;
            } else {
                module_levels_[std::string(module)] = level;
            }
        } else if (!token.empty()) {
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

LogLevel LogFilter::min_level() const {
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
    sinks_.push_back(std::make_unique<ConsoleSink>(LogFormat::Text, true));
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
    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);

    if (!config.filter_spec.empty()) {
        // "*=level" in the spec overrides the configured level
        logger.filter_.parse(config.filter_spec);
        // Per-module overrides may be lower than the global level.
        logger.level_ = logger.filter_.min_level();
    }

    if (config.console) {
        logger.sinks_.push_back(std::make_unique<ConsoleSink>(config.format, config.colors));
    }

    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file, config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

bool Logger::should_log(LogLevel level, std::string_view module) const {
    if (level < level_)
        return false;

    return filter_.should_log(level, module);
}

void Logger::log(LogLevel level, std::string_view module, const std::string& message,
                 const char* file, int line) {
    LogRecord record{level, module, message, file, line, now_ms()};

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

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace reqtree::log
