//! # Logger Implementation
//!
//! Level names, record formatting, the three sinks, LogFilter and the
//! Logger singleton.

#include "log/log.hpp"

#include <array>
#include <chrono>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>

#ifdef _WIN32
#include <io.h>
#define SML_ISATTY(fd) _isatty(fd)
#define SML_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define SML_ISATTY(fd) isatty(fd)
#define SML_FILENO(f) fileno(f)
#endif

namespace sml::log {

namespace {

struct LevelInfo {
    std::string_view upper;
    std::string_view lower;
    const char* color; ///< ANSI escape used by ConsoleSink
};

constexpr std::array<LevelInfo, 7> LEVELS = {{
    {"TRACE", "trace", "\033[90m"},
    {"DEBUG", "debug", "\033[36m"},
    {"INFO", "info", "\033[32m"},
    {"WARN", "warn", "\033[33m"},
    {"ERROR", "error", "\033[31m"},
    {"FATAL", "fatal", "\033[1;31m"},
    {"OFF", "off", ""},
}};

auto info_of(LogLevel level) -> const LevelInfo& {
    return LEVELS[static_cast<size_t>(level)];
}

auto now_ms() -> int64_t {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

/// Local wall-clock time of a record as "HH:MM:SS.mmm".
auto clock_time(int64_t timestamp_ms) -> std::string {
    auto seconds = static_cast<std::time_t>(timestamp_ms / 1000);
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &seconds);
#else
    localtime_r(&seconds, &local);
#endif
    std::ostringstream out;
    out << std::put_time(&local, "%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << timestamp_ms % 1000;
    return out.str();
}

auto format_text(const LogRecord& record, bool colors) -> std::string {
    std::ostringstream out;
    out << clock_time(record.timestamp_ms) << ' ';
    if (colors) {
        out << info_of(record.level).color;
    }
    out << std::left << std::setw(5) << level_name(record.level);
    if (colors) {
        out << "\033[0m";
    }
    out << " [" << record.module << "] " << record.message << '\n';
    return out.str();
}

auto render_record(const LogRecord& record, LogFormat format, bool colors) -> std::string {
    return format == LogFormat::JSON ? to_json(record) + '\n' : format_text(record, colors);
}

auto stderr_has_colors() -> bool {
    if (!SML_ISATTY(SML_FILENO(stderr))) {
        return false;
    }
    const char* term = std::getenv("TERM");
    return term != nullptr && std::string_view(term) != "dumb";
}

} // namespace

auto level_name(LogLevel level) -> std::string_view {
    return info_of(level).upper;
}

auto parse_level(std::string_view name) -> LogLevel {
    for (size_t i = 0; i < LEVELS.size(); ++i) {
        if (name == LEVELS[i].upper || name == LEVELS[i].lower) {
            return static_cast<LogLevel>(i);
        }
    }
    return LogLevel::Info;
}

auto to_json(const LogRecord& record) -> std::string {
    std::ostringstream out;
    out << R"({"ts":)" << record.timestamp_ms << R"(,"level":")" << level_name(record.level)
        << R"(","module":")" << record.module << R"(","msg":")";
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
    out << "\"}";
    return out.str();
}

// ============================================================================
// Sinks
// ============================================================================

ConsoleSink::ConsoleSink(LogFormat format) : format_(format), colors_(stderr_has_colors()) {}

void ConsoleSink::write(const LogRecord& record) {
    std::cerr << render_record(record, format_, colors_);
}

void ConsoleSink::flush() {
    std::cerr.flush();
}

FileSink::FileSink(const std::string& path, LogFormat format, bool append)
    : file_(path, append ? std::ios::app : std::ios::trunc), format_(format) {}

void FileSink::write(const LogRecord& record) {
    if (!file_.is_open()) {
        return;
    }
    file_ << render_record(record, format_, false);
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
    messages_.push_back("[" + std::string(record.module) + "] " + record.message);
}

auto MemorySink::messages() const -> std::vector<std::string> {
    std::lock_guard<std::mutex> lock(mutex_);
    return messages_;
}

// ============================================================================
// LogFilter
// ============================================================================

void LogFilter::parse(std::string_view spec) {
    module_levels_.clear();
    while (!spec.empty()) {
        auto comma = spec.find(',');
        auto entry = spec.substr(0, comma);
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);
        if (entry.empty()) {
            continue;
        }

        auto eq = entry.find('=');
        auto module = entry.substr(0, eq);
        auto level =
            eq == std::string_view::npos ? LogLevel::Trace : parse_level(entry.substr(eq + 1));
        if (module == "*") {
            default_level_ = level;
        } else {
            module_levels_[std::string(module)] = level;
        }
    }
}

auto LogFilter::should_log(LogLevel level, std::string_view module) const -> bool {
    auto it = module_levels_.find(std::string(module));
    auto threshold = it == module_levels_.end() ? default_level_ : it->second;
    return level >= threshold && level != LogLevel::Off;
}

// ============================================================================
// Logger
// ============================================================================

auto Logger::instance() -> Logger& {
    static Logger logger;
    return logger;
}

void Logger::init(const LogConfig& config) {
    auto& logger = instance();
    std::lock_guard<std::mutex> lock(logger.mutex_);

    logger.filter_ = LogFilter{};
    logger.filter_.set_default_level(config.level);
    logger.filter_.parse(config.filter_spec);

    logger.sinks_.clear();
    logger.sinks_.push_back(std::make_unique<ConsoleSink>(config.format));
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file, config.format);
        if (file->is_open()) {
            logger.sinks_.push_back(std::move(file));
        } else {
            std::cerr << "warning: could not open log file: " << config.log_file << "\n";
        }
    }
}

auto Logger::should_log(LogLevel level, std::string_view module) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return filter_.should_log(level, module);
}

void Logger::log(LogLevel level, std::string_view module, std::string message) {
    LogRecord record{
        .level = level, .module = module, .message = std::move(message), .timestamp_ms = now_ms()};
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
    filter_ = LogFilter{};
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
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

} // namespace sml::log
