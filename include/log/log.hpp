//! # SML Logging
//!
//! Module-tagged logging for the SML front end. Records go through a
//! process-wide `Logger` that filters them per module and hands them to
//! its sinks (stderr, a file, or memory for tests). The logger starts with
//! no sinks, so a library user that never configures it sees nothing.
//!
//! ## Usage
//!
//! ```cpp
//! SML_LOG_DEBUG("parser", "parsing document " << name);
//! SML_LOG_TRACE("lexer", "emit " << token);
//! ```
//!
//! Levels below `SML_MIN_LOG_LEVEL` are compiled out.

#ifndef SML_LOG_LOG_HPP
#define SML_LOG_LOG_HPP

#include <cstdint>
#include <fstream>
#include <memory>
#include <mutex>
#include <sstream>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sml::log {

// ============================================================================
// Levels and Records
// ============================================================================

/// Severity, least severe first. `Off` only appears in filters.
enum class LogLevel : int { Trace = 0, Debug, Info, Warn, Error, Fatal, Off };

/// Upper-case name of a level ("TRACE" .. "OFF").
[[nodiscard]] auto level_name(LogLevel level) -> std::string_view;

/// Parses a level name in lower or upper case. Unknown names give Info.
[[nodiscard]] auto parse_level(std::string_view name) -> LogLevel;

struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string message;
    int64_t timestamp_ms; ///< Milliseconds since the Unix epoch
};

enum class LogFormat {
    Text, ///< `HH:MM:SS.mmm LEVEL [module] message`
    JSON  ///< One object per line
};

/// Renders a record as one JSON object, without the newline.
[[nodiscard]] auto to_json(const LogRecord& record) -> std::string;

// ============================================================================
// Sinks
// ============================================================================

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() = 0;
};

/// Writes to stderr. Text records are coloured when stderr is a terminal.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(LogFormat format = LogFormat::Text);

    void write(const LogRecord& record) override;
    void flush() override;

private:
    LogFormat format_;
    bool colors_;
};

/// Appends to a file. Error and Fatal records are flushed at once.
class FileSink : public LogSink {
public:
    explicit FileSink(const std::string& path, LogFormat format = LogFormat::Text,
                      bool append = true);

    void write(const LogRecord& record) override;
    void flush() override;

    [[nodiscard]] auto is_open() const -> bool {
        return file_.is_open();
    }

private:
    std::ofstream file_;
    LogFormat format_;
};

/// Keeps `[module] message` for every record written.
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override;
    void flush() override {}

    [[nodiscard]] auto messages() const -> std::vector<std::string>;

private:
    mutable std::mutex mutex_;
    std::vector<std::string> messages_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module minimum levels, e.g. "lexer=trace,parser=debug,*=warn".
///
/// A bare module name means Trace. `*` sets the level for every module
/// not named.
class LogFilter {
public:
    void parse(std::string_view spec);

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void set_default_level(LogLevel level) {
        default_level_ = level;
    }

private:
    LogLevel default_level_ = LogLevel::Info;
    std::unordered_map<std::string, LogLevel> module_levels_;
};

// ============================================================================
// Logger
// ============================================================================

/// What `smlc` asks for on its command line.
struct LogConfig {
    LogLevel level = LogLevel::Info;
    LogFormat format = LogFormat::Text;
    std::string filter_spec; ///< Applied on top of `level`
    std::string log_file;    ///< Empty for stderr only
};

class Logger {
public:
    /// Replaces the sinks with a console sink (plus a file sink when
    /// `log_file` is set) and applies the level and filter.
    static void init(const LogConfig& config);

    static auto instance() -> Logger&;

    [[nodiscard]] auto should_log(LogLevel level, std::string_view module) const -> bool;

    void log(LogLevel level, std::string_view module, std::string message);

    void add_sink(std::unique_ptr<LogSink> sink);

    /// Drops every sink and filter; the level goes back to Info.
    void reset();

    void set_level(LogLevel level);
    void set_filter(std::string_view spec);

    void flush();

private:
    Logger() = default;

    LogFilter filter_;
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

// ============================================================================
// Command Line
// ============================================================================

/// Reads the logging options out of argv: --log-level=, --log-filter=,
/// --log-file=, --log-format=, -v/-vv/-vvv, --verbose, -q/--quiet.
///
/// The level defaults to Warn. When argv names neither a level nor a
/// filter, SML_LOG is consulted: a value with '=' or ',' is a filter,
/// anything else a level.
[[nodiscard]] auto parse_log_options(int argc, char* argv[]) -> LogConfig;

/// True for every argument `parse_log_options` consumes.
[[nodiscard]] auto is_log_option(std::string_view arg) -> bool;

// ============================================================================
// Macros
// ============================================================================

// 0=Trace .. 6=Off
#ifndef SML_MIN_LOG_LEVEL
#define SML_MIN_LOG_LEVEL 0
#endif

#define SML_LOG_IMPL(level, module_str, msg)                                                       \
    do {                                                                                           \
        if (static_cast<int>(level) >= SML_MIN_LOG_LEVEL) {                                        \
            auto& sml_logger_ = ::sml::log::Logger::instance();                                    \
            if (sml_logger_.should_log(level, module_str)) {                                       \
                std::ostringstream sml_oss_;                                                       \
                sml_oss_ << msg;                                                                   \
                sml_logger_.log(level, module_str, sml_oss_.str());                                \
            }                                                                                      \
        }                                                                                          \
    } while (0)

#define SML_LOG_TRACE(module, msg) SML_LOG_IMPL(::sml::log::LogLevel::Trace, module, msg)
#define SML_LOG_DEBUG(module, msg) SML_LOG_IMPL(::sml::log::LogLevel::Debug, module, msg)
#define SML_LOG_INFO(module, msg) SML_LOG_IMPL(::sml::log::LogLevel::Info, module, msg)
#define SML_LOG_WARN(module, msg) SML_LOG_IMPL(::sml::log::LogLevel::Warn, module, msg)
#define SML_LOG_ERROR(module, msg) SML_LOG_IMPL(::sml::log::LogLevel::Error, module, msg)
#define SML_LOG_FATAL(module, msg) SML_LOG_IMPL(::sml::log::LogLevel::Fatal, module, msg)

} // namespace sml::log

#endif // SML_LOG_LOG_HPP
