//! # Logger Unit Tests
//!
//! Tests for the SML logging layer: LogFilter parsing, JSON rendering,
//! FileSink I/O, CLI option parsing, and the records the front end emits.

#include "log/log.hpp"
#include "parser/tree.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <string>
#include <vector>

using namespace sml::log;
namespace fs = std::filesystem;

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("lexer=debug,*=warn");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "lexer"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "lexer"));

    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "parser"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "parser"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    // Bare module name (no =level) sets module to Trace
    filter.parse("reduce");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "reduce"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "lexer"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("lexer=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "parser"));
}

TEST_F(LogFilterTest, ModuleLevelBelowDefault) {
    filter.parse("parser=trace,*=error");
    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "parser"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "lexer"));
}

TEST_F(LogFilterTest, ReparseKeepsDefault) {
    filter.set_default_level(LogLevel::Warn);
    filter.parse("lexer=debug");
    filter.parse("parser=trace");
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "lexer"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "lexer"));
}

TEST_F(LogFilterTest, EmptyFilter) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

TEST(LogLevelTest, ParseLevel) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("WARN"), LogLevel::Warn);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("loud"), LogLevel::Info);
    EXPECT_EQ(level_name(LogLevel::Error), "ERROR");
    EXPECT_EQ(parse_level(level_name(LogLevel::Fatal)), LogLevel::Fatal);
}

TEST(LogJsonTest, EscapesMessage) {
    LogRecord record{.level = LogLevel::Warn,
                     .module = "parser",
                     .message = "unexpected \"x\"\nhere",
                     .timestamp_ms = 42};
    EXPECT_EQ(to_json(record),
              R"({"ts":42,"level":"WARN","module":"parser","msg":"unexpected \"x\"\nhere"})");
}

// ============================================================================
// Records Emitted by the Front End
// ============================================================================

class LoggerCaptureTest : public ::testing::Test {
protected:
    MemorySink* sink = nullptr;

    void SetUp() override {
        auto memory = std::make_unique<MemorySink>();
        sink = memory.get();
        Logger::instance().reset();
        Logger::instance().add_sink(std::move(memory));
    }

    void TearDown() override {
        Logger::instance().reset();
    }

    auto contains(const std::string& message) const -> bool {
        auto messages = sink->messages();
        return std::find(messages.begin(), messages.end(), message) != messages.end();
    }
};

TEST_F(LoggerCaptureTest, ScannerReportsDocument) {
    Logger::instance().set_level(LogLevel::Debug);
    auto result = sml::parser::parse("doc", "a", sml::lexer::ScanMode::Synchronous);
    ASSERT_TRUE(sml::is_ok(result));
    EXPECT_TRUE(contains("[lexer] scanning doc (1 bytes)"));
}

TEST_F(LoggerCaptureTest, ModuleFilterDropsOtherModules) {
    Logger::instance().set_filter("parser=debug,*=off");
    auto result = sml::parser::parse("doc", "a - b", sml::lexer::ScanMode::Synchronous);
    ASSERT_TRUE(sml::is_ok(result));
    for (const auto& message : sink->messages()) {
        EXPECT_TRUE(message.starts_with("[parser] ")) << message;
    }
}

TEST_F(LoggerCaptureTest, DefaultLevelIsQuiet) {
    auto result = sml::parser::parse("doc", "rect 1 2 @ 3 4", sml::lexer::ScanMode::Concurrent);
    ASSERT_TRUE(sml::is_ok(result));
    EXPECT_TRUE(sink->messages().empty());
}

TEST_F(LoggerCaptureTest, FilterLayersOnLevel) {
    Logger::instance().set_level(LogLevel::Warn);
    Logger::instance().set_filter("parser=debug");
    SML_LOG_DEBUG("parser", "kept");
    SML_LOG_DEBUG("lexer", "dropped");
    SML_LOG_WARN("lexer", "warned");
    EXPECT_EQ(sink->messages(), (std::vector<std::string>{"[parser] kept", "[lexer] warned"}));
}

TEST_F(LoggerCaptureTest, MacroFormatsStream) {
    SML_LOG_WARN("test", "value " << 7 << " of " << 9);
    EXPECT_TRUE(contains("[test] value 7 of 9"));
}

// ============================================================================
// FileSink
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "sml_log_test.log";
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    void TearDown() override {
        if (fs::exists(temp_file)) {
            fs::remove(temp_file);
        }
    }

    std::string read_file(const fs::path& path) {
        std::ifstream f(path);
        std::string content((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());
        return content;
    }
};

TEST_F(FileSinkTest, WritesTextRecord) {
    {
        FileSink sink(temp_file.string(), LogFormat::Text, false);
        ASSERT_TRUE(sink.is_open());
        sink.write(LogRecord{.level = LogLevel::Error,
                             .module = "lexer",
                             .message = "unclosed comment",
                             .timestamp_ms = 1'700'000'000'123});
    }
    auto content = read_file(temp_file);
    EXPECT_NE(content.find(".123 ERROR [lexer] unclosed comment\n"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsByDefault) {
    for (const char* message : {"first", "second"}) {
        FileSink sink(temp_file.string(), LogFormat::JSON);
        sink.write(LogRecord{
            .level = LogLevel::Warn, .module = "cli", .message = message, .timestamp_ms = 0});
    }
    auto content = read_file(temp_file);
    EXPECT_LT(content.find("first"), content.find("second"));
}

TEST_F(FileSinkTest, WritesJsonRecord) {
    {
        FileSink sink(temp_file.string(), LogFormat::JSON, false);
        sink.write(LogRecord{.level = LogLevel::Info,
                             .module = "parser",
                             .message = "parsed",
                             .timestamp_ms = 5});
    }
    EXPECT_EQ(read_file(temp_file), "{\"ts\":5,\"level\":\"INFO\",\"module\":\"parser\",\"msg\":\"parsed\"}\n");
}

// ============================================================================
// CLI Options
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("SML_LOG");
    }

    auto parse(std::vector<std::string> args) -> LogConfig {
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, DefaultsToWarn) {
    EXPECT_EQ(parse({"smlc", "shapes.sml"}).level, LogLevel::Warn);
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse({"smlc", "-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"smlc", "-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"smlc", "-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"smlc", "-q"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitLevelWinsOverVerbosity) {
    auto config = parse({"smlc", "-vv", "--log-level=error"});
    EXPECT_EQ(config.level, LogLevel::Error);
}

TEST_F(LogOptionsTest, FilterFileAndFormat) {
    auto config =
        parse({"smlc", "--log-filter=lexer=trace", "--log-file=out.log", "--log-format=json"});
    EXPECT_EQ(config.filter_spec, "lexer=trace");
    EXPECT_EQ(config.log_file, "out.log");
    EXPECT_EQ(config.format, LogFormat::JSON);
}

TEST_F(LogOptionsTest, EnvironmentFallback) {
    setenv("SML_LOG", "parser=debug", 1);
    EXPECT_EQ(parse({"smlc"}).filter_spec, "parser=debug");
    setenv("SML_LOG", "trace", 1);
    EXPECT_EQ(parse({"smlc"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"smlc", "-q"}).level, LogLevel::Error);
    unsetenv("SML_LOG");
}

TEST_F(LogOptionsTest, RecognizesLogOptions) {
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--log-level=debug"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("--tokens"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("shapes.sml"));
}
