//! # Logger Unit Tests
//!
//! Tests for the jcodec logging system: LogFilter parsing, formatter
//! tokens, FileSink I/O, JSON records, CLI option parsing, thread safety,
//! and the library's own debug output.

#include "log/log.hpp"

#include "json/json.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace jcodec;
using namespace jcodec::log;
namespace fs = std::filesystem;

namespace {

auto make_record(LogLevel level, std::string_view module, std::string message) -> LogRecord {
    LogRecord record;
    record.level = level;
    record.module = module;
    record.message = std::move(message);
    record.file = "test.cpp";
    record.line = 7;
    record.timestamp_ms = 1234567890;
    return record;
}

} // namespace

// ============================================================================
// LogFilter Parsing
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, ParseModuleAndDefault) {
    filter.parse("derive=debug,*=info");

    EXPECT_TRUE(filter.should_log(LogLevel::Debug, "derive"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "derive"));
    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "derive"));

    EXPECT_TRUE(filter.should_log(LogLevel::Info, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "cli"));
}

TEST_F(LogFilterTest, ParseModuleOff) {
    filter.parse("cursor=off");

    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "cursor"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "json"));
}

TEST_F(LogFilterTest, ParseBareModuleName) {
    filter.parse("json");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "json"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "cli"));
}

TEST_F(LogFilterTest, ParseMultipleModules) {
    filter.parse("json=trace,derive=info,cli=warn,*=error");

    EXPECT_TRUE(filter.should_log(LogLevel::Trace, "json"));
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "derive"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "derive"));
    EXPECT_TRUE(filter.should_log(LogLevel::Warn, "cli"));
    EXPECT_FALSE(filter.should_log(LogLevel::Info, "cli"));
    EXPECT_TRUE(filter.should_log(LogLevel::Error, "other"));
    EXPECT_FALSE(filter.should_log(LogLevel::Warn, "other"));
}

TEST_F(LogFilterTest, MinLevelAcrossModules) {
    filter.parse("cursor=trace,*=warn");
    EXPECT_EQ(filter.min_level(), LogLevel::Trace);
}

TEST_F(LogFilterTest, EmptyFilter) {
    EXPECT_TRUE(filter.should_log(LogLevel::Info, "anything"));
    EXPECT_FALSE(filter.should_log(LogLevel::Debug, "anything"));
}

TEST(LogLevelFilteringTest, AllHiddenAtOff) {
    LogFilter filter;
    filter.set_default_level(LogLevel::Off);

    EXPECT_FALSE(filter.should_log(LogLevel::Trace, "any"));
    EXPECT_FALSE(filter.should_log(LogLevel::Fatal, "any"));
}

// ============================================================================
// Level Helpers
// ============================================================================

TEST(LogLevelHelpersTest, Names) {
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(level_name(LogLevel::Off), "OFF");
    EXPECT_STREQ(level_short_name(LogLevel::Debug), "DB");
    EXPECT_STREQ(level_short_name(LogLevel::Off), "--");
}

TEST(LogLevelHelpersTest, ParseLevel) {
    EXPECT_EQ(parse_level("trace"), LogLevel::Trace);
    EXPECT_EQ(parse_level("DEBUG"), LogLevel::Debug);
    EXPECT_EQ(parse_level("off"), LogLevel::Off);
    EXPECT_EQ(parse_level("garbage"), LogLevel::Info);
    EXPECT_EQ(parse_level(""), LogLevel::Info);
}

TEST(TimestampTest, Format) {
    std::string ts = format_timestamp(epoch_ms());
    // HH:MM:SS.mmm
    EXPECT_EQ(ts.size(), 12u);
    EXPECT_EQ(ts[2], ':');
    EXPECT_EQ(ts[5], ':');
    EXPECT_EQ(ts[8], '.');
}

// ============================================================================
// Helper: Capture sink that stores records in memory
// ============================================================================

class CaptureSink : public LogSink {
public:
    void write(const LogRecord& record) override {
        records.push_back({record.level, std::string(record.module), record.message});
    }
    void flush() override {}

    struct Entry {
        LogLevel level;
        std::string module;
        std::string message;
    };

    std::vector<Entry> records;
};

// ============================================================================
// LogFormatter
// ============================================================================

TEST(LogFormatterTest, DefaultFormat) {
    LogFormatter formatter;
    EXPECT_EQ(formatter.get_template(), "{time} {level_short} [{module}] {message}");
}

TEST(LogFormatterTest, FormatTokens) {
    LogFormatter formatter("{level} ({module}) {message} @{file}:{line}");
    auto record = make_record(LogLevel::Warn, "derive", "something happened");
    EXPECT_EQ(formatter.format(record), "WARN (derive) something happened @test.cpp:7");
}

TEST(LogFormatterTest, TimeMsAndUnknownTokens) {
    LogFormatter formatter("{time_ms} {nope}");
    auto record = make_record(LogLevel::Info, "cli", "");
    EXPECT_EQ(formatter.format(record), "1234567890 {nope}");
}

TEST(LogFormatterTest, SetTemplate) {
    LogFormatter formatter;
    formatter.set_template("{level_short}|{message}");
    EXPECT_EQ(formatter.format(make_record(LogLevel::Error, "json", "bad")), "ER|bad");
}

// ============================================================================
// JSON Records
// ============================================================================

TEST(JsonRecordTest, IsAParseableObject) {
    auto record = make_record(LogLevel::Error, "json", "line1\nline2\t\"quoted\"\\");
    std::string line = format_json_record(record);

    auto parsed = json::parse_json(line);
    ASSERT_TRUE(is_ok(parsed)) << line;
    const auto& doc = unwrap(parsed);
    EXPECT_EQ(doc.find("ts")->as_i64(), 1234567890);
    EXPECT_EQ(doc.find("level")->as_string(), "ERROR");
    EXPECT_EQ(doc.find("module")->as_string(), "json");
    EXPECT_EQ(doc.find("msg")->as_string(), "line1\nline2\t\"quoted\"\\");
    EXPECT_EQ(doc.find("line")->as_i64(), 7);
}

TEST(JsonRecordTest, FieldOrder) {
    std::string line = format_json_record(make_record(LogLevel::Info, "cli", "hi"));
    EXPECT_EQ(line.rfind("{\"ts\":1234567890,\"level\":\"INFO\",\"module\":\"cli\",\"msg\":\"hi\"", 0),
              0u);
}

// ============================================================================
// Sinks
// ============================================================================

class FileSinkTest : public ::testing::Test {
protected:
    fs::path temp_file;

    void SetUp() override {
        temp_file = fs::temp_directory_path() / "jcodec_log_test.log";
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

TEST_F(FileSinkTest, CreatesAndWritesFile) {
    {
        FileSink sink(temp_file.string(), false);
        ASSERT_TRUE(sink.is_open());
        sink.write(make_record(LogLevel::Info, "cli", "file sink test"));
        sink.flush();
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("INFO"), std::string::npos);
    EXPECT_NE(content.find("[cli]"), std::string::npos);
    EXPECT_NE(content.find("file sink test"), std::string::npos);
}

TEST_F(FileSinkTest, AppendsToExistingFile) {
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Info, "m1", "first"));
    }
    {
        FileSink sink(temp_file.string(), true);
        sink.write(make_record(LogLevel::Warn, "m2", "second"));
    }

    std::string content = read_file(temp_file);
    EXPECT_NE(content.find("first"), std::string::npos);
    EXPECT_NE(content.find("second"), std::string::npos);
}

TEST_F(FileSinkTest, JsonFormatWritesOneObjectPerLine) {
    {
        FileSink sink(temp_file.string(), false);
        sink.set_format(LogFormat::JSON);
        sink.write(make_record(LogLevel::Error, "json", "one"));
        sink.write(make_record(LogLevel::Info, "json", "two"));
    }

    std::istringstream lines(read_file(temp_file));
    std::string line;
    int count = 0;
    while (std::getline(lines, line)) {
        EXPECT_TRUE(is_ok(json::parse_json(line))) << line;
        ++count;
    }
    EXPECT_EQ(count, 2);
}

TEST(MultiSinkTest, FansOutToAllChildren) {
    MultiSink multi;
    auto capture1 = std::make_unique<CaptureSink>();
    auto capture2 = std::make_unique<CaptureSink>();
    auto* ptr1 = capture1.get();
    auto* ptr2 = capture2.get();
    multi.add(std::move(capture1));
    multi.add(std::move(capture2));
    multi.add(std::make_unique<NullSink>());

    EXPECT_EQ(multi.size(), 3u);
    multi.write(make_record(LogLevel::Info, "cli", "fan-out"));
    multi.flush();

    ASSERT_EQ(ptr1->records.size(), 1u);
    ASSERT_EQ(ptr2->records.size(), 1u);
    EXPECT_EQ(ptr2->records[0].message, "fan-out");
}

// ============================================================================
// CLI Option Parsing
// ============================================================================

class LogOptionsTest : public ::testing::Test {
protected:
    void SetUp() override {
        unsetenv("JCODEC_LOG");
    }

    void TearDown() override {
        unsetenv("JCODEC_LOG");
    }

    LogConfig parse(std::vector<std::string> args) {
        args.insert(args.begin(), "jcodec");
        std::vector<char*> argv;
        for (auto& arg : args) {
            argv.push_back(arg.data());
        }
        return parse_log_options(static_cast<int>(argv.size()), argv.data());
    }
};

TEST_F(LogOptionsTest, DefaultsToWarn) {
    auto config = parse({"fmt", "file.json"});
    EXPECT_EQ(config.level, LogLevel::Warn);
    EXPECT_TRUE(config.filter_spec.empty());
    EXPECT_EQ(config.format, LogFormat::Text);
}

TEST_F(LogOptionsTest, VerbosityFlags) {
    EXPECT_EQ(parse({"-v"}).level, LogLevel::Info);
    EXPECT_EQ(parse({"-vv"}).level, LogLevel::Debug);
    EXPECT_EQ(parse({"-vvv"}).level, LogLevel::Trace);
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
    EXPECT_EQ(parse({"-vvv", "--log-level=error"}).level, LogLevel::Error);
}

TEST_F(LogOptionsTest, ExplicitOptions) {
    auto config = parse({"--log-filter=json=trace", "--log-format=json", "--log-file=out.log",
                         "--log-pattern={message}"});
    EXPECT_EQ(config.filter_spec, "json=trace");
    EXPECT_EQ(config.format, LogFormat::JSON);
    EXPECT_EQ(config.log_file, "out.log");
    EXPECT_EQ(config.pattern, "{message}");
}

TEST_F(LogOptionsTest, EnvironmentFallback) {
    setenv("JCODEC_LOG", "debug", 1);
    EXPECT_EQ(parse({}).level, LogLevel::Debug);

    setenv("JCODEC_LOG", "derive=trace", 1);
    EXPECT_EQ(parse({}).filter_spec, "derive=trace");

    // Command line wins
    EXPECT_EQ(parse({"-q"}).level, LogLevel::Error);
}

TEST(LogOptionRecognitionTest, IsLogOption) {
    EXPECT_TRUE(is_log_option("-v"));
    EXPECT_TRUE(is_log_option("-vvv"));
    EXPECT_TRUE(is_log_option("--log-level=info"));
    EXPECT_TRUE(is_log_option("--quiet"));
    EXPECT_FALSE(is_log_option("-V"));
    EXPECT_FALSE(is_log_option("--compact"));
    EXPECT_FALSE(is_log_option("fmt"));
}

// ============================================================================
// Logger
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    CaptureSink* capture = nullptr;

    void SetUp() override {
        LogConfig config;
        config.console = false;
        config.level = LogLevel::Trace;
        Logger::init(config);
        auto sink = std::make_unique<CaptureSink>();
        capture = sink.get();
        Logger::instance().add_sink(std::move(sink));
    }

    void TearDown() override {
        LogConfig config;
        config.level = LogLevel::Warn;
        Logger::init(config);
    }
};

TEST_F(LoggerTest, ConcurrentLogging) {
    const int num_threads = 8;
    const int messages_per_thread = 100;

    std::vector<std::thread> threads;
    threads.reserve(num_threads);
    for (int t = 0; t < num_threads; t++) {
        threads.emplace_back([t]() {
            for (int i = 0; i < messages_per_thread; i++) {
                JCODEC_LOG_INFO("cli", "thread-" << t << "-msg-" << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(static_cast<int>(capture->records.size()), num_threads * messages_per_thread);
}

TEST_F(LoggerTest, FilterAppliesToMacros) {
    Logger::instance().set_filter("json=debug,*=off");

    JCODEC_LOG_DEBUG("json", "kept");
    JCODEC_LOG_TRACE("json", "dropped");
    JCODEC_LOG_ERROR("cli", "dropped");

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].message, "kept");
    EXPECT_EQ(capture->records[0].level, LogLevel::Debug);
}

TEST_F(LoggerTest, DecodeFailuresAreLoggedUnderJson) {
    auto result = json::from_json<std::vector<int>>("[1, \"x\"]");
    ASSERT_TRUE(is_err(result));

    bool found = false;
    for (const auto& entry : capture->records) {
        if (entry.module == "json" && entry.message.find("[1](expected a number)") !=
                                          std::string::npos) {
            found = true;
        }
    }
    EXPECT_TRUE(found);
}

TEST_F(LoggerTest, NothingBelowLevelReachesSinks) {
    Logger::instance().set_level(LogLevel::Error);
    JCODEC_LOG_WARN("cli", "hidden");
    JCODEC_LOG_ERROR("cli", "shown");

    ASSERT_EQ(capture->records.size(), 1u);
    EXPECT_EQ(capture->records[0].message, "shown");
}
