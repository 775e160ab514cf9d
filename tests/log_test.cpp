//! # Logger Unit Tests
//!
//! Level parsing, filter specs, the console and memory sinks, macro gating
//! through the global logger and REFORM_LOG handling.

#include "log/log.hpp"

#include <cstdlib>
#include <gtest/gtest.h>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

using namespace reform::log;

namespace {

auto record(LogLevel level, std::string_view module, std::string_view message) -> LogRecord {
    return {level, module, message, __FILE__, __LINE__};
}

void set_env(const char* name, const char* value) {
#ifdef _WIN32
    _putenv_s(name, value ? value : "");
#else
    if (value) {
        setenv(name, value, 1);
    } else {
        unsetenv(name);
    }
#endif
}

} // namespace

// ============================================================================
// Levels
// ============================================================================

TEST(LogLevelTest, NamesAndParsing) {
    EXPECT_STREQ(level_name(LogLevel::Trace), "TRACE");
    EXPECT_STREQ(level_name(LogLevel::Warn), "WARN");
    EXPECT_STREQ(level_name(LogLevel::Off), "OFF");

    EXPECT_EQ(parse_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_level("Error"), LogLevel::Error);
    EXPECT_EQ(parse_level("warning"), LogLevel::Warn);
    EXPECT_EQ(parse_level("verbose"), std::nullopt);
}

TEST(LogLevelTest, EscapeJson) {
    std::ostringstream out;
    escape_json(out, "a \"b\"\n\\");
    EXPECT_EQ(out.str(), "a \\\"b\\\"\\n\\\\");
}

// ============================================================================
// LogFilter
// ============================================================================

class LogFilterTest : public ::testing::Test {
protected:
    LogFilter filter;
};

TEST_F(LogFilterTest, DefaultsToWarn) {
    EXPECT_EQ(filter.threshold("rules"), LogLevel::Warn);
    EXPECT_EQ(filter.lowest(), LogLevel::Warn);
}

TEST_F(LogFilterTest, LoneLevelSetsDefault) {
    EXPECT_TRUE(filter.parse("debug"));
    EXPECT_EQ(filter.default_level(), LogLevel::Debug);
    EXPECT_EQ(filter.threshold("config"), LogLevel::Debug);
}

TEST_F(LogFilterTest, ModuleAndDefaultEntries) {
    EXPECT_TRUE(filter.parse("rules=trace, *=error"));

    EXPECT_EQ(filter.threshold("rules"), LogLevel::Trace);
    EXPECT_EQ(filter.threshold("engine"), LogLevel::Error);
    EXPECT_EQ(filter.lowest(), LogLevel::Trace);
}

TEST_F(LogFilterTest, BareModuleNamesTraceThatModule) {
    EXPECT_TRUE(filter.parse("rules,config"));

    EXPECT_EQ(filter.threshold("rules"), LogLevel::Trace);
    EXPECT_EQ(filter.threshold("config"), LogLevel::Trace);
    EXPECT_EQ(filter.threshold("rewrite"), LogLevel::Warn);
}

TEST_F(LogFilterTest, UnknownLevelIsReportedAndSkipped) {
    EXPECT_FALSE(filter.parse("rules=loud,engine=info"));

    EXPECT_EQ(filter.threshold("rules"), LogLevel::Warn);
    EXPECT_EQ(filter.threshold("engine"), LogLevel::Info);
}

TEST_F(LogFilterTest, ReparseStartsOver) {
    filter.parse("rules=trace,*=error");
    filter.parse("");

    EXPECT_EQ(filter.threshold("rules"), LogLevel::Warn);
    EXPECT_EQ(filter.default_level(), LogLevel::Warn);
}

// ============================================================================
// Sinks
// ============================================================================

TEST(ConsoleSinkTest, PlainLine) {
    std::ostringstream out;
    ConsoleSink sink(out);
    sink.write(record(LogLevel::Info, "engine", "format: 1 diagnostic(s)"));

    EXPECT_EQ(out.str(), "INFO [engine] format: 1 diagnostic(s)\n");
}

TEST(ConsoleSinkTest, ColoredLevel) {
    std::ostringstream out;
    ConsoleSink sink(out, true);
    sink.write(record(LogLevel::Warn, "config", "skipping unknown section [fmt]"));

    EXPECT_EQ(out.str(), "\033[33mWARN\033[0m [config] skipping unknown section [fmt]\n");
}

TEST(MemorySinkTest, CapturesAndClears) {
    MemorySink sink;
    sink.write(record(LogLevel::Debug, "rules", "one"));
    sink.write(record(LogLevel::Warn, "config", "two"));

    auto records = sink.records();
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].level, LogLevel::Debug);
    EXPECT_EQ(records[1].module, "config");
    EXPECT_TRUE(sink.contains("rules", "on"));
    EXPECT_FALSE(sink.contains("config", "one"));

    sink.clear();
    EXPECT_TRUE(sink.records().empty());
}

// ============================================================================
// Logger and Macros
// ============================================================================

class LoggerTest : public ::testing::Test {
protected:
    MemorySink* sink = nullptr;

    void SetUp() override {
        auto memory = std::make_unique<MemorySink>();
        sink = memory.get();
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_filter("");
        logger.set_level(LogLevel::Info);
        logger.add_sink(std::move(memory));
    }

    void TearDown() override {
        auto& logger = Logger::instance();
        logger.clear_sinks();
        logger.set_filter("");
    }
};

TEST_F(LoggerTest, MacrosRespectLevel) {
    REFORM_LOG_DEBUG("rules", "hidden");
    REFORM_LOG_INFO("rules", "shown " << 42);

    auto records = sink->records();
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].message, "shown 42");
    EXPECT_EQ(records[0].level, LogLevel::Info);
}

TEST_F(LoggerTest, ModuleEntryBelowDefault) {
    EXPECT_TRUE(Logger::instance().set_filter("rules=trace,*=error"));

    REFORM_LOG_TRACE("rules", "traced");
    REFORM_LOG_WARN("engine", "dropped");
    REFORM_LOG_ERROR("engine", "kept");

    EXPECT_TRUE(sink->contains("rules", "traced"));
    EXPECT_FALSE(sink->contains("engine", "dropped"));
    EXPECT_TRUE(sink->contains("engine", "kept"));
}

TEST_F(LoggerTest, MessageIsNotBuiltWhenFiltered) {
    int evaluated = 0;
    auto count = [&evaluated]() { return ++evaluated; };

    REFORM_LOG_TRACE("rewrite", "value " << count());
    EXPECT_EQ(evaluated, 0);

    REFORM_LOG_INFO("rewrite", "value " << count());
    EXPECT_EQ(evaluated, 1);
}

TEST_F(LoggerTest, ConcurrentLogging) {
    constexpr int THREADS = 4;
    constexpr int MESSAGES = 100;

    std::vector<std::thread> threads;
    for (int t = 0; t < THREADS; ++t) {
        threads.emplace_back([t]() {
            for (int i = 0; i < MESSAGES; ++i) {
                REFORM_LOG_INFO("engine", "thread " << t << " message " << i);
            }
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(sink->records().size(), static_cast<size_t>(THREADS * MESSAGES));
}

// ============================================================================
// Environment
// ============================================================================

class LogEnvTest : public ::testing::Test {
protected:
    void TearDown() override {
        set_env("REFORM_LOG", nullptr);
    }
};

TEST_F(LogEnvTest, UnsetGivesDefaults) {
    set_env("REFORM_LOG", nullptr);
    auto filter = filter_from_env();
    EXPECT_EQ(filter.default_level(), LogLevel::Warn);
    EXPECT_EQ(filter.lowest(), LogLevel::Warn);
}

TEST_F(LogEnvTest, LevelName) {
    set_env("REFORM_LOG", "debug");
    EXPECT_EQ(filter_from_env().default_level(), LogLevel::Debug);
}

TEST_F(LogEnvTest, FilterSpec) {
    set_env("REFORM_LOG", "rules=trace,*=error");
    auto filter = filter_from_env();
    EXPECT_EQ(filter.threshold("rules"), LogLevel::Trace);
    EXPECT_EQ(filter.threshold("config"), LogLevel::Error);
}
