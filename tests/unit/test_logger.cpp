/**
 * @file test_logger.cpp
 * @brief Unit tests for Logger, log sinks and LoggingObserver.
 */

#include "client/observer.hpp"
#include "core/logger.hpp"
#include "telemetry/log_sinks.hpp"

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

using namespace statsd_emitter;

namespace {

struct CaptureSink : ILogSink {
    explicit CaptureSink(std::vector<std::string>& out) : lines(out) {}
    void write(std::string_view json_line) override { lines.emplace_back(json_line); }
    void flush() override { ++flushes; }

    std::vector<std::string>& lines;
    int flushes = 0;
};

}  // namespace

TEST(LoggerTest, FiltersBelowLevel) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Warn);

    logger.debug("d");
    logger.info("i");
    logger.warn("w");
    logger.error("e");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_NE(lines[0].find(R"("level":"warn")"), std::string::npos);
    EXPECT_NE(lines[1].find(R"("level":"error")"), std::string::npos);
}

TEST(LoggerTest, JsonShape) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Info, "unit");
    logger.info(R"(say "hi")");

    ASSERT_EQ(lines.size(), 1u);
    const auto& line = lines[0];
    EXPECT_EQ(line.front(), '{');
    EXPECT_EQ(line.back(), '}');
    EXPECT_NE(line.find(R"("ts":")"), std::string::npos);
    EXPECT_NE(line.find(R"("logger":"unit")"), std::string::npos);
    EXPECT_NE(line.find(R"("msg":"say \"hi\"")"), std::string::npos);
}

TEST(LoggerTest, SetLevel) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines));
    EXPECT_FALSE(logger.enabled(LogLevel::Debug));
    logger.set_level(LogLevel::Debug);
    EXPECT_EQ(logger.level(), LogLevel::Debug);
    logger.debug("now visible");
    EXPECT_EQ(lines.size(), 1u);
}

TEST(LoggerTest, ParseLogLevel) {
    EXPECT_EQ(parse_log_level("debug"), LogLevel::Debug);
    EXPECT_EQ(parse_log_level("error"), LogLevel::Error);
    EXPECT_FALSE(parse_log_level("loud").has_value());
}

TEST(LoggerTest, JsonEscape) {
    EXPECT_EQ(json_escape("plain"), "plain");
    EXPECT_EQ(json_escape("a\nb"), "a\\nb");
    EXPECT_EQ(json_escape("tab\there"), "tab\\there");
    EXPECT_EQ(json_escape(std::string_view("\x01", 1)), "\\u0001");
    EXPECT_EQ(json_escape("back\\slash"), "back\\\\slash");
}

TEST(LoggerTest, FileSinkAppends) {
    auto path = std::filesystem::temp_directory_path() / "statsd_test_logger" / "out.ndjson";
    std::filesystem::remove_all(path.parent_path());
    {
        Logger logger(std::make_unique<FileSink>(path));
        logger.info("first");
        logger.info("second");
        logger.flush();
    }

    std::ifstream in(path);
    std::string line;
    int count = 0;
    while (std::getline(in, line)) ++count;
    EXPECT_EQ(count, 2);
    std::filesystem::remove_all(path.parent_path());
}

TEST(LoggingObserverTest, LogsLinesAtDebug) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Debug);
    LoggingObserver observer(logger);

    observer.on_send("app.hits:1|c|@0.5", MetricRequest{MetricKind::Counter, int64_t{1}, 0.5});
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_NE(lines[0].find("app.hits:1|c|@0.5"), std::string::npos);
    EXPECT_NE(lines[0].find("kind=counter"), std::string::npos);
}

TEST(LoggingObserverTest, SilentAboveDebug) {
    std::vector<std::string> lines;
    Logger logger(std::make_unique<CaptureSink>(lines), LogLevel::Info);
    LoggingObserver observer(logger);
    observer.on_send("x:1|c", MetricRequest{});
    EXPECT_TRUE(lines.empty());
}
