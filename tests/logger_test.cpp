#include <catch2/catch_test_macros.hpp>

#include "towerlink/log/logger.hpp"

#include "test_support.hpp"

#include <string_view>

using namespace towerlink;
using towerlink::testing::TestLogger;

// ─────────────────────────────────────────────────────────────────────────────
// Levels
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("LogLevel to_string returns correct names", "[log]") {
    REQUIRE(to_string(LogLevel::Trace) == "TRACE");
    REQUIRE(to_string(LogLevel::Debug) == "DEBUG");
    REQUIRE(to_string(LogLevel::Info) == "INFO");
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
    REQUIRE(to_string(LogLevel::Error) == "ERROR");
    REQUIRE(to_string(LogLevel::Fatal) == "FATAL");
    REQUIRE(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("parse_log_level accepts command-line names", "[log]") {
    REQUIRE(parse_log_level("trace") == LogLevel::Trace);
    REQUIRE(parse_log_level("DEBUG") == LogLevel::Debug);
    REQUIRE(parse_log_level("Warn") == LogLevel::Warn);
    REQUIRE(parse_log_level("warning") == LogLevel::Warn);
    REQUIRE(parse_log_level("error") == LogLevel::Error);
    REQUIRE(parse_log_level("critical") == LogLevel::Fatal);
    REQUIRE(parse_log_level("off") == LogLevel::Off);
}

TEST_CASE("parse_log_level falls back to info", "[log]") {
    REQUIRE(parse_log_level("") == LogLevel::Info);
    REQUIRE(parse_log_level("verbose") == LogLevel::Info);
}

TEST_CASE("level_enabled never passes an Off threshold", "[log]") {
    REQUIRE(level_enabled(LogLevel::Warn, LogLevel::Info));
    REQUIRE_FALSE(level_enabled(LogLevel::Debug, LogLevel::Info));
    REQUIRE_FALSE(level_enabled(LogLevel::Off, LogLevel::Off));
    REQUIRE_FALSE(level_enabled(LogLevel::Fatal, LogLevel::Off));
}

// ─────────────────────────────────────────────────────────────────────────────
// Backends
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("NullLogger discards all messages", "[log]") {
    NullLogger logger;

    REQUIRE(logger.should_log(LogLevel::Trace) == false);
    REQUIRE(logger.should_log(LogLevel::Fatal) == false);

    logger.debug("test");
    logger.info("test");
    logger.warn("test");
    logger.error("test");
}

TEST_CASE("TestLogger captures messages at or above min level", "[log]") {
    TestLogger logger(LogLevel::Warn);

    logger.debug("debug message");
    logger.info("info message");
    logger.warn("warn message");
    logger.error("error message");

    const auto records = logger.records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].level == LogLevel::Warn);
    REQUIRE(records[0].message == "warn message");
    REQUIRE(records[1].level == LogLevel::Error);
    REQUIRE(records[1].message == "error message");
}

TEST_CASE("LogRecord captures source location", "[log]") {
    TestLogger logger;
    logger.info("test message");

    const auto records = logger.records();
    REQUIRE(records.size() == 1);

    std::string_view filename(records[0].location.file_name());
    REQUIRE(filename.find("logger_test") != std::string_view::npos);
    REQUIRE(records[0].location.line() > 0);
}

TEST_CASE("LogRecord captures timestamp", "[log]") {
    TestLogger logger;

    auto before = std::chrono::system_clock::now();
    logger.info("test message");
    auto after = std::chrono::system_clock::now();

    const auto records = logger.records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].timestamp >= before);
    REQUIRE(records[0].timestamp <= after);
}

TEST_CASE("ConsoleLogger respects min level", "[log]") {
    ConsoleLogger logger(LogLevel::Error);

    REQUIRE(logger.should_log(LogLevel::Trace) == false);
    REQUIRE(logger.should_log(LogLevel::Info) == false);
    REQUIRE(logger.should_log(LogLevel::Warn) == false);
    REQUIRE(logger.should_log(LogLevel::Error) == true);
    REQUIRE(logger.should_log(LogLevel::Fatal) == true);
}

TEST_CASE("ConsoleLogger level can be changed", "[log]") {
    ConsoleLogger logger(LogLevel::Error, false);

    REQUIRE(logger.level() == LogLevel::Error);
    REQUIRE(logger.should_log(LogLevel::Warn) == false);

    logger.set_level(LogLevel::Warn);

    REQUIRE(logger.level() == LogLevel::Warn);
    REQUIRE(logger.should_log(LogLevel::Warn) == true);
    logger.warn("console output without colors");
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Global logger defaults to NullLogger", "[log]") {
    set_logger(nullptr);
    REQUIRE(get_logger().should_log(LogLevel::Fatal) == false);
}

TEST_CASE("Global logger can be swapped", "[log]") {
    towerlink::testing::ScopedTestLogger scoped;

    get_logger().info("test message");

    REQUIRE(scoped->count() == 1);
    REQUIRE(scoped->records()[0].message == "test message");
}

TEST_CASE("TOWERLINK_LOG macros format and filter", "[log]") {
    towerlink::testing::ScopedTestLogger scoped(LogLevel::Debug);

    TOWERLINK_LOG_TRACE("trace {}", 1);
    TOWERLINK_LOG_DEBUG("debug {}", 2);
    TOWERLINK_LOG_INFO("info {}", "three");
    TOWERLINK_LOG_WARN("warn");
    TOWERLINK_LOG_ERROR("error {}:{}", "host", 443);

    const auto records = scoped->records();
    REQUIRE(records.size() == 4);
    REQUIRE(records[0].level == LogLevel::Debug);
    REQUIRE(records[0].message == "debug 2");
    REQUIRE(records[1].message == "info three");
    REQUIRE(records[2].level == LogLevel::Warn);
    REQUIRE(records[3].message == "error host:443");
}

TEST_CASE("TOWERLINK_LOG skips formatting when the level is disabled", "[log]") {
    towerlink::testing::ScopedTestLogger scoped(LogLevel::Error);

    int evaluations = 0;
    auto expensive = [&evaluations] {
        ++evaluations;
        return 42;
    };

    TOWERLINK_LOG_DEBUG("value {}", expensive());
    REQUIRE(evaluations == 0);

    TOWERLINK_LOG_ERROR("value {}", expensive());
    REQUIRE(evaluations == 1);
}
