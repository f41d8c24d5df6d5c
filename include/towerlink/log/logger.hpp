#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace towerlink {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,
    Debug = 1,
    Info  = 2,
    Warn  = 3,
    Error = 4,
    Fatal = 5,
    Off   = 6
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

/// Parse a level name as accepted on the command line ("debug", "WARN", ...).
/// Unknown names yield LogLevel::Info.
[[nodiscard]] LogLevel parse_log_level(std::string_view name) noexcept;

[[nodiscard]] constexpr bool level_enabled(LogLevel level, LogLevel threshold) noexcept {
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(threshold)
        && threshold != LogLevel::Off;
}

// ─────────────────────────────────────────────────────────────────────────────
// Log Record
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger - swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────
// The tunnel code never talks to a backend directly; it goes through the
// TOWERLINK_LOG_* macros below, which consult should_log() before formatting.

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void write(
        LogLevel level,
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        if (should_log(level)) {
            log(LogRecord(level, std::string(msg), loc));
        }
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Debug, msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Info, msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Warn, msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        write(LogLevel::Error, msg, loc);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - default backend, discards everything
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - plain stderr output, no third-party dependency
// ─────────────────────────────────────────────────────────────────────────────

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info, bool colors = true)
        : min_level_(min_level)
        , colors_enabled_(colors)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return level_enabled(level, min_level_);
    }

    void set_level(LogLevel level) noexcept { min_level_ = level; }

    [[nodiscard]] LogLevel level() const noexcept { return min_level_; }

private:
    LogLevel min_level_;
    bool colors_enabled_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

// Defaults to a NullLogger until the embedding program installs one.
[[nodiscard]] ILogger& get_logger() noexcept;

// Passing nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Format arguments are only evaluated when the level is enabled.
#define TOWERLINK_LOG(level, ...)                                                    \
    do {                                                                             \
        ::towerlink::ILogger& towerlink_log_target_ = ::towerlink::get_logger();     \
        if (towerlink_log_target_.should_log(level)) {                               \
            towerlink_log_target_.log(                                               \
                ::towerlink::LogRecord((level), std::format(__VA_ARGS__)));          \
        }                                                                            \
    } while (false)

#define TOWERLINK_LOG_TRACE(...) TOWERLINK_LOG(::towerlink::LogLevel::Trace, __VA_ARGS__)
#define TOWERLINK_LOG_DEBUG(...) TOWERLINK_LOG(::towerlink::LogLevel::Debug, __VA_ARGS__)
#define TOWERLINK_LOG_INFO(...)  TOWERLINK_LOG(::towerlink::LogLevel::Info, __VA_ARGS__)
#define TOWERLINK_LOG_WARN(...)  TOWERLINK_LOG(::towerlink::LogLevel::Warn, __VA_ARGS__)
#define TOWERLINK_LOG_ERROR(...) TOWERLINK_LOG(::towerlink::LogLevel::Error, __VA_ARGS__)

}  // namespace towerlink
