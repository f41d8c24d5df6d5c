#include "towerlink/log/logger.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iostream>
#include <mutex>

namespace towerlink {

namespace {

constexpr std::string_view kReset = "\033[0m";
constexpr std::string_view kDim   = "\033[90m";

[[nodiscard]] std::string_view level_color(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "\033[90m";
        case LogLevel::Debug: return "\033[36m";
        case LogLevel::Info:  return "\033[32m";
        case LogLevel::Warn:  return "\033[33m";
        case LogLevel::Error: return "\033[31m";
        case LogLevel::Fatal: return "\033[35m";
        case LogLevel::Off:   return kReset;
    }
    return kReset;
}

[[nodiscard]] std::string clock_time(std::chrono::system_clock::time_point tp) {
    const auto seconds = std::chrono::system_clock::to_time_t(tp);
    const auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(
        tp.time_since_epoch()
    ).count() % 1000;

    std::tm local{};
    localtime_r(&seconds, &local);
    return std::format("{:02}:{:02}:{:02}.{:03}", local.tm_hour, local.tm_min, local.tm_sec, millis);
}

[[nodiscard]] std::string_view basename_of(const char* path) noexcept {
    const std::string_view full(path);
    const auto slash = full.find_last_of('/');
    if (slash == std::string_view::npos) {
        return full;
    }
    return full.substr(slash + 1);
}

}  // namespace

LogLevel parse_log_level(std::string_view name) noexcept {
    std::string lowered(name);
    std::ranges::transform(lowered, lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });

    if (lowered == "trace") return LogLevel::Trace;
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info")  return LogLevel::Info;
    if (lowered == "warn" || lowered == "warning") return LogLevel::Warn;
    if (lowered == "error") return LogLevel::Error;
    if (lowered == "fatal" || lowered == "critical") return LogLevel::Fatal;
    if (lowered == "off")   return LogLevel::Off;
    return LogLevel::Info;
}

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger
// ─────────────────────────────────────────────────────────────────────────────

void ConsoleLogger::log(const LogRecord& record) {
    if (should_log(record.level) == false) {
        return;
    }

    std::string line;
    if (colors_enabled_) {
        line = std::format("{}{}{} {}{:<5}{} {}{}:{}{} {}\n",
            kDim, clock_time(record.timestamp), kReset,
            level_color(record.level), to_string(record.level), kReset,
            kDim, basename_of(record.location.file_name()), record.location.line(), kReset,
            record.message);
    } else {
        line = std::format("{} {:<5} {}:{} {}\n",
            clock_time(record.timestamp), to_string(record.level),
            basename_of(record.location.file_name()), record.location.line(),
            record.message);
    }

    static std::mutex output_mutex;
    std::lock_guard<std::mutex> lock(output_mutex);
    std::cerr << line;
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

namespace {

std::unique_ptr<ILogger>& logger_instance() {
    static std::unique_ptr<ILogger> instance = std::make_unique<NullLogger>();
    return instance;
}

std::mutex& logger_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // namespace

ILogger& get_logger() noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    return *logger_instance();
}

void set_logger(std::unique_ptr<ILogger> logger) noexcept {
    std::lock_guard<std::mutex> lock(logger_mutex());
    if (logger != nullptr) {
        logger_instance() = std::move(logger);
    } else {
        logger_instance() = std::make_unique<NullLogger>();
    }
}

}  // namespace towerlink
