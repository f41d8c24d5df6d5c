#pragma once

#include "towerlink/log/logger.hpp"

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <vector>

namespace towerlink {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backend on top of spdlog
// ─────────────────────────────────────────────────────────────────────────────
// Used by the towerlink daemon binary. Loggers are never registered in
// spdlog's global registry, so several instances (tests, embedding
// programs) can coexist.

class SpdlogLogger final : public ILogger {
public:
    /// Default line layout: [date time] [level] [file:line] message
    static constexpr const char* kDefaultPattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%s:%#] %v";

    /// Wrap an existing spdlog logger. Throws std::invalid_argument on null.
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Build a logger over the given sinks.
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return level_enabled(level, min_level_);
    }

    void set_level(LogLevel level) noexcept;
    void set_pattern(const std::string& pattern);
    void flush();

    [[nodiscard]] std::shared_ptr<spdlog::logger> spdlog_logger() const noexcept {
        return logger_;
    }

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// Console plus file, the layout the daemon uses when --log-file is given.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

/// File logging through spdlog's background thread pool.
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_async_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info,
    std::size_t queue_size = 8192
);

}  // namespace towerlink
