#pragma once

#include "relay/log/logger.hpp"

#include <atomic>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace relay {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger
// ─────────────────────────────────────────────────────────────────────────────
// Routes relay log records into an spdlog logger. Each record is written as
// "[component] message", and a component ("retry", "transport", ...) can be
// given its own threshold, e.g. Debug for "retry" while the rest of the
// pipeline stays at Warn:
//
//   auto logger = make_spdlog_console_logger(LogLevel::Warn);
//   logger->set_component_level("retry", LogLevel::Debug);
//   set_logger(std::move(logger));

class SpdlogLogger final : public ILogger {
public:
    /// Wrap an existing spdlog logger; its current level becomes ours.
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Any combination of sinks.
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level = LogLevel::Info);

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;

    void log(const LogRecord& record) override;

    /// True if any component would accept `level`.
    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    /// Threshold applied to records from `component`.
    [[nodiscard]] LogLevel level_for(std::string_view component) const;

    void set_level(LogLevel level);
    void set_component_level(std::string component, LogLevel level);
    void clear_component_level(const std::string& component);

    void set_pattern(const std::string& pattern);
    void flush();

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    void refresh_floor();

    std::shared_ptr<spdlog::logger> logger_;

    mutable std::mutex mutex_;
    LogLevel default_level_;
    std::map<std::string, LogLevel, std::less<>> component_levels_;
    std::atomic<LogLevel> floor_;   // lowest threshold in effect
};

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(
    const std::string& filename,
    LogLevel min_level = LogLevel::Info
);

}  // namespace relay
