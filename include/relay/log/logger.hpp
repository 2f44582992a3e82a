#pragma once

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>

namespace relay {

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

/// Parse a level name ("trace", "WARN", ...). Unknown names map to Info.
[[nodiscard]] LogLevel log_level_from_string(std::string_view name) noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// LogRecord
// ─────────────────────────────────────────────────────────────────────────────
// One log event. `component` names the pipeline stage that emitted it
// ("chain", "retry", "transport", "tracing") so sinks can filter on it.

struct LogRecord {
    LogLevel level;
    std::string_view component;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string_view comp,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , component(comp)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger
// ─────────────────────────────────────────────────────────────────────────────

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void log_at(
        LogLevel level,
        std::string_view component,
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        if (should_log(level)) {
            log(LogRecord(level, component, std::string(msg), loc));
        }
    }

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log_at(LogLevel::Trace, "relay", msg, loc);
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log_at(LogLevel::Debug, "relay", msg, loc);
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log_at(LogLevel::Info, "relay", msg, loc);
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log_at(LogLevel::Warn, "relay", msg, loc);
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log_at(LogLevel::Error, "relay", msg, loc);
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        log_at(LogLevel::Fatal, "relay", msg, loc);
    }

    // Formatting is skipped entirely when the level is filtered out.
    template<typename... Args>
    void log_fmt(
        LogLevel level,
        std::string_view component,
        std::format_string<Args...> fmt,
        Args&&... args
    ) {
        if (should_log(level)) {
            log(LogRecord(level, component, std::format(fmt, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void debug_fmt(std::format_string<Args...> fmt, Args&&... args) {
        log_fmt(LogLevel::Debug, "relay", fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void info_fmt(std::format_string<Args...> fmt, Args&&... args) {
        log_fmt(LogLevel::Info, "relay", fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void warn_fmt(std::format_string<Args...> fmt, Args&&... args) {
        log_fmt(LogLevel::Warn, "relay", fmt, std::forward<Args>(args)...);
    }

    template<typename... Args>
    void error_fmt(std::format_string<Args...> fmt, Args&&... args) {
        log_fmt(LogLevel::Error, "relay", fmt, std::forward<Args>(args)...);
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// ConsoleLogger - stderr, optional ANSI colors
// ─────────────────────────────────────────────────────────────────────────────

class ConsoleLogger final : public ILogger {
public:
    explicit ConsoleLogger(LogLevel min_level = LogLevel::Info)
        : min_level_(min_level)
    {}

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override {
        return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(min_level_);
    }

    void set_level(LogLevel level) noexcept {
        min_level_ = level;
    }

    [[nodiscard]] LogLevel level() const noexcept {
        return min_level_;
    }

    void set_colors_enabled(bool enabled) noexcept {
        colors_enabled_ = enabled;
    }

private:
    LogLevel min_level_;
    bool colors_enabled_ = true;
};

// ─────────────────────────────────────────────────────────────────────────────
// Process-wide logger
// ─────────────────────────────────────────────────────────────────────────────
// Defaults to NullLogger. Every chain, middleware and transport in the
// process reports through the installed instance.

[[nodiscard]] ILogger& get_logger() noexcept;

// Passing nullptr restores the NullLogger.
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

#define RELAY_LOG_TRACE(component, msg) \
    do { if (::relay::get_logger().should_log(::relay::LogLevel::Trace)) \
         ::relay::get_logger().log_at(::relay::LogLevel::Trace, component, msg); } while(false)

#define RELAY_LOG_DEBUG(component, msg) \
    do { if (::relay::get_logger().should_log(::relay::LogLevel::Debug)) \
         ::relay::get_logger().log_at(::relay::LogLevel::Debug, component, msg); } while(false)

#define RELAY_LOG_INFO(component, msg) \
    do { if (::relay::get_logger().should_log(::relay::LogLevel::Info)) \
         ::relay::get_logger().log_at(::relay::LogLevel::Info, component, msg); } while(false)

#define RELAY_LOG_WARN(component, msg) \
    do { if (::relay::get_logger().should_log(::relay::LogLevel::Warn)) \
         ::relay::get_logger().log_at(::relay::LogLevel::Warn, component, msg); } while(false)

#define RELAY_LOG_ERROR(component, msg) \
    do { if (::relay::get_logger().should_log(::relay::LogLevel::Error)) \
         ::relay::get_logger().log_at(::relay::LogLevel::Error, component, msg); } while(false)

}  // namespace relay
