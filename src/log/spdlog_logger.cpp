#include "relay/log/spdlog_logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <stdexcept>

namespace relay {

namespace {

// The component is already part of the message.
constexpr const char* kPipelinePattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";

std::string unique_logger_name(std::string_view prefix) {
    static std::atomic<std::uint64_t> counter{0};
    return std::string(prefix) + "_" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed));
}

bool passes(LogLevel level, LogLevel threshold) noexcept {
    return static_cast<std::uint8_t>(level) >= static_cast<std::uint8_t>(threshold);
}

}  // namespace

spdlog::level::level_enum SpdlogLogger::to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return spdlog::level::trace;
        case LogLevel::Debug: return spdlog::level::debug;
        case LogLevel::Info:  return spdlog::level::info;
        case LogLevel::Warn:  return spdlog::level::warn;
        case LogLevel::Error: return spdlog::level::err;
        case LogLevel::Fatal: return spdlog::level::critical;
        case LogLevel::Off:   return spdlog::level::off;
    }
    return spdlog::level::info;
}

LogLevel SpdlogLogger::from_spdlog_level(spdlog::level::level_enum level) noexcept {
    switch (level) {
        case spdlog::level::trace:    return LogLevel::Trace;
        case spdlog::level::debug:    return LogLevel::Debug;
        case spdlog::level::info:     return LogLevel::Info;
        case spdlog::level::warn:     return LogLevel::Warn;
        case spdlog::level::err:      return LogLevel::Error;
        case spdlog::level::critical: return LogLevel::Fatal;
        case spdlog::level::off:      return LogLevel::Off;
        default:                      return LogLevel::Info;
    }
}

SpdlogLogger::SpdlogLogger(std::shared_ptr<spdlog::logger> logger)
    : logger_(std::move(logger))
    , default_level_(LogLevel::Info)
    , floor_(LogLevel::Info)
{
    if (!logger_) {
        throw std::invalid_argument("SpdlogLogger: logger cannot be null");
    }
    default_level_ = from_spdlog_level(logger_->level());
    floor_ = default_level_;
}

SpdlogLogger::SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level)
    : logger_(std::make_shared<spdlog::logger>(unique_logger_name("relay"), sinks.begin(), sinks.end()))
    , default_level_(min_level)
    , floor_(min_level)
{
    logger_->set_level(to_spdlog_level(min_level));
    logger_->set_pattern(kPipelinePattern);
}

void SpdlogLogger::log(const LogRecord& record) {
    if (passes(record.level, level_for(record.component)) == false) {
        return;
    }

    logger_->log(
        spdlog::source_loc{
            record.location.file_name(),
            static_cast<int>(record.location.line()),
            record.location.function_name()
        },
        to_spdlog_level(record.level),
        "[{}] {}",
        record.component,
        record.message
    );
}

bool SpdlogLogger::should_log(LogLevel level) const noexcept {
    return passes(level, floor_.load(std::memory_order_relaxed));
}

LogLevel SpdlogLogger::level_for(std::string_view component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = component_levels_.find(component);
    return (it != component_levels_.end()) ? it->second : default_level_;
}

void SpdlogLogger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    default_level_ = level;
    refresh_floor();
}

void SpdlogLogger::set_component_level(std::string component, LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    component_levels_.insert_or_assign(std::move(component), level);
    refresh_floor();
}

void SpdlogLogger::clear_component_level(const std::string& component) {
    std::lock_guard<std::mutex> lock(mutex_);
    component_levels_.erase(component);
    refresh_floor();
}

// Caller holds mutex_.
void SpdlogLogger::refresh_floor() {
    LogLevel floor = default_level_;
    for (const auto& [component, level] : component_levels_) {
        floor = std::min(floor, level);
    }
    floor_.store(floor, std::memory_order_relaxed);
    // spdlog filters again on its side; let through whatever we accept.
    logger_->set_level(to_spdlog_level(floor));
}

void SpdlogLogger::set_pattern(const std::string& pattern) {
    logger_->set_pattern(pattern);
}

void SpdlogLogger::flush() {
    logger_->flush();
}

std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(LogLevel min_level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    return std::make_unique<SpdlogLogger>(std::move(sinks), min_level);
}

std::unique_ptr<SpdlogLogger> make_spdlog_file_logger(const std::string& filename, LogLevel min_level) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(filename));
    return std::make_unique<SpdlogLogger>(std::move(sinks), min_level);
}

}  // namespace relay
