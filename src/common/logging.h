#pragma once

/// @file logging.h
/// @brief TurnGuard logging utilities wrapping spdlog

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>

namespace turnguard {

/// @brief Log levels matching spdlog levels
enum class LogLevel {
    kTrace = spdlog::level::trace,
    kDebug = spdlog::level::debug,
    kInfo = spdlog::level::info,
    kWarn = spdlog::level::warn,
    kError = spdlog::level::err,
    kCritical = spdlog::level::critical,
    kOff = spdlog::level::off
};

/// @brief Logging configuration
struct LogConfig {
    std::string name = "turnguard";
    LogLevel level = LogLevel::kInfo;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] [%t] %v";

    // Console output goes to stderr so replay output on stdout stays parseable
    bool log_to_stderr = true;

    // File logging (optional)
    bool enable_file = false;
    std::string file_path = "turnguard.log";
    size_t max_file_size = 10 * 1024 * 1024;  // 10 MB
    size_t max_files = 5;
};

/// @brief Initialize the global logger with the given configuration
/// @param config Logging configuration
void InitLogging(const LogConfig& config = {});

/// @brief Get the global logger instance
std::shared_ptr<spdlog::logger> GetLogger();

/// @brief Set the global log level
void SetLogLevel(LogLevel level);

/// @brief Parse a level name ("trace", "debug", "info", "warn", "error",
///        "critical", "off"); unknown names map to kInfo
LogLevel LogLevelFromString(std::string_view name);

/// @brief Flush all log messages
void FlushLogs();

/// @brief Shutdown the logging system
void ShutdownLogging();

// Convenience macros for logging
#define TURNGUARD_LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::turnguard::GetLogger(), __VA_ARGS__)
#define TURNGUARD_LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::turnguard::GetLogger(), __VA_ARGS__)
#define TURNGUARD_LOG_INFO(...) SPDLOG_LOGGER_INFO(::turnguard::GetLogger(), __VA_ARGS__)
#define TURNGUARD_LOG_WARN(...) SPDLOG_LOGGER_WARN(::turnguard::GetLogger(), __VA_ARGS__)
#define TURNGUARD_LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::turnguard::GetLogger(), __VA_ARGS__)
#define TURNGUARD_LOG_CRITICAL(...) SPDLOG_LOGGER_CRITICAL(::turnguard::GetLogger(), __VA_ARGS__)

}  // namespace turnguard
