#include "logging.h"

#include <mutex>
#include <vector>

namespace turnguard {

namespace {

std::shared_ptr<spdlog::logger> g_logger;
std::once_flag g_init_flag;

spdlog::level::level_enum ToSpdlog(LogLevel level) {
    return static_cast<spdlog::level::level_enum>(level);
}

}  // namespace

void InitLogging(const LogConfig& config) {
    std::call_once(g_init_flag, [&config]() {
        std::vector<spdlog::sink_ptr> sinks;

        spdlog::sink_ptr console_sink;
        if (config.log_to_stderr) {
            console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
        } else {
            console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        }
        console_sink->set_level(ToSpdlog(config.level));
        sinks.push_back(console_sink);

        if (config.enable_file) {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                config.file_path,
                config.max_file_size,
                config.max_files
            );
            file_sink->set_level(ToSpdlog(config.level));
            sinks.push_back(file_sink);
        }

        g_logger = std::make_shared<spdlog::logger>(config.name, sinks.begin(), sinks.end());
        g_logger->set_level(ToSpdlog(config.level));
        g_logger->set_pattern(config.pattern);

        spdlog::set_default_logger(g_logger);

        // Block decisions are logged at warn; make sure they reach disk
        g_logger->flush_on(spdlog::level::warn);
    });
}

std::shared_ptr<spdlog::logger> GetLogger() {
    // call_once also orders this read after the initializing write
    InitLogging();
    return g_logger;
}

void SetLogLevel(LogLevel level) {
    auto logger = GetLogger();
    logger->set_level(ToSpdlog(level));
    for (auto& sink : logger->sinks()) {
        sink->set_level(ToSpdlog(level));
    }
}

LogLevel LogLevelFromString(std::string_view name) {
    if (name == "trace") return LogLevel::kTrace;
    if (name == "debug") return LogLevel::kDebug;
    if (name == "warn" || name == "warning") return LogLevel::kWarn;
    if (name == "error") return LogLevel::kError;
    if (name == "critical") return LogLevel::kCritical;
    if (name == "off") return LogLevel::kOff;
    return LogLevel::kInfo;
}

void FlushLogs() {
    if (g_logger) {
        g_logger->flush();
    }
}

void ShutdownLogging() {
    if (g_logger) {
        g_logger->flush();
        spdlog::shutdown();
        g_logger.reset();
    }
}

}  // namespace turnguard
