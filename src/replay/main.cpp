/// @file main.cpp
/// @brief turnguard-replay: run a recorded transcript through the session tracker

#include <iostream>
#include <optional>
#include <string>

#include <CLI/CLI.hpp>
#include <nlohmann/json.hpp>

#include "common/config.h"
#include "common/logging.h"
#include "common/metrics.h"
#include "common/thread_pool.h"
#include "replay/replayer.h"
#include "replay/transcript.h"
#include "session/session_risk_tracker.h"
#include "session/session_status.h"

namespace {

constexpr int kExitOk = 0;
constexpr int kExitError = 1;
constexpr int kExitBlocked = 2;

void PrintText(const turnguard::replay::ReplayReport& report) {
    for (const auto& blocked : report.blocked_turns) {
        std::cout << "BLOCK " << blocked.session_id << " line " << blocked.line_number
                  << ": " << blocked.reason << "\n";
    }
    for (const auto& status : report.sessions) {
        std::cout << status.session_id
                  << " risk=" << turnguard::session::RiskLevelToString(status.risk_level)
                  << " cumulative=" << status.cumulative_risk
                  << " injections=" << status.injection_attempts
                  << " events=" << status.event_count
                  << (status.is_blocked ? " BLOCKED (" + status.block_reason.value_or("") + ")"
                                        : "")
                  << "\n";
    }
    std::cout << report.turns_replayed << " turns, " << report.sessions.size()
              << " sessions, " << report.BlockedSessions() << " blocked" << std::endl;
}

void PrintJson(const turnguard::replay::ReplayReport& report) {
    nlohmann::json out;
    out["turns_replayed"] = report.turns_replayed;

    out["blocked_turns"] = nlohmann::json::array();
    for (const auto& blocked : report.blocked_turns) {
        out["blocked_turns"].push_back({{"session_id", blocked.session_id},
                                        {"line", blocked.line_number},
                                        {"reason", blocked.reason}});
    }

    out["sessions"] = nlohmann::json::array();
    for (const auto& status : report.sessions) {
        out["sessions"].push_back(turnguard::session::SessionStatusToJson(status));
    }
    std::cout << out.dump(2) << std::endl;
}

}  // namespace

int main(int argc, char* argv[]) {
    CLI::App app{"turnguard-replay - replay classified turns through the session risk tracker"};

    std::string config_path;
    std::string transcript_path;
    std::string log_level = "info";
    size_t threads = 0;
    bool json_output = false;
    bool print_metrics = false;

    app.add_option("-c,--config", config_path, "Path to YAML configuration file");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)");
    app.add_option("--threads", threads, "Worker threads (0 = hardware concurrency)");
    app.add_flag("--json", json_output, "Print the report as JSON");
    app.add_flag("--metrics", print_metrics, "Print tracker metrics to stderr when done");
    app.add_option("transcript", transcript_path, "JSON Lines transcript of classified turns")
        ->required();

    CLI11_PARSE(app, argc, argv);

    std::optional<std::filesystem::path> config_file;
    if (!config_path.empty()) {
        config_file = config_path;
    }

    auto config = turnguard::Config::LoadLayered(config_file);
    if (!config.ok()) {
        std::cerr << "Failed to load config: " << config.status().message() << std::endl;
        return kExitError;
    }

    turnguard::LogConfig log_config;
    log_config.name = "turnguard-replay";
    // An explicit --log-level wins over the file and environment
    if (app.count("--log-level") == 0 && config->HasKey("logging.level")) {
        log_level = config->GetString("logging.level");
    }
    log_config.level = turnguard::LogLevelFromString(log_level);
    if (config->HasKey("logging.file")) {
        log_config.enable_file = true;
        log_config.file_path = config->GetString("logging.file");
    }
    // Nothing may log before this point: the first log call fixes the sinks
    turnguard::InitLogging(log_config);
    if (config_file) {
        TURNGUARD_LOG_INFO("Loaded configuration from {}", config_file->string());
    }

    auto tracker_config = turnguard::session::SessionTrackerConfig::FromConfig(*config);
    if (!tracker_config.ok()) {
        TURNGUARD_LOG_ERROR("Invalid tracker configuration: {}",
                            tracker_config.status().message());
        return kExitError;
    }

    auto tracker = turnguard::session::SessionRiskTracker::Create(*std::move(tracker_config));
    if (!tracker.ok()) {
        TURNGUARD_LOG_ERROR("Failed to create tracker: {}", tracker.status().message());
        return kExitError;
    }

    auto turns = turnguard::replay::LoadTranscript(transcript_path);
    if (!turns.ok()) {
        TURNGUARD_LOG_ERROR("Failed to load transcript: {}", turns.status().message());
        return kExitError;
    }
    TURNGUARD_LOG_INFO("Loaded {} turns from {}", turns->size(), transcript_path);

    turnguard::ThreadPool pool(threads);
    auto report = turnguard::replay::Replay(**tracker, *std::move(turns), pool);
    if (!report.ok()) {
        TURNGUARD_LOG_ERROR("Replay failed: {}", report.status().message());
        return kExitError;
    }

    if (json_output) {
        PrintJson(*report);
    } else {
        PrintText(*report);
    }
    if (print_metrics) {
        std::cerr << turnguard::MetricsRegistry::Instance().ExportText();
    }

    turnguard::ShutdownLogging();
    return report->BlockedSessions() > 0 ? kExitBlocked : kExitOk;
}
