#include "session/tracker_config.h"

#include <cmath>
#include <string>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "session/session_profile.h"

namespace turnguard::session {

namespace {

absl::Status ReadCount(const Config& config, const std::string& key, size_t* out) {
    if (!config.HasKey(key)) {
        return absl::OkStatus();
    }
    int64_t value = config.GetInt(key, -1);
    if (value < 0) {
        return MakeError(ErrorCode::kConfigurationError,
                         absl::StrCat(key, " must be a non-negative integer"));
    }
    *out = static_cast<size_t>(value);
    return absl::OkStatus();
}

absl::Status CheckWindow(const char* name, size_t value, size_t min) {
    if (value < min || value > SessionRiskProfile::kMaxEvents) {
        return absl::InvalidArgumentError(absl::StrCat(
            name, " must be between ", min, " and ", SessionRiskProfile::kMaxEvents,
            ", got ", value));
    }
    return absl::OkStatus();
}

bool IsPositive(double value) {
    return std::isfinite(value) && value > 0.0;
}

}  // namespace

absl::StatusOr<SessionTrackerConfig> SessionTrackerConfig::FromConfig(const Config& config) {
    SessionTrackerConfig out;

    out.high_risk_threshold =
        config.GetDouble("tracker.high_risk_threshold", out.high_risk_threshold);
    out.max_cumulative_risk =
        config.GetDouble("tracker.max_cumulative_risk", out.max_cumulative_risk);
    out.max_injection_attempts =
        config.GetInt("tracker.max_injection_attempts", out.max_injection_attempts);

    if (config.HasKey("tracker.session_idle_timeout_seconds")) {
        int64_t seconds = config.GetInt("tracker.session_idle_timeout_seconds", -1);
        if (seconds <= 0) {
            return MakeError(ErrorCode::kConfigurationError,
                             "tracker.session_idle_timeout_seconds must be positive");
        }
        out.session_idle_timeout = std::chrono::seconds(seconds);
    }

    TURNGUARD_RETURN_IF_ERROR(ReadCount(config, "tracker.max_sessions", &out.max_sessions));
    TURNGUARD_RETURN_IF_ERROR(
        ReadCount(config, "tracker.eviction_headroom", &out.eviction_headroom));

    TURNGUARD_RETURN_IF_ERROR(
        ReadCount(config, "tracker.echo.repeat_threshold", &out.echo_repeat_threshold));
    TURNGUARD_RETURN_IF_ERROR(ReadCount(config, "tracker.echo.lookback", &out.echo_lookback));
    TURNGUARD_RETURN_IF_ERROR(
        ReadCount(config, "tracker.echo.similarity_window", &out.echo_similarity_window));
    TURNGUARD_RETURN_IF_ERROR(ReadCount(config, "tracker.echo.min_similar_transitions",
                                        &out.echo_min_similar_transitions));
    out.echo_similarity_epsilon =
        config.GetDouble("tracker.echo.similarity_epsilon", out.echo_similarity_epsilon);

    TURNGUARD_RETURN_IF_ERROR(
        ReadCount(config, "tracker.crescendo.window", &out.crescendo_window));
    TURNGUARD_RETURN_IF_ERROR(
        ReadCount(config, "tracker.crescendo.min_injections", &out.crescendo_min_injections));
    out.crescendo_increase_ratio =
        config.GetDouble("tracker.crescendo.increase_ratio", out.crescendo_increase_ratio);
    out.crescendo_growth_factor =
        config.GetDouble("tracker.crescendo.growth_factor", out.crescendo_growth_factor);

    TURNGUARD_RETURN_IF_ERROR(out.Validate());
    return out;
}

absl::Status SessionTrackerConfig::Validate() const {
    if (!IsPositive(high_risk_threshold)) {
        return absl::InvalidArgumentError("high_risk_threshold must be positive");
    }
    if (session_idle_timeout.count() <= 0) {
        return absl::InvalidArgumentError("session_idle_timeout must be positive");
    }
    if (max_sessions == 0) {
        return absl::InvalidArgumentError("max_sessions must be at least 1");
    }
    if (max_injection_attempts < 1) {
        return absl::InvalidArgumentError("max_injection_attempts must be at least 1");
    }
    if (!IsPositive(max_cumulative_risk)) {
        return absl::InvalidArgumentError("max_cumulative_risk must be positive");
    }

    if (echo_repeat_threshold == 0) {
        return absl::InvalidArgumentError("echo_repeat_threshold must be at least 1");
    }
    TURNGUARD_RETURN_IF_ERROR(CheckWindow("echo_lookback", echo_lookback, 1));
    TURNGUARD_RETURN_IF_ERROR(
        CheckWindow("echo_similarity_window", echo_similarity_window, 2));
    if (echo_min_similar_transitions == 0 ||
        echo_min_similar_transitions >= echo_similarity_window) {
        return absl::InvalidArgumentError(
            "echo_min_similar_transitions must be in [1, echo_similarity_window)");
    }
    if (!IsPositive(echo_similarity_epsilon)) {
        return absl::InvalidArgumentError("echo_similarity_epsilon must be positive");
    }

    TURNGUARD_RETURN_IF_ERROR(CheckWindow("crescendo_window", crescendo_window, 2));
    if (!IsPositive(crescendo_increase_ratio) || crescendo_increase_ratio > 1.0) {
        return absl::InvalidArgumentError("crescendo_increase_ratio must be in (0, 1]");
    }
    if (!IsPositive(crescendo_growth_factor)) {
        return absl::InvalidArgumentError("crescendo_growth_factor must be positive");
    }
    if (crescendo_min_injections == 0) {
        return absl::InvalidArgumentError("crescendo_min_injections must be at least 1");
    }

    return absl::OkStatus();
}

TimePoint SessionTrackerConfig::Now() const {
    if (time_source) {
        return time_source();
    }
    return std::chrono::system_clock::now();
}

}  // namespace turnguard::session
