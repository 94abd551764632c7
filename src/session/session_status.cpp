#include "session/session_status.h"

#include <algorithm>

#include <absl/status/status.h>

namespace turnguard::session {

std::string_view RiskLevelToString(RiskLevel level) {
    switch (level) {
        case RiskLevel::kLow:
            return "low";
        case RiskLevel::kMedium:
            return "medium";
        case RiskLevel::kHigh:
            return "high";
        case RiskLevel::kCritical:
            return "critical";
        case RiskLevel::kUnknown:
        default:
            return "unknown";
    }
}

RiskLevel RiskLevelFromCumulative(double cumulative_risk) {
    if (cumulative_risk >= 3.0) {
        return RiskLevel::kCritical;
    }
    if (cumulative_risk >= 2.0) {
        return RiskLevel::kHigh;
    }
    if (cumulative_risk >= 1.0) {
        return RiskLevel::kMedium;
    }
    return RiskLevel::kLow;
}

SessionStatus BuildSessionStatus(const SessionRiskProfile& profile, TimePoint now) {
    SessionStatus status;
    status.session_id = profile.SessionId();
    status.is_blocked = profile.IsBlocked();
    status.block_reason = profile.BlockReason();
    status.risk_level = RiskLevelFromCumulative(profile.CumulativeRisk());
    status.cumulative_risk = profile.CumulativeRisk();
    status.injection_attempts = profile.InjectionAttempts();
    status.high_risk_count = profile.HighRiskCount();
    status.event_count = profile.Events().Size();
    // A clock stepping backwards reports zero rather than a negative age
    status.session_duration = std::max(std::chrono::duration<double>(now - profile.CreatedAt()),
                                       std::chrono::duration<double>::zero());
    return status;
}

nlohmann::json SessionStatusToJson(const absl::StatusOr<SessionStatus>& status) {
    nlohmann::json j;
    if (!status.ok()) {
        j["exists"] = false;
        if (absl::IsNotFound(status.status())) {
            j["is_blocked"] = false;
            j["risk_level"] = std::string(RiskLevelToString(RiskLevel::kUnknown));
        } else {
            j["error"] = std::string(status.status().message());
        }
        return j;
    }

    j["exists"] = true;
    j["session_id"] = status->session_id;
    j["is_blocked"] = status->is_blocked;
    if (status->block_reason) {
        j["block_reason"] = *status->block_reason;
    } else {
        j["block_reason"] = nullptr;
    }
    j["risk_level"] = std::string(RiskLevelToString(status->risk_level));
    j["cumulative_risk"] = status->cumulative_risk;
    j["injection_attempts"] = status->injection_attempts;
    j["high_risk_count"] = status->high_risk_count;
    j["event_count"] = status->event_count;
    j["session_duration"] = status->session_duration.count();
    return j;
}

}  // namespace turnguard::session
