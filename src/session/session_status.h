#pragma once

/// @file session_status.h
/// @brief Read-only view of a tracked session

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>
#include <nlohmann/json.hpp>

#include "session/session_profile.h"

namespace turnguard::session {

/// @brief Coarse bucket of a session's cumulative risk
enum class RiskLevel {
    kUnknown,   ///< Session not tracked
    kLow,       ///< < 1.0
    kMedium,    ///< [1.0, 2.0)
    kHigh,      ///< [2.0, 3.0)
    kCritical   ///< >= 3.0
};

std::string_view RiskLevelToString(RiskLevel level);

/// @brief Bucket a cumulative risk value
RiskLevel RiskLevelFromCumulative(double cumulative_risk);

/// @brief Snapshot of a session that exists in the tracker
struct SessionStatus {
    std::string session_id;
    bool is_blocked = false;
    std::optional<std::string> block_reason;
    RiskLevel risk_level = RiskLevel::kLow;
    double cumulative_risk = 0.0;
    int64_t injection_attempts = 0;
    int64_t high_risk_count = 0;
    size_t event_count = 0;
    std::chrono::duration<double> session_duration{0.0};  ///< now - created_at
};

/// @brief Snapshot a profile at time `now`
SessionStatus BuildSessionStatus(const SessionRiskProfile& profile, TimePoint now);

/// @brief JSON body for a status lookup
///
/// A NotFound status renders as
/// {"exists": false, "is_blocked": false, "risk_level": "unknown"}.
/// Other errors render as {"exists": false, "error": "<message>"}.
nlohmann::json SessionStatusToJson(const absl::StatusOr<SessionStatus>& status);

}  // namespace turnguard::session
