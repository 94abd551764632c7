#pragma once

/// @file session_profile.h
/// @brief Bounded per-session risk aggregate

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#include "session/event_window.h"
#include "session/risk_event.h"

namespace turnguard::session {

/// @brief Risk state accumulated for one conversation session
///
/// Not synchronized; SessionRiskTracker serializes access per session.
/// Invariants:
/// - at most kMaxEvents events are retained
/// - cumulative risk never decreases (it survives window eviction)
/// - once blocked, a profile stays blocked
/// - last activity never moves backwards
class SessionRiskProfile {
public:
    static constexpr size_t kMaxEvents = 100;
    using Window = EventWindow<RiskEvent, kMaxEvents>;

    SessionRiskProfile(std::string session_id, TimePoint created_at);

    /// @brief Append an event and update the aggregates
    /// @param event Classified turn (risk_score already validated)
    /// @param high_risk_threshold Score at or above which the turn counts as high risk
    void Record(RiskEvent event, double high_risk_threshold);

    /// @brief Mark blocked; the first reason recorded is kept
    void MarkBlocked(const std::string& reason);

    const std::string& SessionId() const { return session_id_; }
    TimePoint CreatedAt() const { return created_at_; }
    TimePoint LastActivity() const { return last_activity_; }

    const Window& Events() const { return events_; }

    double CumulativeRisk() const { return cumulative_risk_; }
    int64_t HighRiskCount() const { return high_risk_count_; }
    int64_t InjectionAttempts() const { return injection_attempts_; }

    bool IsBlocked() const { return is_blocked_; }
    const std::optional<std::string>& BlockReason() const { return block_reason_; }

private:
    std::string session_id_;
    TimePoint created_at_;
    TimePoint last_activity_;

    Window events_;

    double cumulative_risk_ = 0.0;
    int64_t high_risk_count_ = 0;
    int64_t injection_attempts_ = 0;

    bool is_blocked_ = false;
    std::optional<std::string> block_reason_;
};

}  // namespace turnguard::session
