#include "session/session_profile.h"

#include <algorithm>
#include <utility>

namespace turnguard::session {

SessionRiskProfile::SessionRiskProfile(std::string session_id, TimePoint created_at)
    : session_id_(std::move(session_id)),
      created_at_(created_at),
      last_activity_(created_at) {}

void SessionRiskProfile::Record(RiskEvent event, double high_risk_threshold) {
    // A clock stepping backwards must not rewind the session
    last_activity_ = std::max(last_activity_, event.timestamp);

    cumulative_risk_ += event.risk_score;
    if (event.risk_score >= high_risk_threshold) {
        ++high_risk_count_;
    }
    if (event.IsInjection()) {
        ++injection_attempts_;
    }

    events_.Push(std::move(event));
}

void SessionRiskProfile::MarkBlocked(const std::string& reason) {
    if (is_blocked_) {
        return;
    }
    is_blocked_ = true;
    block_reason_ = reason;
}

}  // namespace turnguard::session
