#include "session/threshold_detector.h"

namespace turnguard::session {

ThresholdDetector::ThresholdDetector(ThresholdDetectorConfig config) : config_(config) {}

std::optional<Detection> ThresholdDetector::Inspect(const SessionRiskProfile& profile) const {
    if (profile.InjectionAttempts() >= config_.max_injection_attempts) {
        return Detection{std::string(Name()), "Multiple injection attempts detected"};
    }
    if (profile.CumulativeRisk() >= config_.max_cumulative_risk) {
        return Detection{std::string(Name()), "Cumulative risk threshold exceeded"};
    }
    return std::nullopt;
}

}  // namespace turnguard::session
