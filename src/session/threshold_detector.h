#pragma once

/// @file threshold_detector.h
/// @brief Hard limits on injection attempts and cumulative risk

#include <cstdint>

#include "session/attack_detector.h"

namespace turnguard::session {

/// @brief Configuration for ThresholdDetector
struct ThresholdDetectorConfig {
    int64_t max_injection_attempts = 5;
    double max_cumulative_risk = 5.0;
};

/// @brief Blocks once a session's lifetime totals cross fixed limits
///
/// Checked first in the chain. Injection attempts take precedence over
/// cumulative risk when both limits are reached on the same turn.
class ThresholdDetector : public AttackDetector {
public:
    explicit ThresholdDetector(ThresholdDetectorConfig config = {});

    std::string_view Name() const override { return "threshold"; }
    std::optional<Detection> Inspect(const SessionRiskProfile& profile) const override;

private:
    ThresholdDetectorConfig config_;
};

}  // namespace turnguard::session
