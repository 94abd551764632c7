#pragma once

/// @file crescendo_detector.h
/// @brief Detection of gradual escalation across recent turns

#include <cstddef>

#include "session/attack_detector.h"

namespace turnguard::session {

/// @brief Configuration for CrescendoDetector
struct CrescendoDetectorConfig {
    size_t window = 5;
    double increase_ratio = 0.8;
    double growth_factor = 1.5;
    size_t min_injections = 3;
};

/// @brief Flags sessions whose recent turns escalate
///
/// Looks at the newest `window` events only, and only once that many exist:
/// - score escalation: at least increase_ratio of the transitions are strict
///   increases and the last score exceeds growth_factor times the first
/// - technique escalation: at least min_injections injection turns whose
///   pattern counts never decrease
class CrescendoDetector : public AttackDetector {
public:
    explicit CrescendoDetector(CrescendoDetectorConfig config = {});

    std::string_view Name() const override { return "crescendo"; }
    std::optional<Detection> Inspect(const SessionRiskProfile& profile) const override;

private:
    CrescendoDetectorConfig config_;
};

}  // namespace turnguard::session
