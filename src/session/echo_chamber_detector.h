#pragma once

/// @file echo_chamber_detector.h
/// @brief Detection of repeated manipulation vectors across turns
///
/// An echo chamber attack repeats the same (or nearly the same) prompt over
/// several turns to condition the model into compliance. Each turn on its
/// own scores low; the repetition is the signal. Two signals are checked:
/// - one pattern identifier recurring across the recent turns
/// - a run of turns whose risk scores are nearly identical

#include <cstddef>

#include "session/attack_detector.h"

namespace turnguard::session {

/// @brief Configuration for EchoChamberDetector
struct EchoChamberDetectorConfig {
    /// Occurrences of one pattern that trip the detector
    size_t repeat_threshold = 3;
    /// Recent events scanned for pattern repeats
    size_t lookback = 10;
    /// Score deltas below this count as "similar"
    double similarity_epsilon = 0.1;
    /// Recent events whose consecutive deltas are compared
    size_t similarity_window = 5;
    /// Similar deltas needed within similarity_window
    size_t min_similar_transitions = 4;
};

class EchoChamberDetector : public AttackDetector {
public:
    explicit EchoChamberDetector(EchoChamberDetectorConfig config = {});

    std::string_view Name() const override { return "echo_chamber"; }
    std::optional<Detection> Inspect(const SessionRiskProfile& profile) const override;

private:
    std::optional<Detection> CheckRepeatedPatterns(const SessionRiskProfile::Window& events) const;
    std::optional<Detection> CheckSimilarScores(const SessionRiskProfile::Window& events) const;

    EchoChamberDetectorConfig config_;
};

}  // namespace turnguard::session
