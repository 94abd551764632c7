#include "session/attack_detector.h"

#include "session/crescendo_detector.h"
#include "session/echo_chamber_detector.h"
#include "session/threshold_detector.h"
#include "session/tracker_config.h"

namespace turnguard::session {

DetectorChain CreateDefaultDetectorChain(const SessionTrackerConfig& config) {
    DetectorChain chain;

    ThresholdDetectorConfig thresholds;
    thresholds.max_injection_attempts = config.max_injection_attempts;
    thresholds.max_cumulative_risk = config.max_cumulative_risk;
    chain.push_back(std::make_unique<ThresholdDetector>(thresholds));

    EchoChamberDetectorConfig echo;
    echo.repeat_threshold = config.echo_repeat_threshold;
    echo.lookback = config.echo_lookback;
    echo.similarity_epsilon = config.echo_similarity_epsilon;
    echo.similarity_window = config.echo_similarity_window;
    echo.min_similar_transitions = config.echo_min_similar_transitions;
    chain.push_back(std::make_unique<EchoChamberDetector>(echo));

    CrescendoDetectorConfig crescendo;
    crescendo.window = config.crescendo_window;
    crescendo.increase_ratio = config.crescendo_increase_ratio;
    crescendo.growth_factor = config.crescendo_growth_factor;
    crescendo.min_injections = config.crescendo_min_injections;
    chain.push_back(std::make_unique<CrescendoDetector>(crescendo));

    return chain;
}

std::optional<Detection> RunDetectorChain(const DetectorChain& chain,
                                          const SessionRiskProfile& profile) {
    for (const auto& detector : chain) {
        if (auto detection = detector->Inspect(profile)) {
            return detection;
        }
    }
    return std::nullopt;
}

}  // namespace turnguard::session
