#pragma once

/// @file attack_detector.h
/// @brief Interface for multi-turn attack detectors run after every turn

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "session/session_profile.h"

namespace turnguard::session {

struct SessionTrackerConfig;

/// @brief A detector's finding that the session must be blocked
struct Detection {
    std::string detector;  ///< Name() of the detector that fired
    std::string reason;    ///< Human-readable block reason returned to callers
};

/// @brief Abstract base class for session attack detectors
///
/// Detectors keep no per-session state: everything they need is in the
/// profile, so a single chain serves all sessions concurrently. Inspect()
/// is called with the profile's lock held, after the newest event has been
/// recorded.
class AttackDetector {
public:
    virtual ~AttackDetector() = default;

    /// @brief Short stable name, used in logs and metric labels
    virtual std::string_view Name() const = 0;

    /// @brief Examine a session
    /// @return Detection if the session must be blocked, nullopt otherwise
    virtual std::optional<Detection> Inspect(const SessionRiskProfile& profile) const = 0;
};

/// @brief Ordered detectors; evaluation stops at the first Detection
using DetectorChain = std::vector<std::unique_ptr<AttackDetector>>;

/// @brief Build the production chain: thresholds, echo chamber, crescendo
DetectorChain CreateDefaultDetectorChain(const SessionTrackerConfig& config);

/// @brief Run detectors in order and return the first finding
std::optional<Detection> RunDetectorChain(const DetectorChain& chain,
                                          const SessionRiskProfile& profile);

}  // namespace turnguard::session
