#pragma once

/// @file tracker_config.h
/// @brief Tunables for SessionRiskTracker and its detector chain

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/config.h"
#include "session/risk_event.h"

namespace turnguard::session {

/// @brief Source of "now" for every timestamp the tracker takes
using TimeSource = std::function<TimePoint()>;

/// @brief Configuration for SessionRiskTracker
///
/// Defaults reproduce the production thresholds. Load overrides from the
/// "tracker" section of a Config with FromConfig().
struct SessionTrackerConfig {
    /// Score at or above which a turn counts toward high_risk_count
    double high_risk_threshold = 0.7;

    /// Sessions idle longer than this are removed during cleanup
    std::chrono::seconds session_idle_timeout = std::chrono::minutes(30);

    /// Table size that triggers cleanup on the next new lookup
    size_t max_sessions = 10000;

    /// Capacity eviction shrinks the table to max_sessions - eviction_headroom
    size_t eviction_headroom = 1000;

    // Hard thresholds
    int64_t max_injection_attempts = 5;
    double max_cumulative_risk = 5.0;

    // Echo chamber
    size_t echo_repeat_threshold = 3;
    size_t echo_lookback = 10;
    double echo_similarity_epsilon = 0.1;
    size_t echo_similarity_window = 5;
    size_t echo_min_similar_transitions = 4;

    // Crescendo
    size_t crescendo_window = 5;
    double crescendo_increase_ratio = 0.8;
    double crescendo_growth_factor = 1.5;
    size_t crescendo_min_injections = 3;

    /// Clock override for tests; empty means std::chrono::system_clock
    TimeSource time_source;

    /// @brief Read the "tracker.*" keys over the defaults
    /// @return Validated configuration, or InvalidArgument
    static absl::StatusOr<SessionTrackerConfig> FromConfig(const Config& config);

    /// @brief Check ranges; windows must fit in the per-session event buffer
    absl::Status Validate() const;

    /// @brief Current time from time_source or the system clock
    TimePoint Now() const;
};

}  // namespace turnguard::session
