#pragma once

/// @file session_risk_tracker.h
/// @brief Session-level tracking of multi-turn prompt-injection attacks
///
/// Single-message classifiers miss attacks that spread their intent over
/// many turns. The tracker accumulates each turn's classification into a
/// per-session profile and, after every turn, runs a detector chain that
/// decides whether the session must be blocked:
/// - hard thresholds on injection attempts and cumulative risk
/// - echo chamber (the same vector repeated)
/// - crescendo (escalating scores or technique complexity)

#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "common/metrics.h"
#include "session/attack_detector.h"
#include "session/risk_event.h"
#include "session/session_profile.h"
#include "session/session_status.h"
#include "session/tracker_config.h"

namespace turnguard::session {

/// @brief Maximum accepted session id length in bytes
inline constexpr size_t kMaxSessionIdLength = 256;

/// @brief In-memory table of session risk profiles with a block verdict per turn
///
/// Thread-safe. Calls for the same session are serialized and observe each
/// other in call order; calls for different sessions only contend on the
/// table lookup. Memory is bounded by max_sessions profiles of at most
/// SessionRiskProfile::kMaxEvents events each.
///
/// Lookups for sessions that are not in the table (never seen or evicted)
/// are fail-open: IsSessionBlocked() returns false.
///
/// Example:
/// @code
///   SessionRiskTracker tracker;
///   auto decision = tracker.TrackRiskEvent(
///       session_id, score, "prompt_injection", {"role_play_jailbreak"}, text);
///   if (decision.ok() && decision->should_block) {
///       // Close the connection; the reason is in decision->reason
///   }
/// @endcode
class SessionRiskTracker {
public:
    /// @brief Tracker with the default detector chain
    explicit SessionRiskTracker(SessionTrackerConfig config = {},
                                MetricsRegistry& metrics = MetricsRegistry::Instance());

    /// @brief Tracker with a caller-supplied detector chain
    SessionRiskTracker(SessionTrackerConfig config,
                       DetectorChain detectors,
                       MetricsRegistry& metrics = MetricsRegistry::Instance());

    ~SessionRiskTracker();

    SessionRiskTracker(const SessionRiskTracker&) = delete;
    SessionRiskTracker& operator=(const SessionRiskTracker&) = delete;

    /// @brief Validate the configuration, then construct
    static absl::StatusOr<std::unique_ptr<SessionRiskTracker>> Create(
        SessionTrackerConfig config,
        MetricsRegistry& metrics = MetricsRegistry::Instance());

    /// @brief Record one classified turn and decide whether to block
    ///
    /// The event is recorded even when the session is already blocked, and
    /// the decision reflects the state after recording it.
    ///
    /// @param session_id Non-empty, at most kMaxSessionIdLength bytes
    /// @param risk_score Finite and non-negative; scale set by the classifier
    /// @param event_type Classifier category ("prompt_injection" is counted)
    /// @param patterns_detected Pattern identifiers reported for this turn
    /// @param content_sample Turn text; only the first 100 characters are kept
    /// @return Decision, or InvalidArgument (nothing is recorded)
    absl::StatusOr<BlockDecision> TrackRiskEvent(std::string_view session_id,
                                                 double risk_score,
                                                 std::string_view event_type,
                                                 std::vector<std::string> patterns_detected,
                                                 std::string_view content_sample);

    /// @brief Snapshot of a session
    /// @return Status, or NotFound for sessions not in the table
    absl::StatusOr<SessionStatus> GetSessionStatus(std::string_view session_id) const;

    /// @brief Whether a session is blocked; false for unknown sessions
    bool IsSessionBlocked(std::string_view session_id) const;

    /// @brief Remove sessions idle longer than session_idle_timeout
    /// @return Number of sessions removed
    size_t EvictIdleSessions();

    /// @brief Number of sessions in the table
    size_t SessionCount() const;

    const SessionTrackerConfig& GetConfig() const { return config_; }

private:
    struct SessionEntry {
        SessionEntry(std::string session_id, TimePoint now)
            : profile(std::move(session_id), now) {}

        mutable std::mutex mutex;
        SessionRiskProfile profile;
    };

    using SessionTable = std::unordered_map<std::string, std::shared_ptr<SessionEntry>>;

    /// @brief Fetch or create a session; cleans up first whenever the table
    ///        is full. Requires table_mutex_.
    std::shared_ptr<SessionEntry> GetOrCreateLocked(const std::string& session_id,
                                                    TimePoint now);

    /// @brief Requires table_mutex_
    std::shared_ptr<SessionEntry> FindLocked(const std::string& session_id) const;

    /// @brief Drop idle sessions other than `exempt`. Requires table_mutex_.
    size_t EvictIdleLocked(TimePoint now, std::string_view exempt);

    /// @brief Drop least recently active sessions other than `exempt` down to
    ///        the headroom target. Requires table_mutex_.
    size_t EvictOldestLocked(std::string_view exempt);

    void UpdateSessionGauge();

    SessionTrackerConfig config_;
    DetectorChain detectors_;
    MetricsRegistry& metrics_;

    Counter& events_tracked_;
    Counter& events_rejected_;
    Counter& sessions_evicted_;
    Gauge& active_sessions_;
    Histogram& track_latency_;

    mutable std::mutex table_mutex_;
    SessionTable sessions_;
};

}  // namespace turnguard::session
