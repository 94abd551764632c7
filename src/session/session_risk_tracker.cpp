#include "session/session_risk_tracker.h"

#include <algorithm>
#include <cmath>
#include <utility>

#include <absl/strings/str_cat.h>

#include "common/error.h"
#include "common/logging.h"

namespace turnguard::session {

namespace {

absl::Status ValidateTurn(std::string_view session_id, double risk_score) {
    if (session_id.empty()) {
        return MakeError(ErrorCode::kValidationError, "session_id must not be empty");
    }
    if (session_id.size() > kMaxSessionIdLength) {
        return MakeError(ErrorCode::kValidationError,
                         absl::StrCat("session_id exceeds ", kMaxSessionIdLength, " bytes"));
    }
    if (!std::isfinite(risk_score) || risk_score < 0.0) {
        return MakeError(ErrorCode::kValidationError,
                         absl::StrCat("risk_score must be finite and non-negative, got ",
                                      risk_score));
    }
    return absl::OkStatus();
}

}  // namespace

SessionRiskTracker::SessionRiskTracker(SessionTrackerConfig config, MetricsRegistry& metrics)
    : SessionRiskTracker(config, CreateDefaultDetectorChain(config), metrics) {}

SessionRiskTracker::SessionRiskTracker(SessionTrackerConfig config,
                                       DetectorChain detectors,
                                       MetricsRegistry& metrics)
    : config_(std::move(config)),
      detectors_(std::move(detectors)),
      metrics_(metrics),
      events_tracked_(metrics.GetCounter("turnguard_events_tracked_total", {},
                                         "Turns recorded by the session tracker")),
      events_rejected_(metrics.GetCounter("turnguard_events_rejected_total", {},
                                          "Turns rejected by input validation")),
      sessions_evicted_(metrics.GetCounter("turnguard_sessions_evicted_total", {},
                                           "Sessions removed by idle or capacity eviction")),
      active_sessions_(metrics.GetGauge("turnguard_active_sessions", {},
                                        "Sessions currently tracked")),
      track_latency_(metrics.GetHistogram("turnguard_track_latency_seconds", {},
                                          "TrackRiskEvent latency")) {
    TURNGUARD_LOG_DEBUG("SessionRiskTracker created: max_sessions={}, idle_timeout={}s, "
                        "{} detectors",
                        config_.max_sessions, config_.session_idle_timeout.count(),
                        detectors_.size());
}

SessionRiskTracker::~SessionRiskTracker() = default;

absl::StatusOr<std::unique_ptr<SessionRiskTracker>> SessionRiskTracker::Create(
    SessionTrackerConfig config, MetricsRegistry& metrics) {
    TURNGUARD_RETURN_IF_ERROR(config.Validate());
    return std::make_unique<SessionRiskTracker>(std::move(config), metrics);
}

absl::StatusOr<BlockDecision> SessionRiskTracker::TrackRiskEvent(
    std::string_view session_id,
    double risk_score,
    std::string_view event_type,
    std::vector<std::string> patterns_detected,
    std::string_view content_sample) {
    if (auto status = ValidateTurn(session_id, risk_score); !status.ok()) {
        events_rejected_.Increment();
        TURNGUARD_LOG_WARN("Rejected risk event: {}", std::string(status.message()));
        return status;
    }

    ScopedTimer timer(track_latency_);
    const TimePoint now = config_.Now();

    // Lock order is always table, then session. The table lock is released
    // as soon as the session lock is held so other sessions proceed.
    std::shared_ptr<SessionEntry> entry;
    std::unique_lock<std::mutex> session_lock;
    {
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        entry = GetOrCreateLocked(std::string(session_id), now);
        session_lock = std::unique_lock<std::mutex>(entry->mutex);
    }

    SessionRiskProfile& profile = entry->profile;
    profile.Record(MakeRiskEvent(now, risk_score, std::string(event_type),
                                 std::move(patterns_detected), content_sample),
                   config_.high_risk_threshold);
    events_tracked_.Increment();

    BlockDecision decision;
    auto detection = RunDetectorChain(detectors_, profile);
    if (!detection) {
        return decision;
    }

    decision.should_block = true;
    decision.reason = detection->reason;

    if (!profile.IsBlocked()) {
        profile.MarkBlocked(detection->reason);
        metrics_.GetCounter("turnguard_sessions_blocked_total",
                            {{"detector", detection->detector}},
                            "Sessions blocked, by the detector that fired")
            .Increment();
    }

    TURNGUARD_LOG_WARN("Session {} blocked due to: {}. Cumulative risk: {:.2f}, "
                       "Injection attempts: {}",
                       profile.SessionId(), detection->reason, profile.CumulativeRisk(),
                       profile.InjectionAttempts());
    return decision;
}

absl::StatusOr<SessionStatus> SessionRiskTracker::GetSessionStatus(
    std::string_view session_id) const {
    std::shared_ptr<SessionEntry> entry;
    std::unique_lock<std::mutex> session_lock;
    {
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        entry = FindLocked(std::string(session_id));
        if (!entry) {
            return SessionNotFoundError(session_id);
        }
        session_lock = std::unique_lock<std::mutex>(entry->mutex);
    }
    return BuildSessionStatus(entry->profile, config_.Now());
}

bool SessionRiskTracker::IsSessionBlocked(std::string_view session_id) const {
    std::shared_ptr<SessionEntry> entry;
    std::unique_lock<std::mutex> session_lock;
    {
        std::lock_guard<std::mutex> table_lock(table_mutex_);
        entry = FindLocked(std::string(session_id));
        if (!entry) {
            return false;
        }
        session_lock = std::unique_lock<std::mutex>(entry->mutex);
    }
    return entry->profile.IsBlocked();
}

size_t SessionRiskTracker::EvictIdleSessions() {
    std::lock_guard<std::mutex> table_lock(table_mutex_);
    size_t removed = EvictIdleLocked(config_.Now(), {});
    UpdateSessionGauge();
    return removed;
}

size_t SessionRiskTracker::SessionCount() const {
    std::lock_guard<std::mutex> table_lock(table_mutex_);
    return sessions_.size();
}

std::shared_ptr<SessionRiskTracker::SessionEntry> SessionRiskTracker::GetOrCreateLocked(
    const std::string& session_id, TimePoint now) {
    // Cleanup runs on every lookup against a full table, for known sessions
    // too. The calling session is spared so its block state survives.
    if (sessions_.size() >= config_.max_sessions) {
        size_t idle = EvictIdleLocked(now, session_id);
        size_t oldest = 0;
        if (sessions_.size() >= config_.max_sessions) {
            oldest = EvictOldestLocked(session_id);
        }
        TURNGUARD_LOG_INFO("Session table at capacity ({}): evicted {} idle and {} "
                           "least recently active sessions",
                           config_.max_sessions, idle, oldest);
    }

    if (auto existing = FindLocked(session_id)) {
        UpdateSessionGauge();
        return existing;
    }

    auto entry = std::make_shared<SessionEntry>(session_id, now);
    sessions_.emplace(session_id, entry);
    TURNGUARD_LOG_DEBUG("Tracking new session {}", session_id);
    UpdateSessionGauge();
    return entry;
}

std::shared_ptr<SessionRiskTracker::SessionEntry> SessionRiskTracker::FindLocked(
    const std::string& session_id) const {
    auto it = sessions_.find(session_id);
    if (it == sessions_.end()) {
        return nullptr;
    }
    return it->second;
}

size_t SessionRiskTracker::EvictIdleLocked(TimePoint now, std::string_view exempt) {
    const TimePoint cutoff = now - config_.session_idle_timeout;

    size_t removed = 0;
    for (auto it = sessions_.begin(); it != sessions_.end();) {
        if (it->first == exempt) {
            ++it;
            continue;
        }
        bool idle = false;
        {
            std::lock_guard<std::mutex> session_lock(it->second->mutex);
            idle = it->second->profile.LastActivity() < cutoff;
        }
        if (idle) {
            it = sessions_.erase(it);
            ++removed;
        } else {
            ++it;
        }
    }

    sessions_evicted_.Add(static_cast<int64_t>(removed));
    return removed;
}

size_t SessionRiskTracker::EvictOldestLocked(std::string_view exempt) {
    // Always free at least one slot for the session being created
    const size_t headroom = std::max<size_t>(config_.eviction_headroom, 1);
    const size_t target = config_.max_sessions > headroom ? config_.max_sessions - headroom : 0;
    if (sessions_.size() <= target) {
        return 0;
    }

    std::vector<std::pair<TimePoint, SessionTable::iterator>> by_activity;
    by_activity.reserve(sessions_.size());
    for (auto it = sessions_.begin(); it != sessions_.end(); ++it) {
        if (it->first == exempt) {
            continue;
        }
        std::lock_guard<std::mutex> session_lock(it->second->mutex);
        by_activity.emplace_back(it->second->profile.LastActivity(), it);
    }

    const size_t excess = std::min(sessions_.size() - target, by_activity.size());
    if (excess == 0) {
        return 0;
    }
    std::nth_element(by_activity.begin(), by_activity.begin() + (excess - 1), by_activity.end(),
                     [](const auto& a, const auto& b) { return a.first < b.first; });

    for (size_t i = 0; i < excess; ++i) {
        sessions_.erase(by_activity[i].second);
    }

    sessions_evicted_.Add(static_cast<int64_t>(excess));
    return excess;
}

void SessionRiskTracker::UpdateSessionGauge() {
    active_sessions_.Set(static_cast<double>(sessions_.size()));
}

}  // namespace turnguard::session
