#pragma once

/// @file replayer.h
/// @brief Drive a SessionRiskTracker from a recorded transcript

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <absl/status/statusor.h>

#include "common/thread_pool.h"
#include "replay/transcript.h"
#include "session/session_risk_tracker.h"
#include "session/session_status.h"

namespace turnguard::replay {

/// @brief A turn whose decision was to block
struct BlockedTurn {
    std::string session_id;
    size_t line_number = 0;
    std::string reason;
};

/// @brief Outcome of a replay
struct ReplayReport {
    size_t turns_replayed = 0;
    std::vector<BlockedTurn> blocked_turns;       ///< Ordered by session, then line
    std::vector<session::SessionStatus> sessions; ///< Final status, first-appearance order

    size_t BlockedSessions() const;
};

/// @brief Replay every session's turns through the tracker
///
/// Each session is one task on the pool, so turns of a session keep their
/// transcript order while different sessions run in parallel.
/// @return Report, or the first tracker error (e.g. a negative risk_score)
absl::StatusOr<ReplayReport> Replay(session::SessionRiskTracker& tracker,
                                    std::vector<TranscriptTurn> turns,
                                    ThreadPool& pool);

}  // namespace turnguard::replay
