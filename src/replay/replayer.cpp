#include "replay/replayer.h"

#include <future>
#include <utility>

#include <absl/strings/str_cat.h>

#include "common/logging.h"

namespace turnguard::replay {

namespace {

struct SessionOutcome {
    size_t turns = 0;
    std::vector<BlockedTurn> blocked;
};

absl::StatusOr<SessionOutcome> ReplaySession(session::SessionRiskTracker& tracker,
                                             const SessionTurns& session) {
    SessionOutcome outcome;
    for (const auto& turn : session.second) {
        auto decision = tracker.TrackRiskEvent(turn.session_id, turn.risk_score,
                                               turn.event_type, turn.patterns, turn.content);
        if (!decision.ok()) {
            return absl::Status(decision.status().code(),
                                absl::StrCat("line ", turn.line_number, ": ",
                                             decision.status().message()));
        }
        ++outcome.turns;
        if (decision->should_block) {
            outcome.blocked.push_back(
                BlockedTurn{turn.session_id, turn.line_number, decision->reason.value_or("")});
        }
    }
    return outcome;
}

}  // namespace

size_t ReplayReport::BlockedSessions() const {
    size_t count = 0;
    for (const auto& status : sessions) {
        if (status.is_blocked) {
            ++count;
        }
    }
    return count;
}

absl::StatusOr<ReplayReport> Replay(session::SessionRiskTracker& tracker,
                                    std::vector<TranscriptTurn> turns,
                                    ThreadPool& pool) {
    auto sessions = GroupBySession(std::move(turns));
    TURNGUARD_LOG_INFO("Replaying {} sessions on {} threads", sessions.size(), pool.Size());

    std::vector<std::future<absl::StatusOr<SessionOutcome>>> futures;
    futures.reserve(sessions.size());
    for (const auto& session : sessions) {
        futures.push_back(pool.Submit(
            [&tracker, &session]() { return ReplaySession(tracker, session); }));
    }

    // Collect every future before returning so no task outlives `sessions`
    std::vector<absl::StatusOr<SessionOutcome>> outcomes;
    outcomes.reserve(futures.size());
    for (auto& future : futures) {
        outcomes.push_back(future.get());
    }

    ReplayReport report;
    for (size_t i = 0; i < sessions.size(); ++i) {
        if (!outcomes[i].ok()) {
            return outcomes[i].status();
        }
        report.turns_replayed += outcomes[i]->turns;
        for (auto& blocked : outcomes[i]->blocked) {
            report.blocked_turns.push_back(std::move(blocked));
        }

        auto status = tracker.GetSessionStatus(sessions[i].first);
        if (status.ok()) {
            report.sessions.push_back(*std::move(status));
        } else {
            // Evicted during the replay (table smaller than the transcript)
            TURNGUARD_LOG_WARN("Session {} no longer tracked: {}", sessions[i].first,
                               std::string(status.status().message()));
        }
    }
    return report;
}

}  // namespace turnguard::replay
