/// @file replayer_test.cpp
/// @brief Tests for replaying transcripts through the tracker

#include <gtest/gtest.h>

#include <memory>
#include <sstream>
#include <string>

#include "replay/replayer.h"

namespace turnguard::replay {
namespace {

class ReplayerTest : public ::testing::Test {
protected:
    std::vector<TranscriptTurn> Parse(const std::string& text) {
        std::istringstream input(text);
        auto result = ParseTranscript(input);
        EXPECT_TRUE(result.ok()) << result.status().message();
        return result.ok() ? *std::move(result) : std::vector<TranscriptTurn>{};
    }

    MetricsRegistry metrics_;
    session::SessionRiskTracker tracker_{session::SessionTrackerConfig{}, metrics_};
    ThreadPool pool_{4};
};

TEST_F(ReplayerTest, ReplaysInterleavedSessions) {
    auto turns = Parse(R"(
{"session_id": "echo", "risk_score": 0.4, "patterns": ["role_play_jailbreak"]}
{"session_id": "benign", "risk_score": 0.05}
{"session_id": "echo", "risk_score": 0.4, "patterns": ["role_play_jailbreak"]}
{"session_id": "benign", "risk_score": 0.02}
{"session_id": "echo", "risk_score": 0.4, "patterns": ["role_play_jailbreak"]}
)");

    auto report = Replay(tracker_, std::move(turns), pool_);
    ASSERT_TRUE(report.ok()) << report.status().message();

    EXPECT_EQ(report->turns_replayed, 5u);
    ASSERT_EQ(report->blocked_turns.size(), 1u);
    EXPECT_EQ(report->blocked_turns[0].session_id, "echo");
    EXPECT_EQ(report->blocked_turns[0].line_number, 6u);
    EXPECT_NE(report->blocked_turns[0].reason.find("Echo chamber"), std::string::npos);

    ASSERT_EQ(report->sessions.size(), 2u);
    EXPECT_EQ(report->sessions[0].session_id, "echo");
    EXPECT_TRUE(report->sessions[0].is_blocked);
    EXPECT_EQ(report->sessions[1].session_id, "benign");
    EXPECT_FALSE(report->sessions[1].is_blocked);
    EXPECT_EQ(report->BlockedSessions(), 1u);
}

TEST_F(ReplayerTest, PreservesPerSessionOrder) {
    // Crescendo only fires if the turns are applied in transcript order
    std::string text;
    const double climb[] = {0.1, 0.2, 0.3, 0.4, 0.7};
    const double noise[] = {0.0, 0.2, 0.0, 0.2, 0.0};
    for (size_t i = 0; i < 5; ++i) {
        text += "{\"session_id\": \"climb\", \"risk_score\": " + std::to_string(climb[i]) +
                "}\n";
        text += "{\"session_id\": \"noise\", \"risk_score\": " + std::to_string(noise[i]) +
                "}\n";
    }

    auto report = Replay(tracker_, Parse(text), pool_);
    ASSERT_TRUE(report.ok());

    ASSERT_EQ(report->blocked_turns.size(), 1u);
    EXPECT_EQ(report->blocked_turns[0].session_id, "climb");
    EXPECT_NE(report->blocked_turns[0].reason.find("Crescendo"), std::string::npos);
}

TEST_F(ReplayerTest, PropagatesTrackerErrors) {
    auto turns = Parse(R"({"session_id": "s1", "risk_score": -1.0})");

    auto report = Replay(tracker_, std::move(turns), pool_);
    ASSERT_FALSE(report.ok());
    EXPECT_EQ(report.status().code(), absl::StatusCode::kInvalidArgument);
    EXPECT_NE(report.status().message().find("line 1"), std::string::npos);
}

TEST_F(ReplayerTest, EmptyTranscript) {
    auto report = Replay(tracker_, {}, pool_);

    ASSERT_TRUE(report.ok());
    EXPECT_EQ(report->turns_replayed, 0u);
    EXPECT_TRUE(report->sessions.empty());
    EXPECT_EQ(report->BlockedSessions(), 0u);
}

}  // namespace
}  // namespace turnguard::replay
