/// @file detectors_test.cpp
/// @brief Tests for the threshold, echo chamber and crescendo detectors

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <vector>

#include "session/attack_detector.h"
#include "session/crescendo_detector.h"
#include "session/echo_chamber_detector.h"
#include "session/threshold_detector.h"
#include "session/tracker_config.h"

namespace turnguard::session {
namespace {

const TimePoint kEpoch = TimePoint(std::chrono::seconds(1700000000));

class DetectorTest : public ::testing::Test {
protected:
    void Add(double score,
             std::vector<std::string> patterns = {},
             std::string type = "benign") {
        profile_.Record(MakeRiskEvent(kEpoch, score, std::move(type), std::move(patterns), ""),
                        0.7);
    }

    void AddScores(const std::vector<double>& scores) {
        for (double score : scores) {
            Add(score);
        }
    }

    SessionRiskProfile profile_{"detector-session", kEpoch};
};

// ---------------------------------------------------------------------------
// ThresholdDetector
// ---------------------------------------------------------------------------

TEST_F(DetectorTest, ThresholdInjectionAttempts) {
    ThresholdDetector detector;

    for (int i = 0; i < 4; ++i) {
        Add(0.1, {}, "prompt_injection");
        EXPECT_FALSE(detector.Inspect(profile_).has_value());
    }
    Add(0.1, {}, "prompt_injection");

    auto detection = detector.Inspect(profile_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_EQ(detection->detector, "threshold");
    EXPECT_EQ(detection->reason, "Multiple injection attempts detected");
}

TEST_F(DetectorTest, ThresholdCumulativeRisk) {
    ThresholdDetector detector;

    AddScores({1.2, 1.3, 1.3});
    EXPECT_FALSE(detector.Inspect(profile_).has_value());

    Add(1.3);
    auto detection = detector.Inspect(profile_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_EQ(detection->reason, "Cumulative risk threshold exceeded");
}

TEST_F(DetectorTest, ThresholdInjectionTakesPrecedence) {
    ThresholdDetector detector(
        ThresholdDetectorConfig{.max_injection_attempts = 1, .max_cumulative_risk = 0.5});

    Add(1.0, {}, "prompt_injection");

    auto detection = detector.Inspect(profile_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_EQ(detection->reason, "Multiple injection attempts detected");
}

// ---------------------------------------------------------------------------
// EchoChamberDetector
// ---------------------------------------------------------------------------

TEST_F(DetectorTest, EchoRepeatedPattern) {
    EchoChamberDetector detector;

    Add(0.4, {"role_play_jailbreak"});
    Add(0.4, {"role_play_jailbreak"});
    EXPECT_FALSE(detector.Inspect(profile_).has_value());

    Add(0.4, {"role_play_jailbreak"});
    auto detection = detector.Inspect(profile_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_EQ(detection->detector, "echo_chamber");
    EXPECT_EQ(detection->reason,
              "Echo chamber attack detected: 'role_play_jailbreak' repeated 3 times");
}

TEST_F(DetectorTest, EchoNeedsRepeatThresholdEvents) {
    // Three occurrences inside fewer than three events do not count
    EchoChamberDetector detector;

    Add(0.4, {"a", "a"});
    Add(0.4, {"a"});

    EXPECT_FALSE(detector.Inspect(profile_).has_value());
}

TEST_F(DetectorTest, EchoReportsFirstSeenPattern) {
    EchoChamberDetector detector;

    Add(0.4, {"alpha", "beta"});
    Add(0.4, {"beta", "alpha"});
    Add(0.4, {"beta", "alpha"});

    auto detection = detector.Inspect(profile_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_NE(detection->reason.find("'alpha'"), std::string::npos);
}

TEST_F(DetectorTest, EchoOnlyScansLookback) {
    EchoChamberDetector detector(EchoChamberDetectorConfig{.repeat_threshold = 3, .lookback = 3});

    Add(0.2, {"old"});
    Add(0.2, {"old"});
    Add(0.5);
    Add(0.9, {"old"});

    EXPECT_FALSE(detector.Inspect(profile_).has_value());
}

TEST_F(DetectorTest, EchoSimilarScores) {
    EchoChamberDetector detector;

    AddScores({0.50, 0.52, 0.49, 0.51});
    EXPECT_FALSE(detector.Inspect(profile_).has_value());

    Add(0.50);
    auto detection = detector.Inspect(profile_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_EQ(detection->reason, "Echo chamber attack: Repetitive similar risk patterns");
}

TEST_F(DetectorTest, EchoSimilarScoresNeedEnoughSmallDeltas) {
    EchoChamberDetector detector;

    // Only the 0.2 -> 0.3 delta is below 0.1
    AddScores({0.1, 0.2, 0.3, 0.45, 0.7});

    EXPECT_FALSE(detector.Inspect(profile_).has_value());
}

// ---------------------------------------------------------------------------
// CrescendoDetector
// ---------------------------------------------------------------------------

TEST_F(DetectorTest, CrescendoScoreEscalation) {
    CrescendoDetector detector;

    AddScores({0.1, 0.2, 0.3, 0.4});
    EXPECT_FALSE(detector.Inspect(profile_).has_value());

    Add(0.7);
    auto detection = detector.Inspect(profile_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_EQ(detection->detector, "crescendo");
    EXPECT_EQ(detection->reason, "Crescendo attack detected: Risk escalated from 0.10 to 0.70");
}

TEST_F(DetectorTest, CrescendoRequiresGrowth) {
    CrescendoDetector detector;

    // Increasing but last <= 1.5 * first
    AddScores({0.50, 0.55, 0.60, 0.65, 0.70});

    EXPECT_FALSE(detector.Inspect(profile_).has_value());
}

TEST_F(DetectorTest, CrescendoRequiresMostlyIncreasing) {
    CrescendoDetector detector;

    // Two of four transitions increase
    AddScores({0.1, 0.3, 0.2, 0.4, 0.35});

    EXPECT_FALSE(detector.Inspect(profile_).has_value());
}

TEST_F(DetectorTest, CrescendoUsesNewestWindowOnly) {
    CrescendoDetector detector;

    AddScores({0.9, 0.1, 0.2, 0.3, 0.4, 0.7});

    auto detection = detector.Inspect(profile_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_NE(detection->reason.find("from 0.10 to 0.70"), std::string::npos);
}

TEST_F(DetectorTest, CrescendoInjectionComplexity) {
    CrescendoDetector detector;

    Add(0.3);
    Add(0.3);
    Add(0.3, {"a"}, "prompt_injection");
    Add(0.3, {"a", "b"}, "prompt_injection");
    Add(0.3, {"a", "b", "c"}, "prompt_injection");

    auto detection = detector.Inspect(profile_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_EQ(detection->reason, "Crescendo attack: Escalating injection complexity");
}

TEST_F(DetectorTest, CrescendoInjectionComplexityMustNotDecrease) {
    CrescendoDetector detector;

    Add(0.3);
    Add(0.3);
    Add(0.3, {"a", "b"}, "prompt_injection");
    Add(0.3, {"a"}, "prompt_injection");
    Add(0.3, {"a", "b", "c"}, "prompt_injection");

    EXPECT_FALSE(detector.Inspect(profile_).has_value());
}

TEST_F(DetectorTest, CrescendoNeedsFullWindow) {
    CrescendoDetector detector;

    Add(0.1, {"a"}, "prompt_injection");
    Add(0.2, {"a", "b"}, "prompt_injection");
    Add(0.9, {"a", "b", "c"}, "prompt_injection");

    EXPECT_FALSE(detector.Inspect(profile_).has_value());
}

// ---------------------------------------------------------------------------
// Chain
// ---------------------------------------------------------------------------

TEST_F(DetectorTest, DefaultConfigsMatchTrackerDefaults) {
    const SessionTrackerConfig tracker;
    const ThresholdDetectorConfig threshold;
    const EchoChamberDetectorConfig echo;
    const CrescendoDetectorConfig crescendo;

    EXPECT_EQ(threshold.max_injection_attempts, tracker.max_injection_attempts);
    EXPECT_DOUBLE_EQ(threshold.max_cumulative_risk, tracker.max_cumulative_risk);
    EXPECT_EQ(echo.repeat_threshold, tracker.echo_repeat_threshold);
    EXPECT_EQ(echo.lookback, tracker.echo_lookback);
    EXPECT_EQ(echo.similarity_window, tracker.echo_similarity_window);
    EXPECT_EQ(echo.min_similar_transitions, tracker.echo_min_similar_transitions);
    EXPECT_DOUBLE_EQ(echo.similarity_epsilon, tracker.echo_similarity_epsilon);
    EXPECT_EQ(crescendo.window, tracker.crescendo_window);
    EXPECT_EQ(crescendo.min_injections, tracker.crescendo_min_injections);
    EXPECT_DOUBLE_EQ(crescendo.increase_ratio, tracker.crescendo_increase_ratio);
    EXPECT_DOUBLE_EQ(crescendo.growth_factor, tracker.crescendo_growth_factor);
}

TEST_F(DetectorTest, DefaultConstructedDetectors) {
    ThresholdDetector threshold;
    EchoChamberDetector echo;
    CrescendoDetector crescendo;

    Add(0.1);
    EXPECT_FALSE(threshold.Inspect(profile_).has_value());
    EXPECT_FALSE(echo.Inspect(profile_).has_value());
    EXPECT_FALSE(crescendo.Inspect(profile_).has_value());
}

TEST_F(DetectorTest, DefaultChainOrder) {
    auto chain = CreateDefaultDetectorChain(SessionTrackerConfig{});

    ASSERT_EQ(chain.size(), 3u);
    EXPECT_EQ(chain[0]->Name(), "threshold");
    EXPECT_EQ(chain[1]->Name(), "echo_chamber");
    EXPECT_EQ(chain[2]->Name(), "crescendo");
}

TEST_F(DetectorTest, ChainStopsAtFirstDetection) {
    auto chain = CreateDefaultDetectorChain(SessionTrackerConfig{});

    // Trips both the injection limit and the injection-complexity crescendo
    for (int i = 1; i <= 5; ++i) {
        Add(0.2, std::vector<std::string>(static_cast<size_t>(i), "p" + std::to_string(i)),
            "prompt_injection");
    }

    auto detection = RunDetectorChain(chain, profile_);
    ASSERT_TRUE(detection.has_value());
    EXPECT_EQ(detection->detector, "threshold");
}

TEST_F(DetectorTest, EmptyChainNeverBlocks) {
    DetectorChain chain;
    Add(100.0, {}, "prompt_injection");

    EXPECT_FALSE(RunDetectorChain(chain, profile_).has_value());
}

}  // namespace
}  // namespace turnguard::session
