/// @file tracker_config_test.cpp
/// @brief Tests for loading and validating tracker configuration

#include <gtest/gtest.h>

#include <chrono>

#include "session/session_profile.h"
#include "session/tracker_config.h"

namespace turnguard::session {
namespace {

TEST(TrackerConfigTest, Defaults) {
    SessionTrackerConfig config;

    EXPECT_DOUBLE_EQ(config.high_risk_threshold, 0.7);
    EXPECT_EQ(config.session_idle_timeout, std::chrono::minutes(30));
    EXPECT_EQ(config.max_sessions, 10000u);
    EXPECT_EQ(config.max_injection_attempts, 5);
    EXPECT_DOUBLE_EQ(config.max_cumulative_risk, 5.0);
    EXPECT_EQ(config.echo_repeat_threshold, 3u);
    EXPECT_EQ(config.crescendo_window, 5u);
    EXPECT_TRUE(config.Validate().ok());
}

TEST(TrackerConfigTest, FromEmptyConfigKeepsDefaults) {
    auto result = SessionTrackerConfig::FromConfig(Config{});

    ASSERT_TRUE(result.ok()) << result.status().message();
    EXPECT_EQ(result->max_sessions, 10000u);
    EXPECT_DOUBLE_EQ(result->crescendo_growth_factor, 1.5);
}

TEST(TrackerConfigTest, FromConfigReadsTrackerSection) {
    auto config = Config::LoadFromString(R"(
tracker:
  high_risk_threshold: 0.8
  max_cumulative_risk: 7.5
  max_injection_attempts: 3
  session_idle_timeout_seconds: 600
  max_sessions: 200
  eviction_headroom: 20
  echo:
    repeat_threshold: 4
    lookback: 8
    similarity_window: 6
    min_similar_transitions: 3
    similarity_epsilon: 0.05
  crescendo:
    window: 6
    min_injections: 2
    increase_ratio: 0.6
    growth_factor: 2.0
)");
    ASSERT_TRUE(config.ok());

    auto result = SessionTrackerConfig::FromConfig(*config);
    ASSERT_TRUE(result.ok()) << result.status().message();

    EXPECT_DOUBLE_EQ(result->high_risk_threshold, 0.8);
    EXPECT_DOUBLE_EQ(result->max_cumulative_risk, 7.5);
    EXPECT_EQ(result->max_injection_attempts, 3);
    EXPECT_EQ(result->session_idle_timeout, std::chrono::seconds(600));
    EXPECT_EQ(result->max_sessions, 200u);
    EXPECT_EQ(result->eviction_headroom, 20u);
    EXPECT_EQ(result->echo_repeat_threshold, 4u);
    EXPECT_EQ(result->echo_lookback, 8u);
    EXPECT_EQ(result->echo_similarity_window, 6u);
    EXPECT_EQ(result->echo_min_similar_transitions, 3u);
    EXPECT_DOUBLE_EQ(result->echo_similarity_epsilon, 0.05);
    EXPECT_EQ(result->crescendo_window, 6u);
    EXPECT_EQ(result->crescendo_min_injections, 2u);
    EXPECT_DOUBLE_EQ(result->crescendo_increase_ratio, 0.6);
    EXPECT_DOUBLE_EQ(result->crescendo_growth_factor, 2.0);
}

TEST(TrackerConfigTest, RejectsNegativeCount) {
    auto config = Config::LoadFromString("tracker:\n  max_sessions: -5\n");
    ASSERT_TRUE(config.ok());

    auto result = SessionTrackerConfig::FromConfig(*config);
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(TrackerConfigTest, RejectsNonPositiveIdleTimeout) {
    auto config = Config::LoadFromString("tracker:\n  session_idle_timeout_seconds: 0\n");
    ASSERT_TRUE(config.ok());

    EXPECT_FALSE(SessionTrackerConfig::FromConfig(*config).ok());
}

TEST(TrackerConfigTest, ValidateRanges) {
    {
        SessionTrackerConfig config;
        config.high_risk_threshold = 0.0;
        EXPECT_FALSE(config.Validate().ok());
    }
    {
        SessionTrackerConfig config;
        config.echo_lookback = SessionRiskProfile::kMaxEvents + 1;
        EXPECT_FALSE(config.Validate().ok());
    }
    {
        SessionTrackerConfig config;
        config.echo_min_similar_transitions = config.echo_similarity_window;
        EXPECT_FALSE(config.Validate().ok());
    }
    {
        SessionTrackerConfig config;
        config.crescendo_window = 1;
        EXPECT_FALSE(config.Validate().ok());
    }
    {
        SessionTrackerConfig config;
        config.crescendo_increase_ratio = 1.5;
        EXPECT_FALSE(config.Validate().ok());
    }
    {
        SessionTrackerConfig config;
        config.max_injection_attempts = 0;
        EXPECT_FALSE(config.Validate().ok());
    }
}

TEST(TrackerConfigTest, TimeSourceOverride) {
    const TimePoint fixed = TimePoint(std::chrono::seconds(42));
    SessionTrackerConfig config;
    config.time_source = [fixed]() { return fixed; };

    EXPECT_EQ(config.Now(), fixed);
}

}  // namespace
}  // namespace turnguard::session
