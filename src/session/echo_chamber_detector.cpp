#include "session/echo_chamber_detector.h"

#include <cmath>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include <absl/strings/str_cat.h>

namespace turnguard::session {

EchoChamberDetector::EchoChamberDetector(EchoChamberDetectorConfig config) : config_(config) {}

std::optional<Detection> EchoChamberDetector::Inspect(const SessionRiskProfile& profile) const {
    const auto& events = profile.Events();
    if (events.Size() < config_.repeat_threshold) {
        return std::nullopt;
    }

    if (auto detection = CheckRepeatedPatterns(events)) {
        return detection;
    }
    return CheckSimilarScores(events);
}

std::optional<Detection> EchoChamberDetector::CheckRepeatedPatterns(
    const SessionRiskProfile::Window& events) const {
    // Tally in first-seen order so the reported pattern is deterministic
    std::vector<std::pair<std::string_view, size_t>> tallies;
    std::unordered_map<std::string_view, size_t> index;

    for (size_t i = events.TailStart(config_.lookback); i < events.Size(); ++i) {
        for (const auto& pattern : events[i].patterns_detected) {
            auto [it, inserted] = index.try_emplace(pattern, tallies.size());
            if (inserted) {
                tallies.emplace_back(pattern, 0);
            }
            ++tallies[it->second].second;
        }
    }

    for (const auto& [pattern, count] : tallies) {
        if (count >= config_.repeat_threshold) {
            return Detection{
                std::string(Name()),
                absl::StrCat("Echo chamber attack detected: '", absl::string_view(pattern.data(), pattern.size()), "' repeated ",
                             count, " times")};
        }
    }
    return std::nullopt;
}

std::optional<Detection> EchoChamberDetector::CheckSimilarScores(
    const SessionRiskProfile::Window& events) const {
    if (events.Size() < config_.similarity_window) {
        return std::nullopt;
    }

    size_t similar = 0;
    size_t start = events.TailStart(config_.similarity_window);
    for (size_t i = start + 1; i < events.Size(); ++i) {
        double delta = events[i].risk_score - events[i - 1].risk_score;
        if (std::fabs(delta) < config_.similarity_epsilon) {
            ++similar;
        }
    }

    if (similar >= config_.min_similar_transitions) {
        return Detection{std::string(Name()),
                         "Echo chamber attack: Repetitive similar risk patterns"};
    }
    return std::nullopt;
}

}  // namespace turnguard::session
