#include "session/crescendo_detector.h"

#include <string>

#include <absl/strings/str_format.h>

namespace turnguard::session {

CrescendoDetector::CrescendoDetector(CrescendoDetectorConfig config) : config_(config) {}

std::optional<Detection> CrescendoDetector::Inspect(const SessionRiskProfile& profile) const {
    const auto& events = profile.Events();
    if (config_.window < 2 || events.Size() < config_.window) {
        return std::nullopt;
    }

    const size_t start = events.TailStart(config_.window);

    size_t increasing = 0;
    for (size_t i = start + 1; i < events.Size(); ++i) {
        if (events[i].risk_score > events[i - 1].risk_score) {
            ++increasing;
        }
    }

    const double transitions = static_cast<double>(config_.window - 1);
    if (static_cast<double>(increasing) >= transitions * config_.increase_ratio) {
        double first = events[start].risk_score;
        double last = events.Back().risk_score;
        if (last > first * config_.growth_factor) {
            return Detection{
                std::string(Name()),
                absl::StrFormat("Crescendo attack detected: Risk escalated from %.2f to %.2f",
                                first, last)};
        }
    }

    size_t injections = 0;
    size_t previous_patterns = 0;
    bool non_decreasing = true;
    for (size_t i = start; i < events.Size(); ++i) {
        const auto& event = events[i];
        if (!event.IsInjection()) {
            continue;
        }
        size_t patterns = event.patterns_detected.size();
        if (injections > 0 && patterns < previous_patterns) {
            non_decreasing = false;
        }
        previous_patterns = patterns;
        ++injections;
    }

    if (injections >= config_.min_injections && non_decreasing) {
        return Detection{std::string(Name()),
                         "Crescendo attack: Escalating injection complexity"};
    }
    return std::nullopt;
}

}  // namespace turnguard::session
