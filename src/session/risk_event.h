#pragma once

/// @file risk_event.h
/// @brief One classified conversational turn and the verdict returned for it

#include <chrono>
#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace turnguard::session {

using TimePoint = std::chrono::system_clock::time_point;

/// @brief Event type the classifier assigns to injection attempts
inline constexpr std::string_view kPromptInjectionEventType = "prompt_injection";

/// @brief Maximum characters of turn text retained for diagnostics
inline constexpr size_t kMaxContentSampleChars = 100;

/// @brief Record of one classified turn
///
/// Built once by MakeRiskEvent() and only read afterwards.
struct RiskEvent {
    TimePoint timestamp;
    double risk_score = 0.0;
    std::string event_type;
    std::vector<std::string> patterns_detected;
    std::string content_sample;  ///< At most kMaxContentSampleChars characters

    bool IsInjection() const { return event_type == kPromptInjectionEventType; }
};

/// @brief Build an event, truncating the content sample
RiskEvent MakeRiskEvent(TimePoint timestamp,
                        double risk_score,
                        std::string event_type,
                        std::vector<std::string> patterns_detected,
                        std::string_view content_sample);

/// @brief Truncate UTF-8 text to at most max_chars code points without
///        splitting a multi-byte sequence
std::string TruncateUtf8(std::string_view text, size_t max_chars);

/// @brief Verdict for one tracked turn
struct BlockDecision {
    bool should_block = false;
    std::optional<std::string> reason;  ///< Set only when should_block
};

}  // namespace turnguard::session
