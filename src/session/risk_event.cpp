#include "session/risk_event.h"

#include <utility>

namespace turnguard::session {

std::string TruncateUtf8(std::string_view text, size_t max_chars) {
    size_t chars = 0;
    size_t pos = 0;
    while (pos < text.size() && chars < max_chars) {
        auto lead = static_cast<unsigned char>(text[pos]);
        size_t width = 1;
        if (lead >= 0xF0) {
            width = 4;
        } else if (lead >= 0xE0) {
            width = 3;
        } else if (lead >= 0xC0) {
            width = 2;
        }
        // Malformed tail: keep what is complete
        if (pos + width > text.size()) {
            break;
        }
        pos += width;
        ++chars;
    }
    return std::string(text.substr(0, pos));
}

RiskEvent MakeRiskEvent(TimePoint timestamp,
                        double risk_score,
                        std::string event_type,
                        std::vector<std::string> patterns_detected,
                        std::string_view content_sample) {
    RiskEvent event;
    event.timestamp = timestamp;
    event.risk_score = risk_score;
    event.event_type = std::move(event_type);
    event.patterns_detected = std::move(patterns_detected);
    event.content_sample = TruncateUtf8(content_sample, kMaxContentSampleChars);
    return event;
}

}  // namespace turnguard::session
