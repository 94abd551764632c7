#pragma once

/// @file transcript.h
/// @brief Recorded classifier output, one JSON object per line

#include <cstddef>
#include <filesystem>
#include <istream>
#include <string>
#include <utility>
#include <vector>

#include <absl/status/statusor.h>

namespace turnguard::replay {

/// @brief One classified turn as recorded in a transcript
///
/// Line format:
/// {"session_id": "...", "risk_score": 0.4, "event_type": "prompt_injection",
///  "patterns": ["role_play_jailbreak"], "content": "..."}
/// session_id and risk_score are required.
struct TranscriptTurn {
    std::string session_id;
    double risk_score = 0.0;
    std::string event_type = "benign";
    std::vector<std::string> patterns;
    std::string content;
    size_t line_number = 0;  ///< 1-based position in the source
};

/// @brief Turns for one session, in transcript order
using SessionTurns = std::pair<std::string, std::vector<TranscriptTurn>>;

/// @brief Parse JSON Lines; blank lines and lines starting with '#' are skipped
absl::StatusOr<std::vector<TranscriptTurn>> ParseTranscript(std::istream& input);

/// @brief Open and parse a transcript file
absl::StatusOr<std::vector<TranscriptTurn>> LoadTranscript(const std::filesystem::path& path);

/// @brief Group turns by session, sessions ordered by first appearance
std::vector<SessionTurns> GroupBySession(std::vector<TranscriptTurn> turns);

}  // namespace turnguard::replay
