#include "replay/transcript.h"

#include <fstream>
#include <unordered_map>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>
#include <nlohmann/json.hpp>

#include "common/error.h"

namespace turnguard::replay {

namespace {

using json = nlohmann::json;

absl::Status LineError(size_t line_number, std::string_view message) {
    return MakeError(ErrorCode::kTranscriptError,
                     absl::StrCat("transcript line ", line_number, ": ", absl::string_view(message.data(), message.size())));
}

absl::StatusOr<TranscriptTurn> ParseTurn(const std::string& line, size_t line_number) {
    json j = json::parse(line, nullptr, /*allow_exceptions=*/false);
    if (j.is_discarded()) {
        return LineError(line_number, "not valid JSON");
    }
    if (!j.is_object()) {
        return LineError(line_number, "expected a JSON object");
    }

    TranscriptTurn turn;
    turn.line_number = line_number;

    try {
        if (!j.contains("session_id") || !j["session_id"].is_string()) {
            return LineError(line_number, "missing string field 'session_id'");
        }
        turn.session_id = j["session_id"].get<std::string>();

        if (!j.contains("risk_score") || !j["risk_score"].is_number()) {
            return LineError(line_number, "missing numeric field 'risk_score'");
        }
        turn.risk_score = j["risk_score"].get<double>();

        turn.event_type = j.value("event_type", turn.event_type);
        turn.content = j.value("content", std::string());

        if (j.contains("patterns")) {
            turn.patterns = j["patterns"].get<std::vector<std::string>>();
        }
    } catch (const json::exception& e) {
        return LineError(line_number, e.what());
    }

    return turn;
}

}  // namespace

absl::StatusOr<std::vector<TranscriptTurn>> ParseTranscript(std::istream& input) {
    std::vector<TranscriptTurn> turns;
    std::string line;
    size_t line_number = 0;

    while (std::getline(input, line)) {
        ++line_number;
        absl::string_view trimmed = absl::StripAsciiWhitespace(line);
        if (trimmed.empty() || trimmed.front() == '#') {
            continue;
        }
        TURNGUARD_ASSIGN_OR_RETURN(auto turn, ParseTurn(std::string(trimmed), line_number));
        turns.push_back(std::move(turn));
    }

    if (input.bad()) {
        return MakeError(ErrorCode::kTranscriptError, "I/O error while reading transcript");
    }
    return turns;
}

absl::StatusOr<std::vector<TranscriptTurn>> LoadTranscript(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        return absl::NotFoundError(absl::StrCat("Cannot open transcript: ", path.string()));
    }
    return ParseTranscript(file);
}

std::vector<SessionTurns> GroupBySession(std::vector<TranscriptTurn> turns) {
    std::vector<SessionTurns> groups;
    std::unordered_map<std::string, size_t> index;

    for (auto& turn : turns) {
        auto [it, inserted] = index.try_emplace(turn.session_id, groups.size());
        if (inserted) {
            groups.emplace_back(turn.session_id, std::vector<TranscriptTurn>{});
        }
        groups[it->second].second.push_back(std::move(turn));
    }
    return groups;
}

}  // namespace turnguard::replay
