#include "error.h"

namespace turnguard {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
        case ErrorCode::kTranscriptError:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    return absl::Status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
}

}  // namespace turnguard
