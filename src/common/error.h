#pragma once

/// @file error.h
/// @brief TurnGuard error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace turnguard {

/// @brief Error codes used across TurnGuard
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kInternal,

    // TurnGuard-specific error codes
    kConfigurationError,
    kValidationError,
    kTranscriptError,
};

/// @brief Convert TurnGuard error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Not-found status for a session id that is not in the table
inline absl::Status SessionNotFoundError(std::string_view session_id) {
    return absl::NotFoundError(absl::StrCat("Session not found: ", absl::string_view(session_id.data(), session_id.size())));
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define TURNGUARD_RETURN_IF_ERROR(expr)                                        \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define TURNGUARD_ASSIGN_OR_RETURN(lhs, rhs)                                   \
    TURNGUARD_ASSIGN_OR_RETURN_IMPL(                                           \
        TURNGUARD_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define TURNGUARD_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                    \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define TURNGUARD_CONCAT(a, b) TURNGUARD_CONCAT_IMPL(a, b)
#define TURNGUARD_CONCAT_IMPL(a, b) a##b

}  // namespace turnguard
