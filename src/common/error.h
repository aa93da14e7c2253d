#pragma once

/// @file error.h
/// @brief Error codes and status propagation helpers
///
/// Failures travel as absl::Status. MakeError maps a domain ErrorCode onto
/// the closest canonical code and records the ErrorCode as a status payload,
/// so callers that need the finer distinction (schema mismatch versus empty
/// dataset, say) can recover it with GetErrorCode.

#include <optional>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace sentinel {

enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kFailedPrecondition,
    kOutOfRange,
    kUnimplemented,
    kInternal,
    kUnavailable,

    kParseError,            ///< malformed CSV or JSON input
    kSchemaMismatch,        ///< reference and production columns differ
    kEmptyDataset,          ///< no columns or no rows
    kDegenerateStatistic,   ///< a test statistic is undefined for the data
    kConfigurationError,    ///< parameter out of range
    kSerializationError,    ///< report or dataset could not be written
};

/// @brief Canonical absl code an ErrorCode is reported under
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Stable snake_case name, e.g. "schema_mismatch"
std::string_view ErrorCodeName(ErrorCode code);

/// @brief Build a status carrying both the canonical code and the ErrorCode
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief ErrorCode recorded by MakeError, if the status came from it
std::optional<ErrorCode> GetErrorCode(const absl::Status& status);

#define SENTINEL_RETURN_IF_ERROR(expr)                                         \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Declare-free assignment from a StatusOr, returning its error
#define SENTINEL_ASSIGN_OR_RETURN(lhs, rhs)                                    \
    SENTINEL_ASSIGN_OR_RETURN_IMPL(                                            \
        SENTINEL_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define SENTINEL_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                     \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define SENTINEL_CONCAT(a, b) SENTINEL_CONCAT_IMPL(a, b)
#define SENTINEL_CONCAT_IMPL(a, b) a##b

#define SENTINEL_CHECK_OR_RETURN(condition, error_status)                      \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace sentinel
