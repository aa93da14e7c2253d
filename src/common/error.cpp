/// @file error.cpp
/// @brief ErrorCode mapping and status payloads

#include "error.h"

#include <absl/strings/cord.h>
#include <absl/types/optional.h>

namespace sentinel {

namespace {

constexpr std::string_view kErrorCodePayload = "type.sentinel/error_code";

constexpr ErrorCode kAllCodes[] = {
    ErrorCode::kOk,
    ErrorCode::kUnknown,
    ErrorCode::kInvalidArgument,
    ErrorCode::kNotFound,
    ErrorCode::kFailedPrecondition,
    ErrorCode::kOutOfRange,
    ErrorCode::kUnimplemented,
    ErrorCode::kInternal,
    ErrorCode::kUnavailable,
    ErrorCode::kParseError,
    ErrorCode::kSchemaMismatch,
    ErrorCode::kEmptyDataset,
    ErrorCode::kDegenerateStatistic,
    ErrorCode::kConfigurationError,
    ErrorCode::kSerializationError,
};

}  // namespace

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kParseError:
        case ErrorCode::kSchemaMismatch:
        case ErrorCode::kEmptyDataset:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kDegenerateStatistic:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kOutOfRange:
            return absl::StatusCode::kOutOfRange;
        case ErrorCode::kUnimplemented:
            return absl::StatusCode::kUnimplemented;
        case ErrorCode::kInternal:
        case ErrorCode::kSerializationError:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnavailable:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kUnknown:
            break;
    }
    return absl::StatusCode::kUnknown;
}

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "ok";
        case ErrorCode::kUnknown: return "unknown";
        case ErrorCode::kInvalidArgument: return "invalid_argument";
        case ErrorCode::kNotFound: return "not_found";
        case ErrorCode::kFailedPrecondition: return "failed_precondition";
        case ErrorCode::kOutOfRange: return "out_of_range";
        case ErrorCode::kUnimplemented: return "unimplemented";
        case ErrorCode::kInternal: return "internal";
        case ErrorCode::kUnavailable: return "unavailable";
        case ErrorCode::kParseError: return "parse_error";
        case ErrorCode::kSchemaMismatch: return "schema_mismatch";
        case ErrorCode::kEmptyDataset: return "empty_dataset";
        case ErrorCode::kDegenerateStatistic: return "degenerate_statistic";
        case ErrorCode::kConfigurationError: return "configuration_error";
        case ErrorCode::kSerializationError: return "serialization_error";
    }
    return "unknown";
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
    if (!status.ok()) {
        status.SetPayload(absl::string_view(kErrorCodePayload.data(), kErrorCodePayload.size()), absl::Cord(absl::string_view(ErrorCodeName(code).data(), ErrorCodeName(code).size())));
    }
    return status;
}

std::optional<ErrorCode> GetErrorCode(const absl::Status& status) {
    const absl::optional<absl::Cord> payload = status.GetPayload(absl::string_view(kErrorCodePayload.data(), kErrorCodePayload.size()));
    if (!payload.has_value()) {
        return std::nullopt;
    }
    for (ErrorCode code : kAllCodes) {
        if (*payload == absl::string_view(ErrorCodeName(code).data(), ErrorCodeName(code).size())) {
            return code;
        }
    }
    return std::nullopt;
}

}  // namespace sentinel
