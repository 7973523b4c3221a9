#include "error.h"

#include <optional>

#include <absl/strings/cord.h>
#include <absl/strings/numbers.h>

namespace driftscope {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInvalidArgument:
        case ErrorCode::kValidationError:
        case ErrorCode::kDeserializationError:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
        case ErrorCode::kInputNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kAlreadyExists:
            return absl::StatusCode::kAlreadyExists;
        case ErrorCode::kPermissionDenied:
            return absl::StatusCode::kPermissionDenied;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kConfigurationError:
        case ErrorCode::kSchemaMismatch:
        case ErrorCode::kDegenerateSample:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kOutOfRange:
            return absl::StatusCode::kOutOfRange;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnavailable:
        case ErrorCode::kWriteFailure:
            return absl::StatusCode::kUnavailable;
        case ErrorCode::kDataLoss:
            return absl::StatusCode::kDataLoss;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

std::string_view ErrorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk: return "Ok";
        case ErrorCode::kInvalidArgument: return "InvalidArgument";
        case ErrorCode::kNotFound: return "NotFound";
        case ErrorCode::kAlreadyExists: return "AlreadyExists";
        case ErrorCode::kPermissionDenied: return "PermissionDenied";
        case ErrorCode::kFailedPrecondition: return "FailedPrecondition";
        case ErrorCode::kOutOfRange: return "OutOfRange";
        case ErrorCode::kInternal: return "Internal";
        case ErrorCode::kUnavailable: return "Unavailable";
        case ErrorCode::kDataLoss: return "DataLoss";
        case ErrorCode::kInputNotFound: return "InputNotFound";
        case ErrorCode::kSchemaMismatch: return "SchemaMismatch";
        case ErrorCode::kDegenerateSample: return "DegenerateSample";
        case ErrorCode::kWriteFailure: return "WriteFailure";
        case ErrorCode::kDeserializationError: return "DeserializationError";
        case ErrorCode::kConfigurationError: return "ConfigurationError";
        case ErrorCode::kValidationError: return "ValidationError";
        case ErrorCode::kUnknown:
        default:
            return "Unknown";
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), message);
    if (!status.ok()) {
        status.SetPayload(kErrorCodePayloadKey,
                          absl::Cord(std::to_string(static_cast<int>(code))));
    }
    return status;
}

ErrorCode GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return ErrorCode::kOk;
    }

    std::optional<absl::Cord> payload = status.GetPayload(kErrorCodePayloadKey);
    if (payload.has_value()) {
        int value = 0;
        if (absl::SimpleAtoi(std::string(*payload), &value) &&
            value > static_cast<int>(ErrorCode::kOk) &&
            value <= static_cast<int>(ErrorCode::kValidationError)) {
            return static_cast<ErrorCode>(value);
        }
    }

    switch (status.code()) {
        case absl::StatusCode::kInvalidArgument:
            return ErrorCode::kInvalidArgument;
        case absl::StatusCode::kNotFound:
            return ErrorCode::kNotFound;
        case absl::StatusCode::kAlreadyExists:
            return ErrorCode::kAlreadyExists;
        case absl::StatusCode::kPermissionDenied:
            return ErrorCode::kPermissionDenied;
        case absl::StatusCode::kFailedPrecondition:
            return ErrorCode::kFailedPrecondition;
        case absl::StatusCode::kOutOfRange:
            return ErrorCode::kOutOfRange;
        case absl::StatusCode::kInternal:
            return ErrorCode::kInternal;
        case absl::StatusCode::kUnavailable:
            return ErrorCode::kUnavailable;
        case absl::StatusCode::kDataLoss:
            return ErrorCode::kDataLoss;
        default:
            return ErrorCode::kUnknown;
    }
}

}  // namespace driftscope
