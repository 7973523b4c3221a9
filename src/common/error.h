#pragma once

/// @file error.h
/// @brief DriftScope error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace driftscope {

/// @brief Error codes specific to DriftScope
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInvalidArgument,
    kNotFound,
    kAlreadyExists,
    kPermissionDenied,
    kFailedPrecondition,
    kOutOfRange,
    kInternal,
    kUnavailable,
    kDataLoss,

    // Drift check error kinds
    kInputNotFound,
    // kSchemaMismatch and kDegenerateSample name outcome states carried in a
    // check result (schema_mismatch, type "degenerate"); no status uses them
    kSchemaMismatch,
    kDegenerateSample,
    kWriteFailure,

    kDeserializationError,
    kConfigurationError,
    kValidationError,
};

/// @brief Status payload key carrying the DriftScope error code
inline constexpr std::string_view kErrorCodePayloadKey = "type.driftscope.dev/error_code";

/// @brief Convert DriftScope error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Human readable name of an error code (e.g. "InputNotFound")
std::string_view ErrorCodeName(ErrorCode code);

/// @brief Create an error status with the given code and message
///
/// The DriftScope code is attached as a payload so callers can distinguish
/// kinds that share a canonical absl code (see GetErrorCode).
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Recover the DriftScope error code of a status
///
/// Statuses created without MakeError map back from their canonical code.
ErrorCode GetErrorCode(const absl::Status& status);

/// @brief Check whether a status carries the given DriftScope error code
inline bool HasErrorCode(const absl::Status& status, ErrorCode code) {
    return GetErrorCode(status) == code;
}

/// @brief Create a dataset-not-found error
inline absl::Status InputNotFoundError(std::string_view message) {
    return MakeError(ErrorCode::kInputNotFound, message);
}

/// @brief Create an artifact write error
inline absl::Status WriteFailureError(std::string_view message) {
    return MakeError(ErrorCode::kWriteFailure, message);
}

/// @brief Create a typed validation error
inline absl::Status ValidationError(std::string_view message) {
    return MakeError(ErrorCode::kValidationError, message);
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define DRIFTSCOPE_RETURN_IF_ERROR(expr)                                       \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define DRIFTSCOPE_ASSIGN_OR_RETURN(lhs, rhs)                                  \
    DRIFTSCOPE_ASSIGN_OR_RETURN_IMPL(                                          \
        DRIFTSCOPE_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define DRIFTSCOPE_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                   \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define DRIFTSCOPE_CONCAT(a, b) DRIFTSCOPE_CONCAT_IMPL(a, b)
#define DRIFTSCOPE_CONCAT_IMPL(a, b) a##b

/// @brief Check condition and return error if false
#define DRIFTSCOPE_CHECK_OR_RETURN(condition, error_status)                    \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace driftscope
