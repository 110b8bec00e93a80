#pragma once

/// @file error.h
/// @brief driftguard error handling utilities using absl::Status

#include <string>
#include <string_view>

#include <absl/status/status.h>
#include <absl/status/statusor.h>
#include <absl/strings/str_cat.h>

namespace driftguard {

/// @brief Error codes specific to driftguard
///
/// Each code maps onto an absl canonical code. The driftguard code itself is
/// carried as a status payload so callers can tell, for example, an
/// unsupported model apart from other unimplemented paths.
enum class ErrorCode {
    kOk = 0,
    kUnknown,
    kInternal,
    kNotFound,
    kFailedPrecondition,

    // Analysis error taxonomy
    kInputValidation,     ///< Missing or empty required data
    kUnsupportedType,     ///< Non-numeric data fed to a numeric-only routine
    kInsufficientData,    ///< Too few samples or groups for a metric
    kUnsupportedModel,    ///< Attribution engine cannot introspect the model
    kConfigurationError,  ///< Invalid or incomplete configuration
};

/// @brief Payload type URL under which the driftguard error code is stored
inline constexpr std::string_view kErrorCodePayloadUrl = "driftguard.dev/error_code";

/// @brief Convert driftguard error code to absl::StatusCode
absl::StatusCode ToAbslCode(ErrorCode code);

/// @brief Human readable name of an error code
std::string_view ErrorCodeToString(ErrorCode code);

/// @brief Create an OK status
inline absl::Status OkStatus() {
    return absl::OkStatus();
}

/// @brief Create an error status with the given code and message
absl::Status MakeError(ErrorCode code, std::string_view message);

/// @brief Recover the driftguard error code from a status
///
/// Statuses produced outside MakeError are classified by their absl code.
ErrorCode GetErrorCode(const absl::Status& status);

/// @brief Create an input validation error
inline absl::Status InputValidationError(std::string_view message) {
    return MakeError(ErrorCode::kInputValidation, message);
}

/// @brief Create an unsupported type error
inline absl::Status UnsupportedTypeError(std::string_view message) {
    return MakeError(ErrorCode::kUnsupportedType, message);
}

/// @brief Create an insufficient data error
inline absl::Status InsufficientDataError(std::string_view message) {
    return MakeError(ErrorCode::kInsufficientData, message);
}

/// @brief Create an unsupported model error
inline absl::Status UnsupportedModelError(std::string_view message) {
    return MakeError(ErrorCode::kUnsupportedModel, message);
}

/// @brief Create a configuration error
inline absl::Status ConfigurationError(std::string_view message) {
    return MakeError(ErrorCode::kConfigurationError, message);
}

/// @brief Create a failed precondition error
inline absl::Status FailedPreconditionError(std::string_view message) {
    return MakeError(ErrorCode::kFailedPrecondition, message);
}

/// @brief Create an internal error
inline absl::Status InternalError(std::string_view message) {
    return MakeError(ErrorCode::kInternal, message);
}

// Macros for status checking and propagation

/// @brief Return if status is not OK
#define DRIFTGUARD_RETURN_IF_ERROR(expr)                                       \
    do {                                                                        \
        auto _status = (expr);                                                  \
        if (!_status.ok()) {                                                    \
            return _status;                                                     \
        }                                                                       \
    } while (0)

/// @brief Assign or return if status is not OK
#define DRIFTGUARD_ASSIGN_OR_RETURN(lhs, rhs)                                  \
    DRIFTGUARD_ASSIGN_OR_RETURN_IMPL(                                          \
        DRIFTGUARD_CONCAT(_status_or_, __LINE__), lhs, rhs)

#define DRIFTGUARD_ASSIGN_OR_RETURN_IMPL(statusor, lhs, rhs)                   \
    auto statusor = (rhs);                                                      \
    if (!statusor.ok()) {                                                       \
        return statusor.status();                                               \
    }                                                                           \
    lhs = std::move(statusor).value()

#define DRIFTGUARD_CONCAT(a, b) DRIFTGUARD_CONCAT_IMPL(a, b)
#define DRIFTGUARD_CONCAT_IMPL(a, b) a##b

/// @brief Check condition and return error if false
#define DRIFTGUARD_CHECK_OR_RETURN(condition, error_status)                    \
    do {                                                                        \
        if (!(condition)) {                                                     \
            return (error_status);                                              \
        }                                                                       \
    } while (0)

}  // namespace driftguard
