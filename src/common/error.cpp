#include "error.h"

#include <absl/strings/cord.h>
#include <absl/strings/numbers.h>

namespace driftguard {

absl::StatusCode ToAbslCode(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return absl::StatusCode::kOk;
        case ErrorCode::kInputValidation:
        case ErrorCode::kUnsupportedType:
            return absl::StatusCode::kInvalidArgument;
        case ErrorCode::kNotFound:
            return absl::StatusCode::kNotFound;
        case ErrorCode::kFailedPrecondition:
        case ErrorCode::kInsufficientData:
        case ErrorCode::kConfigurationError:
            return absl::StatusCode::kFailedPrecondition;
        case ErrorCode::kUnsupportedModel:
            return absl::StatusCode::kUnimplemented;
        case ErrorCode::kInternal:
            return absl::StatusCode::kInternal;
        case ErrorCode::kUnknown:
        default:
            return absl::StatusCode::kUnknown;
    }
}

std::string_view ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::kOk:
            return "ok";
        case ErrorCode::kInternal:
            return "internal";
        case ErrorCode::kNotFound:
            return "not_found";
        case ErrorCode::kFailedPrecondition:
            return "failed_precondition";
        case ErrorCode::kInputValidation:
            return "input_validation";
        case ErrorCode::kUnsupportedType:
            return "unsupported_type";
        case ErrorCode::kInsufficientData:
            return "insufficient_data";
        case ErrorCode::kUnsupportedModel:
            return "unsupported_model";
        case ErrorCode::kConfigurationError:
            return "configuration_error";
        case ErrorCode::kUnknown:
        default:
            return "unknown";
    }
}

absl::Status MakeError(ErrorCode code, std::string_view message) {
    absl::Status status(ToAbslCode(code), absl::string_view(message.data(), message.size()));
    if (!status.ok()) {
        status.SetPayload(absl::string_view(kErrorCodePayloadUrl.data(), kErrorCodePayloadUrl.size()),
                          absl::Cord(std::to_string(static_cast<int>(code))));
    }
    return status;
}

ErrorCode GetErrorCode(const absl::Status& status) {
    if (status.ok()) {
        return ErrorCode::kOk;
    }

    auto payload = status.GetPayload(absl::string_view(kErrorCodePayloadUrl.data(), kErrorCodePayloadUrl.size()));
    int value = 0;
    if (payload.has_value() && absl::SimpleAtoi(std::string(*payload), &value)) {
        return static_cast<ErrorCode>(value);
    }

    switch (status.code()) {
        case absl::StatusCode::kInvalidArgument:
            return ErrorCode::kInputValidation;
        case absl::StatusCode::kNotFound:
            return ErrorCode::kNotFound;
        case absl::StatusCode::kFailedPrecondition:
            return ErrorCode::kFailedPrecondition;
        case absl::StatusCode::kUnimplemented:
            return ErrorCode::kUnsupportedModel;
        case absl::StatusCode::kInternal:
            return ErrorCode::kInternal;
        default:
            return ErrorCode::kUnknown;
    }
}

}  // namespace driftguard
