#include <absl/strings/cord.h>
#include <absl/strings/str_cat.h>

#include <tgstore/Errors.hpp>

namespace tgstore {

absl::Status ConfigurationError(const std::string_view message) {
    return absl::FailedPreconditionError(message);
}

absl::Status SizeLimitExceededError(const std::string_view message) {
    return absl::ResourceExhaustedError(message);
}

absl::Status TimeoutError(const std::string_view message) {
    return absl::DeadlineExceededError(message);
}

absl::Status TransportError(const std::string_view message) {
    return absl::UnavailableError(message);
}

absl::Status ResolutionError(const std::string_view message) {
    return absl::InvalidArgumentError(message);
}

absl::Status NotFoundError(const std::string_view message) {
    return absl::NotFoundError(message);
}

ErrorKind errorKindOf(const absl::Status& status) {
    switch (status.code()) {
        case absl::StatusCode::kOk:
            return ErrorKind::kNone;
        case absl::StatusCode::kFailedPrecondition:
            return ErrorKind::kConfiguration;
        case absl::StatusCode::kResourceExhausted:
            return ErrorKind::kSizeLimitExceeded;
        case absl::StatusCode::kDeadlineExceeded:
            return ErrorKind::kTimeout;
        case absl::StatusCode::kUnavailable:
            return ErrorKind::kTransport;
        case absl::StatusCode::kInvalidArgument:
            return ErrorKind::kResolution;
        case absl::StatusCode::kNotFound:
            return ErrorKind::kNotFound;
        default:
            return ErrorKind::kInternal;
    }
}

std::string_view errorKindName(const ErrorKind kind) {
    switch (kind) {
        case ErrorKind::kNone:
            return "None";
        case ErrorKind::kConfiguration:
            return "ConfigurationError";
        case ErrorKind::kSizeLimitExceeded:
            return "SizeLimitExceeded";
        case ErrorKind::kTimeout:
            return "TimeoutError";
        case ErrorKind::kTransport:
            return "TransportError";
        case ErrorKind::kResolution:
            return "ResolutionError";
        case ErrorKind::kNotFound:
            return "NotFoundError";
        case ErrorKind::kInternal:
            return "InternalError";
    }
    return "Unknown";
}

absl::Status withContext(const absl::Status& status,
                         const std::string_view context) {
    if (status.ok()) {
        return status;
    }
    absl::Status result(status.code(),
                        absl::StrCat(context, ": ", status.message()));
    status.ForEachPayload(
        [&result](std::string_view url, const absl::Cord& payload) {
            result.SetPayload(url, payload);
        });
    return result;
}

}  // namespace tgstore
