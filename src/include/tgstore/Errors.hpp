#pragma once

#include <absl/status/status.h>

#include <ostream>
#include <string_view>

namespace tgstore {

/**
 * @brief Error categories surfaced to callers of the storage core.
 *
 * Each category is carried as a distinct absl::StatusCode so the caller can
 * map it to its own response semantics (quota exceeded, bad gateway, not
 * found...) without parsing messages.
 */
enum class ErrorKind {
    kNone,
    kConfiguration,      // kFailedPrecondition
    kSizeLimitExceeded,  // kResourceExhausted
    kTimeout,            // kDeadlineExceeded
    kTransport,          // kUnavailable
    kResolution,         // kInvalidArgument
    kNotFound,           // kNotFound
    kInternal,           // Anything else
};

absl::Status ConfigurationError(std::string_view message);
absl::Status SizeLimitExceededError(std::string_view message);
absl::Status TimeoutError(std::string_view message);
absl::Status TransportError(std::string_view message);
absl::Status ResolutionError(std::string_view message);
absl::Status NotFoundError(std::string_view message);

/**
 * @brief Classifies a status into one of the storage error categories.
 *
 * @param status The status to classify.
 * @return ErrorKind::kNone for an OK status, kInternal for codes that do not
 * belong to the taxonomy.
 */
ErrorKind errorKindOf(const absl::Status& status);

std::string_view errorKindName(ErrorKind kind);

// Prefix a status message with context, keeping the code and payloads.
absl::Status withContext(const absl::Status& status, std::string_view context);

inline std::ostream& operator<<(std::ostream& os, const ErrorKind kind) {
    return os << errorKindName(kind);
}

}  // namespace tgstore
