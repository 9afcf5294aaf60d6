#pragma once

#include <ostream>
#include <string>

namespace osync {

/**
 * @brief Error taxonomy shared by every layer of the engine
 *
 * Only NetworkFailure is transient. Concurrent is routed to conflict
 * resolution rather than surfaced as a failure.
 */
enum class ErrorCode {
    InvalidPayload,            // Malformed operation, rejected at enqueue
    IllegalTransition,         // Status change not allowed by the state machine
    NetworkFailure,            // Transport error or deadline exceeded
    Rejected,                  // Remote refused the change for policy reasons
    RetryExhausted,            // Retry bound reached, item is terminally Failed
    Concurrent,                // Remote saw a concurrent version at write time
    ManualResolutionRequired,  // Entity blocked until the user decides
    NotFound,                  // Unknown item or entity
    StorageFailure,            // Local store could not persist/load state
    InvalidConfig              // Configuration could not be parsed or validated
};

struct Error {
    ErrorCode code = ErrorCode::InvalidPayload;
    std::string message;
};

inline Error make_error(ErrorCode code, std::string message) {
    return Error{code, std::move(message)};
}

inline const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidPayload: return "InvalidPayload";
        case ErrorCode::IllegalTransition: return "IllegalTransition";
        case ErrorCode::NetworkFailure: return "NetworkFailure";
        case ErrorCode::Rejected: return "Rejected";
        case ErrorCode::RetryExhausted: return "RetryExhausted";
        case ErrorCode::Concurrent: return "Concurrent";
        case ErrorCode::ManualResolutionRequired: return "ManualResolutionRequired";
        case ErrorCode::NotFound: return "NotFound";
        case ErrorCode::StorageFailure: return "StorageFailure";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

inline std::ostream& operator<<(std::ostream& os, const Error& error) {
    return os << to_string(error.code) << ": " << error.message;
}

} // namespace osync
