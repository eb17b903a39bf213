// SPDX-License-Identifier: MIT

// lib/stream/error.hpp
#pragma once

#include <string>
#include <string_view>

namespace valid_pipe {

/// Error codes for stream and validation operations.
enum class ErrorCode {
    // Lifecycle
    AlreadyTerminated,     ///< Subscription is already complete or cancelled

    // Validation
    ValidationFailed,      ///< Validator rejected a value

    // Stream
    UpstreamFailed,        ///< Source reported a failure of its own
};

/// Error payload delivered to OnError callbacks.
struct Error {
    ErrorCode code;                ///< Classified error code
    std::string message;           ///< Human-readable description
};

/// Return a short category string for an error code (e.g. "lifecycle", "validation").
constexpr std::string_view error_category(ErrorCode code) {
    switch (code) {
        case ErrorCode::AlreadyTerminated:
            return "lifecycle";
        case ErrorCode::ValidationFailed:
            return "validation";
        case ErrorCode::UpstreamFailed:
            return "stream";
    }
    return "unknown";
}

}  // namespace valid_pipe
