#pragma once

#include <string>
#include <string_view>

namespace zipstage {

enum class StagingError {
    InvalidInput,
    PathTraversal,
    InvalidProtocol,
    NotFound,
    UnsupportedType,
    SizeExceeded,
    SecretsDetected,
    Timeout,
    TooLarge,
    NetworkError
};

struct StagingErrorInfo {
    StagingError error;
    std::string message;  // Secret-free, safe to show to the caller
};

// Stable kind name, used by the CLI and in log lines
constexpr std::string_view to_string(StagingError error) {
    switch (error) {
        case StagingError::InvalidInput:    return "InvalidInput";
        case StagingError::PathTraversal:   return "PathTraversal";
        case StagingError::InvalidProtocol: return "InvalidProtocol";
        case StagingError::NotFound:        return "NotFound";
        case StagingError::UnsupportedType: return "UnsupportedType";
        case StagingError::SizeExceeded:    return "SizeExceeded";
        case StagingError::SecretsDetected: return "SecretsDetected";
        case StagingError::Timeout:         return "Timeout";
        case StagingError::TooLarge:        return "TooLarge";
        case StagingError::NetworkError:    return "NetworkError";
    }
    return "Unknown";
}

} // namespace zipstage
