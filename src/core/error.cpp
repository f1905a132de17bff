#include "lcars/core/error.hpp"

namespace lcars::core {

const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS: return "Success";
        case ErrorCode::INVALID_INPUT: return "InvalidInput";
        case ErrorCode::NOT_FOUND: return "NotFound";
        case ErrorCode::INVALID_TRANSITION: return "InvalidTransition";
        case ErrorCode::TRANSIENT_NETWORK: return "TransientNetworkError";
        case ErrorCode::FATAL_STORAGE: return "FatalStorageError";
        case ErrorCode::TUNNEL_SETUP: return "TunnelSetupError";
        case ErrorCode::PERMISSION_DENIED: return "PermissionDenied";
    }
    return "Unknown";
}

std::string Result::to_string() const {
    if (message.empty()) {
        return error_code_to_string(error);
    }
    return std::string(error_code_to_string(error)) + ": " + message;
}

}
