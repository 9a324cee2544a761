#include "vouchnet/Errors.hpp"

#include <utility>

namespace vouchnet {

std::string_view error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::InvalidDelta:
            return "InvalidDelta";
        case ErrorCode::InvalidState:
            return "InvalidState";
        case ErrorCode::InsufficientPeers:
            return "InsufficientPeers";
        case ErrorCode::RegistrationRejected:
            return "RegistrationRejected";
        case ErrorCode::VerificationFailure:
            return "VerificationFailure";
        case ErrorCode::RecoveryIncomplete:
            return "RecoveryIncomplete";
        case ErrorCode::CorruptChunk:
            return "CorruptChunk";
    }
    return "Unknown";
}

VouchnetError::VouchnetError(ErrorCode code, std::string message)
    : code_(code),
      message_(std::move(message)) {
    formatted_ = "[" + std::string(error_code_name(code_)) + "] " + message_;
}

}  // namespace vouchnet
