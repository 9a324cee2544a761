#pragma once

#include <exception>
#include <string>
#include <string_view>
#include <utility>

namespace vouchnet {

enum class ErrorCode {
    InvalidDelta,
    InvalidState,
    InsufficientPeers,
    RegistrationRejected,
    VerificationFailure,
    RecoveryIncomplete,
    CorruptChunk
};

std::string_view error_code_name(ErrorCode code);

class VouchnetError : public std::exception {
public:
    VouchnetError(ErrorCode code, std::string message);

    [[nodiscard]] ErrorCode code() const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    const char* what() const noexcept override { return formatted_.c_str(); }

private:
    ErrorCode code_;
    std::string message_;
    std::string formatted_;
};

// Outcome of a single challenge, proof or signature check.
struct VerificationResult {
    bool passed{false};
    std::string reason;

    static VerificationResult ok() { return {true, {}}; }
    static VerificationResult fail(std::string why) { return {false, std::move(why)}; }

    explicit operator bool() const noexcept { return passed; }
};

}  // namespace vouchnet
