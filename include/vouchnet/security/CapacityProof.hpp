#pragma once

#include "vouchnet/Errors.hpp"
#include "vouchnet/Types.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <span>

namespace vouchnet::security {

// The peer must fill `claimed_bytes` with the ChaCha20 keystream keyed by
// `seed` and hash it behind `nonce`.
struct CapacityChallenge {
    PeerId peer{};
    std::array<std::uint8_t, 32> seed{};
    std::array<std::uint8_t, 32> nonce{};
    std::uint64_t claimed_bytes{0};
    Timestamp issued_at{};
};

struct CapacityResponse {
    Digest hash{};
    Timestamp responded_at{};
};

CapacityChallenge issue_capacity_challenge(const PeerId& peer, std::uint64_t claimed_bytes, Timestamp now);

Bytes materialize_capacity_buffer(const CapacityChallenge& challenge);
CapacityResponse respond_capacity(const CapacityChallenge& challenge,
                                  std::span<const std::uint8_t> buffer,
                                  Timestamp now);

// Regenerates the keystream in slices so the verifier never holds the whole buffer.
VerificationResult verify_capacity(const CapacityChallenge& challenge,
                                   const CapacityResponse& response,
                                   Timestamp now,
                                   std::chrono::seconds window);

}  // namespace vouchnet::security
