#pragma once

#include "vouchnet/Errors.hpp"
#include "vouchnet/Types.hpp"
#include "vouchnet/crypto/ChaCha20.hpp"

#include <chrono>
#include <cstdint>
#include <span>

namespace vouchnet::persistence {

// Owner-signed record that `holder` confirmed receipt of one chunk.
struct Attestation {
    MemberId owner{};
    std::uint32_t chunk_index{0};
    Digest content_hash{};
    PeerId holder{};
    std::uint64_t epoch{0};
    Timestamp timestamp{};
    Digest mac{};
};

Attestation sign_attestation(const crypto::Key& key,
                             const MemberId& owner,
                             std::uint32_t chunk_index,
                             const Digest& content_hash,
                             const PeerId& holder,
                             std::uint64_t epoch,
                             Timestamp now);

VerificationResult verify_attestation(const crypto::Key& key,
                                      const Attestation& attestation,
                                      Timestamp now,
                                      std::chrono::seconds max_age);

Bytes encode_attestation(const Attestation& attestation);
// Throws std::invalid_argument on malformed input.
Attestation decode_attestation(std::span<const std::uint8_t> encoded);

}  // namespace vouchnet::persistence
