#include "vouchnet/security/CapacityProof.hpp"

#include "vouchnet/crypto/ChaCha20.hpp"
#include "vouchnet/crypto/HmacSha256.hpp"
#include "vouchnet/crypto/Sha256.hpp"
#include "vouchnet/crypto/SnapshotCipher.hpp"

#include <algorithm>

namespace vouchnet::security {

namespace {

constexpr std::size_t kVerifySlice = 64 * 1024;

crypto::ChaCha20 stream_for(const CapacityChallenge& challenge) {
    crypto::Key key{};
    key.bytes = challenge.seed;
    crypto::Nonce nonce{};
    std::copy_n(challenge.nonce.begin(), nonce.bytes.size(), nonce.bytes.begin());
    return crypto::ChaCha20(key, nonce);
}

}  // namespace

CapacityChallenge issue_capacity_challenge(const PeerId& peer, std::uint64_t claimed_bytes, Timestamp now) {
    CapacityChallenge challenge{};
    challenge.peer = peer;
    challenge.claimed_bytes = claimed_bytes;
    challenge.issued_at = now;
    crypto::random_bytes(challenge.seed);
    crypto::random_bytes(challenge.nonce);
    return challenge;
}

Bytes materialize_capacity_buffer(const CapacityChallenge& challenge) {
    Bytes buffer(static_cast<std::size_t>(challenge.claimed_bytes));
    const auto stream = stream_for(challenge);
    stream.keystream(0, buffer);
    return buffer;
}

CapacityResponse respond_capacity(const CapacityChallenge& challenge,
                                  std::span<const std::uint8_t> buffer,
                                  Timestamp now) {
    crypto::Sha256 hasher;
    hasher.update(challenge.nonce);
    hasher.update(buffer);
    return CapacityResponse{hasher.finalize(), now};
}

VerificationResult verify_capacity(const CapacityChallenge& challenge,
                                   const CapacityResponse& response,
                                   Timestamp now,
                                   std::chrono::seconds window) {
    if (response.responded_at < challenge.issued_at || now - challenge.issued_at > window ||
        response.responded_at - challenge.issued_at > window) {
        return VerificationResult::fail("capacity challenge expired");
    }
    if (challenge.claimed_bytes == 0) {
        return VerificationResult::fail("capacity claim is empty");
    }

    const auto stream = stream_for(challenge);
    crypto::Sha256 hasher;
    hasher.update(challenge.nonce);
    Bytes slice(kVerifySlice);
    for (std::uint64_t offset = 0; offset < challenge.claimed_bytes; offset += kVerifySlice) {
        const auto length = static_cast<std::size_t>(std::min<std::uint64_t>(kVerifySlice, challenge.claimed_bytes - offset));
        const auto window_bytes = std::span<std::uint8_t>(slice).first(length);
        stream.keystream(offset, window_bytes);
        hasher.update(window_bytes);
    }
    const auto expected = hasher.finalize();
    if (!crypto::HmacSha256::equal(expected, response.hash)) {
        return VerificationResult::fail("capacity response does not match");
    }
    return VerificationResult::ok();
}

}  // namespace vouchnet::security
