#include "vouchnet/security/PossessionVerifier.hpp"

#include "vouchnet/crypto/HmacSha256.hpp"
#include "vouchnet/crypto/Sha256.hpp"
#include "vouchnet/crypto/SnapshotCipher.hpp"

#include <algorithm>

namespace vouchnet::security {

namespace {

std::uint32_t random_below(std::uint64_t bound) {
    if (bound <= 1) {
        return 0;
    }
    std::array<std::uint8_t, 8> raw{};
    crypto::random_bytes(raw);
    std::uint64_t value = 0;
    for (const auto byte : raw) {
        value = (value << 8) | byte;
    }
    return static_cast<std::uint32_t>(value % bound);
}

bool range_fits(std::uint32_t offset, std::uint32_t length, std::size_t size) {
    return length > 0 && static_cast<std::uint64_t>(offset) + length <= size;
}

}  // namespace

Digest possession_digest(std::span<const std::uint8_t> nonce, std::span<const std::uint8_t> window) {
    crypto::Sha256 hasher;
    hasher.update(nonce);
    hasher.update(window);
    return hasher.finalize();
}

PossessionVerifier::PossessionVerifier(const Config& config)
    : sample_length_(std::max<std::uint32_t>(config.possession_sample_length, 1)),
      freshness_(config.possession_freshness) {}

PossessionChallenge PossessionVerifier::issue(const MemberId& owner,
                                              std::uint32_t chunk_index,
                                              std::size_t chunk_size,
                                              Timestamp now) const {
    PossessionChallenge challenge{};
    crypto::random_bytes(challenge.nonce);
    challenge.owner = owner;
    challenge.chunk_index = chunk_index;
    challenge.issued_at = now;
    challenge.length = static_cast<std::uint32_t>(std::min<std::size_t>(sample_length_, chunk_size));
    challenge.offset = random_below(chunk_size - challenge.length + 1);
    return challenge;
}

std::optional<PossessionResponse> PossessionVerifier::respond(const PossessionChallenge& challenge,
                                                              std::span<const std::uint8_t> chunk,
                                                              Timestamp now) {
    if (!range_fits(challenge.offset, challenge.length, chunk.size())) {
        return std::nullopt;
    }
    return PossessionResponse{possession_digest(challenge.nonce, chunk.subspan(challenge.offset, challenge.length)), now};
}

VerificationResult PossessionVerifier::check_freshness(const PossessionChallenge& challenge,
                                                       const PossessionResponse& response,
                                                       Timestamp now) const {
    if (now - challenge.issued_at > freshness_) {
        return VerificationResult::fail("challenge is stale");
    }
    if (response.responded_at < challenge.issued_at || response.responded_at - challenge.issued_at > freshness_) {
        return VerificationResult::fail("response outside freshness window");
    }
    return VerificationResult::ok();
}

VerificationResult PossessionVerifier::verify(const PossessionChallenge& challenge,
                                              const PossessionResponse& response,
                                              std::span<const std::uint8_t> chunk,
                                              Timestamp now) const {
    if (auto fresh = check_freshness(challenge, response, now); !fresh) {
        return fresh;
    }
    if (!range_fits(challenge.offset, challenge.length, chunk.size())) {
        return VerificationResult::fail("challenge range outside chunk");
    }
    const auto expected = possession_digest(challenge.nonce, chunk.subspan(challenge.offset, challenge.length));
    if (!crypto::HmacSha256::equal(expected, response.hash)) {
        return VerificationResult::fail("possession hash mismatch");
    }
    return VerificationResult::ok();
}

std::vector<PossessionProbe> PossessionVerifier::precompute_probes(std::span<const std::uint8_t> chunk,
                                                                   std::size_t count) const {
    std::vector<PossessionProbe> probes;
    if (chunk.empty()) {
        return probes;
    }
    probes.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        PossessionProbe probe{};
        crypto::random_bytes(probe.nonce);
        probe.length = static_cast<std::uint32_t>(std::min<std::size_t>(sample_length_, chunk.size()));
        probe.offset = random_below(chunk.size() - probe.length + 1);
        probe.expected = possession_digest(probe.nonce, chunk.subspan(probe.offset, probe.length));
        probes.push_back(probe);
    }
    return probes;
}

PossessionChallenge PossessionVerifier::challenge_from_probe(const PossessionProbe& probe,
                                                             const MemberId& owner,
                                                             std::uint32_t chunk_index,
                                                             Timestamp now) {
    PossessionChallenge challenge{};
    challenge.nonce = probe.nonce;
    challenge.owner = owner;
    challenge.chunk_index = chunk_index;
    challenge.offset = probe.offset;
    challenge.length = probe.length;
    challenge.issued_at = now;
    return challenge;
}

VerificationResult PossessionVerifier::verify_probe(const PossessionProbe& probe,
                                                    const PossessionChallenge& challenge,
                                                    const PossessionResponse& response,
                                                    Timestamp now) const {
    if (auto fresh = check_freshness(challenge, response, now); !fresh) {
        return fresh;
    }
    if (challenge.nonce != probe.nonce || challenge.offset != probe.offset || challenge.length != probe.length) {
        return VerificationResult::fail("challenge does not match probe");
    }
    if (!crypto::HmacSha256::equal(probe.expected, response.hash)) {
        return VerificationResult::fail("possession hash mismatch");
    }
    return VerificationResult::ok();
}

}  // namespace vouchnet::security
