#include "vouchnet/security/RegistrationProof.hpp"

#include "vouchnet/crypto/Sha256.hpp"

#include <algorithm>
#include <cstring>
#include <random>

namespace vouchnet::security {

namespace {
constexpr std::string_view kRegistrationDomain = "vouchnet-registration-pow-v1";
}

Digest registration_pow_digest(const PeerId& peer, std::uint64_t nonce) {
    crypto::Sha256 hasher;
    hasher.update(kRegistrationDomain);
    hasher.update(peer);
    hasher.update_u64(nonce);
    return hasher.finalize();
}

std::size_t leading_zero_bits(std::span<const std::uint8_t> digest) {
    std::size_t total = 0;
    for (const auto byte : digest) {
        if (byte == 0) {
            total += 8;
            continue;
        }
        for (int bit = 7; bit >= 0 && ((byte >> bit) & 0x1) == 0; --bit) {
            ++total;
        }
        break;
    }
    return total;
}

bool registration_pow_valid(const PeerId& peer, std::uint64_t nonce, std::uint8_t difficulty_bits) {
    difficulty_bits = std::min(difficulty_bits, kMaxRegistrationPowDifficulty);
    if (difficulty_bits == 0) {
        return true;
    }
    return leading_zero_bits(registration_pow_digest(peer, nonce)) >= difficulty_bits;
}

std::optional<std::uint64_t> compute_registration_pow(const PeerId& peer,
                                                      std::uint8_t difficulty_bits,
                                                      std::uint64_t max_attempts) {
    difficulty_bits = std::min(difficulty_bits, kMaxRegistrationPowDifficulty);
    if (difficulty_bits == 0) {
        return std::uint64_t{0};
    }
    if (max_attempts == 0) {
        max_attempts = kDefaultRegistrationPowMaxAttempts;
    }

    // Start from a key-derived point so two searches for the same key agree.
    const auto seed_digest = registration_pow_digest(peer, 0);
    std::uint64_t seed = 0;
    std::memcpy(&seed, seed_digest.data(), sizeof(seed));
    std::mt19937_64 rng(seed);

    for (std::uint64_t attempt = 0; attempt < max_attempts; ++attempt) {
        const auto candidate = rng();
        if (registration_pow_valid(peer, candidate, difficulty_bits)) {
            return candidate;
        }
    }
    return std::nullopt;
}

}  // namespace vouchnet::security
