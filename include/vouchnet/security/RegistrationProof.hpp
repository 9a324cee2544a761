#pragma once

#include "vouchnet/Types.hpp"

#include <cstdint>
#include <optional>
#include <span>

namespace vouchnet::security {

constexpr std::uint8_t kMaxRegistrationPowDifficulty = 24;
constexpr std::uint64_t kDefaultRegistrationPowMaxAttempts = 4'000'000;

// SHA-256 over a fixed domain tag, the peer key and the big-endian nonce.
Digest registration_pow_digest(const PeerId& peer, std::uint64_t nonce);

std::size_t leading_zero_bits(std::span<const std::uint8_t> digest);

// Difficulties above the cap are clamped; zero accepts any nonce.
bool registration_pow_valid(const PeerId& peer, std::uint64_t nonce, std::uint8_t difficulty_bits);

std::optional<std::uint64_t> compute_registration_pow(const PeerId& peer,
                                                      std::uint8_t difficulty_bits,
                                                      std::uint64_t max_attempts = kDefaultRegistrationPowMaxAttempts);

}  // namespace vouchnet::security
