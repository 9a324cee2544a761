#pragma once

#include "vouchnet/Config.hpp"
#include "vouchnet/Errors.hpp"
#include "vouchnet/Types.hpp"

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

namespace vouchnet::security {

struct PossessionChallenge {
    std::array<std::uint8_t, 32> nonce{};
    MemberId owner{};
    std::uint32_t chunk_index{0};
    std::uint32_t offset{0};
    std::uint32_t length{0};
    Timestamp issued_at{};
};

struct PossessionResponse {
    Digest hash{};
    Timestamp responded_at{};
};

// Challenge prepared while the owner still had the chunk, with the answer it expects.
struct PossessionProbe {
    std::array<std::uint8_t, 32> nonce{};
    std::uint32_t offset{0};
    std::uint32_t length{0};
    Digest expected{};

    bool operator==(const PossessionProbe&) const = default;
};

Digest possession_digest(std::span<const std::uint8_t> nonce, std::span<const std::uint8_t> window);

class PossessionVerifier {
public:
    explicit PossessionVerifier(const Config& config);

    // Random nonce and a random window of at most sample_length bytes.
    PossessionChallenge issue(const MemberId& owner,
                              std::uint32_t chunk_index,
                              std::size_t chunk_size,
                              Timestamp now) const;

    // Holder side; nullopt when the requested range lies outside the chunk.
    static std::optional<PossessionResponse> respond(const PossessionChallenge& challenge,
                                                     std::span<const std::uint8_t> chunk,
                                                     Timestamp now);

    VerificationResult verify(const PossessionChallenge& challenge,
                              const PossessionResponse& response,
                              std::span<const std::uint8_t> chunk,
                              Timestamp now) const;

    std::vector<PossessionProbe> precompute_probes(std::span<const std::uint8_t> chunk, std::size_t count) const;
    static PossessionChallenge challenge_from_probe(const PossessionProbe& probe,
                                                    const MemberId& owner,
                                                    std::uint32_t chunk_index,
                                                    Timestamp now);
    VerificationResult verify_probe(const PossessionProbe& probe,
                                    const PossessionChallenge& challenge,
                                    const PossessionResponse& response,
                                    Timestamp now) const;

private:
    VerificationResult check_freshness(const PossessionChallenge& challenge,
                                       const PossessionResponse& response,
                                       Timestamp now) const;

    std::uint32_t sample_length_;
    std::chrono::seconds freshness_;
};

}  // namespace vouchnet::security
