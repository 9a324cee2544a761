#pragma once

#include "vouchnet/trust/GroupPolicy.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace vouchnet {

struct Config {
    // Applied to genesis states; afterwards the policy travels with the state.
    trust::GroupPolicy group_policy{};

    std::size_t chunk_size{64 * 1024};
    std::uint16_t replica_factor{2};
    std::chrono::milliseconds transfer_timeout{std::chrono::milliseconds(5000)};
    std::uint16_t distribution_fallback_depth{4};
    std::uint8_t probes_per_chunk{4};
    // Upper bound on chunk combinations tried when recovering without a manifest.
    std::uint32_t recovery_max_assemblies{256};

    std::uint16_t registry_shards{16};
    std::uint8_t registry_stale_after_failures{3};
    double registry_epoch_churn_ratio{0.10};

    std::uint8_t registration_pow_difficulty{16};
    std::uint64_t registration_pow_max_attempts{4'000'000};
    std::uint64_t capacity_buffer_bytes{1024ull * 1024ull};
    std::chrono::seconds capacity_challenge_window{std::chrono::minutes(5)};
    std::chrono::seconds min_holder_age{std::chrono::hours(24 * 7)};
    double reputation_floor{0.3};
    double reputation_weight_success{0.5};
    double reputation_weight_age{0.3};
    double reputation_weight_activity{0.2};
    std::chrono::seconds reputation_age_saturation{std::chrono::hours(24 * 30)};
    std::uint32_t reputation_chunk_saturation{10};
    std::uint16_t max_consecutive_failures{3};

    std::uint32_t possession_sample_length{256};
    std::chrono::seconds possession_freshness{std::chrono::hours(1)};
    std::chrono::seconds attestation_max_age{std::chrono::hours(24 * 7)};

    std::size_t holder_capacity_bytes{64ull * 1024ull * 1024ull};

    bool logging_enabled{true};
};

}  // namespace vouchnet
