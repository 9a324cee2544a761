#pragma once

#include "vouchnet/Config.hpp"
#include "vouchnet/Errors.hpp"
#include "vouchnet/Types.hpp"
#include "vouchnet/network/ReputationManager.hpp"

#include <atomic>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vouchnet::network {

// Coarse group size advertised instead of an exact member count.
enum class SizeBucket : std::uint8_t {
    Small = 0,
    Medium = 1,
    Large = 2
};

SizeBucket size_bucket_for(std::size_t member_count);
std::string_view size_bucket_name(SizeBucket bucket);

struct RegistryEntry {
    PeerId peer{};
    std::uint32_t chunk_count{0};
    SizeBucket size_bucket{SizeBucket::Small};
    Timestamp registered_at{};
    std::uint32_t consecutive_failures{0};
    bool stale{false};
};

// Wire form of the advertised fields; failure tracking stays local.
Bytes encode_registry_entry(const RegistryEntry& entry);
RegistryEntry decode_registry_entry(std::span<const std::uint8_t> encoded);

struct RegistrationRequest {
    RegistryEntry entry{};
    std::uint64_t pow_nonce{0};
};

struct RegistrationResult {
    bool accepted{false};
    std::optional<ErrorCode> code;
    std::string reason;
    // Too few peers to hold replicas yet; the caller retries distribution later.
    bool persistence_deferred{false};
    bool updated{false};
};

class DiscoveryRegistry {
public:
    // With `reputation`, every accepted registration starts a reputation record
    // aged from the entry's registration time, and unregistering drops it.
    explicit DiscoveryRegistry(const Config& config, ReputationManager* reputation = nullptr);

    RegistrationResult register_peer(const RegistrationRequest& request);
    // Clean exit; the key is tombstoned and can never register again.
    bool unregister(const PeerId& peer);

    std::vector<RegistryEntry> discover() const;
    // Excludes entries marked stale after repeated failures.
    std::vector<RegistryEntry> discover_live() const;
    std::optional<RegistryEntry> find(const PeerId& peer) const;
    bool is_tombstoned(const PeerId& peer) const;

    void mark_failure(const PeerId& peer);
    void mark_success(const PeerId& peer);

    std::size_t network_size() const noexcept { return size_.load(); }
    std::uint64_t epoch() const;

private:
    struct Shard {
        mutable std::mutex mutex;
        std::map<PeerId, RegistryEntry> entries;
        std::set<PeerId> tombstones;
    };

    Shard& shard_for(const PeerId& peer) const;
    std::vector<RegistryEntry> gather(bool live_only) const;
    void note_size(std::size_t size);

    Config config_;
    ReputationManager* reputation_;
    std::vector<std::unique_ptr<Shard>> shards_;
    std::atomic<std::size_t> size_{0};

    mutable std::mutex epoch_mutex_;
    std::uint64_t epoch_{1};
    std::size_t size_at_epoch_{0};
    bool baseline_set_{false};
};

}  // namespace vouchnet::network
