#include "vouchnet/network/DiscoveryRegistry.hpp"

#include "vouchnet/Wire.hpp"
#include "vouchnet/log/StructuredLogger.hpp"
#include "vouchnet/security/RegistrationProof.hpp"

#include <algorithm>
#include <cmath>
#include <future>
#include <stdexcept>

namespace vouchnet::network {

namespace {

constexpr std::uint8_t kEntryVersion = 1;

RegistrationResult rejected(std::string reason) {
    RegistrationResult result;
    result.code = ErrorCode::RegistrationRejected;
    result.reason = std::move(reason);
    return result;
}

}  // namespace

SizeBucket size_bucket_for(std::size_t member_count) {
    if (member_count < 50) {
        return SizeBucket::Small;
    }
    if (member_count <= 200) {
        return SizeBucket::Medium;
    }
    return SizeBucket::Large;
}

std::string_view size_bucket_name(SizeBucket bucket) {
    switch (bucket) {
        case SizeBucket::Small:
            return "small";
        case SizeBucket::Medium:
            return "medium";
        case SizeBucket::Large:
            return "large";
    }
    return "small";
}

Bytes encode_registry_entry(const RegistryEntry& entry) {
    Bytes buffer;
    wire::append_u8(buffer, kEntryVersion);
    wire::append_bytes(buffer, entry.peer);
    wire::append_u32(buffer, entry.chunk_count);
    wire::append_u8(buffer, static_cast<std::uint8_t>(entry.size_bucket));
    wire::append_u64(buffer, to_unix_seconds(entry.registered_at));
    return buffer;
}

RegistryEntry decode_registry_entry(std::span<const std::uint8_t> encoded) {
    wire::Reader reader(encoded, "registry entry");
    if (reader.u8() != kEntryVersion) {
        throw std::invalid_argument("unsupported registry entry version");
    }
    RegistryEntry entry{};
    entry.peer = reader.fixed<32>();
    entry.chunk_count = reader.u32();
    const auto bucket = reader.u8();
    if (bucket > static_cast<std::uint8_t>(SizeBucket::Large)) {
        throw std::invalid_argument("registry entry has unknown size bucket");
    }
    entry.size_bucket = static_cast<SizeBucket>(bucket);
    entry.registered_at = from_unix_seconds(reader.u64());
    reader.expect_done();
    return entry;
}

DiscoveryRegistry::DiscoveryRegistry(const Config& config, ReputationManager* reputation)
    : config_(config),
      reputation_(reputation) {
    const auto count = std::max<std::uint16_t>(config.registry_shards, 1);
    shards_.reserve(count);
    for (std::uint16_t i = 0; i < count; ++i) {
        shards_.push_back(std::make_unique<Shard>());
    }
}

DiscoveryRegistry::Shard& DiscoveryRegistry::shard_for(const PeerId& peer) const {
    return *shards_[peer[0] % shards_.size()];
}

RegistrationResult DiscoveryRegistry::register_peer(const RegistrationRequest& request) {
    auto& logger = log::StructuredLogger::instance();
    const auto& peer = request.entry.peer;
    if (!security::registration_pow_valid(peer, request.pow_nonce, config_.registration_pow_difficulty)) {
        logger.warning("registry.registration_rejected", {{"peer", short_id(peer)}, {"reason", "proof_of_work"}});
        return rejected("registration proof of work is invalid");
    }

    RegistrationResult result;
    std::size_t size_after = 0;
    {
        auto& shard = shard_for(peer);
        std::scoped_lock lock(shard.mutex);
        if (shard.tombstones.contains(peer)) {
            logger.warning("registry.registration_rejected", {{"peer", short_id(peer)}, {"reason", "tombstoned"}});
            return rejected("peer key was unregistered and cannot return");
        }
        auto entry = request.entry;
        entry.consecutive_failures = 0;
        entry.stale = false;
        const auto [it, inserted] = shard.entries.insert_or_assign(peer, entry);
        result.updated = !inserted;
        size_after = inserted ? size_.fetch_add(1) + 1 : size_.load();
    }

    if (reputation_ != nullptr) {
        reputation_->track(peer, request.entry.registered_at);
    }
    result.accepted = true;
    result.persistence_deferred = size_after < config_.replica_factor;
    if (!result.updated) {
        note_size(size_after);
    }
    logger.info("registry.peer_registered",
                {{"peer", short_id(peer)},
                 {"bucket", std::string(size_bucket_name(request.entry.size_bucket))},
                 {"network_size", std::to_string(size_after)},
                 {"deferred", result.persistence_deferred ? "true" : "false"}});
    return result;
}

bool DiscoveryRegistry::unregister(const PeerId& peer) {
    std::size_t size_after = 0;
    {
        auto& shard = shard_for(peer);
        std::scoped_lock lock(shard.mutex);
        if (shard.entries.erase(peer) == 0) {
            return false;
        }
        shard.tombstones.insert(peer);
        size_after = size_.fetch_sub(1) - 1;
    }
    if (reputation_ != nullptr) {
        reputation_->forget(peer);
    }
    note_size(size_after);
    log::StructuredLogger::instance().info("registry.peer_unregistered", {{"peer", short_id(peer)}});
    return true;
}

std::vector<RegistryEntry> DiscoveryRegistry::gather(bool live_only) const {
    std::vector<std::future<std::vector<RegistryEntry>>> pending;
    pending.reserve(shards_.size());
    for (const auto& shard : shards_) {
        pending.push_back(std::async(std::launch::async, [&shard, live_only]() {
            std::vector<RegistryEntry> out;
            std::scoped_lock lock(shard->mutex);
            for (const auto& [peer, entry] : shard->entries) {
                if (!live_only || !entry.stale) {
                    out.push_back(entry);
                }
            }
            return out;
        }));
    }

    std::vector<RegistryEntry> entries;
    for (auto& future : pending) {
        auto part = future.get();
        entries.insert(entries.end(), part.begin(), part.end());
    }
    std::sort(entries.begin(), entries.end(), [](const RegistryEntry& lhs, const RegistryEntry& rhs) {
        return lhs.peer < rhs.peer;
    });
    return entries;
}

std::vector<RegistryEntry> DiscoveryRegistry::discover() const {
    return gather(false);
}

std::vector<RegistryEntry> DiscoveryRegistry::discover_live() const {
    return gather(true);
}

std::optional<RegistryEntry> DiscoveryRegistry::find(const PeerId& peer) const {
    auto& shard = shard_for(peer);
    std::scoped_lock lock(shard.mutex);
    const auto it = shard.entries.find(peer);
    if (it == shard.entries.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool DiscoveryRegistry::is_tombstoned(const PeerId& peer) const {
    auto& shard = shard_for(peer);
    std::scoped_lock lock(shard.mutex);
    return shard.tombstones.contains(peer);
}

void DiscoveryRegistry::mark_failure(const PeerId& peer) {
    auto& shard = shard_for(peer);
    std::scoped_lock lock(shard.mutex);
    const auto it = shard.entries.find(peer);
    if (it == shard.entries.end()) {
        return;
    }
    auto& entry = it->second;
    ++entry.consecutive_failures;
    if (!entry.stale && entry.consecutive_failures >= config_.registry_stale_after_failures) {
        entry.stale = true;
        log::StructuredLogger::instance().warning(
            "registry.peer_stale",
            {{"peer", short_id(peer)}, {"failures", std::to_string(entry.consecutive_failures)}});
    }
}

void DiscoveryRegistry::mark_success(const PeerId& peer) {
    auto& shard = shard_for(peer);
    std::scoped_lock lock(shard.mutex);
    const auto it = shard.entries.find(peer);
    if (it != shard.entries.end()) {
        it->second.consecutive_failures = 0;
        it->second.stale = false;
    }
}

std::uint64_t DiscoveryRegistry::epoch() const {
    std::scoped_lock lock(epoch_mutex_);
    return epoch_;
}

void DiscoveryRegistry::note_size(std::size_t size) {
    std::scoped_lock lock(epoch_mutex_);
    if (!baseline_set_) {
        baseline_set_ = true;
        size_at_epoch_ = size;
        return;
    }
    const auto change = std::abs(static_cast<double>(size) - static_cast<double>(size_at_epoch_));
    if (change > config_.registry_epoch_churn_ratio * static_cast<double>(size_at_epoch_)) {
        ++epoch_;
        size_at_epoch_ = size;
        log::StructuredLogger::instance().info("registry.epoch_advanced",
                                               {{"epoch", std::to_string(epoch_)},
                                                {"network_size", std::to_string(size)}});
    }
}

}  // namespace vouchnet::network
