#include "vouchnet/storage/HolderStore.hpp"

#include "vouchnet/log/StructuredLogger.hpp"

namespace vouchnet::storage {

HolderStore::HolderStore(const Config& config, const PeerId& self)
    : config_(config),
      self_(self) {}

void HolderStore::erase_owner_locked(const MemberId& owner) {
    for (auto it = chunks_.lower_bound({owner, 0}); it != chunks_.end() && it->first.first == owner;) {
        bytes_used_ -= it->second.chunk.data.size();
        it = chunks_.erase(it);
    }
    owner_epochs_.erase(owner);
}

std::optional<persistence::PushReceipt> HolderStore::accept(const persistence::PushRequest& request) {
    const auto& chunk = request.chunk;
    if (persistence::chunk_hash(chunk.data) != chunk.content_hash) {
        log::StructuredLogger::instance().warning(
            "holder.chunk_rejected",
            {{"owner", short_id(request.owner)}, {"chunk", std::to_string(chunk.index)}, {"reason", "hash_mismatch"}});
        return std::nullopt;
    }

    std::scoped_lock lock(chunks_mutex_);
    const auto held_epoch = owner_epochs_.find(request.owner);
    if (held_epoch != owner_epochs_.end()) {
        if (request.epoch < held_epoch->second) {
            return std::nullopt;
        }
        if (request.epoch > held_epoch->second) {
            erase_owner_locked(request.owner);
        }
    }

    const Key key{request.owner, chunk.index};
    const auto existing = chunks_.find(key);
    const auto replaced = existing == chunks_.end() ? 0 : existing->second.chunk.data.size();
    if (bytes_used_ - replaced + chunk.data.size() > config_.holder_capacity_bytes) {
        log::StructuredLogger::instance().warning(
            "holder.chunk_rejected",
            {{"owner", short_id(request.owner)}, {"chunk", std::to_string(chunk.index)}, {"reason", "capacity"}});
        return std::nullopt;
    }

    bytes_used_ = bytes_used_ - replaced + chunk.data.size();
    chunks_.insert_or_assign(key, HeldChunk{request.owner, request.epoch, chunk});
    owner_epochs_[request.owner] = request.epoch;
    return persistence::PushReceipt{self_, chunk.index, chunk.content_hash};
}

std::optional<persistence::Chunk> HolderStore::fetch(const persistence::FetchRequest& request) const {
    std::scoped_lock lock(chunks_mutex_);
    const auto it = chunks_.find({request.owner, request.chunk_index});
    if (it == chunks_.end()) {
        return std::nullopt;
    }
    return it->second.chunk;
}

std::optional<security::PossessionResponse> HolderStore::answer(const security::PossessionChallenge& challenge,
                                                                Timestamp responded_at) const {
    std::scoped_lock lock(chunks_mutex_);
    const auto it = chunks_.find({challenge.owner, challenge.chunk_index});
    if (it == chunks_.end()) {
        return std::nullopt;
    }
    return security::PossessionVerifier::respond(challenge, it->second.chunk.data, responded_at);
}

security::CapacityResponse HolderStore::prove_capacity(const security::CapacityChallenge& challenge,
                                                       Timestamp now) const {
    const auto buffer = security::materialize_capacity_buffer(challenge);
    return security::respond_capacity(challenge, buffer, now);
}

bool HolderStore::drop_owner(const MemberId& owner) {
    std::scoped_lock lock(chunks_mutex_);
    if (!owner_epochs_.contains(owner)) {
        return false;
    }
    erase_owner_locked(owner);
    return true;
}

std::size_t HolderStore::bytes_used() const {
    std::scoped_lock lock(chunks_mutex_);
    return bytes_used_;
}

std::size_t HolderStore::size() const {
    std::scoped_lock lock(chunks_mutex_);
    return chunks_.size();
}

std::vector<HolderStore::SnapshotEntry> HolderStore::snapshot() const {
    std::scoped_lock lock(chunks_mutex_);
    std::vector<SnapshotEntry> entries;
    entries.reserve(chunks_.size());
    for (const auto& [key, held] : chunks_) {
        entries.push_back({key.first, key.second, held.epoch, held.chunk.data.size()});
    }
    return entries;
}

}  // namespace vouchnet::storage
