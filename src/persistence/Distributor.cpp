#include "vouchnet/persistence/Distributor.hpp"

#include "vouchnet/log/StructuredLogger.hpp"
#include "vouchnet/persistence/ChunkCodec.hpp"
#include "vouchnet/persistence/HolderAssignment.hpp"

#include <algorithm>

namespace vouchnet::persistence {

namespace {

bool receipt_matches(const std::optional<PushReceipt>& receipt, const PeerId& peer, const Chunk& chunk) {
    return receipt && receipt->holder == peer && receipt->chunk_index == chunk.index &&
           receipt->content_hash == chunk.content_hash;
}

}  // namespace

Distributor::Distributor(const Config& config,
                         PeerChannel& channel,
                         network::DiscoveryRegistry& registry,
                         network::ReputationManager& reputation,
                         const security::SybilGate& gate,
                         const crypto::Key& attestation_key)
    : config_(config),
      channel_(channel),
      registry_(registry),
      reputation_(reputation),
      gate_(gate),
      attestation_key_(attestation_key),
      verifier_(config),
      health_(config.replica_factor),
      pool_(config.transfer_timeout) {}

std::optional<std::uint64_t> Distributor::last_epoch() const {
    std::scoped_lock lock(mutex_);
    return last_epoch_;
}

void Distributor::note_outcome(const PeerId& peer, bool ok) {
    if (ok) {
        reputation_.record_success(peer);
        registry_.mark_success(peer);
    } else {
        reputation_.record_failure(peer);
        registry_.mark_failure(peer);
    }
}

DistributionReport Distributor::distribute(const MemberId& owner,
                                           std::span<const std::uint8_t> sealed_snapshot,
                                           std::uint64_t epoch,
                                           Timestamp now) {
    std::scoped_lock lock(mutex_);
    auto& logger = log::StructuredLogger::instance();
    if (last_epoch_ && epoch <= *last_epoch_) {
        throw VouchnetError(ErrorCode::InvalidState,
                            "epoch " + std::to_string(epoch) + " is not newer than " + std::to_string(*last_epoch_));
    }

    DistributionReport report;
    report.epoch = epoch;

    auto peers = gate_.eligible_peers(registry_.discover_live(), now);
    peers.erase(std::remove(peers.begin(), peers.end(), owner), peers.end());
    report.eligible_peers = peers.size();
    const std::size_t replica_factor = config_.replica_factor;
    if (peers.size() < replica_factor) {
        report.deferred = true;
        report.code = ErrorCode::InsufficientPeers;
        report.reason = "need " + std::to_string(replica_factor) + " eligible peers, have " + std::to_string(peers.size());
        report.health = health_.status();
        logger.warning("distribution.deferred",
                       {{"owner", short_id(owner)}, {"epoch", std::to_string(epoch)}, {"eligible", std::to_string(peers.size())}});
        return report;
    }

    const auto chunks = split(sealed_snapshot, config_.chunk_size);
    report.chunk_count = static_cast<std::uint32_t>(chunks.size());
    health_.reset(report.chunk_count);

    const auto candidate_limit = std::min(peers.size(), replica_factor + config_.distribution_fallback_depth);
    std::vector<std::vector<PeerId>> ranked(chunks.size());
    std::vector<std::size_t> cursor(chunks.size(), replica_factor);
    std::vector<std::vector<PeerId>> confirmed(chunks.size());

    std::vector<Slot> wave;
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        ranked[i] = rank_candidates(owner, chunks[i].index, peers, epoch);
        ranked[i].resize(std::min(ranked[i].size(), candidate_limit));
        for (std::size_t r = 0; r < replica_factor && r < ranked[i].size(); ++r) {
            wave.push_back({i, ranked[i][r]});
        }
    }

    while (!wave.empty()) {
        std::vector<std::function<std::optional<PushReceipt>()>> tasks;
        tasks.reserve(wave.size());
        for (const auto& slot : wave) {
            PushRequest request{owner, epoch, chunks[slot.chunk]};
            tasks.emplace_back([this, peer = slot.peer, request = std::move(request)]() {
                return channel_.push(peer, request);
            });
        }
        report.pushes_attempted += tasks.size();
        const auto receipts = pool_.run(std::move(tasks));

        std::vector<Slot> next_wave;
        for (std::size_t t = 0; t < wave.size(); ++t) {
            const auto& slot = wave[t];
            const auto& chunk = chunks[slot.chunk];
            const bool ok = receipt_matches(receipts[t], slot.peer, chunk);
            note_outcome(slot.peer, ok);
            health_.record(chunk.index, slot.peer, ok);
            if (ok) {
                ++report.pushes_confirmed;
                reputation_.record_chunk_held(slot.peer);
                confirmed[slot.chunk].push_back(slot.peer);
                report.attestations.push_back(
                    sign_attestation(attestation_key_, owner, chunk.index, chunk.content_hash, slot.peer, epoch, now));
                continue;
            }
            logger.warning("distribution.push_failed",
                           {{"peer", short_id(slot.peer)}, {"chunk", std::to_string(chunk.index)}});
            auto& next = cursor[slot.chunk];
            if (next < ranked[slot.chunk].size()) {
                next_wave.push_back({slot.chunk, ranked[slot.chunk][next++]});
                ++report.fallbacks_used;
            }
        }
        wave = std::move(next_wave);
    }

    report.manifest.owner = owner;
    report.manifest.epoch = epoch;
    report.manifest.chunk_size = static_cast<std::uint32_t>(config_.chunk_size);
    report.manifest.total_size = sealed_snapshot.size();
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        ManifestEntry entry{};
        entry.index = chunks[i].index;
        entry.content_hash = chunks[i].content_hash;
        entry.size = static_cast<std::uint32_t>(chunks[i].data.size());
        // Keep rank order so recovery tries the best-placed holder first.
        for (const auto& peer : ranked[i]) {
            if (std::find(confirmed[i].begin(), confirmed[i].end(), peer) != confirmed[i].end()) {
                entry.holders.push_back(peer);
            }
        }
        entry.probes = verifier_.precompute_probes(chunks[i].data, config_.probes_per_chunk);
        if (entry.holders.size() < replica_factor) {
            report.under_replicated.push_back(entry.index);
        }
        report.manifest.entries.push_back(std::move(entry));
    }

    report.complete = report.under_replicated.empty();
    report.health = health_.status();
    last_epoch_ = epoch;

    log::StructuredLogger::FieldList fields{{"owner", short_id(owner)},
                                            {"epoch", std::to_string(epoch)},
                                            {"chunks", std::to_string(report.chunk_count)},
                                            {"confirmed", std::to_string(report.pushes_confirmed)},
                                            {"fallbacks", std::to_string(report.fallbacks_used)},
                                            {"health", std::string(replication_status_name(report.health))}};
    if (report.complete) {
        logger.info("distribution.completed", std::move(fields));
    } else {
        fields.emplace_back("under_replicated", std::to_string(report.under_replicated.size()));
        logger.warning("distribution.partial", std::move(fields));
    }
    return report;
}

AuditReport Distributor::audit(ChunkManifest& manifest, Timestamp now) {
    struct Probe {
        std::size_t entry;
        PeerId holder;
        security::PossessionProbe probe;
        security::PossessionChallenge challenge;
    };

    std::scoped_lock lock(mutex_);
    AuditReport report;
    std::vector<Probe> probes;
    for (std::size_t e = 0; e < manifest.entries.size(); ++e) {
        auto& entry = manifest.entries[e];
        for (const auto& holder : entry.holders) {
            if (entry.probes.empty()) {
                ++report.unchecked;
                continue;
            }
            const auto probe = entry.probes.back();
            entry.probes.pop_back();
            probes.push_back({e, holder, probe,
                              security::PossessionVerifier::challenge_from_probe(probe, manifest.owner, entry.index, now)});
        }
    }

    std::vector<std::function<std::optional<security::PossessionResponse>()>> tasks;
    tasks.reserve(probes.size());
    for (const auto& probe : probes) {
        tasks.emplace_back([this, holder = probe.holder, challenge = probe.challenge]() {
            return channel_.challenge(holder, challenge);
        });
    }
    const auto responses = pool_.run(std::move(tasks));

    for (std::size_t i = 0; i < probes.size(); ++i) {
        const auto& probe = probes[i];
        const bool ok = responses[i] && verifier_.verify_probe(probe.probe, probe.challenge, *responses[i], now).passed;
        note_outcome(probe.holder, ok);
        if (manifest.epoch == last_epoch_.value_or(0)) {
            health_.record(manifest.entries[probe.entry].index, probe.holder, ok);
        }
        if (ok) {
            ++report.verified;
        } else {
            ++report.failed;
        }
    }

    log::StructuredLogger::instance().info("distribution.audit",
                                           {{"owner", short_id(manifest.owner)},
                                            {"verified", std::to_string(report.verified)},
                                            {"failed", std::to_string(report.failed)},
                                            {"unchecked", std::to_string(report.unchecked)}});
    return report;
}

}  // namespace vouchnet::persistence
