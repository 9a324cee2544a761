#include "vouchnet/persistence/Recovery.hpp"

#include "vouchnet/log/StructuredLogger.hpp"
#include "vouchnet/persistence/ChunkCodec.hpp"
#include "vouchnet/persistence/HolderAssignment.hpp"

#include <algorithm>
#include <stdexcept>

namespace vouchnet::persistence {

namespace {

std::string join_indices(const std::vector<std::uint32_t>& indices) {
    std::string out;
    for (const auto index : indices) {
        if (!out.empty()) {
            out.push_back(',');
        }
        out += std::to_string(index);
    }
    return out;
}

std::chrono::milliseconds elapsed_since(std::chrono::steady_clock::time_point started) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - started);
}

RecoveryReport incomplete(const MemberId& owner, RecoveryReport report) {
    report.code = ErrorCode::RecoveryIncomplete;
    log::StructuredLogger::instance().error("recovery.incomplete",
                                            {{"owner", short_id(owner)},
                                             {"missing", join_indices(report.missing)},
                                             {"unauthenticated", report.authentication_failed ? "true" : "false"},
                                             {"attempts", std::to_string(report.stats.fetch_attempts)}});
    return report;
}

void log_completed(const MemberId& owner, const RecoveryReport& report, std::size_t chunk_count) {
    log::StructuredLogger::instance().info("recovery.completed",
                                           {{"owner", short_id(owner)},
                                            {"chunks", std::to_string(chunk_count)},
                                            {"fallbacks", std::to_string(report.stats.fallbacks)},
                                            {"elapsed_ms", std::to_string(report.stats.elapsed.count())}});
}

// A fetched copy of one chunk and how many holders returned it.
struct Copy {
    Chunk chunk;
    std::size_t holders{0};
    std::size_t best_rank{0};
};

}  // namespace

Recovery::Recovery(const Config& config, PeerChannel& channel)
    : config_(config),
      channel_(channel),
      verifier_(config),
      pool_(config.transfer_timeout) {}

RecoveryReport Recovery::recover(ChunkManifest& manifest, Timestamp now) {
    const auto started = std::chrono::steady_clock::now();

    struct Pending {
        std::size_t entry;
        PeerId holder;
        security::PossessionProbe probe;
        security::PossessionChallenge challenge;
    };

    RecoveryStats stats;
    std::vector<Pending> pending;
    // Holders left without a probe can still be fetched from; the content hash decides.
    std::vector<std::vector<PeerId>> unchallenged(manifest.entries.size());
    for (std::size_t e = 0; e < manifest.entries.size(); ++e) {
        auto& entry = manifest.entries[e];
        for (const auto& holder : entry.holders) {
            if (entry.probes.empty()) {
                unchallenged[e].push_back(holder);
                continue;
            }
            const auto probe = entry.probes.back();
            entry.probes.pop_back();
            pending.push_back({e, holder, probe,
                               security::PossessionVerifier::challenge_from_probe(probe, manifest.owner, entry.index, now)});
        }
    }

    std::vector<std::function<std::optional<security::PossessionResponse>()>> tasks;
    tasks.reserve(pending.size());
    for (const auto& item : pending) {
        tasks.emplace_back([this, holder = item.holder, challenge = item.challenge]() {
            return channel_.challenge(holder, challenge);
        });
    }
    stats.challenges_sent = tasks.size();
    const auto responses = pool_.run(std::move(tasks));

    std::vector<std::vector<PeerId>> candidates(manifest.entries.size());
    for (std::size_t i = 0; i < pending.size(); ++i) {
        const auto& item = pending[i];
        if (responses[i] && verifier_.verify_probe(item.probe, item.challenge, *responses[i], now).passed) {
            ++stats.challenges_passed;
            candidates[item.entry].push_back(item.holder);
        } else {
            ++stats.failures;
            log::StructuredLogger::instance().warning(
                "recovery.challenge_failed",
                {{"holder", short_id(item.holder)}, {"chunk", std::to_string(manifest.entries[item.entry].index)}});
        }
    }
    for (std::size_t e = 0; e < manifest.entries.size(); ++e) {
        candidates[e].insert(candidates[e].end(), unchallenged[e].begin(), unchallenged[e].end());
    }

    // Entries are addressed by chunk index; reorder candidate lists accordingly.
    std::vector<std::vector<PeerId>> by_index(manifest.entries.size());
    for (std::size_t e = 0; e < manifest.entries.size(); ++e) {
        const auto index = manifest.entries[e].index;
        if (index < by_index.size()) {
            by_index[index] = std::move(candidates[e]);
        }
    }
    return fetch_all(manifest, by_index, stats, started);
}

RecoveryReport Recovery::recover(const MemberId& owner,
                                 std::uint32_t chunk_count,
                                 const std::vector<PeerId>& peers,
                                 std::uint64_t epoch,
                                 const SnapshotAuthenticator& authenticate) {
    if (!authenticate) {
        throw std::invalid_argument("recovery without a manifest needs an authenticator");
    }
    const auto started = std::chrono::steady_clock::now();
    auto& logger = log::StructuredLogger::instance();

    struct Source {
        std::uint32_t index;
        std::size_t rank;
        PeerId holder;
    };

    const std::size_t limit = config_.replica_factor + config_.distribution_fallback_depth;
    std::vector<Source> sources;
    for (std::uint32_t index = 0; index < chunk_count; ++index) {
        auto ranked = rank_candidates(owner, index, peers, epoch);
        ranked.resize(std::min(ranked.size(), limit));
        for (std::size_t rank = 0; rank < ranked.size(); ++rank) {
            sources.push_back({index, rank, ranked[rank]});
        }
    }

    std::vector<std::function<std::optional<Chunk>()>> tasks;
    tasks.reserve(sources.size());
    for (const auto& source : sources) {
        FetchRequest request{owner, source.index};
        tasks.emplace_back([this, peer = source.holder, request]() {
            return channel_.fetch(peer, request);
        });
    }

    RecoveryReport report;
    report.stats.fetch_attempts = tasks.size();
    auto fetched = pool_.run(std::move(tasks));

    std::vector<std::vector<Copy>> copies(chunk_count);
    for (std::size_t i = 0; i < sources.size(); ++i) {
        const auto& source = sources[i];
        auto& chunk = fetched[i];
        if (!chunk || chunk->index != source.index || chunk_hash(chunk->data) != chunk->content_hash) {
            ++report.stats.failures;
            logger.warning("recovery.fetch_failed",
                           {{"holder", short_id(source.holder)}, {"chunk", std::to_string(source.index)}});
            continue;
        }
        auto& known = copies[source.index];
        const auto same = std::find_if(known.begin(), known.end(), [&](const Copy& copy) {
            return copy.chunk.content_hash == chunk->content_hash;
        });
        if (same != known.end()) {
            ++same->holders;
            same->best_rank = std::min(same->best_rank, source.rank);
        } else {
            known.push_back({std::move(*chunk), 1, source.rank});
        }
    }

    // Most widely held copy first, then the best-ranked holder.
    for (std::uint32_t index = 0; index < chunk_count; ++index) {
        auto& known = copies[index];
        std::sort(known.begin(), known.end(), [](const Copy& lhs, const Copy& rhs) {
            if (lhs.holders != rhs.holders) {
                return lhs.holders > rhs.holders;
            }
            return lhs.best_rank < rhs.best_rank;
        });
        if (known.empty()) {
            report.missing.push_back(index);
        }
    }
    if (!report.missing.empty()) {
        report.stats.elapsed = elapsed_since(started);
        return incomplete(owner, std::move(report));
    }

    // Odometer over the copies of each chunk; chunk 0 turns fastest.
    std::vector<std::size_t> choice(chunk_count, 0);
    while (report.stats.assemblies_tried < config_.recovery_max_assemblies) {
        std::vector<Chunk> assembly;
        assembly.reserve(chunk_count);
        for (std::uint32_t index = 0; index < chunk_count; ++index) {
            assembly.push_back(copies[index][choice[index]].chunk);
        }
        auto sealed = join(std::move(assembly));
        ++report.stats.assemblies_tried;
        if (authenticate(sealed)) {
            report.stats.fallbacks = report.stats.assemblies_tried - 1;
            report.stats.elapsed = elapsed_since(started);
            report.sealed = std::move(sealed);
            report.complete = true;
            log_completed(owner, report, chunk_count);
            return report;
        }
        logger.warning("recovery.assembly_rejected",
                       {{"owner", short_id(owner)}, {"attempt", std::to_string(report.stats.assemblies_tried)}});

        std::size_t position = 0;
        while (position < chunk_count && ++choice[position] == copies[position].size()) {
            choice[position] = 0;
            ++position;
        }
        if (position == chunk_count) {
            break;
        }
    }

    report.stats.fallbacks = report.stats.assemblies_tried - 1;
    report.stats.elapsed = elapsed_since(started);
    report.authentication_failed = true;
    return incomplete(owner, std::move(report));
}

RecoveryReport Recovery::fetch_all(const ChunkManifest& manifest,
                                   const std::vector<std::vector<PeerId>>& candidates,
                                   RecoveryStats stats,
                                   std::chrono::steady_clock::time_point started) {
    auto& logger = log::StructuredLogger::instance();
    const auto chunk_count = candidates.size();
    std::vector<std::optional<Chunk>> recovered(chunk_count);
    std::vector<std::size_t> attempt(chunk_count, 0);

    const auto expected_hash = [&](std::size_t index) -> const Digest* {
        const auto it = std::find_if(manifest.entries.begin(), manifest.entries.end(), [&](const ManifestEntry& entry) {
            return entry.index == index;
        });
        return it == manifest.entries.end() ? nullptr : &it->content_hash;
    };

    for (;;) {
        std::vector<std::size_t> wave;
        for (std::size_t i = 0; i < chunk_count; ++i) {
            if (!recovered[i] && attempt[i] < candidates[i].size()) {
                wave.push_back(i);
            }
        }
        if (wave.empty()) {
            break;
        }

        std::vector<std::function<std::optional<Chunk>()>> tasks;
        tasks.reserve(wave.size());
        for (const auto index : wave) {
            if (attempt[index] > 0) {
                ++stats.fallbacks;
            }
            FetchRequest request{manifest.owner, static_cast<std::uint32_t>(index)};
            tasks.emplace_back([this, peer = candidates[index][attempt[index]], request]() {
                return channel_.fetch(peer, request);
            });
        }
        stats.fetch_attempts += tasks.size();
        auto chunks = pool_.run(std::move(tasks));

        for (std::size_t w = 0; w < wave.size(); ++w) {
            const auto index = wave[w];
            const auto& peer = candidates[index][attempt[index]++];
            auto& chunk = chunks[w];
            const auto* commitment = expected_hash(index);
            const bool ok = chunk && chunk->index == index && commitment != nullptr &&
                            chunk_hash(chunk->data) == *commitment && chunk->content_hash == *commitment;
            if (ok) {
                recovered[index] = std::move(*chunk);
                continue;
            }
            ++stats.failures;
            logger.warning("recovery.fetch_failed", {{"holder", short_id(peer)}, {"chunk", std::to_string(index)}});
        }
    }

    RecoveryReport report;
    for (std::size_t i = 0; i < chunk_count; ++i) {
        if (!recovered[i]) {
            report.missing.push_back(static_cast<std::uint32_t>(i));
        }
    }

    report.stats = stats;
    report.stats.elapsed = elapsed_since(started);

    if (!report.missing.empty()) {
        return incomplete(manifest.owner, std::move(report));
    }

    std::vector<Chunk> chunks;
    chunks.reserve(chunk_count);
    for (auto& chunk : recovered) {
        chunks.push_back(std::move(*chunk));
    }
    report.sealed = join(std::move(chunks), manifest);
    report.complete = true;
    log_completed(manifest.owner, report, chunk_count);
    return report;
}

}  // namespace vouchnet::persistence
