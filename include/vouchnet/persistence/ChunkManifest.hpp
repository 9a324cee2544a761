#pragma once

#include "vouchnet/Types.hpp"
#include "vouchnet/security/PossessionVerifier.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace vouchnet::persistence {

struct ManifestEntry {
    std::uint32_t index{0};
    Digest content_hash{};
    std::uint32_t size{0};
    // Confirmed holders in rank order.
    std::vector<PeerId> holders;
    // Unused possession probes; each is consumed by one recovery attempt.
    std::vector<security::PossessionProbe> probes;
};

// What the owner keeps (or hands to a trusted contact) to recover a snapshot.
struct ChunkManifest {
    MemberId owner{};
    std::uint64_t epoch{0};
    std::uint32_t chunk_size{0};
    std::uint64_t total_size{0};
    std::vector<ManifestEntry> entries;
};

// vnm://<base64>
std::string encode_manifest(const ChunkManifest& manifest);
// Throws std::invalid_argument on malformed input.
ChunkManifest decode_manifest(const std::string& uri);

}  // namespace vouchnet::persistence
