#pragma once

#include "vouchnet/Types.hpp"

#include <cstdint>
#include <span>
#include <vector>

namespace vouchnet::persistence {

struct ChunkManifest;

struct Chunk {
    std::uint32_t index{0};
    Bytes data;
    // SHA-256 of data.
    Digest content_hash{};
};

Digest chunk_hash(std::span<const std::uint8_t> data);

// ceil(size / chunk_size) chunks, the last one short; empty input yields no chunks.
// Throws std::invalid_argument for a zero chunk size.
std::vector<Chunk> split(std::span<const std::uint8_t> ciphertext, std::size_t chunk_size);

// Chunks may arrive in any order. Throws VouchnetError(CorruptChunk) on a
// hash mismatch, a missing or duplicate index.
Bytes join(std::vector<Chunk> chunks);
// Additionally checks every chunk against the manifest's hash and size.
Bytes join(std::vector<Chunk> chunks, const ChunkManifest& manifest);

}  // namespace vouchnet::persistence
