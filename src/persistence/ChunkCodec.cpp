#include "vouchnet/persistence/ChunkCodec.hpp"

#include "vouchnet/Errors.hpp"
#include "vouchnet/crypto/Sha256.hpp"
#include "vouchnet/persistence/ChunkManifest.hpp"

#include <algorithm>
#include <limits>
#include <stdexcept>

namespace vouchnet::persistence {

namespace {

[[noreturn]] void corrupt(const std::string& message) {
    throw VouchnetError(ErrorCode::CorruptChunk, message);
}

void order_and_check(std::vector<Chunk>& chunks) {
    std::sort(chunks.begin(), chunks.end(), [](const Chunk& lhs, const Chunk& rhs) {
        return lhs.index < rhs.index;
    });
    for (std::size_t i = 0; i < chunks.size(); ++i) {
        if (chunks[i].index != i) {
            corrupt(chunks[i].index < i ? "duplicate chunk index " + std::to_string(chunks[i].index)
                                        : "missing chunk index " + std::to_string(i));
        }
        if (chunk_hash(chunks[i].data) != chunks[i].content_hash) {
            corrupt("chunk " + std::to_string(i) + " does not match its content hash");
        }
    }
}

Bytes concatenate(const std::vector<Chunk>& chunks) {
    std::size_t total = 0;
    for (const auto& chunk : chunks) {
        total += chunk.data.size();
    }
    Bytes out;
    out.reserve(total);
    for (const auto& chunk : chunks) {
        out.insert(out.end(), chunk.data.begin(), chunk.data.end());
    }
    return out;
}

}  // namespace

Digest chunk_hash(std::span<const std::uint8_t> data) {
    return crypto::Sha256::digest(data);
}

std::vector<Chunk> split(std::span<const std::uint8_t> ciphertext, std::size_t chunk_size) {
    if (chunk_size == 0) {
        throw std::invalid_argument("chunk size must be positive");
    }
    const auto count = (ciphertext.size() + chunk_size - 1) / chunk_size;
    if (count > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("too many chunks");
    }

    std::vector<Chunk> chunks;
    chunks.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto offset = i * chunk_size;
        const auto piece = ciphertext.subspan(offset, std::min(chunk_size, ciphertext.size() - offset));
        Chunk chunk{};
        chunk.index = static_cast<std::uint32_t>(i);
        chunk.data.assign(piece.begin(), piece.end());
        chunk.content_hash = chunk_hash(piece);
        chunks.push_back(std::move(chunk));
    }
    return chunks;
}

Bytes join(std::vector<Chunk> chunks) {
    order_and_check(chunks);
    return concatenate(chunks);
}

Bytes join(std::vector<Chunk> chunks, const ChunkManifest& manifest) {
    order_and_check(chunks);
    if (chunks.size() != manifest.entries.size()) {
        corrupt("expected " + std::to_string(manifest.entries.size()) + " chunks, got " + std::to_string(chunks.size()));
    }
    for (const auto& entry : manifest.entries) {
        if (entry.index >= chunks.size()) {
            corrupt("manifest names unknown chunk " + std::to_string(entry.index));
        }
        const auto& chunk = chunks[entry.index];
        if (chunk.content_hash != entry.content_hash || chunk.data.size() != entry.size) {
            corrupt("chunk " + std::to_string(entry.index) + " does not match the manifest");
        }
    }
    auto joined = concatenate(chunks);
    if (joined.size() != manifest.total_size) {
        corrupt("joined size does not match the manifest");
    }
    return joined;
}

}  // namespace vouchnet::persistence
