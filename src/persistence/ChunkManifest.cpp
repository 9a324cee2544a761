#include "vouchnet/persistence/ChunkManifest.hpp"

#include "vouchnet/Wire.hpp"

#include <limits>
#include <stdexcept>

namespace vouchnet::persistence {

namespace {

constexpr std::uint8_t kManifestVersion = 1;
constexpr std::string_view kScheme = "vnm://";
constexpr std::size_t kMaxListLength = std::numeric_limits<std::uint16_t>::max();

void require_list_fits(std::size_t size, const char* what) {
    if (size > kMaxListLength) {
        throw std::length_error(std::string("manifest ") + what + " count exceeds limit");
    }
}

}  // namespace

std::string encode_manifest(const ChunkManifest& manifest) {
    if (manifest.entries.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw std::length_error("manifest entry count exceeds limit");
    }

    Bytes buffer;
    wire::append_u8(buffer, kManifestVersion);
    wire::append_bytes(buffer, manifest.owner);
    wire::append_u64(buffer, manifest.epoch);
    wire::append_u32(buffer, manifest.chunk_size);
    wire::append_u64(buffer, manifest.total_size);
    wire::append_u32(buffer, static_cast<std::uint32_t>(manifest.entries.size()));

    for (const auto& entry : manifest.entries) {
        require_list_fits(entry.holders.size(), "holder");
        require_list_fits(entry.probes.size(), "probe");

        wire::append_u32(buffer, entry.index);
        wire::append_bytes(buffer, entry.content_hash);
        wire::append_u32(buffer, entry.size);

        wire::append_u16(buffer, static_cast<std::uint16_t>(entry.holders.size()));
        for (const auto& holder : entry.holders) {
            wire::append_bytes(buffer, holder);
        }

        wire::append_u16(buffer, static_cast<std::uint16_t>(entry.probes.size()));
        for (const auto& probe : entry.probes) {
            wire::append_bytes(buffer, probe.nonce);
            wire::append_u32(buffer, probe.offset);
            wire::append_u32(buffer, probe.length);
            wire::append_bytes(buffer, probe.expected);
        }
    }

    return std::string{kScheme} + wire::base64_encode(buffer);
}

ChunkManifest decode_manifest(const std::string& uri) {
    if (uri.rfind(kScheme, 0) != 0) {
        throw std::invalid_argument("manifest URI must start with vnm://");
    }
    const auto payload = wire::base64_decode(std::string_view(uri).substr(kScheme.size()));
    wire::Reader reader(payload, "manifest");

    if (reader.u8() != kManifestVersion) {
        throw std::invalid_argument("unsupported manifest version");
    }

    ChunkManifest manifest{};
    manifest.owner = reader.fixed<32>();
    manifest.epoch = reader.u64();
    manifest.chunk_size = reader.u32();
    manifest.total_size = reader.u64();

    const auto entry_count = reader.u32();
    // Smallest possible entry: index, hash, size and two empty list counts.
    if (entry_count > reader.remaining() / (4 + 32 + 4 + 2 + 2)) {
        throw std::invalid_argument("manifest entry count exceeds payload");
    }
    manifest.entries.reserve(entry_count);
    for (std::uint32_t i = 0; i < entry_count; ++i) {
        ManifestEntry entry{};
        entry.index = reader.u32();
        entry.content_hash = reader.fixed<32>();
        entry.size = reader.u32();

        const auto holder_count = reader.u16();
        entry.holders.reserve(holder_count);
        for (std::uint16_t h = 0; h < holder_count; ++h) {
            entry.holders.push_back(reader.fixed<32>());
        }

        const auto probe_count = reader.u16();
        entry.probes.reserve(probe_count);
        for (std::uint16_t p = 0; p < probe_count; ++p) {
            security::PossessionProbe probe{};
            probe.nonce = reader.fixed<32>();
            probe.offset = reader.u32();
            probe.length = reader.u32();
            probe.expected = reader.fixed<32>();
            entry.probes.push_back(probe);
        }
        manifest.entries.push_back(std::move(entry));
    }
    reader.expect_done();
    return manifest;
}

}  // namespace vouchnet::persistence
