#pragma once

#include <array>
#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace vouchnet {

// Member identities are hashes of the real-world identifier, never the identifier itself.
using MemberId = std::array<std::uint8_t, 32>;
using PeerId = std::array<std::uint8_t, 32>;
using Digest = std::array<std::uint8_t, 32>;
using Bytes = std::vector<std::uint8_t>;
using Timestamp = std::chrono::system_clock::time_point;

std::string to_hex(std::span<const std::uint8_t> bytes);
std::string member_id_to_string(const MemberId& id);
std::string peer_id_to_string(const PeerId& id);
std::string short_id(std::span<const std::uint8_t> id);

std::optional<MemberId> member_id_from_string(const std::string& text);
std::optional<PeerId> peer_id_from_string(const std::string& text);

// Hashes an arbitrary label (display name, key file contents) into an identity.
MemberId derive_member_id(std::string_view label);

std::uint64_t to_unix_seconds(Timestamp value);
Timestamp from_unix_seconds(std::uint64_t seconds);

}  // namespace vouchnet
