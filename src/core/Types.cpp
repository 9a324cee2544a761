#include "vouchnet/Types.hpp"

#include "vouchnet/crypto/Sha256.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace vouchnet {

namespace {

std::optional<std::array<std::uint8_t, 32>> parse_hex32(const std::string& text) {
    std::array<std::uint8_t, 32> out{};
    if (text.size() != out.size() * 2) {
        return std::nullopt;
    }

    const auto nibble = [](char ch) -> int {
        if (ch >= '0' && ch <= '9') {
            return ch - '0';
        }
        if (ch >= 'a' && ch <= 'f') {
            return 10 + (ch - 'a');
        }
        if (ch >= 'A' && ch <= 'F') {
            return 10 + (ch - 'A');
        }
        return -1;
    };

    for (std::size_t index = 0; index < out.size(); ++index) {
        const auto high = nibble(text[index * 2]);
        const auto low = nibble(text[index * 2 + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        out[index] = static_cast<std::uint8_t>((high << 4) | low);
    }
    return out;
}

}  // namespace

std::string to_hex(std::span<const std::uint8_t> bytes) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setfill('0');
    for (const auto byte : bytes) {
        oss << std::setw(2) << static_cast<int>(byte);
    }
    return oss.str();
}

std::string member_id_to_string(const MemberId& id) {
    return to_hex(id);
}

std::string peer_id_to_string(const PeerId& id) {
    return to_hex(id);
}

std::string short_id(std::span<const std::uint8_t> id) {
    return to_hex(id.first(std::min<std::size_t>(id.size(), 6)));
}

std::optional<MemberId> member_id_from_string(const std::string& text) {
    return parse_hex32(text);
}

std::optional<PeerId> peer_id_from_string(const std::string& text) {
    return parse_hex32(text);
}

MemberId derive_member_id(std::string_view label) {
    crypto::Sha256 hasher;
    hasher.update(std::string_view{"vouchnet-member-v1"});
    hasher.update(label);
    return hasher.finalize();
}

std::uint64_t to_unix_seconds(Timestamp value) {
    const auto seconds = std::chrono::duration_cast<std::chrono::seconds>(value.time_since_epoch()).count();
    return seconds < 0 ? 0 : static_cast<std::uint64_t>(seconds);
}

Timestamp from_unix_seconds(std::uint64_t seconds) {
    return Timestamp{std::chrono::seconds{static_cast<std::int64_t>(seconds)}};
}

}  // namespace vouchnet
