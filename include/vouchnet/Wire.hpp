#pragma once

#include "vouchnet/Types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace vouchnet::wire {

// Big-endian framing shared by every record vouchnet puts on the wire or
// hands to a holder.
void append_u8(Bytes& buffer, std::uint8_t value);
void append_u16(Bytes& buffer, std::uint16_t value);
void append_u32(Bytes& buffer, std::uint32_t value);
void append_u64(Bytes& buffer, std::uint64_t value);
void append_bytes(Bytes& buffer, std::span<const std::uint8_t> data);
// u32 length prefix followed by the bytes.
void append_blob(Bytes& buffer, std::span<const std::uint8_t> data);

// Bounds-checked cursor; every read past the end throws std::invalid_argument.
class Reader {
public:
    Reader(std::span<const std::uint8_t> data, std::string_view what);

    std::uint8_t u8();
    std::uint16_t u16();
    std::uint32_t u32();
    std::uint64_t u64();
    Bytes bytes(std::size_t length);
    Bytes blob();

    template <std::size_t N>
    std::array<std::uint8_t, N> fixed() {
        require(N);
        std::array<std::uint8_t, N> out{};
        for (std::size_t i = 0; i < N; ++i) {
            out[i] = data_[offset_ + i];
        }
        offset_ += N;
        return out;
    }

    [[nodiscard]] std::size_t remaining() const noexcept { return data_.size() - offset_; }
    [[nodiscard]] bool done() const noexcept { return offset_ == data_.size(); }
    // Throws unless the whole buffer was consumed.
    void expect_done() const;

private:
    void require(std::size_t length) const;

    std::span<const std::uint8_t> data_;
    std::size_t offset_{0};
    std::string what_;
};

std::string base64_encode(std::span<const std::uint8_t> input);
Bytes base64_decode(std::string_view input);

}  // namespace vouchnet::wire
