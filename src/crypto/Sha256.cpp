#include "vouchnet/crypto/Sha256.hpp"

#include <algorithm>
#include <cstring>

namespace vouchnet::crypto {

namespace {

constexpr std::array<std::uint32_t, 8> kInitialState{
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au,
    0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u,
};

constexpr std::array<std::uint32_t, 64> kK{
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u,
};

inline std::uint32_t rotr(std::uint32_t x, unsigned n) noexcept {
    return (x >> n) | (x << (32u - n));
}

inline std::uint32_t load_be(const std::uint8_t* p) noexcept {
    return (std::uint32_t{p[0]} << 24) | (std::uint32_t{p[1]} << 16) | (std::uint32_t{p[2]} << 8) | std::uint32_t{p[3]};
}

template <std::size_t N>
std::array<std::uint8_t, N> big_endian(std::uint64_t value) {
    std::array<std::uint8_t, N> out{};
    for (std::size_t i = 0; i < N; ++i) {
        out[N - 1 - i] = static_cast<std::uint8_t>(value >> (8 * i));
    }
    return out;
}

}  // namespace

Sha256::Sha256()
    : h_(kInitialState) {}

Sha256& Sha256::update(std::span<const std::uint8_t> data) {
    if (data.empty()) {
        return *this;
    }
    total_bytes_ += data.size();
    auto cursor = data.data();
    auto remaining = data.size();

    if (pending_len_ > 0) {
        const auto take = std::min(remaining, kBlockSize - pending_len_);
        std::memcpy(pending_.data() + pending_len_, cursor, take);
        pending_len_ += take;
        cursor += take;
        remaining -= take;
        if (pending_len_ < kBlockSize) {
            return *this;
        }
        compress(pending_.data());
        pending_len_ = 0;
    }

    while (remaining >= kBlockSize) {
        compress(cursor);
        cursor += kBlockSize;
        remaining -= kBlockSize;
    }

    if (remaining > 0) {
        std::memcpy(pending_.data(), cursor, remaining);
        pending_len_ = remaining;
    }
    return *this;
}

Sha256& Sha256::update(std::string_view text) {
    return update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

Sha256& Sha256::update_u32(std::uint32_t value) {
    return update(big_endian<4>(value));
}

Sha256& Sha256::update_u64(std::uint64_t value) {
    return update(big_endian<8>(value));
}

Sha256& Sha256::update_framed(std::span<const std::uint8_t> data) {
    update_u32(static_cast<std::uint32_t>(data.size()));
    return update(data);
}

Sha256::Output Sha256::finalize() {
    const auto bit_length = total_bytes_ * 8;

    pending_[pending_len_++] = 0x80;
    if (pending_len_ > kBlockSize - 8) {
        std::fill(pending_.begin() + static_cast<std::ptrdiff_t>(pending_len_), pending_.end(), std::uint8_t{0});
        compress(pending_.data());
        pending_len_ = 0;
    }
    std::fill(pending_.begin() + static_cast<std::ptrdiff_t>(pending_len_), pending_.end() - 8, std::uint8_t{0});
    const auto length_bytes = big_endian<8>(bit_length);
    std::copy(length_bytes.begin(), length_bytes.end(), pending_.end() - 8);
    compress(pending_.data());

    Output out{};
    for (std::size_t word = 0; word < h_.size(); ++word) {
        const auto bytes = big_endian<4>(h_[word]);
        std::copy(bytes.begin(), bytes.end(), out.begin() + static_cast<std::ptrdiff_t>(word * 4));
    }

    h_ = kInitialState;
    pending_.fill(0);
    pending_len_ = 0;
    total_bytes_ = 0;
    return out;
}

Sha256::Output Sha256::digest(std::span<const std::uint8_t> data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

void Sha256::compress(const std::uint8_t* block) {
    std::array<std::uint32_t, 64> w{};
    for (std::size_t t = 0; t < 16; ++t) {
        w[t] = load_be(block + t * 4);
    }
    for (std::size_t t = 16; t < 64; ++t) {
        const auto s0 = rotr(w[t - 15], 7) ^ rotr(w[t - 15], 18) ^ (w[t - 15] >> 3);
        const auto s1 = rotr(w[t - 2], 17) ^ rotr(w[t - 2], 19) ^ (w[t - 2] >> 10);
        w[t] = w[t - 16] + s0 + w[t - 7] + s1;
    }

    auto v = h_;
    for (std::size_t t = 0; t < 64; ++t) {
        const auto& [a, b, c, d, e, f, g, h] = v;
        const auto sum1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
        const auto choose = (e & f) ^ (~e & g);
        const auto t1 = h + sum1 + choose + kK[t] + w[t];
        const auto sum0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
        const auto majority = (a & b) ^ (a & c) ^ (b & c);
        const auto t2 = sum0 + majority;
        v = {t1 + t2, a, b, c, d + t1, e, f, g};
    }

    for (std::size_t i = 0; i < h_.size(); ++i) {
        h_[i] += v[i];
    }
}

}  // namespace vouchnet::crypto
