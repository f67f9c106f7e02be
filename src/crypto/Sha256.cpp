#include "cortexnet/crypto/Sha256.hpp"

#include <algorithm>
#include <bit>
#include <cstring>

namespace cortexnet::crypto {

namespace {

constexpr std::array<std::uint32_t, 8> kInitialState = {
    0x6a09e667u, 0xbb67ae85u, 0x3c6ef372u, 0xa54ff53au, 0x510e527fu, 0x9b05688cu, 0x1f83d9abu, 0x5be0cd19u};

constexpr std::array<std::uint32_t, 64> kK = {
    0x428a2f98u, 0x71374491u, 0xb5c0fbcfu, 0xe9b5dba5u, 0x3956c25bu, 0x59f111f1u, 0x923f82a4u, 0xab1c5ed5u,
    0xd807aa98u, 0x12835b01u, 0x243185beu, 0x550c7dc3u, 0x72be5d74u, 0x80deb1feu, 0x9bdc06a7u, 0xc19bf174u,
    0xe49b69c1u, 0xefbe4786u, 0x0fc19dc6u, 0x240ca1ccu, 0x2de92c6fu, 0x4a7484aau, 0x5cb0a9dcu, 0x76f988dau,
    0x983e5152u, 0xa831c66du, 0xb00327c8u, 0xbf597fc7u, 0xc6e00bf3u, 0xd5a79147u, 0x06ca6351u, 0x14292967u,
    0x27b70a85u, 0x2e1b2138u, 0x4d2c6dfcu, 0x53380d13u, 0x650a7354u, 0x766a0abbu, 0x81c2c92eu, 0x92722c85u,
    0xa2bfe8a1u, 0xa81a664bu, 0xc24b8b70u, 0xc76c51a3u, 0xd192e819u, 0xd6990624u, 0xf40e3585u, 0x106aa070u,
    0x19a4c116u, 0x1e376c08u, 0x2748774cu, 0x34b0bcb5u, 0x391c0cb3u, 0x4ed8aa4au, 0x5b9cca4fu, 0x682e6ff3u,
    0x748f82eeu, 0x78a5636fu, 0x84c87814u, 0x8cc70208u, 0x90befffau, 0xa4506cebu, 0xbef9a3f7u, 0xc67178f2u};

std::uint32_t load_be(const std::uint8_t* p) {
    return (static_cast<std::uint32_t>(p[0]) << 24) | (static_cast<std::uint32_t>(p[1]) << 16) |
           (static_cast<std::uint32_t>(p[2]) << 8) | static_cast<std::uint32_t>(p[3]);
}

}  // namespace

Sha256::Sha256()
    : h_(kInitialState) {}

void Sha256::update(std::span<const std::uint8_t> data) {
    total_bytes_ += data.size();
    std::size_t offset = 0;

    if (pending_len_ > 0) {
        const auto take = std::min(pending_.size() - pending_len_, data.size());
        std::memcpy(pending_.data() + pending_len_, data.data(), take);
        pending_len_ += take;
        offset = take;
        if (pending_len_ < pending_.size()) {
            return;
        }
        compress(pending_.data());
        pending_len_ = 0;
    }

    while (data.size() - offset >= pending_.size()) {
        compress(data.data() + offset);
        offset += pending_.size();
    }

    const auto tail = data.size() - offset;
    if (tail > 0) {
        std::memcpy(pending_.data(), data.data() + offset, tail);
        pending_len_ = tail;
    }
}

void Sha256::update(std::string_view text) {
    update(std::span<const std::uint8_t>(reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

Sha256::Digest Sha256::finalize() {
    const std::uint64_t bit_length = total_bytes_ * 8;

    std::array<std::uint8_t, 72> trailer{};
    trailer[0] = 0x80u;
    // Pad so that the length field ends exactly on a block boundary.
    const std::size_t pad = (pending_len_ < 56) ? (56 - pending_len_) : (120 - pending_len_);
    for (std::size_t i = 0; i < 8; ++i) {
        trailer[pad + i] = static_cast<std::uint8_t>(bit_length >> (56 - 8 * i));
    }
    const auto saved_total = total_bytes_;
    update(std::span<const std::uint8_t>(trailer.data(), pad + 8));
    total_bytes_ = saved_total;

    Digest out{};
    for (std::size_t word = 0; word < h_.size(); ++word) {
        for (std::size_t byte = 0; byte < 4; ++byte) {
            out[word * 4 + byte] = static_cast<std::uint8_t>(h_[word] >> (24 - 8 * byte));
        }
    }

    h_ = kInitialState;
    pending_len_ = 0;
    total_bytes_ = 0;
    return out;
}

Sha256::Digest Sha256::digest(std::span<const std::uint8_t> data) {
    Sha256 hasher;
    hasher.update(data);
    return hasher.finalize();
}

Sha256::Digest Sha256::digest(std::string_view text) {
    Sha256 hasher;
    hasher.update(text);
    return hasher.finalize();
}

void Sha256::compress(const std::uint8_t* block) {
    std::array<std::uint32_t, 64> w{};
    for (std::size_t t = 0; t < 16; ++t) {
        w[t] = load_be(block + t * 4);
    }
    for (std::size_t t = 16; t < 64; ++t) {
        const auto s0 = std::rotr(w[t - 15], 7) ^ std::rotr(w[t - 15], 18) ^ (w[t - 15] >> 3);
        const auto s1 = std::rotr(w[t - 2], 17) ^ std::rotr(w[t - 2], 19) ^ (w[t - 2] >> 10);
        w[t] = w[t - 16] + s0 + w[t - 7] + s1;
    }

    auto v = h_;
    for (std::size_t t = 0; t < 64; ++t) {
        const auto [a, b, c, d, e, f, g, h] = v;
        const auto sigma1 = std::rotr(e, 6) ^ std::rotr(e, 11) ^ std::rotr(e, 25);
        const auto choose = (e & f) ^ (~e & g);
        const auto temp1 = h + sigma1 + choose + kK[t] + w[t];
        const auto sigma0 = std::rotr(a, 2) ^ std::rotr(a, 13) ^ std::rotr(a, 22);
        const auto majority = (a & b) ^ (a & c) ^ (b & c);
        const auto temp2 = sigma0 + majority;

        v = {temp1 + temp2, a, b, c, d + temp1, e, f, g};
    }

    for (std::size_t i = 0; i < h_.size(); ++i) {
        h_[i] += v[i];
    }
}

}  // namespace cortexnet::crypto
