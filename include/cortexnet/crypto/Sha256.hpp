#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace cortexnet::crypto {

// Incremental SHA-256 (FIPS 180-4). Used to map node ids and shard tags onto fixed-width integers.
class Sha256 {
public:
    static constexpr std::size_t kDigestSize = 32;
    using Digest = std::array<std::uint8_t, kDigestSize>;

    Sha256();

    void update(std::span<const std::uint8_t> data);
    void update(std::string_view text);
    Digest finalize();

    static Digest digest(std::span<const std::uint8_t> data);
    static Digest digest(std::string_view text);

private:
    void compress(const std::uint8_t* block);

    std::array<std::uint32_t, 8> h_{};
    std::array<std::uint8_t, 64> pending_{};
    std::size_t pending_len_{0};
    std::uint64_t total_bytes_{0};
};

}  // namespace cortexnet::crypto
