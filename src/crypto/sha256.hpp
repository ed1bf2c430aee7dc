#pragma once

// Incremental SHA-256 (FIPS 180-4).
// Internal header, not installed.

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace treedelta_cpp::crypto {

namespace detail {

inline constexpr std::array<std::uint32_t, 64> round_constants = {
    0x428a2f98, 0x71374491, 0xb5c0fbcf, 0xe9b5dba5, 0x3956c25b, 0x59f111f1, 0x923f82a4, 0xab1c5ed5,
    0xd807aa98, 0x12835b01, 0x243185be, 0x550c7dc3, 0x72be5d74, 0x80deb1fe, 0x9bdc06a7, 0xc19bf174,
    0xe49b69c1, 0xefbe4786, 0x0fc19dc6, 0x240ca1cc, 0x2de92c6f, 0x4a7484aa, 0x5cb0a9dc, 0x76f988da,
    0x983e5152, 0xa831c66d, 0xb00327c8, 0xbf597fc7, 0xc6e00bf3, 0xd5a79147, 0x06ca6351, 0x14292967,
    0x27b70a85, 0x2e1b2138, 0x4d2c6dfc, 0x53380d13, 0x650a7354, 0x766a0abb, 0x81c2c92e, 0x92722c85,
    0xa2bfe8a1, 0xa81a664b, 0xc24b8b70, 0xc76c51a3, 0xd192e819, 0xd6990624, 0xf40e3585, 0x106aa070,
    0x19a4c116, 0x1e376c08, 0x2748774c, 0x34b0bcb5, 0x391c0cb3, 0x4ed8aa4a, 0x5b9cca4f, 0x682e6ff3,
    0x748f82ee, 0x78a5636f, 0x84c87814, 0x8cc70208, 0x90befffa, 0xa4506ceb, 0xbef9a3f7, 0xc67178f2,
};

inline constexpr auto rotr(std::uint32_t x, unsigned n) -> std::uint32_t {
    return (x >> n) | (x << (32 - n));
}

}  // namespace detail

/// Streaming SHA-256: feed bytes with update(), read the digest once with
/// finish().
class Sha256 {
public:
    static constexpr std::size_t digest_size = 32;
    using Digest = std::array<std::byte, digest_size>;

    void update(std::span<const std::byte> data) {
        total_len_ += data.size();
        for (auto b : data) {
            block_[block_len_++] = b;
            if (block_len_ == block_.size()) {
                compress();
                block_len_ = 0;
            }
        }
    }

    void update(std::string_view text) {
        update(std::as_bytes(std::span{text.data(), text.size()}));
    }

    auto finish() -> Digest {
        const auto bit_len = total_len_ * 8;
        block_[block_len_++] = std::byte{0x80};
        if (block_len_ > 56) {
            while (block_len_ < 64) block_[block_len_++] = std::byte{0};
            compress();
            block_len_ = 0;
        }
        while (block_len_ < 56) block_[block_len_++] = std::byte{0};
        for (int i = 7; i >= 0; --i) {
            block_[block_len_++] = static_cast<std::byte>(bit_len >> (i * 8));
        }
        compress();

        auto out = Digest{};
        for (std::size_t i = 0; i < state_.size(); ++i) {
            out[i * 4 + 0] = static_cast<std::byte>(state_[i] >> 24);
            out[i * 4 + 1] = static_cast<std::byte>(state_[i] >> 16);
            out[i * 4 + 2] = static_cast<std::byte>(state_[i] >> 8);
            out[i * 4 + 3] = static_cast<std::byte>(state_[i]);
        }
        return out;
    }

private:
    void compress() {
        using detail::rotr;
        auto w = std::array<std::uint32_t, 64>{};
        for (std::size_t i = 0; i < 16; ++i) {
            w[i] = (static_cast<std::uint32_t>(block_[i * 4]) << 24) |
                   (static_cast<std::uint32_t>(block_[i * 4 + 1]) << 16) |
                   (static_cast<std::uint32_t>(block_[i * 4 + 2]) << 8) |
                   static_cast<std::uint32_t>(block_[i * 4 + 3]);
        }
        for (std::size_t i = 16; i < 64; ++i) {
            auto s0 = rotr(w[i - 15], 7) ^ rotr(w[i - 15], 18) ^ (w[i - 15] >> 3);
            auto s1 = rotr(w[i - 2], 17) ^ rotr(w[i - 2], 19) ^ (w[i - 2] >> 10);
            w[i] = w[i - 16] + s0 + w[i - 7] + s1;
        }

        auto [a, b, c, d, e, f, g, h] = state_;
        for (std::size_t i = 0; i < 64; ++i) {
            auto s1 = rotr(e, 6) ^ rotr(e, 11) ^ rotr(e, 25);
            auto ch = (e & f) ^ (~e & g);
            auto t1 = h + s1 + ch + detail::round_constants[i] + w[i];
            auto s0 = rotr(a, 2) ^ rotr(a, 13) ^ rotr(a, 22);
            auto maj = (a & b) ^ (a & c) ^ (b & c);
            auto t2 = s0 + maj;
            h = g;
            g = f;
            f = e;
            e = d + t1;
            d = c;
            c = b;
            b = a;
            a = t1 + t2;
        }
        state_[0] += a; state_[1] += b; state_[2] += c; state_[3] += d;
        state_[4] += e; state_[5] += f; state_[6] += g; state_[7] += h;
    }

    std::array<std::uint32_t, 8> state_{
        0x6a09e667, 0xbb67ae85, 0x3c6ef372, 0xa54ff53a,
        0x510e527f, 0x9b05688c, 0x1f83d9ab, 0x5be0cd19,
    };
    std::array<std::byte, 64> block_{};
    std::size_t block_len_{0};
    std::uint64_t total_len_{0};
};

/// One-shot convenience.
inline auto sha256(std::span<const std::byte> input) -> Sha256::Digest {
    auto hasher = Sha256{};
    hasher.update(input);
    return hasher.finish();
}

}  // namespace treedelta_cpp::crypto
