#include "hash_utils.hpp"
#include <cstring>

namespace securewallet {

namespace {

constexpr uint64_t keccak_round_constants[24] = {
    0x0000000000000001ULL, 0x0000000000008082ULL, 0x800000000000808aULL,
    0x8000000080008000ULL, 0x000000000000808bULL, 0x0000000080000001ULL,
    0x8000000080008081ULL, 0x8000000000008009ULL, 0x000000000000008aULL,
    0x0000000000000088ULL, 0x0000000080008009ULL, 0x000000008000000aULL,
    0x000000008000808bULL, 0x800000000000008bULL, 0x8000000000008089ULL,
    0x8000000000008003ULL, 0x8000000000008002ULL, 0x8000000000000080ULL,
    0x000000000000800aULL, 0x800000008000000aULL, 0x8000000080008081ULL,
    0x8000000000008080ULL, 0x0000000080000001ULL, 0x8000000080008008ULL
};

constexpr int pi_lanes[24] = {
    10, 7, 11, 17, 18, 3, 5, 16, 8, 21, 24, 4,
    15, 23, 19, 13, 12, 2, 20, 14, 22, 9, 6, 1
};

constexpr int rho_offsets[24] = {
    1, 3, 6, 10, 15, 21, 28, 36, 45, 55, 2, 14,
    27, 41, 56, 8, 25, 43, 62, 18, 39, 61, 20, 44
};

// Keccak-256 rate: 1600-bit state minus 2 * 256-bit capacity
constexpr size_t KECCAK256_RATE = 136;

inline uint64_t rotl64(uint64_t x, int n) {
    return (x << n) | (x >> (64 - n));
}

// The Keccak-f[1600] permutation, 24 rounds of theta, rho, pi, chi and iota
void keccak_f1600(std::array<uint64_t, 25>& state) {
    for (int round = 0; round < 24; ++round) {
        // Theta
        uint64_t c[5];
        uint64_t d[5];
        for (int x = 0; x < 5; ++x) {
            c[x] = state[x] ^ state[x + 5] ^ state[x + 10] ^ state[x + 15] ^ state[x + 20];
        }
        for (int x = 0; x < 5; ++x) {
            d[x] = c[(x + 4) % 5] ^ rotl64(c[(x + 1) % 5], 1);
            for (int y = 0; y < 25; y += 5) {
                state[x + y] ^= d[x];
            }
        }

        // Rho + Pi
        uint64_t current = state[1];
        for (int i = 0; i < 24; ++i) {
            int lane = pi_lanes[i];
            uint64_t next = state[lane];
            state[lane] = rotl64(current, rho_offsets[i]);
            current = next;
        }

        // Chi
        for (int y = 0; y < 25; y += 5) {
            uint64_t row[5];
            for (int x = 0; x < 5; ++x) {
                row[x] = state[y + x];
            }
            for (int x = 0; x < 5; ++x) {
                state[y + x] = row[x] ^ ((~row[(x + 1) % 5]) & row[(x + 2) % 5]);
            }
        }

        // Iota
        state[0] ^= keccak_round_constants[round];
    }
}

// XOR one rate-sized block into the state, lanes are little-endian
void absorb_block(std::array<uint64_t, 25>& state, const uint8_t* block) {
    for (size_t i = 0; i < KECCAK256_RATE / 8; ++i) {
        uint64_t lane = 0;
        for (int j = 0; j < 8; ++j) {
            lane |= static_cast<uint64_t>(block[i * 8 + j]) << (8 * j);
        }
        state[i] ^= lane;
    }
}

} // anonymous namespace

// Computes the Keccak-256 hash used throughout the chain for addresses,
// transaction hashes and message digests.
//
// The sponge:
// 1. Absorb every full 136-byte block of input, permuting after each one
// 2. Pad the tail with 0x01 ... 0x80 (original Keccak multi-rate padding)
// 3. Absorb the padded block and permute once more
// 4. Squeeze the first 32 bytes of the state
Hash256 HashUtils::keccak256(std::span<const uint8_t> data) {
    std::array<uint64_t, 25> state{};

    size_t offset = 0;
    size_t remaining = data.size();
    while (remaining >= KECCAK256_RATE) {
        absorb_block(state, data.data() + offset);
        keccak_f1600(state);
        offset += KECCAK256_RATE;
        remaining -= KECCAK256_RATE;
    }

    uint8_t tail[KECCAK256_RATE];
    std::memset(tail, 0, sizeof(tail));
    if (remaining > 0) {
        std::memcpy(tail, data.data() + offset, remaining);
    }
    tail[remaining] = 0x01;
    tail[KECCAK256_RATE - 1] |= 0x80;

    absorb_block(state, tail);
    keccak_f1600(state);

    Hash256 digest;
    for (size_t i = 0; i < digest.size(); ++i) {
        digest[i] = static_cast<uint8_t>(state[i / 8] >> (8 * (i % 8)));
    }
    return digest;
}

Hash256 HashUtils::keccak256(const std::string& text) {
    return keccak256(std::span<const uint8_t>(
        reinterpret_cast<const uint8_t*>(text.data()), text.size()));
}

// EIP-191 version 0x45 digest, the one wallets produce for personal_sign.
// The length is the decimal byte count of the message.
Hash256 HashUtils::personal_message_hash(const std::string& message) {
    std::string prefixed = "\x19""Ethereum Signed Message:\n" + std::to_string(message.size()) + message;
    return keccak256(prefixed);
}

} // namespace securewallet
