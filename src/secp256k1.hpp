#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "hash_utils.hpp"
#include "secure_memory.hpp"

namespace securewallet {

using Scalar = std::array<uint8_t, 32>;

// ECDSA signature with the recovery bit that selects which of the two
// candidate public keys produced it (0 or 1, i.e. v - 27)
struct RecoverableSignature {
    Scalar r{};
    Scalar s{};
    uint8_t recovery_bit = 0;
};

// secp256k1 operations on top of OpenSSL's EC and BIGNUM APIs
class Secp256k1 {
public:
    // Fresh random private key in the range [1, n-1], held in locked memory
    static SecureMemory generate_private_key();

    // True when the 32 bytes are a usable scalar (0 < k < n)
    static bool is_valid_private_key(std::span<const uint8_t> key);

    // 65-byte uncompressed public key (0x04 || X || Y) for a private key
    static std::vector<uint8_t> derive_public_key(std::span<const uint8_t> private_key);

    // Low-S ECDSA signature over a 32-byte digest, recovery bit included
    static RecoverableSignature sign(std::span<const uint8_t> private_key, const Hash256& digest);

    // Lower-half S (EIP-2): n - s when s > n/2, otherwise s unchanged. Flipping
    // S flips the parity of the recovered point, so the recovery bit changes too
    static Scalar normalize_s(const Scalar& s);
    static bool is_low_s(const Scalar& s);

    // SEC1 4.1.6 public key recovery. Returns the 65-byte uncompressed key, or
    // nullopt when (r, s, recovery_bit) does not describe a valid point
    static std::optional<std::vector<uint8_t>> recover_public_key(
        const Hash256& digest, const Scalar& r, const Scalar& s, uint8_t recovery_bit);

private:
    Secp256k1() = delete;
};

} // namespace securewallet
