#pragma once

// =============================================================================
// address.hpp: account addresses with EIP-55 checksum
// =============================================================================
//
// Address derivation:
//   1. Drop the 0x04 uncompressed-point marker from the public key, if present
//   2. Keccak-256 the remaining 64 bytes (X || Y)
//   3. Keep the low 20 bytes of the digest
//
// Text form is "0x" + 40 hex digits with the EIP-55 mixed-case checksum:
//   - Keccak-256 the lowercase hex string (without "0x")
//   - For each hex letter: uppercase it if the matching hash nibble is >= 8
// =============================================================================

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include "consts.hpp"

namespace securewallet {

class Address {
public:
    Address() = default;
    explicit Address(const std::array<uint8_t, ADDRESS_SIZE>& bytes) : bytes_(bytes) {}

    // Throws WalletError(InvalidInput) unless the key is 64 bytes, or 65 bytes starting with 0x04
    static Address from_public_key(std::span<const uint8_t> public_key);

    // Accepts "0x" + 40 hex digits. Single-case input carries no checksum and is
    // taken as is; mixed-case input must match its EIP-55 checksum.
    static Address parse(const std::string& text);
    static bool is_valid(const std::string& text);

    std::string to_checksum_string() const;
    const std::array<uint8_t, ADDRESS_SIZE>& bytes() const { return bytes_; }

    bool operator==(const Address& other) const = default;

private:
    std::array<uint8_t, ADDRESS_SIZE> bytes_{};
};

} // namespace securewallet
