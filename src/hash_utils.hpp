#pragma once

#include <array>
#include <vector>
#include <span>
#include <string>
#include <cstdint>
#include "consts.hpp"

namespace securewallet {

using Hash256 = std::array<uint8_t, HASH_SIZE>;

// HashUtils is a utility class for the hash functions used by the chain
class HashUtils {
public:
    // Computes the Keccak-256 hash of input data
    // This is the original Keccak submission (0x01 padding), not FIPS-202 SHA3-256
    static Hash256 keccak256(std::span<const uint8_t> data);

    // Keccak-256 of a text string's bytes
    static Hash256 keccak256(const std::string& text);

    // Computes the EIP-191 personal message digest:
    // keccak256("\x19Ethereum Signed Message:\n" + len(message) + message)
    static Hash256 personal_message_hash(const std::string& message);

private:
    // Private constructor to prevent instantiation
    HashUtils() = delete;
};

} // namespace securewallet
