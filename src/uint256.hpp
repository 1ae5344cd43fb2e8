#pragma once

#include <array>
#include <compare>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace securewallet {

// Unsigned 256-bit quantity (wei amounts, gas prices, signature scalars)
// stored big-endian. Arithmetic goes through OpenSSL BIGNUM.
class Uint256 {
public:
    Uint256() = default;
    explicit Uint256(uint64_t value);

    // Big-endian bytes, at most 32 of them
    static Uint256 from_bytes(std::span<const uint8_t> bytes);

    // Plain non-negative decimal integer ("21000")
    static Uint256 from_decimal(const std::string& decimal);

    // JSON-RPC quantity ("0x5208"), the prefix is required
    static Uint256 from_hex_quantity(const std::string& hex);

    // Fixed-point decimal in whole units to minor units, e.g. ("0.5", 18) -> 5 * 10^17
    // Rejects signs, exponents, empty parts and more fractional digits than decimals
    static Uint256 parse_units(const std::string& amount, unsigned decimals);

    // Minor units back to a trimmed whole-unit decimal ("0.5", "1000", "0")
    std::string format_units(unsigned decimals) const;

    std::string to_decimal() const;
    std::string to_hex_quantity() const;

    // Big-endian bytes without leading zeros; empty for zero (RLP integer form)
    std::vector<uint8_t> to_minimal_bytes() const;

    const std::array<uint8_t, 32>& bytes() const { return bytes_; }
    bool is_zero() const;

    // Throws WalletError(InvalidInput) when the value does not fit
    uint64_t to_uint64() const;

    // Both throw WalletError(InvalidInput) on 256-bit overflow
    Uint256 operator+(const Uint256& other) const;
    Uint256 operator*(const Uint256& other) const;

    // Lexicographic order of big-endian bytes is numeric order
    auto operator<=>(const Uint256& other) const = default;
    bool operator==(const Uint256& other) const = default;

private:
    std::array<uint8_t, 32> bytes_{};
};

} // namespace securewallet
