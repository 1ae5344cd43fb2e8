#include "uint256.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include <openssl/bn.h>
#include <openssl/crypto.h>
#include <algorithm>
#include <memory>

namespace securewallet {

namespace {

using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;

BignumPtr to_bignum(const std::array<uint8_t, 32>& bytes) {
    BignumPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr), BN_free);
    if (!bn) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "BIGNUM allocation failed");
    }
    return bn;
}

Uint256 from_bignum(const BIGNUM* bn) {
    if (BN_num_bytes(bn) > 32) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Value exceeds 256 bits");
    }
    std::array<uint8_t, 32> out{};
    if (BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) != 32) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "BIGNUM serialization failed");
    }
    return Uint256::from_bytes(out);
}

bool all_digits(const std::string& text) {
    return !text.empty() && std::all_of(text.begin(), text.end(),
        [](unsigned char c) { return c >= '0' && c <= '9'; });
}

} // anonymous namespace

Uint256::Uint256(uint64_t value) {
    for (size_t i = 0; i < 8; ++i) {
        bytes_[31 - i] = static_cast<uint8_t>(value >> (8 * i));
    }
}

Uint256 Uint256::from_bytes(std::span<const uint8_t> bytes) {
    if (bytes.size() > 32) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Value exceeds 256 bits");
    }
    Uint256 result;
    std::copy(bytes.begin(), bytes.end(), result.bytes_.end() - bytes.size());
    return result;
}

Uint256 Uint256::from_decimal(const std::string& decimal) {
    if (!all_digits(decimal)) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Invalid decimal integer: '" + decimal + "'");
    }

    BIGNUM* raw = nullptr;
    if (BN_dec2bn(&raw, decimal.c_str()) == 0 || raw == nullptr) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Invalid decimal integer: '" + decimal + "'");
    }
    BignumPtr bn(raw, BN_free);
    return from_bignum(bn.get());
}

Uint256 Uint256::from_hex_quantity(const std::string& hex) {
    if (!HexUtils::has_prefix(hex)) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Hex quantity needs a 0x prefix: '" + hex + "'");
    }
    std::string digits = HexUtils::strip_prefix(hex);
    if (digits.empty() || digits.size() > 64) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Invalid hex quantity: '" + hex + "'");
    }
    if (digits.size() % 2 != 0) {
        digits.insert(digits.begin(), '0');
    }
    auto bytes = HexUtils::decode(digits);
    return from_bytes(bytes);
}

// Decimal amounts are scaled by string manipulation: "12.34" with 18 decimals
// becomes "12" + "34" + sixteen zeros, which is then parsed as an integer.
// This keeps the conversion exact, unlike a floating point multiply.
Uint256 Uint256::parse_units(const std::string& amount, unsigned decimals) {
    auto dot = amount.find('.');
    std::string whole = amount.substr(0, dot);
    std::string fraction = dot == std::string::npos ? "" : amount.substr(dot + 1);

    if (!all_digits(whole)) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Invalid amount: '" + amount + "'");
    }
    if (dot != std::string::npos && !all_digits(fraction)) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Invalid amount: '" + amount + "'");
    }
    if (fraction.size() > decimals) {
        throw WalletError(WalletError::ErrorType::InvalidInput,
            "Amount has more than " + std::to_string(decimals) + " fractional digits: '" + amount + "'");
    }

    fraction.append(decimals - fraction.size(), '0');
    return from_decimal(whole + fraction);
}

std::string Uint256::format_units(unsigned decimals) const {
    std::string digits = to_decimal();
    if (digits.size() <= decimals) {
        digits.insert(digits.begin(), decimals - digits.size() + 1, '0');
    }

    std::string whole = digits.substr(0, digits.size() - decimals);
    std::string fraction = digits.substr(digits.size() - decimals);
    while (!fraction.empty() && fraction.back() == '0') {
        fraction.pop_back();
    }
    return fraction.empty() ? whole : whole + "." + fraction;
}

std::string Uint256::to_decimal() const {
    auto bn = to_bignum(bytes_);
    char* text = BN_bn2dec(bn.get());
    if (!text) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "BIGNUM conversion failed");
    }
    std::string result(text);
    OPENSSL_free(text);
    return result;
}

std::string Uint256::to_hex_quantity() const {
    std::string hex = HexUtils::encode(to_minimal_bytes());
    auto first = hex.find_first_not_of('0');
    if (first == std::string::npos) {
        return "0x0";
    }
    return "0x" + hex.substr(first);
}

std::vector<uint8_t> Uint256::to_minimal_bytes() const {
    auto first = std::find_if(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b != 0; });
    return std::vector<uint8_t>(first, bytes_.end());
}

bool Uint256::is_zero() const {
    return std::all_of(bytes_.begin(), bytes_.end(), [](uint8_t b) { return b == 0; });
}

uint64_t Uint256::to_uint64() const {
    auto minimal = to_minimal_bytes();
    if (minimal.size() > 8) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Value does not fit in 64 bits");
    }
    uint64_t value = 0;
    for (uint8_t b : minimal) {
        value = (value << 8) | b;
    }
    return value;
}

Uint256 Uint256::operator+(const Uint256& other) const {
    auto a = to_bignum(bytes_);
    auto b = to_bignum(other.bytes_);
    BignumPtr sum(BN_new(), BN_free);
    if (!sum || !BN_add(sum.get(), a.get(), b.get())) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "BIGNUM addition failed");
    }
    return from_bignum(sum.get());
}

Uint256 Uint256::operator*(const Uint256& other) const {
    auto a = to_bignum(bytes_);
    auto b = to_bignum(other.bytes_);
    BignumPtr product(BN_new(), BN_free);
    BnCtxPtr ctx(BN_CTX_new(), BN_CTX_free);
    if (!product || !ctx || !BN_mul(product.get(), a.get(), b.get(), ctx.get())) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "BIGNUM multiplication failed");
    }
    return from_bignum(product.get());
}

} // namespace securewallet
