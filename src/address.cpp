#include "address.hpp"
#include "error.hpp"
#include "hash_utils.hpp"
#include "hex_utils.hpp"
#include <algorithm>
#include <cctype>

namespace securewallet {

Address Address::from_public_key(std::span<const uint8_t> public_key) {
    std::span<const uint8_t> raw = public_key;
    if (raw.size() == UNCOMPRESSED_PUBKEY_SIZE && raw[0] == UNCOMPRESSED_PUBKEY_MARKER) {
        raw = raw.subspan(1);
    }
    if (raw.size() != RAW_PUBKEY_SIZE) {
        throw WalletError(WalletError::ErrorType::InvalidInput,
            "Malformed public key: expected 64 or 65 bytes, got " + std::to_string(public_key.size()));
    }

    auto digest = HashUtils::keccak256(raw);

    std::array<uint8_t, ADDRESS_SIZE> bytes;
    std::copy(digest.end() - ADDRESS_SIZE, digest.end(), bytes.begin());
    return Address(bytes);
}

Address Address::parse(const std::string& text) {
    if (!HexUtils::has_prefix(text) || text.size() != 2 + 2 * ADDRESS_SIZE) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Invalid address: '" + text + "'");
    }

    std::string digits = text.substr(2);
    bool has_lower = false;
    bool has_upper = false;
    for (char c : digits) {
        if (HexUtils::nibble(c) < 0) {
            throw WalletError(WalletError::ErrorType::InvalidInput, "Invalid address: '" + text + "'");
        }
        has_lower |= (c >= 'a' && c <= 'f');
        has_upper |= (c >= 'A' && c <= 'F');
    }

    auto decoded = HexUtils::decode(digits);
    std::array<uint8_t, ADDRESS_SIZE> bytes;
    std::copy(decoded.begin(), decoded.end(), bytes.begin());
    Address address(bytes);

    if (has_lower && has_upper && address.to_checksum_string() != text) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Address checksum mismatch: '" + text + "'");
    }
    return address;
}

bool Address::is_valid(const std::string& text) {
    try {
        parse(text);
        return true;
    } catch (const WalletError&) {
        return false;
    }
}

std::string Address::to_checksum_string() const {
    std::string lower = HexUtils::encode(bytes_);
    auto digest = HashUtils::keccak256(lower);

    std::string result = "0x";
    result.reserve(2 + lower.size());
    for (size_t i = 0; i < lower.size(); ++i) {
        uint8_t hash_byte = digest[i / 2];
        uint8_t hash_nibble = (i % 2 == 0) ? (hash_byte >> 4) : (hash_byte & 0x0F);
        char c = lower[i];
        if (c >= 'a' && c <= 'f' && hash_nibble >= 8) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        result.push_back(c);
    }
    return result;
}

} // namespace securewallet
