#include "transaction.hpp"
#include "error.hpp"
#include "rlp.hpp"
#include <algorithm>

namespace securewallet {

namespace {

std::vector<std::vector<uint8_t>> common_fields(uint64_t nonce, const Uint256& gas_price, uint64_t gas_limit,
                                                const Address& to, const Uint256& value,
                                                const std::vector<uint8_t>& data) {
    return {
        Rlp::encode_uint(nonce),
        Rlp::encode_uint(gas_price),
        Rlp::encode_uint(gas_limit),
        Rlp::encode_bytes(to.bytes()),
        Rlp::encode_uint(value),
        Rlp::encode_bytes(data),
    };
}

Scalar scalar_from_item(const RlpItem& item, const char* name) {
    if (item.is_list || item.bytes.empty()) {
        throw WalletError(WalletError::ErrorType::InvalidInput,
            std::string("Transaction signature field '") + name + "' is missing");
    }
    return item.as_uint256().bytes();
}

} // anonymous namespace

std::vector<uint8_t> UnsignedTransaction::serialize_unsigned() const {
    auto fields = common_fields(nonce, gas_price, gas_limit, to, value, data);
    fields.push_back(Rlp::encode_uint(chain_id));
    fields.push_back(Rlp::encode_uint(uint64_t{0}));
    fields.push_back(Rlp::encode_uint(uint64_t{0}));
    return Rlp::encode_list(fields);
}

Hash256 UnsignedTransaction::signing_hash() const {
    return HashUtils::keccak256(serialize_unsigned());
}

Hash256 DecodedTransaction::signing_hash() const {
    auto fields = common_fields(nonce, gas_price, gas_limit, to, value, data);
    if (chain_id) {
        fields.push_back(Rlp::encode_uint(*chain_id));
        fields.push_back(Rlp::encode_uint(uint64_t{0}));
        fields.push_back(Rlp::encode_uint(uint64_t{0}));
    }
    return HashUtils::keccak256(Rlp::encode_list(fields));
}

Address DecodedTransaction::recover_sender() const {
    auto public_key = Secp256k1::recover_public_key(signing_hash(), r, s, recovery_bit);
    if (!public_key) {
        throw WalletError(WalletError::ErrorType::SignatureVerificationFailed,
            "Transaction signature does not recover to any public key");
    }
    return Address::from_public_key(*public_key);
}

SignedTransaction::SignedTransaction(UnsignedTransaction tx, SignaturePayload signature)
    : tx_(std::move(tx)), signature_(std::move(signature)) {
    if (signature_.v != RECOVERY_ID_LOW && signature_.v != RECOVERY_ID_HIGH) {
        throw WalletError(WalletError::ErrorType::InvalidInput,
            "Recovery identifier must be 27 or 28, got " + std::to_string(signature_.v));
    }
}

uint64_t SignedTransaction::v_value() const {
    return tx_.chain_id * 2 + EIP155_V_OFFSET + (signature_.v - RECOVERY_ID_LOW);
}

// Signed layout: the 6 common fields followed by V, r, s. r and s are written
// as integers, so a leading zero byte of either scalar is dropped.
std::vector<uint8_t> SignedTransaction::serialize() const {
    auto fields = common_fields(tx_.nonce, tx_.gas_price, tx_.gas_limit, tx_.to, tx_.value, tx_.data);
    fields.push_back(Rlp::encode_uint(v_value()));
    fields.push_back(Rlp::encode_uint(Uint256::from_bytes(signature_.r)));
    fields.push_back(Rlp::encode_uint(Uint256::from_bytes(signature_.s)));
    return Rlp::encode_list(fields);
}

Hash256 SignedTransaction::hash() const {
    return HashUtils::keccak256(serialize());
}

DecodedTransaction SignedTransaction::decode(std::span<const uint8_t> raw) {
    if (!raw.empty() && raw[0] < 0xc0) {
        throw WalletError(WalletError::ErrorType::InvalidInput,
            "Typed transaction envelopes are not supported (type " + std::to_string(raw[0]) + ")");
    }

    RlpItem root = Rlp::decode(raw);
    if (!root.is_list || root.items.size() != 9) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Expected a 9-item legacy transaction");
    }
    for (const auto& item : root.items) {
        if (item.is_list) {
            throw WalletError(WalletError::ErrorType::InvalidInput, "Nested list inside transaction");
        }
    }

    const auto& f = root.items;
    DecodedTransaction out;
    out.nonce = f[0].as_uint64();
    out.gas_price = f[1].as_uint256();
    out.gas_limit = f[2].as_uint64();

    if (f[3].bytes.size() != ADDRESS_SIZE) {
        throw WalletError(WalletError::ErrorType::InvalidInput,
            "Recipient must be a 20-byte address (contract creation is not supported)");
    }
    std::array<uint8_t, ADDRESS_SIZE> to{};
    std::copy(f[3].bytes.begin(), f[3].bytes.end(), to.begin());
    out.to = Address(to);

    out.value = f[4].as_uint256();
    out.data = f[5].bytes;

    uint64_t v = f[6].as_uint64();
    if (v == RECOVERY_ID_LOW || v == RECOVERY_ID_HIGH) {
        out.recovery_bit = static_cast<uint8_t>(v - RECOVERY_ID_LOW);
    } else if (v >= EIP155_V_OFFSET) {
        out.chain_id = (v - EIP155_V_OFFSET) / 2;
        out.recovery_bit = static_cast<uint8_t>((v - EIP155_V_OFFSET) % 2);
    } else {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Invalid signature V value " + std::to_string(v));
    }

    out.r = scalar_from_item(f[7], "r");
    out.s = scalar_from_item(f[8], "s");
    return out;
}

} // namespace securewallet
