#pragma once

// =============================================================================
// transaction.hpp: legacy (type 0) transactions with EIP-155 replay protection
// =============================================================================
//
// Unsigned (hashed) form, 9 items:
//   rlp([nonce, gasPrice, gasLimit, to, value, data, chainId, 0, 0])
//
// Signed form, 9 items:
//   rlp([nonce, gasPrice, gasLimit, to, value, data, V, r, s])
//   V = chainId * 2 + 35 + recovery_bit
//
// Before EIP-155 the hashed form had only the first 6 items and V was 27 or
// 28. The decoder accepts both; the encoder only produces EIP-155.
// =============================================================================

#include <cstdint>
#include <optional>
#include <span>
#include <vector>
#include "address.hpp"
#include "consts.hpp"
#include "hash_utils.hpp"
#include "secp256k1.hpp"
#include "uint256.hpp"

namespace securewallet {

struct UnsignedTransaction {
    Address to;
    Uint256 value;
    uint64_t nonce = 0;
    uint64_t gas_limit = 0;
    Uint256 gas_price;
    std::vector<uint8_t> data;
    uint64_t chain_id = 0;
    uint8_t tx_type = LEGACY_TX_TYPE;

    // The 9-item EIP-155 signing preimage
    std::vector<uint8_t> serialize_unsigned() const;

    // keccak256 of serialize_unsigned(), the digest every backend signs
    Hash256 signing_hash() const;
};

// What a signer hands back. v is the 27/28 recovery identifier, not EIP-155 V
struct SignaturePayload {
    Scalar r{};
    Scalar s{};
    uint8_t v = RECOVERY_ID_LOW;
    std::vector<uint8_t> signer_public_key;
};

// Result of parsing raw signed bytes off the wire
struct DecodedTransaction {
    uint64_t nonce = 0;
    Uint256 gas_price;
    uint64_t gas_limit = 0;
    Address to;
    Uint256 value;
    std::vector<uint8_t> data;
    std::optional<uint64_t> chain_id;   // absent for pre-EIP-155 signatures
    Scalar r{};
    Scalar s{};
    uint8_t recovery_bit = 0;

    Hash256 signing_hash() const;

    // Throws WalletError(SignatureVerificationFailed) when (r, s) recover nothing
    Address recover_sender() const;
};

class SignedTransaction {
public:
    // Throws WalletError(InvalidInput) if v is not 27 or 28
    SignedTransaction(UnsignedTransaction tx, SignaturePayload signature);

    const UnsignedTransaction& transaction() const { return tx_; }
    const SignaturePayload& signature() const { return signature_; }

    // EIP-155 V value
    uint64_t v_value() const;

    // Raw bytes accepted by eth_sendRawTransaction
    std::vector<uint8_t> serialize() const;

    // keccak256 of the raw bytes, the hash a node reports for this transaction
    Hash256 hash() const;

    // Throws WalletError(InvalidInput) for anything that is not a 9-item legacy
    // transaction with a canonical encoding
    static DecodedTransaction decode(std::span<const uint8_t> raw);

private:
    UnsignedTransaction tx_;
    SignaturePayload signature_;
};

} // namespace securewallet
