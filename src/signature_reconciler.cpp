#include "signature_reconciler.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "logger.hpp"

namespace securewallet {

namespace {

std::string describe(const std::optional<Address>& address) {
    return address ? address->to_checksum_string() : "<none>";
}

} // anonymous namespace

std::optional<Address> SignatureReconciler::recover_address(const Hash256& hash,
                                                            const Scalar& r,
                                                            const Scalar& s,
                                                            uint8_t v) {
    if (v != RECOVERY_ID_LOW && v != RECOVERY_ID_HIGH) {
        return std::nullopt;
    }
    auto public_key = Secp256k1::recover_public_key(hash, r, s, static_cast<uint8_t>(v - RECOVERY_ID_LOW));
    if (!public_key) {
        return std::nullopt;
    }
    return Address::from_public_key(*public_key);
}

std::optional<uint8_t> SignatureReconciler::find_recovery_id(const Hash256& hash,
                                                             const Scalar& r,
                                                             const Scalar& s,
                                                             const Address& expected) {
    for (uint8_t v : {RECOVERY_ID_LOW, RECOVERY_ID_HIGH}) {
        auto candidate = recover_address(hash, r, s, v);
        LOG_DEBUG << "Recovery id " << static_cast<int>(v) << " -> " << describe(candidate);
        if (candidate && *candidate == expected) {
            return v;
        }
    }
    return std::nullopt;
}

SignedTransaction SignatureReconciler::reconcile(const UnsignedTransaction& tx, const SignaturePayload& payload) {
    Hash256 hash = tx.signing_hash();

    Address expected;
    try {
        expected = Address::from_public_key(payload.signer_public_key);
    } catch (const WalletError& e) {
        throw WalletError(WalletError::ErrorType::SignatureVerificationFailed,
            std::string("Signer returned an unusable public key: ") + e.what());
    }

    // Secure elements don't normalize S; nodes only accept the lower half
    SignaturePayload authoritative = payload;
    authoritative.s = Secp256k1::normalize_s(payload.s);
    if (authoritative.s != payload.s) {
        LOG_DEBUG << "Signer returned a high S, using n - s";
    }

    auto v = find_recovery_id(hash, authoritative.r, authoritative.s, expected);
    if (!v) {
        LOG_ERROR << "Recovery id search failed"
                  << " hash=" << HexUtils::encode_prefixed(hash)
                  << " r=" << HexUtils::encode_prefixed(payload.r)
                  << " s=" << HexUtils::encode_prefixed(payload.s)
                  << " reported_v=" << static_cast<int>(payload.v)
                  << " expected=" << expected.to_checksum_string()
                  << " candidate27=" << describe(recover_address(hash, authoritative.r, authoritative.s, RECOVERY_ID_LOW))
                  << " candidate28=" << describe(recover_address(hash, authoritative.r, authoritative.s, RECOVERY_ID_HIGH));
        throw WalletError(WalletError::ErrorType::SignatureVerificationFailed,
            "No recovery id maps the signature to " + expected.to_checksum_string());
    }
    if (*v != payload.v) {
        LOG_INFO << "Signer reported v=" << static_cast<int>(payload.v)
                 << ", recovered v=" << static_cast<int>(*v);
    }

    authoritative.v = *v;
    SignedTransaction signed_tx(tx, authoritative);

    // Check what will actually go on the wire, not the in-memory parts
    auto raw = signed_tx.serialize();
    DecodedTransaction decoded = SignedTransaction::decode(raw);
    Address sender = decoded.recover_sender();

    if (sender != expected || decoded.chain_id != tx.chain_id) {
        LOG_ERROR << "Serialized transaction sender mismatch"
                  << " hash=" << HexUtils::encode_prefixed(hash)
                  << " expected=" << expected.to_checksum_string()
                  << " decoded=" << sender.to_checksum_string();
        throw WalletError(WalletError::ErrorType::SignatureVerificationFailed,
            "Serialized transaction recovers to " + sender.to_checksum_string() +
            ", expected " + expected.to_checksum_string());
    }

    LOG_DEBUG << "Signature reconciled for " << expected.to_checksum_string() << " with v=" << static_cast<int>(*v);
    return signed_tx;
}

} // namespace securewallet
