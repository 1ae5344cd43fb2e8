// =============================================================================
// test_signature_reconciler.cpp: recovery id search and sender equality
// =============================================================================

#include <gtest/gtest.h>
#include "fakes.hpp"
#include "signature_reconciler.hpp"
#include "transaction_builder.hpp"

using namespace securewallet;
using namespace securewallet::testing;

namespace {

UnsignedTransaction sample_transaction(uint64_t nonce) {
    return UnsignedTransaction{
        .to = Address::parse("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed"),
        .value = Uint256::parse_units("0.5", 18),
        .nonce = nonce,
        .gas_limit = 21000,
        .gas_price = Uint256(20'000'000'000ULL),
        .data = {},
        .chain_id = 11155111,
    };
}

SignaturePayload sign_with(const std::vector<uint8_t>& key, const Hash256& hash) {
    RecoverableSignature sig = Secp256k1::sign(key, hash);
    SignaturePayload payload;
    payload.r = sig.r;
    payload.s = sig.s;
    payload.v = static_cast<uint8_t>(RECOVERY_ID_LOW + sig.recovery_bit);
    payload.signer_public_key = Secp256k1::derive_public_key(key);
    return payload;
}

WalletError::ErrorType reconcile_error(const UnsignedTransaction& tx, const SignaturePayload& payload) {
    try {
        SignatureReconciler::reconcile(tx, payload);
    } catch (const WalletError& e) {
        return e.type();
    }
    ADD_FAILURE() << "reconcile did not throw";
    return WalletError::ErrorType::ConfigError;
}

} // anonymous namespace

TEST(SignatureReconciler, TripleEqualityWithRandomKeys) {
    for (uint64_t i = 0; i < 10; ++i) {
        auto key = random_key();
        auto tx = sample_transaction(i);
        auto payload = sign_with(key, tx.signing_hash());

        SignedTransaction signed_tx = SignatureReconciler::reconcile(tx, payload);

        Address expected = Address::from_public_key(payload.signer_public_key);
        DecodedTransaction decoded = SignedTransaction::decode(signed_tx.serialize());
        EXPECT_EQ(expected, address_of(key));
        EXPECT_EQ(decoded.recover_sender(), expected);
        EXPECT_EQ(SignatureReconciler::recover_address(tx.signing_hash(), payload.r, payload.s,
                                                       signed_tx.signature().v),
                  expected);
    }
}

TEST(SignatureReconciler, ExactlyOneRecoveryIdMatches) {
    for (int i = 0; i < 10; ++i) {
        auto key = random_key();
        Address expected = address_of(key);
        Hash256 hash = HashUtils::keccak256(std::string("tx ") + std::to_string(i));
        auto payload = sign_with(key, hash);

        auto low = SignatureReconciler::recover_address(hash, payload.r, payload.s, RECOVERY_ID_LOW);
        auto high = SignatureReconciler::recover_address(hash, payload.r, payload.s, RECOVERY_ID_HIGH);
        int matches = (low && *low == expected) + (high && *high == expected);
        EXPECT_EQ(matches, 1);

        auto v = SignatureReconciler::find_recovery_id(hash, payload.r, payload.s, expected);
        ASSERT_TRUE(v.has_value());
        EXPECT_EQ(*v, payload.v);
    }
}

TEST(SignatureReconciler, RepairsAWrongReportedV) {
    auto key = random_key();
    auto tx = sample_transaction(1);
    auto payload = sign_with(key, tx.signing_hash());
    uint8_t correct = payload.v;
    payload.v = correct == RECOVERY_ID_LOW ? RECOVERY_ID_HIGH : RECOVERY_ID_LOW;

    SignedTransaction signed_tx = SignatureReconciler::reconcile(tx, payload);
    EXPECT_EQ(signed_tx.signature().v, correct);
}

TEST(SignatureReconciler, RejectsDriftedKey) {
    // Signed with one key, reported with another
    auto signing_key = random_key();
    auto reported_key = random_key();
    auto tx = sample_transaction(2);
    auto payload = sign_with(signing_key, tx.signing_hash());
    payload.signer_public_key = Secp256k1::derive_public_key(reported_key);

    EXPECT_EQ(reconcile_error(tx, payload), WalletError::ErrorType::SignatureVerificationFailed);
    EXPECT_FALSE(SignatureReconciler::find_recovery_id(tx.signing_hash(), payload.r, payload.s,
                                                       address_of(reported_key)).has_value());
}

TEST(SignatureReconciler, RejectsSignatureOverAnotherTransaction) {
    auto key = random_key();
    auto payload = sign_with(key, sample_transaction(1).signing_hash());
    EXPECT_EQ(reconcile_error(sample_transaction(2), payload), WalletError::ErrorType::SignatureVerificationFailed);
}

TEST(SignatureReconciler, RejectsUnusablePublicKey) {
    auto key = random_key();
    auto tx = sample_transaction(3);
    auto payload = sign_with(key, tx.signing_hash());
    payload.signer_public_key.resize(33);
    EXPECT_EQ(reconcile_error(tx, payload), WalletError::ErrorType::SignatureVerificationFailed);
}

// Recipient with a valid checksum, amount 0.5, nonce 3, 20 gwei, Sepolia,
// and a signer that reports v = 28 for a signature whose correct id is 28
TEST(SignatureReconciler, EndToEndHybridSigning) {
    TransactionBuilder builder("1000");
    auto tx = builder.build("0x5aAeb6053F3E94C9b9A09f33669435E7Ef1BeAed", "0.5", 3,
                            Uint256(20'000'000'000ULL), 21000, 11155111);
    EXPECT_EQ(tx.value.to_decimal(), "500000000000000000");

    // Draw keys until the signature's correct recovery id is 28
    std::vector<uint8_t> key;
    SignaturePayload payload;
    do {
        key = random_key();
        payload = sign_with(key, tx.signing_hash());
    } while (payload.v != RECOVERY_ID_HIGH);

    SignedTransaction signed_tx = SignatureReconciler::reconcile(tx, payload);
    EXPECT_EQ(signed_tx.signature().v, RECOVERY_ID_HIGH);
    EXPECT_EQ(signed_tx.v_value(), 11155111u * 2 + 36);
    EXPECT_EQ(SignedTransaction::decode(signed_tx.serialize()).recover_sender(), address_of(key));
}

TEST(SignatureReconciler, HighSIsNormalizedBeforeSerialization) {
    auto key = repeated_key(0x46);
    UnsignedTransaction tx = sample_transaction(3);
    SignaturePayload low = sign_with(key, tx.signing_hash());

    SignaturePayload high = low;
    high.s = high_s_twin(low.s);
    ASSERT_FALSE(Secp256k1::is_low_s(high.s));

    for (uint8_t reported : {RECOVERY_ID_LOW, RECOVERY_ID_HIGH}) {
        high.v = reported;
        SignedTransaction signed_tx = SignatureReconciler::reconcile(tx, high);

        DecodedTransaction decoded = SignedTransaction::decode(signed_tx.serialize());
        EXPECT_TRUE(Secp256k1::is_low_s(decoded.s));
        EXPECT_EQ(decoded.s, low.s);
        EXPECT_EQ(decoded.recover_sender(), address_of(key));
        EXPECT_EQ(signed_tx.signature().v, low.v);
    }
}
