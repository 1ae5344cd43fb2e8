// =============================================================================
// test_secp256k1.cpp: key derivation, low-S signing and public key recovery
// =============================================================================

#include <gtest/gtest.h>
#include <algorithm>
#include "fakes.hpp"
#include "hex_utils.hpp"
#include "secp256k1.hpp"
#include "uint256.hpp"

using namespace securewallet;
using namespace securewallet::testing;

namespace {

const std::string CURVE_ORDER = "fffffffffffffffffffffffffffffffebaaedce6af48a03bbfd25e8cd0364141";
const std::string HALF_ORDER = "7fffffffffffffffffffffffffffffff5d576e7357a4501ddfe92f46681b20a0";

} // anonymous namespace

TEST(Secp256k1, DerivesGeneratorFromKeyOne) {
    auto public_key = Secp256k1::derive_public_key(scalar_key(1));
    EXPECT_EQ(HexUtils::encode(public_key),
              "0479be667ef9dcbbac55a06295ce870b07029bfcdb2dce28d959f2815b16f81798"
              "483ada7726a3c4655da4fbfc0e1108a8fd17b448a68554199c47d08ffb10d4b8");
}

TEST(Secp256k1, PrivateKeyRange) {
    auto order = HexUtils::decode(CURVE_ORDER);
    auto below_order = order;
    below_order.back() -= 1;

    EXPECT_FALSE(Secp256k1::is_valid_private_key(scalar_key(0)));
    EXPECT_FALSE(Secp256k1::is_valid_private_key(order));
    EXPECT_TRUE(Secp256k1::is_valid_private_key(below_order));
    EXPECT_TRUE(Secp256k1::is_valid_private_key(scalar_key(1)));
    EXPECT_FALSE(Secp256k1::is_valid_private_key(std::vector<uint8_t>(31, 0x01)));
    EXPECT_THROW(Secp256k1::derive_public_key(order), WalletError);
}

TEST(Secp256k1, GeneratedKeysAreValidAndDistinct) {
    auto a = random_key();
    auto b = random_key();
    EXPECT_TRUE(Secp256k1::is_valid_private_key(a));
    EXPECT_NE(a, b);
}

TEST(Secp256k1, SignaturesAreLowS) {
    Uint256 half = Uint256::from_bytes(HexUtils::decode(HALF_ORDER));
    auto key = repeated_key(0x46);
    for (int i = 0; i < 20; ++i) {
        Hash256 digest = HashUtils::keccak256(std::string("message ") + std::to_string(i));
        RecoverableSignature sig = Secp256k1::sign(key, digest);
        EXPECT_LE(Uint256::from_bytes(sig.s), half);
        EXPECT_LE(sig.recovery_bit, 1);
    }
}

TEST(Secp256k1, NormalizeSFoldsTheUpperHalf) {
    Scalar half{};
    auto half_bytes = HexUtils::decode(HALF_ORDER);
    std::copy(half_bytes.begin(), half_bytes.end(), half.begin());
    Scalar above = half;
    above.back() += 1;

    EXPECT_TRUE(Secp256k1::is_low_s(half));
    EXPECT_FALSE(Secp256k1::is_low_s(above));
    EXPECT_EQ(Secp256k1::normalize_s(half), half);
    EXPECT_EQ(Secp256k1::normalize_s(above), half);

    Scalar order{};
    auto order_bytes = HexUtils::decode(CURVE_ORDER);
    std::copy(order_bytes.begin(), order_bytes.end(), order.begin());
    EXPECT_EQ(Secp256k1::normalize_s(order), order);
}

TEST(Secp256k1, RecoveryBitSelectsTheSigningKey) {
    auto key = random_key();
    auto public_key = Secp256k1::derive_public_key(key);
    Hash256 digest = HashUtils::keccak256(std::string("recover me"));

    RecoverableSignature sig = Secp256k1::sign(key, digest);
    auto recovered = Secp256k1::recover_public_key(digest, sig.r, sig.s, sig.recovery_bit);
    ASSERT_TRUE(recovered.has_value());
    EXPECT_EQ(*recovered, public_key);

    auto other = Secp256k1::recover_public_key(digest, sig.r, sig.s, sig.recovery_bit ^ 1);
    if (other) {
        EXPECT_NE(*other, public_key);
    }
}

TEST(Secp256k1, RecoveryRejectsInvalidInputs) {
    Hash256 digest = HashUtils::keccak256(std::string("x"));
    Scalar zero{};
    Scalar one{};
    one[31] = 1;
    EXPECT_FALSE(Secp256k1::recover_public_key(digest, zero, one, 0).has_value());
    EXPECT_FALSE(Secp256k1::recover_public_key(digest, one, zero, 0).has_value());
    EXPECT_FALSE(Secp256k1::recover_public_key(digest, one, one, 2).has_value());
}
