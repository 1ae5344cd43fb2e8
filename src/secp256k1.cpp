#include "secp256k1.hpp"
#include "consts.hpp"
#include "error.hpp"
#include <openssl/bn.h>
#include <openssl/ec.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/obj_mac.h>
#include <openssl/rand.h>
#include <memory>

namespace securewallet {

namespace {

using BignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_free)>;
using SecretBignumPtr = std::unique_ptr<BIGNUM, decltype(&BN_clear_free)>;
using BnCtxPtr = std::unique_ptr<BN_CTX, decltype(&BN_CTX_free)>;
using GroupPtr = std::unique_ptr<EC_GROUP, decltype(&EC_GROUP_free)>;
using PointPtr = std::unique_ptr<EC_POINT, decltype(&EC_POINT_free)>;
using EcKeyPtr = std::unique_ptr<EC_KEY, decltype(&EC_KEY_free)>;
using SigPtr = std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)>;

[[noreturn]] void crypto_failure(const std::string& what) {
    throw WalletError(WalletError::ErrorType::SignatureVerificationFailed, "secp256k1: " + what);
}

GroupPtr new_group() {
    GroupPtr group(EC_GROUP_new_by_curve_name(NID_secp256k1), EC_GROUP_free);
    if (!group) {
        crypto_failure("curve unavailable");
    }
    return group;
}

BignumPtr bn_from(std::span<const uint8_t> bytes) {
    BignumPtr bn(BN_bin2bn(bytes.data(), static_cast<int>(bytes.size()), nullptr), BN_free);
    if (!bn) {
        crypto_failure("BIGNUM allocation failed");
    }
    return bn;
}

Scalar scalar_from(const BIGNUM* bn) {
    Scalar out{};
    if (BN_bn2binpad(bn, out.data(), static_cast<int>(out.size())) != 32) {
        crypto_failure("scalar wider than 32 bytes");
    }
    return out;
}

std::vector<uint8_t> encode_uncompressed(const EC_GROUP* group, const EC_POINT* point, BN_CTX* ctx) {
    std::vector<uint8_t> out(UNCOMPRESSED_PUBKEY_SIZE);
    size_t size = EC_POINT_point2oct(group, point, POINT_CONVERSION_UNCOMPRESSED,
                                     out.data(), out.size(), ctx);
    if (size != UNCOMPRESSED_PUBKEY_SIZE) {
        crypto_failure("public key serialization failed");
    }
    return out;
}

} // anonymous namespace

SecureMemory Secp256k1::generate_private_key() {
    SecureMemory key(PRIVATE_KEY_SIZE);
    // Rejection sampling: retry the (astronomically rare) draws outside [1, n-1]
    for (int attempt = 0; attempt < 16; ++attempt) {
        if (RAND_bytes(key.mutable_data(), static_cast<int>(key.size())) != 1) {
            throw WalletError(WalletError::ErrorType::KeyStoreError, "System RNG failure");
        }
        if (is_valid_private_key(key.view())) {
            return key;
        }
    }
    throw WalletError(WalletError::ErrorType::KeyStoreError, "Could not draw a valid private key");
}

bool Secp256k1::is_valid_private_key(std::span<const uint8_t> key) {
    if (key.size() != PRIVATE_KEY_SIZE) {
        return false;
    }
    auto group = new_group();
    SecretBignumPtr k(BN_bin2bn(key.data(), static_cast<int>(key.size()), nullptr), BN_clear_free);
    if (!k) {
        return false;
    }
    return !BN_is_zero(k.get()) && BN_cmp(k.get(), EC_GROUP_get0_order(group.get())) < 0;
}

// Derives a public key from a private key using elliptic curve multiplication
// public_key = private_key * G, where G is the generator point of the curve.
//
// Uncompressed public key format (65 bytes):
// - First byte: 0x04
// - 32 bytes: x-coordinate
// - 32 bytes: y-coordinate
//
// Addresses are derived from the 64 bytes following the marker.
std::vector<uint8_t> Secp256k1::derive_public_key(std::span<const uint8_t> private_key) {
    if (!is_valid_private_key(private_key)) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Invalid secp256k1 private key");
    }

    auto group = new_group();
    BnCtxPtr ctx(BN_CTX_new(), BN_CTX_free);
    SecretBignumPtr priv(BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()), nullptr),
                         BN_clear_free);
    PointPtr pub(EC_POINT_new(group.get()), EC_POINT_free);
    if (!ctx || !priv || !pub) {
        crypto_failure("allocation failed");
    }

    if (!EC_POINT_mul(group.get(), pub.get(), priv.get(), nullptr, nullptr, ctx.get())) {
        crypto_failure("scalar multiplication failed");
    }

    return encode_uncompressed(group.get(), pub.get(), ctx.get());
}

// Sign a 32-byte digest with ECDSA on secp256k1, then normalize S.
//
// For any valid signature (r, s), (r, n - s) is also valid. Nodes only accept
// the lower half (EIP-2), so an S above n/2 is replaced by n - S. Negating S
// also flips the parity of the recovered R point, so the recovery bit is
// determined after normalization by recovering both candidates and keeping the
// one that matches the signer's own public key.
RecoverableSignature Secp256k1::sign(std::span<const uint8_t> private_key, const Hash256& digest) {
    auto public_key = derive_public_key(private_key);

    EcKeyPtr eckey(EC_KEY_new_by_curve_name(NID_secp256k1), EC_KEY_free);
    if (!eckey) {
        crypto_failure("EC_KEY allocation failed");
    }

    SecretBignumPtr priv(BN_bin2bn(private_key.data(), static_cast<int>(private_key.size()), nullptr),
                         BN_clear_free);
    if (!priv || !EC_KEY_set_private_key(eckey.get(), priv.get())) {
        crypto_failure("could not load private key");
    }

    SigPtr sig(ECDSA_do_sign(digest.data(), static_cast<int>(digest.size()), eckey.get()), ECDSA_SIG_free);
    if (!sig) {
        crypto_failure("ECDSA signing failed");
    }

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    RecoverableSignature result;
    result.r = scalar_from(r);
    result.s = normalize_s(scalar_from(s));

    for (uint8_t bit = 0; bit <= 1; ++bit) {
        auto candidate = recover_public_key(digest, result.r, result.s, bit);
        if (candidate && *candidate == public_key) {
            result.recovery_bit = bit;
            return result;
        }
    }

    crypto_failure("signature does not recover to the signing key");
}

Scalar Secp256k1::normalize_s(const Scalar& s_bytes) {
    auto group = new_group();
    const BIGNUM* order = EC_GROUP_get0_order(group.get());
    auto s = bn_from(s_bytes);

    BignumPtr half_order(BN_new(), BN_free);
    if (!half_order || !BN_rshift1(half_order.get(), order)) {
        crypto_failure("BIGNUM shift failed");
    }
    // Out-of-range values are left for recovery to reject
    if (BN_cmp(s.get(), half_order.get()) <= 0 || BN_cmp(s.get(), order) >= 0) {
        return s_bytes;
    }

    BignumPtr low_s(BN_new(), BN_free);
    if (!low_s || !BN_sub(low_s.get(), order, s.get())) {
        crypto_failure("S normalization failed");
    }
    return scalar_from(low_s.get());
}

bool Secp256k1::is_low_s(const Scalar& s) {
    return normalize_s(s) == s;
}

// ECDSA public key recovery (SEC1 v2, section 4.1.6)
//
// Given a signature (r, s) over digest e, the signer's public key is
//   Q = r^-1 * (s * R - e * G)
// where R is the curve point whose x-coordinate is r and whose y parity is
// the recovery bit. Only x = r is considered (the x = r + n case cannot occur
// for secp256k1 outside negligible probability), so the bit is 0 or 1.
std::optional<std::vector<uint8_t>> Secp256k1::recover_public_key(
    const Hash256& digest, const Scalar& r_bytes, const Scalar& s_bytes, uint8_t recovery_bit) {

    if (recovery_bit > 1) {
        return std::nullopt;
    }

    auto group = new_group();
    BnCtxPtr ctx(BN_CTX_new(), BN_CTX_free);
    if (!ctx) {
        crypto_failure("BN_CTX allocation failed");
    }
    const BIGNUM* order = EC_GROUP_get0_order(group.get());

    auto r = bn_from(r_bytes);
    auto s = bn_from(s_bytes);
    if (BN_is_zero(r.get()) || BN_is_zero(s.get()) ||
        BN_cmp(r.get(), order) >= 0 || BN_cmp(s.get(), order) >= 0) {
        return std::nullopt;
    }

    // R = (r, y) with y parity chosen by the recovery bit
    PointPtr big_r(EC_POINT_new(group.get()), EC_POINT_free);
    if (!big_r) {
        crypto_failure("EC_POINT allocation failed");
    }
    if (!EC_POINT_set_compressed_coordinates(group.get(), big_r.get(), r.get(), recovery_bit, ctx.get())) {
        // r is not the x-coordinate of any curve point
        ERR_clear_error();
        return std::nullopt;
    }

    auto e = bn_from(digest);
    BignumPtr zero(BN_new(), BN_free);
    BignumPtr neg_e(BN_new(), BN_free);
    BignumPtr u1(BN_new(), BN_free);
    BignumPtr u2(BN_new(), BN_free);
    if (!zero || !neg_e || !u1 || !u2) {
        crypto_failure("BIGNUM allocation failed");
    }
    BN_zero(zero.get());

    BignumPtr r_inv(BN_mod_inverse(nullptr, r.get(), order, ctx.get()), BN_free);
    if (!r_inv) {
        ERR_clear_error();
        return std::nullopt;
    }

    // u1 = -e * r^-1 mod n, u2 = s * r^-1 mod n, Q = u1 * G + u2 * R
    if (!BN_mod_sub(neg_e.get(), zero.get(), e.get(), order, ctx.get()) ||
        !BN_mod_mul(u1.get(), neg_e.get(), r_inv.get(), order, ctx.get()) ||
        !BN_mod_mul(u2.get(), s.get(), r_inv.get(), order, ctx.get())) {
        crypto_failure("BIGNUM modular arithmetic failed");
    }

    PointPtr q(EC_POINT_new(group.get()), EC_POINT_free);
    if (!q || !EC_POINT_mul(group.get(), q.get(), u1.get(), big_r.get(), u2.get(), ctx.get())) {
        crypto_failure("point multiplication failed");
    }
    if (EC_POINT_is_at_infinity(group.get(), q.get())) {
        return std::nullopt;
    }

    return encode_uncompressed(group.get(), q.get(), ctx.get());
}

} // namespace securewallet
