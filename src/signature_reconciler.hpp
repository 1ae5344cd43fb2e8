#pragma once

// =============================================================================
// signature_reconciler.hpp: completing a signature produced from a bare hash
// =============================================================================
//
// A secure element signs a 32-byte digest and returns (r, s) together with its
// public key. The recovery identifier it reports can't be relied on, so it is
// recomputed:
//
//   1. expected = address(signer public key); a high S is replaced by n - s
//   2. For v in {27, 28}: recover a public key from (hash, r, s, v) and keep
//      the first v whose address equals expected
//   3. Assemble and serialize the signed transaction
//   4. Decode the serialized bytes, recover the sender and require it to
//      equal expected
//
// Any failure is SignatureVerificationFailed and is never retried.
// =============================================================================

#include <cstdint>
#include <optional>
#include "address.hpp"
#include "hash_utils.hpp"
#include "secp256k1.hpp"
#include "transaction.hpp"

namespace securewallet {

class SignatureReconciler {
public:
    // The recovery identifier (27 or 28) under which (r, s) recovers to
    // expected, or nullopt if neither does
    static std::optional<uint8_t> find_recovery_id(const Hash256& hash,
                                                   const Scalar& r,
                                                   const Scalar& s,
                                                   const Address& expected);

    // Address recovered from (hash, r, s, v), nullopt if no point recovers
    static std::optional<Address> recover_address(const Hash256& hash,
                                                  const Scalar& r,
                                                  const Scalar& s,
                                                  uint8_t v);

    // Steps 1-4 above. Throws WalletError(SignatureVerificationFailed)
    static SignedTransaction reconcile(const UnsignedTransaction& tx, const SignaturePayload& payload);

private:
    SignatureReconciler() = delete;
};

} // namespace securewallet
