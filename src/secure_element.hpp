#pragma once

#include <cstdint>
#include <optional>
#include <vector>
#include "hash_utils.hpp"
#include "transaction.hpp"

namespace securewallet {

// A key-holding hardware module that only ever exposes public keys and
// signatures over 32-byte digests. Implementations report failures as
// WalletError(BackendUnavailable).
class SecureElement {
public:
    virtual ~SecureElement() = default;

    virtual bool is_available() = 0;

    // Uncompressed public key of the key currently held, if any
    virtual std::optional<std::vector<uint8_t>> locate_existing_key() = 0;

    // Creates a new key, replacing any existing one, and returns its public key
    virtual std::vector<uint8_t> generate_key(bool require_biometric) = 0;

    // Signs a digest. The returned v is advisory and may be wrong
    virtual SignaturePayload sign_hash(const Hash256& hash) = 0;

    virtual bool delete_key() = 0;
};

} // namespace securewallet
