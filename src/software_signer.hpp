#pragma once

#include <functional>
#include <memory>
#include <string>
#include "key_store.hpp"
#include "secure_memory.hpp"
#include "signer.hpp"

namespace securewallet {

// Supplies the passphrase that seals software keys. Called once per seal or unseal
using PassphraseProvider = std::function<std::string()>;

// Backend holding a secp256k1 key sealed in a KeyStore.
//
// Key store entries:
//   software_private_key: {"address": "0x...", "sealed": SealedKey}
//   software_address:     "0x..." (readable without the passphrase)
//
// The key is unsealed into locked memory for each signature and wiped
// right after.
class SoftwareSigner : public Signer {
public:
    SoftwareSigner(std::shared_ptr<KeyStore> store, PassphraseProvider passphrase);

    BackendKind kind() const override { return BackendKind::Software; }
    bool is_available() override { return true; }
    std::optional<Account> locate() override;
    Account create(bool require_biometric) override;
    SignOutcome sign(const UnsignedTransaction& tx) override;
    std::string sign_message(const std::string& message) override;
    void remove() override;

    // Replaces any stored key with the given 32-byte hex private key
    Account import_key(const std::string& private_key_hex);

private:
    Account store_key(const SecureMemory& private_key);
    SecureMemory unseal_key(Address& address);

    std::shared_ptr<KeyStore> store_;
    PassphraseProvider passphrase_;
};

} // namespace securewallet
