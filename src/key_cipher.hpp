#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "secure_memory.hpp"

namespace securewallet {

// A private key sealed with AES-256-GCM under a passphrase-derived key
struct SealedKey {
    std::vector<uint8_t> salt;        // PBKDF2 salt
    std::vector<uint8_t> nonce;       // GCM IV
    std::vector<uint8_t> ciphertext;
    std::vector<uint8_t> tag;         // GCM authentication tag
    int iterations = 0;
};

// Stored as hex strings
void to_json(nlohmann::json& j, const SealedKey& sealed);
void from_json(const nlohmann::json& j, SealedKey& sealed);

class KeyCipher {
public:
    // Encrypt with a fresh random salt and nonce. associated_data is
    // authenticated but not encrypted (the owning address)
    static SealedKey seal(std::span<const uint8_t> plaintext,
                          const std::string& passphrase,
                          const std::string& associated_data);

    // Throws WalletError(KeyStoreError) for a wrong passphrase, a different
    // associated_data or tampered fields
    static SecureMemory unseal(const SealedKey& sealed,
                               const std::string& passphrase,
                               const std::string& associated_data);

private:
    KeyCipher() = delete;
};

} // namespace securewallet
