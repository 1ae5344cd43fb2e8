#include "key_cipher.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <memory>

namespace securewallet {

namespace {

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

[[noreturn]] void sealing_failure(const std::string& what) {
    throw WalletError(WalletError::ErrorType::KeyStoreError, what);
}

std::vector<uint8_t> random_bytes(size_t size) {
    std::vector<uint8_t> out(size);
    if (RAND_bytes(out.data(), static_cast<int>(out.size())) != 1) {
        sealing_failure("System RNG failure");
    }
    return out;
}

// PBKDF2-HMAC-SHA256 stretching of the passphrase into an AES-256 key
SecureMemory derive_key(const std::string& passphrase, const std::vector<uint8_t>& salt, int iterations) {
    if (passphrase.empty()) {
        sealing_failure("Passphrase must not be empty");
    }
    if (iterations <= 0) {
        sealing_failure("Invalid key derivation iteration count");
    }
    SecureMemory key(AES_KEY_SIZE);
    if (PKCS5_PBKDF2_HMAC(passphrase.data(), static_cast<int>(passphrase.size()),
                          salt.data(), static_cast<int>(salt.size()),
                          iterations, EVP_sha256(),
                          static_cast<int>(key.size()), key.mutable_data()) != 1) {
        sealing_failure("Key derivation failed");
    }
    return key;
}

CipherCtxPtr new_context() {
    CipherCtxPtr ctx(EVP_CIPHER_CTX_new(), EVP_CIPHER_CTX_free);
    if (!ctx) {
        sealing_failure("Cipher context allocation failed");
    }
    return ctx;
}

} // anonymous namespace

void to_json(nlohmann::json& j, const SealedKey& sealed) {
    j = nlohmann::json{
        {"salt", HexUtils::encode(sealed.salt)},
        {"nonce", HexUtils::encode(sealed.nonce)},
        {"ciphertext", HexUtils::encode(sealed.ciphertext)},
        {"tag", HexUtils::encode(sealed.tag)},
        {"iterations", sealed.iterations}
    };
}

void from_json(const nlohmann::json& j, SealedKey& sealed) {
    sealed.salt = HexUtils::decode(j.at("salt").get<std::string>());
    sealed.nonce = HexUtils::decode(j.at("nonce").get<std::string>());
    sealed.ciphertext = HexUtils::decode(j.at("ciphertext").get<std::string>());
    sealed.tag = HexUtils::decode(j.at("tag").get<std::string>());
    sealed.iterations = j.at("iterations").get<int>();
}

SealedKey KeyCipher::seal(std::span<const uint8_t> plaintext,
                          const std::string& passphrase,
                          const std::string& associated_data) {
    SealedKey sealed;
    sealed.salt = random_bytes(KDF_SALT_SIZE);
    sealed.nonce = random_bytes(AES_GCM_NONCE_SIZE);
    sealed.iterations = KDF_ITERATIONS;

    SecureMemory key = derive_key(passphrase, sealed.salt, sealed.iterations);
    auto ctx = new_context();

    int len = 0;
    sealed.ciphertext.resize(plaintext.size());

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(sealed.nonce.size()), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), sealed.nonce.data()) != 1) {
        sealing_failure("Cipher initialization failed");
    }

    if (!associated_data.empty() &&
        EVP_EncryptUpdate(ctx.get(), nullptr, &len,
                          reinterpret_cast<const uint8_t*>(associated_data.data()),
                          static_cast<int>(associated_data.size())) != 1) {
        sealing_failure("Cipher AAD update failed");
    }

    if (EVP_EncryptUpdate(ctx.get(), sealed.ciphertext.data(), &len,
                          plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
        sealing_failure("Encryption failed");
    }
    int total = len;

    if (EVP_EncryptFinal_ex(ctx.get(), sealed.ciphertext.data() + total, &len) != 1) {
        sealing_failure("Encryption finalization failed");
    }
    total += len;
    sealed.ciphertext.resize(total);

    sealed.tag.resize(AES_GCM_TAG_SIZE);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(sealed.tag.size()), sealed.tag.data()) != 1) {
        sealing_failure("Could not read authentication tag");
    }

    return sealed;
}

SecureMemory KeyCipher::unseal(const SealedKey& sealed,
                               const std::string& passphrase,
                               const std::string& associated_data) {
    if (sealed.nonce.size() != AES_GCM_NONCE_SIZE || sealed.tag.size() != AES_GCM_TAG_SIZE ||
        sealed.ciphertext.empty()) {
        sealing_failure("Sealed key is malformed");
    }

    SecureMemory key = derive_key(passphrase, sealed.salt, sealed.iterations);
    auto ctx = new_context();

    SecureMemory plaintext(sealed.ciphertext.size());
    int len = 0;

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(sealed.nonce.size()), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), sealed.nonce.data()) != 1) {
        sealing_failure("Cipher initialization failed");
    }

    if (!associated_data.empty() &&
        EVP_DecryptUpdate(ctx.get(), nullptr, &len,
                          reinterpret_cast<const uint8_t*>(associated_data.data()),
                          static_cast<int>(associated_data.size())) != 1) {
        sealing_failure("Cipher AAD update failed");
    }

    if (EVP_DecryptUpdate(ctx.get(), plaintext.mutable_data(), &len,
                          sealed.ciphertext.data(), static_cast<int>(sealed.ciphertext.size())) != 1) {
        sealing_failure("Decryption failed");
    }
    int total = len;

    // The tag has to be set before the final call, which performs the check
    std::vector<uint8_t> tag = sealed.tag;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(tag.size()), tag.data()) != 1) {
        sealing_failure("Could not set authentication tag");
    }

    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.mutable_data() + total, &len) != 1) {
        sealing_failure("Wrong passphrase or corrupted key data");
    }

    return plaintext;
}

} // namespace securewallet
