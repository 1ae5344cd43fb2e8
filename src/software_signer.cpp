#include "software_signer.hpp"
#include "consts.hpp"
#include "error.hpp"
#include "hex_utils.hpp"
#include "key_cipher.hpp"
#include "logger.hpp"
#include "secp256k1.hpp"
#include <openssl/crypto.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace securewallet {

SoftwareSigner::SoftwareSigner(std::shared_ptr<KeyStore> store, PassphraseProvider passphrase)
    : store_(std::move(store)), passphrase_(std::move(passphrase)) {
    if (!store_) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "SoftwareSigner requires a key store");
    }
    if (!passphrase_) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "SoftwareSigner requires a passphrase provider");
    }
}

std::optional<Account> SoftwareSigner::locate() {
    auto address_text = store_->load(SOFTWARE_ADDRESS_ENTRY);
    if (!address_text) {
        return std::nullopt;
    }
    if (!store_->load(SOFTWARE_KEY_ENTRY)) {
        LOG_WARN << "Software address " << *address_text << " has no stored key; ignoring it";
        return std::nullopt;
    }

    Address address;
    try {
        address = Address::parse(*address_text);
    } catch (const WalletError& e) {
        throw WalletError(WalletError::ErrorType::KeyStoreError,
            std::string("Stored software address is corrupt: ") + e.what());
    }
    return Account{.address = address, .kind = BackendKind::Software, .cached_balance = std::nullopt};
}

Account SoftwareSigner::create(bool require_biometric) {
    if (require_biometric) {
        LOG_DEBUG << "Biometric gating is enforced by the app lock for software keys";
    }
    SecureMemory key = Secp256k1::generate_private_key();
    Account account = store_key(key);
    LOG_INFO << "Created software wallet " << account.address.to_checksum_string();
    return account;
}

Account SoftwareSigner::import_key(const std::string& private_key_hex) {
    auto decoded = HexUtils::decode(private_key_hex);
    SecureMemory key(decoded.data(), decoded.size());
    OPENSSL_cleanse(decoded.data(), decoded.size());

    if (!Secp256k1::is_valid_private_key(key.view())) {
        throw WalletError(WalletError::ErrorType::InvalidInput, "Not a valid secp256k1 private key");
    }
    Account account = store_key(key);
    LOG_INFO << "Imported software wallet " << account.address.to_checksum_string();
    return account;
}

// The address is bound into the ciphertext as associated data, so a sealed
// key can't be paired with a different address entry
Account SoftwareSigner::store_key(const SecureMemory& private_key) {
    auto public_key = Secp256k1::derive_public_key(private_key.view());
    Address address = Address::from_public_key(public_key);
    std::string address_text = address.to_checksum_string();

    SealedKey sealed = KeyCipher::seal(private_key.view(), passphrase_(), address_text);
    json blob = {
        {"address", address_text},
        {"sealed", sealed}
    };

    store_->store(SOFTWARE_KEY_ENTRY, blob.dump());
    store_->store(SOFTWARE_ADDRESS_ENTRY, address_text);

    return Account{.address = address, .kind = BackendKind::Software, .cached_balance = std::nullopt};
}

SecureMemory SoftwareSigner::unseal_key(Address& address) {
    auto stored = store_->load(SOFTWARE_KEY_ENTRY);
    if (!stored) {
        throw WalletError(WalletError::ErrorType::BackendUnavailable, "No software wallet exists");
    }

    SealedKey sealed;
    std::string address_text;
    try {
        json blob = json::parse(*stored);
        address_text = blob.at("address").get<std::string>();
        sealed = blob.at("sealed").get<SealedKey>();
        address = Address::parse(address_text);
    } catch (const json::exception& e) {
        throw WalletError(WalletError::ErrorType::KeyStoreError, std::string("Stored software key is corrupt: ") + e.what());
    } catch (const WalletError& e) {
        throw WalletError(WalletError::ErrorType::KeyStoreError, std::string("Stored software key is corrupt: ") + e.what());
    }

    SecureMemory key = KeyCipher::unseal(sealed, passphrase_(), address_text);
    if (Address::from_public_key(Secp256k1::derive_public_key(key.view())) != address) {
        throw WalletError(WalletError::ErrorType::KeyStoreError, "Stored software key does not match its address");
    }
    return key;
}

SignOutcome SoftwareSigner::sign(const UnsignedTransaction& tx) {
    Address address;
    Hash256 hash = tx.signing_hash();
    SignaturePayload payload;
    {
        SecureMemory key = unseal_key(address);
        RecoverableSignature sig = Secp256k1::sign(key.view(), hash);
        payload.r = sig.r;
        payload.s = sig.s;
        payload.v = static_cast<uint8_t>(RECOVERY_ID_LOW + sig.recovery_bit);
        payload.signer_public_key = Secp256k1::derive_public_key(key.view());
    }

    LOG_DEBUG << "Software signed " << HexUtils::encode_prefixed(hash) << " for " << address.to_checksum_string();
    return SignedTransaction(tx, payload);
}

std::string SoftwareSigner::sign_message(const std::string& message) {
    Address address;
    Hash256 hash = HashUtils::personal_message_hash(message);
    SecureMemory key = unseal_key(address);
    RecoverableSignature sig = Secp256k1::sign(key.view(), hash);
    return encode_message_signature(sig.r, sig.s, static_cast<uint8_t>(RECOVERY_ID_LOW + sig.recovery_bit));
}

void SoftwareSigner::remove() {
    store_->erase(SOFTWARE_KEY_ENTRY);
    store_->erase(SOFTWARE_ADDRESS_ENTRY);
    LOG_INFO << "Software wallet deleted";
}

} // namespace securewallet
