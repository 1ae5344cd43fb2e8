// =============================================================================
// test_key_store.cpp: AES-256-GCM key sealing and the JSON file key store
// =============================================================================

#include <gtest/gtest.h>
#include "consts.hpp"
#include "error.hpp"
#include "file_key_store.hpp"
#include "key_cipher.hpp"
#include <filesystem>
#include <fstream>
#include <random>
#include <vector>

using namespace securewallet;

namespace fs = std::filesystem;

namespace {

std::vector<uint8_t> secret() {
    return std::vector<uint8_t>(32, 0x5a);
}

WalletError::ErrorType unseal_error(const SealedKey& sealed, const std::string& pass, const std::string& aad) {
    try {
        KeyCipher::unseal(sealed, pass, aad);
    } catch (const WalletError& e) {
        return e.type();
    }
    ADD_FAILURE() << "unseal did not throw";
    return WalletError::ErrorType::ConfigError;
}

class FileKeyStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        dir = fs::temp_directory_path() / ("securewallet_test_" + std::to_string(rd()));
        fs::create_directories(dir);
        path = (dir / "keys.json").string();
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir, ec);
    }

    fs::path dir;
    std::string path;
};

} // anonymous namespace

TEST(KeyCipher, SealThenUnseal) {
    SealedKey sealed = KeyCipher::seal(secret(), "passphrase", "0xabc");
    EXPECT_EQ(sealed.salt.size(), KDF_SALT_SIZE);
    EXPECT_EQ(sealed.nonce.size(), AES_GCM_NONCE_SIZE);
    EXPECT_EQ(sealed.tag.size(), AES_GCM_TAG_SIZE);
    EXPECT_EQ(sealed.ciphertext.size(), 32u);
    EXPECT_NE(sealed.ciphertext, secret());

    SecureMemory plain = KeyCipher::unseal(sealed, "passphrase", "0xabc");
    EXPECT_EQ(std::vector<uint8_t>(plain.data(), plain.data() + plain.size()), secret());
}

TEST(KeyCipher, FreshSaltAndNonceEachTime) {
    SealedKey a = KeyCipher::seal(secret(), "passphrase", "");
    SealedKey b = KeyCipher::seal(secret(), "passphrase", "");
    EXPECT_NE(a.salt, b.salt);
    EXPECT_NE(a.nonce, b.nonce);
    EXPECT_NE(a.ciphertext, b.ciphertext);
}

TEST(KeyCipher, AuthenticationFailures) {
    SealedKey sealed = KeyCipher::seal(secret(), "passphrase", "0xabc");
    EXPECT_EQ(unseal_error(sealed, "other", "0xabc"), WalletError::ErrorType::KeyStoreError);
    EXPECT_EQ(unseal_error(sealed, "passphrase", "0xdef"), WalletError::ErrorType::KeyStoreError);

    SealedKey tampered = sealed;
    tampered.tag[0] ^= 0x01;
    EXPECT_EQ(unseal_error(tampered, "passphrase", "0xabc"), WalletError::ErrorType::KeyStoreError);
}

TEST(KeyCipher, EmptyPassphraseIsRefused) {
    EXPECT_THROW(KeyCipher::seal(secret(), "", ""), WalletError);
}

TEST(KeyCipher, JsonRoundTrip) {
    SealedKey sealed = KeyCipher::seal(secret(), "passphrase", "");
    nlohmann::json j = sealed;
    SealedKey restored = j.get<SealedKey>();
    EXPECT_EQ(restored.ciphertext, sealed.ciphertext);
    EXPECT_EQ(restored.iterations, KDF_ITERATIONS);

    SecureMemory plain = KeyCipher::unseal(restored, "passphrase", "");
    EXPECT_EQ(plain.size(), 32u);
}

TEST_F(FileKeyStoreTest, MissingFileIsEmpty) {
    FileKeyStore store(path);
    EXPECT_FALSE(store.load("anything").has_value());
    store.erase("anything");
    EXPECT_FALSE(fs::exists(path));
}

TEST_F(FileKeyStoreTest, StoreLoadErase) {
    FileKeyStore store(path);
    store.store("a", "blob-a");
    store.store("b", "blob-b");
    EXPECT_EQ(store.load("a"), "blob-a");

    // A second instance sees the persisted data
    FileKeyStore reopened(path);
    EXPECT_EQ(reopened.load("b"), "blob-b");

    reopened.erase("a");
    EXPECT_FALSE(store.load("a").has_value());
    EXPECT_EQ(store.load("b"), "blob-b");
}

TEST_F(FileKeyStoreTest, FileIsOwnerOnly) {
    FileKeyStore store(path);
    store.store("a", "blob");
    auto perms = fs::status(path).permissions();
    EXPECT_EQ(perms & (fs::perms::group_all | fs::perms::others_all), fs::perms::none);
}

TEST_F(FileKeyStoreTest, CreatesParentDirectories) {
    std::string nested = (dir / "nested" / "deeper" / "keys.json").string();
    FileKeyStore store(nested);
    store.store("a", "blob");
    EXPECT_TRUE(fs::exists(nested));
}

TEST_F(FileKeyStoreTest, CorruptFileIsAKeyStoreError) {
    {
        std::ofstream out(path);
        out << "{broken";
    }
    FileKeyStore store(path);
    try {
        store.load("a");
        FAIL() << "expected KeyStoreError";
    } catch (const WalletError& e) {
        EXPECT_EQ(e.type(), WalletError::ErrorType::KeyStoreError);
    }
}
