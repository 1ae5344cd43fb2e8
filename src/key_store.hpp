#pragma once

#include <optional>
#include <string>

namespace securewallet {

// Persistent storage for opaque key blobs. Failures throw WalletError(KeyStoreError)
class KeyStore {
public:
    virtual ~KeyStore() = default;

    virtual void store(const std::string& id, const std::string& blob) = 0;
    virtual std::optional<std::string> load(const std::string& id) = 0;
    virtual void erase(const std::string& id) = 0;
};

} // namespace securewallet
