#pragma once

#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include "key_store.hpp"

namespace securewallet {

// KeyStore backed by a single JSON object file ({"id": "blob", ...}).
// Blobs are stored as given; callers seal key material before storing it.
// The file is rewritten through a temporary file and rename, with owner-only
// permissions.
class FileKeyStore : public KeyStore {
public:
    explicit FileKeyStore(std::string path);

    void store(const std::string& id, const std::string& blob) override;
    std::optional<std::string> load(const std::string& id) override;
    void erase(const std::string& id) override;

    const std::string& path() const { return path_; }

private:
    nlohmann::json read_entries() const;
    void write_entries(const nlohmann::json& entries) const;

    std::string path_;
    std::mutex mu_;
};

} // namespace securewallet
