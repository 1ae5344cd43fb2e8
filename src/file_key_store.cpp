#include "file_key_store.hpp"
#include "error.hpp"
#include "logger.hpp"
#include <filesystem>
#include <fstream>

using json = nlohmann::json;

namespace securewallet {

namespace fs = std::filesystem;

FileKeyStore::FileKeyStore(std::string path) : path_(std::move(path)) {}

void FileKeyStore::store(const std::string& id, const std::string& blob) {
    std::lock_guard<std::mutex> lock(mu_);
    json entries = read_entries();
    entries[id] = blob;
    write_entries(entries);
    LOG_DEBUG << "Key store: stored entry '" << id << "'";
}

std::optional<std::string> FileKeyStore::load(const std::string& id) {
    std::lock_guard<std::mutex> lock(mu_);
    json entries = read_entries();
    auto it = entries.find(id);
    if (it == entries.end()) {
        return std::nullopt;
    }
    if (!it->is_string()) {
        throw WalletError(WalletError::ErrorType::KeyStoreError,
            "Key store entry '" + id + "' is not a string in " + path_);
    }
    return it->get<std::string>();
}

void FileKeyStore::erase(const std::string& id) {
    std::lock_guard<std::mutex> lock(mu_);
    json entries = read_entries();
    if (entries.erase(id) > 0) {
        write_entries(entries);
        LOG_DEBUG << "Key store: erased entry '" << id << "'";
    }
}

// A missing file is an empty store
json FileKeyStore::read_entries() const {
    std::error_code ec;
    if (!fs::exists(path_, ec)) {
        return json::object();
    }

    std::ifstream file(path_);
    if (!file) {
        throw WalletError(WalletError::ErrorType::KeyStoreError, "Failed to open key store for reading: " + path_);
    }

    json entries;
    try {
        file >> entries;
    } catch (const json::exception& e) {
        throw WalletError(WalletError::ErrorType::KeyStoreError,
            "Key store " + path_ + " is not valid JSON: " + e.what());
    }
    if (!entries.is_object()) {
        throw WalletError(WalletError::ErrorType::KeyStoreError, "Key store " + path_ + " is not a JSON object");
    }
    return entries;
}

void FileKeyStore::write_entries(const json& entries) const {
    fs::path target(path_);
    if (target.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw WalletError(WalletError::ErrorType::KeyStoreError,
                "Cannot create key store directory: " + ec.message());
        }
    }

    fs::path temp = target;
    temp += ".tmp";
    {
        std::ofstream file(temp, std::ios::trunc);
        if (!file) {
            throw WalletError(WalletError::ErrorType::KeyStoreError, "Failed to open key store for writing: " + path_);
        }
        file << entries.dump(4);
        if (!file) {
            throw WalletError(WalletError::ErrorType::KeyStoreError, "Failed to write key store: " + path_);
        }
    }

    std::error_code ec;
    fs::permissions(temp, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
    if (ec) {
        LOG_WARN << "Could not restrict key store permissions: " << ec.message();
    }

    fs::rename(temp, target, ec);
    if (ec) {
        fs::remove(temp, ec);
        throw WalletError(WalletError::ErrorType::KeyStoreError, "Failed to replace key store " + path_);
    }
}

} // namespace securewallet
