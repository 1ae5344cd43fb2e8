#include "config.hpp"
#include "error.hpp"
#include "logger.hpp"
#include "uint256.hpp"
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>

using json = nlohmann::json;

namespace securewallet {

namespace {

template <typename T>
void read_optional(const json& j, const char* key, T& field) {
    if (j.contains(key)) {
        field = j.at(key).get<T>();
    }
}

} // anonymous namespace

void to_json(json& j, const WalletConfig& config) {
    j = json{
        {"rpc_url", config.rpc_url},
        {"chain_id", config.chain_id},
        {"max_send_amount", config.max_send_amount},
        {"hardware_timeout_ms", config.hardware_timeout_ms},
        {"key_store_path", config.key_store_path},
        {"confirmations", config.confirmations},
        {"confirmation_poll_ms", config.confirmation_poll_ms},
        {"log_level", config.log_level},
        {"log_file", config.log_file}
    };
}

void from_json(const json& j, WalletConfig& config) {
    read_optional(j, "rpc_url", config.rpc_url);
    read_optional(j, "chain_id", config.chain_id);
    read_optional(j, "max_send_amount", config.max_send_amount);
    read_optional(j, "hardware_timeout_ms", config.hardware_timeout_ms);
    read_optional(j, "key_store_path", config.key_store_path);
    read_optional(j, "confirmations", config.confirmations);
    read_optional(j, "confirmation_poll_ms", config.confirmation_poll_ms);
    read_optional(j, "log_level", config.log_level);
    read_optional(j, "log_file", config.log_file);
}

WalletConfig WalletConfig::from_json_text(const std::string& text) {
    try {
        json j = json::parse(text);
        if (!j.is_object()) {
            throw WalletError(WalletError::ErrorType::ConfigError, "Configuration must be a JSON object");
        }
        WalletConfig config = j.get<WalletConfig>();
        config.validate();
        return config;
    } catch (const json::exception& e) {
        throw WalletError(WalletError::ErrorType::ConfigError, std::string("Invalid configuration: ") + e.what());
    }
}

WalletConfig WalletConfig::load(const std::string& path) {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        LOG_DEBUG << "No configuration at " << path << ", using defaults";
        return WalletConfig{};
    }

    std::ifstream file(path);
    if (!file) {
        throw WalletError(WalletError::ErrorType::ConfigError, "Failed to open configuration file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_json_text(buffer.str());
}

void WalletConfig::apply_environment() {
    if (const char* url = std::getenv("SECUREWALLET_RPC_URL"); url && *url) {
        rpc_url = url;
    }
    if (const char* pass = std::getenv("SECUREWALLET_PASSPHRASE"); pass && *pass) {
        passphrase = pass;
    }
}

void WalletConfig::validate() const {
    if (rpc_url.empty()) {
        throw WalletError(WalletError::ErrorType::ConfigError, "rpc_url must not be empty");
    }
    if (chain_id == 0) {
        throw WalletError(WalletError::ErrorType::ConfigError, "chain_id must be greater than zero");
    }
    if (hardware_timeout_ms == 0) {
        throw WalletError(WalletError::ErrorType::ConfigError, "hardware_timeout_ms must be greater than zero");
    }
    if (key_store_path.empty()) {
        throw WalletError(WalletError::ErrorType::ConfigError, "key_store_path must not be empty");
    }
    try {
        if (Uint256::parse_units(max_send_amount, ETHER_DECIMALS).is_zero()) {
            throw WalletError(WalletError::ErrorType::ConfigError, "max_send_amount must be greater than zero");
        }
        Log::parse_level(log_level);
    } catch (const WalletError& e) {
        if (e.type() == WalletError::ErrorType::ConfigError) {
            throw;
        }
        throw WalletError(WalletError::ErrorType::ConfigError, std::string("Invalid configuration: ") + e.what());
    }
}

} // namespace securewallet
